#include "network/http_server.hpp"
#include <chrono>
#include <optional>
#include <type_traits>
#include <utility>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/log/trivial.hpp>

namespace rsbackup {
namespace network {

namespace {

namespace beast = boost::beast;
namespace beast_http = boost::beast::http;
using tcp = boost::asio::ip::tcp;
using SslStream = beast::ssl_stream<beast::tcp_stream>;

constexpr std::chrono::seconds HANDSHAKE_TIMEOUT{30};
// Covers a whole request or response, uploads included
constexpr std::chrono::seconds TRANSFER_TIMEOUT{300};

// One connection; reads requests until the peer or a response ends it
template <class Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
  static constexpr bool IS_TLS = std::is_same_v<Stream, SslStream>;

  template <class... StreamArgs>
  Session(http::Router& router, uint64_t max_body_size, std::string peer_address, StreamArgs&&... stream_args)
    : stream_(std::forward<StreamArgs>(stream_args)...)
    , router_(router)
    , max_body_size_(max_body_size) {
    context_.peer_address = std::move(peer_address);
  }

  // Moves onto the connection's strand before touching the stream
  void run() {
    boost::asio::dispatch(stream_.get_executor(),
                          beast::bind_front_handler(&Session::start, this->shared_from_this()));
  }

private:
  Stream stream_;
  beast::flat_buffer buffer_;
  std::optional<beast_http::request_parser<beast_http::string_body>> parser_;
  // Kept alive until the write completes
  http::Response response_;
  bool close_after_write_ = false;

  http::Router& router_;
  const uint64_t max_body_size_;
  http::RequestContext context_;

  void start() {
    if constexpr (IS_TLS) {
      beast::get_lowest_layer(stream_).expires_after(HANDSHAKE_TIMEOUT);
      stream_.async_handshake(boost::asio::ssl::stream_base::server,
                              beast::bind_front_handler(&Session::on_handshake, this->shared_from_this()));
    } else {
      do_read();
    }
  }

  void on_handshake(beast::error_code ec) {
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "HTTP server: [" << context_.peer_address << "] TLS handshake failed: " << ec.message();
      return;
    }
    do_read();
  }

  void do_read() {
    parser_.emplace();
    parser_->body_limit(max_body_size_);
    beast::get_lowest_layer(stream_).expires_after(TRANSFER_TIMEOUT);
    beast_http::async_read(stream_, buffer_, *parser_,
                           beast::bind_front_handler(&Session::on_read, this->shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t) {
    if (ec == beast_http::error::end_of_stream) {
      do_close();
      return;
    }
    if (ec == beast_http::error::body_limit) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: [" << context_.peer_address << "] Request body exceeds "
                               << max_body_size_ << " bytes";
      auto response = http::error_response(parser_->get(), beast_http::status::payload_too_large);
      response.keep_alive(false);
      send(std::move(response));
      return;
    }
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: [" << context_.peer_address << "] Read failed: " << ec.message();
      return;
    }

    http::Request request = parser_->release();
    BOOST_LOG_TRIVIAL(debug) << "HTTP server: [" << context_.peer_address << "] "
                             << request.method_string() << " " << request.target();
    try {
      send(router_.dispatch(request, context_));
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: [" << context_.peer_address << "] Unhandled error: " << e.what();
      send(http::error_response(request, beast_http::status::internal_server_error));
    }
  }

  void send(http::Response response) {
    response_ = std::move(response);
    beast::get_lowest_layer(stream_).expires_after(TRANSFER_TIMEOUT);
    std::visit([this](auto& message) {
      close_after_write_ = message.need_eof();
      beast_http::async_write(stream_, message,
                              beast::bind_front_handler(&Session::on_write, this->shared_from_this()));
    }, response_);
  }

  void on_write(beast::error_code ec, std::size_t bytes) {
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: [" << context_.peer_address << "] Write failed: " << ec.message();
      return;
    }
    BOOST_LOG_TRIVIAL(debug) << "HTTP server: [" << context_.peer_address << "] Sent "
                             << http::response_status(response_) << " (" << bytes << " bytes)";
    if (close_after_write_) {
      do_close();
      return;
    }
    // Drops the file handle of a finished download before waiting for more
    response_ = http::StringResponse{};
    do_read();
  }

  void do_close() {
    if constexpr (IS_TLS) {
      beast::get_lowest_layer(stream_).expires_after(HANDSHAKE_TIMEOUT);
      stream_.async_shutdown(beast::bind_front_handler(&Session::on_shutdown, this->shared_from_this()));
    } else {
      beast::error_code ec;
      stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
  }

  void on_shutdown(beast::error_code ec) {
    if (ec && ec != boost::asio::ssl::error::stream_truncated) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: [" << context_.peer_address << "] TLS shutdown: " << ec.message();
    }
  }
};

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const std::string& address, uint16_t port, http::Router& router,
                       size_t thread_count, uint64_t max_body_size)
  : address_(address)
  , port_(port)
  , thread_count_(thread_count == 0 ? 1 : thread_count)
  , max_body_size_(max_body_size)
  , is_running_(false)
  , io_context_(static_cast<int>(thread_count_))
  , router_(router) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing HTTP server on " << address << ":" << port;
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::enable_tls(const std::string& cert_path, const std::string& key_path) {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: TLS must be enabled before starting";
    return false;
  }

  try {
    auto context = std::make_unique<boost::asio::ssl::context>(boost::asio::ssl::context::tls_server);
    context->set_options(boost::asio::ssl::context::default_workarounds |
                         boost::asio::ssl::context::no_sslv2 |
                         boost::asio::ssl::context::no_sslv3 |
                         boost::asio::ssl::context::no_tlsv1 |
                         boost::asio::ssl::context::no_tlsv1_1);
    context->use_certificate_chain_file(cert_path);
    context->use_private_key_file(key_path, boost::asio::ssl::context::pem);
    ssl_context_ = std::move(context);

    BOOST_LOG_TRIVIAL(info) << "HTTP server: TLS enabled with certificate " << cert_path;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to load TLS certificate or key: " << e.what();
    return false;
  }
}

bool HttpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);

    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Acceptor bound";

    is_running_ = true;
    start_accept();

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting " << thread_count_ << " IO threads";
    for (size_t i = 0; i < thread_count_; ++i) {
      io_threads_.emplace_back([this]() {
        try {
          io_context_.run();
        } catch (const std::exception& e) {
          BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        }
      });
    }

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Serving " << (uses_tls() ? "https" : "http")
                            << " on " << address_ << ":" << local_port();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    is_running_ = false;
    acceptor_.reset();
    return false;
  }
}

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  acceptor_->async_accept(boost::asio::make_strand(io_context_),
    [this](const boost::system::error_code& error, tcp::socket socket) {
      if (error) {
        if (is_running_) {
          BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
        }
      } else {
        boost::system::error_code ec;
        auto remote = socket.remote_endpoint(ec);
        std::string peer = ec ? std::string() : remote.address().to_string() + ":" + std::to_string(remote.port());
        BOOST_LOG_TRIVIAL(debug) << "HTTP server: Accepted connection from " << peer;

        if (ssl_context_) {
          std::make_shared<Session<SslStream>>(router_, max_body_size_, std::move(peer),
                                               std::move(socket), *ssl_context_)->run();
        } else {
          std::make_shared<Session<beast::tcp_stream>>(router_, max_body_size_, std::move(peer),
                                                       std::move(socket))->run();
        }
      }
      start_accept();  // Continue accepting new connections
    });
}

void HttpServer::shutdown() {
  if (!is_running_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";
  is_running_ = false;

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }

  io_context_.stop();
  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}


//==============================================
// GETTERS
//==============================================

uint16_t HttpServer::local_port() const {
  if (!acceptor_ || !acceptor_->is_open()) {
    return port_;
  }
  boost::system::error_code ec;
  auto endpoint = acceptor_->local_endpoint(ec);
  return ec ? port_ : endpoint.port();
}

} // namespace network
} // namespace rsbackup
