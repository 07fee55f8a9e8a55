#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include "http/router.hpp"

namespace rsbackup {
namespace network {

// HTTP/1.1 server, optionally over TLS. Every connection runs on its own
// strand of a shared io_context served by a pool of threads.
class HttpServer {
public:
  static constexpr uint64_t DEFAULT_MAX_BODY_SIZE = 256ull << 20;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpServer(const std::string& address, uint16_t port, http::Router& router,
             size_t thread_count, uint64_t max_body_size = DEFAULT_MAX_BODY_SIZE);
  ~HttpServer();
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Loads a PEM certificate chain and key; must precede start_listener
  bool enable_tls(const std::string& cert_path, const std::string& key_path);
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  // Bound port, useful when constructed with port 0
  uint16_t local_port() const;
  bool is_running() const { return is_running_; }
  bool uses_tls() const { return ssl_context_ != nullptr; }

private:

  // ---- PARAMETERS ----
  const std::string address_;
  const uint16_t port_;
  const size_t thread_count_;
  const uint64_t max_body_size_;

  // Server state
  std::atomic<bool> is_running_;
  std::vector<std::thread> io_threads_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::unique_ptr<boost::asio::ssl::context> ssl_context_;

  // System components
  http::Router& router_;


  // ---- CONNECTION ACCEPTANCE ----
  // Main listening loop that hands each connection to a session
  void start_accept();
};

} // namespace network
} // namespace rsbackup
