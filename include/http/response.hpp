#ifndef RSBACKUP_HTTP_RESPONSE_HPP
#define RSBACKUP_HTTP_RESPONSE_HPP

#include <ctime>
#include <functional>
#include <string>
#include <variant>
#include <boost/beast/http.hpp>

namespace rsbackup::http {

namespace beast_http = boost::beast::http;

using Request = beast_http::request<beast_http::string_body>;
using StringResponse = beast_http::response<beast_http::string_body>;
using FileResponse = beast_http::response<beast_http::file_body>;
// File downloads stream straight from disk, everything else is buffered
using Response = std::variant<StringResponse, FileResponse>;

// Per-request facts known only to the connection
struct RequestContext {
  std::string peer_address;
};

using Handler = std::function<Response(const Request&, const RequestContext&)>;

// Plain-text body holding the reason phrase of status
StringResponse error_response(const Request& request, beast_http::status status);
StringResponse json_response(const Request& request, std::string json);

// Value of X-Forwarded-For when present, else the peer address, else "Unknown"
std::string client_address(const Request& request, const RequestContext& context);

// IMF-fixdate in GMT, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
std::string http_date(std::time_t time);

// Status code of either response alternative
unsigned response_status(const Response& response);

} // namespace rsbackup::http

#endif // RSBACKUP_HTTP_RESPONSE_HPP
