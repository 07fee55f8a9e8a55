#include "http/response.hpp"
#include <iomanip>
#include <locale>
#include <sstream>
#include <utility>

namespace rsbackup::http {

// Short plain-text error; keeps the connection when the client asked to
StringResponse error_response(const Request& request, beast_http::status status) {
  StringResponse response{status, request.version()};
  response.set(beast_http::field::content_type, "text/plain; charset=utf-8");
  response.set("X-Content-Type-Options", "nosniff");
  response.keep_alive(request.keep_alive());
  response.body() = std::string(beast_http::obsolete_reason(status)) + "\n";
  response.prepare_payload();
  return response;
}

// Serialized message with a trailing newline
StringResponse json_response(const Request& request, std::string json) {
  StringResponse response{beast_http::status::ok, request.version()};
  response.set(beast_http::field::content_type, "application/json");
  response.keep_alive(request.keep_alive());
  json.push_back('\n');
  response.body() = std::move(json);
  response.prepare_payload();
  return response;
}

// Proxies forward the original client address
std::string client_address(const Request& request, const RequestContext& context) {
  auto forwarded = request.find("X-Forwarded-For");
  if (forwarded != request.end() && !forwarded->value().empty()) {
    return std::string(forwarded->value());
  }
  if (!context.peer_address.empty()) {
    return context.peer_address;
  }
  return "Unknown";
}

// Day and month names must not follow the process locale
std::string http_date(std::time_t time) {
  std::tm utc{};
  gmtime_r(&time, &utc);
  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << std::put_time(&utc, "%a, %d %b %Y %H:%M:%S GMT");
  return out.str();
}

unsigned response_status(const Response& response) {
  return std::visit([](const auto& message) { return message.result_int(); }, response);
}

} // namespace rsbackup::http
