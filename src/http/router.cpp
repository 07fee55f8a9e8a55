#include "http/router.hpp"
#include <algorithm>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace rsbackup {
namespace http {

//==============================================
// REGISTRATION
//==============================================

// Duplicate paths throw std::invalid_argument
void Router::add_exact(const std::string& path, Handler handler) {
  if (!exact_.emplace(path, std::move(handler)).second) {
    throw std::invalid_argument("Router: Duplicate route " + path);
  }
  BOOST_LOG_TRIVIAL(debug) << "Router: Registered " << path;
}

void Router::add_prefix(const std::string& prefix, Handler handler) {
  auto it = std::find_if(prefixes_.begin(), prefixes_.end(),
                         [&prefix](const auto& route) { return route.first == prefix; });
  if (it != prefixes_.end()) {
    throw std::invalid_argument("Router: Duplicate route " + prefix);
  }
  prefixes_.emplace_back(prefix, std::move(handler));
  // Longest first, so the first hit is the most specific
  std::stable_sort(prefixes_.begin(), prefixes_.end(),
                   [](const auto& a, const auto& b) { return a.first.size() > b.first.size(); });
  BOOST_LOG_TRIVIAL(debug) << "Router: Registered " << prefix << "*";
}


//==============================================
// DISPATCH
//==============================================

// Exact routes first, then the longest matching prefix, else 404
Response Router::dispatch(const Request& request, const RequestContext& context) const {
  const std::string path = target_path(request);

  auto exact = exact_.find(path);
  if (exact != exact_.end()) {
    return exact->second(request, context);
  }
  for (const auto& [prefix, handler] : prefixes_) {
    if (path.compare(0, prefix.size(), prefix) == 0) {
      return handler(request, context);
    }
  }

  BOOST_LOG_TRIVIAL(warning) << "Router: [" << client_address(request, context) << "] No route for " << path;
  return error_response(request, beast_http::status::not_found);
}

// Request target without the query string
std::string Router::target_path(const Request& request) {
  std::string target(request.target());
  return target.substr(0, target.find('?'));
}

} // namespace http
} // namespace rsbackup
