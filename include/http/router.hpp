#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>
#include "http/response.hpp"

namespace rsbackup {
namespace http {

// Maps request paths to handlers. Built once at startup, then only read,
// so concurrent dispatch needs no locking.
class Router {
public:

  // ---- REGISTRATION ----
  // Matches the path exactly, query string ignored
  void add_exact(const std::string& path, Handler handler);
  // Matches any path starting with prefix; the longest prefix wins
  void add_prefix(const std::string& prefix, Handler handler);


  // ---- DISPATCH ----
  // Falls back to 404 when nothing matches
  Response dispatch(const Request& request, const RequestContext& context) const;

  // Path part of a request target
  static std::string target_path(const Request& request);

private:
  std::map<std::string, Handler> exact_;
  std::vector<std::pair<std::string, Handler>> prefixes_;
};

} // namespace http
} // namespace rsbackup
