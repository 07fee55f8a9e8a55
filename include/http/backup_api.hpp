#pragma once

#include <string>
#include <string_view>
#include "backup/backup_manager.hpp"
#include "http/response.hpp"
#include "http/router.hpp"

namespace rsbackup {
namespace http {

// HTTP bindings for the backup manager operations
class BackupApi {
public:
  static constexpr const char* LIST_ROUTE = "/list_data";
  static constexpr const char* CHECK_ROUTE = "/check_data/";
  static constexpr const char* SUBMIT_ROUTE = "/submit_data";
  static constexpr const char* RETRIEVE_ROUTE = "/retrieve_data/";
  static constexpr const char* REPAIR_ROUTE = "/repair_data/";

  // Status reported by repair when the record is healthy afterwards
  static constexpr const char* REPAIR_GOOD = "GOOD";

  // ---- CONSTRUCTOR ----
  explicit BackupApi(backup::BackupManager& manager);


  // ---- ROUTING ----
  void register_routes(Router& router);


  // ---- HANDLERS ----
  Response list_data(const Request& request, const RequestContext& context);
  Response check_data(const Request& request, const RequestContext& context);
  // Multipart form with a "file" upload and a "filename" field
  Response submit_data(const Request& request, const RequestContext& context);
  Response retrieve_data(const Request& request, const RequestContext& context);
  Response repair_data(const Request& request, const RequestContext& context);


  // ---- URL HELPERS ----
  // Decoded third segment of "/<route>/<name>"; false unless the path has
  // exactly three segments and a non-empty, well-encoded last one
  static bool extract_name(const std::string& path, std::string& name);
  // Decodes %XX escapes; false on a truncated or non-hex escape
  static bool percent_decode(std::string_view encoded, std::string& decoded);

private:
  backup::BackupManager& manager_;

  // Logs the failure and maps its code to a status
  StringResponse failure(const Request& request, const RequestContext& context,
                         const std::string& action, const store::StoreError& error) const;
  StringResponse internal_failure(const Request& request, const RequestContext& context,
                                  const std::string& action, const std::exception& error) const;
  // Logs the rejection and answers with status
  StringResponse reject(const Request& request, const RequestContext& context,
                        beast_http::status status, const std::string& reason) const;
};

} // namespace http
} // namespace rsbackup
