#include "http/backup_api.hpp"
#include "http/multipart.hpp"
#include "utils/json.hpp"
#include "rsbackup.pb.h"
#include <istream>
#include <streambuf>
#include <tuple>
#include <utility>
#include <vector>
#include <boost/log/trivial.hpp>

namespace rsbackup {
namespace http {

namespace {

// Read-only stream buffer over memory owned by someone else
class ViewBuffer : public std::streambuf {
public:
  explicit ViewBuffer(std::string_view view) {
    char* begin = const_cast<char*>(view.data());
    setg(begin, begin, begin + view.size());
  }
};

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Quoted-string form for Content-Disposition
std::string quote_filename(const std::string& name) {
  std::string quoted = "\"";
  for (char c : name) {
    if (c == '"' || c == '\\') {
      quoted.push_back('\\');
    }
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

} // namespace


//==============================================
// CONSTRUCTOR
//==============================================

BackupApi::BackupApi(backup::BackupManager& manager) : manager_(manager) {}


//==============================================
// ROUTING
//==============================================

// One route per endpoint; record names follow the prefix
void BackupApi::register_routes(Router& router) {
  BOOST_LOG_TRIVIAL(debug) << "Backup API: Registering routes";
  router.add_exact(LIST_ROUTE, [this](const Request& r, const RequestContext& c) { return list_data(r, c); });
  router.add_prefix(CHECK_ROUTE, [this](const Request& r, const RequestContext& c) { return check_data(r, c); });
  router.add_exact(SUBMIT_ROUTE, [this](const Request& r, const RequestContext& c) { return submit_data(r, c); });
  router.add_prefix(RETRIEVE_ROUTE, [this](const Request& r, const RequestContext& c) { return retrieve_data(r, c); });
  router.add_prefix(REPAIR_ROUTE, [this](const Request& r, const RequestContext& c) { return repair_data(r, c); });
}


//==============================================
// HANDLERS
//==============================================

// GET: every non-parity file under the backup root
Response BackupApi::list_data(const Request& request, const RequestContext& context) {
  if (request.method() != beast_http::verb::get) {
    return reject(request, context, beast_http::status::method_not_allowed,
                  "Bad request method " + std::string(request.method_string()));
  }

  BOOST_LOG_TRIVIAL(debug) << "Backup API: Listing files in " << manager_.config().backup_root.string();
  try {
    proto::ListDataResponse message;
    for (const auto& name : manager_.list()) {
      message.add_files(name);
    }
    return json_response(request, utils::to_json(message, utils::JsonNames::ProtoField));
  } catch (const store::StoreError& e) {
    return failure(request, context, "Error while listing files", e);
  } catch (const std::exception& e) {
    return internal_failure(request, context, "Error while listing files", e);
  }
}

// GET: hash every shard and report health without repairing
Response BackupApi::check_data(const Request& request, const RequestContext& context) {
  if (request.method() != beast_http::verb::get) {
    return reject(request, context, beast_http::status::method_not_allowed,
                  "Bad request method " + std::string(request.method_string()));
  }
  std::string name;
  if (!extract_name(Router::target_path(request), name)) {
    return reject(request, context, beast_http::status::bad_request,
                  "Can't check data: Cannot extract url param from '" + std::string(request.target()) + "'");
  }

  BOOST_LOG_TRIVIAL(debug) << "Backup API: Checking health of " << name;
  try {
    const auto result = manager_.check(name);
    proto::CheckDataResponse message;
    message.set_name(result.name);
    message.set_lmod(result.last_modified);
    message.set_health(result.healthy);
    for (const auto& hash : result.hashes) {
      message.add_hashes(hash);
    }
    return json_response(request, utils::to_json(message, utils::JsonNames::ProtoField));
  } catch (const store::StoreError& e) {
    return failure(request, context, "Could not check " + name, e);
  } catch (const std::exception& e) {
    return internal_failure(request, context, "Could not check " + name, e);
  }
}

// POST multipart: the "file" part is stored under the "filename" field
Response BackupApi::submit_data(const Request& request, const RequestContext& context) {
  if (request.method() != beast_http::verb::post) {
    return reject(request, context, beast_http::status::method_not_allowed,
                  "Bad method " + std::string(request.method_string()));
  }

  MultipartForm form;
  try {
    form = MultipartForm::parse(std::string(request[beast_http::field::content_type]), request.body());
  } catch (const MultipartError& e) {
    return reject(request, context, beast_http::status::bad_request,
                  std::string("Error while reading multipart form: ") + e.what());
  }

  const FormPart* file = form.find_file("file");
  if (file == nullptr) {
    return reject(request, context, beast_http::status::bad_request, "Bad form field: no 'file' upload");
  }
  const FormPart* filename = form.find("filename");
  if (filename == nullptr || filename->is_file || filename->content.empty()) {
    return reject(request, context, beast_http::status::bad_request, "Missing 'filename' parameter");
  }
  const std::string name(filename->content);

  BOOST_LOG_TRIVIAL(debug) << "Backup API: Submitted file " << name << " (" << file->content.size() << " bytes)";
  try {
    ViewBuffer buffer(file->content);
    std::istream input(&buffer);
    const auto result = manager_.submit(name, input);

    proto::SubmitDataResponse message;
    message.set_size(result.size);
    for (const auto& hash : result.hashes) {
      message.add_hashes(hash);
    }
    message.set_data_shards(static_cast<int32_t>(result.data_shards));
    message.set_parity_shards(static_cast<int32_t>(result.parity_shards));
    return json_response(request, utils::to_json(message, utils::JsonNames::ProtoField));
  } catch (const store::StoreError& e) {
    return failure(request, context, "Unable to save file " + name, e);
  } catch (const std::exception& e) {
    return internal_failure(request, context, "Unable to save file " + name, e);
  }
}

// GET: stream the data file without checking it
Response BackupApi::retrieve_data(const Request& request, const RequestContext& context) {
  if (request.method() != beast_http::verb::get) {
    return reject(request, context, beast_http::status::method_not_allowed,
                  "Bad method " + std::string(request.method_string()));
  }
  std::string name;
  if (!extract_name(Router::target_path(request), name)) {
    return reject(request, context, beast_http::status::bad_request,
                  "Can't retrieve file: Cannot extract url param from '" + std::string(request.target()) + "'");
  }

  BOOST_LOG_TRIVIAL(debug) << "Backup API: Retrieving file " << name;
  backup::RetrieveInfo info;
  try {
    info = manager_.retrieve(name);
  } catch (const store::StoreError& e) {
    return failure(request, context, "Retrieval of " + name + " failed", e);
  } catch (const std::exception& e) {
    return internal_failure(request, context, "Retrieval of " + name + " failed", e);
  }

  beast_http::file_body::value_type body;
  boost::beast::error_code ec;
  body.open(info.path.c_str(), boost::beast::file_mode::scan, ec);
  if (ec == boost::system::errc::no_such_file_or_directory) {
    return reject(request, context, beast_http::status::not_found,
                  "Retrieval failed, " + name + " disappeared");
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Backup API: [" << client_address(request, context) << "] Retrieval of "
                             << name << " failed: " << ec.message();
    return error_response(request, beast_http::status::internal_server_error);
  }

  const auto size = body.size();
  FileResponse response{std::piecewise_construct,
                        std::make_tuple(std::move(body)),
                        std::make_tuple(beast_http::status::ok, request.version())};
  response.set(beast_http::field::content_type, "application/octet-stream");
  response.set(beast_http::field::content_disposition, "attachment; filename=" + quote_filename(name));
  response.set(beast_http::field::last_modified, http_date(info.modified_time));
  response.content_length(size);
  response.keep_alive(request.keep_alive());
  return response;
}

// GET: rebuild corrupt shards from parity
Response BackupApi::repair_data(const Request& request, const RequestContext& context) {
  if (request.method() != beast_http::verb::get) {
    return reject(request, context, beast_http::status::method_not_allowed,
                  "Bad method " + std::string(request.method_string()));
  }
  std::string name;
  if (!extract_name(Router::target_path(request), name)) {
    return reject(request, context, beast_http::status::bad_request,
                  "Can't repair file: Cannot extract url param from '" + std::string(request.target()) + "'");
  }

  proto::RepairDataResponse message;
  message.set_name(name);
  message.set_status(REPAIR_GOOD);

  BOOST_LOG_TRIVIAL(debug) << "Backup API: Repairing file " << name;
  try {
    const auto result = manager_.repair(name);
    if (result.status == backup::RepairStatus::Repaired) {
      BOOST_LOG_TRIVIAL(info) << "Backup API: Repaired " << result.repaired_shards.size() << " shards of " << name;
    }
  } catch (const store::UnrecoverableError& e) {
    BOOST_LOG_TRIVIAL(error) << "Backup API: [" << client_address(request, context)
                             << "] Could not process request: " << e.what();
    message.set_status(e.what());
  } catch (const store::StoreError& e) {
    return failure(request, context, "Could not repair " + name, e);
  } catch (const std::exception& e) {
    return internal_failure(request, context, "Could not repair " + name, e);
  }

  try {
    return json_response(request, utils::to_json(message, utils::JsonNames::ProtoField));
  } catch (const std::exception& e) {
    return internal_failure(request, context, "Cannot marshal repair response", e);
  }
}


//==============================================
// URL HELPERS
//==============================================

// Exactly one decoded path segment after the route prefix
bool BackupApi::extract_name(const std::string& path, std::string& name) {
  std::vector<std::string_view> segments;
  std::string_view rest(path);
  while (true) {
    size_t slash = rest.find('/');
    segments.push_back(rest.substr(0, slash));
    if (slash == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(slash + 1);
  }

  if (segments.size() != 3 || segments[2].empty()) {
    return false;
  }
  std::string decoded;
  if (!percent_decode(segments[2], decoded) || decoded.empty()) {
    return false;
  }
  name = std::move(decoded);
  return true;
}

bool BackupApi::percent_decode(std::string_view encoded, std::string& decoded) {
  std::string out;
  out.reserve(encoded.size());
  for (size_t i = 0; i < encoded.size(); ++i) {
    if (encoded[i] != '%') {
      out.push_back(encoded[i]);
      continue;
    }
    if (i + 2 >= encoded.size()) {
      return false;
    }
    int high = hex_value(encoded[i + 1]);
    int low = hex_value(encoded[i + 2]);
    if (high < 0 || low < 0) {
      return false;
    }
    out.push_back(static_cast<char>(high * 16 + low));
    i += 2;
  }
  decoded = std::move(out);
  return true;
}


//==============================================
// ERROR REPORTING
//==============================================

// Map a store error to its status code and log it
StringResponse BackupApi::failure(const Request& request, const RequestContext& context,
                                  const std::string& action, const store::StoreError& error) const {
  const std::string client = client_address(request, context);
  switch (error.code()) {
    case store::ErrorCode::NotFound:
      BOOST_LOG_TRIVIAL(error) << "Backup API: [" << client << "] " << action << ": " << error.what();
      return error_response(request, beast_http::status::not_found);
    case store::ErrorCode::BadRequest:
      BOOST_LOG_TRIVIAL(error) << "Backup API: [" << client << "] " << action << ": " << error.what();
      return error_response(request, beast_http::status::bad_request);
    default:
      BOOST_LOG_TRIVIAL(error) << "Backup API: [" << client << "] " << action << " ("
                               << store::error_code_to_string(error.code()) << "): " << error.what();
      return error_response(request, beast_http::status::internal_server_error);
  }
}

StringResponse BackupApi::internal_failure(const Request& request, const RequestContext& context,
                                           const std::string& action, const std::exception& error) const {
  BOOST_LOG_TRIVIAL(error) << "Backup API: [" << client_address(request, context) << "] " << action
                           << ": " << error.what();
  return error_response(request, beast_http::status::internal_server_error);
}

StringResponse BackupApi::reject(const Request& request, const RequestContext& context,
                                 beast_http::status status, const std::string& reason) const {
  BOOST_LOG_TRIVIAL(error) << "Backup API: [" << client_address(request, context) << "] " << reason;
  return error_response(request, status);
}

} // namespace http
} // namespace rsbackup
