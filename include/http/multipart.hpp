#ifndef RSBACKUP_HTTP_MULTIPART_HPP
#define RSBACKUP_HTTP_MULTIPART_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace rsbackup::http {

class MultipartError : public std::runtime_error {
public:
  explicit MultipartError(const std::string& message) : std::runtime_error(message) {}
};

struct FormPart {
  std::string name;
  // Set only for file fields
  std::string filename;
  bool is_file = false;
  // Lower-cased header names
  std::map<std::string, std::string> headers;
  // Points into the parsed body
  std::string_view content;
};

// A parsed multipart/form-data body. Parts reference the body they were
// parsed from, which must outlive the form.
class MultipartForm {
public:

  // ---- PARSING ----
  // Throws MultipartError on a malformed content type or body
  static MultipartForm parse(std::string_view content_type, std::string_view body);
  // Boundary parameter of a multipart/form-data content type
  static std::string boundary_from_content_type(std::string_view content_type);


  // ---- LOOKUP ----
  // First part named name, nullptr when absent
  const FormPart* find(const std::string& name) const;
  // First file part named name
  const FormPart* find_file(const std::string& name) const;
  const std::vector<FormPart>& parts() const { return parts_; }

private:
  std::vector<FormPart> parts_;

  static FormPart parse_headers(std::string_view block);
};

} // namespace rsbackup::http

#endif // RSBACKUP_HTTP_MULTIPART_HPP
