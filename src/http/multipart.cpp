#include "http/multipart.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace rsbackup::http {

namespace {

constexpr std::string_view CRLF = "\r\n";
constexpr size_t MAX_BOUNDARY_LENGTH = 70;

std::string to_lower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::string_view trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

// Splits "value; key=value; key=\"quoted;value\"" into the leading value and
// its lower-cased parameters
std::string split_parameters(std::string_view header, std::map<std::string, std::string>& parameters) {
  std::vector<std::string> fields;
  std::string current;
  bool quoted = false;
  for (size_t i = 0; i < header.size(); ++i) {
    char c = header[i];
    if (quoted && c == '\\' && i + 1 < header.size()) {
      current.push_back(header[++i]);
      continue;
    }
    if (c == '"') {
      quoted = !quoted;
      continue;
    }
    if (c == ';' && !quoted) {
      fields.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  if (quoted) {
    throw MultipartError("Multipart: Unterminated quoted string in header");
  }
  fields.push_back(std::move(current));

  for (size_t i = 1; i < fields.size(); ++i) {
    std::string_view field = trim(fields[i]);
    if (field.empty()) {
      continue;
    }
    size_t equals = field.find('=');
    if (equals == std::string_view::npos) {
      parameters[to_lower(field)] = "";
    } else {
      parameters[to_lower(trim(field.substr(0, equals)))] = std::string(trim(field.substr(equals + 1)));
    }
  }
  return to_lower(trim(fields.front()));
}

} // namespace


//==============================================
// PARSING
//==============================================

std::string MultipartForm::boundary_from_content_type(std::string_view content_type) {
  std::map<std::string, std::string> parameters;
  const std::string media_type = split_parameters(content_type, parameters);
  if (media_type != "multipart/form-data") {
    throw MultipartError("Multipart: Unexpected content type '" + media_type + "'");
  }

  auto boundary = parameters.find("boundary");
  if (boundary == parameters.end() || boundary->second.empty()) {
    throw MultipartError("Multipart: Missing boundary");
  }
  if (boundary->second.size() > MAX_BOUNDARY_LENGTH) {
    throw MultipartError("Multipart: Boundary longer than 70 characters");
  }
  return boundary->second;
}

// Split the body on the boundary and parse each part
MultipartForm MultipartForm::parse(std::string_view content_type, std::string_view body) {
  const std::string delimiter = "--" + boundary_from_content_type(content_type);

  // Anything before the first delimiter is preamble
  size_t position = body.find(delimiter);
  if (position == std::string_view::npos) {
    throw MultipartError("Multipart: Body holds no boundary");
  }
  position += delimiter.size();

  MultipartForm form;
  while (true) {
    if (body.substr(position, 2) == "--") {
      return form;
    }
    // Transport padding after the delimiter is allowed
    while (position < body.size() && (body[position] == ' ' || body[position] == '\t')) {
      ++position;
    }
    if (body.substr(position, CRLF.size()) != CRLF) {
      throw MultipartError("Multipart: Malformed boundary line");
    }
    position += CRLF.size();

    // An empty header block leaves the blank line directly at position
    size_t headers_end = body.substr(position, CRLF.size()) == CRLF
                           ? position
                           : body.find("\r\n\r\n", position);
    if (headers_end == std::string_view::npos) {
      throw MultipartError("Multipart: Unterminated part headers");
    }
    FormPart part = parse_headers(body.substr(position, headers_end - position));
    position = headers_end + (headers_end == position ? CRLF.size() : 2 * CRLF.size());

    const std::string closing = std::string(CRLF) + delimiter;
    size_t content_end = body.find(closing, position);
    if (content_end == std::string_view::npos) {
      throw MultipartError("Multipart: Part '" + part.name + "' is not terminated");
    }
    part.content = body.substr(position, content_end - position);
    form.parts_.push_back(std::move(part));
    position = content_end + closing.size();
  }
}

// Content-Disposition gives the field name and, for uploads, the filename
FormPart MultipartForm::parse_headers(std::string_view block) {
  FormPart part;
  size_t start = 0;
  while (start < block.size()) {
    size_t end = block.find(CRLF, start);
    if (end == std::string_view::npos) {
      end = block.size();
    }
    std::string_view line = block.substr(start, end - start);
    start = end + CRLF.size();
    if (line.empty()) {
      continue;
    }

    size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
      throw MultipartError("Multipart: Malformed part header");
    }
    part.headers[to_lower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
  }

  auto disposition = part.headers.find("content-disposition");
  if (disposition == part.headers.end()) {
    throw MultipartError("Multipart: Part without Content-Disposition");
  }
  std::map<std::string, std::string> parameters;
  if (split_parameters(disposition->second, parameters) != "form-data") {
    throw MultipartError("Multipart: Part is not form-data");
  }

  auto name = parameters.find("name");
  if (name == parameters.end()) {
    throw MultipartError("Multipart: Part without a name");
  }
  part.name = name->second;
  auto filename = parameters.find("filename");
  if (filename != parameters.end()) {
    part.is_file = true;
    part.filename = filename->second;
  }
  return part;
}


//==============================================
// LOOKUP
//==============================================

// First part with this field name, or nullptr
const FormPart* MultipartForm::find(const std::string& name) const {
  for (const auto& part : parts_) {
    if (part.name == name) {
      return &part;
    }
  }
  return nullptr;
}

const FormPart* MultipartForm::find_file(const std::string& name) const {
  for (const auto& part : parts_) {
    if (part.is_file && part.name == name) {
      return &part;
    }
  }
  return nullptr;
}

} // namespace rsbackup::http
