#include "utils/json.hpp"
#include <cctype>
#include <set>
#include <stdexcept>
#include <google/protobuf/descriptor.h>
#include <google/protobuf/util/json_util.h>

namespace rsbackup::utils {

namespace {

// Top-level 64-bit integer fields, under the names the printer used
std::set<std::string> integer_keys(const google::protobuf::Descriptor& descriptor, JsonNames names) {
  std::set<std::string> keys;
  for (int i = 0; i < descriptor.field_count(); ++i) {
    const auto* field = descriptor.field(i);
    if (field->is_repeated()) {
      continue;
    }
    const auto type = field->cpp_type();
    if (type == google::protobuf::FieldDescriptor::CPPTYPE_INT64 ||
        type == google::protobuf::FieldDescriptor::CPPTYPE_UINT64) {
      keys.insert(names == JsonNames::ProtoField ? field->name() : field->json_name());
    }
  }
  return keys;
}

bool is_integer_text(const std::string& text) {
  size_t start = (!text.empty() && text[0] == '-') ? 1 : 0;
  if (start == text.size()) {
    return false;
  }
  for (size_t i = start; i < text.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
  }
  return true;
}

// The printer quotes 64-bit integers; emit the listed top-level ones as numbers
std::string unquote_integers(const std::string& json, const std::set<std::string>& keys) {
  if (keys.empty()) {
    return json;
  }

  std::string out;
  out.reserve(json.size());
  int depth = 0;
  bool expect_key = false;
  std::string pending_key;
  size_t i = 0;
  while (i < json.size()) {
    const char c = json[i];
    if (c == '"') {
      // Copy the whole string literal, escapes included
      size_t end = i + 1;
      while (end < json.size() && json[end] != '"') {
        end += (json[end] == '\\') ? 2 : 1;
      }
      const std::string literal = json.substr(i + 1, end - i - 1);
      if (depth == 1 && expect_key) {
        pending_key = literal;
        expect_key = false;
        out += json.substr(i, end - i + 1);
      } else if (depth == 1 && keys.count(pending_key) && is_integer_text(literal)) {
        out += literal;
        pending_key.clear();
      } else {
        out += json.substr(i, end - i + 1);
        pending_key.clear();
      }
      i = end + 1;
      continue;
    }
    if (c == '{' || c == '[') {
      ++depth;
      expect_key = (c == '{' && depth == 1);
    } else if (c == '}' || c == ']') {
      --depth;
    } else if (c == ',' && depth == 1) {
      expect_key = true;
      pending_key.clear();
    }
    out += c;
    ++i;
  }
  return out;
}

} // namespace

//==============================================
// ENCODE / DECODE
//==============================================

// Print with defaults included, 64-bit integers as JSON numbers
std::string to_json(const google::protobuf::Message& message, JsonNames names) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = false;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = (names == JsonNames::ProtoField);

  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("JSON: Failed to serialize " + message.GetTypeName() + ": " +
                             std::string(status.message()));
  }
  return unquote_integers(json, integer_keys(*message.GetDescriptor(), names));
}

// Parse leniently; unknown fields are skipped and integers may be numbers or strings
bool from_json(const std::string& json, google::protobuf::Message& message, std::string& error) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    error = std::string(status.message());
    return false;
  }
  return true;
}

} // namespace rsbackup::utils
