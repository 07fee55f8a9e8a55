#ifndef RSBACKUP_UTILS_JSON_HPP
#define RSBACKUP_UTILS_JSON_HPP

#include <string>
#include <google/protobuf/message.h>

namespace rsbackup::utils {

enum class JsonNames {
  CamelCase,   // proto3 JSON names, e.g. dataShards
  ProtoField   // field names as declared, e.g. data_shards
};

// Serializes every field, including defaults such as false and empty lists.
// Top-level 64-bit integers are printed as numbers, not protobuf's quoted form.
// Throws std::runtime_error on failure.
std::string to_json(const google::protobuf::Message& message, JsonNames names);

// Parses JSON into message; returns false and fills error on failure
bool from_json(const std::string& json, google::protobuf::Message& message, std::string& error);

} // namespace rsbackup::utils

#endif // RSBACKUP_UTILS_JSON_HPP
