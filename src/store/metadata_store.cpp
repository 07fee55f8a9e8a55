#include "store/metadata_store.hpp"
#include "store/file_handle.hpp"
#include "utils/json.hpp"
#include "rsbackup.pb.h"
#include <boost/log/trivial.hpp>

namespace rsbackup {
namespace store {

//==============================================
// CONSTRUCTOR
//==============================================

MetadataStore::MetadataStore(const ShardLayout& layout) : layout_(layout) {}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

// Metadata is written once; an existing file is an error
void MetadataStore::write(const std::string& name, const Metadata& metadata) {
  const auto path = layout_.metadata_path(name);
  BOOST_LOG_TRIVIAL(debug) << "Metadata store: Writing metadata " << path.string();

  std::string json = encode(metadata);
  json.push_back('\n');

  FileHandle file(path, FileHandle::Mode::CreateExclusive);
  file.write_at(0, reinterpret_cast<const uint8_t*>(json.data()), json.size());

  BOOST_LOG_TRIVIAL(info) << "Metadata store: Wrote metadata for " << name
                          << " (" << metadata.data_shards << "+" << metadata.parity_shards << " shards)";
}

// Load and validate the metadata of a record
Metadata MetadataStore::read(const std::string& name) const {
  const auto path = layout_.metadata_path(name);
  BOOST_LOG_TRIVIAL(debug) << "Metadata store: Reading metadata " << path.string();

  FileHandle file(path, FileHandle::Mode::Read);
  const uint64_t size = file.size();
  std::string json(static_cast<size_t>(size), '\0');
  size_t read = file.read_at(0, reinterpret_cast<uint8_t*>(json.data()), json.size());
  json.resize(read);

  try {
    return decode(json);
  } catch (const CorruptError& e) {
    BOOST_LOG_TRIVIAL(error) << "Metadata store: Unable to decode metadata " << path.string() << ": " << e.what();
    throw;
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool MetadataStore::exists(const std::string& name) const {
  std::error_code ec;
  return std::filesystem::exists(layout_.metadata_path(name), ec);
}


//==============================================
// ENCODING
//==============================================

// camelCase JSON, one hash per shard
std::string MetadataStore::encode(const Metadata& metadata) {
  if (metadata.hashes.size() != metadata.total_shards()) {
    throw InternalError("Metadata store: Hash count does not match shard count");
  }

  proto::Metadata message;
  message.set_size(metadata.size);
  message.set_data_shards(static_cast<int32_t>(metadata.data_shards));
  message.set_parity_shards(static_cast<int32_t>(metadata.parity_shards));
  for (const auto& hash : metadata.hashes) {
    message.add_hashes(hash);
  }
  return utils::to_json(message, utils::JsonNames::CamelCase);
}

// Unknown fields are ignored; inconsistent counts are corrupt
Metadata MetadataStore::decode(const std::string& json) {
  proto::Metadata message;
  std::string error;
  if (!utils::from_json(json, message, error)) {
    throw CorruptError("Metadata store: Invalid metadata: " + error);
  }

  if (message.data_shards() < 1) {
    throw CorruptError("Metadata store: Metadata needs at least one data shard");
  }
  if (message.parity_shards() < 0) {
    throw CorruptError("Metadata store: Negative parity shard count");
  }

  Metadata metadata;
  metadata.size = message.size();
  metadata.data_shards = static_cast<size_t>(message.data_shards());
  metadata.parity_shards = static_cast<size_t>(message.parity_shards());
  metadata.hashes.assign(message.hashes().begin(), message.hashes().end());

  if (metadata.hashes.size() != metadata.total_shards()) {
    throw CorruptError("Metadata store: Expected " + std::to_string(metadata.total_shards()) +
                       " hashes, found " + std::to_string(metadata.hashes.size()));
  }
  return metadata;
}

} // namespace store
} // namespace rsbackup
