#include "crypto/hasher.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace rsbackup::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw HashError("Hasher: Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sha256::Sha256() : context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw HashError("Hasher: Failed to initialize hash context");
  }
}

Sha256::~Sha256() = default;

Sha256::Sha256(Sha256&& other) noexcept = default;

Sha256& Sha256::operator=(Sha256&& other) noexcept = default;


//==============================================
// HASHING
//==============================================

void Sha256::update(const uint8_t* data, size_t length) {
  if (finalized_) {
    throw HashError("Hasher: Digest already finalized");
  }
  if (length == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, length)) {
    throw HashError("Hasher: Failed to update hash");
  }
}

void Sha256::update(const std::string& data) {
  update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string Sha256::hex_digest() {
  if (finalized_) {
    throw HashError("Hasher: Digest already finalized");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), digest, &digest_len)) {
    throw HashError("Hasher: Failed to finalize hash");
  }
  finalized_ = true;

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < digest_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(digest[i]);
  }
  return ss.str();
}


//==============================================
// ONE-SHOT HELPERS
//==============================================

std::string Sha256::hash(const uint8_t* data, size_t length) {
  Sha256 hasher;
  hasher.update(data, length);
  return hasher.hex_digest();
}

std::string Sha256::hash(const std::string& data) {
  Sha256 hasher;
  hasher.update(data);
  std::string result = hasher.hex_digest();
  BOOST_LOG_TRIVIAL(trace) << "Hasher: Hashed " << data.size() << " bytes to " << result;
  return result;
}

} // namespace rsbackup::crypto
