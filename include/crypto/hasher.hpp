#ifndef RSBACKUP_CRYPTO_HASHER_HPP
#define RSBACKUP_CRYPTO_HASHER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace rsbackup::crypto {

class HashError : public std::runtime_error {
public:
  explicit HashError(const std::string& message) : std::runtime_error(message) {}
};

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-256, rendered as lowercase hex
class Sha256 {
public:
  static constexpr size_t DIGEST_SIZE = 32;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256();
  ~Sha256();
  Sha256(Sha256&& other) noexcept;
  Sha256& operator=(Sha256&& other) noexcept;
  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;


  // ---- HASHING ----
  void update(const uint8_t* data, size_t length);
  void update(const std::string& data);
  // Finalizes the digest; the hasher must not be updated afterwards
  std::string hex_digest();


  // ---- ONE-SHOT HELPERS ----
  static std::string hash(const uint8_t* data, size_t length);
  static std::string hash(const std::string& data);

private:
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};

} // namespace rsbackup::crypto

#endif // RSBACKUP_CRYPTO_HASHER_HPP
