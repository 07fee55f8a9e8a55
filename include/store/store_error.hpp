#ifndef RSBACKUP_STORE_ERROR_HPP
#define RSBACKUP_STORE_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace rsbackup::store {

enum class ErrorCode {
  NotFound,
  AlreadyExists,
  BadRequest,
  Unrecoverable,
  Corrupt,
  Internal
};

inline const char* error_code_to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::NotFound: return "Not found";
    case ErrorCode::AlreadyExists: return "Already exists";
    case ErrorCode::BadRequest: return "Bad request";
    case ErrorCode::Unrecoverable: return "Unrecoverable";
    case ErrorCode::Corrupt: return "Corrupt";
    case ErrorCode::Internal: return "Internal error";
    default: return "Undefined error";
  }
}

class StoreError : public std::runtime_error {
public:
  StoreError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

class NotFoundError : public StoreError {
public:
  explicit NotFoundError(const std::string& message)
    : StoreError(ErrorCode::NotFound, message) {}
};

class AlreadyExistsError : public StoreError {
public:
  explicit AlreadyExistsError(const std::string& message)
    : StoreError(ErrorCode::AlreadyExists, message) {}
};

class BadRequestError : public StoreError {
public:
  explicit BadRequestError(const std::string& message)
    : StoreError(ErrorCode::BadRequest, message) {}
};

class CorruptError : public StoreError {
public:
  explicit CorruptError(const std::string& message)
    : StoreError(ErrorCode::Corrupt, message) {}
};

class InternalError : public StoreError {
public:
  explicit InternalError(const std::string& message)
    : StoreError(ErrorCode::Internal, message) {}
};

// More shards are damaged than the parity shards can rebuild
class UnrecoverableError : public StoreError {
public:
  UnrecoverableError(std::size_t corrupt_count, std::size_t parity_count)
    : StoreError(ErrorCode::Unrecoverable,
                 "Cannot repair data: " + std::to_string(corrupt_count) +
                 " shards corrupt, only have " + std::to_string(parity_count) +
                 " parity shards")
    , corrupt_count_(corrupt_count)
    , parity_count_(parity_count) {}

  std::size_t corrupt_count() const { return corrupt_count_; }
  std::size_t parity_count() const { return parity_count_; }

private:
  std::size_t corrupt_count_;
  std::size_t parity_count_;
};

} // namespace rsbackup::store

#endif // RSBACKUP_STORE_ERROR_HPP
