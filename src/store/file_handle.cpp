#include "store/file_handle.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <boost/log/trivial.hpp>

namespace rsbackup::store {

namespace {

constexpr mode_t FILE_PERMISSIONS = 0644;

int open_flags(FileHandle::Mode mode) {
  switch (mode) {
    case FileHandle::Mode::Read: return O_RDONLY;
    case FileHandle::Mode::ReadWrite: return O_RDWR;
    case FileHandle::Mode::CreateExclusive: return O_RDWR | O_CREAT | O_EXCL;
    case FileHandle::Mode::CreateOrOpen: return O_RDWR | O_CREAT;
  }
  return O_RDONLY;
}

std::string errno_message(const std::string& action, const std::filesystem::path& path, int error) {
  return "File: " + action + " '" + path.string() + "' failed: " + std::strerror(error);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// A missing file throws NotFoundError and a taken name AlreadyExistsError
FileHandle::FileHandle(const std::filesystem::path& path, Mode mode) : path_(path) {
  fd_ = ::open(path.c_str(), open_flags(mode) | O_CLOEXEC, FILE_PERMISSIONS);
  if (fd_ < 0) {
    int error = errno;
    if (error == ENOENT) {
      throw NotFoundError(errno_message("open", path, error));
    }
    if (error == EEXIST) {
      throw AlreadyExistsError(errno_message("create", path, error));
    }
    throw InternalError(errno_message("open", path, error));
  }

  struct stat st;
  if (::fstat(fd_, &st) != 0) {
    int error = errno;
    close();
    throw InternalError(errno_message("stat", path, error));
  }
  if (!S_ISREG(st.st_mode)) {
    close();
    throw InternalError("File: '" + path.string() + "' is not a regular file");
  }
  BOOST_LOG_TRIVIAL(trace) << "File: Opened " << path.string();
}

FileHandle::~FileHandle() {
  close();
}

FileHandle::FileHandle(FileHandle&& other) noexcept
  : fd_(other.fd_)
  , path_(std::move(other.path_)) {
  other.fd_ = -1;
}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = other.fd_;
    path_ = std::move(other.path_);
    other.fd_ = -1;
  }
  return *this;
}

// A failed close is logged, not thrown
void FileHandle::close() {
  if (fd_ >= 0) {
    if (::close(fd_) != 0) {
      BOOST_LOG_TRIVIAL(warning) << "File: Closing " << path_.string() << " failed: " << std::strerror(errno);
    }
    fd_ = -1;
  }
}


//==============================================
// I/O
//==============================================

// Loops until length bytes or end of file; returns the count read
size_t FileHandle::read_at(uint64_t offset, uint8_t* buffer, size_t length) const {
  size_t total = 0;
  while (total < length) {
    ssize_t n = ::pread(fd_, buffer + total, length - total, static_cast<off_t>(offset + total));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw InternalError(errno_message("read", path_, errno));
    }
    if (n == 0) {
      break;  // end of file
    }
    total += static_cast<size_t>(n);
  }
  return total;
}

// Loops until every byte is written
void FileHandle::write_at(uint64_t offset, const uint8_t* buffer, size_t length) {
  size_t total = 0;
  while (total < length) {
    ssize_t n = ::pwrite(fd_, buffer + total, length - total, static_cast<off_t>(offset + total));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw InternalError(errno_message("write", path_, errno));
    }
    total += static_cast<size_t>(n);
  }
}

void FileHandle::truncate(uint64_t size) {
  if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
    throw InternalError(errno_message("truncate", path_, errno));
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

uint64_t FileHandle::size() const {
  struct stat st;
  if (::fstat(fd_, &st) != 0) {
    throw InternalError(errno_message("stat", path_, errno));
  }
  return static_cast<uint64_t>(st.st_size);
}

// Seconds since the epoch
std::time_t FileHandle::modified_time() const {
  struct stat st;
  if (::fstat(fd_, &st) != 0) {
    throw InternalError(errno_message("stat", path_, errno));
  }
  return st.st_mtime;
}

} // namespace rsbackup::store
