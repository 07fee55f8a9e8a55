#ifndef RSBACKUP_STORE_FILE_HANDLE_HPP
#define RSBACKUP_STORE_FILE_HANDLE_HPP

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include "store/store_error.hpp"

namespace rsbackup::store {

// Owns a POSIX file descriptor; positional reads and writes only
class FileHandle {
public:
  enum class Mode {
    Read,             // existing file, read only
    ReadWrite,        // existing file, read and write
    CreateExclusive,  // new file, fails if the path exists
    CreateOrOpen      // read and write, created when missing
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws NotFoundError, AlreadyExistsError or InternalError
  FileHandle(const std::filesystem::path& path, Mode mode);
  ~FileHandle();
  FileHandle(FileHandle&& other) noexcept;
  FileHandle& operator=(FileHandle&& other) noexcept;
  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;


  // ---- I/O ----
  // Returns the number of bytes read, short only at end of file
  size_t read_at(uint64_t offset, uint8_t* buffer, size_t length) const;
  void write_at(uint64_t offset, const uint8_t* buffer, size_t length);
  void truncate(uint64_t size);


  // ---- QUERY OPERATIONS ----
  uint64_t size() const;
  std::time_t modified_time() const;
  const std::filesystem::path& path() const { return path_; }

private:
  int fd_ = -1;
  std::filesystem::path path_;

  void close();
};

} // namespace rsbackup::store

#endif // RSBACKUP_STORE_FILE_HANDLE_HPP
