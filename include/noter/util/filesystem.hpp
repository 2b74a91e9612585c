#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "noter/common.hpp"

namespace noter::util {

// Kind of entry returned by directory listings
enum class EntryType {
  kFile,
  kDirectory,
  kOther
};

struct DirectoryEntry {
  std::string name;
  EntryType type = EntryType::kOther;
};

// Exclusive flock(2) on a directory, released when the lock is destroyed.
// Advisory: only serializes writers that take the same lock.
class DirectoryLock {
 public:
  static Result<DirectoryLock> acquire(const std::filesystem::path& dir);

  DirectoryLock(DirectoryLock&& other) noexcept;
  DirectoryLock& operator=(DirectoryLock&& other) noexcept;
  DirectoryLock(const DirectoryLock&) = delete;
  DirectoryLock& operator=(const DirectoryLock&) = delete;
  ~DirectoryLock();

 private:
  explicit DirectoryLock(int fd) : fd_(fd) {}
  void release();

  int fd_ = -1;
};

// Filesystem utilities
class FileSystem {
 public:
  // Create a single directory with mkdir(2) semantics: fails with
  // kAlreadyExists when anything already occupies the path.
  static Result<void> createDirectoryExclusive(const std::filesystem::path& path);

  // Create a new file with O_CREAT | O_EXCL and write content to it.
  // Fails with kAlreadyExists if the file is present; never truncates.
  static Result<void> createFileExclusive(const std::filesystem::path& path,
                                          const std::string& content);

  // Atomic write with fsync and rename
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      const std::string& content);

  // List the entries of a directory (names only, unsorted)
  static Result<std::vector<DirectoryEntry>> listDirectory(const std::filesystem::path& path);

 private:
  static Result<void> writeAll(int fd, const std::string& content,
                               const std::filesystem::path& path);
};

}  // namespace noter::util
