#include "noter/util/filesystem.hpp"

#include <cerrno>
#include <random>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace noter::util {

namespace {

std::error_code lastError() {
  return std::error_code(errno, std::generic_category());
}

}  // namespace

Result<DirectoryLock> DirectoryLock::acquire(const std::filesystem::path& dir) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd == -1) {
    auto ec = lastError();
    return makeErrorResult<DirectoryLock>(errorCodeFromSystem(ec),
                                          "Cannot open directory " + dir.string() + ": " + ec.message());
  }

  while (::flock(fd, LOCK_EX) == -1) {
    if (errno == EINTR) {
      continue;
    }
    auto ec = lastError();
    ::close(fd);
    return makeErrorResult<DirectoryLock>(ErrorCode::kIoError,
                                          "Cannot lock directory " + dir.string() + ": " + ec.message());
  }
  return DirectoryLock(fd);
}

DirectoryLock::DirectoryLock(DirectoryLock&& other) noexcept : fd_(other.fd_) {
  other.fd_ = -1;
}

DirectoryLock& DirectoryLock::operator=(DirectoryLock&& other) noexcept {
  if (this != &other) {
    release();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

DirectoryLock::~DirectoryLock() {
  release();
}

void DirectoryLock::release() {
  if (fd_ != -1) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
  }
}

Result<void> FileSystem::createDirectoryExclusive(const std::filesystem::path& path) {
  if (::mkdir(path.c_str(), 0755) != 0) {
    auto ec = lastError();
    return makeErrorResult<void>(errorCodeFromSystem(ec),
                                 "Cannot create directory " + path.string() + ": " + ec.message());
  }
  return {};
}

Result<void> FileSystem::createFileExclusive(const std::filesystem::path& path,
                                             const std::string& content) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) {
    auto ec = lastError();
    return makeErrorResult<void>(errorCodeFromSystem(ec),
                                 "Cannot create file " + path.string() + ": " + ec.message());
  }

  auto write_result = writeAll(fd, content, path);
  if (write_result.has_value() && ::fsync(fd) != 0) {
    auto ec = lastError();
    write_result = makeErrorResult<void>(errorCodeFromSystem(ec),
                                         "Cannot sync file " + path.string() + ": " + ec.message());
  }
  ::close(fd);

  if (!write_result.has_value()) {
    // The file is ours (O_EXCL), so a half-written one can be removed
    ::unlink(path.c_str());
    return write_result;
  }
  return {};
}

Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         const std::string& content) {
  auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return makeErrorResult<void>(errorCodeFromSystem(ec),
                                   "Cannot create parent directory: " + ec.message());
    }
  }

  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(100000, 999999);

  auto temp_path = path;
  temp_path += ".tmp." + std::to_string(dis(gen));

  auto create_result = createFileExclusive(temp_path, content);
  if (!create_result.has_value()) {
    return create_result;
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code remove_ec;
    std::filesystem::remove(temp_path, remove_ec);
    return makeErrorResult<void>(errorCodeFromSystem(ec),
                                 "Atomic rename failed for " + path.string() + ": " + ec.message());
  }

  if (!parent.empty()) {
    int dir_fd = ::open(parent.c_str(), O_RDONLY | O_DIRECTORY);
    if (dir_fd >= 0) {
      ::fsync(dir_fd);
      ::close(dir_fd);
    }
  }

  return {};
}

Result<std::vector<DirectoryEntry>> FileSystem::listDirectory(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::directory_iterator it(path, ec);
  if (ec) {
    return makeErrorResult<std::vector<DirectoryEntry>>(
        errorCodeFromSystem(ec), "Cannot list directory " + path.string() + ": " + ec.message());
  }

  std::vector<DirectoryEntry> entries;
  for (const auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    DirectoryEntry entry;
    entry.name = it->path().filename().string();

    std::error_code type_ec;
    // Follows symlinks so a linked course directory still counts
    if (it->is_directory(type_ec)) {
      entry.type = EntryType::kDirectory;
    } else if (it->is_regular_file(type_ec)) {
      entry.type = EntryType::kFile;
    }
    entries.push_back(std::move(entry));
  }

  if (ec) {
    return makeErrorResult<std::vector<DirectoryEntry>>(
        errorCodeFromSystem(ec), "Failed while listing " + path.string() + ": " + ec.message());
  }
  return entries;
}

Result<void> FileSystem::writeAll(int fd, const std::string& content,
                                  const std::filesystem::path& path) {
  const char* data = content.data();
  size_t remaining = content.size();
  while (remaining > 0) {
    ssize_t written = ::write(fd, data, remaining);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      auto ec = lastError();
      return makeErrorResult<void>(errorCodeFromSystem(ec),
                                   "Write failed for " + path.string() + ": " + ec.message());
    }
    data += written;
    remaining -= static_cast<size_t>(written);
  }
  return {};
}

}  // namespace noter::util
