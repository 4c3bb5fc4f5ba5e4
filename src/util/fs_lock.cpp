// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace weave {
namespace util {

DataDirLock::~DataDirLock() {
  if (fd_ != -1) {
    // Closing the fd releases the fcntl lock
    close(fd_);
  }
}

std::unique_ptr<DataDirLock>
DataDirLock::Acquire(const std::filesystem::path &directory, LockResult &result,
                     std::string *reason, const std::string &lockfile_name) {
  const auto path = directory / lockfile_name;

  // O_CLOEXEC: don't leak the lock into child processes
  int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd == -1) {
    result = LockResult::ErrorWrite;
    if (reason) {
      *reason = std::strerror(errno);
    }
    return nullptr;
  }

  struct flock lock;
  std::memset(&lock, 0, sizeof(lock));
  lock.l_type = F_WRLCK; // Exclusive write lock
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0; // Lock entire file

  if (fcntl(fd, F_SETLK, &lock) == -1) {
    result = LockResult::ErrorLock;
    if (reason) {
      *reason = std::strerror(errno);
    }
    close(fd);
    return nullptr;
  }

  result = LockResult::Success;
  return std::unique_ptr<DataDirLock>(new DataDirLock(fd));
}

} // namespace util
} // namespace weave
