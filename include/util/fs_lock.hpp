// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace weave {
namespace util {

/**
 * Result of directory lock attempt
 */
enum class LockResult {
  Success,    // Lock acquired successfully
  ErrorWrite, // Could not create lock file
  ErrorLock,  // Lock already held by another process
};

/**
 * DataDirLock - exclusive fcntl() lock on <dir>/<lockfile_name>
 *
 * Held for the lifetime of the object; closing the descriptor releases it.
 * Keeps two weave-recover processes from writing the same block store.
 */
class DataDirLock {
public:
  DataDirLock(const DataDirLock &) = delete;
  DataDirLock &operator=(const DataDirLock &) = delete;
  ~DataDirLock();

  // On failure returns nullptr and sets result (and reason, if non-null)
  static std::unique_ptr<DataDirLock>
  Acquire(const std::filesystem::path &directory, LockResult &result,
          std::string *reason = nullptr,
          const std::string &lockfile_name = ".lock");

private:
  explicit DataDirLock(int fd) : fd_(fd) {}

  int fd_{-1};
};

} // namespace util
} // namespace weave
