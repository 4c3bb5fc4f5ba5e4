// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace weave {
namespace util {

/**
 * Crash-safe file replacement
 *
 * 1. Write to a temporary sibling (.tmp.<random>)
 * 2. fsync() the file
 * 3. fsync() the directory
 * 4. rename() over the target
 *
 * Readers see either the old or the new contents, never a torn write.
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode = 0644);

// Whole-file read. std::nullopt if the file is missing, unreadable or
// larger than max_size bytes.
std::optional<std::string>
read_file_string(const std::filesystem::path &path,
                 size_t max_size = 64 * 1024 * 1024);

// Recursive mkdir; true if the directory exists afterwards
bool ensure_directory(const std::filesystem::path &dir);

// ~/.weave, or ./.weave when HOME is unset
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace weave
