// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "storage/block_json.hpp"
#include <string>

namespace weave {

constexpr int WEAVE_VERSION_MAJOR = 1;
constexpr int WEAVE_VERSION_MINOR = 0;
constexpr int WEAVE_VERSION_PATCH = 0;

constexpr const char *WEAVE_TOOL_NAME = "weave-recover";
constexpr const char *WEAVE_COPYRIGHT = "Copyright (C) 2025 The Unicity Foundation";

inline std::string GetVersionString() {
  return std::to_string(WEAVE_VERSION_MAJOR) + "." +
         std::to_string(WEAVE_VERSION_MINOR) + "." +
         std::to_string(WEAVE_VERSION_PATCH);
}

// "weave-recover 1.0.0 (block format v1)"; the format is what --datadir and
// --peerdir stores must be written in
inline std::string GetFullVersionString() {
  return std::string(WEAVE_TOOL_NAME) + " " + GetVersionString() +
         " (block format v" + std::to_string(storage::BLOCK_FORMAT_VERSION) + ")";
}

inline std::string GetCopyrightString() { return WEAVE_COPYRIGHT; }

} // namespace weave
