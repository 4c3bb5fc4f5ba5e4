// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Safe parsing of command-line values. Every function validates that the
 whole input is consumed and returns std::nullopt on any error (never throws).
*/

#include "util/uint.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace weave {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 *   SafeParseInt("42", 0, 100)  -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string &str, int min, int max);

std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max);

// True if str is non-empty and all characters are hex digits
bool IsValidHex(const std::string &str);

// Parse a 64-character hex hash (no prefix)
std::optional<uint256> SafeParseHash(const std::string &str);

// "a,b,,c" -> {"a", "b", "c"}
std::vector<std::string> SplitList(const std::string &str, char sep = ',');

} // namespace util
} // namespace weave
