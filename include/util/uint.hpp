// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <span>
#include <string>
#include <string_view>

/** Fixed-size opaque blob used for block, transaction and wallet identifiers. */
template <unsigned int BITS> class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0, "base_blob only supports whole bytes.");
  std::array<uint8_t, WIDTH> m_data;

public:
  constexpr base_blob() : m_data() {}

  /* constructor for small constants (first byte only) */
  constexpr explicit base_blob(uint8_t v) : m_data{v} {}

  // Copies min(WIDTH, bytes.size()) bytes, zero-filling the remainder
  explicit base_blob(std::span<const unsigned char> bytes) : m_data() {
    std::copy_n(bytes.begin(), std::min<size_t>(WIDTH, bytes.size()),
                m_data.begin());
  }

  constexpr bool IsNull() const {
    return std::all_of(m_data.begin(), m_data.end(),
                       [](uint8_t val) { return val == 0; });
  }

  constexpr void SetNull() { std::fill(m_data.begin(), m_data.end(), 0); }

  int Compare(const base_blob &other) const {
    return std::memcmp(m_data.data(), other.m_data.data(), WIDTH);
  }

  friend bool operator==(const base_blob &a, const base_blob &b) {
    return a.Compare(b) == 0;
  }
  friend bool operator!=(const base_blob &a, const base_blob &b) {
    return a.Compare(b) != 0;
  }
  friend bool operator<(const base_blob &a, const base_blob &b) {
    return a.Compare(b) < 0;
  }

  // Hex is written in storage order (byte 0 first). Unlike Bitcoin-derived
  // blobs there is no byte reversal: these values are digests, not numbers.
  std::string GetHex() const;
  std::string ToString() const { return GetHex(); }

  // Parses exactly WIDTH*2 hex digits (optional "0x" prefix).
  // Returns false and leaves the blob null on any other input.
  bool SetHex(std::string_view str);

  constexpr const unsigned char *data() const { return m_data.data(); }
  constexpr unsigned char *data() { return m_data.data(); }

  constexpr unsigned char *begin() { return m_data.data(); }
  constexpr unsigned char *end() { return m_data.data() + WIDTH; }
  constexpr const unsigned char *begin() const { return m_data.data(); }
  constexpr const unsigned char *end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }

  // Little-endian 64-bit word at position pos (0-based, in 8-byte units)
  uint64_t GetUint64(int pos) const {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
      v = (v << 8) | m_data[pos * 8 + i];
    }
    return v;
  }
};

/** 256-bit opaque blob. Block, transaction and wallet identifiers. */
class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  constexpr explicit uint256(uint8_t v) : base_blob<256>(v) {}
  explicit uint256(std::span<const unsigned char> bytes)
      : base_blob<256>(bytes) {}

  static const uint256 ZERO;
  static const uint256 ONE;
};

/* uint256 from hex. Separate function so uint256("...") can't silently
 * construct from a pointer. Invalid input yields the null hash. */
inline uint256 uint256S(std::string_view str) {
  uint256 rv;
  rv.SetHex(str);
  return rv;
}

namespace std {
template <> struct hash<uint256> {
  size_t operator()(const uint256 &h) const noexcept {
    return static_cast<size_t>(h.GetUint64(0));
  }
};
} // namespace std
