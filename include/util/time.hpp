// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace weave {
namespace util {

/**
 * Adjusted-time source for block timestamp checks
 *
 * The time-too-new rule compares block timestamps against GetTime(). Tests pin
 * it with SetMockTime() or MockTimeScope; 0 restores the system clock.
 */
int64_t GetTime();

void SetMockTime(int64_t time);
int64_t GetMockTime();

// Block timestamp for logs and reports: "2011-02-02 23:16:42 UTC"
std::string FormatTime(int64_t unix_time);

// Recovery durations: "850ms", "12.4s", "3m05s"
std::string FormatDuration(std::chrono::milliseconds duration);

class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : saved_(GetMockTime()) {
    SetMockTime(time);
  }
  ~MockTimeScope() { SetMockTime(saved_); }

  MockTimeScope(const MockTimeScope &) = delete;
  MockTimeScope &operator=(const MockTimeScope &) = delete;

private:
  const int64_t saved_;
};

} // namespace util
} // namespace weave
