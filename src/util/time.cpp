// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <cstdio>
#include <ctime>

namespace weave {
namespace util {

namespace {
std::atomic<int64_t> g_mock_time{0};
} // namespace

int64_t GetTime() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  using namespace std::chrono;
  return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);
}

int64_t GetMockTime() { return g_mock_time.load(std::memory_order_relaxed); }

std::string FormatTime(int64_t unix_time) {
  const std::time_t t = static_cast<std::time_t>(unix_time);
  std::tm utc{};
  if (gmtime_r(&t, &utc) == nullptr) {
    return "invalid time " + std::to_string(unix_time);
  }
  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &utc) == 0) {
    return "invalid time " + std::to_string(unix_time);
  }
  return buf;
}

std::string FormatDuration(std::chrono::milliseconds duration) {
  const int64_t ms = duration.count();
  char buf[32];
  if (ms < 1000) {
    std::snprintf(buf, sizeof(buf), "%lldms", static_cast<long long>(ms));
  } else if (ms < 60 * 1000) {
    std::snprintf(buf, sizeof(buf), "%.1fs", static_cast<double>(ms) / 1000.0);
  } else {
    const long long secs = ms / 1000;
    std::snprintf(buf, sizeof(buf), "%lldm%02llds", secs / 60, secs % 60);
  }
  return buf;
}

} // namespace util
} // namespace weave
