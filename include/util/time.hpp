// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace peerlink {
namespace util {

// Current unix time in seconds (mock time if set)
int64_t GetTime();

// Steady clock that follows mock time while it is set, so that elapsed-time
// logic (rate limiting) can be tested without sleeping.
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time in unix seconds (0 disables mocking)
void SetMockTime(int64_t time);
int64_t GetMockTime();

// RAII helper for tests: sets mock time, restores the previous value on exit
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace peerlink
