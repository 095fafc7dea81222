// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <mutex>

namespace peerlink {
namespace util {

namespace {

// 0 = mock time disabled
std::atomic<int64_t> g_mock_time{0};

// Anchor pairing a real steady_clock reading with the mock time at which
// mocking started; mock steady time advances from it by the mock delta.
struct SteadyAnchor {
  std::mutex mutex;
  bool set{false};
  std::chrono::steady_clock::time_point real;
  int64_t mock{0};
};

SteadyAnchor& Anchor() {
  static SteadyAnchor anchor;
  return anchor;
}

}  // namespace

int64_t GetTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  auto& anchor = Anchor();
  std::lock_guard<std::mutex> lock(anchor.mutex);
  if (!anchor.set) {
    anchor.real = std::chrono::steady_clock::now();
    anchor.mock = mock;
    anchor.set = true;
  }
  return anchor.real + std::chrono::seconds(mock - anchor.mock);
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);

  // Keep the anchor while mock time moves so elapsed time stays consistent
  if (time == 0) {
    auto& anchor = Anchor();
    std::lock_guard<std::mutex> lock(anchor.mutex);
    anchor.set = false;
  }
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

}  // namespace util
}  // namespace peerlink
