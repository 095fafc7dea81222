// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Rate limiter for logging triggered by remote peers

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace peerlink {
namespace util {

/**
 * RateLimiter - Token bucket per (callsite, subject) for logging
 *
 * The subject is whoever triggered the message, usually a peer address.
 * A peer that keeps sending malformed frames exhausts only its own bucket,
 * so the same callsite still logs for every other peer. Lines dropped for a
 * key are counted and reported with the next line that gets through.
 *
 * At most max_keys buckets are tracked; idle (refilled) buckets go first,
 * then the least recently used one.
 */
class RateLimiter {
public:
  struct Verdict {
    bool log{false};
    uint64_t suppressed{0};  // Lines dropped for this key since it last logged
  };

  // burst lines per key, refilled evenly over period. A non-positive burst
  // or period disables limiting.
  RateLimiter(int burst, std::chrono::seconds period, size_t max_keys = 1024);

  Verdict check(const std::string& callsite, const std::string& subject);

  size_t tracked() const;

  // Shared instance behind the *_RL macros: 20 lines per minute per callsite and subject
  static RateLimiter& instance();

private:
  using TimePoint = std::chrono::steady_clock::time_point;

  struct Bucket {
    double tokens;
    TimePoint last_refill;
    TimePoint last_used;
    uint64_t suppressed;
  };

  void refill(Bucket& bucket, TimePoint now) const;
  void evict_locked(TimePoint now);

  const double burst_;
  const std::chrono::steady_clock::duration period_;
  const size_t max_keys_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Bucket> buckets_;
};

}  // namespace util
}  // namespace peerlink
