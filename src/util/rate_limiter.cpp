// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include <algorithm>

namespace peerlink {
namespace util {

RateLimiter::RateLimiter(int burst, std::chrono::seconds period, size_t max_keys)
    : burst_(static_cast<double>(burst)), period_(period), max_keys_(std::max<size_t>(max_keys, 1)) {}

void RateLimiter::refill(Bucket& bucket, TimePoint now) const {
  // Mock time may step backwards between tests
  if (now <= bucket.last_refill) {
    return;
  }
  std::chrono::duration<double> elapsed = now - bucket.last_refill;
  std::chrono::duration<double> period = period_;
  bucket.tokens = std::min(burst_, bucket.tokens + burst_ * (elapsed / period));
  bucket.last_refill = now;
}

RateLimiter::Verdict RateLimiter::check(const std::string& callsite, const std::string& subject) {
  if (burst_ <= 0.0 || period_ <= std::chrono::steady_clock::duration::zero()) {
    return Verdict{true, 0};
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const TimePoint now = GetSteadyTime();
  const std::string key = callsite + '|' + subject;

  auto it = buckets_.find(key);
  if (it == buckets_.end()) {
    if (buckets_.size() >= max_keys_) {
      evict_locked(now);
    }
    // Start with a full bucket (burst capacity)
    it = buckets_.emplace(key, Bucket{burst_, now, now, 0}).first;
  }

  Bucket& bucket = it->second;
  refill(bucket, now);
  bucket.last_used = now;

  if (bucket.tokens >= 1.0) {
    bucket.tokens -= 1.0;
    Verdict verdict{true, bucket.suppressed};
    bucket.suppressed = 0;
    return verdict;
  }

  ++bucket.suppressed;
  return Verdict{false, 0};
}

void RateLimiter::evict_locked(TimePoint now) {
  for (auto it = buckets_.begin(); it != buckets_.end();) {
    refill(it->second, now);
    if (it->second.tokens >= burst_ && it->second.suppressed == 0) {
      it = buckets_.erase(it);
    } else {
      ++it;
    }
  }

  if (buckets_.size() < max_keys_) {
    return;
  }

  auto oldest = std::min_element(buckets_.begin(), buckets_.end(), [](const auto& a, const auto& b) {
    return a.second.last_used < b.second.last_used;
  });
  buckets_.erase(oldest);
}

size_t RateLimiter::tracked() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buckets_.size();
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter instance(20, std::chrono::seconds(60));
  return instance;
}

}  // namespace util
}  // namespace peerlink
