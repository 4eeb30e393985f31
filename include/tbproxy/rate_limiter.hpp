#pragma once
#include <atomic>
#include <boost/thread/lock_guard.hpp>
#include <boost/thread/mutex.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tbproxy {

struct RateLimiterConfig {
  int max_requests = 100;
  int window_seconds = 60;
  std::size_t max_identities = 10000; // LRU bound on tracked clients
};

// Monotonic clock source; tests inject a fake one.
using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

inline std::chrono::steady_clock::time_point steady_now() {
  return std::chrono::steady_clock::now();
}

struct RateDecision {
  bool allowed = false;
  int remaining = 0;
  // Rejected: when the oldest admission leaves the window.
  // Admitted: the same instant for the window as it stands after admission.
  std::chrono::steady_clock::time_point reset_at{};

  // Seconds until reset_at, rounded up; never below 1 for a rejection.
  std::int64_t retry_after(std::chrono::steady_clock::time_point now) const;
};

// Per-identity sliding-window limiter.
//
// Every identity owns a deque of admission instants. Entries older than the
// window are dropped lazily on each admit(); a request is admitted while fewer
// than max_requests instants remain. Rejections do not record an instant.
//
// Thread safety: admit() is atomic per identity. The identity table is split
// into shards (each with its own LRU), and each window has its own mutex, so
// callers for different identities only meet on a short table lookup.
class RateLimiter {
public:
  using time_point = std::chrono::steady_clock::time_point;

  // Throws std::invalid_argument on non-positive limits.
  explicit RateLimiter(RateLimiterConfig cfg = {}, SteadyClock clock = steady_now);

  RateDecision admit(const std::string &identity);
  RateDecision admit(const std::string &identity, time_point now);

  int limit() const noexcept { return cfg_.max_requests; }
  int window_seconds() const noexcept { return cfg_.window_seconds; }
  time_point now() const { return clock_(); }

  std::size_t tracked_count() const;
  bool is_tracked(const std::string &identity) const;
  std::uint64_t eviction_count() const noexcept {
    return evictions_.load(std::memory_order_relaxed);
  }

private:
  struct Window {
    boost::mutex m;
    std::deque<time_point> admitted; // ascending
  };

  using LruList = std::list<std::string>;

  struct Entry {
    std::shared_ptr<Window> window;
    LruList::iterator lru_pos;
  };

  struct Shard {
    mutable boost::mutex m;
    std::unordered_map<std::string, Entry> entries;
    LruList lru; // most recent at front
  };

  std::shared_ptr<Window> acquire_window(const std::string &identity);
  RateDecision decide(Window &w, time_point now) const;
  std::size_t shard_index(const std::string &identity) const;

  RateLimiterConfig cfg_;
  SteadyClock clock_;
  std::chrono::steady_clock::duration window_;
  std::size_t shard_capacity_;
  std::vector<std::unique_ptr<Shard>> shards_;
  std::atomic<std::uint64_t> evictions_{0};
};

} // namespace tbproxy
