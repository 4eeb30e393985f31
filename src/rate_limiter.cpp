#include "tbproxy/rate_limiter.hpp"
#include "tbproxy/time_utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace tbproxy {

namespace {
constexpr std::size_t kMaxShards = 16;
} // namespace

std::int64_t RateDecision::retry_after(
    std::chrono::steady_clock::time_point now) const {
  const std::int64_t secs = ceil_seconds(reset_at - now);
  if (!allowed)
    return std::max<std::int64_t>(1, secs);
  return secs;
}

RateLimiter::RateLimiter(RateLimiterConfig cfg, SteadyClock clock)
    : cfg_(cfg), clock_(std::move(clock)),
      window_(std::chrono::seconds(cfg.window_seconds)) {
  if (cfg_.max_requests <= 0)
    throw std::invalid_argument("rate limit max_requests must be positive");
  if (cfg_.window_seconds <= 0)
    throw std::invalid_argument("rate limit window_seconds must be positive");
  if (cfg_.max_identities == 0)
    throw std::invalid_argument("rate limit max_identities must be positive");

  const std::size_t n = std::min(kMaxShards, cfg_.max_identities);
  shard_capacity_ = (cfg_.max_identities + n - 1) / n;
  shards_.reserve(n);
  for (std::size_t i = 0; i < n; ++i)
    shards_.push_back(std::make_unique<Shard>());
}

RateDecision RateLimiter::admit(const std::string &identity) {
  auto w = acquire_window(identity);
  boost::lock_guard<boost::mutex> lk(w->m);
  return decide(*w, clock_());
}

RateDecision RateLimiter::admit(const std::string &identity, time_point now) {
  auto w = acquire_window(identity);
  boost::lock_guard<boost::mutex> lk(w->m);
  return decide(*w, now);
}

RateDecision RateLimiter::decide(Window &w, time_point now) const {
  // Inclusive lower bound: an instant exactly one window old still counts.
  const time_point cutoff = now - window_;
  while (!w.admitted.empty() && w.admitted.front() < cutoff)
    w.admitted.pop_front();

  const int count = static_cast<int>(w.admitted.size());
  RateDecision d;
  if (count >= cfg_.max_requests) {
    d.allowed = false;
    d.remaining = 0;
    d.reset_at = w.admitted.front() + window_;
    return d;
  }

  // Callers passing explicit instants may arrive slightly out of order.
  if (w.admitted.empty() || w.admitted.back() <= now)
    w.admitted.push_back(now);
  else
    w.admitted.insert(
        std::upper_bound(w.admitted.begin(), w.admitted.end(), now), now);

  d.allowed = true;
  d.remaining = cfg_.max_requests - count - 1;
  d.reset_at = w.admitted.front() + window_;
  return d;
}

std::shared_ptr<RateLimiter::Window>
RateLimiter::acquire_window(const std::string &identity) {
  Shard &shard = *shards_[shard_index(identity)];
  boost::lock_guard<boost::mutex> lk(shard.m);

  auto it = shard.entries.find(identity);
  if (it != shard.entries.end()) {
    shard.lru.splice(shard.lru.begin(), shard.lru, it->second.lru_pos);
    return it->second.window;
  }

  if (shard.entries.size() >= shard_capacity_ && !shard.lru.empty()) {
    // A caller still holding the evicted window finishes against it; the
    // identity simply starts over with a fresh window next time.
    shard.entries.erase(shard.lru.back());
    shard.lru.pop_back();
    evictions_.fetch_add(1, std::memory_order_relaxed);
  }

  shard.lru.push_front(identity);
  Entry entry{std::make_shared<Window>(), shard.lru.begin()};
  auto window = entry.window;
  shard.entries.emplace(identity, std::move(entry));
  return window;
}

std::size_t RateLimiter::shard_index(const std::string &identity) const {
  return std::hash<std::string>{}(identity) % shards_.size();
}

std::size_t RateLimiter::tracked_count() const {
  std::size_t total = 0;
  for (const auto &s : shards_) {
    boost::lock_guard<boost::mutex> lk(s->m);
    total += s->entries.size();
  }
  return total;
}

bool RateLimiter::is_tracked(const std::string &identity) const {
  const Shard &shard = *shards_[shard_index(identity)];
  boost::lock_guard<boost::mutex> lk(shard.m);
  return shard.entries.find(identity) != shard.entries.end();
}

} // namespace tbproxy
