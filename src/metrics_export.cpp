#include "tbproxy/metrics_export.hpp"

namespace tbproxy {

std::atomic<unsigned long long> g_requests_total{0};
std::atomic<unsigned long long> g_requests_rate_limited{0};
std::atomic<unsigned long long> g_auth_failures{0};
std::atomic<unsigned long long> g_bulk_targets_succeeded{0};
std::atomic<unsigned long long> g_bulk_targets_failed{0};

nlohmann::json counters_snapshot() {
  const auto load = [](const std::atomic<unsigned long long> &c) {
    return c.load(std::memory_order_relaxed);
  };
  return {{"requests_total", load(g_requests_total)},
          {"requests_rate_limited", load(g_requests_rate_limited)},
          {"auth_failures", load(g_auth_failures)},
          {"bulk_targets_succeeded", load(g_bulk_targets_succeeded)},
          {"bulk_targets_failed", load(g_bulk_targets_failed)}};
}

} // namespace tbproxy
