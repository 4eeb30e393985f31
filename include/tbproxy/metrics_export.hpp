#pragma once
#include <atomic>
#include <nlohmann/json.hpp>

namespace tbproxy {
// requests seen by the router (counter)
extern std::atomic<unsigned long long> g_requests_total;
// requests answered with 429 (counter)
extern std::atomic<unsigned long long> g_requests_rate_limited;
// requests answered with 401 (counter)
extern std::atomic<unsigned long long> g_auth_failures;
// devices per bulk outcome (counters)
extern std::atomic<unsigned long long> g_bulk_targets_succeeded;
extern std::atomic<unsigned long long> g_bulk_targets_failed;

// All counters above as one JSON object, for the health endpoint.
nlohmann::json counters_snapshot();
} // namespace tbproxy
