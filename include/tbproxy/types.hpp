#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tbproxy {

// One telemetry sample as received. ts and value stay raw JSON until the
// orchestrator checks them per target, so a bad sample only fails its device.
struct Sample {
  nlohmann::json ts;    // unix ms, positive integer
  nlohmann::json value; // scalar, object or array; never null
};

// metric key -> samples, ordered by key
using TelemetryPayload = std::map<std::string, std::vector<Sample>>;

struct UploadTarget {
  std::string target_id; // device id, opaque here
  TelemetryPayload payload;
};

inline std::size_t count_samples(const TelemetryPayload &payload) {
  std::size_t n = 0;
  for (const auto &kv : payload)
    n += kv.second.size();
  return n;
}

struct Config {
  std::string service_name = "tb-proxy";
  std::string version = "0.1.0";
  bool debug = false; // verbose error bodies; never enable in production
  std::string log_level = "info";

  std::string host = "0.0.0.0";
  unsigned short port = 8000;
  std::size_t http_threads = 4;
  std::size_t request_workers = 8;
  std::size_t queue_capacity = 1024;
  std::size_t max_body_bytes = 1024 * 1024;

  std::string api_key; // empty: X-API-Key not required
  bool trust_forwarded_headers = true;

  // Rate limiting
  int rate_limit_requests = 100;
  int rate_limit_window_seconds = 60;
  std::size_t rate_limit_max_identities = 10000;

  // ThingsBoard
  std::string tb_host = "127.0.0.1";
  int tb_port = 8080;
  std::string tb_username;
  std::string tb_password;
  int tb_token_ttl_seconds = 9000;

  // Bulk upload
  std::size_t upload_concurrency = 8;
  std::size_t upload_queue_capacity = 1024;
  int per_target_timeout_ms = 10000;
};

} // namespace tbproxy
