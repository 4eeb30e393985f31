#include "tbproxy/config.hpp"
#include "tbproxy/logging.hpp"

#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace tbproxy {

Config config_from_json(const json &j) {
  Config c;
  if (!j.is_object())
    throw std::invalid_argument("config root must be a JSON object");

  auto get = [&](auto key, auto def) {
    return j.contains(key) ? j[key].template get<std::decay_t<decltype(def)>>()
                           : def;
  };
  // Counts are read signed so that a negative value is rejected instead of
  // wrapping around to a huge size_t.
  auto count = [&](const char *key, std::size_t def) {
    const long long v = get(key, static_cast<long long>(def));
    if (v <= 0)
      throw std::invalid_argument(std::string(key) + " must be positive");
    return static_cast<std::size_t>(v);
  };

  c.service_name = get("service_name", c.service_name);
  c.version = get("version", c.version);
  c.debug = get("debug", c.debug);
  c.log_level = get("log_level", c.log_level);

  c.host = get("host", c.host);
  const int port = get("port", static_cast<int>(c.port));
  if (port <= 0 || port > 65535)
    throw std::invalid_argument("port is out of range (1..65535)");
  c.port = static_cast<unsigned short>(port);
  c.http_threads = count("http_threads", c.http_threads);
  c.request_workers = count("request_workers", c.request_workers);
  c.queue_capacity = count("queue_capacity", c.queue_capacity);
  c.max_body_bytes = count("max_body_bytes", c.max_body_bytes);

  c.api_key = get("api_key", c.api_key);
  c.trust_forwarded_headers =
      get("trust_forwarded_headers", c.trust_forwarded_headers);

  c.rate_limit_requests = get("rate_limit_requests", c.rate_limit_requests);
  c.rate_limit_window_seconds =
      get("rate_limit_window_seconds", c.rate_limit_window_seconds);
  c.rate_limit_max_identities =
      count("rate_limit_max_identities", c.rate_limit_max_identities);

  c.tb_host = get("tb_host", c.tb_host);
  c.tb_port = get("tb_port", c.tb_port);
  c.tb_username = get("tb_username", c.tb_username);
  c.tb_password = get("tb_password", c.tb_password);
  c.tb_token_ttl_seconds = get("tb_token_ttl_seconds", c.tb_token_ttl_seconds);

  c.upload_concurrency = count("upload_concurrency", c.upload_concurrency);
  c.upload_queue_capacity =
      count("upload_queue_capacity", c.upload_queue_capacity);
  c.per_target_timeout_ms =
      get("per_target_timeout_ms", c.per_target_timeout_ms);

  validate_config(c);
  return c;
}

Config load_config(const std::string &path) {
  Config c;
  std::ifstream f(path);
  if (f) {
    json j;
    f >> j;
    c = config_from_json(j);
  } else {
    log_info("CFG", "no config file at " + path + ", using defaults");
  }
  apply_env_overrides(c);
  validate_config(c);
  return c;
}

void apply_env_overrides(Config &c) {
  if (const char *v = std::getenv("TB_USERNAME"))
    c.tb_username = v;
  if (const char *v = std::getenv("TB_PASSWORD"))
    c.tb_password = v;
  if (const char *v = std::getenv("API_KEY"))
    c.api_key = v;
}

void validate_config(const Config &c) {
  parse_log_level(c.log_level);
  if (c.http_threads == 0)
    throw std::invalid_argument("http_threads must be at least 1");
  if (c.request_workers == 0)
    throw std::invalid_argument("request_workers must be at least 1");
  if (c.queue_capacity == 0)
    throw std::invalid_argument("queue_capacity must be at least 1");
  if (c.max_body_bytes == 0)
    throw std::invalid_argument("max_body_bytes must be positive");
  if (c.rate_limit_requests <= 0)
    throw std::invalid_argument("rate_limit_requests must be positive");
  if (c.rate_limit_window_seconds <= 0)
    throw std::invalid_argument("rate_limit_window_seconds must be positive");
  if (c.rate_limit_max_identities == 0)
    throw std::invalid_argument("rate_limit_max_identities must be positive");
  if (c.tb_port <= 0 || c.tb_port > 65535)
    throw std::invalid_argument("tb_port is out of range (1..65535)");
  if (c.tb_token_ttl_seconds <= 60)
    throw std::invalid_argument("tb_token_ttl_seconds must exceed 60");
  if (c.upload_concurrency == 0)
    throw std::invalid_argument("upload_concurrency must be at least 1");
  if (c.upload_queue_capacity == 0)
    throw std::invalid_argument("upload_queue_capacity must be at least 1");
  if (c.per_target_timeout_ms <= 0)
    throw std::invalid_argument("per_target_timeout_ms must be positive");
}

RateLimiterConfig rate_limiter_config(const Config &c) {
  RateLimiterConfig r;
  r.max_requests = c.rate_limit_requests;
  r.window_seconds = c.rate_limit_window_seconds;
  r.max_identities = c.rate_limit_max_identities;
  return r;
}

ThingsBoardConfig thingsboard_config(const Config &c) {
  ThingsBoardConfig t;
  t.host = c.tb_host;
  t.port = c.tb_port;
  t.username = c.tb_username;
  t.password = c.tb_password;
  t.token_ttl = std::chrono::seconds(c.tb_token_ttl_seconds);
  t.timeout = std::chrono::milliseconds(c.per_target_timeout_ms);
  return t;
}

BulkUploadConfig bulk_upload_config(const Config &c) {
  BulkUploadConfig b;
  b.concurrency = c.upload_concurrency;
  b.queue_capacity = c.upload_queue_capacity;
  b.per_target_timeout = std::chrono::milliseconds(c.per_target_timeout_ms);
  return b;
}

} // namespace tbproxy
