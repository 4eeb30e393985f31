#pragma once
#include "upstream_client.hpp"
#include <boost/thread/lock_guard.hpp>
#include <boost/thread/mutex.hpp>
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

namespace tbproxy {

struct ThingsBoardConfig {
  std::string host = "127.0.0.1";
  int port = 8080;
  std::string username; // empty: requests go out without X-Authorization
  std::string password;
  std::chrono::seconds token_ttl{9000};
  std::chrono::milliseconds timeout{10000}; // whole upload, login included
};

// Plain-HTTP ThingsBoard client built on Boost.Beast.
//
// Logs in with username/password, keeps the JWT in memory only and reuses it
// until shortly before its TTL runs out. A 401 on upload drops the token and
// retries once with a fresh login.
class ThingsBoardClient final : public UpstreamTelemetryClient {
public:
  explicit ThingsBoardClient(ThingsBoardConfig cfg);

  UploadResult upload(const std::string &target_id,
                      const TelemetryPayload &payload) override;

  // /api/plugins/telemetry/DEVICE/<id>/timeseries/any, id percent-encoded
  static std::string timeseries_path(const std::string &device_id);
  // {"<key>": [{"ts": .., "value": ..}, ...], ...}
  static nlohmann::json timeseries_body(const TelemetryPayload &payload);

private:
  using Deadline = std::chrono::steady_clock::time_point;

  struct HttpReply {
    int status = 0;
    std::string body;
  };

  // Throws boost::system::system_error on transport failure or timeout.
  HttpReply post_json(const std::string &path, const std::string &body,
                      const std::string &token, Deadline deadline) const;

  std::string ensure_token(Deadline deadline);
  std::string login(Deadline deadline) const;
  void drop_token(const std::string &token);

  const ThingsBoardConfig cfg_;

  boost::mutex token_m_;
  std::string token_;
  std::chrono::steady_clock::time_point token_expires_{};

  boost::mutex login_m_; // one login at a time
};

} // namespace tbproxy
