#pragma once
#include "types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tbproxy {

struct UploadAck {
  std::vector<std::string> accepted_keys;
  std::size_t accepted_count = 0;
};

struct UpstreamFailure {
  std::optional<int> status_code; // absent for transport errors and timeouts
  std::string message;
};

using UploadResult = std::variant<UploadAck, UpstreamFailure>;

// The remote telemetry platform as seen by the orchestrator.
//
// Contract:
// - bounds every call with its own timeout
// - reports failures through UpstreamFailure rather than by throwing
// - callable from several threads at once
class UpstreamTelemetryClient {
public:
  virtual ~UpstreamTelemetryClient() = default;

  virtual UploadResult upload(const std::string &target_id,
                              const TelemetryPayload &payload) = 0;
};

} // namespace tbproxy
