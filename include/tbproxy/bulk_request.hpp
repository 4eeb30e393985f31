#pragma once
#include "types.hpp"
#include <string>
#include <vector>

namespace tbproxy {

// Parses a bulk telemetry body:
//   {"<device>": {"<key>": [{"ts": 1640995200000, "value": 25.6}, ...]}, ...}
//
// Only the outer shape is enforced here; a violation rejects the whole
// request (ApiError with SchemaViolation, or EmptyRequest for "{}").
// Sample contents are left for the orchestrator to judge per device.
std::vector<UploadTarget> parse_bulk_request(const std::string &body);

} // namespace tbproxy
