#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace tbproxy {

// Closed set of error codes exposed to callers. Adding a code means adding a
// cause below and a branch in the normalizer; nothing else maps to the wire.
enum class ErrorCode {
  ValidationError,
  AuthenticationFailed,
  RateLimitExceeded,
  ResourceNotFound,
  UpstreamError,
  InternalError,
};

// "VALIDATION_ERROR", "RATE_LIMIT_EXCEEDED", ...
const char *to_string(ErrorCode code) noexcept;

// Internal failure causes. Each carries the context it needs; the normalizer
// decides how much of it reaches the caller.
namespace cause {

struct SchemaViolation {
  std::string reason;
};
struct EmptyRequest {};
struct TargetInvalid {
  std::string target_id;
  std::string reason;
};
struct MissingApiKey {};
struct InvalidApiKey {};
struct RateLimited {
  int limit = 0;
  int window_seconds = 0;
  std::int64_t retry_after = 0;
};
struct RouteNotFound {
  std::string method;
  std::string path;
};
struct Upstream {
  std::optional<int> status_code;
  std::string message;
};
struct Overloaded {
  std::string reason;
};
struct Internal {
  std::string what;
};

} // namespace cause

using ErrorCause =
    std::variant<cause::SchemaViolation, cause::EmptyRequest,
                 cause::TargetInvalid, cause::MissingApiKey,
                 cause::InvalidApiKey, cause::RateLimited,
                 cause::RouteNotFound, cause::Upstream, cause::Overloaded,
                 cause::Internal>;

ErrorCode code_of(const ErrorCause &cause) noexcept;

struct NormalizedError {
  int status = 500;
  ErrorCode code = ErrorCode::InternalError;
  std::string message;
  nlohmann::json details = nlohmann::json::object();
  std::int64_t timestamp = 0; // unix ms

  // {status, message, error_code, timestamp, details?}
  nlohmann::json to_json() const;
};

class ErrorNormalizer {
public:
  explicit ErrorNormalizer(bool debug = false) : debug_(debug) {}

  NormalizedError normalize(const ErrorCause &cause) const;

  bool debug() const noexcept { return debug_; }

private:
  bool debug_;
};

// Masks bearer tokens, API keys and password/token fields in free text.
// Linear in the length of text.
std::string redact_secrets(const std::string &text);

// text cut to max_len bytes, with "..." appended when it was longer.
std::string abbreviate(const std::string &text, std::size_t max_len = 128);

// Carries a cause across layers that cannot return a NormalizedError
// directly (request parsing, orchestrator pre-conditions).
class ApiError : public std::runtime_error {
public:
  explicit ApiError(ErrorCause cause);

  const ErrorCause &cause() const noexcept { return cause_; }

private:
  ErrorCause cause_;
};

} // namespace tbproxy
