#include "tbproxy/error_normalizer.hpp"
#include "tbproxy/time_utils.hpp"

#include <cctype>
#include <cstring>
#include <string_view>

namespace tbproxy {

namespace {

// Generic, non-leaking texts used outside debug mode.
constexpr const char *kMsgBadRequest =
    "The request was invalid. Please check your input and try again.";
constexpr const char *kMsgInvalidData =
    "The request contains invalid data. Please check your input and try again.";
constexpr const char *kMsgUnauthorized =
    "Authentication is required to access this resource.";
constexpr const char *kMsgNotFound = "The requested resource was not found.";
constexpr const char *kMsgTooMany =
    "Too many requests. Please slow down and try again later.";
constexpr const char *kMsgUpstream =
    "The backend service is temporarily unavailable.";
constexpr const char *kMsgUnavailable =
    "The service is temporarily unavailable. Please try again later.";
constexpr const char *kMsgInternal =
    "An internal server error occurred. Please try again later.";

NormalizedError make(int status, ErrorCode code, std::string message) {
  NormalizedError e;
  e.status = status;
  e.code = code;
  e.message = std::move(message);
  return e;
}

// Debug text echoed back to the caller: bounded, then scrubbed.
std::string echo(const std::string &text) {
  return redact_secrets(abbreviate(text, 512));
}

struct CodeOf {
  ErrorCode operator()(const cause::SchemaViolation &) const {
    return ErrorCode::ValidationError;
  }
  ErrorCode operator()(const cause::EmptyRequest &) const {
    return ErrorCode::ValidationError;
  }
  ErrorCode operator()(const cause::TargetInvalid &) const {
    return ErrorCode::ValidationError;
  }
  ErrorCode operator()(const cause::MissingApiKey &) const {
    return ErrorCode::AuthenticationFailed;
  }
  ErrorCode operator()(const cause::InvalidApiKey &) const {
    return ErrorCode::AuthenticationFailed;
  }
  ErrorCode operator()(const cause::RateLimited &) const {
    return ErrorCode::RateLimitExceeded;
  }
  ErrorCode operator()(const cause::RouteNotFound &) const {
    return ErrorCode::ResourceNotFound;
  }
  ErrorCode operator()(const cause::Upstream &) const {
    return ErrorCode::UpstreamError;
  }
  ErrorCode operator()(const cause::Overloaded &) const {
    return ErrorCode::InternalError;
  }
  ErrorCode operator()(const cause::Internal &) const {
    return ErrorCode::InternalError;
  }
};

// One overload per cause: a cause added to ErrorCause without a branch here
// does not compile.
struct Normalize {
  bool debug;

  NormalizedError operator()(const cause::SchemaViolation &c) const {
    auto e = make(422, ErrorCode::ValidationError,
                  debug ? "Request validation failed" : kMsgInvalidData);
    if (debug)
      e.details["reason"] = echo(c.reason);
    return e;
  }

  NormalizedError operator()(const cause::EmptyRequest &) const {
    return make(400, ErrorCode::ValidationError,
                debug ? "No device data provided" : kMsgBadRequest);
  }

  NormalizedError operator()(const cause::TargetInvalid &c) const {
    if (!debug)
      return make(422, ErrorCode::ValidationError, kMsgInvalidData);
    auto e = make(422, ErrorCode::ValidationError,
                  "Invalid telemetry for target: " + echo(c.reason));
    e.details["target_id"] = abbreviate(c.target_id);
    e.details["reason"] = echo(c.reason);
    return e;
  }

  NormalizedError operator()(const cause::MissingApiKey &) const {
    return make(401, ErrorCode::AuthenticationFailed,
                debug ? "API key required. Provide X-API-Key header."
                      : kMsgUnauthorized);
  }

  NormalizedError operator()(const cause::InvalidApiKey &) const {
    return make(401, ErrorCode::AuthenticationFailed,
                debug ? "Invalid API key" : kMsgUnauthorized);
  }

  NormalizedError operator()(const cause::RateLimited &c) const {
    auto e = make(429, ErrorCode::RateLimitExceeded,
                  debug ? "Maximum " + std::to_string(c.limit) +
                              " requests per " +
                              std::to_string(c.window_seconds) +
                              " seconds allowed"
                        : kMsgTooMany);
    e.details["limit"] = c.limit;
    e.details["window_seconds"] = c.window_seconds;
    e.details["retry_after"] = c.retry_after;
    return e;
  }

  NormalizedError operator()(const cause::RouteNotFound &c) const {
    if (!debug)
      return make(404, ErrorCode::ResourceNotFound, kMsgNotFound);
    const std::string method = echo(c.method);
    const std::string path = echo(c.path);
    auto e = make(404, ErrorCode::ResourceNotFound,
                  "No route for " + method + " " + path);
    e.details["method"] = method;
    e.details["path"] = path;
    return e;
  }

  NormalizedError operator()(const cause::Upstream &c) const {
    auto e = make(502, ErrorCode::UpstreamError,
                  debug ? "Upstream request failed: " + echo(c.message)
                        : kMsgUpstream);
    if (c.status_code)
      e.details["upstream_status"] = *c.status_code;
    return e;
  }

  NormalizedError operator()(const cause::Overloaded &c) const {
    if (!debug)
      return make(503, ErrorCode::InternalError, kMsgUnavailable);
    auto e = make(503, ErrorCode::InternalError,
                  "Service unavailable: " + c.reason);
    e.details["reason"] = c.reason;
    return e;
  }

  NormalizedError operator()(const cause::Internal &c) const {
    return make(500, ErrorCode::InternalError,
                debug ? echo(c.what) : kMsgInternal);
  }
};

// Secret redaction is a single forward scan: client-supplied text can be
// up to max_body_bytes long, so no backtracking and no recursion.
constexpr const char *kBearerStops = "\"',;";
constexpr const char *kKeyedStops = "\"',;}";
constexpr std::string_view kSecretKeys[] = {
    "refreshtoken", "password", "passwd", "api_key", "api-key",
    "apikey",       "token",    "secret",
};

bool is_secret_char(char c, const char *stops) {
  return !std::isspace(static_cast<unsigned char>(c)) &&
         std::strchr(stops, c) == nullptr;
}

bool iequals_at(const std::string &s, std::size_t pos, std::string_view word) {
  if (s.size() - pos < word.size())
    return false;
  for (std::size_t k = 0; k < word.size(); ++k) {
    if (std::tolower(static_cast<unsigned char>(s[pos + k])) != word[k])
      return false;
  }
  return true;
}

std::size_t skip_spaces(const std::string &s, std::size_t pos) {
  while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos])))
    ++pos;
  return pos;
}

// "Bearer <value>": index of <value>, or npos.
std::size_t bearer_value_at(const std::string &s, std::size_t pos) {
  if (!iequals_at(s, pos, "bearer"))
    return std::string::npos;
  const std::size_t after = pos + 6;
  if (after >= s.size() || !std::isspace(static_cast<unsigned char>(s[after])))
    return std::string::npos;
  return skip_spaces(s, after);
}

// <key>"? [:=] "?<value> for a known secret key: index of <value>, or npos.
std::size_t keyed_value_at(const std::string &s, std::size_t pos) {
  for (std::string_view key : kSecretKeys) {
    if (!iequals_at(s, pos, key))
      continue;
    std::size_t j = pos + key.size();
    if (j < s.size() && s[j] == '"')
      ++j;
    j = skip_spaces(s, j);
    if (j >= s.size() || (s[j] != ':' && s[j] != '='))
      continue;
    j = skip_spaces(s, j + 1);
    if (j < s.size() && s[j] == '"')
      ++j;
    return j;
  }
  return std::string::npos;
}

std::string describe(const ErrorCause &cause) {
  return std::string("api error: ") + to_string(code_of(cause));
}

} // namespace

const char *to_string(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::ValidationError:
    return "VALIDATION_ERROR";
  case ErrorCode::AuthenticationFailed:
    return "AUTHENTICATION_FAILED";
  case ErrorCode::RateLimitExceeded:
    return "RATE_LIMIT_EXCEEDED";
  case ErrorCode::ResourceNotFound:
    return "RESOURCE_NOT_FOUND";
  case ErrorCode::UpstreamError:
    return "UPSTREAM_ERROR";
  case ErrorCode::InternalError:
    return "INTERNAL_ERROR";
  }
  return "INTERNAL_ERROR";
}

ErrorCode code_of(const ErrorCause &cause) noexcept {
  return std::visit(CodeOf{}, cause);
}

nlohmann::json NormalizedError::to_json() const {
  nlohmann::json j;
  j["status"] = status;
  j["message"] = message;
  j["error_code"] = to_string(code);
  j["timestamp"] = timestamp;
  if (!details.empty())
    j["details"] = details;
  return j;
}

NormalizedError ErrorNormalizer::normalize(const ErrorCause &cause) const {
  NormalizedError e = std::visit(Normalize{debug_}, cause);
  e.timestamp = unix_millis_now();
  return e;
}

std::string redact_secrets(const std::string &text) {
  const std::size_t n = text.size();
  std::string out;
  out.reserve(n);

  std::size_t i = 0;
  while (i < n) {
    const char *stops = kKeyedStops;
    std::size_t value = bearer_value_at(text, i);
    if (value != std::string::npos)
      stops = kBearerStops;
    else
      value = keyed_value_at(text, i);

    if (value != std::string::npos && value < n &&
        is_secret_char(text[value], stops)) {
      out.append(text, i, value - i);
      out += "***";
      i = value;
      while (i < n && is_secret_char(text[i], stops))
        ++i;
      continue;
    }
    out.push_back(text[i]);
    ++i;
  }
  return out;
}

std::string abbreviate(const std::string &text, std::size_t max_len) {
  if (text.size() <= max_len)
    return text;
  return text.substr(0, max_len) + "...";
}

ApiError::ApiError(ErrorCause cause)
    : std::runtime_error(describe(cause)), cause_(std::move(cause)) {}

} // namespace tbproxy
