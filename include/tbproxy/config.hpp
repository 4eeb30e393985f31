#pragma once
#include "bulk_upload.hpp"
#include "rate_limiter.hpp"
#include "thingsboard_client.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace tbproxy {

// Every key is optional; absent keys keep the defaults from Config.
// Throws std::invalid_argument on out-of-range values and
// nlohmann::json::exception on wrongly typed ones.
Config config_from_json(const nlohmann::json &j);

// Reads path if it exists (defaults otherwise), then applies the TB_USERNAME,
// TB_PASSWORD and API_KEY environment overrides and validates the result.
Config load_config(const std::string &path);

void apply_env_overrides(Config &c);

// Throws std::invalid_argument describing the first bad field.
void validate_config(const Config &c);

RateLimiterConfig rate_limiter_config(const Config &c);
ThingsBoardConfig thingsboard_config(const Config &c);
BulkUploadConfig bulk_upload_config(const Config &c);

} // namespace tbproxy
