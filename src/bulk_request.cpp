#include "tbproxy/bulk_request.hpp"
#include "tbproxy/error_normalizer.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace tbproxy {

namespace {

[[noreturn]] void reject(const std::string &reason) {
  throw ApiError(cause::SchemaViolation{reason});
}

} // namespace

std::vector<UploadTarget> parse_bulk_request(const std::string &body) {
  json root;
  try {
    root = json::parse(body);
  } catch (const json::parse_error &e) {
    reject(std::string("body is not valid JSON: ") + e.what());
  }

  if (!root.is_object())
    reject("body must be a JSON object keyed by device id");
  if (root.empty())
    throw ApiError(cause::EmptyRequest{});

  std::vector<UploadTarget> targets;
  targets.reserve(root.size());

  for (auto &[device_id, telemetry] : root.items()) {
    if (!telemetry.is_object())
      reject("telemetry for device '" + abbreviate(device_id) +
             "' must be an object");

    UploadTarget t;
    t.target_id = device_id;
    for (auto &[key, series] : telemetry.items()) {
      if (!series.is_array())
        reject("telemetry values must be arrays of data points (device '" +
               abbreviate(device_id) + "', key '" + abbreviate(key) + "')");

      auto &samples = t.payload[key];
      samples.reserve(series.size());
      for (auto &point : series) {
        if (!point.is_object() || !point.contains("ts") ||
            !point.contains("value"))
          reject("data points need 'ts' and 'value' (device '" +
                 abbreviate(device_id) + "', key '" + abbreviate(key) + "')");
        samples.push_back(Sample{point["ts"], point["value"]});
      }
    }
    targets.push_back(std::move(t));
  }
  return targets;
}

} // namespace tbproxy
