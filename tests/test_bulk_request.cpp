#include <gtest/gtest.h>
#include <tbproxy/bulk_request.hpp>
#include <tbproxy/error_normalizer.hpp>

#include <string>

using namespace tbproxy;

namespace {

// Returns the cause the parser rejected body with; fails the test if it
// accepted it.
ErrorCause rejection(const std::string &body) {
  try {
    parse_bulk_request(body);
  } catch (const ApiError &e) {
    return e.cause();
  }
  ADD_FAILURE() << "accepted: " << body;
  return cause::Internal{"accepted"};
}

bool is_schema_violation(const ErrorCause &c) {
  return std::holds_alternative<cause::SchemaViolation>(c);
}

} // namespace

TEST(BulkRequest, ParsesDevicesKeysAndSamples) {
  const auto targets = parse_bulk_request(R"({
    "dev-a": {"temperature": [{"ts": 1640995200000, "value": 25.6},
                              {"ts": 1640995260000, "value": 25.8}],
              "status": [{"ts": 1640995200000, "value": {"door": "open"}}]},
    "dev-b": {"humidity": [{"ts": 1640995200000, "value": 40}]}
  })");

  ASSERT_EQ(targets.size(), 2u);
  const UploadTarget *a = nullptr;
  for (const auto &t : targets)
    if (t.target_id == "dev-a")
      a = &t;
  ASSERT_NE(a, nullptr);
  ASSERT_EQ(a->payload.size(), 2u);
  ASSERT_EQ(a->payload.at("temperature").size(), 2u);
  EXPECT_EQ(a->payload.at("temperature")[1].ts, 1640995260000LL);
  EXPECT_DOUBLE_EQ(a->payload.at("temperature")[0].value.get<double>(), 25.6);
  EXPECT_EQ(a->payload.at("status")[0].value["door"], "open");
  EXPECT_EQ(count_samples(a->payload), 3u);
}

TEST(BulkRequest, EmptyObjectIsEmptyRequest) {
  EXPECT_TRUE(std::holds_alternative<cause::EmptyRequest>(rejection("{}")));
}

TEST(BulkRequest, OuterShapeViolationsRejectWholeBody) {
  EXPECT_TRUE(is_schema_violation(rejection("not json")));
  EXPECT_TRUE(is_schema_violation(rejection("[1, 2]")));
  EXPECT_TRUE(is_schema_violation(rejection(R"({"dev": 5})")));
  EXPECT_TRUE(is_schema_violation(rejection(R"({"dev": {"t": 25.6}})")));
  EXPECT_TRUE(is_schema_violation(rejection(R"({"dev": {"t": [25.6]}})")));
  EXPECT_TRUE(
      is_schema_violation(rejection(R"({"dev": {"t": [{"ts": 1}]}})")));
  EXPECT_TRUE(
      is_schema_violation(rejection(R"({"dev": {"t": [{"value": 1}]}})")));
}

TEST(BulkRequest, SampleContentsAreLeftForPerDeviceChecks) {
  // an empty device, an empty series, a bad ts and a null value all parse;
  // they fail their own device later
  const auto targets = parse_bulk_request(R"({
    "empty": {},
    "no-samples": {"t": []},
    "bad-ts": {"t": [{"ts": "yesterday", "value": 1}]},
    "null": {"t": [{"ts": 1, "value": null}]}
  })");
  ASSERT_EQ(targets.size(), 4u);
  for (const auto &t : targets) {
    if (t.target_id == "empty")
      EXPECT_TRUE(t.payload.empty());
  }
}
