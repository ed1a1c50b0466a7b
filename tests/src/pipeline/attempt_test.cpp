#include <salvage/decode/decode.hpp>
#include <salvage/pipeline/attempt.hpp>
#include <salvage/pipeline/run.hpp>
#include <salvage/testing/common.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace decode = salvage::decode;
namespace pipeline = salvage::pipeline;
using salvage::schema::decode_errors_t;
using salvage::testing::failing;
using salvage::testing::instrumented;
using salvage::testing::make_call_log;
using salvage::testing::missing_field;
using salvage::testing::parse;

namespace {

struct profile final {
  std::string name;
  int64_t age{};
  bool admin{};
  std::string locale;

  bool operator==(const profile&) const = default;
};

profile make_profile(std::string name,
                     int64_t age,
                     bool admin,
                     std::string locale) {
  return profile{.name = std::move(name),
                 .age = age,
                 .admin = admin,
                 .locale = std::move(locale)};
}

}  // namespace

TEST(pipeline_attempt, from_value_reads_nothing) {
  const auto start = pipeline::from_value(&make_profile);
  const auto state = start.evaluate(parse("{}"));
  const auto* staged =
      std::get_if<pipeline::partial_value<std::tuple<>>>(&state);
  ASSERT_NE(staged, nullptr);
  EXPECT_TRUE(staged->errors.empty());
}

TEST(pipeline_attempt, function_pointer_constructor_receives_slots_in_order) {
  const auto attempt = pipeline::from_value(&make_profile)
                           .risk(decode::field("name", decode::string()))
                           .try_or(decode::field("age", decode::integer()), 0)
                           .try_or(decode::field("admin", decode::boolean()), false)
                           .try_or(decode::field("locale", decode::string()),
                                   std::string{"en"});
  const auto outcome = pipeline::run_dangerously(
      attempt,
      parse(R"({"name": "ada", "age": 36, "admin": true, "locale": "fr"})"));
  const auto* result = std::get_if<0>(&outcome);
  ASSERT_NE(result, nullptr);
  EXPECT_EQ(result->value, make_profile("ada", 36, true, "fr"));
  EXPECT_TRUE(result->errors.empty());
}

TEST(pipeline_attempt, fallback_replaces_failed_field) {
  const auto attempt =
      pipeline::from_value(pipeline::construct<profile>())
          .try_or(decode::field("name", decode::string()), std::string{"anon"})
          .try_or(decode::field("age", decode::integer()), -1)
          .try_or(decode::field("admin", decode::boolean()), false)
          .try_or(decode::field("locale", decode::string()), std::string{"en"});
  const auto result = pipeline::run_safely(
      attempt, parse(R"({"name": "ada", "age": "old", "locale": "fr"})"));
  EXPECT_EQ(result.value, make_profile("ada", -1, false, "fr"));
  ASSERT_EQ(result.errors.size(), 2u);
  EXPECT_EQ(salvage::schema::to_string(result.errors[0]),
            "$.age: expected integer, found string");
  EXPECT_EQ(result.errors[1], missing_field("admin"));
}

TEST(pipeline_attempt, minor_errors_keep_chain_order) {
  const auto attempt =
      pipeline::from_value(pipeline::construct<profile>())
          .try_or(failing<std::string>("first"), std::string{})
          .try_or(decode::field("age", decode::integer()), 0)
          .try_or(failing<bool>("third"), false)
          .try_or(failing<std::string>("fourth"), std::string{});
  const auto result = pipeline::run_safely(attempt, parse(R"({"age": 1})"));
  ASSERT_EQ(result.errors.size(), 3u);
  EXPECT_EQ(result.errors[0].message, "first");
  EXPECT_EQ(result.errors[1].message, "third");
  EXPECT_EQ(result.errors[2].message, "fourth");
  EXPECT_EQ(result.value.age, 1);
}

TEST(pipeline_attempt, fallback_value_is_used_verbatim) {
  const auto attempt =
      pipeline::from_value(pipeline::construct<profile>())
          .try_or(failing<std::string>("no"), std::string{"  padded  "})
          .try_or(failing<int64_t>("no"), int64_t{-42})
          .try_or(failing<bool>("no"), true)
          .try_or(failing<std::string>("no"), std::string{});
  const auto result = pipeline::run_safely(attempt, parse("null"));
  EXPECT_EQ(result.value, make_profile("  padded  ", -42, true, ""));
  EXPECT_EQ(result.errors.size(), 4u);
}

TEST(pipeline_attempt, failed_risk_short_circuits_later_steps) {
  auto log = make_call_log();
  const auto attempt =
      pipeline::from_value(pipeline::construct<profile>())
          .try_or(instrumented("name", decode::field("name", decode::string()),
                               log),
                  std::string{})
          .risk(instrumented("age", decode::field("age", decode::integer()), log))
          .risk(instrumented("admin", decode::field("admin", decode::boolean()),
                             log))
          .try_or(instrumented("locale",
                               decode::field("locale", decode::string()), log),
                  std::string{"en"});

  const auto outcome =
      pipeline::run_dangerously(attempt, parse(R"({"name": 1, "admin": true})"));
  const auto* error = std::get_if<1>(&outcome);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(*error, missing_field("age"));
  EXPECT_EQ(*log, (std::vector<std::string>{"name", "age"}));
}

TEST(pipeline_attempt, first_failing_risk_wins) {
  auto log = make_call_log();
  const auto attempt =
      pipeline::from_value(pipeline::construct<profile>())
          .risk(instrumented("name", failing<std::string>("name broken"), log))
          .risk(instrumented("age", failing<int64_t>("age broken"), log))
          .try_or(decode::boolean(), false)
          .try_or(decode::string(), std::string{});
  const auto outcome = pipeline::run_dangerously(attempt, parse("{}"));
  ASSERT_NE(std::get_if<1>(&outcome), nullptr);
  EXPECT_EQ(std::get<1>(outcome).message, "name broken");
  EXPECT_EQ(salvage::testing::count(log, "age"), 0u);
}

TEST(pipeline_attempt, critical_error_drops_earlier_minor_errors) {
  const auto attempt =
      pipeline::from_value(pipeline::construct<profile>())
          .try_or(failing<std::string>("minor"), std::string{})
          .try_or(failing<int64_t>("minor"), 0)
          .risk(failing<bool>("fatal"))
          .try_or(decode::string(), std::string{});
  const auto state = attempt.evaluate(parse("{}"));
  const auto* failure = std::get_if<pipeline::critical_error>(&state);
  ASSERT_NE(failure, nullptr);
  EXPECT_EQ(failure->error.message, "fatal");

  const auto outcome = pipeline::run_dangerously(attempt, parse("{}"));
  ASSERT_NE(std::get_if<1>(&outcome), nullptr);
  EXPECT_EQ(std::get<1>(outcome).message, "fatal");
}

TEST(pipeline_attempt, successful_risk_keeps_minor_errors) {
  const auto attempt =
      pipeline::from_value(pipeline::construct<profile>())
          .try_or(failing<std::string>("minor"), std::string{"x"})
          .risk(decode::field("age", decode::integer()))
          .try_or(decode::field("admin", decode::boolean()), false)
          .try_or(decode::field("locale", decode::string()), std::string{"en"});
  const auto outcome = pipeline::run_dangerously(
      attempt, parse(R"({"age": 7, "admin": true, "locale": "de"})"));
  const auto* result = std::get_if<0>(&outcome);
  ASSERT_NE(result, nullptr);
  EXPECT_EQ(result->value, make_profile("x", 7, true, "de"));
  ASSERT_EQ(result->errors.size(), 1u);
  EXPECT_EQ(result->errors[0].message, "minor");
}

TEST(pipeline_attempt, extending_does_not_change_the_original) {
  auto log = make_call_log();
  const auto base =
      pipeline::from_value(pipeline::construct<profile>())
          .try_or(instrumented("name", decode::field("name", decode::string()),
                               log),
                  std::string{})
          .try_or(decode::field("age", decode::integer()), 0);
  const auto strict = base.risk(decode::field("admin", decode::boolean()))
                          .try_or(decode::string(), std::string{});
  const auto lenient = base.try_or(decode::field("admin", decode::boolean()), true)
                           .try_or(decode::string(), std::string{});

  const auto raw = parse(R"({"name": "n", "age": 2})");
  const auto rejected = pipeline::run_dangerously(strict, raw);
  EXPECT_NE(std::get_if<1>(&rejected), nullptr);
  const auto relaxed = pipeline::run_safely(lenient, raw);
  EXPECT_TRUE(relaxed.value.admin);

  const auto state = base.evaluate(raw);
  const auto* staged =
      std::get_if<pipeline::partial_value<std::tuple<std::string, int64_t>>>(
          &state);
  ASSERT_NE(staged, nullptr);
  EXPECT_EQ(std::get<0>(staged->value), "n");
  EXPECT_EQ(std::get<1>(staged->value), 2);
  EXPECT_TRUE(staged->errors.empty());
  EXPECT_EQ(salvage::testing::count(log, "name"), 3u);
}

TEST(pipeline_attempt, hardcoded_fills_slot_without_reading) {
  const auto attempt =
      pipeline::from_value(pipeline::construct<profile>())
          .risk(decode::field("name", decode::string()))
          .hardcoded(int64_t{99})
          .try_or(decode::field("admin", decode::boolean()), false)
          .hardcoded(std::string{"en"});
  const auto outcome =
      pipeline::run_dangerously(attempt, parse(R"({"name": "n", "age": 1})"));
  const auto* result = std::get_if<0>(&outcome);
  ASSERT_NE(result, nullptr);
  EXPECT_EQ(result->value, make_profile("n", 99, false, "en"));
  ASSERT_EQ(result->errors.size(), 1u);
  EXPECT_EQ(result->errors[0], missing_field("admin"));
}

TEST(pipeline_attempt, optional_slots_accept_nullopt_fallback) {
  struct event final {
    std::string title;
    std::optional<int64_t> starts_at;
  };
  const auto attempt =
      pipeline::from_value(pipeline::construct<event>())
          .try_or(decode::field("title", decode::string()), std::string{})
          .try_or(decode::field("startsAt", decode::nullable(decode::integer())),
                  std::nullopt);
  const auto present =
      pipeline::run_safely(attempt, parse(R"({"title": "t", "startsAt": 5})"));
  EXPECT_EQ(present.value.starts_at, std::optional<int64_t>{5});
  EXPECT_TRUE(present.errors.empty());

  const auto explicit_null =
      pipeline::run_safely(attempt, parse(R"({"title": "t", "startsAt": null})"));
  EXPECT_FALSE(explicit_null.value.starts_at.has_value());
  EXPECT_TRUE(explicit_null.errors.empty());
}
