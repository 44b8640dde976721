#include <leadflow/Config.h>

#include <folly/portability/GMock.h>
#include <folly/portability/GTest.h>
#include <folly/dynamic.h>

using namespace testing;
using folly::dynamic;

static dynamic row(int attempt, int minDays, int maxDays) {
  return dynamic::object
    ("attempt", attempt)("min_days", minDays)("max_days", maxDays)("channel", "call");
}

static void expectRejected(const dynamic &json, const char *key) {
  auto config = EngineConfig::fromJson(json);
  ASSERT_FALSE(config.hasValue());
  EXPECT_EQ(config.error().code(), PIPE_BAD_CONFIG);
  EXPECT_THAT(config.error().message(), HasSubstr(key));
}

TEST(EngineConfig, Defaults) {
  EngineConfig config = EngineConfig::defaults();
  ASSERT_EQ(config.cadence.size(), 5);
  EXPECT_EQ(config.cadence[0].minDays, 3);
  EXPECT_EQ(config.cadence[0].maxDays, 5);
  EXPECT_EQ(config.cadence[2].channel, "email");
  EXPECT_EQ(config.cadence[4].minDays, 14);
  EXPECT_DOUBLE_EQ(config.similarityThreshold, 0.85);
  EXPECT_TRUE(validateCadence(config.cadence).hasValue());
}

TEST(EngineConfig, IntervalFor) {
  EngineConfig config = EngineConfig::defaults();
  EXPECT_EQ(config.intervalFor(0).attempt, 1);
  EXPECT_EQ(config.intervalFor(1).attempt, 1);
  EXPECT_EQ(config.intervalFor(3).attempt, 3);
  EXPECT_EQ(config.intervalFor(5).attempt, 5);
  EXPECT_EQ(config.intervalFor(40).attempt, 5);
}

TEST(EngineConfig, FromJson) {
  dynamic json = dynamic::object
    ("cadence", dynamic::array(row(1, 2, 3), row(2, 2, 4), row(3, 9, 12)))
    ("similarity_threshold", 0.9)
    ("lock_timeout_ms", 250);

  EngineConfig config = EngineConfig::fromJson(json).value();
  ASSERT_EQ(config.cadence.size(), 3);
  EXPECT_EQ(config.cadence[2].minDays, 9);
  EXPECT_DOUBLE_EQ(config.similarityThreshold, 0.9);
  EXPECT_EQ(config.lockTimeout.count(), 250);
  EXPECT_EQ(config.fuzzyScanLimit, 500);

  EngineConfig again = EngineConfig::fromJson(config.toJson()).value();
  EXPECT_EQ(again.cadence.size(), 3);
  EXPECT_DOUBLE_EQ(again.similarityThreshold, 0.9);
}

TEST(EngineConfig, EmptyObjectKeepsDefaults) {
  EngineConfig config = EngineConfig::fromJson(dynamic::object).value();
  EXPECT_EQ(config.cadence.size(), 5);
  EXPECT_DOUBLE_EQ(config.similarityThreshold, 0.85);
}

TEST(EngineConfig, RejectsBadCadence) {
  expectRejected(dynamic::object("cadence", dynamic::array()), "cadence");
  // not contiguous
  expectRejected(dynamic::object("cadence", dynamic::array(row(1, 3, 5), row(3, 5, 7))),
                 "cadence");
  // min > max
  expectRejected(dynamic::object("cadence", dynamic::array(row(1, 6, 5))), "cadence");
  // shrinking interval
  expectRejected(dynamic::object("cadence", dynamic::array(row(1, 5, 7), row(2, 3, 7))),
                 "cadence");
  // bad type
  expectRejected(dynamic::object("cadence", dynamic::array(
      dynamic::object("attempt", "one")("min_days", 1)("max_days", 2))), "cadence");
  expectRejected(dynamic::object("cadence", dynamic::array(
      dynamic::object("attempt", 1)("max_days", 2))), "cadence");
}

TEST(EngineConfig, RejectsBadScalars) {
  expectRejected(dynamic::object("similarity_threshold", 0), "similarity_threshold");
  expectRejected(dynamic::object("similarity_threshold", 1.5), "similarity_threshold");
  expectRejected(dynamic::object("similarity_threshold", "high"), "similarity_threshold");
  expectRejected(dynamic::object("lock_timeout_ms", -1), "lock_timeout_ms");
  expectRejected(dynamic::array(1, 2), "<root>");
}
