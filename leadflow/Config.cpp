#include "Config.h"

#include <algorithm>
#include <folly/dynamic.h>
#include <folly/Conv.h>
#include <folly/Format.h>
#include <glog/logging.h>

using folly::dynamic;
using folly::StringPiece;

static PipelineError badConfig(StringPiece key, StringPiece reason) {
  PipelineError err = PIPE_BAD_CONFIG;
  err.putVariable(key).putVariable(reason);
  return err;
}

EngineConfig EngineConfig::defaults() {
  EngineConfig config;
  config.cadence = {
    {1,  3,  5, "call"},
    {2,  5,  7, "call"},
    {3,  7, 10, "email"},
    {4, 10, 14, "combo"},
    {5, 14, 21, "combo"},
  };
  return config;
}

PipelineResult<folly::Unit>
validateCadence(const std::vector<CadenceInterval> &table) {
  if (table.empty())
    return folly::makeUnexpected(badConfig("cadence", "table is empty"));

  for (size_t i = 0; i < table.size(); ++i) {
    const CadenceInterval &row = table[i];
    if (row.attempt != i + 1) {
      return folly::makeUnexpected(badConfig("cadence", folly::sformat(
          "row {} has attempt {}, expected {}", i, row.attempt, i + 1)));
    }
    if (row.minDays > row.maxDays) {
      return folly::makeUnexpected(badConfig("cadence", folly::sformat(
          "attempt {}: min_days {} exceeds max_days {}",
          row.attempt, row.minDays, row.maxDays)));
    }
    if (i > 0 && row.minDays < table[i - 1].minDays) {
      return folly::makeUnexpected(badConfig("cadence", folly::sformat(
          "attempt {}: min_days {} shorter than previous attempt",
          row.attempt, row.minDays)));
    }
  }
  return folly::unit;
}

static CadenceInterval intervalFromJson(const dynamic &row) {
  CadenceInterval interval;
  interval.attempt = folly::to<uint32_t>(row.at("attempt").asInt());
  interval.minDays = folly::to<uint32_t>(row.at("min_days").asInt());
  interval.maxDays = folly::to<uint32_t>(row.at("max_days").asInt());
  if (auto *channel = row.get_ptr("channel"))
    interval.channel = channel->asString();
  return interval;
}

PipelineResult<EngineConfig> EngineConfig::fromJson(const dynamic &json) {
  EngineConfig config = defaults();

  if (!json.isObject())
    return folly::makeUnexpected(badConfig("<root>", "object expected"));

  StringPiece key;
  try {
    key = "cadence";
    if (auto *rows = json.get_ptr(key)) {
      config.cadence.clear();
      for (const dynamic &row : *rows)
        config.cadence.push_back(intervalFromJson(row));
    }

    key = "similarity_threshold";
    if (auto *value = json.get_ptr(key))
      config.similarityThreshold = value->asDouble();

    key = "fuzzy_scan_limit";
    if (auto *value = json.get_ptr(key))
      config.fuzzyScanLimit = folly::to<uint32_t>(value->asInt());

    key = "lock_timeout_ms";
    if (auto *value = json.get_ptr(key))
      config.lockTimeout = std::chrono::milliseconds(value->asInt());
  } catch (const folly::TypeError &ex) {
    return folly::makeUnexpected(badConfig(key, ex.what()));
  } catch (const folly::ConversionError &ex) {
    return folly::makeUnexpected(badConfig(key, ex.what()));
  } catch (const std::out_of_range &ex) {
    return folly::makeUnexpected(badConfig(key, ex.what()));
  }

  if (!(config.similarityThreshold > 0.0 && config.similarityThreshold <= 1.0))
    return folly::makeUnexpected(badConfig("similarity_threshold",
                                           "must be in (0, 1]"));
  if (config.lockTimeout.count() < 0)
    return folly::makeUnexpected(badConfig("lock_timeout_ms",
                                           "must not be negative"));

  auto valid = validateCadence(config.cadence);
  if (!valid)
    return folly::makeUnexpected(std::move(valid.error()));
  return config;
}

dynamic EngineConfig::toJson() const {
  dynamic rows = dynamic::array;
  for (const CadenceInterval &row : cadence) {
    rows.push_back(dynamic::object
                   ("attempt", row.attempt)
                   ("min_days", row.minDays)
                   ("max_days", row.maxDays)
                   ("channel", row.channel));
  }

  return dynamic::object
    ("cadence", std::move(rows))
    ("similarity_threshold", similarityThreshold)
    ("fuzzy_scan_limit", fuzzyScanLimit)
    ("lock_timeout_ms", static_cast<int64_t>(lockTimeout.count()));
}

const CadenceInterval& EngineConfig::intervalFor(uint32_t attemptCount) const {
  CHECK(!cadence.empty());
  size_t row = std::max<uint32_t>(attemptCount, 1) - 1;
  return cadence[std::min(row, cadence.size() - 1)];
}
