#ifndef LEADFLOW_CONFIG_H
#define LEADFLOW_CONFIG_H

#include "PipelineError.h"

#include <chrono>
#include <string>
#include <vector>
#include <folly/Unit.h>

namespace folly {
  struct dynamic;
}

/** One row of the system-paced outreach table. */
struct CadenceInterval {
  uint32_t attempt = 0;
  uint32_t minDays = 0;
  uint32_t maxDays = 0;
  std::string channel;
};

/**
 * Immutable engine configuration. Built once at startup and handed to
 * every engine by const reference.
 */
struct EngineConfig {
  std::vector<CadenceInterval> cadence;
  /** Fuzzy name ratio at or above which intake merges. */
  double similarityThreshold = 0.85;
  /** Max prospects per company compared by the fuzzy matcher. */
  uint32_t fuzzyScanLimit = 500;
  std::chrono::milliseconds lockTimeout{5000};

  static EngineConfig defaults();

  /**
   * Absent keys keep their defaults. Rejects empty, non-contiguous or
   * non-monotonic cadence tables and out of range scalars.
   */
  static PipelineResult<EngineConfig> fromJson(const folly::dynamic &json);
  folly::dynamic toJson() const;

  /** Interval for the given attempt count, clamped to the table. */
  const CadenceInterval& intervalFor(uint32_t attemptCount) const;
};

/** Check a cadence table without touching the rest of the config. */
PipelineResult<folly::Unit> validateCadence(const std::vector<CadenceInterval> &table);

#endif // LEADFLOW_CONFIG_H
