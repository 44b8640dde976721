#ifndef LEADFLOW_INVARIANTS_H
#define LEADFLOW_INVARIANTS_H

#include "EntityStore.h"

#include <vector>
#include <folly/Unit.h>

/**
 * Pure checks on a candidate prospect state, shared by the state machines,
 * the cadence engine and intake.
 */
namespace invariants {

/** DNC prospects accept no writes. Logs the refusal at ERROR. */
PipelineResult<folly::Unit> checkNotDnc(const Prospect &prospect,
                                        folly::StringPiece action);

/**
 * Engaged needs a follow-up, Parked needs a month, and a stage exists only
 * while Engaged.
 */
PipelineResult<folly::Unit> checkStructure(const Prospect &prospect);

PipelineError dncViolation(int64_t prospectId, folly::StringPiece action);
PipelineError validationFailed(int64_t prospectId, folly::StringPiece reason);
PipelineError notFound(int64_t prospectId);

struct Violation {
  int64_t prospectId;
  PipelineError error;
};

/** Run checkStructure over the whole store. */
std::vector<Violation> audit(EntityStore::Transaction &txn);

} // namespace invariants

#endif // LEADFLOW_INVARIANTS_H
