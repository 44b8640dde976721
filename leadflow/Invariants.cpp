#include "Invariants.h"
#include "Codec.h"

#include <folly/Conv.h>
#include <glog/logging.h>

using folly::StringPiece;

namespace invariants {

PipelineError dncViolation(int64_t prospectId, StringPiece action) {
  PipelineError err = PIPE_DNC_VIOLATION;
  err.putVariable(folly::to<std::string>(prospectId)).putVariable(action);
  LOG(ERROR) << err.message();
  return err;
}

PipelineError validationFailed(int64_t prospectId, StringPiece reason) {
  PipelineError err = PIPE_VALIDATION_FAILED;
  err.putVariable(folly::to<std::string>(prospectId)).putVariable(reason);
  return err;
}

PipelineError notFound(int64_t prospectId) {
  PipelineError err = PIPE_NOT_FOUND;
  err.putVariable(folly::to<std::string>(prospectId));
  return err;
}

PipelineResult<folly::Unit> checkNotDnc(const Prospect &prospect, StringPiece action) {
  if (prospect.population == Population::DeadDnc)
    return folly::makeUnexpected(dncViolation(prospect.id, action));
  return folly::unit;
}

PipelineResult<folly::Unit> checkStructure(const Prospect &p) {
  if (p.population == Population::Engaged && !p.followUpDate)
    return folly::makeUnexpected(validationFailed(p.id, "orphan engaged"));

  if (p.population == Population::Parked && !p.parkedMonth)
    return folly::makeUnexpected(validationFailed(p.id, "parked without month"));

  if (p.population != Population::Engaged && p.engagementStage) {
    return folly::makeUnexpected(validationFailed(p.id, folly::to<std::string>(
        "stage ", toString(*p.engagementStage), " outside engaged (",
        toString(p.population), ")")));
  }

  if (p.population == Population::Engaged && !p.engagementStage)
    return folly::makeUnexpected(validationFailed(p.id, "engaged without stage"));

  if (p.population == Population::DeadDnc && (p.followUpDate || p.parkedMonth)) {
    return folly::makeUnexpected(validationFailed(
        p.id, "dead_dnc carries scheduling state"));
  }
  return folly::unit;
}

std::vector<Violation> audit(EntityStore::Transaction &txn) {
  std::vector<Violation> out;
  txn.forEachProspect([&](const Prospect &p) {
    auto ok = checkStructure(p);
    if (!ok) {
      LOG(ERROR) << "invariant violation: " << ok.error().message();
      out.push_back(Violation{p.id, std::move(ok.error())});
    }
  });
  return out;
}

} // namespace invariants
