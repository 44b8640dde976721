#include "Stages.h"
#include "Codec.h"
#include "Invariants.h"

#include <folly/Conv.h>
#include <glog/logging.h>

using folly::StringPiece;

StageMachine::StageMachine(EntityStore &store, const Clock &clock)
  : store_(store)
  , clock_(clock)
{
}

folly::Optional<EngagementStage> StageMachine::nextStage(EngagementStage from) noexcept {
  switch (from) {
  case EngagementStage::PreDemo:       return EngagementStage::DemoScheduled;
  case EngagementStage::DemoScheduled: return EngagementStage::PostDemo;
  case EngagementStage::PostDemo:      return EngagementStage::Closing;
  case EngagementStage::Closing:       break;
  }
  return folly::none;
}

bool StageMachine::canTransitionStage(EngagementStage from, EngagementStage to) noexcept {
  auto next = nextStage(from);
  return next && *next == to;
}

static PipelineError invalidStage(int64_t id, StringPiece what) {
  PipelineError err = PIPE_INVALID_TRANSITION;
  err.putVariable(folly::to<std::string>(id)).putVariable(what);
  return err;
}

PipelineResult<Prospect>
StageMachine::transitionStage(int64_t prospectId, EngagementStage to, StringPiece reason) {
  auto txn = store_.begin();
  if (!txn)
    return folly::makeUnexpected(std::move(txn.error()));

  auto prospect = (*txn)->getProspect(prospectId);
  if (!prospect)
    return folly::makeUnexpected(invariants::notFound(prospectId));

  auto allowed = invariants::checkNotDnc(
      *prospect, folly::to<std::string>("stage change to ", toString(to), " refused"));
  if (!allowed)
    return folly::makeUnexpected(std::move(allowed.error()));

  if (prospect->population != Population::Engaged) {
    return folly::makeUnexpected(invalidStage(prospectId, folly::to<std::string>(
        "to stage ", toString(to), " while ", toString(prospect->population))));
  }

  const EngagementStage from = prospect->engagementStage
    ? *prospect->engagementStage : EngagementStage::PreDemo;
  if (!canTransitionStage(from, to)) {
    return folly::makeUnexpected(invalidStage(prospectId, folly::to<std::string>(
        "from stage ", toString(from), " to ", toString(to))));
  }

  Timestamp now = clock_.now();
  prospect->engagementStage = to;
  prospect->updatedAt = now;
  (*txn)->updateProspect(*prospect);

  Activity activity;
  activity.prospectId = prospectId;
  activity.type = ActivityType::StatusChange;
  activity.populationBefore = Population::Engaged;
  activity.populationAfter = Population::Engaged;
  activity.stageBefore = from;
  activity.stageAfter = to;
  activity.notes = reason.str();
  activity.createdAt = now;
  (*txn)->createActivity(std::move(activity));
  (*txn)->commit();

  LOG(INFO) << "prospect " << prospectId << ": stage " << toString(from)
            << " -> " << toString(to);
  return std::move(*prospect);
}
