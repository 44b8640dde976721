#include "Populations.h"
#include "Codec.h"
#include "Invariants.h"

#include <algorithm>
#include <folly/Conv.h>
#include <glog/logging.h>

using folly::StringPiece;

static folly::Range<const Population*> edgesFrom(Population from) noexcept {
  static const Population broken[] = {
    Population::Unengaged, Population::DeadDnc,
  };
  static const Population unengaged[] = {
    Population::Engaged, Population::DeadDnc, Population::Lost,
    Population::Parked, Population::Partnership,
  };
  static const Population engaged[] = {
    Population::ClosedWon, Population::Lost, Population::Parked, Population::DeadDnc,
  };
  static const Population parked[] = {
    Population::Unengaged, Population::DeadDnc,
  };
  static const Population lost[] = {
    Population::Unengaged, Population::DeadDnc,
  };

  switch (from) {
  case Population::Broken:    return folly::range(broken);
  case Population::Unengaged: return folly::range(unengaged);
  case Population::Engaged:   return folly::range(engaged);
  case Population::Parked:    return folly::range(parked);
  case Population::Lost:      return folly::range(lost);
  case Population::ClosedWon:
  case Population::Partnership:
  case Population::DeadDnc:
    break;
  }
  return {};
}

PopulationMachine::PopulationMachine(EntityStore &store, const CadenceEngine &cadence,
                                     const Clock &clock)
  : store_(store)
  , cadence_(cadence)
  , clock_(clock)
{
}

bool PopulationMachine::canTransition(Population from, Population to) noexcept {
  auto edges = edgesFrom(from);
  return std::find(edges.begin(), edges.end(), to) != edges.end();
}

std::vector<Population> PopulationMachine::availableTransitions(Population from) {
  auto edges = edgesFrom(from);
  return std::vector<Population>(edges.begin(), edges.end());
}

PipelineResult<Prospect>
PopulationMachine::apply(EntityStore::Transaction &txn, const Prospect &prospect,
                         Population target, const TransitionOptions &opts)
{
  const Population from = prospect.population;
  const int64_t id = prospect.id;

  auto allowed = invariants::checkNotDnc(
      prospect, folly::to<std::string>("transition to ", toString(target), " refused"));
  if (!allowed)
    return folly::makeUnexpected(std::move(allowed.error()));

  if (!canTransition(from, target)) {
    PipelineError err = PIPE_INVALID_TRANSITION;
    err.putVariable(folly::to<std::string>(id))
      .putVariable(folly::to<std::string>("from ", toString(from), " to ", toString(target)));
    return folly::makeUnexpected(std::move(err));
  }

  const Timestamp now = clock_.now();
  const Date today = now.date();
  Prospect next = prospect;
  next.population = target;
  if (from == Population::Engaged)
    next.engagementStage.clear();

  switch (target) {
  case Population::Engaged:
    if (!opts.followUp)
      return folly::makeUnexpected(invariants::validationFailed(id, "orphan engaged"));
    next.engagementStage = opts.stage ? *opts.stage : EngagementStage::PreDemo;
    next.followUpDate = opts.followUp;
    next.parkedMonth.clear();
    break;
  case Population::Parked:
    if (!opts.parkedMonth)
      return folly::makeUnexpected(invariants::validationFailed(id, "parked without month"));
    next.parkedMonth = opts.parkedMonth;
    next.followUpDate.clear();
    break;
  case Population::DeadDnc:
    next.followUpDate.clear();
    next.parkedMonth.clear();
    next.deadReason = opts.reason;
    next.deadDate = today;
    break;
  case Population::Lost:
    next.lostReason = opts.lostReason;
    next.lostDate = today;
    next.followUpDate.clear();
    break;
  case Population::ClosedWon:
    next.closeDate = today;
    next.closeNotes = opts.closeNotes.empty() ? opts.reason : opts.closeNotes;
    next.followUpDate.clear();
    break;
  case Population::Partnership:
    next.followUpDate.clear();
    break;
  case Population::Unengaged:
    next.parkedMonth.clear();
    next.followUpDate = opts.followUp
      ? *opts.followUp : cadence_.nextSystemFollowUp(next, today);
    break;
  case Population::Broken:
    break;
  }

  auto valid = invariants::checkStructure(next);
  if (!valid)
    return folly::makeUnexpected(std::move(valid.error()));

  next.updatedAt = now;
  txn.updateProspect(next);

  Activity activity;
  activity.prospectId = id;
  activity.type = ActivityType::StatusChange;
  activity.populationBefore = from;
  activity.populationAfter = target;
  activity.stageBefore = prospect.engagementStage;
  activity.stageAfter = next.engagementStage;
  if (next.followUpDate != prospect.followUpDate)
    activity.followUpSet = next.followUpDate;
  activity.notes = opts.reason;
  activity.createdBy = opts.createdBy;
  activity.createdAt = now;
  txn.createActivity(std::move(activity));

  return next;
}

PipelineResult<Prospect>
PopulationMachine::transition(int64_t prospectId, Population target,
                              const TransitionOptions &opts)
{
  auto txn = store_.begin();
  if (!txn)
    return folly::makeUnexpected(std::move(txn.error()));

  auto prospect = (*txn)->getProspect(prospectId);
  if (!prospect)
    return folly::makeUnexpected(invariants::notFound(prospectId));

  auto result = apply(**txn, *prospect, target, opts);
  if (!result)
    return result;
  (*txn)->commit();

  LOG(INFO) << "prospect " << prospectId << ": " << toString(prospect->population)
            << " -> " << toString(target)
            << (opts.reason.empty() ? "" : " (" + opts.reason + ")");
  return result;
}

PipelineResult<Prospect>
PopulationMachine::admit(EntityStore::Transaction &txn, Prospect prospect,
                         Population initial, StringPiece provenance)
{
  if (initial != Population::Unengaged && initial != Population::Broken) {
    return folly::makeUnexpected(invariants::validationFailed(
        prospect.id, folly::to<std::string>("cannot start in ", toString(initial))));
  }

  const Timestamp now = clock_.now();
  prospect.population = initial;
  prospect.engagementStage.clear();
  prospect.parkedMonth.clear();
  prospect.followUpDate = cadence_.nextSystemFollowUp(prospect, now.date());
  prospect.createdAt = now;
  prospect.updatedAt = now;
  prospect.id = txn.createProspect(prospect);

  Activity activity;
  activity.prospectId = prospect.id;
  activity.type = ActivityType::Import;
  activity.populationAfter = initial;
  activity.followUpSet = prospect.followUpDate;
  activity.notes = provenance.str();
  activity.createdBy = "import";
  activity.createdAt = now;
  txn.createActivity(std::move(activity));

  return prospect;
}

PipelineResult<BatchResult<Prospect, int64_t>>
PopulationMachine::reactivateParked(const Date &today) {
  BatchResult<Prospect, int64_t> result;
  const ParkedMonth current = ParkedMonth::of(today);

  std::vector<int64_t> due;
  {
    auto txn = store_.begin();
    if (!txn)
      return folly::makeUnexpected(std::move(txn.error()));
    (*txn)->forEachProspect([&](const Prospect &p) {
      if (p.population == Population::Parked && p.parkedMonth && *p.parkedMonth <= current)
        due.push_back(p.id);
    });
  }

  TransitionOptions opts;
  opts.reason = "parked month " + current.str() + " reached";
  opts.createdBy = "system";
  for (int64_t id : due) {
    auto moved = transition(id, Population::Unengaged, opts);
    if (moved)
      result.succeeded.push_back(std::move(*moved));
    else
      result.failed.emplace_back(id, std::move(moved.error()));
  }

  LOG(INFO) << "parked reactivation: " << result.succeeded.size() << " woke up, "
            << result.failed.size() << " failed";
  return result;
}
