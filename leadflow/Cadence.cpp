#include "Cadence.h"
#include "Codec.h"
#include "Invariants.h"
#include "Normalize.h"

#include <algorithm>
#include <map>
#include <tuple>
#include <glog/logging.h>

using folly::StringPiece;

CadenceEngine::CadenceEngine(EntityStore &store, const EngineConfig &config,
                             const Clock &clock)
  : store_(store)
  , config_(config)
  , clock_(clock)
{
}

Date CadenceEngine::addBusinessDays(Date from, unsigned days) {
  boost::gregorian::date_duration one(1);
  while (days > 0) {
    from += one;
    int dow = from.day_of_week().as_number();
    if (dow != boost::date_time::Saturday && dow != boost::date_time::Sunday)
      --days;
  }
  return from;
}

Date CadenceEngine::calculateNextContact(uint32_t attemptCount,
                                         const folly::Optional<Date> &lastAttempt,
                                         const Date &today) const
{
  if (!lastAttempt)
    return addBusinessDays(today, config_.cadence.front().minDays);
  return addBusinessDays(*lastAttempt, config_.intervalFor(attemptCount).minDays);
}

Timestamp CadenceEngine::nextSystemFollowUp(const Prospect &p, const Date &today) const {
  return Timestamp(calculateNextContact(p.attemptCount, p.lastContactDate, today));
}

static bool isOpen(Population pop) noexcept {
  switch (pop) {
  case Population::DeadDnc:
  case Population::ClosedWon:
  case Population::Partnership:
  case Population::Lost:
    return false;
  case Population::Broken:
  case Population::Unengaged:
  case Population::Engaged:
  case Population::Parked:
    return true;
  }
  return false;
}

PipelineResult<Prospect>
CadenceEngine::setFollowUp(int64_t prospectId, const folly::Optional<Timestamp> &when,
                           StringPiece reason)
{
  auto txn = store_.begin();
  if (!txn)
    return folly::makeUnexpected(std::move(txn.error()));

  auto prospect = (*txn)->getProspect(prospectId);
  if (!prospect)
    return folly::makeUnexpected(invariants::notFound(prospectId));

  auto allowed = invariants::checkNotDnc(*prospect, "follow-up refused");
  if (!allowed)
    return folly::makeUnexpected(std::move(allowed.error()));

  if (!when || when->is_special())
    return folly::makeUnexpected(invariants::validationFailed(
        prospectId, "follow-up date required"));

  Timestamp now = clock_.now();
  prospect->followUpDate = *when;
  prospect->updatedAt = now;
  (*txn)->updateProspect(*prospect);

  Activity activity;
  activity.prospectId = prospectId;
  activity.type = ActivityType::Reminder;
  activity.followUpSet = *when;
  activity.notes = reason.empty()
    ? "Follow-up set for " + formatTimestamp(*when) : reason.str();
  activity.createdAt = now;
  (*txn)->createActivity(std::move(activity));
  (*txn)->commit();

  LOG(INFO) << "prospect " << prospectId << ": follow-up set for "
            << formatTimestamp(*when);
  return std::move(*prospect);
}

PipelineResult<Prospect>
CadenceEngine::recordAttempt(int64_t prospectId, const Attempt &attempt) {
  auto txn = store_.begin();
  if (!txn)
    return folly::makeUnexpected(std::move(txn.error()));

  auto prospect = (*txn)->getProspect(prospectId);
  if (!prospect)
    return folly::makeUnexpected(invariants::notFound(prospectId));

  auto allowed = invariants::checkNotDnc(*prospect, "attempt refused");
  if (!allowed)
    return folly::makeUnexpected(std::move(allowed.error()));

  Timestamp now = clock_.now();
  Date day = attempt.date ? *attempt.date : now.date();

  prospect->attemptCount += 1;
  prospect->lastContactDate = day;
  prospect->updatedAt = now;

  Activity activity;
  activity.prospectId = prospectId;
  activity.type = attempt.type;
  activity.outcome = attempt.outcome;
  activity.notes = attempt.notes;
  activity.createdAt = now;

  if (isSystemPaced(prospect->population)) {
    prospect->followUpDate = nextSystemFollowUp(*prospect, now.date());
    activity.followUpSet = prospect->followUpDate;
  }

  (*txn)->updateProspect(*prospect);
  (*txn)->createActivity(std::move(activity));
  (*txn)->commit();

  LOG(INFO) << "prospect " << prospectId << ": attempt #" << prospect->attemptCount
            << " (" << toString(attempt.type) << ")"
            << (prospect->followUpDate
                ? ", next " + formatTimestamp(*prospect->followUpDate) : "");
  return std::move(*prospect);
}

template<class Pred>
static PipelineResult<std::vector<Prospect>>
collect(EntityStore &store, Pred pred) {
  auto txn = store.begin();
  if (!txn)
    return folly::makeUnexpected(std::move(txn.error()));

  std::vector<Prospect> out;
  (*txn)->forEachProspect([&](const Prospect &p) {
    if (pred(p))
      out.push_back(p);
  });
  return out;
}

static bool byFollowUp(const Prospect &lhs, const Prospect &rhs) {
  return std::tie(*lhs.followUpDate, lhs.id) < std::tie(*rhs.followUpDate, rhs.id);
}

PipelineResult<std::vector<Prospect>> CadenceEngine::getOverdue(const Timestamp &asOf) {
  auto overdue = collect(store_, [&](const Prospect &p) {
    return isOpen(p.population) && p.followUpDate && *p.followUpDate < asOf;
  });
  if (overdue)
    std::sort(overdue->begin(), overdue->end(), byFollowUp);
  return overdue;
}

PipelineResult<std::vector<Prospect>> CadenceEngine::getDueOn(const Date &day) {
  auto due = collect(store_, [&](const Prospect &p) {
    return isOpen(p.population) && p.followUpDate && p.followUpDate->date() == day;
  });
  if (due)
    std::sort(due->begin(), due->end(), byFollowUp);
  return due;
}

PipelineResult<std::vector<Prospect>> CadenceEngine::getOrphanedEngaged() {
  auto orphans = collect(store_, [](const Prospect &p) {
    return p.population == Population::Engaged && !p.followUpDate;
  });
  if (orphans) {
    for (const Prospect &p : *orphans)
      LOG(ERROR) << "orphan engaged prospect " << p.id << " (" << p.fullName()
                 << ") has no follow-up date";
  }
  return orphans;
}

static int stagePriority(const folly::Optional<EngagementStage> &stage) {
  if (!stage)
    return 1;
  switch (*stage) {
  case EngagementStage::Closing:       return 4;
  case EngagementStage::PostDemo:      return 3;
  case EngagementStage::DemoScheduled: return 2;
  case EngagementStage::PreDemo:       return 1;
  }
  return 0;
}

PipelineResult<std::vector<Prospect>>
CadenceEngine::todaysQueue(const Date &today, Energy energy) {
  auto txn = store_.begin();
  if (!txn)
    return folly::makeUnexpected(std::move(txn.error()));

  struct Entry {
    int group;
    int rank;
    int zone;
    Prospect prospect;
  };
  std::vector<Entry> queue;
  std::map<int64_t, int> zones;

  auto zoneOf = [&](int64_t companyId) {
    auto it = zones.find(companyId);
    if (it != zones.end())
      return it->second;
    auto company = (*txn)->getCompany(companyId);
    int rank = timezoneRank(company ? StringPiece(company->timezone) : "central");
    zones.emplace(companyId, rank);
    return rank;
  };

  (*txn)->forEachProspect([&](const Prospect &p) {
    if (p.population == Population::Engaged) {
      if (p.followUpDate && p.followUpDate->date() <= today)
        queue.push_back(Entry{0, -stagePriority(p.engagementStage), zoneOf(p.companyId), p});
    } else if (p.population == Population::Unengaged) {
      if (!p.followUpDate || p.followUpDate->date() <= today)
        queue.push_back(Entry{1, -p.prospectScore, zoneOf(p.companyId), p});
    }
  });

  std::sort(queue.begin(), queue.end(), [](const Entry &lhs, const Entry &rhs) {
    return std::tie(lhs.group, lhs.rank, lhs.zone, lhs.prospect.id) <
      std::tie(rhs.group, rhs.rank, rhs.zone, rhs.prospect.id);
  });

  if (energy == Energy::Low) {
    auto lowEnergyGroup = [](const Prospect &p) {
      if (p.population != Population::Engaged)
        return 2;
      if (p.engagementStage == EngagementStage::Closing ||
          p.engagementStage == EngagementStage::PostDemo)
        return 0;
      return 1;
    };
    std::stable_sort(queue.begin(), queue.end(), [&](const Entry &lhs, const Entry &rhs) {
      return std::make_tuple(lowEnergyGroup(lhs.prospect), -lhs.prospect.prospectScore) <
        std::make_tuple(lowEnergyGroup(rhs.prospect), -rhs.prospect.prospectScore);
    });
  }

  std::vector<Prospect> out;
  out.reserve(queue.size());
  for (Entry &entry : queue)
    out.push_back(std::move(entry.prospect));
  return out;
}
