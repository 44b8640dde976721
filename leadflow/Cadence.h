#ifndef LEADFLOW_CADENCE_H
#define LEADFLOW_CADENCE_H

#include "Config.h"
#include "EntityStore.h"

#include <vector>

/** Operator energy level; Low reorders the queue toward likely closes. */
enum class Energy {
  Normal,
  Low,
};

/** An outreach attempt as reported by the caller. */
struct Attempt {
  ActivityType type = ActivityType::Call;
  folly::Optional<ActivityOutcome> outcome;
  std::string notes;
  /** Defaults to the clock's today. */
  folly::Optional<Date> date;
};

/**
 * Follow-up scheduling. Unengaged and Broken prospects are system-paced
 * from the interval table; Engaged prospects carry whatever date the
 * prospect asked for and the engine never rewrites it.
 */
class CadenceEngine {
 public:
  CadenceEngine(EntityStore &store, const EngineConfig &config,
                const Clock &clock = Clock::system());

  /**
   * Next system-paced contact day: lastAttempt + min_days business days,
   * or today + min_days of the first interval without a prior attempt.
   */
  Date calculateNextContact(uint32_t attemptCount,
                            const folly::Optional<Date> &lastAttempt,
                            const Date &today) const;

  /** Same, from the prospect's own counters, as a start-of-day timestamp. */
  Timestamp nextSystemFollowUp(const Prospect &prospect, const Date &today) const;

  /** Weekdays only. */
  static Date addBusinessDays(Date from, unsigned days);

  /** Prospect-paced follow-up. Writes one Reminder activity. */
  PipelineResult<Prospect> setFollowUp(int64_t prospectId,
                                       const folly::Optional<Timestamp> &when,
                                       folly::StringPiece reason);

  /**
   * Count an outreach attempt. System-paced prospects get their follow-up
   * recomputed; the new date is recorded on the activity.
   */
  PipelineResult<Prospect> recordAttempt(int64_t prospectId, const Attempt &attempt);

  /** follow_up_date < asOf on open prospects, most overdue first. */
  PipelineResult<std::vector<Prospect>> getOverdue(const Timestamp &asOf);

  /** Open prospects whose follow-up falls on the given day. */
  PipelineResult<std::vector<Prospect>> getDueOn(const Date &day);

  /** Engaged prospects without a follow-up. Each one is a defect. */
  PipelineResult<std::vector<Prospect>> getOrphanedEngaged();

  /**
   * Work queue: due Engaged prospects by stage then timezone, followed by
   * due or unscheduled Unengaged prospects by score then timezone.
   */
  PipelineResult<std::vector<Prospect>> todaysQueue(const Date &today, Energy energy);

 private:
  EntityStore &store_;
  const EngineConfig &config_;
  const Clock &clock_;
};

#endif // LEADFLOW_CADENCE_H
