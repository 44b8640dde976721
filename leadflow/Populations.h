#ifndef LEADFLOW_POPULATIONS_H
#define LEADFLOW_POPULATIONS_H

#include "Cadence.h"
#include "EntityStore.h"

#include <vector>

/** Caller-supplied inputs of a population change. */
struct TransitionOptions {
  /** Entering Engaged: starting stage, PreDemo when absent. */
  folly::Optional<EngagementStage> stage;
  /** Required when entering Engaged; overrides cadence for Unengaged. */
  folly::Optional<Timestamp> followUp;
  /** Required when entering Parked. */
  folly::Optional<ParkedMonth> parkedMonth;
  folly::Optional<LostReason> lostReason;
  /** Activity notes. Also the dead reason when entering DeadDnc. */
  std::string reason;
  std::string closeNotes;
  std::string createdBy = "user";
};

/**
 * Population state machine. The only writer of population fields and of
 * StatusChange activities.
 */
class PopulationMachine {
 public:
  PopulationMachine(EntityStore &store, const CadenceEngine &cadence,
                    const Clock &clock = Clock::system());

  /** Pure table lookup. Self-loops are not edges. */
  static bool canTransition(Population from, Population to) noexcept;
  /** Reachable targets in table order; empty for terminal populations. */
  static std::vector<Population> availableTransitions(Population from);

  /**
   * Move a prospect to target, applying the target's side effects and
   * writing one StatusChange activity in a single transaction.
   */
  PipelineResult<Prospect> transition(int64_t prospectId, Population target,
                                      const TransitionOptions &opts = {});

  /**
   * Wake every Parked prospect whose month has come. Fails only when the
   * store cannot be read; per-prospect failures land in the batch.
   */
  PipelineResult<BatchResult<Prospect, int64_t>> reactivateParked(const Date &today);

  /** transition() within a transaction the caller owns and commits. */
  PipelineResult<Prospect> apply(EntityStore::Transaction &txn, const Prospect &prospect,
                                 Population target, const TransitionOptions &opts);

  /**
   * Create a new prospect in its initial population (Unengaged or Broken)
   * and record an Import activity with the given provenance.
   */
  PipelineResult<Prospect> admit(EntityStore::Transaction &txn, Prospect prospect,
                                 Population initial, folly::StringPiece provenance);

 private:
  EntityStore &store_;
  const CadenceEngine &cadence_;
  const Clock &clock_;
};

#endif // LEADFLOW_POPULATIONS_H
