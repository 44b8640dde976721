#ifndef LEADFLOW_STAGES_H
#define LEADFLOW_STAGES_H

#include "EntityStore.h"

/**
 * Engagement stages advance one step at a time while a prospect is
 * Engaged: PreDemo, DemoScheduled, PostDemo, Closing. Nothing moves back.
 */
class StageMachine {
 public:
  explicit StageMachine(EntityStore &store, const Clock &clock = Clock::system());

  static bool canTransitionStage(EngagementStage from, EngagementStage to) noexcept;
  /** The single next stage, none at Closing. */
  static folly::Optional<EngagementStage> nextStage(EngagementStage from) noexcept;

  PipelineResult<Prospect> transitionStage(int64_t prospectId, EngagementStage to,
                                           folly::StringPiece reason);

 private:
  EntityStore &store_;
  const Clock &clock_;
};

#endif // LEADFLOW_STAGES_H
