#include "PipelineFixture.h"

#include <folly/portability/GMock.h>

using namespace testing;

class StagesTest : public PipelineFixture {};

TEST(StageTable, ForwardOneStepOnly) {
  const EngagementStage all[] = {
    EngagementStage::PreDemo, EngagementStage::DemoScheduled,
    EngagementStage::PostDemo, EngagementStage::Closing,
  };
  for (size_t i = 0; i < kNumStages; ++i) {
    for (size_t j = 0; j < kNumStages; ++j) {
      EXPECT_EQ(StageMachine::canTransitionStage(all[i], all[j]), j == i + 1)
        << toString(all[i]) << " -> " << toString(all[j]);
    }
  }
  EXPECT_EQ(StageMachine::nextStage(EngagementStage::PostDemo), EngagementStage::Closing);
  EXPECT_FALSE(StageMachine::nextStage(EngagementStage::Closing).hasValue());
}

TEST_F(StagesTest, WalkToClosing) {
  int64_t id = addProspect("Jane", "Doe", Population::Engaged);

  ASSERT_TRUE(stages.transitionStage(id, EngagementStage::DemoScheduled, "demo booked")
              .hasValue());
  ASSERT_TRUE(stages.transitionStage(id, EngagementStage::PostDemo, "demo done").hasValue());
  auto closing = stages.transitionStage(id, EngagementStage::Closing, "");
  ASSERT_TRUE(closing.hasValue());
  EXPECT_EQ(closing->engagementStage, EngagementStage::Closing);

  Prospect p = get(id);
  EXPECT_EQ(p.population, Population::Engaged);
  EXPECT_EQ(p.engagementStage, EngagementStage::Closing);
  EXPECT_EQ(p.followUpDate, at("2024-03-20T09:00:00"));

  auto log = activities(id);
  ASSERT_EQ(log.size(), 3);
  EXPECT_EQ(log[0].stageBefore, EngagementStage::PreDemo);
  EXPECT_EQ(log[0].stageAfter, EngagementStage::DemoScheduled);
  EXPECT_EQ(log[0].notes, "demo booked");
  EXPECT_EQ(log[2].populationBefore, Population::Engaged);
  EXPECT_EQ(log[2].populationAfter, Population::Engaged);
}

TEST_F(StagesTest, NoSkippingOrGoingBack) {
  int64_t id = addProspect("Jane", "Doe", Population::Engaged);

  auto skip = stages.transitionStage(id, EngagementStage::PostDemo, "");
  ASSERT_FALSE(skip.hasValue());
  EXPECT_EQ(skip.error().code(), PIPE_INVALID_TRANSITION);
  EXPECT_THAT(skip.error().message(), HasSubstr("from stage pre_demo to post_demo"));

  auto same = stages.transitionStage(id, EngagementStage::PreDemo, "");
  ASSERT_FALSE(same.hasValue());
  EXPECT_EQ(same.error().code(), PIPE_INVALID_TRANSITION);

  EXPECT_EQ(get(id).engagementStage, EngagementStage::PreDemo);
  EXPECT_TRUE(activities(id).empty());
}

TEST_F(StagesTest, OnlyWhileEngaged) {
  int64_t id = addProspect("Jane", "Doe", Population::Unengaged);
  auto moved = stages.transitionStage(id, EngagementStage::DemoScheduled, "");
  ASSERT_FALSE(moved.hasValue());
  EXPECT_EQ(moved.error().code(), PIPE_INVALID_TRANSITION);
  EXPECT_FALSE(get(id).engagementStage.hasValue());
}

TEST_F(StagesTest, DncAndMissing) {
  int64_t id = addProspect("Do", "Not", Population::DeadDnc);
  auto moved = stages.transitionStage(id, EngagementStage::DemoScheduled, "");
  ASSERT_FALSE(moved.hasValue());
  EXPECT_EQ(moved.error().code(), PIPE_DNC_VIOLATION);

  auto missing = stages.transitionStage(12345, EngagementStage::DemoScheduled, "");
  ASSERT_FALSE(missing.hasValue());
  EXPECT_EQ(missing.error().code(), PIPE_NOT_FOUND);
}

TEST_F(StagesTest, StageClearedWhenLeavingEngaged) {
  int64_t id = addProspect("Jane", "Doe", Population::Engaged);
  ASSERT_TRUE(stages.transitionStage(id, EngagementStage::DemoScheduled, "").hasValue());

  TransitionOptions opts;
  opts.parkedMonth = ParkedMonth{2024, 10};
  ASSERT_TRUE(populations.transition(id, Population::Parked, opts).hasValue());
  EXPECT_FALSE(get(id).engagementStage.hasValue());

  auto log = activities(id);
  ASSERT_EQ(log.size(), 2);
  EXPECT_EQ(log[1].stageBefore, EngagementStage::DemoScheduled);
  EXPECT_FALSE(log[1].stageAfter.hasValue());
}
