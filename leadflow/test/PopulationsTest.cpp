#include "PipelineFixture.h"

#include <leadflow/Invariants.h>

#include <folly/portability/GMock.h>
#include <folly/Conv.h>

#include <set>

using namespace testing;

class PopulationsTest : public PipelineFixture {
 protected:
  static TransitionOptions engageOn(const char *iso) {
    TransitionOptions opts;
    opts.followUp = at(iso);
    return opts;
  }
};

static const Population kAllPopulations[] = {
  Population::Broken, Population::DeadDnc, Population::Unengaged, Population::Engaged,
  Population::ClosedWon, Population::Lost, Population::Parked, Population::Partnership,
};

TEST(PopulationTable, Edges) {
  std::set<std::pair<Population, Population>> expected = {
    {Population::Broken, Population::Unengaged},
    {Population::Broken, Population::DeadDnc},
    {Population::Unengaged, Population::Engaged},
    {Population::Unengaged, Population::DeadDnc},
    {Population::Unengaged, Population::Lost},
    {Population::Unengaged, Population::Parked},
    {Population::Unengaged, Population::Partnership},
    {Population::Engaged, Population::ClosedWon},
    {Population::Engaged, Population::Lost},
    {Population::Engaged, Population::Parked},
    {Population::Engaged, Population::DeadDnc},
    {Population::Parked, Population::Unengaged},
    {Population::Parked, Population::DeadDnc},
    {Population::Lost, Population::Unengaged},
    {Population::Lost, Population::DeadDnc},
  };

  for (Population from : kAllPopulations) {
    for (Population to : kAllPopulations) {
      EXPECT_EQ(PopulationMachine::canTransition(from, to),
                expected.count(std::make_pair(from, to)) == 1)
        << toString(from) << " -> " << toString(to);
    }
  }
}

TEST(PopulationTable, TerminalsHaveNoExits) {
  for (Population pop : kAllPopulations) {
    EXPECT_EQ(PopulationMachine::availableTransitions(pop).empty(), isTerminal(pop))
      << toString(pop);
  }
  EXPECT_THAT(PopulationMachine::availableTransitions(Population::Broken),
              ElementsAre(Population::Unengaged, Population::DeadDnc));
}

TEST_F(PopulationsTest, UnengagedToEngaged) {
  int64_t id = addProspect("Jane", "Doe", Population::Unengaged, "jane@acme.com");

  TransitionOptions opts = engageOn("2024-03-20T14:00:00");
  opts.reason = "Replied to email";
  auto moved = populations.transition(id, Population::Engaged, opts);
  ASSERT_TRUE(moved.hasValue()) << moved.error().message();

  Prospect p = get(id);
  EXPECT_EQ(p.population, Population::Engaged);
  EXPECT_EQ(p.engagementStage, EngagementStage::PreDemo);
  EXPECT_EQ(p.followUpDate, at("2024-03-20T14:00:00"));
  EXPECT_EQ(p.updatedAt, at("2024-03-13T10:00:00"));

  auto log = activities(id);
  ASSERT_EQ(log.size(), 1);
  EXPECT_EQ(log[0].type, ActivityType::StatusChange);
  EXPECT_EQ(log[0].populationBefore, Population::Unengaged);
  EXPECT_EQ(log[0].populationAfter, Population::Engaged);
  EXPECT_FALSE(log[0].stageBefore.hasValue());
  EXPECT_EQ(log[0].stageAfter, EngagementStage::PreDemo);
  EXPECT_EQ(log[0].followUpSet, at("2024-03-20T14:00:00"));
  EXPECT_EQ(log[0].notes, "Replied to email");
  EXPECT_EQ(log[0].createdBy, "user");
}

TEST_F(PopulationsTest, EngagedNeedsFollowUp) {
  for (Population from : kAllPopulations) {
    if (!PopulationMachine::canTransition(from, Population::Engaged))
      continue;
    int64_t id = addProspect("No", "Date", from);
    auto moved = populations.transition(id, Population::Engaged);
    ASSERT_FALSE(moved.hasValue());
    EXPECT_EQ(moved.error().code(), PIPE_VALIDATION_FAILED);
    EXPECT_THAT(moved.error().message(), HasSubstr("orphan engaged"));
    EXPECT_EQ(get(id).population, from);
    EXPECT_TRUE(activities(id).empty());
  }
}

TEST_F(PopulationsTest, EngagedAtGivenStage) {
  int64_t id = addProspect("Jane", "Doe", Population::Unengaged);
  TransitionOptions opts = engageOn("2024-03-15T09:00:00");
  opts.stage = EngagementStage::DemoScheduled;
  ASSERT_TRUE(populations.transition(id, Population::Engaged, opts).hasValue());
  EXPECT_EQ(get(id).engagementStage, EngagementStage::DemoScheduled);
}

TEST_F(PopulationsTest, InvalidTransition) {
  int64_t id = addProspect("Bro", "Ken", Population::Broken);
  auto moved = populations.transition(id, Population::Engaged,
                                      engageOn("2024-03-15T09:00:00"));
  ASSERT_FALSE(moved.hasValue());
  EXPECT_EQ(moved.error().code(), PIPE_INVALID_TRANSITION);
  EXPECT_THAT(moved.error().message(), HasSubstr("from broken to engaged"));

  auto self = populations.transition(id, Population::Broken);
  ASSERT_FALSE(self.hasValue());
  EXPECT_EQ(self.error().code(), PIPE_INVALID_TRANSITION);
  EXPECT_TRUE(activities(id).empty());
}

TEST_F(PopulationsTest, EveryEdgeOutsideTableRejected) {
  for (Population from : kAllPopulations) {
    if (from == Population::DeadDnc)
      continue;
    for (Population to : kAllPopulations) {
      if (PopulationMachine::canTransition(from, to))
        continue;
      int64_t id = addProspect("Off", "Table", from);

      TransitionOptions opts = engageOn("2024-03-15T09:00:00");
      opts.parkedMonth = ParkedMonth{2024, 9};
      auto moved = populations.transition(id, to, opts);
      ASSERT_FALSE(moved.hasValue()) << toString(from) << " -> " << toString(to);
      EXPECT_EQ(moved.error().code(), PIPE_INVALID_TRANSITION)
        << toString(from) << " -> " << toString(to);
      EXPECT_THAT(moved.error().message(),
                  HasSubstr(folly::to<std::string>("from ", toString(from),
                                                   " to ", toString(to))));
      EXPECT_EQ(get(id).population, from);
      EXPECT_TRUE(activities(id).empty());
    }
  }
}

TEST_F(PopulationsTest, NotFound) {
  auto moved = populations.transition(999, Population::Lost);
  ASSERT_FALSE(moved.hasValue());
  EXPECT_EQ(moved.error().code(), PIPE_NOT_FOUND);
}

TEST_F(PopulationsTest, DncIsPermanent) {
  int64_t id = addProspect("Do", "Not", Population::DeadDnc, "dnc@x.com");
  Prospect before = get(id);

  for (Population target : kAllPopulations) {
    TransitionOptions opts = engageOn("2024-03-15T09:00:00");
    opts.parkedMonth = ParkedMonth{2024, 9};
    auto moved = populations.transition(id, target, opts);
    ASSERT_FALSE(moved.hasValue()) << toString(target);
    EXPECT_EQ(moved.error().code(), PIPE_DNC_VIOLATION);
  }

  Prospect after = get(id);
  EXPECT_EQ(after.population, Population::DeadDnc);
  EXPECT_EQ(after.updatedAt, before.updatedAt);
  EXPECT_TRUE(activities(id).empty());
}

TEST_F(PopulationsTest, EnterDnc) {
  int64_t id = addProspect("Jane", "Doe", Population::Engaged);
  TransitionOptions opts;
  opts.reason = "Asked to stop";
  ASSERT_TRUE(populations.transition(id, Population::DeadDnc, opts).hasValue());

  Prospect p = get(id);
  EXPECT_EQ(p.population, Population::DeadDnc);
  EXPECT_EQ(p.deadReason, "Asked to stop");
  EXPECT_EQ(p.deadDate, day("2024-03-13"));
  EXPECT_FALSE(p.followUpDate.hasValue());
  EXPECT_FALSE(p.engagementStage.hasValue());
  EXPECT_FALSE(p.parkedMonth.hasValue());

  auto log = activities(id);
  ASSERT_EQ(log.size(), 1);
  EXPECT_EQ(log[0].stageBefore, EngagementStage::PreDemo);
  EXPECT_FALSE(log[0].stageAfter.hasValue());
}

TEST_F(PopulationsTest, Park) {
  int64_t id = addProspect("Jane", "Doe", Population::Engaged);

  auto missing = populations.transition(id, Population::Parked);
  ASSERT_FALSE(missing.hasValue());
  EXPECT_EQ(missing.error().code(), PIPE_VALIDATION_FAILED);
  EXPECT_THAT(missing.error().message(), HasSubstr("parked without month"));

  TransitionOptions opts;
  opts.parkedMonth = ParkedMonth{2024, 9};
  ASSERT_TRUE(populations.transition(id, Population::Parked, opts).hasValue());

  Prospect p = get(id);
  EXPECT_EQ(p.population, Population::Parked);
  EXPECT_EQ(p.parkedMonth, (ParkedMonth{2024, 9}));
  EXPECT_FALSE(p.followUpDate.hasValue());
  EXPECT_FALSE(p.engagementStage.hasValue());
}

TEST_F(PopulationsTest, LoseAndWin) {
  int64_t lost = addProspect("Lo", "Ser", Population::Engaged);
  TransitionOptions opts;
  opts.lostReason = LostReason::Budget;
  ASSERT_TRUE(populations.transition(lost, Population::Lost, opts).hasValue());
  Prospect p = get(lost);
  EXPECT_EQ(p.lostReason, LostReason::Budget);
  EXPECT_EQ(p.lostDate, day("2024-03-13"));
  EXPECT_FALSE(p.followUpDate.hasValue());

  int64_t won = addProspect("Win", "Ner", Population::Engaged);
  TransitionOptions close;
  close.reason = "signed";
  ASSERT_TRUE(populations.transition(won, Population::ClosedWon, close).hasValue());
  Prospect w = get(won);
  EXPECT_EQ(w.closeDate, day("2024-03-13"));
  EXPECT_EQ(w.closeNotes, "signed");
  EXPECT_FALSE(w.engagementStage.hasValue());
  EXPECT_TRUE(PopulationMachine::availableTransitions(w.population).empty());
}

TEST_F(PopulationsTest, BackToUnengagedGetsCadenceDate) {
  int64_t id = addProspect("Jane", "Doe", Population::Parked);
  ASSERT_TRUE(populations.transition(id, Population::Unengaged).hasValue());

  Prospect p = get(id);
  EXPECT_EQ(p.population, Population::Unengaged);
  EXPECT_FALSE(p.parkedMonth.hasValue());
  // Wed + 3 business days
  EXPECT_EQ(p.followUpDate, at("2024-03-18T00:00:00"));
  EXPECT_EQ(activities(id).at(0).followUpSet, at("2024-03-18T00:00:00"));
}

TEST_F(PopulationsTest, ReactivateParked) {
  int64_t due = addProspect("Due", "Now", Population::Parked);
  int64_t later = addProspect("Not", "Yet", Population::Parked);
  Prospect p = get(due);
  p.parkedMonth = ParkedMonth{2024, 3};
  put(p);
  Prospect q = get(later);
  q.parkedMonth = ParkedMonth{2024, 4};
  put(q);

  auto batch = populations.reactivateParked(day("2024-03-13"));
  ASSERT_TRUE(batch.hasValue());
  ASSERT_EQ(batch->succeeded.size(), 1);
  EXPECT_TRUE(batch->failed.empty());
  EXPECT_EQ(batch->succeeded[0].id, due);

  EXPECT_EQ(get(due).population, Population::Unengaged);
  EXPECT_EQ(get(later).population, Population::Parked);

  auto log = activities(due);
  ASSERT_EQ(log.size(), 1);
  EXPECT_EQ(log[0].createdBy, "system");
  EXPECT_EQ(log[0].notes, "parked month 2024-03 reached");

  // a second run finds nothing
  auto again = populations.reactivateParked(day("2024-03-31"));
  ASSERT_TRUE(again.hasValue());
  EXPECT_TRUE(again->succeeded.empty());
}

TEST_F(PopulationsTest, AdmitOnlyAsUnengagedOrBroken) {
  auto txn = std::move(store.begin().value());
  Prospect p;
  p.firstName = "New";
  auto wrong = populations.admit(*txn, p, Population::Engaged, "test");
  ASSERT_FALSE(wrong.hasValue());
  EXPECT_EQ(wrong.error().code(), PIPE_VALIDATION_FAILED);

  auto broken = populations.admit(*txn, p, Population::Broken, "test");
  ASSERT_TRUE(broken.hasValue());
  EXPECT_EQ(broken->followUpDate, at("2024-03-18T00:00:00"));
  EXPECT_EQ(txn->getActivities(broken->id).at(0).followUpSet, at("2024-03-18T00:00:00"));

  auto fresh = populations.admit(*txn, p, Population::Unengaged, "test");
  ASSERT_TRUE(fresh.hasValue());
  EXPECT_EQ(fresh->followUpDate, at("2024-03-18T00:00:00"));
  ASSERT_EQ(txn->getActivities(fresh->id).size(), 1);
  EXPECT_EQ(txn->getActivities(fresh->id)[0].type, ActivityType::Import);
}

TEST_F(PopulationsTest, AuditFindsCorruptRows) {
  int64_t ok = addProspect("Ok", "Row", Population::Engaged);
  int64_t orphan = addProspect("Or", "Phan", Population::Engaged);
  Prospect p = get(orphan);
  p.followUpDate.clear();
  put(p);

  auto txn = std::move(store.begin().value());
  auto violations = invariants::audit(*txn);
  ASSERT_EQ(violations.size(), 1);
  EXPECT_EQ(violations[0].prospectId, orphan);
  EXPECT_NE(violations[0].prospectId, ok);
  EXPECT_THAT(violations[0].error.message(), HasSubstr("orphan engaged"));
}

TEST(Invariants, Structure) {
  Prospect p;
  p.id = 5;
  p.population = Population::Unengaged;
  EXPECT_TRUE(invariants::checkStructure(p).hasValue());

  p.engagementStage = EngagementStage::Closing;
  EXPECT_FALSE(invariants::checkStructure(p).hasValue());

  p.population = Population::Engaged;
  EXPECT_FALSE(invariants::checkStructure(p).hasValue());
  p.followUpDate = at("2024-03-20T09:00:00");
  EXPECT_TRUE(invariants::checkStructure(p).hasValue());

  p.population = Population::Parked;
  p.engagementStage.clear();
  EXPECT_FALSE(invariants::checkStructure(p).hasValue());

  p.population = Population::DeadDnc;
  EXPECT_FALSE(invariants::checkStructure(p).hasValue());
  p.followUpDate.clear();
  EXPECT_TRUE(invariants::checkStructure(p).hasValue());
}
