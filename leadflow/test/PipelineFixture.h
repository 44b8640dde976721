#ifndef LEADFLOW_TEST_PIPELINE_FIXTURE_H
#define LEADFLOW_TEST_PIPELINE_FIXTURE_H

#include <leadflow/Cadence.h>
#include <leadflow/Codec.h>
#include <leadflow/Config.h>
#include <leadflow/Intake.h>
#include <leadflow/MemoryStore.h>
#include <leadflow/Normalize.h>
#include <leadflow/Populations.h>
#include <leadflow/Stages.h>

#include <folly/portability/GTest.h>

class FixedClock : public Clock {
 public:
  explicit FixedClock(Timestamp now) : now_(now) {}
  Timestamp now() const override { return now_; }
  void set(Timestamp now) { now_ = now; }

 private:
  Timestamp now_;
};

inline Timestamp at(const char *iso) {
  return parseTimestamp(iso).value();
}

inline Date day(const char *iso) {
  return parseDate(iso).value();
}

/** Engines over an empty store, with the clock at Wed 2024-03-13 10:00. */
class PipelineFixture : public testing::Test {
 protected:
  int64_t addCompany(const std::string &name, const std::string &state = "TX") {
    auto txn = std::move(store.begin().value());
    Company company;
    company.name = name;
    company.nameNormalized = CompanyName::normalize(name);
    company.state = state;
    company.timezone = timezoneFromState(state).str();
    int64_t id = txn->createCompany(company);
    txn->commit();
    return id;
  }

  /** Seed a prospect in a structurally valid state for its population. */
  int64_t addProspect(const std::string &first, const std::string &last,
                      Population pop, const std::string &email = "",
                      const std::string &phone = "", int64_t companyId = 0) {
    if (companyId == 0)
      companyId = addCompany("Seed Co");

    auto txn = std::move(store.begin().value());
    Prospect p;
    p.companyId = companyId;
    p.firstName = first;
    p.lastName = last;
    p.population = pop;
    p.createdAt = p.updatedAt = clock.now();
    switch (pop) {
    case Population::Engaged:
      p.engagementStage = EngagementStage::PreDemo;
      p.followUpDate = at("2024-03-20T09:00:00");
      break;
    case Population::Parked:
      p.parkedMonth = ParkedMonth{2024, 6};
      break;
    case Population::DeadDnc:
      p.deadReason = "asked to be removed";
      p.deadDate = day("2024-01-02");
      break;
    default:
      break;
    }
    int64_t id = txn->createProspect(p);

    if (!email.empty()) {
      ContactMethod m;
      m.prospectId = id;
      m.type = ContactMethodType::Email;
      m.value = EmailAddress::normalize(email);
      m.isPrimary = true;
      txn->createContactMethod(m);
    }
    if (!phone.empty()) {
      ContactMethod m;
      m.prospectId = id;
      m.type = ContactMethodType::Phone;
      m.value = PhoneNumber::normalize(phone);
      txn->createContactMethod(m);
    }
    txn->commit();
    return id;
  }

  Prospect get(int64_t id) {
    auto txn = std::move(store.begin().value());
    return txn->getProspect(id).value();
  }

  void put(const Prospect &p) {
    auto txn = std::move(store.begin().value());
    txn->updateProspect(p);
    txn->commit();
  }

  std::vector<Activity> activities(int64_t id) {
    auto txn = std::move(store.begin().value());
    return txn->getActivities(id);
  }

  std::vector<ContactMethod> contacts(int64_t id) {
    auto txn = std::move(store.begin().value());
    return txn->getContactMethods(id);
  }

  size_t countProspects() {
    auto txn = std::move(store.begin().value());
    size_t n = 0;
    txn->forEachProspect([&](const Prospect &) { ++n; });
    return n;
  }

  FixedClock clock{at("2024-03-13T10:00:00")};
  EngineConfig config = EngineConfig::defaults();
  MemoryStore store{std::chrono::milliseconds(50)};
  CadenceEngine cadence{store, config, clock};
  PopulationMachine populations{store, cadence, clock};
  StageMachine stages{store, clock};
  IntakeFunnel intake{store, populations, config, clock};
};

#endif // LEADFLOW_TEST_PIPELINE_FIXTURE_H
