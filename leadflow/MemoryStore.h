#ifndef LEADFLOW_MEMORY_STORE_H
#define LEADFLOW_MEMORY_STORE_H

#include "EntityStore.h"

#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <folly/Unit.h>
#include <folly/dynamic.h>

/**
 * Whole-store lock with bounded wait. A transaction owns the lock for its
 * lifetime, applies writes in place and undoes them if not committed.
 */
class MemoryStore : public EntityStore {
 public:
  explicit MemoryStore(std::chrono::milliseconds lockTimeout);
  ~MemoryStore() override;

  PipelineResult<std::unique_ptr<Transaction>> begin() override;

  /** Snapshot of all tables. Busy if the running transaction outlasts the lock wait. */
  PipelineResult<folly::dynamic> toJson() const;
  /** Replace all tables with a snapshot. */
  PipelineResult<folly::Unit> loadJson(const folly::dynamic &json);

 private:
  class Txn;

  using ContactKey = std::pair<ContactMethodType, std::string>;

  struct Tables {
    std::map<int64_t, Company> companies;
    std::map<int64_t, Prospect> prospects;
    std::map<int64_t, ContactMethod> contacts;
    std::map<int64_t, Activity> activities;
    std::map<int64_t, ImportSource> importSources;

    std::map<std::string, int64_t> companyByName;
    std::map<ContactKey, std::set<int64_t>> contactIndex;
    std::map<int64_t, std::vector<int64_t>> activitiesByProspect;

    int64_t nextCompanyId = 1;
    int64_t nextProspectId = 1;
    int64_t nextContactId = 1;
    int64_t nextActivityId = 1;
    int64_t nextImportSourceId = 1;

    void indexContact(const ContactMethod &method);
    void unindexContact(const ContactMethod &method);
  };

  mutable std::timed_mutex mutex_;
  const std::chrono::milliseconds lockTimeout_;
  Tables tables_;
};

#endif // LEADFLOW_MEMORY_STORE_H
