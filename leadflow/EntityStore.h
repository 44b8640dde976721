#ifndef LEADFLOW_ENTITY_STORE_H
#define LEADFLOW_ENTITY_STORE_H

#include "Pipeline.h"
#include "PipelineError.h"

#include <functional>
#include <memory>
#include <vector>

/**
 * Keyed storage for the pipeline entities. Every read and write goes
 * through a Transaction; engines open one per operation so that the
 * DNC check and the write it guards see the same state.
 */
class EntityStore {
 public:
  class Transaction {
   public:
    /** Rolls back unless commit() was called. */
    virtual ~Transaction() = default;

    virtual folly::Optional<Prospect> getProspect(int64_t id) = 0;
    virtual folly::Optional<Company> getCompany(int64_t id) = 0;
    virtual folly::Optional<Company> findCompanyByNormalizedName(folly::StringPiece name) = 0;
    /** Ids of every prospect owning a contact method with this normalized value. */
    virtual std::vector<int64_t> findProspectsByContact(ContactMethodType type,
                                                        folly::StringPiece value) = 0;
    virtual std::vector<Prospect> getProspectsAtCompany(int64_t companyId) = 0;
    virtual std::vector<ContactMethod> getContactMethods(int64_t prospectId) = 0;
    /** Visit all prospects in id order. */
    virtual void forEachProspect(const std::function<void(const Prospect&)> &fn) = 0;
    /** Activities of a prospect, oldest first. */
    virtual std::vector<Activity> getActivities(int64_t prospectId) = 0;
    virtual std::vector<ImportSource> getImportSources() = 0;

    /* Writers assign and return the new id; the id field passed in is ignored. */
    virtual int64_t createCompany(Company company) = 0;
    virtual int64_t createProspect(Prospect prospect) = 0;
    virtual void updateProspect(const Prospect &prospect) = 0;
    virtual int64_t createContactMethod(ContactMethod method) = 0;
    virtual int64_t createActivity(Activity activity) = 0;
    virtual int64_t createImportSource(ImportSource source) = 0;

    virtual void commit() = 0;
  };

  virtual ~EntityStore() = default;

  /** Fails with retryable PIPE_STORAGE_BUSY when the lock wait times out. */
  virtual PipelineResult<std::unique_ptr<Transaction>> begin() = 0;
};

#endif // LEADFLOW_ENTITY_STORE_H
