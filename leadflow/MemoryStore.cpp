#include "MemoryStore.h"
#include "Codec.h"

#include <algorithm>
#include <folly/dynamic.h>
#include <folly/Conv.h>
#include <glog/logging.h>

using folly::dynamic;
using folly::StringPiece;

static constexpr int64_t kSnapshotVersion = 1;

void MemoryStore::Tables::indexContact(const ContactMethod &method) {
  contactIndex[ContactKey(method.type, method.value)].insert(method.id);
}

void MemoryStore::Tables::unindexContact(const ContactMethod &method) {
  auto it = contactIndex.find(ContactKey(method.type, method.value));
  if (it == contactIndex.end())
    return;
  it->second.erase(method.id);
  if (it->second.empty())
    contactIndex.erase(it);
}

class MemoryStore::Txn : public EntityStore::Transaction {
 public:
  Txn(std::unique_lock<std::timed_mutex> lock, Tables &tables)
    : lock_(std::move(lock))
    , t_(tables)
    , savedIds_{tables.nextCompanyId, tables.nextProspectId,
                tables.nextContactId, tables.nextActivityId,
                tables.nextImportSourceId}
  {
  }

  ~Txn() override {
    if (!committed_)
      rollback();
  }

  folly::Optional<Prospect> getProspect(int64_t id) override {
    auto it = t_.prospects.find(id);
    if (it == t_.prospects.end())
      return folly::none;
    return it->second;
  }

  folly::Optional<Company> getCompany(int64_t id) override {
    auto it = t_.companies.find(id);
    if (it == t_.companies.end())
      return folly::none;
    return it->second;
  }

  folly::Optional<Company> findCompanyByNormalizedName(StringPiece name) override {
    auto it = t_.companyByName.find(name.str());
    if (it == t_.companyByName.end())
      return folly::none;
    return getCompany(it->second);
  }

  std::vector<int64_t> findProspectsByContact(ContactMethodType type,
                                              StringPiece value) override {
    std::set<int64_t> owners;
    auto it = t_.contactIndex.find(ContactKey(type, value.str()));
    if (it != t_.contactIndex.end()) {
      for (int64_t methodId : it->second)
        owners.insert(t_.contacts.at(methodId).prospectId);
    }
    return std::vector<int64_t>(owners.begin(), owners.end());
  }

  std::vector<Prospect> getProspectsAtCompany(int64_t companyId) override {
    std::vector<Prospect> out;
    for (const auto &entry : t_.prospects) {
      if (entry.second.companyId == companyId)
        out.push_back(entry.second);
    }
    return out;
  }

  std::vector<ContactMethod> getContactMethods(int64_t prospectId) override {
    std::vector<ContactMethod> out;
    for (const auto &entry : t_.contacts) {
      if (entry.second.prospectId == prospectId)
        out.push_back(entry.second);
    }
    return out;
  }

  void forEachProspect(const std::function<void(const Prospect&)> &fn) override {
    for (const auto &entry : t_.prospects)
      fn(entry.second);
  }

  std::vector<Activity> getActivities(int64_t prospectId) override {
    std::vector<Activity> out;
    auto it = t_.activitiesByProspect.find(prospectId);
    if (it == t_.activitiesByProspect.end())
      return out;
    for (int64_t id : it->second)
      out.push_back(t_.activities.at(id));
    return out;
  }

  std::vector<ImportSource> getImportSources() override {
    std::vector<ImportSource> out;
    for (const auto &entry : t_.importSources)
      out.push_back(entry.second);
    return out;
  }

  int64_t createCompany(Company company) override {
    checkOpen();
    company.id = t_.nextCompanyId++;
    int64_t id = company.id;
    std::string key = company.nameNormalized;
    t_.companies.emplace(id, std::move(company));
    bool indexed = t_.companyByName.emplace(key, id).second;
    undo_.push_back([this, id, key, indexed] {
      if (indexed)
        t_.companyByName.erase(key);
      t_.companies.erase(id);
    });
    return id;
  }

  int64_t createProspect(Prospect prospect) override {
    checkOpen();
    prospect.id = t_.nextProspectId++;
    int64_t id = prospect.id;
    t_.prospects.emplace(id, std::move(prospect));
    undo_.push_back([this, id] { t_.prospects.erase(id); });
    return id;
  }

  void updateProspect(const Prospect &prospect) override {
    checkOpen();
    auto it = t_.prospects.find(prospect.id);
    CHECK(it != t_.prospects.end()) << "update of unknown prospect " << prospect.id;
    Prospect before = it->second;
    it->second = prospect;
    undo_.push_back([this, before] { t_.prospects[before.id] = before; });
  }

  int64_t createContactMethod(ContactMethod method) override {
    checkOpen();
    method.id = t_.nextContactId++;
    int64_t id = method.id;
    t_.indexContact(method);
    t_.contacts.emplace(id, std::move(method));
    undo_.push_back([this, id] {
      t_.unindexContact(t_.contacts.at(id));
      t_.contacts.erase(id);
    });
    return id;
  }

  int64_t createActivity(Activity activity) override {
    checkOpen();
    activity.id = t_.nextActivityId++;
    int64_t id = activity.id;
    int64_t prospectId = activity.prospectId;
    t_.activities.emplace(id, std::move(activity));
    t_.activitiesByProspect[prospectId].push_back(id);
    undo_.push_back([this, id, prospectId] {
      auto &ids = t_.activitiesByProspect[prospectId];
      ids.pop_back();
      if (ids.empty())
        t_.activitiesByProspect.erase(prospectId);
      t_.activities.erase(id);
    });
    return id;
  }

  int64_t createImportSource(ImportSource source) override {
    checkOpen();
    source.id = t_.nextImportSourceId++;
    int64_t id = source.id;
    t_.importSources.emplace(id, std::move(source));
    undo_.push_back([this, id] { t_.importSources.erase(id); });
    return id;
  }

  void commit() override {
    checkOpen();
    committed_ = true;
    undo_.clear();
    lock_.unlock();
  }

 private:
  void checkOpen() const {
    CHECK(!committed_) << "write after commit";
  }

  void rollback() {
    if (!undo_.empty())
      VLOG(1) << "rolling back " << undo_.size() << " writes";
    for (auto it = undo_.rbegin(); it != undo_.rend(); ++it)
      (*it)();
    undo_.clear();
    t_.nextCompanyId = savedIds_[0];
    t_.nextProspectId = savedIds_[1];
    t_.nextContactId = savedIds_[2];
    t_.nextActivityId = savedIds_[3];
    t_.nextImportSourceId = savedIds_[4];
  }

  std::unique_lock<std::timed_mutex> lock_;
  Tables &t_;
  const int64_t savedIds_[5];
  std::vector<std::function<void()>> undo_;
  bool committed_ = false;
};

MemoryStore::MemoryStore(std::chrono::milliseconds lockTimeout)
  : lockTimeout_(lockTimeout)
{
}

MemoryStore::~MemoryStore() = default;

PipelineResult<std::unique_ptr<EntityStore::Transaction>> MemoryStore::begin() {
  std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
  if (!lock.try_lock_for(lockTimeout_)) {
    LOG(WARNING) << "entity store lock not acquired within "
                 << lockTimeout_.count() << "ms";
    return folly::makeUnexpected(PipelineError(PIPE_STORAGE_BUSY));
  }
  return std::unique_ptr<Transaction>(new Txn(std::move(lock), tables_));
}

template<class M>
static dynamic tableToJson(const std::map<int64_t, M> &table) {
  dynamic rows = dynamic::array;
  for (const auto &entry : table)
    rows.push_back(EntityCodec<M>::toJson(entry.second));
  return rows;
}

PipelineResult<dynamic> MemoryStore::toJson() const {
  std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
  if (!lock.try_lock_for(lockTimeout_)) {
    LOG(WARNING) << "snapshot not taken: entity store lock not acquired within "
                 << lockTimeout_.count() << "ms";
    return folly::makeUnexpected(PipelineError(PIPE_STORAGE_BUSY));
  }
  return dynamic::object
    ("version", kSnapshotVersion)
    ("companies", tableToJson(tables_.companies))
    ("prospects", tableToJson(tables_.prospects))
    ("contact_methods", tableToJson(tables_.contacts))
    ("activities", tableToJson(tables_.activities))
    ("import_sources", tableToJson(tables_.importSources));
}

template<class M>
static PipelineResult<folly::Unit>
tableFromJson(const dynamic &json, StringPiece key,
              std::map<int64_t, M> &table, int64_t &nextId) {
  auto *rows = json.get_ptr(key);
  if (!rows)
    return folly::unit;
  if (!rows->isArray()) {
    return folly::makeUnexpected(PipelineError(PIPE_MALFORMED_RECORD)
        .putVariable(folly::to<std::string>(key, ": array expected")));
  }

  for (const dynamic &row : *rows) {
    auto entity = EntityCodec<M>::decode(row);
    if (!entity)
      return folly::makeUnexpected(std::move(entity.error()));
    int64_t id = entity->id;
    if (!table.emplace(id, std::move(*entity)).second) {
      return folly::makeUnexpected(PipelineError(PIPE_MALFORMED_RECORD)
          .putVariable(folly::to<std::string>(key, ": duplicate id ", id)));
    }
    nextId = std::max(nextId, id + 1);
  }
  return folly::unit;
}

PipelineResult<folly::Unit> MemoryStore::loadJson(const dynamic &json) {
  const dynamic *version = json.isObject() ? json.get_ptr("version") : nullptr;
  if (!version || !version->isInt() || version->getInt() != kSnapshotVersion) {
    return folly::makeUnexpected(PipelineError(PIPE_MALFORMED_RECORD)
        .putVariable("unsupported snapshot"));
  }

  Tables tables;
  PipelineResult<folly::Unit> loaded = folly::unit;
  loaded = tableFromJson(json, "companies", tables.companies, tables.nextCompanyId);
  if (loaded)
    loaded = tableFromJson(json, "prospects", tables.prospects, tables.nextProspectId);
  if (loaded)
    loaded = tableFromJson(json, "contact_methods", tables.contacts, tables.nextContactId);
  if (loaded)
    loaded = tableFromJson(json, "activities", tables.activities, tables.nextActivityId);
  if (loaded)
    loaded = tableFromJson(json, "import_sources", tables.importSources,
                           tables.nextImportSourceId);
  if (!loaded)
    return loaded;

  for (const auto &entry : tables.companies)
    tables.companyByName.emplace(entry.second.nameNormalized, entry.first);
  for (const auto &entry : tables.contacts)
    tables.indexContact(entry.second);
  for (const auto &entry : tables.activities)
    tables.activitiesByProspect[entry.second.prospectId].push_back(entry.first);

  std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
  if (!lock.try_lock_for(lockTimeout_))
    return folly::makeUnexpected(PipelineError(PIPE_STORAGE_BUSY));
  tables_ = std::move(tables);

  LOG(INFO) << "loaded snapshot: " << tables_.prospects.size() << " prospects, "
            << tables_.companies.size() << " companies, "
            << tables_.activities.size() << " activities";
  return folly::unit;
}
