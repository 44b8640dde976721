#include "Intake.h"
#include "Codec.h"
#include "Invariants.h"
#include "Normalize.h"

#include <algorithm>
#include <set>
#include <folly/dynamic.h>
#include <folly/Conv.h>
#include <folly/String.h>
#include <glog/logging.h>

using folly::dynamic;
using folly::StringPiece;

StringPiece toString(IntakeStatus status) noexcept {
  switch (status) {
  case IntakeStatus::New:         return "new";
  case IntakeStatus::Merge:       return "merge";
  case IntakeStatus::NeedsReview: return "needs_review";
  case IntakeStatus::BlockedDnc:  return "blocked_dnc";
  case IntakeStatus::Incomplete:  return "incomplete";
  }
  return "";
}

StringPiece toString(MatchReason reason) noexcept {
  switch (reason) {
  case MatchReason::Email:     return "email";
  case MatchReason::FuzzyName: return "fuzzy_name";
  case MatchReason::Phone:     return "phone";
  case MatchReason::Dnc:       return "dnc";
  }
  return "";
}

double nameSimilarity(StringPiece a, StringPiece b) {
  if (a.empty() && b.empty())
    return 0.0;

  std::string x = a.str(), y = b.str();
  folly::toLowerAscii(x);
  folly::toLowerAscii(y);

  // LCS length, two rolling rows
  std::vector<uint32_t> prev(y.size() + 1, 0), cur(y.size() + 1, 0);
  for (size_t i = 1; i <= x.size(); ++i) {
    for (size_t j = 1; j <= y.size(); ++j) {
      if (x[i - 1] == y[j - 1])
        cur[j] = prev[j - 1] + 1;
      else
        cur[j] = std::max(prev[j], cur[j - 1]);
    }
    std::swap(prev, cur);
  }
  double lcs = prev[y.size()];
  return 2.0 * lcs / static_cast<double>(x.size() + y.size());
}

static std::string fullName(const ImportRecord &record) {
  std::string first = folly::trimWhitespace(record.firstName).str();
  std::string last = folly::trimWhitespace(record.lastName).str();
  if (!first.empty() && !last.empty())
    first += ' ';
  return first + last;
}

static bool hasName(const ImportRecord &record) {
  return !folly::trimWhitespace(record.firstName).empty() ||
    !folly::trimWhitespace(record.lastName).empty();
}

struct IntakeFunnel::Contacts {
  std::string email;
  std::string phone;

  explicit Contacts(const ImportRecord &record)
    : email(EmailAddress::normalize(record.email))
    , phone(PhoneNumber::normalize(record.phone))
  {
  }

  bool any() const noexcept {
    return !email.empty() || !phone.empty();
  }

  bool anyUsable() const noexcept {
    return EmailAddress::isUsable(email) || PhoneNumber::isUsable(phone);
  }
};

/* ImportPreview */

size_t ImportPreview::totalRecords() const noexcept {
  return newRecords.size() + mergeRecords.size() + needsReview.size() +
    blockedDnc.size() + incomplete.size();
}

bool ImportPreview::canImport() const noexcept {
  return !newRecords.empty() || !mergeRecords.empty() || !incomplete.empty();
}

static dynamic entryToJson(const AnalysisResult &entry) {
  dynamic out = dynamic::object
    ("name", fullName(entry.record))
    ("email", entry.record.email)
    ("phone", entry.record.phone)
    ("company", entry.record.companyName)
    ("status", toString(entry.status));
  if (entry.matchedProspectId)
    out["matched_prospect_id"] = *entry.matchedProspectId;
  if (entry.matchReason)
    out["match_reason"] = toString(*entry.matchReason);
  if (entry.matchConfidence)
    out["match_confidence"] = *entry.matchConfidence;
  return out;
}

static dynamic entriesToJson(const std::vector<AnalysisResult> &entries) {
  dynamic out = dynamic::array;
  for (const AnalysisResult &entry : entries)
    out.push_back(entryToJson(entry));
  return out;
}

dynamic ImportPreview::toJson() const {
  return dynamic::object
    ("source_name", sourceName)
    ("filename", filename)
    ("total", totalRecords())
    ("new", entriesToJson(newRecords))
    ("merge", entriesToJson(mergeRecords))
    ("needs_review", entriesToJson(needsReview))
    ("blocked_dnc", entriesToJson(blockedDnc))
    ("incomplete", entriesToJson(incomplete));
}

dynamic ImportResult::toJson() const {
  dynamic failures = dynamic::array;
  for (const auto &failure : failed) {
    failures.push_back(dynamic::object
                       ("name", fullName(failure.first))
                       ("error", failure.second.toJson()));
  }

  return dynamic::object
    ("imported", importedCount)
    ("merged", mergedCount)
    ("broken", brokenCount)
    ("dnc_blocked", dncBlockedCount)
    ("source_id", sourceId ? dynamic(*sourceId) : dynamic(nullptr))
    ("prospect_ids", dynamic(prospectIds.begin(), prospectIds.end()))
    ("failed", std::move(failures));
}

/* IntakeFunnel */

IntakeFunnel::IntakeFunnel(EntityStore &store, PopulationMachine &populations,
                           const EngineConfig &config, const Clock &clock)
  : store_(store)
  , populations_(populations)
  , config_(config)
  , clock_(clock)
{
}

folly::Optional<int64_t>
IntakeFunnel::findDncOwner(EntityStore::Transaction &txn, const Contacts &contacts) const {
  auto dncOwner = [&](ContactMethodType type, const std::string &value)
    -> folly::Optional<int64_t> {
    if (value.empty())
      return folly::none;
    for (int64_t id : txn.findProspectsByContact(type, value)) {
      auto owner = txn.getProspect(id);
      if (owner && owner->population == Population::DeadDnc)
        return id;
    }
    return folly::none;
  };

  if (auto id = dncOwner(ContactMethodType::Email, contacts.email))
    return id;
  return dncOwner(ContactMethodType::Phone, contacts.phone);
}

folly::Optional<std::pair<int64_t, double>>
IntakeFunnel::findFuzzyMatch(EntityStore::Transaction &txn, const ImportRecord &record) const {
  if (folly::trimWhitespace(record.firstName).empty() ||
      folly::trimWhitespace(record.lastName).empty() ||
      folly::trimWhitespace(record.companyName).empty())
    return folly::none;

  auto company = txn.findCompanyByNormalizedName(CompanyName::normalize(record.companyName));
  if (!company)
    return folly::none;

  const std::string incoming = fullName(record);
  folly::Optional<std::pair<int64_t, double>> best;
  uint32_t scanned = 0;
  for (const Prospect &p : txn.getProspectsAtCompany(company->id)) {
    if (scanned++ >= config_.fuzzyScanLimit)
      break;
    double ratio = nameSimilarity(incoming, p.fullName());
    if (ratio >= config_.similarityThreshold && (!best || ratio > best->second))
      best = std::make_pair(p.id, ratio);
  }
  return best;
}

AnalysisResult
IntakeFunnel::classify(EntityStore::Transaction &txn, const ImportRecord &record) const {
  AnalysisResult result;
  result.record = record;
  const Contacts contacts(record);

  if (auto owner = findDncOwner(txn, contacts)) {
    result.status = IntakeStatus::BlockedDnc;
    result.matchedProspectId = owner;
    result.matchReason = MatchReason::Dnc;
    return result;
  }

  if (!contacts.email.empty()) {
    auto owners = txn.findProspectsByContact(ContactMethodType::Email, contacts.email);
    if (!owners.empty()) {
      result.status = IntakeStatus::Merge;
      result.matchedProspectId = owners.front();
      result.matchReason = MatchReason::Email;
      result.matchConfidence = 1.0;
      return result;
    }
  }

  if (auto match = findFuzzyMatch(txn, record)) {
    auto target = txn.getProspect(match->first);
    if (target && target->population == Population::DeadDnc) {
      result.status = IntakeStatus::BlockedDnc;
      result.matchedProspectId = match->first;
      result.matchReason = MatchReason::Dnc;
      result.matchConfidence = match->second;
      return result;
    }
    result.status = IntakeStatus::Merge;
    result.matchedProspectId = match->first;
    result.matchReason = MatchReason::FuzzyName;
    result.matchConfidence = match->second;
    return result;
  }

  if (!contacts.phone.empty()) {
    auto owners = txn.findProspectsByContact(ContactMethodType::Phone, contacts.phone);
    if (!owners.empty()) {
      result.status = IntakeStatus::NeedsReview;
      result.matchedProspectId = owners.front();
      result.matchReason = MatchReason::Phone;
      return result;
    }
  }

  result.status = contacts.any() ? IntakeStatus::New : IntakeStatus::Incomplete;
  return result;
}

PipelineResult<ImportPreview>
IntakeFunnel::analyze(const std::vector<ImportRecord> &records,
                      StringPiece sourceName, StringPiece filename) const
{
  auto txn = store_.begin();
  if (!txn)
    return folly::makeUnexpected(std::move(txn.error()));

  ImportPreview preview;
  preview.sourceName = sourceName.str();
  preview.filename = filename.str();

  for (const ImportRecord &record : records) {
    AnalysisResult result = classify(**txn, record);
    switch (result.status) {
    case IntakeStatus::New:
      preview.newRecords.push_back(std::move(result));
      break;
    case IntakeStatus::Merge:
      preview.mergeRecords.push_back(std::move(result));
      break;
    case IntakeStatus::NeedsReview:
      preview.needsReview.push_back(std::move(result));
      break;
    case IntakeStatus::BlockedDnc:
      preview.blockedDnc.push_back(std::move(result));
      break;
    case IntakeStatus::Incomplete:
      preview.incomplete.push_back(std::move(result));
      break;
    }
  }

  LOG(INFO) << "import analysis '" << preview.sourceName << "': "
            << preview.totalRecords() << " records, "
            << preview.newRecords.size() << " new, "
            << preview.mergeRecords.size() << " merge, "
            << preview.needsReview.size() << " review, "
            << preview.blockedDnc.size() << " dnc blocked, "
            << preview.incomplete.size() << " incomplete";
  return preview;
}

int64_t IntakeFunnel::findOrCreateCompany(EntityStore::Transaction &txn,
                                          const ImportRecord &record)
{
  StringPiece name = folly::trimWhitespace(record.companyName);
  if (name.empty())
    name = "Unknown";

  std::string normalized = CompanyName::normalize(name);
  if (auto existing = txn.findCompanyByNormalizedName(normalized))
    return existing->id;

  Company company;
  company.name = name.str();
  company.nameNormalized = std::move(normalized);
  company.state = folly::trimWhitespace(record.state).str();
  company.timezone = timezoneFromState(company.state).str();
  company.createdAt = clock_.now();
  return txn.createCompany(std::move(company));
}

void IntakeFunnel::addContacts(EntityStore::Transaction &txn, int64_t prospectId,
                               const Contacts &contacts, bool primary,
                               const ImportPreview &preview)
{
  std::set<std::pair<ContactMethodType, std::string>> seen;
  for (const ContactMethod &m : txn.getContactMethods(prospectId))
    seen.emplace(m.type, m.value);

  auto add = [&](ContactMethodType type, const std::string &value,
                 bool usable, bool isPrimary) {
    if (value.empty() || seen.count(std::make_pair(type, value)))
      return;
    ContactMethod method;
    method.prospectId = prospectId;
    method.type = type;
    method.value = value;
    method.isPrimary = isPrimary;
    method.isSuspect = !usable;
    method.source = preview.sourceName;
    method.createdAt = clock_.now();
    txn.createContactMethod(std::move(method));
  };

  add(ContactMethodType::Email, contacts.email,
      EmailAddress::isUsable(contacts.email), primary);
  add(ContactMethodType::Phone, contacts.phone,
      PhoneNumber::isUsable(contacts.phone), primary && contacts.email.empty());
}

PipelineResult<Prospect>
IntakeFunnel::commitNew(EntityStore::Transaction &txn, const ImportRecord &record,
                        const ImportPreview &preview)
{
  const Contacts contacts(record);

  Prospect prospect;
  prospect.companyId = findOrCreateCompany(txn, record);
  prospect.firstName = folly::trimWhitespace(record.firstName).str();
  prospect.lastName = folly::trimWhitespace(record.lastName).str();
  prospect.title = record.title;
  prospect.source = record.source.empty() ? preview.sourceName : record.source;
  prospect.notes = record.notes;

  Population initial = contacts.anyUsable() ? Population::Unengaged : Population::Broken;
  auto admitted = populations_.admit(
      txn, std::move(prospect), initial,
      "Imported from " + (preview.sourceName.empty() ? preview.filename : preview.sourceName));
  if (!admitted)
    return admitted;

  addContacts(txn, admitted->id, contacts, true, preview);
  return admitted;
}

PipelineResult<Prospect>
IntakeFunnel::commitMerge(EntityStore::Transaction &txn, const AnalysisResult &entry,
                          const ImportPreview &preview)
{
  if (!entry.matchedProspectId) {
    return folly::makeUnexpected(PipelineError(PIPE_MALFORMED_RECORD)
        .putVariable("merge entry without a matched prospect"));
  }

  const int64_t id = *entry.matchedProspectId;
  auto target = txn.getProspect(id);
  if (!target)
    return folly::makeUnexpected(invariants::notFound(id));

  auto allowed = invariants::checkNotDnc(*target, "merge refused");
  if (!allowed)
    return folly::makeUnexpected(std::move(allowed.error()));

  const ImportRecord &record = entry.record;
  Prospect merged = *target;
  auto fill = [](std::string &field, const std::string &incoming) {
    StringPiece value = folly::trimWhitespace(incoming);
    if (field.empty() && !value.empty())
      field = value.str();
  };
  fill(merged.firstName, record.firstName);
  fill(merged.lastName, record.lastName);
  fill(merged.title, record.title);
  fill(merged.notes, record.notes);
  fill(merged.source, record.source);

  Timestamp now = clock_.now();
  if (merged.firstName != target->firstName || merged.lastName != target->lastName ||
      merged.title != target->title || merged.notes != target->notes ||
      merged.source != target->source) {
    merged.updatedAt = now;
    txn.updateProspect(merged);
  }

  addContacts(txn, id, Contacts(record), false, preview);

  Activity activity;
  activity.prospectId = id;
  activity.type = ActivityType::Import;
  activity.populationAfter = merged.population;
  activity.notes = folly::to<std::string>(
      "Merged from import: ",
      preview.sourceName.empty() ? preview.filename : preview.sourceName,
      " (match: ", entry.matchReason ? toString(*entry.matchReason) : "manual", ")");
  activity.createdBy = "import";
  activity.createdAt = now;
  txn.createActivity(std::move(activity));
  return merged;
}

ImportResult IntakeFunnel::commit(const ImportPreview &preview) {
  ImportResult result;
  result.dncBlockedCount = preview.blockedDnc.size();

  auto commitOne = [&](const AnalysisResult &entry) {
    const ImportRecord &record = entry.record;
    auto fail = [&](PipelineError err) {
      LOG(WARNING) << "import of '" << fullName(record) << "' failed: " << err.message();
      if (err.code() == PIPE_DNC_VIOLATION)
        result.dncBlockedCount++;
      result.failed.emplace_back(record, std::move(err));
    };

    if (!hasName(record)) {
      fail(PipelineError(PIPE_MALFORMED_RECORD).putVariable("first or last name required"));
      return;
    }

    auto txn = store_.begin();
    if (!txn) {
      fail(std::move(txn.error()));
      return;
    }

    if (auto owner = findDncOwner(**txn, Contacts(record))) {
      fail(invariants::dncViolation(*owner, "matched by import record"));
      return;
    }

    const AnalysisResult *target = &entry;
    AnalysisResult rematched;
    if (entry.status != IntakeStatus::Merge) {
      // an earlier record of this batch may own the email by now
      const Contacts contacts(record);
      std::vector<int64_t> owners;
      if (!contacts.email.empty())
        owners = (*txn)->findProspectsByContact(ContactMethodType::Email, contacts.email);
      if (!owners.empty()) {
        rematched = entry;
        rematched.status = IntakeStatus::Merge;
        rematched.matchedProspectId = owners.front();
        rematched.matchReason = MatchReason::Email;
        rematched.matchConfidence = 1.0;
        target = &rematched;
      }
    }

    const bool merge = target->status == IntakeStatus::Merge;
    auto committed = merge
      ? commitMerge(**txn, *target, preview)
      : commitNew(**txn, record, preview);
    if (!committed) {
      fail(std::move(committed.error()));
      return;
    }
    (*txn)->commit();

    result.prospectIds.push_back(committed->id);
    if (merge) {
      result.mergedCount++;
    } else {
      result.importedCount++;
      if (committed->population == Population::Broken)
        result.brokenCount++;
    }
  };

  for (const AnalysisResult &entry : preview.newRecords)
    commitOne(entry);
  for (const AnalysisResult &entry : preview.incomplete)
    commitOne(entry);
  for (const AnalysisResult &entry : preview.mergeRecords)
    commitOne(entry);

  ImportSource source;
  source.sourceName = preview.sourceName;
  source.filename = preview.filename;
  source.totalRecords = preview.totalRecords();
  source.importedRecords = result.importedCount;
  source.duplicateRecords = result.mergedCount;
  source.brokenRecords = result.brokenCount;
  source.dncBlockedRecords = result.dncBlockedCount;
  source.importDate = clock_.now();

  auto txn = store_.begin();
  if (txn) {
    result.sourceId = (*txn)->createImportSource(std::move(source));
    (*txn)->commit();
  } else {
    LOG(ERROR) << "import source row for '" << preview.sourceName
               << "' not written: " << txn.error().message();
  }

  LOG(INFO) << "import committed '" << preview.sourceName << "': "
            << result.importedCount << " imported, "
            << result.mergedCount << " merged, "
            << result.brokenCount << " broken, "
            << result.dncBlockedCount << " dnc blocked, "
            << result.failed.size() << " failed";
  return result;
}
