#ifndef LEADFLOW_INTAKE_H
#define LEADFLOW_INTAKE_H

#include "Config.h"
#include "EntityStore.h"
#include "Populations.h"

#include <string>
#include <vector>

/** One lead as produced by an importer adapter. Empty means absent. */
struct ImportRecord {
  std::string firstName;
  std::string lastName;
  std::string email;
  std::string phone;
  std::string companyName;
  std::string title;
  std::string state;
  std::string source;
  std::string notes;
};

enum class IntakeStatus : uint8_t {
  New,
  Merge,
  NeedsReview,
  BlockedDnc,
  Incomplete,
};

enum class MatchReason : uint8_t {
  Email,
  FuzzyName,
  Phone,
  Dnc,
};

folly::StringPiece toString(IntakeStatus status) noexcept;
folly::StringPiece toString(MatchReason reason) noexcept;

struct AnalysisResult {
  ImportRecord record;
  IntakeStatus status = IntakeStatus::New;
  folly::Optional<int64_t> matchedProspectId;
  folly::Optional<MatchReason> matchReason;
  folly::Optional<double> matchConfidence;
};

/** Classified batch. Only new, incomplete and merge entries get committed. */
struct ImportPreview {
  std::vector<AnalysisResult> newRecords;
  std::vector<AnalysisResult> mergeRecords;
  std::vector<AnalysisResult> needsReview;
  std::vector<AnalysisResult> blockedDnc;
  std::vector<AnalysisResult> incomplete;
  std::string sourceName;
  std::string filename;

  size_t totalRecords() const noexcept;
  bool canImport() const noexcept;
  folly::dynamic toJson() const;
};

struct ImportResult {
  uint32_t importedCount = 0;
  uint32_t mergedCount = 0;
  uint32_t brokenCount = 0;
  uint32_t dncBlockedCount = 0;
  /** Set once the ImportSource row is written. */
  folly::Optional<int64_t> sourceId;
  /** Created or merged prospects, in commit order. */
  std::vector<int64_t> prospectIds;
  std::vector<std::pair<ImportRecord, PipelineError>> failed;

  folly::dynamic toJson() const;
};

/**
 * 2 * LCS(a, b) / (|a| + |b|) over lowercased strings. Symmetric; two
 * empty strings score 0.
 */
double nameSimilarity(folly::StringPiece a, folly::StringPiece b);

/**
 * Two-phase import. analyze() classifies a batch against the store without
 * writing; commit() admits the accepted part of a (possibly edited)
 * preview, one transaction per record, re-checking DNC status live.
 */
class IntakeFunnel {
 public:
  IntakeFunnel(EntityStore &store, PopulationMachine &populations,
               const EngineConfig &config, const Clock &clock = Clock::system());

  PipelineResult<ImportPreview> analyze(const std::vector<ImportRecord> &records,
                                        folly::StringPiece sourceName,
                                        folly::StringPiece filename = "") const;

  ImportResult commit(const ImportPreview &preview);

 private:
  struct Contacts;

  AnalysisResult classify(EntityStore::Transaction &txn, const ImportRecord &record) const;
  folly::Optional<int64_t> findDncOwner(EntityStore::Transaction &txn,
                                        const Contacts &contacts) const;
  folly::Optional<std::pair<int64_t, double>>
  findFuzzyMatch(EntityStore::Transaction &txn, const ImportRecord &record) const;

  PipelineResult<Prospect> commitNew(EntityStore::Transaction &txn,
                                     const ImportRecord &record,
                                     const ImportPreview &preview);
  PipelineResult<Prospect> commitMerge(EntityStore::Transaction &txn,
                                       const AnalysisResult &entry,
                                       const ImportPreview &preview);
  int64_t findOrCreateCompany(EntityStore::Transaction &txn, const ImportRecord &record);
  void addContacts(EntityStore::Transaction &txn, int64_t prospectId,
                   const Contacts &contacts, bool primary,
                   const ImportPreview &preview);

  EntityStore &store_;
  PopulationMachine &populations_;
  const EngineConfig &config_;
  const Clock &clock_;
};

#endif // LEADFLOW_INTAKE_H
