#ifndef LEADFLOW_PIPELINE_H
#define LEADFLOW_PIPELINE_H

#include <cstdint>
#include <cstddef>
#include <string>

#include <folly/Optional.h>
#include <folly/Range.h>
#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

using Date = boost::gregorian::date;
using Timestamp = boost::posix_time::ptime;

/** Where a prospect lives in the pipeline. Mutually exclusive. */
enum class Population : uint8_t {
  Broken,       // no usable phone or email
  DeadDnc,      // Do Not Contact, permanent
  Unengaged,    // system-paced outreach
  Engaged,      // prospect-paced, has a follow-up date
  ClosedWon,
  Lost,
  Parked,       // paused until parkedMonth
  Partnership,  // non-prospect relationship
};
static constexpr size_t kNumPopulations = 8;

/** Sub-state of Population::Engaged. Ordered. */
enum class EngagementStage : uint8_t {
  PreDemo,
  DemoScheduled,
  PostDemo,
  Closing,
};
static constexpr size_t kNumStages = 4;

enum class ActivityType : uint8_t {
  Call,
  Voicemail,
  EmailSent,
  EmailReceived,
  Demo,
  DemoScheduled,
  DemoCompleted,
  Note,
  StatusChange,
  Skip,
  Defer,
  Import,
  Enrichment,
  Verification,
  Reminder,
  Task,
};

enum class ActivityOutcome : uint8_t {
  NoAnswer,
  LeftVm,
  SpokeWith,
  Interested,
  NotInterested,
  NotNow,
  DemoSet,
  DemoCompleted,
  ClosedWon,
  ClosedLost,
  Bounced,
  Replied,
  Ooo,
  Referral,
};

enum class LostReason : uint8_t {
  LostToCompetitor,
  NotBuying,
  Timing,
  Budget,
  OutOfBusiness,
};

enum class ContactMethodType : uint8_t {
  Email,
  Phone,
};

/** Terminal populations have no outgoing transitions. */
bool isTerminal(Population pop) noexcept;

/** Populations whose follow-up date is computed by the cadence engine. */
bool isSystemPaced(Population pop) noexcept;

/** Calendar month a parked prospect wakes up in (YYYY-MM). */
struct ParkedMonth {
  int year = 0;
  int month = 0;

  /** Parse "YYYY-MM". Returns none on malformed input. */
  static folly::Optional<ParkedMonth> parse(folly::StringPiece s);
  static ParkedMonth of(const Date &date);
  std::string str() const;

  bool operator==(const ParkedMonth &rhs) const noexcept {
    return year == rhs.year && month == rhs.month;
  }
  bool operator!=(const ParkedMonth &rhs) const noexcept {
    return !(*this == rhs);
  }
  bool operator<(const ParkedMonth &rhs) const noexcept {
    return year < rhs.year || (year == rhs.year && month < rhs.month);
  }
  bool operator<=(const ParkedMonth &rhs) const noexcept {
    return !(rhs < *this);
  }
};

struct Company {
  int64_t id = 0;
  std::string name;
  std::string nameNormalized;
  std::string domain;
  std::string state;
  std::string timezone = "central";
  Timestamp createdAt;
};

/** Empty strings stand for absent values throughout. */
struct Prospect {
  int64_t id = 0;
  int64_t companyId = 0;
  std::string firstName;
  std::string lastName;
  std::string title;
  Population population = Population::Broken;
  folly::Optional<EngagementStage> engagementStage;
  folly::Optional<Timestamp> followUpDate;
  folly::Optional<Date> lastContactDate;
  folly::Optional<ParkedMonth> parkedMonth;
  uint32_t attemptCount = 0;
  int32_t prospectScore = 0;
  std::string source;
  std::string notes;
  folly::Optional<int64_t> referredBy;
  std::string deadReason;
  folly::Optional<Date> deadDate;
  folly::Optional<LostReason> lostReason;
  folly::Optional<Date> lostDate;
  folly::Optional<Date> closeDate;
  std::string closeNotes;
  Timestamp createdAt;
  Timestamp updatedAt;

  std::string fullName() const;
};

struct ContactMethod {
  int64_t id = 0;
  int64_t prospectId = 0;
  ContactMethodType type = ContactMethodType::Email;
  /** Normalized: lowercase email or digits-only phone. */
  std::string value;
  std::string label;
  bool isPrimary = false;
  bool isVerified = false;
  bool isSuspect = false;
  int32_t confidenceScore = 0;
  std::string source;
  Timestamp createdAt;
};

/** Append-only audit row. Never updated or deleted. */
struct Activity {
  int64_t id = 0;
  int64_t prospectId = 0;
  ActivityType type = ActivityType::Note;
  folly::Optional<ActivityOutcome> outcome;
  folly::Optional<Population> populationBefore;
  folly::Optional<Population> populationAfter;
  folly::Optional<EngagementStage> stageBefore;
  folly::Optional<EngagementStage> stageAfter;
  folly::Optional<Timestamp> followUpSet;
  std::string notes;
  std::string createdBy = "user";
  Timestamp createdAt;
};

struct ImportSource {
  int64_t id = 0;
  std::string sourceName;
  std::string filename;
  uint32_t totalRecords = 0;
  uint32_t importedRecords = 0;
  uint32_t duplicateRecords = 0;
  uint32_t brokenRecords = 0;
  uint32_t dncBlockedRecords = 0;
  Timestamp importDate;
};

/** Source of "now" for every engine. Tests substitute a fixed clock. */
class Clock {
 public:
  virtual ~Clock() = default;
  virtual Timestamp now() const = 0;
  Date today() const { return now().date(); }

  /** Wall clock in local time. */
  static const Clock& system() noexcept;
};

#endif // LEADFLOW_PIPELINE_H
