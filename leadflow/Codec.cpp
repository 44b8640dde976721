#include "Codec.h"

#include <stdexcept>
#include <folly/dynamic.h>
#include <folly/Conv.h>
#include <folly/String.h>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

using folly::dynamic;
using folly::StringPiece;

template<> StringPiece EnumCodec<Population>::name(Population v) noexcept {
  switch (v) {
  case Population::Broken:      return "broken";
  case Population::DeadDnc:     return "dead_dnc";
  case Population::Unengaged:   return "unengaged";
  case Population::Engaged:     return "engaged";
  case Population::ClosedWon:   return "closed_won";
  case Population::Lost:        return "lost";
  case Population::Parked:      return "parked";
  case Population::Partnership: return "partnership";
  }
  return "";
}

template<> StringPiece EnumCodec<EngagementStage>::name(EngagementStage v) noexcept {
  switch (v) {
  case EngagementStage::PreDemo:       return "pre_demo";
  case EngagementStage::DemoScheduled: return "demo_scheduled";
  case EngagementStage::PostDemo:      return "post_demo";
  case EngagementStage::Closing:       return "closing";
  }
  return "";
}

template<> StringPiece EnumCodec<ActivityType>::name(ActivityType v) noexcept {
  switch (v) {
  case ActivityType::Call:          return "call";
  case ActivityType::Voicemail:     return "voicemail";
  case ActivityType::EmailSent:     return "email_sent";
  case ActivityType::EmailReceived: return "email_received";
  case ActivityType::Demo:          return "demo";
  case ActivityType::DemoScheduled: return "demo_scheduled";
  case ActivityType::DemoCompleted: return "demo_completed";
  case ActivityType::Note:          return "note";
  case ActivityType::StatusChange:  return "status_change";
  case ActivityType::Skip:          return "skip";
  case ActivityType::Defer:         return "defer";
  case ActivityType::Import:        return "import";
  case ActivityType::Enrichment:    return "enrichment";
  case ActivityType::Verification:  return "verification";
  case ActivityType::Reminder:      return "reminder";
  case ActivityType::Task:          return "task";
  }
  return "";
}

template<> StringPiece EnumCodec<ActivityOutcome>::name(ActivityOutcome v) noexcept {
  switch (v) {
  case ActivityOutcome::NoAnswer:      return "no_answer";
  case ActivityOutcome::LeftVm:        return "left_vm";
  case ActivityOutcome::SpokeWith:     return "spoke_with";
  case ActivityOutcome::Interested:    return "interested";
  case ActivityOutcome::NotInterested: return "not_interested";
  case ActivityOutcome::NotNow:        return "not_now";
  case ActivityOutcome::DemoSet:       return "demo_set";
  case ActivityOutcome::DemoCompleted: return "demo_completed";
  case ActivityOutcome::ClosedWon:     return "closed_won";
  case ActivityOutcome::ClosedLost:    return "closed_lost";
  case ActivityOutcome::Bounced:       return "bounced";
  case ActivityOutcome::Replied:       return "replied";
  case ActivityOutcome::Ooo:           return "ooo";
  case ActivityOutcome::Referral:      return "referral";
  }
  return "";
}

template<> StringPiece EnumCodec<LostReason>::name(LostReason v) noexcept {
  switch (v) {
  case LostReason::LostToCompetitor: return "lost_to_competitor";
  case LostReason::NotBuying:        return "not_buying";
  case LostReason::Timing:           return "timing";
  case LostReason::Budget:           return "budget";
  case LostReason::OutOfBusiness:    return "out_of_business";
  }
  return "";
}

template<> StringPiece EnumCodec<ContactMethodType>::name(ContactMethodType v) noexcept {
  switch (v) {
  case ContactMethodType::Email: return "email";
  case ContactMethodType::Phone: return "phone";
  }
  return "";
}

// Enums are dense and start at zero; walk until name() runs dry.
template<class E>
static folly::Optional<E> parseDense(StringPiece s) noexcept {
  for (unsigned i = 0; i < 256; ++i) {
    E v = static_cast<E>(i);
    StringPiece n = EnumCodec<E>::name(v);
    if (n.empty())
      break;
    if (n == s)
      return v;
  }
  return folly::none;
}

template<> folly::Optional<Population>
EnumCodec<Population>::parse(StringPiece s) noexcept {
  return parseDense<Population>(s);
}

template<> folly::Optional<EngagementStage>
EnumCodec<EngagementStage>::parse(StringPiece s) noexcept {
  return parseDense<EngagementStage>(s);
}

template<> folly::Optional<ActivityType>
EnumCodec<ActivityType>::parse(StringPiece s) noexcept {
  return parseDense<ActivityType>(s);
}

template<> folly::Optional<ActivityOutcome>
EnumCodec<ActivityOutcome>::parse(StringPiece s) noexcept {
  return parseDense<ActivityOutcome>(s);
}

template<> folly::Optional<LostReason>
EnumCodec<LostReason>::parse(StringPiece s) noexcept {
  return parseDense<LostReason>(s);
}

template<> folly::Optional<ContactMethodType>
EnumCodec<ContactMethodType>::parse(StringPiece s) noexcept {
  return parseDense<ContactMethodType>(s);
}

folly::Optional<Date> parseDate(StringPiece s) noexcept {
  s = folly::trimWhitespace(s);
  if (s.size() != 10)
    return folly::none;
  try {
    return boost::gregorian::from_simple_string(s.str());
  } catch (const std::exception &) {
    return folly::none;
  }
}

folly::Optional<Timestamp> parseTimestamp(StringPiece s) noexcept {
  s = folly::trimWhitespace(s);
  if (auto date = parseDate(s))
    return Timestamp(*date);
  try {
    Timestamp ts = boost::posix_time::from_iso_extended_string(s.str());
    if (ts.is_special())
      return folly::none;
    return ts;
  } catch (const std::exception &) {
    return folly::none;
  }
}

std::string formatDate(const Date &date) {
  return boost::gregorian::to_iso_extended_string(date);
}

std::string formatTimestamp(const Timestamp &ts) {
  if (ts.is_special())
    return "";
  return boost::posix_time::to_iso_extended_string(ts);
}

/* Field helpers */

template<class E>
static dynamic enumOrNull(const folly::Optional<E> &v) {
  return v ? dynamic(toString(*v)) : dynamic(nullptr);
}

static dynamic dateOrNull(const folly::Optional<Date> &v) {
  return v ? dynamic(formatDate(*v)) : dynamic(nullptr);
}

static dynamic timestampOrNull(const folly::Optional<Timestamp> &v) {
  return v ? dynamic(formatTimestamp(*v)) : dynamic(nullptr);
}

static bool isAbsent(const dynamic &obj, StringPiece key) {
  auto *v = obj.get_ptr(key);
  return !v || v->isNull();
}

template<class E>
static E getEnum(const dynamic &obj, StringPiece key) {
  StringPiece s = obj.at(key).stringPiece();
  if (auto v = EnumCodec<E>::parse(s))
    return *v;
  throw std::invalid_argument(folly::to<std::string>(key, ": unknown value ", s));
}

template<class E>
static folly::Optional<E> getOptEnum(const dynamic &obj, StringPiece key) {
  if (isAbsent(obj, key))
    return folly::none;
  return getEnum<E>(obj, key);
}

static folly::Optional<Date> getOptDate(const dynamic &obj, StringPiece key) {
  if (isAbsent(obj, key))
    return folly::none;
  StringPiece s = obj.at(key).stringPiece();
  if (auto date = parseDate(s))
    return date;
  throw std::invalid_argument(folly::to<std::string>(key, ": bad date ", s));
}

static folly::Optional<Timestamp> getOptTimestamp(const dynamic &obj, StringPiece key) {
  if (isAbsent(obj, key))
    return folly::none;
  StringPiece s = obj.at(key).stringPiece();
  if (s.empty())
    return folly::none;
  if (auto ts = parseTimestamp(s))
    return ts;
  throw std::invalid_argument(folly::to<std::string>(key, ": bad timestamp ", s));
}

static Timestamp getTimestamp(const dynamic &obj, StringPiece key) {
  if (auto ts = getOptTimestamp(obj, key))
    return *ts;
  return Timestamp();
}

static std::string getString(const dynamic &obj, StringPiece key) {
  if (isAbsent(obj, key))
    return "";
  return obj.at(key).asString();
}

/* Company */

template<> dynamic EntityCodec<Company>::toJson(const Company &c) {
  return dynamic::object
    ("id", c.id)
    ("name", c.name)
    ("name_normalized", c.nameNormalized)
    ("domain", c.domain)
    ("state", c.state)
    ("timezone", c.timezone)
    ("created_at", formatTimestamp(c.createdAt));
}

template<> Company EntityCodec<Company>::fromJson(const dynamic &d) {
  Company c;
  c.id = d.at("id").asInt();
  c.name = d.at("name").asString();
  c.nameNormalized = getString(d, "name_normalized");
  c.domain = getString(d, "domain");
  c.state = getString(d, "state");
  c.timezone = getString(d, "timezone");
  c.createdAt = getTimestamp(d, "created_at");
  return c;
}

/* Prospect */

template<> dynamic EntityCodec<Prospect>::toJson(const Prospect &p) {
  return dynamic::object
    ("id", p.id)
    ("company_id", p.companyId)
    ("first_name", p.firstName)
    ("last_name", p.lastName)
    ("title", p.title)
    ("population", toString(p.population))
    ("engagement_stage", enumOrNull(p.engagementStage))
    ("follow_up_date", timestampOrNull(p.followUpDate))
    ("last_contact_date", dateOrNull(p.lastContactDate))
    ("parked_month", p.parkedMonth ? dynamic(p.parkedMonth->str()) : dynamic(nullptr))
    ("attempt_count", p.attemptCount)
    ("prospect_score", p.prospectScore)
    ("source", p.source)
    ("notes", p.notes)
    ("referred_by", p.referredBy ? dynamic(*p.referredBy) : dynamic(nullptr))
    ("dead_reason", p.deadReason)
    ("dead_date", dateOrNull(p.deadDate))
    ("lost_reason", enumOrNull(p.lostReason))
    ("lost_date", dateOrNull(p.lostDate))
    ("close_date", dateOrNull(p.closeDate))
    ("close_notes", p.closeNotes)
    ("created_at", formatTimestamp(p.createdAt))
    ("updated_at", formatTimestamp(p.updatedAt));
}

template<> Prospect EntityCodec<Prospect>::fromJson(const dynamic &d) {
  Prospect p;
  p.id = d.at("id").asInt();
  p.companyId = d.at("company_id").asInt();
  p.firstName = getString(d, "first_name");
  p.lastName = getString(d, "last_name");
  p.title = getString(d, "title");
  p.population = getEnum<Population>(d, "population");
  p.engagementStage = getOptEnum<EngagementStage>(d, "engagement_stage");
  p.followUpDate = getOptTimestamp(d, "follow_up_date");
  p.lastContactDate = getOptDate(d, "last_contact_date");
  if (!isAbsent(d, "parked_month")) {
    StringPiece month = d.at("parked_month").stringPiece();
    p.parkedMonth = ParkedMonth::parse(month);
    if (!p.parkedMonth)
      throw std::invalid_argument(folly::to<std::string>("parked_month: bad value ", month));
  }
  if (!isAbsent(d, "attempt_count"))
    p.attemptCount = folly::to<uint32_t>(d.at("attempt_count").asInt());
  if (!isAbsent(d, "prospect_score"))
    p.prospectScore = folly::to<int32_t>(d.at("prospect_score").asInt());
  p.source = getString(d, "source");
  p.notes = getString(d, "notes");
  if (!isAbsent(d, "referred_by"))
    p.referredBy = d.at("referred_by").asInt();
  p.deadReason = getString(d, "dead_reason");
  p.deadDate = getOptDate(d, "dead_date");
  p.lostReason = getOptEnum<LostReason>(d, "lost_reason");
  p.lostDate = getOptDate(d, "lost_date");
  p.closeDate = getOptDate(d, "close_date");
  p.closeNotes = getString(d, "close_notes");
  p.createdAt = getTimestamp(d, "created_at");
  p.updatedAt = getTimestamp(d, "updated_at");
  return p;
}

/* ContactMethod */

template<> dynamic EntityCodec<ContactMethod>::toJson(const ContactMethod &m) {
  return dynamic::object
    ("id", m.id)
    ("prospect_id", m.prospectId)
    ("type", toString(m.type))
    ("value", m.value)
    ("label", m.label)
    ("is_primary", m.isPrimary)
    ("is_verified", m.isVerified)
    ("is_suspect", m.isSuspect)
    ("confidence_score", m.confidenceScore)
    ("source", m.source)
    ("created_at", formatTimestamp(m.createdAt));
}

template<> ContactMethod EntityCodec<ContactMethod>::fromJson(const dynamic &d) {
  ContactMethod m;
  m.id = d.at("id").asInt();
  m.prospectId = d.at("prospect_id").asInt();
  m.type = getEnum<ContactMethodType>(d, "type");
  m.value = d.at("value").asString();
  m.label = getString(d, "label");
  m.isPrimary = d.getDefault("is_primary", false).asBool();
  m.isVerified = d.getDefault("is_verified", false).asBool();
  m.isSuspect = d.getDefault("is_suspect", false).asBool();
  m.confidenceScore = folly::to<int32_t>(d.getDefault("confidence_score", 0).asInt());
  m.source = getString(d, "source");
  m.createdAt = getTimestamp(d, "created_at");
  return m;
}

/* Activity */

template<> dynamic EntityCodec<Activity>::toJson(const Activity &a) {
  return dynamic::object
    ("id", a.id)
    ("prospect_id", a.prospectId)
    ("activity_type", toString(a.type))
    ("outcome", enumOrNull(a.outcome))
    ("population_before", enumOrNull(a.populationBefore))
    ("population_after", enumOrNull(a.populationAfter))
    ("stage_before", enumOrNull(a.stageBefore))
    ("stage_after", enumOrNull(a.stageAfter))
    ("follow_up_set", timestampOrNull(a.followUpSet))
    ("notes", a.notes)
    ("created_by", a.createdBy)
    ("created_at", formatTimestamp(a.createdAt));
}

template<> Activity EntityCodec<Activity>::fromJson(const dynamic &d) {
  Activity a;
  a.id = d.at("id").asInt();
  a.prospectId = d.at("prospect_id").asInt();
  a.type = getEnum<ActivityType>(d, "activity_type");
  a.outcome = getOptEnum<ActivityOutcome>(d, "outcome");
  a.populationBefore = getOptEnum<Population>(d, "population_before");
  a.populationAfter = getOptEnum<Population>(d, "population_after");
  a.stageBefore = getOptEnum<EngagementStage>(d, "stage_before");
  a.stageAfter = getOptEnum<EngagementStage>(d, "stage_after");
  a.followUpSet = getOptTimestamp(d, "follow_up_set");
  a.notes = getString(d, "notes");
  a.createdBy = getString(d, "created_by");
  a.createdAt = getTimestamp(d, "created_at");
  return a;
}

/* ImportSource */

template<> dynamic EntityCodec<ImportSource>::toJson(const ImportSource &s) {
  return dynamic::object
    ("id", s.id)
    ("source_name", s.sourceName)
    ("filename", s.filename)
    ("total_records", s.totalRecords)
    ("imported_records", s.importedRecords)
    ("duplicate_records", s.duplicateRecords)
    ("broken_records", s.brokenRecords)
    ("dnc_blocked_records", s.dncBlockedRecords)
    ("import_date", formatTimestamp(s.importDate));
}

template<> ImportSource EntityCodec<ImportSource>::fromJson(const dynamic &d) {
  ImportSource s;
  s.id = d.at("id").asInt();
  s.sourceName = getString(d, "source_name");
  s.filename = getString(d, "filename");
  s.totalRecords = folly::to<uint32_t>(d.getDefault("total_records", 0).asInt());
  s.importedRecords = folly::to<uint32_t>(d.getDefault("imported_records", 0).asInt());
  s.duplicateRecords = folly::to<uint32_t>(d.getDefault("duplicate_records", 0).asInt());
  s.brokenRecords = folly::to<uint32_t>(d.getDefault("broken_records", 0).asInt());
  s.dncBlockedRecords = folly::to<uint32_t>(d.getDefault("dnc_blocked_records", 0).asInt());
  s.importDate = getTimestamp(d, "import_date");
  return s;
}

template<class M> PipelineResult<M>
EntityCodec<M>::decode(const dynamic &json) {
  PipelineError err = PIPE_MALFORMED_RECORD;
  try {
    return fromJson(json);
  } catch (const std::out_of_range &ex) {
    err.putVariable(folly::to<std::string>("missing field: ", ex.what()));
  } catch (const folly::TypeError &ex) {
    err.putVariable(ex.what());
  } catch (const folly::ConversionError &ex) {
    err.putVariable(ex.what());
  } catch (const std::invalid_argument &ex) {
    err.putVariable(ex.what());
  }
  return folly::makeUnexpected(std::move(err));
}

template struct EntityCodec<Company>;
template struct EntityCodec<Prospect>;
template struct EntityCodec<ContactMethod>;
template struct EntityCodec<Activity>;
template struct EntityCodec<ImportSource>;
