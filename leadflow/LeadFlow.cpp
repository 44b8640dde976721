#include "Codec.h"
#include "Control.h"
#include "CsvImporter.h"
#include "Invariants.h"

#include <folly/dynamic.h>
#include <folly/json.h>
#include <folly/Conv.h>
#include <folly/portability/GFlags.h>
#include <folly/experimental/NestedCommandLineApp.h>
#include <glog/logging.h>

#include <iostream>
#include <clocale>

namespace po = boost::program_options;

using folly::dynamic;
using folly::StringPiece;

using Args = std::vector<std::string>;

static void print(const dynamic &json) {
  std::cout << folly::toPrettyJson(json) << std::endl;
}

static dynamic prospectList(const std::vector<Prospect> &prospects) {
  dynamic out = dynamic::array;
  for (const Prospect &p : prospects) {
    dynamic row = dynamic::object
      ("id", p.id)
      ("name", p.fullName())
      ("population", toString(p.population));
    if (p.engagementStage)
      row["stage"] = toString(*p.engagementStage);
    if (p.followUpDate)
      row["follow_up"] = formatTimestamp(*p.followUpDate);
    out.push_back(std::move(row));
  }
  return out;
}

static int64_t argProspectId(const std::string &arg) {
  auto id = folly::tryTo<int64_t>(arg);
  if (!id || *id <= 0)
    throw folly::ProgramExit(1, "bad prospect id: " + arg);
  return *id;
}

template<class E>
static E argEnum(const std::string &arg, StringPiece what) {
  if (auto value = EnumCodec<E>::parse(arg))
    return *value;
  throw folly::ProgramExit(1, folly::to<std::string>("unknown ", what, ": ", arg));
}

static Timestamp argTimestamp(const std::string &arg) {
  if (auto ts = parseTimestamp(arg))
    return *ts;
  throw folly::ProgramExit(1, "bad date/time (YYYY-MM-DD[THH:MM:SS]): " + arg);
}

static Date argDate(const po::variables_map &options, const char *key) {
  if (!options.count(key))
    return Clock::system().today();
  const std::string &arg = options[key].as<std::string>();
  if (auto date = parseDate(arg))
    return *date;
  throw folly::ProgramExit(1, "bad date (YYYY-MM-DD): " + arg);
}

static std::string optString(const po::variables_map &options, const char *key) {
  return options.count(key) ? options[key].as<std::string>() : std::string();
}

/** Fold an engine result into the process exit status. */
template<class T>
static T unwrap(PipelineResult<T> &&result) {
  if (!result) {
    const PipelineError &err = result.error();
    throw folly::ProgramExit(err.retryable() ? 75 : 1,
                             folly::to<std::string>(err.id(), ": ", err.message()));
  }
  return std::move(*result);
}

/* Commands */

static void Analyze(const po::variables_map &options, const Args &args) {
  if (args.size() != 1u)
    throw folly::ProgramExit(1, "CSV file expected");

  Workspace ws;
  auto records = unwrap(CsvImporter::readFile(args[0].c_str()));
  std::string source = options.count("source") ? optString(options, "source") : args[0];
  print(unwrap(ws.intake.analyze(records, source, args[0])).toJson());
}

static void Import(const po::variables_map &options, const Args &args) {
  if (args.size() != 1u)
    throw folly::ProgramExit(1, "CSV file expected");

  Workspace ws;
  auto records = unwrap(CsvImporter::readFile(args[0].c_str()));
  std::string source = options.count("source") ? optString(options, "source") : args[0];
  ImportPreview preview = unwrap(ws.intake.analyze(records, source, args[0]));

  if (!options.count("yes")) {
    print(preview.toJson());
    std::cerr << "Nothing written. Re-run with --yes to commit." << std::endl;
    return;
  }

  if (options.count("accept-review")) {
    for (AnalysisResult &entry : preview.needsReview)
      preview.newRecords.push_back(std::move(entry));
    preview.needsReview.clear();
  }

  ImportResult result = ws.intake.commit(preview);
  ws.save();
  print(result.toJson());
  if (!result.failed.empty())
    throw folly::ProgramExit(3, folly::to<std::string>(result.failed.size(),
                                                       " records failed"));
}

static void Transition(const po::variables_map &options, const Args &args) {
  if (args.size() != 2u)
    throw folly::ProgramExit(1, "prospect id and population expected");

  int64_t id = argProspectId(args[0]);
  Population target = argEnum<Population>(args[1], "population");

  TransitionOptions opts;
  opts.reason = optString(options, "reason");
  opts.closeNotes = optString(options, "close-notes");
  if (options.count("follow-up"))
    opts.followUp = argTimestamp(optString(options, "follow-up"));
  if (options.count("stage"))
    opts.stage = argEnum<EngagementStage>(optString(options, "stage"), "stage");
  if (options.count("lost-reason"))
    opts.lostReason = argEnum<LostReason>(optString(options, "lost-reason"), "lost reason");
  if (options.count("parked-month")) {
    opts.parkedMonth = ParkedMonth::parse(optString(options, "parked-month"));
    if (!opts.parkedMonth)
      throw folly::ProgramExit(1, "bad parked month (YYYY-MM)");
  }

  Workspace ws;
  Prospect p = unwrap(ws.populations.transition(id, target, opts));
  ws.save();
  print(EntityCodec<Prospect>::toJson(p));
}

static void Stage(const po::variables_map &options, const Args &args) {
  if (args.size() != 2u)
    throw folly::ProgramExit(1, "prospect id and stage expected");

  int64_t id = argProspectId(args[0]);
  EngagementStage to = argEnum<EngagementStage>(args[1], "stage");

  Workspace ws;
  Prospect p = unwrap(ws.stages.transitionStage(id, to, optString(options, "reason")));
  ws.save();
  print(EntityCodec<Prospect>::toJson(p));
}

static void FollowUp(const po::variables_map &options, const Args &args) {
  if (args.size() != 2u)
    throw folly::ProgramExit(1, "prospect id and date expected");

  int64_t id = argProspectId(args[0]);
  Timestamp when = argTimestamp(args[1]);

  Workspace ws;
  Prospect p = unwrap(ws.cadence.setFollowUp(id, when, optString(options, "reason")));
  ws.save();
  print(EntityCodec<Prospect>::toJson(p));
}

static void RecordAttempt(const po::variables_map &options, const Args &args) {
  if (args.size() != 1u)
    throw folly::ProgramExit(1, "prospect id expected");

  Attempt attempt;
  attempt.type = argEnum<ActivityType>(optString(options, "type"), "activity type");
  attempt.notes = optString(options, "notes");
  if (options.count("outcome"))
    attempt.outcome = argEnum<ActivityOutcome>(optString(options, "outcome"), "outcome");
  if (options.count("date"))
    attempt.date = argDate(options, "date");

  Workspace ws;
  Prospect p = unwrap(ws.cadence.recordAttempt(argProspectId(args[0]), attempt));
  ws.save();
  print(EntityCodec<Prospect>::toJson(p));
}

static void Overdue(const po::variables_map &options, const Args &) {
  Workspace ws;
  Date asOf = argDate(options, "as-of");
  print(prospectList(unwrap(ws.cadence.getOverdue(Timestamp(asOf)))));
}

static void Orphans(const po::variables_map &, const Args &) {
  Workspace ws;
  auto orphans = unwrap(ws.cadence.getOrphanedEngaged());
  print(prospectList(orphans));
  if (!orphans.empty())
    throw folly::ProgramExit(3, "orphan engaged prospects found");
}

static void Queue(const po::variables_map &options, const Args &) {
  Workspace ws;
  Energy energy = options.count("low-energy") ? Energy::Low : Energy::Normal;
  print(prospectList(unwrap(ws.cadence.todaysQueue(argDate(options, "date"), energy))));
}

static void Reactivate(const po::variables_map &options, const Args &) {
  Workspace ws;
  auto batch = unwrap(ws.populations.reactivateParked(argDate(options, "date")));
  ws.save();

  dynamic failed = dynamic::array;
  for (const auto &failure : batch.failed) {
    failed.push_back(dynamic::object
                     ("id", failure.first)
                     ("error", failure.second.toJson()));
  }
  print(dynamic::object
        ("reactivated", prospectList(batch.succeeded))
        ("failed", std::move(failed)));
}

static void Audit(const po::variables_map &, const Args &) {
  Workspace ws;
  auto txn = unwrap(ws.store.begin());
  auto violations = invariants::audit(*txn);

  dynamic out = dynamic::array;
  for (const auto &violation : violations) {
    out.push_back(dynamic::object
                  ("id", violation.prospectId)
                  ("error", violation.error.toJson()));
  }
  print(out);
  if (!violations.empty())
    throw folly::ProgramExit(3, folly::to<std::string>(violations.size(),
                                                       " invariant violations"));
}

static void History(const po::variables_map &, const Args &args) {
  if (args.size() != 1u)
    throw folly::ProgramExit(1, "prospect id expected");

  int64_t id = argProspectId(args[0]);
  Workspace ws;
  auto txn = unwrap(ws.store.begin());
  auto prospect = txn->getProspect(id);
  if (!prospect)
    throw folly::ProgramExit(1, invariants::notFound(id).message());

  dynamic activities = dynamic::array;
  for (const Activity &activity : txn->getActivities(id))
    activities.push_back(EntityCodec<Activity>::toJson(activity));
  dynamic contacts = dynamic::array;
  for (const ContactMethod &method : txn->getContactMethods(id))
    contacts.push_back(EntityCodec<ContactMethod>::toJson(method));

  print(dynamic::object
        ("prospect", EntityCodec<Prospect>::toJson(*prospect))
        ("contact_methods", std::move(contacts))
        ("activities", std::move(activities)));
}

int main(int argc, const char* argv[]) {
  setlocale(LC_ALL, "C");
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();
  FLAGS_logtostderr = 1;

  folly::NestedCommandLineApp app{argv[0], "0.9", "", "", nullptr};
  app.addGFlags(folly::ProgramOptionsStyle::GNU);

  app.addCommand("analyze", "leads.csv",
                 "Classify a CSV batch without writing",
                 "", Analyze)
    .add_options()
    ("source", po::value<std::string>(), "Import source name");

  app.addCommand("import", "leads.csv",
                 "Analyze a CSV batch and commit it",
                 "Without --yes only the preview is printed.",
                 Import)
    .add_options()
    ("source", po::value<std::string>(), "Import source name")
    ("yes,y", "Commit the batch")
    ("accept-review", "Create phone-matched records as new");

  app.addCommand("transition", "id population",
                 "Move a prospect to another population",
                 "", Transition)
    .add_options()
    ("follow-up", po::value<std::string>(), "Follow-up date (required for engaged)")
    ("stage", po::value<std::string>(), "Starting engagement stage")
    ("parked-month", po::value<std::string>(), "YYYY-MM (required for parked)")
    ("lost-reason", po::value<std::string>(), "Why the deal was lost")
    ("close-notes", po::value<std::string>(), "Notes for closed_won")
    ("reason", po::value<std::string>(), "Recorded on the activity");

  app.addCommand("stage", "id stage",
                 "Advance an engaged prospect to the next stage",
                 "", Stage)
    .add_options()
    ("reason", po::value<std::string>(), "Recorded on the activity");

  app.addCommand("follow-up", "id date",
                 "Set a prospect-paced follow-up",
                 "", FollowUp)
    .add_options()
    ("reason", po::value<std::string>(), "Recorded on the activity");

  app.addCommand("attempt", "id",
                 "Record an outreach attempt",
                 "", RecordAttempt)
    .add_options()
    ("type", po::value<std::string>()->default_value("call"), "Activity type")
    ("outcome", po::value<std::string>(), "Attempt outcome")
    ("notes", po::value<std::string>(), "Notes")
    ("date", po::value<std::string>(), "Attempt date, today by default");

  app.addCommand("overdue", "",
                 "List prospects with a missed follow-up",
                 "", Overdue)
    .add_options()
    ("as-of", po::value<std::string>(), "Reference date, today by default");

  app.addCommand("orphans", "",
                 "List engaged prospects without a follow-up",
                 "", Orphans);

  app.addCommand("queue", "",
                 "Today's work queue",
                 "", Queue)
    .add_options()
    ("date", po::value<std::string>(), "Queue date, today by default")
    ("low-energy", "Likely closes first");

  app.addCommand("reactivate", "",
                 "Wake parked prospects whose month has come",
                 "", Reactivate)
    .add_options()
    ("date", po::value<std::string>(), "Reference date, today by default");

  app.addCommand("audit", "",
                 "Check every prospect against the pipeline invariants",
                 "", Audit);

  app.addCommand("history", "id",
                 "Show a prospect with contact methods and activities",
                 "", History);

  return app.run(argc, argv);
}
