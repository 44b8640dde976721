#include "Control.h"

#include <folly/dynamic.h>
#include <folly/json.h>
#include <folly/FileUtil.h>
#include <folly/String.h>
#include <folly/portability/GFlags.h>
#include <folly/experimental/NestedCommandLineApp.h>
#include <glog/logging.h>

using folly::StringPiece;

DEFINE_string(db, "leadflow.json", "Pipeline snapshot to read and update");
DEFINE_string(config, "", "Engine configuration (JSON)");
DEFINE_double(similarity_threshold, 0,
              "Fuzzy name merge threshold. 0 keeps the configured value.");
DEFINE_int32(lock_timeout_ms, -1,
             "Entity store lock wait. Negative keeps the configured value.");

static StringPiece osBasename(StringPiece path) {
  auto idx = path.rfind('/');
  if (idx == StringPiece::npos)
    return path;
  return path.subpiece(idx + 1);
}

static folly::dynamic parseJsonFile(const std::string &path, StringPiece text) {
  try {
    return folly::parseJson(text);
  } catch (const std::exception &e) {
    throw folly::ProgramExit(1, osBasename(path).str() + ": " + e.what());
  }
}

static folly::dynamic readJsonFile(const std::string &path) {
  std::string text;
  if (!folly::readFile(path.c_str(), text))
    throw folly::ProgramExit(1, "cannot read " + path);
  return parseJsonFile(path, text);
}

EngineConfig loadEngineConfig() {
  EngineConfig config = EngineConfig::defaults();

  if (!FLAGS_config.empty()) {
    auto loaded = EngineConfig::fromJson(readJsonFile(FLAGS_config));
    if (!loaded)
      throw folly::ProgramExit(1, loaded.error().message());
    config = std::move(*loaded);
    LOG(INFO) << "configuration loaded from " << osBasename(FLAGS_config);
  }

  folly::dynamic overrides = folly::dynamic::object;
  if (FLAGS_similarity_threshold != 0)
    overrides["similarity_threshold"] = FLAGS_similarity_threshold;
  if (FLAGS_lock_timeout_ms >= 0)
    overrides["lock_timeout_ms"] = FLAGS_lock_timeout_ms;

  if (!overrides.empty()) {
    folly::dynamic merged = config.toJson();
    merged.update(overrides);
    auto loaded = EngineConfig::fromJson(merged);
    if (!loaded)
      throw folly::ProgramExit(1, loaded.error().message());
    config = std::move(*loaded);
  }
  return config;
}

Workspace::Workspace()
  : config(loadEngineConfig())
  , store(config.lockTimeout)
  , cadence(store, config)
  , populations(store, cadence)
  , stages(store)
  , intake(store, populations, config)
{
  std::string text;
  if (!folly::readFile(FLAGS_db.c_str(), text)) {
    LOG(INFO) << osBasename(FLAGS_db) << " not found, starting with an empty pipeline";
    return;
  }

  auto loaded = store.loadJson(parseJsonFile(FLAGS_db, text));
  if (!loaded)
    throw folly::ProgramExit(1, osBasename(FLAGS_db).str() + ": " + loaded.error().message());
}

void Workspace::save() const {
  auto snapshot = store.toJson();
  if (!snapshot) {
    const PipelineError &err = snapshot.error();
    throw folly::ProgramExit(err.retryable() ? 75 : 1,
                             FLAGS_db + ": " + err.message());
  }
  std::string text = folly::toPrettyJson(*snapshot);
  text += '\n';
  try {
    folly::writeFileAtomic(FLAGS_db, text);
  } catch (const std::system_error &e) {
    throw folly::ProgramExit(2, FLAGS_db + ": " + e.what());
  }
  VLOG(1) << "snapshot written to " << FLAGS_db;
}
