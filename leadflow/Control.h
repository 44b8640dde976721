#ifndef LEADFLOW_CONTROL_H
#define LEADFLOW_CONTROL_H

#include "Cadence.h"
#include "Config.h"
#include "Intake.h"
#include "MemoryStore.h"
#include "Populations.h"
#include "Stages.h"

/**
 * Engines wired over the snapshot named by --db, configured from
 * --config and flag overrides. Constructing one throws folly::ProgramExit
 * when either file is unusable.
 */
class Workspace {
 public:
  Workspace();

  /** Write the snapshot back to --db atomically. */
  void save() const;

  const EngineConfig config;
  MemoryStore store;
  CadenceEngine cadence;
  PopulationMachine populations;
  StageMachine stages;
  IntakeFunnel intake;
};

/** --config file with flag overrides applied. */
EngineConfig loadEngineConfig();

#endif // LEADFLOW_CONTROL_H
