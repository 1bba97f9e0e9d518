#pragma once
#include "artifact_store.hpp"
#include "cli_config.hpp"

namespace avf {

// Scores every row of cfg.batch_path and writes the report to cfg.out_path.
// A bad row fails alone and is written with status error:<kind>.
// Returns 0 when every row scored, 2 when any row failed, and 1 when the batch
// could not run (unreadable or empty patient file, bad header, report not writable).
int runBatch(const CliConfig& cfg, const ArtifactStore& store);

} // namespace avf
