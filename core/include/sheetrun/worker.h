#pragma once
#include "sheetrun/config.h"
#include "sheetrun/job_store.h"
#include "sheetrun/proc.h"
#include "sheetrun/sandbox.h"
#include "sheetrun/types.h"

#include <string>

namespace sheetrun {

// Maps a reaped child to a terminal outcome. `artifact_path` supplies the
// failing stage and code for user-code failures.
Outcome classify_child_exit(const WaitResult& w, const ResourceBudget& b,
                            const std::filesystem::path& artifact_path);

// Drives one dequeued job to a terminal state:
// Queued -> Running, launch, wait under the wall-clock timeout, classify,
// verify the directory on success, write the terminal status and then the
// single terminal event. `tag` prefixes diagnostics ("[worker 3]").
Outcome run_job(const Settings& s, JobStore& store, SandboxLauncher& launcher,
                const JobId& id, const std::string& tag);

} // namespace sheetrun
