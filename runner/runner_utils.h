#pragma once

#include "sheetrun/job_manager.h"
#include "sheetrun/types.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sheetrun {

// ---- Helpers shared by the CLI subcommands ----

// Directory of the running executable; the runhost and the preload library
// are looked up next to it.
std::filesystem::path resolve_exe_dir(const char* argv0);

// SHEETRUN_ROOT, or the current directory. Client commands use this without
// loading the full Settings.
std::filesystem::path resolve_data_root();

std::filesystem::path wal_path(const std::filesystem::path& root);

// spool/, spool/processed, spool/rejected, control/
void ensure_spool_dirs(const std::filesystem::path& root);

// *.json directly under `dir`, ordered by file name (names start with the
// submission time, so this is arrival order).
std::vector<std::filesystem::path> list_spool_json(const std::filesystem::path& dir);

// One spool file: either a new submission or a resubmission of a failed job.
struct SpoolRequest {
    SubmitRequest submit;
    JobId resubmit_of;     // non-empty: resubmit, `submit` unused
};

// Returns empty string on success.
std::string parse_spool_request(const std::string& json, SpoolRequest* out);
std::string spool_request_to_json(const SpoolRequest& r);

std::string submit_result_to_json(const SubmitResult& r);

// Name for a new spool file: "<ms>-<8 hex>.json".
std::string new_spool_name();

// Result file written by `serve` next to a consumed request.
std::filesystem::path spool_result_path(const std::filesystem::path& root, const std::string& spool_name);

// control/concurrency: a single decimal integer. nullopt when the file is
// absent; an error string when it is present but invalid.
std::optional<int> read_concurrency_control(const std::filesystem::path& path, std::string* err);

} // namespace sheetrun
