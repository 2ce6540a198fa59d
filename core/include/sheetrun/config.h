#pragma once
#include "sheetrun/resource_limits.h"

#include <filesystem>
#include <string>

namespace sheetrun {

enum class Profile { DEV, PROD };

// Detect profile from SHEETRUN_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: generous budgets, no fsync, no seccomp network filter
// PROD: tight budgets, fsync on, seccomp network filter on
void apply_profile_defaults(Profile p);

// Process-wide settings. Loaded once at startup and passed by reference;
// nothing reads the environment after load_settings().
struct Settings {
    std::filesystem::path root;
    std::filesystem::path builds_root;

    int max_concurrency{2};
    int queue_capacity{16};

    ResourceBudget budget;

    bool network_default{false};
    bool netgate_seccomp{false};
    std::filesystem::path offline_cache;

    std::filesystem::path runhost_bin;
    std::filesystem::path netgate_lib;

    bool wal_fsync{false};
    int scan_ms{200};

    std::filesystem::path jobs_dir() const { return root / "jobs"; }
    std::filesystem::path state_dir() const { return root / "state"; }
    std::filesystem::path spool_dir() const { return root / "spool"; }
    std::filesystem::path control_dir() const { return root / "control"; }
};

// Reads SHEETRUN_* variables into *out. `exe_dir` locates the runhost binary
// and the network gate library when they are not configured explicitly.
// Returns empty string on success, otherwise a configuration error; callers
// treat a configuration error as fatal.
std::string load_settings(const std::filesystem::path& exe_dir, Settings* out);

} // namespace sheetrun
