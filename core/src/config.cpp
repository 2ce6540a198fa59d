#include "sheetrun/config.h"
#include "sheetrun/util.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace sheetrun {

Profile detect_profile() {
    const char* env = std::getenv("SHEETRUN_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    // overwrite=0: won't override existing env vars
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("SHEETRUN_WAL_FSYNC",        "0",      NO_OVERWRITE);
            setenv("SHEETRUN_NETGATE_SECCOMP",  "0",      NO_OVERWRITE);
            setenv("SHEETRUN_TIMEOUT_MS",       "300000", NO_OVERWRITE);
            setenv("SHEETRUN_CPU_SECONDS",      "120",    NO_OVERWRITE);
            setenv("SHEETRUN_MEMORY_MB",        "1024",   NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("SHEETRUN_WAL_FSYNC",        "1",      NO_OVERWRITE);
            setenv("SHEETRUN_NETGATE_SECCOMP",  "1",      NO_OVERWRITE);
            setenv("SHEETRUN_TIMEOUT_MS",       "120000", NO_OVERWRITE);
            setenv("SHEETRUN_CPU_SECONDS",      "60",     NO_OVERWRITE);
            setenv("SHEETRUN_MEMORY_MB",        "512",    NO_OVERWRITE);
            // Network: default deny, jobs must opt in explicitly
            setenv("SHEETRUN_NETWORK_DEFAULT",  "0",      NO_OVERWRITE);
            break;
    }
}

// Strict integer parse: unset -> default, set but malformed -> error.
static std::string read_int(const char* key, int64_t defv, int64_t lo, int64_t hi, int64_t* out) {
    const char* e = std::getenv(key);
    if (!e) {
        *out = defv;
        return "";
    }
    std::string s = e;
    size_t used = 0;
    int64_t v = 0;
    try {
        v = std::stoll(s, &used);
    } catch (const std::exception&) {
        return std::string(key) + ": not an integer: '" + s + "'";
    }
    if (used != s.size()) return std::string(key) + ": not an integer: '" + s + "'";
    if (v < lo || v > hi) {
        return std::string(key) + ": out of range [" + std::to_string(lo) + ", " + std::to_string(hi) + "]";
    }
    *out = v;
    return "";
}

// Strict boolean parse: unset -> default, anything but 1/0/true/false/yes/no/on/off -> error.
static std::string read_bool(const char* key, bool defv, bool* out) {
    const char* e = std::getenv(key);
    if (!e) {
        *out = defv;
        return "";
    }
    std::string s = e;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        *out = true;
        return "";
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        *out = false;
        return "";
    }
    return std::string(key) + ": not a boolean: '" + e + "'";
}

std::string load_settings(const std::filesystem::path& exe_dir, Settings* out) {
    if (!out) return "load_settings: null output";
    Settings s;
    std::error_code ec;

    s.root = getenv_str("SHEETRUN_ROOT", "");
    if (s.root.empty()) s.root = std::filesystem::current_path(ec);
    s.root = std::filesystem::absolute(s.root, ec);
    if (ec) return "SHEETRUN_ROOT: " + ec.message();

    s.builds_root = getenv_str("SHEETRUN_BUILDS_ROOT", (s.root / "builds").string());

    struct IntKey {
        const char* key;
        int64_t defv, lo, hi;
        int64_t value;
    };
    IntKey keys[] = {
        {"SHEETRUN_MAX_CONCURRENCY", 2,      1,    256,         0},
        {"SHEETRUN_QUEUE_CAPACITY",  16,     1,    1000000,     0},
        {"SHEETRUN_TIMEOUT_MS",      300000, 100,  86400000,    0},
        {"SHEETRUN_CPU_SECONDS",     120,    1,    86400,       0},
        {"SHEETRUN_MEMORY_MB",       1024,   16,   1048576,     0},
        {"SHEETRUN_OUTPUT_MB",       64,     1,    1048576,     0},
        {"SHEETRUN_MAX_OPEN_FILES",  256,    16,   1048576,     0},
        {"SHEETRUN_MAX_PROCESSES",   64,     0,    1048576,     0},
        {"SHEETRUN_SCAN_MS",         200,    20,   60000,       0},
    };
    for (auto& k : keys) {
        std::string err = read_int(k.key, k.defv, k.lo, k.hi, &k.value);
        if (!err.empty()) return err;
    }
    s.max_concurrency = (int)keys[0].value;
    s.queue_capacity = (int)keys[1].value;
    s.budget.wall_clock_timeout_ms = keys[2].value;
    s.budget.cpu_seconds = (int)keys[3].value;
    s.budget.memory_mb = (size_t)keys[4].value;
    s.budget.output_mb = (size_t)keys[5].value;
    s.budget.max_open_files = (int)keys[6].value;
    s.budget.max_processes = (int)keys[7].value;
    s.scan_ms = (int)keys[8].value;

    struct BoolKey {
        const char* key;
        bool* value;
    };
    BoolKey flags[] = {
        {"SHEETRUN_NETWORK_DEFAULT", &s.network_default},
        {"SHEETRUN_NETGATE_SECCOMP", &s.netgate_seccomp},
        {"SHEETRUN_WAL_FSYNC",       &s.wal_fsync},
    };
    for (auto& f : flags) {
        std::string err = read_bool(f.key, false, f.value);
        if (!err.empty()) return err;
    }
    s.offline_cache = getenv_str("SHEETRUN_OFFLINE_CACHE", "");

    s.runhost_bin = getenv_str("SHEETRUN_RUNHOST_BIN", (exe_dir / "sheetrun_runhost").string());
    s.netgate_lib = getenv_str("SHEETRUN_NETGATE_LIB", (exe_dir / "libsheetrun_netgate.so").string());

    if (!std::filesystem::exists(s.runhost_bin, ec)) {
        return "runhost binary not found: " + s.runhost_bin.string();
    }
    if (!std::filesystem::exists(s.netgate_lib, ec)) {
        return "network gate library not found: " + s.netgate_lib.string();
    }

    *out = std::move(s);
    return "";
}

} // namespace sheetrun
