#pragma once

#include <cstdint>
#include <string>

#include <sys/resource.h>

namespace sheetrun {

// Per-launch ceilings. Sourced from Settings, never stored per job.
struct ResourceBudget {
    int cpu_seconds{120};           // RLIMIT_CPU soft; hard is one second above
    size_t memory_mb{1024};         // RLIMIT_AS
    size_t output_mb{64};           // RLIMIT_FSIZE, bounds every file the child writes
    int max_open_files{256};        // RLIMIT_NOFILE
    int max_processes{64};          // RLIMIT_NPROC (best-effort, per uid)
    int64_t wall_clock_timeout_ms{300000};

    bool no_new_privs{true};
};

// Lowers soft and hard limits of the calling process. Meant for the forked
// child between fork() and execve(): it only uses async-signal-safe calls and
// writes the failing resource name into `err` (a caller-provided buffer).
// Returns 0 on success, -1 on the first setrlimit failure.
int apply_resource_limits(const ResourceBudget& b, char* err, size_t err_len) noexcept;

// What killed the child, derived from its wait status and rusage.
enum class LimitHit {
    None,
    Cpu,
    Memory,
    Output,
};

const char* limit_hit_name(LimitHit h);

// Exit code the runhost uses when it catches an allocation failure.
constexpr int kExitOutOfMemory = 3;
// Exit code the runhost uses when the pipeline (user code) failed.
constexpr int kExitPipelineFailed = 2;
// Exit code the runhost uses for its own setup failures.
constexpr int kExitRunhostError = 4;

// Peak RSS, as a fraction of the memory budget, at which a crash counts as an
// allocation failure rather than a bug in user code.
constexpr double kMemoryCrashFraction = 0.75;

// Classify a terminated child. `raw_status` is the waitpid() status,
// `cpu_used_ms` the child's user+system time, `max_rss_kb` its peak RSS.
LimitHit classify_termination(int raw_status, int64_t cpu_used_ms, int64_t max_rss_kb,
                              const ResourceBudget& b);

} // namespace sheetrun
