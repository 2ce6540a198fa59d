#pragma once

#include "sheetrun/resource_limits.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>

namespace sheetrun {

// Everything the forked child needs. `env` is the complete environment of the
// child (KEY=VALUE); nothing is inherited from the supervisor.
struct SpawnSpec {
    std::vector<std::string> argv;      // argv[0] is an absolute path
    std::vector<std::string> env;
    std::filesystem::path cwd;
    std::filesystem::path log_path;     // stdout+stderr, opened O_APPEND
    ResourceBudget budget;
    bool socket_filter{false};          // seccomp network filter
    // false: the child stays in the caller's process group, so a group kill
    // aimed at the caller also reaches everything the child forks
    bool new_process_group{true};
};

struct WaitResult {
    bool timed_out{false};
    int raw_status{0};                  // waitpid() status
    int exit_code{-1};                  // -1 when killed by a signal
    int term_signal{0};
    int64_t cpu_ms{0};                  // user + system time of the child
    int64_t max_rss_kb{0};              // peak resident set of the child and its reaped children
    int64_t wall_ms{0};
};

// One spawned child and, when it leads one, its process group.
//
// wait() reaps the child; if the destructor runs while the child is still
// alive, the child (and its group) is killed and reaped so no job outlives
// its handle.
class ChildHandle {
public:
    ChildHandle(pid_t pid, int64_t started_ms, bool own_group = true);
    ~ChildHandle();

    ChildHandle(const ChildHandle&) = delete;
    ChildHandle& operator=(const ChildHandle&) = delete;

    pid_t pid() const { return pid_; }
    bool reaped() const { return reaped_; }

    // Blocks until the child exits or `timeout_ms` elapses (<= 0: no limit).
    // On timeout the process group is killed and reaped; timed_out is set.
    WaitResult wait(int64_t timeout_ms);

    // SIGKILL to the process group (or the child alone outside its own group).
    void kill();

private:
    pid_t pid_;
    int64_t started_ms_;
    bool own_group_;
    bool reaped_{false};
};

// Forks and execs spec.argv under the budget. Returns empty string on success.
// A failure in the child before execve (chdir, limits, filter, execve itself)
// is reported through a close-on-exec status pipe and returned here; the
// failed child is already reaped.
std::string spawn_child(const SpawnSpec& spec, std::unique_ptr<ChildHandle>* out);

} // namespace sheetrun
