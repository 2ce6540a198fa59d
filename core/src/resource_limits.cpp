#include "sheetrun/resource_limits.h"

#include <csignal>
#include <cstring>

#include <sys/wait.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace sheetrun {

static int set_hard_limit(int resource, rlim_t soft, rlim_t hard) noexcept {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    return setrlimit(resource, &rl);
}

static void copy_err(char* err, size_t err_len, const char* msg) noexcept {
    if (!err || err_len == 0) return;
    size_t n = std::strlen(msg);
    if (n >= err_len) n = err_len - 1;
    std::memcpy(err, msg, n);
    err[n] = '\0';
}

int apply_resource_limits(const ResourceBudget& b, char* err, size_t err_len) noexcept {
#ifdef __linux__
    if (b.no_new_privs && prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        copy_err(err, err_len, "no_new_privs");
        return -1;
    }
#endif
    if (b.cpu_seconds > 0) {
        // SIGXCPU at the soft limit, SIGKILL one second later.
        if (set_hard_limit(RLIMIT_CPU, (rlim_t)b.cpu_seconds, (rlim_t)b.cpu_seconds + 1) != 0) {
            copy_err(err, err_len, "RLIMIT_CPU");
            return -1;
        }
    }
    if (b.memory_mb > 0) {
        rlim_t bytes = (rlim_t)b.memory_mb * 1024ULL * 1024ULL;
        if (set_hard_limit(RLIMIT_AS, bytes, bytes) != 0) {
            copy_err(err, err_len, "RLIMIT_AS");
            return -1;
        }
    }
    if (b.output_mb > 0) {
        rlim_t bytes = (rlim_t)b.output_mb * 1024ULL * 1024ULL;
        if (set_hard_limit(RLIMIT_FSIZE, bytes, bytes) != 0) {
            copy_err(err, err_len, "RLIMIT_FSIZE");
            return -1;
        }
    }
    if (b.max_open_files > 0) {
        if (set_hard_limit(RLIMIT_NOFILE, (rlim_t)b.max_open_files, (rlim_t)b.max_open_files) != 0) {
            copy_err(err, err_len, "RLIMIT_NOFILE");
            return -1;
        }
    }
#ifdef RLIMIT_NPROC
    if (b.max_processes > 0) {
        // Per-uid on Linux; a failure here is not fatal for the sandbox.
        (void)set_hard_limit(RLIMIT_NPROC, (rlim_t)b.max_processes, (rlim_t)b.max_processes);
    }
#endif
    if (set_hard_limit(RLIMIT_CORE, 0, 0) != 0) {
        copy_err(err, err_len, "RLIMIT_CORE");
        return -1;
    }
    return 0;
}

const char* limit_hit_name(LimitHit h) {
    switch (h) {
        case LimitHit::None:   return "none";
        case LimitHit::Cpu:    return "cpu";
        case LimitHit::Memory: return "memory";
        case LimitHit::Output: return "output";
    }
    return "none";
}

static LimitHit classify_signal(int sig, int64_t cpu_used_ms, int64_t max_rss_kb, const ResourceBudget& b) {
    if (sig == SIGXCPU) return LimitHit::Cpu;
    if (sig == SIGXFSZ) return LimitHit::Output;
    if (sig == SIGKILL && b.cpu_seconds > 0 && cpu_used_ms >= (int64_t)b.cpu_seconds * 1000) {
        return LimitHit::Cpu;
    }
    // Allocation failures under RLIMIT_AS surface as aborts or segfaults in
    // runtimes that do not check malloc results; only near the budget.
    if ((sig == SIGSEGV || sig == SIGABRT || sig == SIGBUS) && b.memory_mb > 0 &&
        (double)max_rss_kb >= (double)b.memory_mb * 1024.0 * kMemoryCrashFraction) {
        return LimitHit::Memory;
    }
    return LimitHit::None;
}

LimitHit classify_termination(int raw_status, int64_t cpu_used_ms, int64_t max_rss_kb,
                              const ResourceBudget& b) {
    if (WIFSIGNALED(raw_status)) {
        return classify_signal(WTERMSIG(raw_status), cpu_used_ms, max_rss_kb, b);
    }
    if (WIFEXITED(raw_status)) {
        int code = WEXITSTATUS(raw_status);
        if (code == kExitOutOfMemory) return LimitHit::Memory;
        // The runhost mirrors a signal-killed pipeline subprocess as 128+sig.
        if (code > 128 && code < 128 + 65) {
            return classify_signal(code - 128, cpu_used_ms, max_rss_kb, b);
        }
    }
    return LimitHit::None;
}

} // namespace sheetrun
