#include "sheetrun/proc.h"
#include "sheetrun/netgate.h"
#include "sheetrun/util.h"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace sheetrun {

namespace {

// Written to the status pipe by the child when setup fails before execve.
struct ChildFailure {
    char stage[48];
    int err;
};

void report_and_exit(int fd, const char* stage, int err) noexcept {
    ChildFailure f{};
    size_t n = std::strlen(stage);
    if (n >= sizeof(f.stage)) n = sizeof(f.stage) - 1;
    std::memcpy(f.stage, stage, n);
    f.err = err;
    ssize_t w;
    do {
        w = ::write(fd, &f, sizeof(f));
    } while (w < 0 && errno == EINTR);
    _exit(127);
}

int64_t rusage_ms(const struct rusage& ru) {
    return (int64_t)ru.ru_utime.tv_sec * 1000 + ru.ru_utime.tv_usec / 1000 +
           (int64_t)ru.ru_stime.tv_sec * 1000 + ru.ru_stime.tv_usec / 1000;
}

} // namespace

ChildHandle::ChildHandle(pid_t pid, int64_t started_ms, bool own_group)
    : pid_(pid), started_ms_(started_ms), own_group_(own_group) {}

ChildHandle::~ChildHandle() {
    if (!reaped_ && pid_ > 0) {
        kill();
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    }
}

void ChildHandle::kill() {
    if (pid_ <= 0) return;
    // process group first, then the direct pid in case setpgid lost a race
    if (own_group_) (void)::kill(-pid_, SIGKILL);
    if (!reaped_) (void)::kill(pid_, SIGKILL);
}

WaitResult ChildHandle::wait(int64_t timeout_ms) {
    WaitResult r;
    if (reaped_) return r;

    const int64_t deadline = timeout_ms > 0 ? started_ms_ + timeout_ms : 0;
    int status = 0;
    struct rusage ru{};

    while (true) {
        pid_t w = ::wait4(pid_, &status, WNOHANG, &ru);
        if (w == pid_) break;
        if (w < 0 && errno != EINTR) {
            // ECHILD: nothing left to wait for
            reaped_ = true;
            r.raw_status = 0;
            r.exit_code = -1;
            r.wall_ms = now_ms() - started_ms_;
            return r;
        }
        if (deadline > 0 && now_ms() >= deadline) {
            r.timed_out = true;
            kill();
            while (::wait4(pid_, &status, 0, &ru) < 0 && errno == EINTR) {}
            break;
        }
        sleep_ms(20);
    }

    reaped_ = true;
    // stragglers the child left in its group (ESRCH when none)
    if (own_group_) (void)::kill(-pid_, SIGKILL);

    r.raw_status = status;
    if (WIFEXITED(status)) r.exit_code = WEXITSTATUS(status);
    if (WIFSIGNALED(status)) r.term_signal = WTERMSIG(status);
    r.cpu_ms = rusage_ms(ru);
    r.max_rss_kb = ru.ru_maxrss;
    r.wall_ms = now_ms() - started_ms_;
    return r;
}

std::string spawn_child(const SpawnSpec& spec, std::unique_ptr<ChildHandle>* out) {
    if (!out) return "spawn_child: null output";
    if (spec.argv.empty() || spec.argv[0].empty()) return "empty argv";

    // Everything the child touches is prepared here; after fork() only
    // async-signal-safe calls are made.
    std::vector<char*> cargv;
    cargv.reserve(spec.argv.size() + 1);
    for (const auto& s : spec.argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    std::vector<char*> cenv;
    cenv.reserve(spec.env.size() + 1);
    for (const auto& s : spec.env) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);

    const std::string cwd = spec.cwd.string();
    const ResourceBudget budget = spec.budget;
    const bool socket_filter = spec.socket_filter;
    const bool new_group = spec.new_process_group;

    int log_fd = ::open(spec.log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
    if (log_fd < 0) return "open " + spec.log_path.string() + ": " + std::strerror(errno);

    int null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (null_fd < 0) {
        std::string err = std::string("open /dev/null: ") + std::strerror(errno);
        ::close(log_fd);
        return err;
    }

    int status_pipe[2];
    if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
        std::string err = std::string("pipe2: ") + std::strerror(errno);
        ::close(log_fd);
        ::close(null_fd);
        return err;
    }

    const pid_t parent = ::getpid();
    pid_t pid = ::fork();
    if (pid < 0) {
        std::string err = std::string("fork: ") + std::strerror(errno);
        ::close(log_fd);
        ::close(null_fd);
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        return err;
    }

    if (pid == 0) {
        const int sfd = status_pipe[1];

        // own process group so a timeout can kill the whole subtree
        if (new_group) (void)::setpgid(0, 0);

#ifdef __linux__
        (void)::prctl(PR_SET_PDEATHSIG, SIGKILL);
        if (::getppid() != parent) _exit(127);
#endif

        if (::dup2(null_fd, STDIN_FILENO) < 0) report_and_exit(sfd, "dup2 stdin", errno);
        if (::dup2(log_fd, STDOUT_FILENO) < 0) report_and_exit(sfd, "dup2 stdout", errno);
        if (::dup2(log_fd, STDERR_FILENO) < 0) report_and_exit(sfd, "dup2 stderr", errno);

        // close inherited fds beyond stdio, keeping the status pipe
        long maxfd = ::sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) {
            if (fd != sfd) (void)::close(fd);
        }

        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) report_and_exit(sfd, "chdir", errno);

        (void)::umask(077);

        char lim_err[48] = {0};
        if (apply_resource_limits(budget, lim_err, sizeof(lim_err)) != 0) {
            report_and_exit(sfd, lim_err, errno);
        }

        if (socket_filter && install_socket_filter() != 0) {
            report_and_exit(sfd, "seccomp", errno);
        }

        ::execve(cargv[0], cargv.data(), cenv.data());
        report_and_exit(sfd, "execve", errno);
    }

    // parent
    if (new_group) (void)::setpgid(pid, pid);
    ::close(status_pipe[1]);
    ::close(log_fd);
    ::close(null_fd);

    const int64_t started = now_ms();

    ChildFailure f{};
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &f, sizeof(f));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n > 0) {
        int st = 0;
        while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        f.stage[sizeof(f.stage) - 1] = '\0';
        return std::string(f.stage) + ": " + std::strerror(f.err);
    }

    *out = std::make_unique<ChildHandle>(pid, started, new_group);
    return "";
}

} // namespace sheetrun
