#include "cmd_serve.h"
#include "runner_utils.h"

#include "sheetrun/config.h"
#include "sheetrun/job_manager.h"
#include "sheetrun/util.h"

#include <csignal>
#include <iostream>
#include <string>

using namespace sheetrun;

namespace {

volatile std::sig_atomic_t g_stop = 0;

void on_stop_signal(int) {
    g_stop = 1;
}

void install_signal_handlers() {
    struct sigaction sa{};
    sa.sa_handler = on_stop_signal;
    sigemptyset(&sa.sa_mask);
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);
    // A client closing a pipe must not take the supervisor down.
    ::signal(SIGPIPE, SIG_IGN);
}

// Consumes one spool file: submits it and moves it to processed/ (or
// rejected/ when it does not parse). The result lands in processed/ either way.
void consume_spool_file(JobManager& mgr, const std::filesystem::path& root, const std::filesystem::path& f) {
    const std::string name = f.filename().string();
    SpoolRequest req;
    SubmitResult res;
    std::filesystem::path dest_dir = root / "spool" / "processed";

    std::string err = parse_spool_request(slurp_file(f), &req);
    if (!err.empty()) {
        res.error_kind = ErrorKind::InvalidSubmission;
        res.error = err;
        dest_dir = root / "spool" / "rejected";
    } else if (!req.resubmit_of.empty()) {
        res = mgr.resubmit(req.resubmit_of);
    } else {
        res = mgr.submit(req.submit);
    }

    if (res.ok) {
        std::cerr << "[serve] " << name << " -> " << res.job_id << "\n";
    } else {
        std::cerr << "[serve] " << name << " rejected: " << error_kind_to_str(res.error_kind)
                  << ": " << res.error << "\n";
    }

    std::error_code ec;
    std::filesystem::rename(f, dest_dir / name, ec);
    if (ec) {
        // Never pick the same file up twice.
        std::filesystem::remove(f, ec);
    }
    std::string werr = write_atomic_file(spool_result_path(root, name), submit_result_to_json(res) + "\n");
    if (!werr.empty()) std::cerr << "[serve] result for " << name << ": " << werr << "\n";
}

} // namespace

int cmd_serve(int argc, char** argv) {
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--root" && i + 1 < argc) {
            ::setenv("SHEETRUN_ROOT", argv[++i], 1);
            continue;
        }
        if (a == "--workers" && i + 1 < argc) {
            ::setenv("SHEETRUN_MAX_CONCURRENCY", argv[++i], 1);
            continue;
        }
        std::cerr << "usage: sheetrun_cli serve [--root DIR] [--workers N]\n";
        return 2;
    }

    Profile profile = detect_profile();
    apply_profile_defaults(profile);

    Settings s;
    std::string err = load_settings(resolve_exe_dir(argv[0]), &s);
    if (!err.empty()) {
        std::cerr << "[serve] configuration error: " << err << "\n";
        return 2;
    }
    ensure_spool_dirs(s.root);
    install_signal_handlers();

    const std::filesystem::path root = s.root;
    const std::filesystem::path spool = s.spool_dir();
    const std::filesystem::path control = s.control_dir() / "concurrency";
    const int scan_ms = s.scan_ms;

    std::cerr << "[serve] profile=" << profile_name(profile) << " root=" << root.string()
              << " builds=" << s.builds_root.string() << "\n";

    JobManager mgr(std::move(s));
    err = mgr.start();
    if (!err.empty()) {
        std::cerr << "[serve] start failed: " << err << "\n";
        return 2;
    }

    std::string last_control_err;
    while (!g_stop) {
        for (const auto& f : list_spool_json(spool)) {
            if (g_stop) break;
            consume_spool_file(mgr, root, f);
        }

        std::string cerr_msg;
        auto want = read_concurrency_control(control, &cerr_msg);
        if (!cerr_msg.empty() && cerr_msg != last_control_err) {
            std::cerr << "[serve] " << cerr_msg << "\n";
        }
        last_control_err = cerr_msg;
        if (want && *want != mgr.concurrency()) {
            std::string aerr = mgr.adjust_concurrency(*want);
            if (!aerr.empty()) std::cerr << "[serve] adjust concurrency: " << aerr << "\n";
        }

        sleep_ms(scan_ms);
    }

    std::cerr << "[serve] stopping: waiting for running jobs, " << mgr.queue_depth() << " stay queued\n";
    mgr.shutdown();
    std::cerr << "[serve] stopped\n";
    return 0;
}
