#include "cmd_client.h"
#include "runner_utils.h"

#include "sheetrun/job_dir.h"
#include "sheetrun/job_store.h"
#include "sheetrun/json_util.h"
#include "sheetrun/util.h"

#include <algorithm>
#include <iostream>
#include <string>

using namespace sheetrun;

namespace {

// Drops `req` into the spool. With wait_ms > 0, polls for the result file
// written by `serve` and prints it; otherwise prints the spool file name.
int spool_and_wait(const SpoolRequest& req, int64_t wait_ms) {
    const auto root = resolve_data_root();
    ensure_spool_dirs(root);
    const std::string name = new_spool_name();
    std::string err = write_atomic_file(root / "spool" / name, spool_request_to_json(req) + "\n");
    if (!err.empty()) {
        std::cerr << "submit: " << err << "\n";
        return 1;
    }
    if (wait_ms <= 0) {
        std::cout << name << "\n";
        return 0;
    }

    const auto result = spool_result_path(root, name);
    const int64_t deadline = now_ms() + wait_ms;
    std::error_code ec;
    while (now_ms() < deadline) {
        if (std::filesystem::is_regular_file(result, ec)) {
            std::string body = slurp_file(result);
            std::cout << body;
            json_util::Doc d = json_util::parse(body);
            return json_util::obj_bool(d.root, "ok").value_or(false) ? 0 : 1;
        }
        sleep_ms(50);
    }
    std::cerr << "submit: no answer from serve within " << wait_ms << " ms (request " << name << ")\n";
    return 1;
}

int64_t parse_wait(const std::string& v) {
    try {
        return std::stoll(v);
    } catch (const std::exception&) {
        return -1;
    }
}

std::optional<Job> load_job(const JobId& id) {
    auto jobs = JobStore::load(wal_path(resolve_data_root()));
    auto it = jobs.find(id);
    if (it == jobs.end()) return std::nullopt;
    return it->second;
}

} // namespace

int cmd_submit(int argc, char** argv) {
    SpoolRequest req;
    int64_t wait_ms = 0;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--document" && i + 1 < argc) { req.submit.document_ref = argv[++i]; continue; }
        if (a == "--build" && i + 1 < argc) { req.submit.build_ref = argv[++i]; continue; }
        if (a == "--network") { req.submit.network_access = true; continue; }
        if (a == "--offline") { req.submit.network_access = false; continue; }
        if (a == "--wait-ms" && i + 1 < argc) { wait_ms = parse_wait(argv[++i]); continue; }
        req.submit.document_ref.clear();
        break;
    }
    if (req.submit.document_ref.empty() || req.submit.build_ref.empty() || wait_ms < 0) {
        std::cerr << "usage: sheetrun_cli submit --document PATH --build REF [--network|--offline] [--wait-ms N]\n";
        return 2;
    }
    // serve resolves paths from its own cwd
    std::error_code ec;
    req.submit.document_ref = std::filesystem::absolute(req.submit.document_ref, ec).string();
    return spool_and_wait(req, wait_ms);
}

int cmd_resubmit(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: sheetrun_cli resubmit <job_id> [--wait-ms N]\n";
        return 2;
    }
    SpoolRequest req;
    req.resubmit_of = argv[2];
    int64_t wait_ms = 0;
    if (argc >= 5 && std::string(argv[3]) == "--wait-ms") wait_ms = parse_wait(argv[4]);
    if (wait_ms < 0) {
        std::cerr << "resubmit: bad --wait-ms\n";
        return 2;
    }
    return spool_and_wait(req, wait_ms);
}

int cmd_status(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: sheetrun_cli status <job_id>\n";
        return 2;
    }
    auto j = load_job(argv[2]);
    if (!j) {
        std::cerr << "status: unknown job " << argv[2] << "\n";
        return 1;
    }
    std::cout << job_to_json(*j) << "\n";
    return 0;
}

int cmd_list(int argc, char** argv) {
    std::optional<JobStatus> filter;
    if (argc >= 3) {
        filter = status_from_str(argv[2]);
        if (!filter) {
            std::cerr << "list: unknown status " << argv[2] << "\n";
            return 2;
        }
    }
    auto jobs = JobStore::load(wal_path(resolve_data_root()));
    std::vector<Job> v;
    for (const auto& [id, j] : jobs) {
        if (!filter || j.status == *filter) v.push_back(j);
    }
    std::sort(v.begin(), v.end(), [](const Job& a, const Job& b) { return a.seq < b.seq; });
    for (const auto& j : v) {
        std::cout << j.id << "\t" << status_to_str(j.status);
        if (!j.error_summary.empty()) std::cout << "\t" << j.error_summary;
        std::cout << "\n";
    }
    return 0;
}

int cmd_artifact(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: sheetrun_cli artifact <job_id>\n";
        return 2;
    }
    auto j = load_job(argv[2]);
    if (!j) {
        std::cerr << "artifact: unknown job " << argv[2] << "\n";
        return 1;
    }
    if (!is_terminal(j->status)) {
        std::cerr << "artifact: job is " << status_to_str(j->status) << "\n";
        return 1;
    }
    JobPaths p = job_paths(resolve_data_root() / "jobs", j->id);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(p.artifact(), ec)) {
        std::cerr << "artifact: none recorded for " << j->id << "\n";
        return 1;
    }
    std::cout << slurp_file(p.artifact());
    return 0;
}

int cmd_output(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: sheetrun_cli output <job_id>\n";
        return 2;
    }
    auto j = load_job(argv[2]);
    if (!j) {
        std::cerr << "output: unknown job " << argv[2] << "\n";
        return 1;
    }
    if (j->status != JobStatus::Success) {
        std::cerr << "output: job is " << status_to_str(j->status) << "\n";
        return 1;
    }
    JobPaths p = job_paths(resolve_data_root() / "jobs", j->id);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(p.output_file(), ec)) {
        std::cerr << "output: missing for " << j->id << "\n";
        return 1;
    }
    std::cout << slurp_file(p.output_file());
    return 0;
}
