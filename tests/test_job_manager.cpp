#include "test_common.h"
#include "fixtures.h"

#include "sheetrun/dep_isolator.h"
#include "sheetrun/events.h"
#include "sheetrun/job_dir.h"
#include "sheetrun/job_manager.h"
#include "sheetrun/job_store.h"

#include <filesystem>

using namespace sheetrun;
namespace fs = std::filesystem;

namespace {

const char* kBlockerScript = "sleep 2; printf 'email\\n' > \"$SHEETRUN_OUTPUT_PATH\"";

Job wait_for(JobManager& m, const JobId& id, int64_t timeout_ms, bool (*done)(const Job&)) {
    const int64_t deadline = now_ms() + timeout_ms;
    while (now_ms() < deadline) {
        auto j = m.get_status(id);
        if (j && done(*j)) return *j;
        sleep_ms(25);
    }
    auto j = m.get_status(id);
    die("job " + id + " did not reach the expected state, status=" +
        (j ? status_to_str(j->status) : "unknown"));
    return Job{};
}

Job wait_terminal(JobManager& m, const JobId& id, int64_t timeout_ms = 30000) {
    return wait_for(m, id, timeout_ms, [](const Job& j) { return is_terminal(j.status); });
}

Job wait_running(JobManager& m, const JobId& id) {
    return wait_for(m, id, 10000, [](const Job& j) { return j.status != JobStatus::Queued; });
}

SubmitResult submit(JobManager& m, const Settings& s, const std::string& build) {
    SubmitRequest req;
    req.document_ref = (s.root / "docs" / "contacts.csv").string();
    req.build_ref = build;
    return m.submit(req);
}

size_t job_dir_count(const Settings& s) {
    size_t n = 0;
    std::error_code ec;
    for (auto it = fs::directory_iterator(s.jobs_dir(), ec); !ec && it != fs::directory_iterator(); it.increment(ec)) n++;
    return n;
}

// Fresh root with the contacts document and every build the scenarios use.
Settings scenario(const std::string& name) {
    Settings s = test_settings(fs::temp_directory_path() / ("sheetrun_test_job_manager_" + name));
    write_file(s.root / "docs" / "contacts.csv", kContactsCsv);
    make_build(s.builds_root, "contacts", kContactsManifest);
    make_build(s.builds_root, "blocker", command_manifest(kBlockerScript));
    make_build(s.builds_root, "sleeper", command_manifest("sleep 60"));
    make_build(s.builds_root, "spinner", command_manifest("while :; do :; done"));
    make_build(s.builds_root, "with_deps", kContactsManifest, "phonenumbers==8.13.0\n");
    return s;
}

void test_success() {
    Settings s = scenario("success");
    JobManager m(s);
    std::string err = m.start();
    expect_true(err.empty(), "start: " + err);

    SubmitResult r = submit(m, s, "contacts");
    expect_true(r.ok && r.status == JobStatus::Queued, "submit accepted: " + r.error);
    expect_true(!m.get_artifact(r.job_id) || is_terminal(m.get_status(r.job_id)->status),
                "artifact only once terminal");

    Job j = wait_terminal(m, r.job_id);
    expect_true(j.status == JobStatus::Success, "contacts job succeeds: " + j.error_summary);
    expect_true(j.started_at_ms >= j.submitted_at_ms && j.finished_at_ms >= j.started_at_ms, "timestamps ordered");

    auto out = m.get_output(r.job_id);
    expect_true(out && out->rfind("name,email,raw_Favourite Colour\n", 0) == 0, "normalized output header");
    auto art = m.get_artifact(r.job_id);
    expect_true(art && art->find(kSecretCell) == std::string::npos, "artifact free of the secret cell");

    JobPaths p = job_paths(s.jobs_dir(), r.job_id);
    auto events = read_events(p.events());
    auto terms = terminal_events(events);
    expect_eq_ll((long long)terms.size(), 1, "one terminal event");
    expect_true(events.back().event == kEventJobSuccess, "terminal event is last");
    for (size_t i = 1; i < events.size(); i++) {
        expect_true(events[i].seq > events[i - 1].seq, "event seq increases across writers");
    }
    expect_true(events.front().event == "job.queued", "first event is job.queued");

    m.shutdown();
    SubmitResult late = submit(m, s, "contacts");
    expect_true(!late.ok && late.error_kind == ErrorKind::QueueFull, "no submissions after shutdown");
    std::cerr << "  success: ok\n";
}

void test_queue_full_and_fifo() {
    Settings s = scenario("queue_full");
    s.max_concurrency = 1;
    s.queue_capacity = 1;
    JobManager m(s);
    std::string err = m.start();
    expect_true(err.empty(), "start: " + err);

    SubmitResult a = submit(m, s, "blocker");
    expect_true(a.ok, "first accepted: " + a.error);
    wait_running(m, a.job_id);

    SubmitResult b = submit(m, s, "contacts");
    expect_true(b.ok, "second fills the queue: " + b.error);

    const size_t dirs = job_dir_count(s);
    SubmitResult c = submit(m, s, "contacts");
    expect_true(!c.ok, "third rejected");
    expect_true(c.error_kind == ErrorKind::QueueFull, "rejected with QueueFull");
    expect_true(c.job_id.empty(), "no id for rejected submission");
    expect_eq_ll((long long)job_dir_count(s), (long long)dirs, "rejected submission creates no directory");

    Job ja = wait_terminal(m, a.job_id);
    Job jb = wait_terminal(m, b.job_id);
    expect_true(ja.status == JobStatus::Success, "blocker succeeds: " + ja.error_summary);
    expect_true(jb.status == JobStatus::Success, "queued job succeeds: " + jb.error_summary);
    expect_true(jb.started_at_ms >= ja.finished_at_ms, "second starts only after the first is terminal");
    expect_true(ja.seq < jb.seq, "submission order");
    m.shutdown();
    std::cerr << "  queue_full_and_fifo: ok\n";
}

void test_timeout_and_resubmit() {
    Settings s = scenario("timeout");
    s.budget.wall_clock_timeout_ms = 1500;
    JobManager m(s);
    std::string err = m.start();
    expect_true(err.empty(), "start: " + err);

    const int64_t t0 = now_ms();
    SubmitResult r = submit(m, s, "sleeper");
    expect_true(r.ok, "sleeper accepted: " + r.error);
    Job j = wait_terminal(m, r.job_id);
    expect_true(j.status == JobStatus::TimedOut, "sleeper times out");
    expect_true(j.error_kind == ErrorKind::Timeout, "timeout kind");
    expect_true(now_ms() - t0 < 1500 + 8000, "timeout enforced within bound");
    auto terms = terminal_events(read_events(job_paths(s.jobs_dir(), r.job_id).events()));
    expect_true(terms.size() == 1 && terms[0] == kEventJobTimedOut, "job.timed_out event");

    SubmitResult again = m.resubmit(r.job_id);
    expect_true(again.ok, "resubmit timed-out job: " + again.error);
    expect_true(again.job_id != r.job_id, "resubmission gets a new id");
    auto nj = m.get_status(again.job_id);
    expect_true(nj && nj->attempt == 2 && nj->retry_of == r.job_id, "attempt and retry_of recorded");
    auto old = m.get_status(r.job_id);
    expect_true(old && old->status == JobStatus::TimedOut, "old job untouched");
    wait_terminal(m, again.job_id);

    SubmitResult unknown = m.resubmit("no-such-job");
    expect_true(!unknown.ok && unknown.error_kind == ErrorKind::InvalidSubmission, "unknown job not resubmitted");
    m.shutdown();
    std::cerr << "  timeout_and_resubmit: ok\n";
}

void test_forked_processes_die_with_job() {
    Settings s = scenario("forked");
    s.budget.wall_clock_timeout_ms = 1000;
    const fs::path marker = s.root / "late_marker";
    make_build(s.builds_root, "forker",
               command_manifest("/bin/sh -c 'sleep 5; touch \"" + marker.string() + "\"'; true"));
    JobManager m(s);
    std::string err = m.start();
    expect_true(err.empty(), "start: " + err);

    SubmitResult r = submit(m, s, "forker");
    expect_true(r.ok, "forker accepted: " + r.error);
    Job j = wait_terminal(m, r.job_id);
    expect_true(j.status == JobStatus::TimedOut, "forker times out");

    sleep_ms(6500);
    expect_true(!fs::exists(marker), "grandchild killed with the job");
    m.shutdown();
    std::cerr << "  forked_processes_die_with_job: ok\n";
}

void test_modified_input_fails() {
    Settings s = scenario("tamper");
    make_build(s.builds_root, "tamper",
               command_manifest("chmod u+w \"$SHEETRUN_INPUT_PATH\"; echo 'Eve,eve@example.org,red' >> \"$SHEETRUN_INPUT_PATH\"; "
                                "printf 'email\\n' > \"$SHEETRUN_OUTPUT_PATH\""));
    JobManager m(s);
    std::string err = m.start();
    expect_true(err.empty(), "start: " + err);

    SubmitResult r = submit(m, s, "tamper");
    expect_true(r.ok, "accepted: " + r.error);
    Job j = wait_terminal(m, r.job_id);
    expect_true(j.status == JobStatus::Error, "rewritten input is not a success");
    expect_true(j.error_kind == ErrorKind::UserCodeException, "user code blamed");
    expect_eq_str(j.error_summary, "incomplete results: input document modified", "summary");
    expect_true(!m.get_output(r.job_id), "no output served");
    m.shutdown();
    std::cerr << "  modified_input_fails: ok\n";
}

void test_cpu_limit() {
    Settings s = scenario("cpu");
    s.budget.cpu_seconds = 1;
    s.budget.wall_clock_timeout_ms = 30000;
    JobManager m(s);
    std::string err = m.start();
    expect_true(err.empty(), "start: " + err);

    const int64_t t0 = now_ms();
    SubmitResult r = submit(m, s, "spinner");
    expect_true(r.ok, "spinner accepted: " + r.error);
    Job j = wait_terminal(m, r.job_id);
    expect_true(j.status == JobStatus::Error, "spinner fails");
    expect_true(j.error_kind == ErrorKind::ResourceLimitExceeded, "resource limit kind: " + j.error_summary);
    expect_eq_str(j.error_summary, "resource limit exceeded: cpu", "cpu summary");
    expect_true(now_ms() - t0 < 15000, "cpu limit well before the wall clock");
    m.shutdown();
    std::cerr << "  cpu_limit: ok\n";
}

void test_offline_dependencies() {
    Settings s = scenario("deps");
    JobManager m(s);
    std::string err = m.start();
    expect_true(err.empty(), "start: " + err);

    SubmitResult r = submit(m, s, "with_deps");
    expect_true(r.ok, "accepted: " + r.error);
    Job j = wait_terminal(m, r.job_id);
    expect_true(j.status == JobStatus::Error, "offline deps fail");
    expect_true(j.error_kind == ErrorKind::DependencyInstallFailure, "dependency kind");
    expect_eq_str(j.error_summary, kDepsOfflineSummary, "offline summary");

    JobPaths p = job_paths(s.jobs_dir(), r.job_id);
    expect_true(!fs::exists(p.artifact()), "pipeline never ran");
    expect_true(!m.get_artifact(r.job_id), "no artifact to fetch");
    for (const auto& e : read_events(p.events())) {
        expect_true(e.source != "child" && e.event != "child.spawned", "no child events: " + e.event);
    }
    m.shutdown();
    std::cerr << "  offline_dependencies: ok\n";
}

void test_bad_submissions() {
    Settings s = scenario("bad");
    JobManager m(s);
    std::string err = m.start();
    expect_true(err.empty(), "start: " + err);

    SubmitRequest req;
    req.document_ref = (s.root / "docs" / "missing.csv").string();
    req.build_ref = "contacts";
    SubmitResult r = m.submit(req);
    expect_true(!r.ok && r.error_kind == ErrorKind::InvalidSubmission, "missing document rejected");

    req.document_ref = (s.root / "docs" / "contacts.csv").string();
    req.build_ref = "";
    r = m.submit(req);
    expect_true(!r.ok && r.error_kind == ErrorKind::InvalidSubmission, "empty build rejected");
    expect_eq_ll((long long)job_dir_count(s), 0, "nothing created for invalid submissions");

    r = submit(m, s, "does-not-exist");
    expect_true(r.ok, "unknown build is only found at launch");
    Job j = wait_terminal(m, r.job_id);
    expect_true(j.status == JobStatus::Error && j.error_kind == ErrorKind::LaunchFailure, "launch failure");

    SubmitResult ok = submit(m, s, "contacts");
    Job good = wait_terminal(m, ok.job_id);
    SubmitResult again = m.resubmit(good.id);
    expect_true(!again.ok && again.error_kind == ErrorKind::InvalidSubmission, "successful jobs are final");
    m.shutdown();
    std::cerr << "  bad_submissions: ok\n";
}

void test_recovery() {
    Settings s = scenario("recovery");
    const fs::path wal = s.state_dir() / "jobs.wal.jsonl";

    // State left behind by a supervisor that died mid-run.
    {
        JobStore store(wal);
        std::string err = store.open(false);
        expect_true(err.empty(), "seed store: " + err);

        Job running;
        running.id = "crashed";
        running.build_ref = "contacts";
        expect_true(store.insert(&running).empty(), "seed running");
        expect_true(store.mark_running("crashed", now_ms()).empty(), "mark running");
        std::error_code ec;
        fs::create_directories(job_paths(s.jobs_dir(), "crashed").logs_dir(), ec);

        Job queued;
        queued.id = "waiting";
        queued.build_ref = "contacts";
        err = prepare_job_dir(job_paths(s.jobs_dir(), "waiting"), s.root / "docs" / "contacts.csv");
        expect_true(err.empty(), "seed dir: " + err);
        expect_true(store.insert(&queued).empty(), "seed queued");

        Job orphan;
        orphan.id = "orphan";
        orphan.build_ref = "contacts";
        expect_true(store.insert(&orphan).empty(), "seed orphan");
    }

    JobManager m(s);
    std::string err = m.start();
    expect_true(err.empty(), "start: " + err);
    const RecoveryReport& rep = m.last_recovery();
    expect_eq_ll(rep.running_failed, 1, "running swept");
    expect_eq_ll(rep.requeued, 1, "queued re-enqueued");
    expect_eq_ll(rep.queued_failed, 1, "orphan failed");

    auto crashed = m.get_status("crashed");
    expect_true(crashed && crashed->status == JobStatus::Error, "crashed job is error");
    expect_true(crashed->error_kind == ErrorKind::SupervisorRestart, "supervisor restart kind");
    expect_eq_str(crashed->error_summary, "supervisor restarted", "restart summary");
    auto terms = terminal_events(read_events(job_paths(s.jobs_dir(), "crashed").events()));
    expect_true(terms.size() == 1 && terms[0] == kEventJobError, "restart recorded as job.error");

    auto orphan = m.get_status("orphan");
    expect_true(orphan && orphan->status == JobStatus::Error && orphan->error_kind == ErrorKind::InvalidSubmission,
                "orphan without directory fails");

    Job waiting = wait_terminal(m, "waiting");
    expect_true(waiting.status == JobStatus::Success, "recovered job runs: " + waiting.error_summary);
    m.shutdown();
    std::cerr << "  recovery: ok\n";
}

void test_adjust_concurrency() {
    Settings s = scenario("concurrency");
    s.max_concurrency = 1;
    s.queue_capacity = 4;
    JobManager m(s);
    std::string err = m.start();
    expect_true(err.empty(), "start: " + err);
    expect_eq_ll(m.concurrency(), 1, "initial workers");

    expect_true(!m.adjust_concurrency(0).empty(), "zero workers rejected");
    expect_true(m.adjust_concurrency(3).empty(), "grow");
    expect_eq_ll(m.concurrency(), 3, "grown to three");

    // Three blockers run side by side once there are three workers.
    std::vector<JobId> ids;
    for (int i = 0; i < 3; i++) {
        SubmitResult r = submit(m, s, "blocker");
        expect_true(r.ok, "blocker accepted: " + r.error);
        ids.push_back(r.job_id);
    }
    for (const auto& id : ids) wait_running(m, id);
    int running = 0;
    for (const auto& id : ids) running += m.get_status(id)->status == JobStatus::Running ? 1 : 0;
    expect_eq_ll(running, 3, "three jobs in flight");

    expect_true(m.adjust_concurrency(1).empty(), "shrink");
    expect_eq_ll(m.concurrency(), 1, "shrunk to one");
    for (const auto& id : ids) {
        Job j = wait_terminal(m, id);
        expect_true(j.status == JobStatus::Success, "in-flight job finishes after shrink: " + j.error_summary);
    }
    m.shutdown();
    std::cerr << "  adjust_concurrency: ok\n";
}

} // namespace

int main() {
    test_success();
    test_queue_full_and_fifo();
    test_timeout_and_resubmit();
    test_forked_processes_die_with_job();
    test_modified_input_fails();
    test_cpu_limit();
    test_offline_dependencies();
    test_bad_submissions();
    test_recovery();
    test_adjust_concurrency();

    std::cerr << "test_job_manager: ALL PASSED" << std::endl;
    return 0;
}
