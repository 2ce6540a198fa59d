#include "sheetrun/job_manager.h"
#include "sheetrun/events.h"
#include "sheetrun/job_dir.h"
#include "sheetrun/util.h"
#include "sheetrun/worker.h"

#include <algorithm>
#include <iostream>

namespace sheetrun {

JobManager::JobManager(Settings s)
    : s_(std::move(s)),
      store_(s_.state_dir() / "jobs.wal.jsonl"),
      launcher_(s_),
      queue_((size_t)s_.queue_capacity) {}

JobManager::~JobManager() {
    shutdown();
}

std::string JobManager::start() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (started_) return "already started";
    }

    std::error_code ec;
    std::filesystem::create_directories(s_.jobs_dir(), ec);
    if (ec) return "create " + s_.jobs_dir().string() + ": " + ec.message();

    std::string err = store_.open(s_.wal_fsync);
    if (!err.empty()) return err;

    recovery_ = recover();

    std::lock_guard<std::mutex> lk(mu_);
    started_ = true;
    accepting_ = true;
    for (int i = 0; i < s_.max_concurrency; i++) spawn_worker_locked();
    std::cerr << "[serve] workers=" << s_.max_concurrency << " queue_capacity=" << s_.queue_capacity
              << " recovered: failed=" << recovery_.running_failed << " requeued=" << recovery_.requeued << "\n";
    return "";
}

RecoveryReport JobManager::recover() {
    RecoveryReport rep;

    for (const auto& j : store_.list(JobStatus::Running)) {
        Outcome o{JobStatus::Error, ErrorKind::SupervisorRestart, "supervisor restarted"};
        std::string err = store_.finish(j.id, o, now_ms());
        if (!err.empty()) {
            std::cerr << "[recover] " << j.id << ": " << err << "\n";
            continue;
        }
        rep.running_failed++;
        JobPaths p = job_paths(s_.jobs_dir(), j.id);
        std::error_code ec;
        if (std::filesystem::is_directory(p.logs_dir(), ec)) {
            EventLog ev(p.events(), j.id, EventSource::Supervisor);
            std::string eerr = ev.append(kEventJobError, status_to_str(JobStatus::Error),
                                         std::string(error_kind_to_str(o.kind)) + ": " + o.summary);
            if (!eerr.empty()) std::cerr << "[recover] events " << j.id << ": " << eerr << "\n";
        }
        std::cerr << "[recover] " << j.id << " running -> error (supervisor restarted)\n";
    }

    // list() is ordered by seq, so the original submission order survives.
    for (const auto& j : store_.list(JobStatus::Queued)) {
        JobPaths p = job_paths(s_.jobs_dir(), j.id);
        if (!find_input(p)) {
            Outcome o{JobStatus::Error, ErrorKind::InvalidSubmission, "job directory missing"};
            std::string err = store_.finish(j.id, o, now_ms());
            if (err.empty()) rep.queued_failed++;
            std::cerr << "[recover] " << j.id << " queued -> error (job directory missing)\n";
            continue;
        }
        std::lock_guard<std::mutex> lk(mu_);
        queue_.push_unbounded(j.id);
        rep.requeued++;
    }
    return rep;
}

void JobManager::spawn_worker_locked() {
    auto slot = std::make_unique<WorkerSlot>();
    slot->id = next_worker_id_++;
    WorkerSlot* raw = slot.get();
    slot->th = std::thread([this, raw]() { worker_loop(raw); });
    workers_.push_back(std::move(slot));
}

void JobManager::reap_exited(std::vector<std::thread>* out) {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if ((*it)->exited) {
            out->push_back(std::move((*it)->th));
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void JobManager::worker_loop(WorkerSlot* slot) {
    const std::string tag = "[worker " + std::to_string(slot->id) + "]";
    while (true) {
        JobId id;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [&]() { return stopping_ || slot->retiring || !queue_.empty(); });
            if (stopping_ || slot->retiring) {
                slot->exited = true;
                return;
            }
            BoundedFifo<JobId>::Entry e;
            if (!queue_.pop(e)) continue;
            id = std::move(e.value);
        }
        run_job(s_, store_, launcher_, id, tag);
    }
}

SubmitResult JobManager::submit(const SubmitRequest& req) {
    return submit_job(req.document_ref, req.build_ref,
                      req.network_access.value_or(s_.network_default), 1, "");
}

SubmitResult JobManager::resubmit(const JobId& id) {
    SubmitResult r;
    auto old = store_.get(id);
    if (!old) {
        r.error_kind = ErrorKind::InvalidSubmission;
        r.error = "unknown job " + id;
        return r;
    }
    if (!is_terminal(old->status) || old->status == JobStatus::Success) {
        r.error_kind = ErrorKind::InvalidSubmission;
        r.error = std::string("job is ") + status_to_str(old->status) + ", only failed jobs can be resubmitted";
        return r;
    }
    auto input = find_input(job_paths(s_.jobs_dir(), id));
    if (!input) {
        r.error_kind = ErrorKind::InvalidSubmission;
        r.error = "input of " + id + " is gone";
        return r;
    }
    return submit_job(input->string(), old->build_ref, old->network_access, old->attempt + 1, id);
}

SubmitResult JobManager::submit_job(const std::string& document, const std::string& build_ref,
                                    bool network_access, int attempt, const JobId& retry_of) {
    SubmitResult r;
    r.error_kind = ErrorKind::InvalidSubmission;
    if (document.empty()) {
        r.error = "document_ref is empty";
        return r;
    }
    if (build_ref.empty()) {
        r.error = "build_ref is empty";
        return r;
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(document, ec)) {
        r.error = "document not found: " + document;
        return r;
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!accepting_) {
            r.error_kind = ErrorKind::QueueFull;
            r.error = "not accepting submissions";
            return r;
        }
        if (!queue_.try_reserve()) {
            r.error_kind = ErrorKind::QueueFull;
            r.error = "queue full";
            return r;
        }
    }

    auto release = [this]() {
        std::lock_guard<std::mutex> lk(mu_);
        queue_.release_reservation();
    };

    Job j;
    JobPaths p;
    do {
        j.id = gen_job_id();
        p = job_paths(s_.jobs_dir(), j.id);
    } while (store_.contains(j.id) || std::filesystem::exists(p.root, ec));

    std::string err = prepare_job_dir(p, document, &j.input_sha256);
    if (!err.empty()) {
        release();
        r.error = err;
        return r;
    }

    j.status = JobStatus::Queued;
    j.document_ref = document;
    j.build_ref = build_ref;
    j.network_access = network_access;
    j.attempt = attempt;
    j.retry_of = retry_of;
    j.submitted_at_ms = now_ms();

    err = store_.insert(&j);
    if (!err.empty()) {
        std::filesystem::remove_all(p.root, ec);
        release();
        r.error = err;
        return r;
    }

    {
        EventLog ev(p.events(), j.id, EventSource::Supervisor);
        std::string detail = retry_of.empty() ? "" : "retry of " + retry_of;
        if (auto e = ev.append("job.queued", status_to_str(JobStatus::Queued), detail); !e.empty()) {
            std::cerr << "[serve] events " << j.id << ": " << e << "\n";
        }
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        queue_.commit(j.id);
    }
    // a retiring worker may take the wakeup and exit, so wake them all
    cv_.notify_all();

    r.ok = true;
    r.job_id = j.id;
    r.status = JobStatus::Queued;
    r.error_kind = ErrorKind::None;
    return r;
}

std::string JobManager::adjust_concurrency(int n) {
    if (n < 1) return "concurrency must be at least 1";

    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_ || stopping_) return "not running";
        reap_exited(&done);

        int active = 0;
        for (const auto& w : workers_) {
            if (!w->retiring) active++;
        }
        if (n > active) {
            for (int i = active; i < n; i++) spawn_worker_locked();
        } else if (n < active) {
            int excess = active - n;
            for (auto it = workers_.rbegin(); it != workers_.rend() && excess > 0; ++it) {
                if ((*it)->retiring) continue;
                (*it)->retiring = true;
                excess--;
            }
        }
        std::cerr << "[serve] concurrency " << active << " -> " << n << "\n";
    }
    cv_.notify_all();

    // exited workers have returned from worker_loop; join is immediate
    for (auto& t : done) {
        if (t.joinable()) t.join();
    }
    return "";
}

void JobManager::shutdown() {
    std::vector<std::unique_ptr<WorkerSlot>> all;
    {
        std::lock_guard<std::mutex> lk(mu_);
        accepting_ = false;
        if (stopping_) return;
        stopping_ = true;
        all.swap(workers_);
    }
    cv_.notify_all();
    for (auto& w : all) {
        if (w->th.joinable()) w->th.join();
    }
}

std::optional<Job> JobManager::get_status(const JobId& id) const {
    return store_.get(id);
}

std::optional<std::string> JobManager::get_artifact(const JobId& id) const {
    auto j = store_.get(id);
    if (!j || !is_terminal(j->status)) return std::nullopt;
    JobPaths p = job_paths(s_.jobs_dir(), id);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(p.artifact(), ec)) return std::nullopt;
    return slurp_file(p.artifact());
}

std::optional<std::string> JobManager::get_output(const JobId& id) const {
    auto j = store_.get(id);
    if (!j || j->status != JobStatus::Success) return std::nullopt;
    JobPaths p = job_paths(s_.jobs_dir(), id);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(p.output_file(), ec)) return std::nullopt;
    return slurp_file(p.output_file());
}

int JobManager::concurrency() const {
    std::lock_guard<std::mutex> lk(mu_);
    int active = 0;
    for (const auto& w : workers_) {
        if (!w->retiring && !w->exited) active++;
    }
    return active;
}

size_t JobManager::queue_depth() const {
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.size();
}

} // namespace sheetrun
