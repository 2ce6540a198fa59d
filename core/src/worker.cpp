#include "sheetrun/worker.h"
#include "sheetrun/events.h"
#include "sheetrun/job_dir.h"
#include "sheetrun/json_util.h"
#include "sheetrun/util.h"

#include <iostream>

namespace sheetrun {

static std::string failed_stage_summary(const std::filesystem::path& artifact_path) {
    json_util::Doc d = json_util::parse(slurp_file(artifact_path));
    json_object* err = d ? json_util::obj_get(d.root, "error") : nullptr;
    if (!err) return "user code failed";
    std::string stage = json_util::obj_string(err, "stage").value_or("");
    std::string code = json_util::obj_string(err, "code").value_or("");
    if (stage.empty()) return "user code failed";
    std::string out = "user code failed in stage '" + stage + "'";
    if (!code.empty()) out += " (" + code + ")";
    return out;
}

Outcome classify_child_exit(const WaitResult& w, const ResourceBudget& b,
                            const std::filesystem::path& artifact_path) {
    Outcome o;
    if (w.timed_out) {
        o.status = JobStatus::TimedOut;
        o.kind = ErrorKind::Timeout;
        o.summary = "wall-clock timeout after " + std::to_string(b.wall_clock_timeout_ms) + " ms";
        return o;
    }

    LimitHit hit = classify_termination(w.raw_status, w.cpu_ms, w.max_rss_kb, b);
    if (hit != LimitHit::None) {
        o.status = JobStatus::Error;
        o.kind = ErrorKind::ResourceLimitExceeded;
        o.summary = std::string("resource limit exceeded: ") + limit_hit_name(hit);
        return o;
    }

    o.status = JobStatus::Error;
    if (w.term_signal != 0) {
        o.kind = ErrorKind::UserCodeException;
        o.summary = "child killed by signal " + std::to_string(w.term_signal);
        return o;
    }
    switch (w.exit_code) {
        case 0:
            o.status = JobStatus::Success;
            o.kind = ErrorKind::None;
            return o;
        case kExitPipelineFailed:
            o.kind = ErrorKind::UserCodeException;
            o.summary = failed_stage_summary(artifact_path);
            return o;
        case kExitRunhostError:
            o.kind = ErrorKind::LaunchFailure;
            o.summary = "child setup failed";
            return o;
        default:
            o.kind = ErrorKind::UserCodeException;
            if (w.exit_code > 128 && w.exit_code < 128 + 65) {
                o.summary = "user code killed by signal " + std::to_string(w.exit_code - 128);
            } else {
                o.summary = "child exited with code " + std::to_string(w.exit_code);
            }
            return o;
    }
}

static const char* terminal_event_for(JobStatus s) {
    switch (s) {
        case JobStatus::Success:  return kEventJobSuccess;
        case JobStatus::TimedOut: return kEventJobTimedOut;
        default:                  return kEventJobError;
    }
}

Outcome run_job(const Settings& s, JobStore& store, SandboxLauncher& launcher,
                const JobId& id, const std::string& tag) {
    const JobPaths p = job_paths(s.jobs_dir(), id);

    auto job = store.get(id);
    if (!job) {
        std::cerr << tag << " job " << id << " vanished from the store\n";
        return Outcome{JobStatus::Error, ErrorKind::LaunchFailure, "job record missing"};
    }

    std::string err = store.mark_running(id, now_ms());
    if (!err.empty()) {
        // Not Queued any more: someone else owns it or it is already terminal.
        std::cerr << tag << " skip " << id << ": " << err << "\n";
        return Outcome{job->status, job->error_kind, job->error_summary};
    }
    {
        EventLog ev(p.events(), id, EventSource::Supervisor);
        if (auto e = ev.append("job.started", status_to_str(JobStatus::Running)); !e.empty()) {
            std::cerr << tag << " events " << id << ": " << e << "\n";
        }
    }

    Outcome o;
    LaunchResult lr = launcher.launch(*job);
    if (!lr.ok()) {
        o.status = JobStatus::Error;
        o.kind = lr.kind;
        o.summary = lr.error;
        std::cerr << tag << " launch " << id << " failed: " << lr.error << "\n";
    } else {
        {
            EventLog ev(p.events(), id, EventSource::Supervisor);
            std::string eerr = ev.append("child.spawned", status_to_str(JobStatus::Running),
                                         "pid " + std::to_string(lr.child->pid()));
            if (!eerr.empty()) std::cerr << tag << " events " << id << ": " << eerr << "\n";
        }
        WaitResult w = lr.child->wait(s.budget.wall_clock_timeout_ms);
        o = classify_child_exit(w, s.budget, p.artifact());
        if (o.status == JobStatus::Success) {
            std::string verr = verify_success_dir(p, job->input_sha256);
            if (!verr.empty()) {
                o.status = JobStatus::Error;
                o.kind = ErrorKind::UserCodeException;
                o.summary = "incomplete results: " + verr;
            }
        }
        std::cerr << tag << " " << id << " -> " << status_to_str(o.status)
                  << " exit=" << w.exit_code << " sig=" << w.term_signal
                  << " cpu_ms=" << w.cpu_ms << " wall_ms=" << w.wall_ms << "\n";
    }

    err = store.finish(id, o, now_ms());
    if (!err.empty()) {
        std::cerr << tag << " finish " << id << ": " << err << "\n";
        return o;
    }

    EventLog ev(p.events(), id, EventSource::Supervisor);
    std::string detail = o.summary;
    if (o.kind != ErrorKind::None) detail = std::string(error_kind_to_str(o.kind)) + ": " + o.summary;
    if (auto e = ev.append(terminal_event_for(o.status), status_to_str(o.status), detail); !e.empty()) {
        std::cerr << tag << " events " << id << ": " << e << "\n";
    }
    return o;
}

} // namespace sheetrun
