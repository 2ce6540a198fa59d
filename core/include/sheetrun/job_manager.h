#pragma once
#include "sheetrun/config.h"
#include "sheetrun/job_queue.h"
#include "sheetrun/job_store.h"
#include "sheetrun/sandbox.h"
#include "sheetrun/types.h"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace sheetrun {

struct SubmitRequest {
    std::string document_ref;
    std::string build_ref;
    std::optional<bool> network_access;    // unset: Settings::network_default
};

struct SubmitResult {
    bool ok{false};
    JobId job_id;
    JobStatus status{JobStatus::Queued};
    ErrorKind error_kind{ErrorKind::None};  // QueueFull or InvalidSubmission
    std::string error;
};

struct RecoveryReport {
    int running_failed{0};     // Running -> Error (supervisor restarted)
    int requeued{0};
    int queued_failed{0};      // Queued but the job directory is gone
};

// Owns the queue, the worker pool and the job store.
//
// The queue and the worker registry are guarded by one mutex; job records
// have their own lock inside JobStore. start() replays the store and runs
// the recovery sweep before any worker starts or any submission is taken.
class JobManager {
public:
    explicit JobManager(Settings s);
    ~JobManager();

    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    // Returns empty string on success.
    std::string start();

    SubmitResult submit(const SubmitRequest& req);

    // New attempt of a failed or timed-out job: fresh id, attempt+1,
    // retry_of set. The old job is not touched.
    SubmitResult resubmit(const JobId& id);

    // Growth starts workers at once; shrink retires the newest workers after
    // their current job. Returns empty string on success.
    std::string adjust_concurrency(int n);

    // Stops accepting, lets running jobs finish, joins every worker. Jobs
    // still queued stay Queued in the store for the next start().
    void shutdown();

    std::optional<Job> get_status(const JobId& id) const;
    // Artifact bytes once the job is terminal and an artifact exists.
    std::optional<std::string> get_artifact(const JobId& id) const;
    // Normalized output bytes once the job succeeded.
    std::optional<std::string> get_output(const JobId& id) const;

    int concurrency() const;        // workers not retiring
    size_t queue_depth() const;
    const RecoveryReport& last_recovery() const { return recovery_; }

private:
    struct WorkerSlot {
        int id{0};
        std::thread th;
        bool retiring{false};
        bool exited{false};
    };

    SubmitResult submit_job(const std::string& document, const std::string& build_ref,
                            bool network_access, int attempt, const JobId& retry_of);
    RecoveryReport recover();
    void spawn_worker_locked();
    void reap_exited(std::vector<std::thread>* out);
    void worker_loop(WorkerSlot* slot);

    Settings s_;
    JobStore store_;
    SandboxLauncher launcher_;
    RecoveryReport recovery_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    BoundedFifo<JobId> queue_;
    std::vector<std::unique_ptr<WorkerSlot>> workers_;
    int next_worker_id_{1};
    bool started_{false};
    bool accepting_{false};
    bool stopping_{false};
};

} // namespace sheetrun
