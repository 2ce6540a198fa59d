#pragma once
#include "sheetrun/types.h"
#include "sheetrun/wal.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sheetrun {

std::string job_to_json(const Job& j);
std::optional<Job> job_from_json(const std::string& json);

// Durable table of job records.
//
// Every mutation appends a full snapshot of the job to a JSONL write-ahead
// log before the in-memory copy changes. open() replays the log (latest
// snapshot per id wins) and compacts it to one line per job.
//
// Transitions are checked here: Queued -> Running, Queued|Running -> a
// terminal state. A terminal job never changes again.
class JobStore {
public:
    explicit JobStore(std::filesystem::path wal_path);

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    // Returns empty string on success.
    std::string open(bool fsync);

    // Assigns seq. Fails on a duplicate id or a non-Queued status.
    std::string insert(Job* j);

    std::string mark_running(const JobId& id, int64_t started_at_ms);

    // Terminal transition. Fails if the job is unknown or already terminal.
    std::string finish(const JobId& id, const Outcome& o, int64_t finished_at_ms);

    std::optional<Job> get(const JobId& id) const;
    bool contains(const JobId& id) const;

    // Jobs with the given status, ordered by seq.
    std::vector<Job> list(JobStatus status) const;
    std::vector<Job> all() const;

    // Read-only view of a store another process owns (CLI status).
    static std::map<JobId, Job> load(const std::filesystem::path& wal_path);

private:
    std::string persist_locked(const Job& j);

    Wal wal_;
    mutable std::mutex mu_;
    std::map<JobId, Job> jobs_;
    int64_t next_seq_{1};
};

} // namespace sheetrun
