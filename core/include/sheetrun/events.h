#pragma once
#include "sheetrun/types.h"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace sheetrun {

// Who appended an event line.
enum class EventSource { Supervisor, Child };

const char* event_source_name(EventSource s);

// Terminal event names. Exactly one of these ends every job's event log.
inline constexpr const char* kEventJobSuccess  = "job.success";
inline constexpr const char* kEventJobError    = "job.error";
inline constexpr const char* kEventJobTimedOut = "job.timed_out";

// Append-only NDJSON event log of one job (logs/events.ndjson).
//
// Supervisor and child both append to the same file; each line is written
// with a single write(2) on an O_APPEND descriptor so lines never interleave.
// Each append takes an exclusive flock() on the file and continues `seq` from
// the highest value on disk, so concurrent writers in different processes
// share one strictly increasing sequence.
class EventLog {
public:
    EventLog(std::filesystem::path path, JobId job_id, EventSource source);
    ~EventLog();

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    // Returns empty string on success.
    std::string append(const std::string& event, const std::string& state = "",
                       const std::string& detail = "");

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    JobId job_id_;
    EventSource source_;
    int fd_{-1};
    int64_t seq_{0};
    std::mutex mu_;
};

struct EventRecord {
    int64_t seq{0};
    std::string ts;
    JobId job_id;
    std::string source;
    std::string event;
    std::string state;
    std::string detail;
};

// Parses an event log. Malformed or torn lines are skipped.
std::vector<EventRecord> read_events(const std::filesystem::path& path);

// Returns the terminal event names found in `events`, in order.
std::vector<std::string> terminal_events(const std::vector<EventRecord>& events);

} // namespace sheetrun
