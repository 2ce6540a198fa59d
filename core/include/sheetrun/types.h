#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace sheetrun {

using JobId = std::string;

enum class JobStatus {
    Queued,
    Running,
    Success,
    Error,
    TimedOut,
};

// Failure taxonomy. Every terminal Error/TimedOut carries one of these.
enum class ErrorKind {
    None,
    QueueFull,
    InvalidSubmission,
    LaunchFailure,
    DependencyInstallFailure,
    ResourceLimitExceeded,
    Timeout,
    UserCodeException,
    SupervisorRestart,
};

const char* status_to_str(JobStatus s);
std::optional<JobStatus> status_from_str(const std::string& s);
bool is_terminal(JobStatus s);

const char* error_kind_to_str(ErrorKind k);
ErrorKind error_kind_from_str(const std::string& s);

struct Job {
    JobId id;
    JobStatus status{JobStatus::Queued};
    std::string document_ref;   // path of the submitted document
    std::string build_ref;      // rule-package build reference
    bool network_access{false};
    std::string input_sha256;   // digest of input/<document> taken at submission

    int64_t seq{0};             // submission order, assigned by the store
    int attempt{1};
    JobId retry_of;             // previous attempt, empty for first attempts

    int64_t submitted_at_ms{0};
    int64_t started_at_ms{0};
    int64_t finished_at_ms{0};

    ErrorKind error_kind{ErrorKind::None};
    std::string error_summary;  // short, never a stack trace
};

// Result of a terminal transition, produced by the worker.
struct Outcome {
    JobStatus status{JobStatus::Error};
    ErrorKind kind{ErrorKind::None};
    std::string summary;
};

} // namespace sheetrun
