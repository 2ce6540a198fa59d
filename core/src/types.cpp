#include "sheetrun/types.h"

namespace sheetrun {

const char* status_to_str(JobStatus s) {
    switch (s) {
        case JobStatus::Queued:   return "queued";
        case JobStatus::Running:  return "running";
        case JobStatus::Success:  return "success";
        case JobStatus::Error:    return "error";
        case JobStatus::TimedOut: return "timed_out";
    }
    return "error";
}

std::optional<JobStatus> status_from_str(const std::string& s) {
    if (s == "queued") return JobStatus::Queued;
    if (s == "running") return JobStatus::Running;
    if (s == "success") return JobStatus::Success;
    if (s == "error") return JobStatus::Error;
    if (s == "timed_out") return JobStatus::TimedOut;
    return std::nullopt;
}

bool is_terminal(JobStatus s) {
    return s == JobStatus::Success || s == JobStatus::Error || s == JobStatus::TimedOut;
}

const char* error_kind_to_str(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:                     return "";
        case ErrorKind::QueueFull:                return "queue_full";
        case ErrorKind::InvalidSubmission:        return "invalid_submission";
        case ErrorKind::LaunchFailure:            return "launch_failure";
        case ErrorKind::DependencyInstallFailure: return "dependency_install_failure";
        case ErrorKind::ResourceLimitExceeded:    return "resource_limit_exceeded";
        case ErrorKind::Timeout:                  return "timeout";
        case ErrorKind::UserCodeException:        return "user_code_exception";
        case ErrorKind::SupervisorRestart:        return "supervisor_restart";
    }
    return "";
}

ErrorKind error_kind_from_str(const std::string& s) {
    if (s == "queue_full") return ErrorKind::QueueFull;
    if (s == "invalid_submission") return ErrorKind::InvalidSubmission;
    if (s == "launch_failure") return ErrorKind::LaunchFailure;
    if (s == "dependency_install_failure") return ErrorKind::DependencyInstallFailure;
    if (s == "resource_limit_exceeded") return ErrorKind::ResourceLimitExceeded;
    if (s == "timeout") return ErrorKind::Timeout;
    if (s == "user_code_exception") return ErrorKind::UserCodeException;
    if (s == "supervisor_restart") return ErrorKind::SupervisorRestart;
    return ErrorKind::None;
}

} // namespace sheetrun
