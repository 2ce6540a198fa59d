#include "sheetrun/events.h"
#include "sheetrun/json_util.h"
#include "sheetrun/util.h"
#include "sheetrun/wal.h"

#include <json-c/json.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace sheetrun {

namespace {

int64_t last_seq(const std::filesystem::path& path) {
    int64_t last = 0;
    for (const auto& line : Wal::read_lines(path)) {
        json_util::Doc d = json_util::parse(line);
        if (!d) continue;
        auto s = json_util::obj_int(d.root, "seq");
        if (s && *s > last) last = *s;
    }
    return last;
}

// flock() for the duration of one append; released on close or unlock.
class FileLock {
public:
    explicit FileLock(int fd) : fd_(fd) {
        int rc;
        do {
            rc = ::flock(fd_, LOCK_EX);
        } while (rc != 0 && errno == EINTR);
        if (rc != 0) err_ = std::string("flock events: ") + std::strerror(errno);
    }
    ~FileLock() {
        if (err_.empty()) (void)::flock(fd_, LOCK_UN);
    }
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    const std::string& error() const { return err_; }

private:
    int fd_;
    std::string err_;
};

} // namespace

const char* event_source_name(EventSource s) {
    switch (s) {
        case EventSource::Supervisor: return "supervisor";
        case EventSource::Child:      return "child";
    }
    return "supervisor";
}

EventLog::EventLog(std::filesystem::path path, JobId job_id, EventSource source)
    : path_(std::move(path)), job_id_(std::move(job_id)), source_(source) {
    fd_ = ::open(path_.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0600);
}

EventLog::~EventLog() {
    if (fd_ >= 0) ::close(fd_);
}

std::string EventLog::append(const std::string& event, const std::string& state,
                             const std::string& detail) {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ < 0) return "open " + path_.string() + ": " + std::strerror(errno);

    // Both writers share one sequence: under the file lock, continue after
    // the highest seq on disk.
    FileLock lock(fd_);
    if (!lock.error().empty()) return lock.error();
    seq_ = std::max(seq_, last_seq(path_)) + 1;

    json_util::Doc rec(json_object_new_object());
    json_object_object_add(rec.root, "seq", json_object_new_int64(seq_));
    json_object_object_add(rec.root, "ts", json_util::new_string(iso_from_ms(now_ms())));
    json_object_object_add(rec.root, "job_id", json_util::new_string(job_id_));
    json_object_object_add(rec.root, "source", json_object_new_string(event_source_name(source_)));
    json_object_object_add(rec.root, "event", json_util::new_string(event));
    if (!state.empty()) json_object_object_add(rec.root, "state", json_util::new_string(state));
    if (!detail.empty()) json_object_object_add(rec.root, "detail", json_util::new_string(detail));

    std::string line = json_util::to_string(rec.root) + "\n";
    size_t off = 0;
    while (off < line.size()) {
        ssize_t w = ::write(fd_, line.data() + off, line.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            return std::string("write events: ") + std::strerror(errno);
        }
        off += (size_t)w;
    }
    return "";
}

std::vector<EventRecord> read_events(const std::filesystem::path& path) {
    std::vector<EventRecord> out;
    for (const auto& line : Wal::read_lines(path)) {
        json_util::Doc d = json_util::parse(line);
        if (!d || !json_object_is_type(d.root, json_type_object)) continue;
        EventRecord r;
        r.seq = json_util::obj_int(d.root, "seq").value_or(0);
        r.ts = json_util::obj_string(d.root, "ts").value_or("");
        r.job_id = json_util::obj_string(d.root, "job_id").value_or("");
        r.source = json_util::obj_string(d.root, "source").value_or("");
        r.event = json_util::obj_string(d.root, "event").value_or("");
        r.state = json_util::obj_string(d.root, "state").value_or("");
        r.detail = json_util::obj_string(d.root, "detail").value_or("");
        if (r.event.empty()) continue;
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<std::string> terminal_events(const std::vector<EventRecord>& events) {
    std::vector<std::string> out;
    for (const auto& e : events) {
        if (e.event == kEventJobSuccess || e.event == kEventJobError || e.event == kEventJobTimedOut) {
            out.push_back(e.event);
        }
    }
    return out;
}

} // namespace sheetrun
