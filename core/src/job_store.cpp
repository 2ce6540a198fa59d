#include "sheetrun/job_store.h"
#include "sheetrun/json_util.h"

#include <algorithm>

namespace sheetrun {

std::string job_to_json(const Job& j) {
    json_util::Doc d(json_object_new_object());
    json_object_object_add(d.root, "id", json_util::new_string(j.id));
    json_object_object_add(d.root, "status", json_object_new_string(status_to_str(j.status)));
    json_object_object_add(d.root, "document_ref", json_util::new_string(j.document_ref));
    json_object_object_add(d.root, "build_ref", json_util::new_string(j.build_ref));
    json_object_object_add(d.root, "network_access", json_object_new_boolean(j.network_access ? 1 : 0));
    if (!j.input_sha256.empty()) {
        json_object_object_add(d.root, "input_sha256", json_util::new_string(j.input_sha256));
    }
    json_object_object_add(d.root, "seq", json_object_new_int64(j.seq));
    json_object_object_add(d.root, "attempt", json_object_new_int(j.attempt));
    if (!j.retry_of.empty()) json_object_object_add(d.root, "retry_of", json_util::new_string(j.retry_of));
    json_object_object_add(d.root, "submitted_at_ms", json_object_new_int64(j.submitted_at_ms));
    json_object_object_add(d.root, "started_at_ms", json_object_new_int64(j.started_at_ms));
    json_object_object_add(d.root, "finished_at_ms", json_object_new_int64(j.finished_at_ms));
    if (j.error_kind != ErrorKind::None) {
        json_object_object_add(d.root, "error_kind", json_object_new_string(error_kind_to_str(j.error_kind)));
    }
    if (!j.error_summary.empty()) {
        json_object_object_add(d.root, "error_summary", json_util::new_string(j.error_summary));
    }
    return json_util::to_string(d.root);
}

std::optional<Job> job_from_json(const std::string& json) {
    json_util::Doc d = json_util::parse(json);
    if (!d || !json_object_is_type(d.root, json_type_object)) return std::nullopt;

    Job j;
    auto id = json_util::obj_string(d.root, "id");
    auto status = json_util::obj_string(d.root, "status");
    if (!id || id->empty() || !status) return std::nullopt;
    auto st = status_from_str(*status);
    if (!st) return std::nullopt;

    j.id = *id;
    j.status = *st;
    j.document_ref = json_util::obj_string(d.root, "document_ref").value_or("");
    j.build_ref = json_util::obj_string(d.root, "build_ref").value_or("");
    j.network_access = json_util::obj_bool(d.root, "network_access").value_or(false);
    j.input_sha256 = json_util::obj_string(d.root, "input_sha256").value_or("");
    j.seq = json_util::obj_int(d.root, "seq").value_or(0);
    j.attempt = (int)json_util::obj_int(d.root, "attempt").value_or(1);
    j.retry_of = json_util::obj_string(d.root, "retry_of").value_or("");
    j.submitted_at_ms = json_util::obj_int(d.root, "submitted_at_ms").value_or(0);
    j.started_at_ms = json_util::obj_int(d.root, "started_at_ms").value_or(0);
    j.finished_at_ms = json_util::obj_int(d.root, "finished_at_ms").value_or(0);
    j.error_kind = error_kind_from_str(json_util::obj_string(d.root, "error_kind").value_or(""));
    j.error_summary = json_util::obj_string(d.root, "error_summary").value_or("");
    return j;
}

JobStore::JobStore(std::filesystem::path wal_path) : wal_(std::move(wal_path)) {}

std::map<JobId, Job> JobStore::load(const std::filesystem::path& wal_path) {
    std::map<JobId, Job> out;
    for (const auto& line : Wal::read_lines(wal_path)) {
        auto j = job_from_json(line);
        if (!j) continue;
        out[j->id] = std::move(*j);
    }
    return out;
}

std::string JobStore::open(bool fsync) {
    std::lock_guard<std::mutex> lk(mu_);
    jobs_ = load(wal_.path());
    for (const auto& [id, j] : jobs_) {
        if (j.seq >= next_seq_) next_seq_ = j.seq + 1;
    }

    std::vector<Job> ordered;
    ordered.reserve(jobs_.size());
    for (const auto& [id, j] : jobs_) ordered.push_back(j);
    std::sort(ordered.begin(), ordered.end(), [](const Job& a, const Job& b) { return a.seq < b.seq; });

    std::vector<std::string> lines;
    lines.reserve(ordered.size());
    for (const auto& j : ordered) lines.push_back(job_to_json(j));

    std::string err = wal_.compact(lines);
    if (!err.empty()) return "job store compact: " + err;
    wal_.set_fsync(fsync);
    return "";
}

std::string JobStore::persist_locked(const Job& j) {
    std::string err = wal_.append_json_line(job_to_json(j));
    if (!err.empty()) return "job store: " + err;
    jobs_[j.id] = j;
    return "";
}

std::string JobStore::insert(Job* j) {
    if (!j) return "insert: null job";
    if (j->id.empty()) return "insert: empty id";
    if (j->status != JobStatus::Queued) return "insert: new jobs must be queued";

    std::lock_guard<std::mutex> lk(mu_);
    if (jobs_.count(j->id)) return "insert: duplicate job id " + j->id;
    j->seq = next_seq_;
    std::string err = persist_locked(*j);
    if (!err.empty()) return err;
    next_seq_++;
    return "";
}

std::string JobStore::mark_running(const JobId& id, int64_t started_at_ms) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return "unknown job " + id;
    if (it->second.status != JobStatus::Queued) {
        return std::string("illegal transition ") + status_to_str(it->second.status) + " -> running";
    }
    Job next = it->second;
    next.status = JobStatus::Running;
    next.started_at_ms = started_at_ms;
    return persist_locked(next);
}

std::string JobStore::finish(const JobId& id, const Outcome& o, int64_t finished_at_ms) {
    if (!is_terminal(o.status)) return "finish: outcome is not terminal";

    std::lock_guard<std::mutex> lk(mu_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return "unknown job " + id;
    if (is_terminal(it->second.status)) {
        return std::string("illegal transition ") + status_to_str(it->second.status) + " -> " +
               status_to_str(o.status);
    }
    if (it->second.status == JobStatus::Queued && o.status != JobStatus::Error) {
        return std::string("illegal transition queued -> ") + status_to_str(o.status);
    }
    Job next = it->second;
    next.status = o.status;
    next.error_kind = o.kind;
    next.error_summary = o.summary;
    next.finished_at_ms = finished_at_ms;
    return persist_locked(next);
}

std::optional<Job> JobStore::get(const JobId& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second;
}

bool JobStore::contains(const JobId& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return jobs_.count(id) != 0;
}

std::vector<Job> JobStore::list(JobStatus status) const {
    std::vector<Job> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& [id, j] : jobs_) {
            if (j.status == status) out.push_back(j);
        }
    }
    std::sort(out.begin(), out.end(), [](const Job& a, const Job& b) { return a.seq < b.seq; });
    return out;
}

std::vector<Job> JobStore::all() const {
    std::vector<Job> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& [id, j] : jobs_) out.push_back(j);
    }
    std::sort(out.begin(), out.end(), [](const Job& a, const Job& b) { return a.seq < b.seq; });
    return out;
}

} // namespace sheetrun
