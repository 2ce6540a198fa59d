#include "runner_utils.h"

#include "sheetrun/json_util.h"
#include "sheetrun/util.h"

#include <algorithm>

namespace sheetrun {

std::filesystem::path resolve_exe_dir(const char* argv0) {
    std::error_code ec;
    // /proc/self/exe survives being started through a relative path or PATH.
    std::filesystem::path exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        exe = argv0 ? std::filesystem::path(argv0) : std::filesystem::path();
        if (!exe.empty()) exe = std::filesystem::absolute(exe, ec);
    }
    if (exe.empty()) return std::filesystem::current_path(ec);
    return exe.parent_path();
}

std::filesystem::path resolve_data_root() {
    std::error_code ec;
    std::filesystem::path root = getenv_str("SHEETRUN_ROOT", "");
    if (root.empty()) root = std::filesystem::current_path(ec);
    return std::filesystem::absolute(root, ec);
}

std::filesystem::path wal_path(const std::filesystem::path& root) {
    return root / "state" / "jobs.wal.jsonl";
}

void ensure_spool_dirs(const std::filesystem::path& root) {
    std::error_code ec;
    std::filesystem::create_directories(root / "spool" / "processed", ec);
    std::filesystem::create_directories(root / "spool" / "rejected", ec);
    std::filesystem::create_directories(root / "control", ec);
}

std::vector<std::filesystem::path> list_spool_json(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> v;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) return v;
    for (auto& e : std::filesystem::directory_iterator(dir, ec)) {
        if (ec) break;
        if (!e.is_regular_file(ec)) continue;
        auto p = e.path();
        if (p.extension() == ".json") v.push_back(p);
    }
    std::sort(v.begin(), v.end(), [](const std::filesystem::path& a, const std::filesystem::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return v;
}

std::string parse_spool_request(const std::string& json, SpoolRequest* out) {
    if (!out) return "parse_spool_request: null output";
    json_util::Doc d = json_util::parse(json);
    if (!d || !json_object_is_type(d.root, json_type_object)) return "request is not a JSON object";

    SpoolRequest r;
    if (auto id = json_util::obj_string(d.root, "resubmit")) {
        if (id->empty()) return "resubmit: empty job id";
        r.resubmit_of = *id;
        *out = std::move(r);
        return "";
    }

    auto doc = json_util::obj_string(d.root, "document_ref");
    auto build = json_util::obj_string(d.root, "build_ref");
    if (!doc || doc->empty()) return "document_ref missing";
    if (!build || build->empty()) return "build_ref missing";
    r.submit.document_ref = *doc;
    r.submit.build_ref = *build;
    if (json_util::obj_get(d.root, "network_access")) {
        auto net = json_util::obj_bool(d.root, "network_access");
        if (!net) return "network_access must be a boolean";
        r.submit.network_access = *net;
    }
    *out = std::move(r);
    return "";
}

std::string spool_request_to_json(const SpoolRequest& r) {
    json_util::Doc d(json_object_new_object());
    if (!r.resubmit_of.empty()) {
        json_object_object_add(d.root, "resubmit", json_util::new_string(r.resubmit_of));
    } else {
        json_object_object_add(d.root, "document_ref", json_util::new_string(r.submit.document_ref));
        json_object_object_add(d.root, "build_ref", json_util::new_string(r.submit.build_ref));
        if (r.submit.network_access) {
            json_object_object_add(d.root, "network_access", json_object_new_boolean(*r.submit.network_access ? 1 : 0));
        }
    }
    return json_util::to_string(d.root);
}

std::string submit_result_to_json(const SubmitResult& r) {
    json_util::Doc d(json_object_new_object());
    json_object_object_add(d.root, "ok", json_object_new_boolean(r.ok ? 1 : 0));
    if (r.ok) {
        json_object_object_add(d.root, "job_id", json_util::new_string(r.job_id));
        json_object_object_add(d.root, "status", json_util::new_string(status_to_str(r.status)));
    } else {
        json_object_object_add(d.root, "error_kind", json_util::new_string(error_kind_to_str(r.error_kind)));
        json_object_object_add(d.root, "error", json_util::new_string(r.error));
    }
    return json_util::to_string(d.root);
}

std::string new_spool_name() {
    return std::to_string(now_ms()) + "-" + gen_job_id() + ".json";
}

std::filesystem::path spool_result_path(const std::filesystem::path& root, const std::string& spool_name) {
    std::filesystem::path n(spool_name);
    return root / "spool" / "processed" / (n.stem().string() + ".result.json");
}

std::optional<int> read_concurrency_control(const std::filesystem::path& path, std::string* err) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return std::nullopt;
    std::string s = slurp_file(path);
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(s, &used);
    } catch (const std::exception&) {
        if (err) *err = "control/concurrency: not an integer: '" + s + "'";
        return std::nullopt;
    }
    if (used != s.size() || v < 1) {
        if (err) *err = "control/concurrency: expected a positive integer, got '" + s + "'";
        return std::nullopt;
    }
    return v;
}

} // namespace sheetrun
