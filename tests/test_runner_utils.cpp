#include "test_common.h"

#include "runner_utils.h"
#include "sheetrun/json_util.h"
#include "sheetrun/util.h"

#include <filesystem>

using namespace sheetrun;
namespace fs = std::filesystem;

namespace {

fs::path scratch(const std::string& name) {
    fs::path p = fs::temp_directory_path() / ("sheetrun_test_runner_utils_" + name);
    std::error_code ec;
    fs::remove_all(p, ec);
    fs::create_directories(p, ec);
    return p;
}

void test_parse_submit() {
    SpoolRequest r;
    std::string err = parse_spool_request(
        R"({"document_ref":"/data/in.csv","build_ref":"contacts","network_access":true})", &r);
    expect_true(err.empty(), "submit parses: " + err);
    expect_true(r.resubmit_of.empty(), "not a resubmit");
    expect_eq_str(r.submit.document_ref, "/data/in.csv", "document_ref");
    expect_eq_str(r.submit.build_ref, "contacts", "build_ref");
    expect_true(r.submit.network_access && *r.submit.network_access, "network flag");

    SpoolRequest plain;
    err = parse_spool_request(R"({"document_ref":"a.csv","build_ref":"b"})", &plain);
    expect_true(err.empty() && !plain.submit.network_access, "network flag left to the default");

    // The serialized form reads back to the same request.
    SpoolRequest back;
    err = parse_spool_request(spool_request_to_json(r), &back);
    expect_true(err.empty(), "written request parses: " + err);
    expect_true(back.submit.document_ref == r.submit.document_ref && back.submit.build_ref == r.submit.build_ref,
                "refs survive");
    expect_true(back.submit.network_access == r.submit.network_access, "network flag survives");
}

void test_parse_resubmit_and_invalid() {
    SpoolRequest r;
    std::string err = parse_spool_request(R"({"resubmit":"abc123"})", &r);
    expect_true(err.empty() && r.resubmit_of == "abc123", "resubmit parses");

    SpoolRequest again;
    err = parse_spool_request(spool_request_to_json(r), &again);
    expect_true(err.empty() && again.resubmit_of == "abc123", "resubmit survives serialization");

    SpoolRequest bad;
    expect_true(!parse_spool_request("not json", &bad).empty(), "garbage rejected");
    expect_true(!parse_spool_request("[1,2]", &bad).empty(), "array rejected");
    expect_true(!parse_spool_request(R"({"resubmit":""})", &bad).empty(), "empty resubmit id rejected");
    expect_true(!parse_spool_request(R"({"build_ref":"b"})", &bad).empty(), "document required");
    expect_true(!parse_spool_request(R"({"document_ref":"a.csv"})", &bad).empty(), "build required");
    expect_true(!parse_spool_request(R"({"document_ref":"a","build_ref":"b","network_access":"yes"})", &bad).empty(),
                "network flag must be a boolean");
    expect_true(!parse_spool_request("{}", nullptr).empty(), "null output rejected");
}

void test_submit_result_json() {
    SubmitResult ok;
    ok.ok = true;
    ok.job_id = "j1";
    ok.status = JobStatus::Queued;
    json_util::Doc d = json_util::parse(submit_result_to_json(ok));
    expect_true(d && json_util::obj_bool(d.root, "ok").value_or(false), "ok flag");
    expect_true(json_util::obj_string(d.root, "job_id").value_or("") == "j1", "job id");
    expect_true(json_util::obj_string(d.root, "status").value_or("") == "queued", "status");
    expect_true(!json_util::obj_get(d.root, "error"), "no error on success");

    SubmitResult full;
    full.error_kind = ErrorKind::QueueFull;
    full.error = "queue full";
    json_util::Doc f = json_util::parse(submit_result_to_json(full));
    expect_true(f && !json_util::obj_bool(f.root, "ok").value_or(true), "not ok");
    expect_eq_str(json_util::obj_string(f.root, "error_kind").value_or(""), "queue_full", "error kind");
    expect_eq_str(json_util::obj_string(f.root, "error").value_or(""), "queue full", "error text");
    expect_true(!json_util::obj_get(f.root, "job_id"), "no id on rejection");
}

void test_spool_layout() {
    fs::path root = scratch("spool");
    ensure_spool_dirs(root);
    expect_true(fs::is_directory(root / "spool" / "processed"), "processed dir");
    expect_true(fs::is_directory(root / "spool" / "rejected"), "rejected dir");
    expect_true(fs::is_directory(root / "control"), "control dir");
    expect_true(wal_path(root) == root / "state" / "jobs.wal.jsonl", "wal path");

    std::string n = new_spool_name();
    expect_true(ends_with(n, ".json") && n.find('-') != std::string::npos, "spool name shape: " + n);
    expect_true(spool_result_path(root, "100-ab.json") == root / "spool" / "processed" / "100-ab.result.json",
                "result file next to processed requests");

    std::string err = write_atomic_file(root / "spool" / "200-b.json", "{}");
    expect_true(err.empty(), "write: " + err);
    err = write_atomic_file(root / "spool" / "100-a.json", "{}");
    expect_true(err.empty(), "write: " + err);
    err = write_atomic_file(root / "spool" / "notes.txt", "x");
    expect_true(err.empty(), "write: " + err);

    auto files = list_spool_json(root / "spool");
    expect_eq_ll((long long)files.size(), 2, "only json files, no subdirectories");
    expect_true(files[0].filename() == "100-a.json" && files[1].filename() == "200-b.json", "arrival order");
    expect_true(list_spool_json(root / "missing").empty(), "missing dir is empty");
}

void test_concurrency_control() {
    fs::path root = scratch("control");
    fs::path ctl = root / "concurrency";
    std::string err;

    expect_true(!read_concurrency_control(ctl, &err) && err.empty(), "absent file is not an error");

    expect_true(write_atomic_file(ctl, "3\n").empty(), "write");
    auto v = read_concurrency_control(ctl, &err);
    expect_true(v && *v == 3 && err.empty(), "three workers");

    expect_true(write_atomic_file(ctl, "lots").empty(), "write");
    expect_true(!read_concurrency_control(ctl, &err) && !err.empty(), "non-number rejected");

    err.clear();
    expect_true(write_atomic_file(ctl, "0").empty(), "write");
    expect_true(!read_concurrency_control(ctl, &err) && !err.empty(), "zero rejected");

    err.clear();
    expect_true(write_atomic_file(ctl, "2x").empty(), "write");
    expect_true(!read_concurrency_control(ctl, &err) && !err.empty(), "trailing junk rejected");
}

} // namespace

int main() {
    test_parse_submit();
    test_parse_resubmit_and_invalid();
    test_submit_result_json();
    test_spool_layout();
    test_concurrency_control();

    std::cerr << "test_runner_utils: ALL PASSED" << std::endl;
    return 0;
}
