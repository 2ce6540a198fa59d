#include "sheetrun/job_dir.h"
#include "sheetrun/artifact.h"
#include "sheetrun/digest.h"
#include "sheetrun/json_util.h"
#include "sheetrun/util.h"

#include <sys/stat.h>

namespace sheetrun {

JobPaths job_paths(const std::filesystem::path& jobs_dir, const JobId& id) {
    JobPaths p;
    p.root = jobs_dir / id;
    return p;
}

std::string prepare_job_dir(const JobPaths& p, const std::filesystem::path& document,
                            std::string* input_sha256) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(document, ec)) {
        return "document not found: " + document.string();
    }
    if (std::filesystem::exists(p.root, ec)) {
        return "job directory already exists: " + p.root.string();
    }

    auto fail = [&](const std::string& msg) {
        std::error_code rec;
        std::filesystem::remove_all(p.root, rec);
        return msg;
    };

    for (const auto& d : {p.input_dir(), p.rules_dir(), p.output_dir(), p.logs_dir()}) {
        std::filesystem::create_directories(d, ec);
        if (ec) return fail("create " + d.string() + ": " + ec.message());
    }
    ::chmod(p.root.c_str(), 0700);

    auto dst = p.input_dir() / document.filename();
    std::filesystem::copy_file(document, dst, std::filesystem::copy_options::none, ec);
    if (ec) return fail("copy document: " + ec.message());
    // input is never rewritten by the child
    std::filesystem::permissions(dst, std::filesystem::perms::owner_read, ec);

    if (input_sha256) {
        std::string err = sha256_file(dst, input_sha256);
        if (!err.empty()) return fail("digest document: " + err);
    }
    return "";
}

std::optional<std::filesystem::path> find_input(const JobPaths& p) {
    std::error_code ec;
    if (!std::filesystem::is_directory(p.input_dir(), ec)) return std::nullopt;
    for (const auto& e : std::filesystem::directory_iterator(p.input_dir(), ec)) {
        if (e.is_regular_file(ec)) return e.path();
    }
    return std::nullopt;
}

std::string verify_success_dir(const JobPaths& p, const std::string& input_sha256) {
    auto input = find_input(p);
    if (!input) return "input document missing";
    if (!input_sha256.empty()) {
        std::string now;
        std::string err = sha256_file(*input, &now);
        if (!err.empty()) return "input document unreadable";
        if (now != input_sha256) return "input document modified";
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(p.artifact(), ec)) return "artifact missing";
    json_util::Doc d = json_util::parse(slurp_file(p.artifact()));
    if (!d) return "artifact is not valid JSON";
    if (json_util::obj_string(d.root, "schema").value_or("") != kArtifactSchema) {
        return "artifact schema mismatch";
    }

    if (!std::filesystem::is_regular_file(p.output_file(), ec)) return "normalized output missing";
    return "";
}

} // namespace sheetrun
