#pragma once
#include "sheetrun/types.h"

#include <filesystem>
#include <optional>
#include <string>

namespace sheetrun {

inline constexpr const char* kOutputFileName = "normalized.csv";

// Fixed layout of jobs/<id>/.
struct JobPaths {
    std::filesystem::path root;

    std::filesystem::path input_dir() const { return root / "input"; }
    std::filesystem::path rules_dir() const { return root / "rules"; }
    std::filesystem::path vendor_dir() const { return root / "rules" / "vendor"; }
    std::filesystem::path output_dir() const { return root / "output"; }
    std::filesystem::path output_file() const { return root / "output" / kOutputFileName; }
    std::filesystem::path logs_dir() const { return root / "logs"; }
    std::filesystem::path artifact() const { return root / "logs" / "artifact.json"; }
    std::filesystem::path events() const { return root / "logs" / "events.ndjson"; }
    std::filesystem::path child_log() const { return root / "logs" / "child.log"; }
    std::filesystem::path install_log() const { return root / "logs" / "install.log"; }
    std::filesystem::path run_request() const { return root / "logs" / "run_request.json"; }
};

JobPaths job_paths(const std::filesystem::path& jobs_dir, const JobId& id);

// Creates the tree and copies `document` into input/ under its own file name.
// `input_sha256`, when given, receives the digest of the copy.
// On failure nothing is left behind. Returns empty string on success.
std::string prepare_job_dir(const JobPaths& p, const std::filesystem::path& document,
                            std::string* input_sha256 = nullptr);

// The single document in input/, if any.
std::optional<std::filesystem::path> find_input(const JobPaths& p);

// Checks what a successful job must contain: the input document (unchanged
// when `input_sha256` is non-empty), a parseable artifact with the expected
// schema and a normalized output file.
// Returns empty string when the directory is complete.
std::string verify_success_dir(const JobPaths& p, const std::string& input_sha256 = "");

} // namespace sheetrun
