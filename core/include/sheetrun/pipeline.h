#pragma once

// Pipeline interface used by the runhost (the child side of a job).
//
// A pipeline is a fixed list of named stages. run_pipeline() drives them in
// order: one stage.started / stage.completed event pair per stage, an artifact
// checkpoint after every stage, and a single pipeline.completed or
// pipeline.failed event at the end.

#include "sheetrun/artifact.h"
#include "sheetrun/events.h"

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sheetrun {

struct FieldSpec {
    std::string name;
    std::vector<std::string> synonyms;
    bool required{false};
};

// rules/manifest.json
struct Manifest {
    std::string name;
    std::string version;
    std::string pipeline;                    // "builtin.csv_mapper" | "command"
    std::vector<std::string> command;        // for "command"
    std::vector<FieldSpec> fields;
    std::string unmapped_prefix{"raw_"};
    double mapping_threshold{0.5};
};

std::string load_manifest(const std::filesystem::path& path, Manifest* out);

// logs/run_request.json, written by the launcher.
struct RunRequest {
    std::string job_id;
    int attempt{1};
    std::filesystem::path input;
    std::filesystem::path output;
    std::filesystem::path rules_dir;
    std::filesystem::path artifact;
    std::filesystem::path events;
    bool network_access{false};
    std::vector<std::pair<std::string, std::string>> dependencies;
};

std::string load_run_request(const std::filesystem::path& path, RunRequest* out);

struct PipelineContext {
    const RunRequest& req;
    const Manifest& manifest;
    ArtifactWriter& artifact;
    EventLog& events;
};

struct StageResult {
    bool ok{true};
    std::string code;          // short machine code, e.g. "no_table", "exit_1"
    int mirror_signal{0};      // user subprocess died from this signal

    static StageResult success() { return StageResult{}; }
    static StageResult failure(std::string c, int sig = 0) { return StageResult{false, std::move(c), sig}; }
};

class Pipeline {
public:
    virtual ~Pipeline() = default;
    virtual const char* name() const = 0;
    virtual std::vector<std::string> stages() const = 0;
    virtual StageResult run_stage(const std::string& stage, PipelineContext& ctx) = 0;
};

// nullptr for an unknown pipeline name. Implemented by sheetrun_pipelines.
std::unique_ptr<Pipeline> make_pipeline(const std::string& name);

std::unique_ptr<Pipeline> make_csv_mapper_pipeline();
std::unique_ptr<Pipeline> make_command_pipeline();

// Runs every stage and returns the process exit code for the runhost:
// 0, kExitPipelineFailed, or 128+sig when user code died from a signal.
int run_pipeline(Pipeline& p, PipelineContext& ctx);

} // namespace sheetrun
