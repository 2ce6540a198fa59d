#include "sheetrun/artifact.h"
#include "sheetrun/events.h"
#include "sheetrun/pipeline.h"
#include "sheetrun/resource_limits.h"

#include <filesystem>
#include <iostream>
#include <new>
#include <string>

using namespace sheetrun;

// Records a failure that happened before any stage ran.
static void fail_before_stages(ArtifactWriter& artifact, EventLog& events, const std::string& code) {
    artifact.set_status("failed");
    artifact.set_error(code, "load_rules");
    if (auto err = artifact.checkpoint(); !err.empty()) {
        std::cerr << "[runhost] artifact: " << err << "\n";
    }
    if (auto err = events.append("pipeline.failed", "", "load_rules"); !err.empty()) {
        std::cerr << "[runhost] events: " << err << "\n";
    }
}

// Child side of a job. Spawned by the supervisor inside the job sandbox:
//
//   sheetrun_runhost --request <job>/logs/run_request.json
//
// Exit codes: 0 ok, 2 pipeline failed, 3 out of memory, 4 setup error,
// 128+sig when user code died from a signal.
static int run(const std::filesystem::path& request_path) {
    RunRequest req;
    if (auto err = load_run_request(request_path, &req); !err.empty()) {
        std::cerr << "[runhost] " << err << "\n";
        return kExitRunhostError;
    }

    EventLog events(req.events, req.job_id, EventSource::Child);
    ArtifactWriter artifact(req.artifact, req.job_id);
    artifact.set_dependencies(req.dependencies);

    Manifest manifest;
    if (auto err = load_manifest(req.rules_dir / "manifest.json", &manifest); !err.empty()) {
        std::cerr << "[runhost] " << err << "\n";
        fail_before_stages(artifact, events, "manifest_invalid");
        return kExitRunhostError;
    }
    artifact.set_rules(manifest.name, manifest.version, manifest.pipeline);

    auto pipeline = make_pipeline(manifest.pipeline);
    if (!pipeline) {
        std::cerr << "[runhost] unknown pipeline: " << manifest.pipeline << "\n";
        fail_before_stages(artifact, events, "unknown_pipeline");
        return kExitPipelineFailed;
    }

    PipelineContext ctx{req, manifest, artifact, events};
    try {
        return run_pipeline(*pipeline, ctx);
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[runhost] pipeline raised: " << e.what() << "\n";
        artifact.set_status("failed");
        artifact.set_error("exception", "pipeline");
        if (auto err = artifact.checkpoint(); !err.empty()) {
            std::cerr << "[runhost] artifact: " << err << "\n";
        }
        if (auto err = events.append("pipeline.failed", "", "exception"); !err.empty()) {
            std::cerr << "[runhost] events: " << err << "\n";
        }
        return kExitPipelineFailed;
    }
}

int main(int argc, char** argv) {
    if (argc != 3 || std::string(argv[1]) != "--request") {
        std::cerr << "usage:\n  sheetrun_runhost --request <run_request.json>\n";
        return kExitRunhostError;
    }
    try {
        return run(argv[2]);
    } catch (const std::bad_alloc&) {
        // Under RLIMIT_AS; anything more than a fixed write may fail again.
        static const char msg[] = "[runhost] out of memory\n";
        std::cerr.write(msg, sizeof(msg) - 1);
        return kExitOutOfMemory;
    } catch (const std::exception& e) {
        std::cerr << "[runhost] " << e.what() << "\n";
        return kExitRunhostError;
    }
}
