#include "sheetrun/pipeline.h"
#include "sheetrun/json_util.h"
#include "sheetrun/resource_limits.h"
#include "sheetrun/util.h"

#include <iostream>

namespace sheetrun {

std::string load_manifest(const std::filesystem::path& path, Manifest* out) {
    if (!out) return "load_manifest: null output";
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return "manifest not found: " + path.string();

    json_util::Doc d = json_util::parse(slurp_file(path));
    if (!d || !json_object_is_type(d.root, json_type_object)) return "manifest is not a JSON object";

    Manifest m;
    m.name = json_util::obj_string(d.root, "name").value_or("");
    m.version = json_util::obj_string(d.root, "version").value_or("");
    m.pipeline = json_util::obj_string(d.root, "pipeline").value_or("builtin.csv_mapper");
    m.command = json_util::obj_strings(d.root, "command");
    m.unmapped_prefix = json_util::obj_string(d.root, "unmapped_prefix").value_or("raw_");
    m.mapping_threshold = json_util::obj_double(d.root, "mapping_threshold").value_or(0.5);

    json_object* fields = json_util::obj_get(d.root, "fields");
    if (fields && json_object_is_type(fields, json_type_array)) {
        const size_t n = json_object_array_length(fields);
        for (size_t i = 0; i < n; i++) {
            json_object* f = json_object_array_get_idx(fields, i);
            auto name = json_util::obj_string(f, "name");
            if (!name || name->empty()) return "manifest: field " + std::to_string(i) + " has no name";
            FieldSpec fs;
            fs.name = *name;
            fs.synonyms = json_util::obj_strings(f, "synonyms");
            fs.required = json_util::obj_bool(f, "required").value_or(false);
            m.fields.push_back(std::move(fs));
        }
    }

    if (m.pipeline == "command" && m.command.empty()) return "manifest: command pipeline without a command";
    *out = std::move(m);
    return "";
}

std::string load_run_request(const std::filesystem::path& path, RunRequest* out) {
    if (!out) return "load_run_request: null output";
    json_util::Doc d = json_util::parse(slurp_file(path));
    if (!d || !json_object_is_type(d.root, json_type_object)) return "run request missing or invalid: " + path.string();

    RunRequest r;
    r.job_id = json_util::obj_string(d.root, "job_id").value_or("");
    r.attempt = (int)json_util::obj_int(d.root, "attempt").value_or(1);
    r.input = json_util::obj_string(d.root, "input").value_or("");
    r.output = json_util::obj_string(d.root, "output").value_or("");
    r.rules_dir = json_util::obj_string(d.root, "rules_dir").value_or("");
    r.artifact = json_util::obj_string(d.root, "artifact").value_or("");
    r.events = json_util::obj_string(d.root, "events").value_or("");
    r.network_access = json_util::obj_bool(d.root, "network_access").value_or(false);

    json_object* deps = json_util::obj_get(d.root, "dependencies");
    if (deps && json_object_is_type(deps, json_type_array)) {
        const size_t n = json_object_array_length(deps);
        for (size_t i = 0; i < n; i++) {
            json_object* dep = json_object_array_get_idx(deps, i);
            auto name = json_util::obj_string(dep, "name");
            auto version = json_util::obj_string(dep, "version");
            if (name && version) r.dependencies.emplace_back(*name, *version);
        }
    }

    if (r.job_id.empty() || r.input.empty() || r.output.empty() || r.artifact.empty() || r.events.empty()) {
        return "run request incomplete";
    }
    *out = std::move(r);
    return "";
}

namespace {

void emit(EventLog& events, const std::string& event, const std::string& detail = "") {
    if (auto err = events.append(event, "", detail); !err.empty()) {
        std::cerr << "[runhost] events: " << err << "\n";
    }
}

} // namespace

int run_pipeline(Pipeline& p, PipelineContext& ctx) {
    ctx.artifact.set_status("running");
    if (auto err = ctx.artifact.checkpoint(); !err.empty()) {
        std::cerr << "[runhost] artifact: " << err << "\n";
    }

    for (const auto& stage : p.stages()) {
        emit(ctx.events, "stage.started", stage);
        const int64_t t0 = now_ms();
        StageResult r = p.run_stage(stage, ctx);
        const int64_t dt = now_ms() - t0;

        if (!r.ok) {
            ctx.artifact.record_stage(stage, "failed", dt);
            ctx.artifact.set_error(r.code, stage);
            ctx.artifact.set_status("failed");
            if (auto err = ctx.artifact.checkpoint(); !err.empty()) {
                std::cerr << "[runhost] artifact: " << err << "\n";
            }
            emit(ctx.events, "stage.failed", stage + ": " + r.code);
            emit(ctx.events, "pipeline.failed", stage);
            std::cerr << "[runhost] stage " << stage << " failed: " << r.code << "\n";
            if (r.mirror_signal > 0) return 128 + r.mirror_signal;
            return kExitPipelineFailed;
        }

        ctx.artifact.record_stage(stage, "succeeded", dt);
        if (auto err = ctx.artifact.checkpoint(); !err.empty()) {
            std::cerr << "[runhost] artifact: " << err << "\n";
        }
        emit(ctx.events, "stage.completed", stage);
    }

    ctx.artifact.set_status("succeeded");
    if (auto err = ctx.artifact.checkpoint(); !err.empty()) {
        std::cerr << "[runhost] artifact: " << err << "\n";
        emit(ctx.events, "pipeline.failed", "artifact");
        return kExitPipelineFailed;
    }
    emit(ctx.events, "pipeline.completed");
    return 0;
}

} // namespace sheetrun
