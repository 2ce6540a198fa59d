#include "sheetrun/json_util.h"
#include "sheetrun/pipeline.h"
#include "sheetrun/proc.h"
#include "sheetrun/util.h"
#include "sheetrun/wal.h"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <set>

extern char** environ;

namespace sheetrun {

namespace {

// Looks `prog` up like execvp would; names with a slash resolve against `base`.
std::filesystem::path resolve_program(const std::string& prog, const std::filesystem::path& base) {
    if (prog.find('/') != std::string::npos) {
        std::filesystem::path p(prog);
        return p.is_absolute() ? p : base / p;
    }
    std::string path = getenv_str("PATH", "/usr/bin:/bin");
    size_t start = 0;
    while (start <= path.size()) {
        size_t colon = path.find(':', start);
        std::string dir = path.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
        if (!dir.empty()) {
            std::filesystem::path cand = std::filesystem::path(dir) / prog;
            std::error_code ec;
            if (std::filesystem::is_regular_file(cand, ec)) return cand;
        }
        if (colon == std::string::npos) break;
        start = colon + 1;
    }
    return {};
}

// Codes are identifiers: [a-z0-9_.], at most 64 chars.
bool is_code(const std::string& s) {
    if (s.empty() || s.size() > 64) return false;
    for (unsigned char c : s) {
        if (!(std::islower(c) || std::isdigit(c) || c == '_' || c == '.')) return false;
    }
    return true;
}

// Runs the manifest's entrypoint inside the job sandbox (the runhost is
// already under the budget and the network gate; the entrypoint inherits
// both). Each stdout line that is a JSON object with "type" of "mapping",
// "issue" or "table" becomes an artifact record; other lines are ignored.
class CommandPipeline : public Pipeline {
public:
    const char* name() const override { return "command"; }

    std::vector<std::string> stages() const override {
        return {"run_entrypoint", "collect_records", "check_output"};
    }

    StageResult run_stage(const std::string& stage, PipelineContext& ctx) override {
        if (stage == "run_entrypoint") return run_entrypoint(ctx);
        if (stage == "collect_records") return collect_records(ctx);
        if (stage == "check_output") return check_output(ctx);
        return StageResult::failure("unknown_stage");
    }

private:
    StageResult run_entrypoint(PipelineContext& ctx) {
        const auto& cmd = ctx.manifest.command;
        auto prog = resolve_program(cmd[0], ctx.req.rules_dir);
        if (prog.empty()) return StageResult::failure("entrypoint_not_found");

        record_log_ = ctx.req.events.parent_path() / "entrypoint.log";

        SpawnSpec spec;
        spec.argv = cmd;
        spec.argv[0] = prog.string();
        for (char** e = environ; e && *e; e++) spec.env.emplace_back(*e);
        spec.cwd = ctx.req.rules_dir.parent_path();
        spec.log_path = record_log_;
        // the supervisor's timeout kills the runhost group; the entrypoint
        // and anything it forks must be in it
        spec.new_process_group = false;
        // Limits were applied to this process already and are inherited.
        spec.budget.cpu_seconds = 0;
        spec.budget.memory_mb = 0;
        spec.budget.output_mb = 0;
        spec.budget.max_open_files = 0;
        spec.budget.max_processes = 0;

        std::unique_ptr<ChildHandle> child;
        std::string err = spawn_child(spec, &child);
        if (!err.empty()) {
            std::cerr << "[runhost] entrypoint: " << err << "\n";
            return StageResult::failure("entrypoint_launch_failed");
        }

        WaitResult w = child->wait(0);
        if (w.term_signal != 0) {
            return StageResult::failure("signal_" + std::to_string(w.term_signal), w.term_signal);
        }
        if (w.exit_code != 0) return StageResult::failure("exit_" + std::to_string(w.exit_code));
        return StageResult::success();
    }

    void add_table_once(PipelineContext& ctx, const TableInfo& t) {
        if (tables_.count(t.id)) return;
        ctx.artifact.add_table(t);
        tables_.insert(t.id);
    }

    // Records name their table; unknown or missing names land in table_1.
    std::string table_for(PipelineContext& ctx, json_object* rec) {
        std::string id = json_util::obj_string(rec, "table").value_or(kDefaultTable);
        if (tables_.count(id)) return id;
        TableInfo d;
        d.id = kDefaultTable;
        add_table_once(ctx, d);
        return kDefaultTable;
    }

    // Field names must come from the manifest catalogue, or be identifiers
    // when it declares none, so user code cannot smuggle cell text into the
    // artifact.
    bool known_field(PipelineContext& ctx, const std::string& f) const {
        if (f.empty()) return true;
        if (ctx.manifest.fields.empty()) return is_code(f);
        for (const auto& spec : ctx.manifest.fields) {
            if (spec.name == f) return true;
        }
        return false;
    }

    bool known_fields(PipelineContext& ctx, const ScoreRecord& r) const {
        if (!known_field(ctx, r.field)) return false;
        for (const auto& c : r.contributions) {
            if (!known_field(ctx, c.first)) return false;
        }
        return true;
    }

    StageResult collect_records(PipelineContext& ctx) {
        for (const auto& line : Wal::read_lines(record_log_)) {
            if (line.empty() || line[0] != '{') continue;
            json_util::Doc d = json_util::parse(line);
            if (!d || !json_object_is_type(d.root, json_type_object)) continue;
            std::string type = json_util::obj_string(d.root, "type").value_or("");

            if (type == "table") {
                auto id = json_util::obj_string(d.root, "id");
                if (!id || !is_code(*id)) { ctx.artifact.note_dropped_record(); continue; }
                TableInfo t;
                t.id = *id;
                t.header_row = (int)json_util::obj_int(d.root, "header_row").value_or(0);
                t.column_count = (int)json_util::obj_int(d.root, "column_count").value_or(0);
                t.row_count = (int)json_util::obj_int(d.root, "row_count").value_or(0);
                t.first_data_row = t.header_row + 1;
                t.last_data_row = t.row_count > 0 ? t.header_row + t.row_count : -1;
                add_table_once(ctx, t);
            } else if (type == "mapping") {
                auto col = json_util::obj_int(d.root, "column");
                if (!col || *col < 0) { ctx.artifact.note_dropped_record(); continue; }
                MappingDecision m;
                m.column_index = (int)*col;
                m.field = json_util::obj_string(d.root, "field").value_or("");
                m.header_class = json_util::obj_string(d.root, "header_class").value_or("header");
                if (!known_field(ctx, m.field) || (m.header_class != "header" && m.header_class != "blank")) {
                    ctx.artifact.note_dropped_record();
                    continue;
                }
                if (json_object* sv = json_util::obj_get(d.root, "score")) {
                    auto payload = score_payload_from_json(sv);
                    if (!payload) { ctx.artifact.note_dropped_record(); continue; }
                    m.score = normalize_score(*payload, m.field);
                    if (!m.score || !known_fields(ctx, *m.score)) { ctx.artifact.note_dropped_record(); continue; }
                }
                ctx.artifact.add_mapping(table_for(ctx, d.root), std::move(m));
            } else if (type == "issue") {
                auto row = json_util::obj_int(d.root, "row");
                auto col = json_util::obj_int(d.root, "column");
                auto code = json_util::obj_string(d.root, "code");
                if (!row || !col || *row < 0 || *col < 0 || !code || !is_code(*code)) {
                    ctx.artifact.note_dropped_record();
                    continue;
                }
                Issue i;
                i.row = (int)*row;
                i.column = (int)*col;
                i.code = *code;
                i.severity = json_util::obj_string(d.root, "severity").value_or("error");
                if (i.severity != "error" && i.severity != "warning") i.severity = "error";
                i.field = json_util::obj_string(d.root, "field").value_or("");
                if (!known_field(ctx, i.field)) { ctx.artifact.note_dropped_record(); continue; }
                ctx.artifact.add_issue(table_for(ctx, d.root), std::move(i));
            }
        }
        return StageResult::success();
    }

    StageResult check_output(PipelineContext& ctx) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(ctx.req.output, ec)) return StageResult::failure("output_missing");
        return StageResult::success();
    }

    static constexpr const char* kDefaultTable = "table_1";

    std::filesystem::path record_log_;
    std::set<std::string> tables_;
};

} // namespace

std::unique_ptr<Pipeline> make_command_pipeline() {
    return std::make_unique<CommandPipeline>();
}

} // namespace sheetrun
