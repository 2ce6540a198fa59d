#include "sheetrun/artifact.h"
#include "sheetrun/json_util.h"
#include "sheetrun/util.h"

#include <algorithm>
#include <cmath>

namespace sheetrun {

std::optional<ScorePayload> score_payload_from_json(json_object* v) {
    if (!v) return std::nullopt;
    if (json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int)) {
        return ScorePayload{json_object_get_double(v)};
    }
    if (!json_object_is_type(v, json_type_object)) return std::nullopt;

    std::map<std::string, double> m;
    json_object_object_foreach(v, key, val) {
        if (!(json_object_is_type(val, json_type_double) || json_object_is_type(val, json_type_int))) {
            return std::nullopt;
        }
        m[key] = json_object_get_double(val);
    }
    return ScorePayload{std::move(m)};
}

std::optional<ScoreRecord> normalize_score(const ScorePayload& p, const std::string& candidate) {
    if (const double* d = std::get_if<double>(&p)) {
        if (!std::isfinite(*d) || candidate.empty()) return std::nullopt;
        ScoreRecord r;
        r.field = candidate;
        r.score = *d;
        r.contributions.emplace_back(candidate, *d);
        return r;
    }

    const auto& m = std::get<std::map<std::string, double>>(p);
    if (m.empty()) return std::nullopt;

    ScoreRecord r;
    bool first = true;
    for (const auto& [field, score] : m) {
        if (!std::isfinite(score)) return std::nullopt;
        r.contributions.emplace_back(field, score);
        // map order is lexicographic, so strict > keeps the first of a tie
        if (first || score > r.score) {
            r.field = field;
            r.score = score;
            first = false;
        }
    }
    return r;
}

std::string a1_ref(int row, int column) {
    std::string letters;
    int c = column + 1;
    while (c > 0) {
        int rem = (c - 1) % 26;
        letters.insert(letters.begin(), (char)('A' + rem));
        c = (c - 1) / 26;
    }
    return letters + std::to_string(row + 1);
}

ArtifactWriter::ArtifactWriter(std::filesystem::path path, JobId job_id)
    : path_(std::move(path)), job_id_(std::move(job_id)), started_ms_(now_ms()) {}

void ArtifactWriter::set_status(const std::string& status) { status_ = status; }

void ArtifactWriter::set_rules(const std::string& name, const std::string& version, const std::string& pipeline) {
    rules_name_ = name;
    rules_version_ = version;
    pipeline_ = pipeline;
}

void ArtifactWriter::set_dependencies(std::vector<std::pair<std::string, std::string>> deps) {
    deps_ = std::move(deps);
}

void ArtifactWriter::add_table(const TableInfo& t) {
    TableEntry e;
    e.info = t;
    tables_.push_back(std::move(e));
}

void ArtifactWriter::add_mapping(const std::string& table_id, MappingDecision d) {
    for (auto& t : tables_) {
        if (t.info.id == table_id) {
            t.mapping.push_back(std::move(d));
            return;
        }
    }
}

void ArtifactWriter::add_issue(const std::string& table_id, Issue i) {
    for (auto& t : tables_) {
        if (t.info.id == table_id) {
            t.issues.push_back(std::move(i));
            return;
        }
    }
}

void ArtifactWriter::record_stage(const std::string& stage, const std::string& status, int64_t duration_ms) {
    passes_.push_back(StagePass{stage, status, duration_ms});
}

void ArtifactWriter::set_error(const std::string& code, const std::string& stage) {
    error_code_ = code;
    error_stage_ = stage;
}

static json_object* score_to_json(const ScoreRecord& s) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "field", json_util::new_string(s.field));
    json_object_object_add(o, "score", json_object_new_double(s.score));
    json_object* contrib = json_object_new_array();
    for (const auto& [field, score] : s.contributions) {
        json_object* c = json_object_new_object();
        json_object_object_add(c, "field", json_util::new_string(field));
        json_object_object_add(c, "score", json_object_new_double(score));
        json_object_array_add(contrib, c);
    }
    json_object_object_add(o, "contributions", contrib);
    return o;
}

std::string ArtifactWriter::to_json(bool pretty) const {
    json_util::Doc doc(json_object_new_object());
    json_object* root = doc.root;

    json_object_object_add(root, "schema", json_object_new_string(kArtifactSchema));
    json_object_object_add(root, "job_id", json_util::new_string(job_id_));
    json_object_object_add(root, "status", json_util::new_string(status_));
    json_object_object_add(root, "started_at", json_util::new_string(iso_from_ms(started_ms_)));
    json_object_object_add(root, "updated_at", json_util::new_string(iso_from_ms(now_ms())));

    json_object* rules = json_object_new_object();
    json_object_object_add(rules, "name", json_util::new_string(rules_name_));
    json_object_object_add(rules, "version", json_util::new_string(rules_version_));
    json_object_object_add(rules, "pipeline", json_util::new_string(pipeline_));
    json_object_object_add(root, "rules", rules);

    json_object* deps = json_object_new_array();
    for (const auto& [name, version] : deps_) {
        json_object* d = json_object_new_object();
        json_object_object_add(d, "name", json_util::new_string(name));
        json_object_object_add(d, "version", json_util::new_string(version));
        json_object_array_add(deps, d);
    }
    json_object_object_add(root, "dependencies", deps);

    json_object* tables = json_object_new_array();
    for (const auto& t : tables_) {
        json_object* jt = json_object_new_object();
        json_object_object_add(jt, "id", json_util::new_string(t.info.id));
        json_object_object_add(jt, "header_row", json_object_new_int(t.info.header_row));
        json_object_object_add(jt, "column_count", json_object_new_int(t.info.column_count));
        json_object_object_add(jt, "row_count", json_object_new_int(t.info.row_count));
        int last_row = t.info.last_data_row >= 0 ? t.info.last_data_row : t.info.header_row;
        int last_col = t.info.column_count > 0 ? t.info.column_count - 1 : 0;
        json_object_object_add(jt, "range", json_util::new_string(
            a1_ref(t.info.header_row, 0) + ":" + a1_ref(last_row, last_col)));

        json_object* mapping = json_object_new_array();
        for (const auto& m : t.mapping) {
            json_object* jm = json_object_new_object();
            json_object_object_add(jm, "column_index", json_object_new_int(m.column_index));
            json_object_object_add(jm, "header_class", json_util::new_string(m.header_class));
            if (m.field.empty()) {
                json_object_object_add(jm, "field", json_object_new_string("unmapped"));
                json_object_object_add(jm, "mapped", json_object_new_boolean(0));
            } else {
                json_object_object_add(jm, "field", json_util::new_string(m.field));
                json_object_object_add(jm, "mapped", json_object_new_boolean(1));
            }
            json_object_object_add(jm, "score", m.score ? score_to_json(*m.score) : nullptr);
            json_object_array_add(mapping, jm);
        }
        json_object_object_add(jt, "mapping", mapping);

        json_object* issues = json_object_new_array();
        for (const auto& i : t.issues) {
            json_object* ji = json_object_new_object();
            json_object_object_add(ji, "row", json_object_new_int(i.row));
            json_object_object_add(ji, "column", json_object_new_int(i.column));
            json_object_object_add(ji, "a1", json_util::new_string(a1_ref(i.row, i.column)));
            json_object_object_add(ji, "code", json_util::new_string(i.code));
            json_object_object_add(ji, "severity", json_util::new_string(i.severity));
            if (!i.field.empty()) json_object_object_add(ji, "field", json_util::new_string(i.field));
            json_object_array_add(issues, ji);
        }
        json_object_object_add(jt, "issues", issues);

        json_object_array_add(tables, jt);
    }
    json_object_object_add(root, "tables", tables);

    json_object* passes = json_object_new_array();
    for (const auto& p : passes_) {
        json_object* jp = json_object_new_object();
        json_object_object_add(jp, "stage", json_util::new_string(p.stage));
        json_object_object_add(jp, "status", json_util::new_string(p.status));
        json_object_object_add(jp, "duration_ms", json_object_new_int64(p.duration_ms));
        json_object_array_add(passes, jp);
    }
    json_object_object_add(root, "pass_history", passes);

    json_object_object_add(root, "dropped_records", json_object_new_int(dropped_records_));

    if (!error_code_.empty()) {
        json_object* err = json_object_new_object();
        json_object_object_add(err, "code", json_util::new_string(error_code_));
        json_object_object_add(err, "stage", json_util::new_string(error_stage_));
        json_object_object_add(root, "error", err);
    }

    return json_util::to_string(root, pretty);
}

std::string ArtifactWriter::checkpoint() const {
    return write_atomic_file(path_, to_json(true) + "\n");
}

} // namespace sheetrun
