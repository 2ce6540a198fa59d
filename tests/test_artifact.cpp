#include "test_common.h"

#include "sheetrun/artifact.h"
#include "sheetrun/json_util.h"
#include "sheetrun/util.h"

#include <cmath>
#include <filesystem>
#include <limits>

using namespace sheetrun;

int main() {
    namespace fs = std::filesystem;

    // Test 1: bare number scores belong to the candidate field
    {
        auto r = normalize_score(ScorePayload{0.75}, "email");
        expect_true(r && r->field == "email", "bare score keeps candidate");
        expect_true(std::fabs(r->score - 0.75) < 1e-9, "bare score value");
        expect_eq_ll((long long)r->contributions.size(), 1, "one contribution");
        expect_true(!normalize_score(ScorePayload{0.75}, ""), "bare score without candidate is dropped");
        expect_true(!normalize_score(ScorePayload{std::numeric_limits<double>::quiet_NaN()}, "email"),
                    "NaN is dropped");
    }

    // Test 2: maps pick the best field, ties go to the lexicographically first
    {
        std::map<std::string, double> m = {{"phone", 0.4}, {"name", 0.9}, {"email", 0.9}};
        auto r = normalize_score(ScorePayload{m}, "");
        expect_true(r && r->field == "email", "tie resolved to first field");
        expect_eq_ll((long long)r->contributions.size(), 3, "all contributions kept");
        expect_true(!normalize_score(ScorePayload{std::map<std::string, double>{}}, "x"), "empty map dropped");
    }

    // Test 3: JSON payloads: numbers and numeric objects only
    {
        json_util::Doc d = json_util::parse(
            "{\"num\":0.5,\"obj\":{\"a\":1,\"b\":0.25},\"bad\":{\"a\":\"high\"},\"str\":\"0.5\"}");
        expect_true(static_cast<bool>(d), "payload fixture parses");
        expect_true(score_payload_from_json(json_util::obj_get(d.root, "num")).has_value(), "number accepted");
        auto p = score_payload_from_json(json_util::obj_get(d.root, "obj"));
        expect_true(p && std::holds_alternative<std::map<std::string, double>>(*p), "object accepted as map");
        expect_true(!score_payload_from_json(json_util::obj_get(d.root, "bad")), "non-numeric value rejected");
        expect_true(!score_payload_from_json(json_util::obj_get(d.root, "str")), "string rejected");
    }

    expect_true(a1_ref(0, 0) == "A1", "A1");
    expect_true(a1_ref(9, 27) == "AB10", "AB10");

    // Test 4: writer output holds structure, coordinates and codes
    {
        fs::path dir = fs::temp_directory_path() / "sheetrun_test_artifact";
        std::error_code ec;
        fs::remove_all(dir, ec);
        fs::create_directories(dir, ec);

        ArtifactWriter w(dir / "artifact.json", "job7");
        w.set_rules("contacts", "1.2.0", "builtin.csv_mapper");
        w.set_dependencies({{"phonenumbers", "8.13.0"}});
        TableInfo t;
        t.id = "table_1";
        t.header_row = 0;
        t.first_data_row = 1;
        t.last_data_row = 3;
        t.column_count = 2;
        t.row_count = 3;
        w.add_table(t);

        MappingDecision mapped;
        mapped.column_index = 0;
        mapped.header_class = "header";
        mapped.field = "email";
        mapped.score = normalize_score(ScorePayload{1.0}, "email");
        w.add_mapping("table_1", mapped);
        MappingDecision unmapped;
        unmapped.column_index = 1;
        unmapped.header_class = "header";
        w.add_mapping("table_1", unmapped);
        w.add_mapping("nope", unmapped);

        Issue i;
        i.row = 2;
        i.column = 0;
        i.code = "required_missing";
        i.severity = "error";
        i.field = "email";
        w.add_issue("table_1", i);
        w.note_dropped_record();
        w.record_stage("detect_table", "succeeded", 3);
        w.set_error("no_table", "detect_table");
        w.set_status("failed");

        std::string err = w.checkpoint();
        expect_true(err.empty(), "checkpoint: " + err);

        json_util::Doc d = json_util::parse(slurp_file(dir / "artifact.json"));
        expect_true(static_cast<bool>(d), "artifact parses");
        expect_true(json_util::obj_string(d.root, "schema").value_or("") == kArtifactSchema, "schema");
        expect_true(json_util::obj_string(d.root, "status").value_or("") == "failed", "status");
        expect_eq_ll(json_util::obj_int(d.root, "dropped_records").value_or(-1), 1, "dropped count");

        json_object* tables = json_util::obj_get(d.root, "tables");
        expect_true(tables && json_object_array_length(tables) == 1, "one table");
        json_object* t0 = json_object_array_get_idx(tables, 0);
        json_object* mapping = json_util::obj_get(t0, "mapping");
        expect_eq_ll((long long)json_object_array_length(mapping), 2, "unknown table id ignored");
        json_object* m1 = json_object_array_get_idx(mapping, 1);
        expect_true(json_util::obj_string(m1, "field").value_or("") == "unmapped", "unmapped marker");
        expect_true(!json_util::obj_bool(m1, "mapped").value_or(true), "mapped=false");

        json_object* issue = json_object_array_get_idx(json_util::obj_get(t0, "issues"), 0);
        expect_true(json_util::obj_string(issue, "a1").value_or("") == "A3", "issue coordinates");

        json_object* e = json_util::obj_get(d.root, "error");
        expect_true(json_util::obj_string(e, "stage").value_or("") == "detect_table", "error stage");

        fs::remove_all(dir, ec);
    }

    std::cerr << "test_artifact: ALL PASSED" << std::endl;
    return 0;
}
