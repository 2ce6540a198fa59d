#pragma once
#include "sheetrun/types.h"

#include <json-c/json.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sheetrun {

inline constexpr const char* kArtifactSchema = "sheetrun.artifact/v1";

// Score payload as rule code returns it: a bare number for the candidate
// field, or a map of field -> score.
using ScorePayload = std::variant<double, std::map<std::string, double>>;

// Normalized form stored in the artifact.
struct ScoreRecord {
    std::string field;                                   // best field
    double score{0.0};
    std::vector<std::pair<std::string, double>> contributions;
};

// Accepts a JSON number or an object whose values are all numbers.
// Anything else yields nullopt (the caller drops and counts the record).
std::optional<ScorePayload> score_payload_from_json(json_object* v);

// Bare number: {candidate, value, [(candidate, value)]}.
// Map: the highest score wins; ties go to the lexicographically first field.
// An empty map or a non-finite value yields nullopt.
std::optional<ScoreRecord> normalize_score(const ScorePayload& p, const std::string& candidate);

// Spreadsheet-style cell reference, zero-based inputs: (0, 0) -> "A1".
std::string a1_ref(int row, int column);

struct TableInfo {
    std::string id;           // "table_1"
    int header_row{0};        // zero-based
    int first_data_row{0};
    int last_data_row{-1};    // -1 when there are no data rows
    int column_count{0};
    int row_count{0};         // data rows
};

struct MappingDecision {
    int column_index{0};
    std::string header_class;   // "header" | "blank"
    std::string field;          // empty: unmapped
    std::optional<ScoreRecord> score;
};

struct Issue {
    int row{0};                 // zero-based, in sheet coordinates
    int column{0};
    std::string code;           // "required_missing", ...
    std::string severity;       // "error" | "warning"
    std::string field;
};

// Builds logs/artifact.json incrementally inside the child.
//
// Holds only structure: coordinates, counts, field names from the catalogue,
// codes. Cell values never enter it. checkpoint() rewrites the whole document
// atomically so a reader sees either the previous or the next stage.
class ArtifactWriter {
public:
    ArtifactWriter(std::filesystem::path path, JobId job_id);

    void set_status(const std::string& status);   // "running" | "succeeded" | "failed"
    void set_rules(const std::string& name, const std::string& version, const std::string& pipeline);
    void set_dependencies(std::vector<std::pair<std::string, std::string>> deps);

    void add_table(const TableInfo& t);
    // Unknown table ids are ignored.
    void add_mapping(const std::string& table_id, MappingDecision d);
    void add_issue(const std::string& table_id, Issue i);

    void note_dropped_record() { dropped_records_++; }
    int dropped_records() const { return dropped_records_; }

    void record_stage(const std::string& stage, const std::string& status, int64_t duration_ms);
    void set_error(const std::string& code, const std::string& stage);

    std::string to_json(bool pretty = true) const;

    // Atomic write (tmp + fsync + rename). Returns empty string on success.
    std::string checkpoint() const;

    const std::filesystem::path& path() const { return path_; }

private:
    struct TableEntry {
        TableInfo info;
        std::vector<MappingDecision> mapping;
        std::vector<Issue> issues;
    };
    struct StagePass {
        std::string stage;
        std::string status;
        int64_t duration_ms{0};
    };

    std::filesystem::path path_;
    JobId job_id_;
    std::string status_{"running"};
    std::string rules_name_, rules_version_, pipeline_;
    std::vector<std::pair<std::string, std::string>> deps_;
    std::vector<TableEntry> tables_;
    std::vector<StagePass> passes_;
    std::string error_code_, error_stage_;
    int dropped_records_{0};
    int64_t started_ms_{0};
};

} // namespace sheetrun
