#include "sheetrun/csv.h"
#include "sheetrun/pipeline.h"
#include "sheetrun/util.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace sheetrun {

namespace {

// Lowercase, keep letters and digits only: "E-Mail Address" -> "emailaddress".
std::string normalize_header(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c)) out.push_back((char)std::tolower(c));
    }
    return out;
}

// Builtin pipeline: CSV input, synonym-based column mapping.
//
// Stages:
//   detect_table  first non-blank row is the header, later non-blank rows are data
//   map_columns   one decision per column; exact synonym 1.0, containment 0.6
//   validate      required fields present and non-empty, coordinates only
//   write_output  mapped columns in input order, then unmapped as <prefix><header>
class CsvMapperPipeline : public Pipeline {
public:
    const char* name() const override { return "builtin.csv_mapper"; }

    std::vector<std::string> stages() const override {
        return {"detect_table", "map_columns", "validate", "write_output"};
    }

    StageResult run_stage(const std::string& stage, PipelineContext& ctx) override {
        if (stage == "detect_table") return detect_table(ctx);
        if (stage == "map_columns") return map_columns(ctx);
        if (stage == "validate") return validate(ctx);
        if (stage == "write_output") return write_output(ctx);
        return StageResult::failure("unknown_stage");
    }

private:
    struct DataRow {
        int sheet_row{0};
        csv::Row cells;
    };

    StageResult detect_table(PipelineContext& ctx) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(ctx.req.input, ec)) return StageResult::failure("input_missing");

        auto rows = csv::parse(slurp_file(ctx.req.input));
        int header_at = -1;
        for (size_t i = 0; i < rows.size(); i++) {
            if (!csv::row_is_blank(rows[i])) {
                header_at = (int)i;
                break;
            }
        }
        if (header_at < 0) return StageResult::failure("no_table");

        header_ = rows[(size_t)header_at];
        header_row_ = header_at;
        for (size_t i = (size_t)header_at + 1; i < rows.size(); i++) {
            if (csv::row_is_blank(rows[i])) continue;
            data_.push_back(DataRow{(int)i, rows[i]});
        }

        TableInfo t;
        t.id = kTableId;
        t.header_row = header_row_;
        t.first_data_row = header_row_ + 1;
        t.last_data_row = data_.empty() ? -1 : data_.back().sheet_row;
        t.column_count = (int)header_.size();
        t.row_count = (int)data_.size();
        ctx.artifact.add_table(t);
        return StageResult::success();
    }

    StageResult map_columns(PipelineContext& ctx) {
        const auto& fields = ctx.manifest.fields;
        std::set<std::string> taken;
        column_field_.assign(header_.size(), "");

        for (size_t col = 0; col < header_.size(); col++) {
            const std::string h = normalize_header(header_[col]);

            MappingDecision d;
            d.column_index = (int)col;
            d.header_class = h.empty() ? "blank" : "header";

            std::map<std::string, double> scores;
            if (!h.empty()) {
                for (const auto& f : fields) {
                    double best = 0.0;
                    std::vector<std::string> names = f.synonyms;
                    names.push_back(f.name);
                    for (const auto& syn : names) {
                        std::string s = normalize_header(syn);
                        if (s.empty()) continue;
                        if (s == h) best = std::max(best, 1.0);
                        else if (h.find(s) != std::string::npos) best = std::max(best, 0.6);
                    }
                    if (best > 0.0) scores[f.name] = best;
                }
            }

            if (!scores.empty()) {
                // Fields already claimed by an earlier column cannot win again.
                std::map<std::string, double> open;
                for (const auto& [field, score] : scores) {
                    if (!taken.count(field)) open[field] = score;
                }
                auto all = normalize_score(ScorePayload{scores}, "");
                std::optional<ScoreRecord> rec;
                if (!open.empty()) rec = normalize_score(ScorePayload{open}, "");
                if (rec && rec->score >= ctx.manifest.mapping_threshold) {
                    d.field = rec->field;
                    rec->contributions = all ? all->contributions : rec->contributions;
                    d.score = rec;
                    taken.insert(rec->field);
                    column_field_[col] = rec->field;
                } else {
                    d.score = all;
                }
            }
            ctx.artifact.add_mapping(kTableId, std::move(d));
        }
        return StageResult::success();
    }

    StageResult validate(PipelineContext& ctx) {
        for (const auto& f : ctx.manifest.fields) {
            if (!f.required) continue;
            auto it = std::find(column_field_.begin(), column_field_.end(), f.name);
            if (it == column_field_.end()) {
                Issue i;
                i.row = header_row_;
                i.column = 0;
                i.code = "required_column_missing";
                i.severity = "error";
                i.field = f.name;
                ctx.artifact.add_issue(kTableId, std::move(i));
                continue;
            }
            const int col = (int)(it - column_field_.begin());
            for (const auto& r : data_) {
                bool empty = (size_t)col >= r.cells.size() ||
                             r.cells[(size_t)col].find_first_not_of(" \t") == std::string::npos;
                if (!empty) continue;
                Issue i;
                i.row = r.sheet_row;
                i.column = col;
                i.code = "required_missing";
                i.severity = "error";
                i.field = f.name;
                ctx.artifact.add_issue(kTableId, std::move(i));
            }
        }
        return StageResult::success();
    }

    StageResult write_output(PipelineContext& ctx) {
        std::vector<size_t> order;
        csv::Row out_header;
        for (size_t col = 0; col < header_.size(); col++) {
            if (column_field_[col].empty()) continue;
            order.push_back(col);
            out_header.push_back(column_field_[col]);
        }
        for (size_t col = 0; col < header_.size(); col++) {
            if (!column_field_[col].empty()) continue;
            order.push_back(col);
            std::string h = header_[col];
            if (h.find_first_not_of(" \t") == std::string::npos) h = "column_" + std::to_string(col + 1);
            out_header.push_back(ctx.manifest.unmapped_prefix + h);
        }

        std::string body = csv::format_row(out_header) + "\n";
        for (const auto& r : data_) {
            csv::Row out;
            out.reserve(order.size());
            for (size_t col : order) out.push_back(col < r.cells.size() ? r.cells[col] : "");
            body += csv::format_row(out) + "\n";
        }

        std::string err = write_atomic_file(ctx.req.output, body);
        if (!err.empty()) return StageResult::failure("output_write_failed");
        return StageResult::success();
    }

    static constexpr const char* kTableId = "table_1";

    csv::Row header_;
    int header_row_{0};
    std::vector<DataRow> data_;
    std::vector<std::string> column_field_;   // per column, empty when unmapped
};

} // namespace

std::unique_ptr<Pipeline> make_csv_mapper_pipeline() {
    return std::make_unique<CsvMapperPipeline>();
}

} // namespace sheetrun
