#include "sheetrun/csv.h"

namespace sheetrun::csv {

std::vector<Row> parse(const std::string& text) {
    std::vector<Row> rows;
    Row row;
    std::string field;
    bool in_quotes = false;
    bool any = false;   // current row has content (even an empty quoted field)

    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    i++;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }
        switch (c) {
            case '"':
                in_quotes = true;
                any = true;
                break;
            case ',':
                row.push_back(std::move(field));
                field.clear();
                any = true;
                break;
            case '\r':
                break;
            case '\n':
                if (any || !field.empty()) row.push_back(std::move(field));
                field.clear();
                rows.push_back(std::move(row));
                row.clear();
                any = false;
                break;
            default:
                field.push_back(c);
                any = true;
                break;
        }
    }
    if (any || !field.empty()) {
        row.push_back(std::move(field));
        rows.push_back(std::move(row));
    }
    return rows;
}

std::string format_row(const Row& row) {
    std::string out;
    for (size_t i = 0; i < row.size(); i++) {
        if (i) out.push_back(',');
        const std::string& f = row[i];
        if (f.find_first_of(",\"\r\n") == std::string::npos) {
            out += f;
            continue;
        }
        out.push_back('"');
        for (char c : f) {
            if (c == '"') out.push_back('"');
            out.push_back(c);
        }
        out.push_back('"');
    }
    return out;
}

bool row_is_blank(const Row& row) {
    for (const auto& f : row) {
        if (f.find_first_not_of(" \t") != std::string::npos) return false;
    }
    return true;
}

} // namespace sheetrun::csv
