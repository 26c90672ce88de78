#include "tabula/sheet_parser.hpp"
#include "tabula/column_builder.hpp"
#include "tabula/errors.hpp"
#include "tabula/log.hpp"
#include "tabula/util.hpp"
#include <algorithm>
#include <array>
#include <cstdint>

namespace tabula {

table parse_sheet(const std::string& sheet_name, const sheet_rows& rows,
                  const std::string& source_file) {
    if (rows.size() < header_row_count + 1) {
        throw schema_error("sheet " + sheet_name + " has " + std::to_string(rows.size()) +
                           " row(s), at least " + std::to_string(header_row_count + 1) + " required");
    }

    table t;
    t.name = format_name(sheet_name);
    t.sheet_name = sheet_name;
    t.source_file = source_file;
    if (t.name.empty()) {
        throw schema_error("sheet name '" + sheet_name + "' is blank");
    }

    try {
        t.columns = build_columns(rows[0], rows[2], rows[1]);
    } catch (const schema_error& e) {
        throw schema_error("sheet " + sheet_name + ": " + e.what());
    }

    for (size_t i = header_row_count; i < rows.size(); ++i) {
        if (is_blank_row(rows[i])) {
            continue;
        }
        t.rows.push_back({i + 1, rows[i]});
    }

    LOG_DEBUG("sheets", "Parsed %s: %zu column(s), %zu row(s)",
              t.name.c_str(), t.columns.size(), t.rows.size());
    return t;
}

std::vector<relation> parse_relation_sheet(const sheet_rows& rows) {
    std::vector<relation> relations;
    if (rows.empty()) {
        return relations;
    }

    enum { source, target, type, foreign_key, reference_key, field_count };
    static const std::array<const char*, field_count> headers = {
        "SourceTable", "TargetTable", "RelationType", "ForeignKey", "ReferenceKey"
    };

    std::array<size_t, field_count> index;
    index.fill(SIZE_MAX);
    for (size_t i = 0; i < rows[0].size(); ++i) {
        std::string cell = trim(rows[0][i]);
        for (size_t f = 0; f < field_count; ++f) {
            if (cell == headers[f] && index[f] == SIZE_MAX) {
                index[f] = i;
            }
        }
    }

    size_t min_width = 0;
    for (size_t f = 0; f < field_count; ++f) {
        if (index[f] == SIZE_MAX) {
            throw schema_error(std::string("required column ") + headers[f] + " not found in relation sheet");
        }
        min_width = std::max(min_width, index[f] + 1);
    }

    for (size_t r = 1; r < rows.size(); ++r) {
        const auto& row = rows[r];
        if (row.size() < min_width || is_blank_row(row)) {
            continue;
        }

        std::string source_table = format_name(row[index[source]]);
        std::string target_table = format_name(row[index[target]]);
        std::string type_text = trim(row[index[type]]);
        if (source_table.empty() || target_table.empty() || type_text.empty()) {
            LOG_DEBUG("relations", "Skipping incomplete relation row %zu", r + 1);
            continue;
        }

        auto rel_type = parse_relation_type(type_text);
        if (!rel_type) {
            LOG_WARN("relations", "Unknown relation type '%s' in row %zu, skipping",
                     type_text.c_str(), r + 1);
            continue;
        }

        relation rel;
        rel.source_table = source_table;
        rel.target_table = target_table;
        rel.type = *rel_type;
        rel.foreign_key = trim(row[index[foreign_key]]);
        rel.reference_key = trim(row[index[reference_key]]);
        if (rel.foreign_key.empty()) {
            rel.foreign_key = rel.source_table + "ID";
        }
        if (rel.reference_key.empty()) {
            rel.reference_key = "ID";
        }
        relations.push_back(std::move(rel));
    }

    return relations;
}

} // namespace tabula
