#pragma once

#include "schema.hpp"
#include "workbook.hpp"
#include <string>
#include <vector>

namespace tabula {

constexpr const char* relation_sheet_name = "#Relation";

// Row 1 field names, row 2 tags, row 3 declared types, rows 4+ data.
constexpr size_t header_row_count = 3;

// Sheets whose name begins with '#' carry metadata, not table data.
inline bool is_metadata_sheet(const std::string& sheet_name) {
    return !sheet_name.empty() && sheet_name[0] == '#';
}

// Builds a table from one data sheet. Blank data rows are dropped.
// Throws schema_error for fewer than four rows or an invalid header.
table parse_sheet(const std::string& sheet_name, const sheet_rows& rows,
                  const std::string& source_file = {});

// Parses the #Relation sheet. The header must name SourceTable, TargetTable,
// RelationType, ForeignKey and ReferenceKey (any order), else schema_error.
// Incomplete rows and unknown relation types are skipped.
std::vector<relation> parse_relation_sheet(const sheet_rows& rows);

} // namespace tabula
