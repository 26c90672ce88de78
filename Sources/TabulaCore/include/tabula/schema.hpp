#pragma once

#include "types.hpp"
#include "tags.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tabula {

// Column definition produced by the column builder. Immutable once built.
struct column {
    std::string name;                     // normalized
    column_type type;
    std::vector<tag_value> tags;
    bool is_unique = false;               // derived from tag::unique

    std::vector<size_t> source_positions; // raw header indices feeding this column
    size_t array_size = 0;                // aggregate columns: N expansion slots
    int array_index = -1;                 // expansion columns: slot i of Name_i

    bool is_aggregate() const { return type.is_array; }
    bool is_array_element() const { return array_index >= 0; }
};

enum class relation_type {
    has_one,
    has_many,
    belongs_to
};

// Case and separator insensitive: "belongs_to", "Belongs-To", "belongsTo".
std::optional<relation_type> parse_relation_type(const std::string& s);

// "hasOne", "hasMany", "belongsTo"
std::string to_string(relation_type type);

struct relation {
    std::string source_table;
    std::string target_table;
    relation_type type = relation_type::belongs_to;
    std::string foreign_key;      // defaults to source_table + "ID"
    std::string reference_key;    // defaults to "ID"
};

// One data row of a sheet (row 4 onward), with its 1-based sheet row number.
struct data_row {
    size_t number = 0;
    std::vector<std::string> cells;
};

struct table {
    std::string name;             // normalized sheet name
    std::string sheet_name;
    std::string source_file;
    std::vector<column> columns;  // sorted by name
    std::vector<relation> relations;
    std::vector<data_row> rows;

    const column* find_column(const std::string& column_name) const;
};

// Canonical identifier normalization shared by column and table names:
// trim, split on whitespace, upper-case each word's first character, concatenate.
std::string format_name(const std::string& raw);

// id, created_at, updated_at, deleted_at (case-insensitive)
bool is_reserved_column_name(const std::string& name);

// Ordered column names shared by DDL, insert statements and row conversion.
std::vector<std::string> column_names(const table& t);

// Tag string exposed to generated code:
//   plain columns     "primaryKey;unique;index;not null;autoIncrement;size:N;default:V;foreignKey:F"
//   aggregate columns "type:text"
//   expansion columns "column:name_i"
std::string tag_string(const column& c);

// Attaches each relation to the table whose name equals source_table.
// Relations without a matching table are dropped.
void assign_relations(std::vector<table>& tables, const std::vector<relation>& relations);

} // namespace tabula
