#pragma once

#include "schema.hpp"
#include <string>
#include <vector>

namespace tabula {

// One entry of the per-table field list handed to templates.
struct generated_field {
    std::string name;
    std::string storage_type;   // sql_type_string
    std::string cpp_type;       // cpp_type_string
    std::string tag_string;
    size_t array_size = 0;      // aggregates only

    bool operator==(const generated_field& other) const {
        return name == other.name && storage_type == other.storage_type &&
               cpp_type == other.cpp_type && tag_string == other.tag_string &&
               array_size == other.array_size;
    }
};

// All columns, in column_names(t) order.
std::vector<generated_field> model_fields(const table& t);

// The aggregate (array) subset of model_fields, same order.
std::vector<generated_field> array_fields(const table& t);

// Column name made usable as a C++ member name.
std::string cpp_identifier(const std::string& name);

// Self-contained C++ header with a struct for the table inside namespace ns.
// Each array field gets pack_<Name>() and unpack_<Name>() that move values
// between the vector member and its fixed Name_i slots.
std::string model_header(const table& t, const std::string& ns);

// CREATE TABLE plus CREATE INDEX statements for one table.
std::string model_sql(const table& t);

} // namespace tabula
