#pragma once

#include "schema.hpp"
#include <string>
#include <vector>

namespace tabula {

// Turns the three header rows of a sheet into the canonical column list.
//
// Header positions sharing a normalized name with an array<...> declared type
// form one array field of N occurrences. It expands to an aggregate column
// (TEXT, JSON) plus N scalar columns Name_0 .. Name_(N-1) of the base type.
// The base type is taken from the first occurrence.
//
// Throws schema_error when a name is reserved (id, created_at, updated_at,
// deleted_at) or when two columns normalize to the same name.
class column_builder {
public:
    column_builder(std::vector<std::string> field_names,
                   std::vector<std::string> types,
                   std::vector<std::string> tags);

    // Columns sorted by name.
    std::vector<column> build() const;

private:
    std::vector<std::string> field_names_;
    std::vector<std::string> types_;
    std::vector<std::string> tags_;
};

inline std::vector<column> build_columns(const std::vector<std::string>& field_names,
                                         const std::vector<std::string>& types,
                                         const std::vector<std::string>& tags) {
    return column_builder(field_names, types, tags).build();
}

} // namespace tabula
