#pragma once

#include "schema.hpp"
#include <string>
#include <vector>

namespace tabula {

// Double-quotes a name that is an SQLite keyword (case-insensitive) or that
// contains whitespace or one of -+()[]{}.,;" characters. Embedded quotes are doubled.
std::string quote_identifier(const std::string& name);

bool is_sql_keyword(const std::string& name);

// Renders a default tag value as an SQL literal. Numbers, NULL, TRUE, FALSE,
// CURRENT_TIMESTAMP/DATE/TIME, quoted strings and parenthesized expressions
// pass through; anything else is single-quoted.
std::string default_literal(const std::string& value);

// "<quoted name> <sql type>[ NOT NULL][ PRIMARY KEY][ UNIQUE][ DEFAULT v]"
std::string column_definition(const column& c);

std::string create_table_sql(const table& t);

// One statement per index-tagged column, then one per belongs_to foreign key.
std::vector<std::string> create_index_sql(const table& t);

// INSERT with one ? placeholder per column, in column_names(t) order.
std::string insert_sql(const table& t);

// PRAGMA foreign_keys=ON; then every table's DDL and indices.
std::string schema_script(const std::vector<table>& tables);

} // namespace tabula
