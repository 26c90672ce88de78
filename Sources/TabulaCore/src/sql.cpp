#include "tabula/sql.hpp"
#include "tabula/util.hpp"
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace tabula {

namespace {

const std::unordered_set<std::string>& sql_keywords() {
    static const std::unordered_set<std::string> keywords = {
        "abort", "action", "add", "after", "all", "alter", "always", "analyze",
        "and", "as", "asc", "attach", "autoincrement", "before", "begin",
        "between", "by", "cascade", "case", "cast", "check", "collate", "column",
        "commit", "conflict", "constraint", "create", "cross", "current",
        "current_date", "current_time", "current_timestamp", "database",
        "default", "deferrable", "deferred", "delete", "desc", "detach",
        "distinct", "do", "drop", "each", "else", "end", "escape", "except",
        "exclude", "exclusive", "exists", "explain", "fail", "filter", "first",
        "following", "for", "foreign", "from", "full", "generated", "glob",
        "group", "groups", "having", "if", "ignore", "immediate", "in", "index",
        "indexed", "initially", "inner", "insert", "instead", "intersect",
        "into", "is", "isnull", "join", "key", "last", "left", "like", "limit",
        "match", "materialized", "natural", "no", "not", "nothing", "notnull",
        "null", "nulls", "of", "offset", "on", "or", "order", "others", "outer",
        "over", "partition", "plan", "pragma", "preceding", "primary", "query",
        "raise", "range", "recursive", "references", "regexp", "reindex",
        "release", "rename", "replace", "restrict", "returning", "right",
        "rollback", "row", "rows", "savepoint", "select", "set", "table", "temp",
        "temporary", "then", "ties", "to", "transaction", "trigger", "unbounded",
        "union", "unique", "update", "using", "vacuum", "values", "view",
        "virtual", "when", "where", "window", "with", "without"
    };
    return keywords;
}

bool needs_quotes(const std::string& name) {
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c))) return true;
        switch (c) {
            case '-': case '+': case '(': case ')': case '[': case ']':
            case '{': case '}': case '.': case ',': case ';': case '"':
                return true;
            default:
                break;
        }
    }
    return false;
}

bool is_numeric_literal(const std::string& s) {
    if (s.empty()) return false;
    size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    bool digits = false, dot = false;
    for (; i < s.size(); ++i) {
        if (std::isdigit(static_cast<unsigned char>(s[i]))) {
            digits = true;
        } else if (s[i] == '.' && !dot) {
            dot = true;
        } else {
            return false;
        }
    }
    return digits;
}

std::string index_sql(const std::string& table_name, const std::string& column_name) {
    return "CREATE INDEX IF NOT EXISTS " + quote_identifier("idx_" + table_name + "_" + column_name) +
           " ON " + quote_identifier(table_name) + "(" + quote_identifier(column_name) + ");";
}

} // namespace

bool is_sql_keyword(const std::string& name) {
    return sql_keywords().count(to_lower(name)) > 0;
}

std::string quote_identifier(const std::string& name) {
    if (!is_sql_keyword(name) && !needs_quotes(name)) {
        return name;
    }
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string default_literal(const std::string& value) {
    std::string v = trim(value);
    if (is_numeric_literal(v)) return v;

    std::string upper = v;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (upper == "NULL" || upper == "TRUE" || upper == "FALSE" ||
        upper == "CURRENT_TIMESTAMP" || upper == "CURRENT_DATE" || upper == "CURRENT_TIME") {
        return upper;
    }

    if (v.size() >= 2 && ((v.front() == '\'' && v.back() == '\'') ||
                          (v.front() == '(' && v.back() == ')'))) {
        return v;
    }

    std::string quoted = "'";
    for (char c : v) {
        if (c == '\'') quoted += '\'';
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

std::string column_definition(const column& c) {
    std::ostringstream sql;
    sql << quote_identifier(c.name) << " " << sql_type_string(c.type);

    if (has_tag(c.tags, tag::not_null)) {
        sql << " NOT NULL";
    }
    if (has_tag(c.tags, tag::primary_key)) {
        sql << " PRIMARY KEY";
    }
    if (c.is_unique) {
        sql << " UNIQUE";
    }
    if (auto def = tag_value_of(c.tags, tag::default_value); def && !trim(*def).empty()) {
        sql << " DEFAULT " << default_literal(*def);
    }
    return sql.str();
}

std::string create_table_sql(const table& t) {
    std::ostringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS " << quote_identifier(t.name) << " (\n";
    sql << "  id INTEGER PRIMARY KEY AUTOINCREMENT";

    for (const auto& c : t.columns) {
        sql << ",\n  " << column_definition(c);
    }

    for (const auto& rel : t.relations) {
        if (rel.type != relation_type::belongs_to) continue;
        sql << ",\n  FOREIGN KEY(" << quote_identifier(rel.foreign_key) << ") REFERENCES "
            << quote_identifier(rel.target_table) << "(id)";
    }

    sql << "\n);";
    return sql.str();
}

std::vector<std::string> create_index_sql(const table& t) {
    std::vector<std::string> statements;
    for (const auto& c : t.columns) {
        if (has_tag(c.tags, tag::index)) {
            statements.push_back(index_sql(t.name, c.name));
        }
    }
    for (const auto& rel : t.relations) {
        if (rel.type == relation_type::belongs_to) {
            statements.push_back(index_sql(t.name, rel.foreign_key));
        }
    }
    return statements;
}

std::string insert_sql(const table& t) {
    // A table of design-only columns still gets one row per data row
    if (t.columns.empty()) {
        return "INSERT INTO " + quote_identifier(t.name) + " DEFAULT VALUES";
    }

    std::vector<std::string> quoted;
    std::vector<std::string> placeholders;
    for (const auto& name : column_names(t)) {
        quoted.push_back(quote_identifier(name));
        placeholders.push_back("?");
    }

    return "INSERT INTO " + quote_identifier(t.name) + " (" + join(quoted, ", ") +
           ") VALUES (" + join(placeholders, ", ") + ")";
}

std::string schema_script(const std::vector<table>& tables) {
    std::ostringstream out;
    out << "-- Schema generated by tabula\n\n";
    out << "PRAGMA foreign_keys=ON;\n\n";

    for (const auto& t : tables) {
        out << create_table_sql(t) << "\n";
        for (const auto& index : create_index_sql(t)) {
            out << index << "\n";
        }
        out << "\n";
    }
    return out.str();
}

} // namespace tabula
