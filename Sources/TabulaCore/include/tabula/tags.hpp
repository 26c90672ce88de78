#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tabula {

// Column annotations from the tag row
enum class tag {
    unique,
    index,
    not_null,
    auto_increment,
    primary_key,
    default_value,   // value-bearing
    foreign_key,     // value-bearing
    size,            // value-bearing
    design_only,
    ignore,
    read_only,
    write_only,
    validate         // value-bearing
};

struct tag_value {
    tag kind;
    std::string value;  // empty unless the tag is value-bearing

    bool operator==(const tag_value& other) const {
        return kind == other.kind && value == other.value;
    }
};

struct tag_info {
    tag kind;
    const char* name;   // canonical keyword
    bool has_value;
};

// Lower-cases and strips '-' and '_' ("Not_Null" -> "notnull").
std::string normalize_tag_string(const std::string& s);

const tag_info& info(tag t);

// Matches a bare keyword. Unrecognized keywords yield nullopt.
std::optional<tag> parse_tag(const std::string& token);

// Parses "keyword" or "keyword:value". The value is kept only for
// value-bearing tags.
std::optional<tag_value> parse_tag_with_value(const std::string& token);

// Parses a comma-separated tag cell. Unknown tokens are dropped.
std::vector<tag_value> parse_tags(const std::string& cell);

bool has_tag(const std::vector<tag_value>& tags, tag t);

// Value of the first occurrence of t, if any.
std::optional<std::string> tag_value_of(const std::vector<tag_value>& tags, tag t);

} // namespace tabula
