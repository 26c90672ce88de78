#include "tabula/tags.hpp"
#include "tabula/util.hpp"
#include <array>
#include <unordered_map>

namespace tabula {

namespace {

const std::array<tag_info, 13> tag_table = {{
    {tag::unique, "unique", false},
    {tag::index, "index", false},
    {tag::not_null, "notnull", false},
    {tag::auto_increment, "autoincrement", false},
    {tag::primary_key, "primarykey", false},
    {tag::default_value, "default", true},
    {tag::foreign_key, "foreignkey", true},
    {tag::size, "size", true},
    {tag::design_only, "design", false},
    {tag::ignore, "ignore", false},
    {tag::read_only, "readonly", false},
    {tag::write_only, "writeonly", false},
    {tag::validate, "validate", true},
}};

// Keyword (already normalized) -> tag, including short aliases
const std::unordered_map<std::string, tag>& keyword_map() {
    static const std::unordered_map<std::string, tag> keywords = [] {
        std::unordered_map<std::string, tag> m;
        for (const auto& entry : tag_table) {
            m[entry.name] = entry.kind;
        }
        m["pk"] = tag::primary_key;
        m["autoinc"] = tag::auto_increment;
        m["fk"] = tag::foreign_key;
        m["designonly"] = tag::design_only;
        return m;
    }();
    return keywords;
}

} // namespace

std::string normalize_tag_string(const std::string& s) {
    std::string lowered = to_lower(trim(s));
    std::string out;
    out.reserve(lowered.size());
    for (char c : lowered) {
        if (c != '-' && c != '_') out += c;
    }
    return out;
}

const tag_info& info(tag t) {
    return tag_table[static_cast<size_t>(t)];
}

std::optional<tag> parse_tag(const std::string& token) {
    const auto& keywords = keyword_map();
    auto it = keywords.find(normalize_tag_string(token));
    if (it == keywords.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<tag_value> parse_tag_with_value(const std::string& token) {
    auto colon = token.find(':');
    std::string keyword = colon == std::string::npos ? token : token.substr(0, colon);

    auto kind = parse_tag(keyword);
    if (!kind) {
        return std::nullopt;
    }

    tag_value result{*kind, ""};
    if (colon != std::string::npos && info(*kind).has_value) {
        result.value = trim(token.substr(colon + 1));
    }
    return result;
}

std::vector<tag_value> parse_tags(const std::string& cell) {
    std::vector<tag_value> tags;
    for (const auto& piece : split(trim(cell), ',')) {
        std::string token = trim(piece);
        if (token.empty()) continue;
        if (auto tv = parse_tag_with_value(token)) {
            tags.push_back(std::move(*tv));
        }
    }
    return tags;
}

bool has_tag(const std::vector<tag_value>& tags, tag t) {
    for (const auto& tv : tags) {
        if (tv.kind == t) return true;
    }
    return false;
}

std::optional<std::string> tag_value_of(const std::vector<tag_value>& tags, tag t) {
    for (const auto& tv : tags) {
        if (tv.kind == t) return tv.value;
    }
    return std::nullopt;
}

} // namespace tabula
