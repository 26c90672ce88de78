#include "tabula/schema.hpp"
#include "tabula/log.hpp"
#include "tabula/util.hpp"
#include <cctype>
#include <unordered_map>

namespace tabula {

const column* table::find_column(const std::string& column_name) const {
    for (const auto& c : columns) {
        if (c.name == column_name) {
            return &c;
        }
    }
    return nullptr;
}

std::optional<relation_type> parse_relation_type(const std::string& s) {
    std::string key;
    for (char c : to_lower(trim(s))) {
        if (c != '-' && c != '_') key += c;
    }
    if (key == "hasone") return relation_type::has_one;
    if (key == "hasmany") return relation_type::has_many;
    if (key == "belongsto") return relation_type::belongs_to;
    return std::nullopt;
}

std::string to_string(relation_type type) {
    switch (type) {
        case relation_type::has_one: return "hasOne";
        case relation_type::has_many: return "hasMany";
        case relation_type::belongs_to: return "belongsTo";
    }
    return "belongsTo";
}

std::string format_name(const std::string& raw) {
    std::string out;
    for (auto part : split_whitespace(raw)) {
        part[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(part[0])));
        out += part;
    }
    return out;
}

bool is_reserved_column_name(const std::string& name) {
    std::string lowered = to_lower(name);
    return lowered == "id" || lowered == "created_at" ||
           lowered == "updated_at" || lowered == "deleted_at";
}

std::vector<std::string> column_names(const table& t) {
    std::vector<std::string> names;
    names.reserve(t.columns.size());
    for (const auto& c : t.columns) {
        names.push_back(c.name);
    }
    return names;
}

std::string tag_string(const column& c) {
    if (c.is_aggregate()) {
        return "type:text";
    }
    if (c.is_array_element()) {
        std::string base = c.name.substr(0, c.name.rfind('_'));
        return "column:" + to_lower(base) + "_" + std::to_string(c.array_index);
    }

    std::vector<std::string> parts;
    if (has_tag(c.tags, tag::primary_key)) parts.push_back("primaryKey");
    if (c.is_unique) parts.push_back("unique");
    if (has_tag(c.tags, tag::index)) parts.push_back("index");
    if (has_tag(c.tags, tag::not_null)) parts.push_back("not null");
    if (has_tag(c.tags, tag::auto_increment)) parts.push_back("autoIncrement");
    if (auto v = tag_value_of(c.tags, tag::size); v && !v->empty()) parts.push_back("size:" + *v);
    if (auto v = tag_value_of(c.tags, tag::default_value); v && !v->empty()) parts.push_back("default:" + *v);
    if (auto v = tag_value_of(c.tags, tag::foreign_key); v && !v->empty()) parts.push_back("foreignKey:" + *v);
    return join(parts, ";");
}

void assign_relations(std::vector<table>& tables, const std::vector<relation>& relations) {
    std::unordered_map<std::string, size_t> by_name;
    for (size_t i = 0; i < tables.size(); ++i) {
        tables[i].relations.clear();
        by_name[tables[i].name] = i;
    }

    for (const auto& rel : relations) {
        auto it = by_name.find(rel.source_table);
        if (it == by_name.end()) {
            LOG_DEBUG("relations", "No table named %s, dropping %s relation to %s",
                      rel.source_table.c_str(), to_string(rel.type).c_str(), rel.target_table.c_str());
            continue;
        }
        tables[it->second].relations.push_back(rel);
    }
}

} // namespace tabula
