#include "tabula/column_builder.hpp"
#include "tabula/errors.hpp"
#include "tabula/log.hpp"
#include "tabula/util.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace tabula {

namespace {

struct header_position {
    size_t index;
    std::string name;               // normalized
    std::string declared_type;      // trimmed
    std::vector<tag_value> tags;
};

bool is_array_declaration(const std::string& declared_type) {
    return starts_with(to_lower(declared_type), "array<");
}

} // namespace

column_builder::column_builder(std::vector<std::string> field_names,
                               std::vector<std::string> types,
                               std::vector<std::string> tags)
    : field_names_(std::move(field_names))
    , types_(std::move(types))
    , tags_(std::move(tags))
{}

std::vector<column> column_builder::build() const {
    // Collect usable header positions. Design-only positions never reach the model.
    std::vector<header_position> positions;
    for (size_t i = 0; i < field_names_.size(); ++i) {
        std::string raw = trim(field_names_[i]);
        if (raw.empty() || i >= types_.size()) {
            continue;
        }

        auto tags = parse_tags(i < tags_.size() ? tags_[i] : "");
        if (has_tag(tags, tag::design_only)) {
            LOG_DEBUG("columns", "Skipping design-only column %s", raw.c_str());
            continue;
        }

        std::string name = format_name(raw);
        if (is_reserved_column_name(name)) {
            throw schema_error("column name '" + name + "' is reserved by the system");
        }

        positions.push_back({i, std::move(name), trim(types_[i]), std::move(tags)});
    }

    // Array groups keyed by normalized name, in first-seen order.
    std::map<std::string, std::vector<const header_position*>> array_groups;
    std::vector<std::string> array_order;
    for (const auto& pos : positions) {
        if (!is_array_declaration(pos.declared_type)) continue;
        auto& group = array_groups[pos.name];
        if (group.empty()) array_order.push_back(pos.name);
        group.push_back(&pos);
    }

    std::vector<column> columns;
    std::set<std::string> claimed;

    for (const auto& name : array_order) {
        const auto& group = array_groups[name];
        column_type array_type = column_type::array_of(parse_column_type(group.front()->declared_type));

        column aggregate;
        aggregate.name = name;
        aggregate.type = array_type;
        aggregate.tags = group.front()->tags;
        aggregate.is_unique = has_tag(aggregate.tags, tag::unique);
        aggregate.array_size = group.size();
        for (const auto* pos : group) {
            aggregate.source_positions.push_back(pos->index);
        }
        claimed.insert(name);

        for (size_t i = 0; i < group.size(); ++i) {
            column element;
            element.name = name + "_" + std::to_string(i);
            element.type = *array_type.base_type;
            element.array_index = static_cast<int>(i);
            element.source_positions.push_back(group[i]->index);
            columns.push_back(std::move(element));
        }
        columns.push_back(std::move(aggregate));
    }

    std::set<std::string> plain_names;
    for (const auto& pos : positions) {
        if (claimed.count(pos.name)) {
            continue;
        }
        if (!plain_names.insert(pos.name).second) {
            throw schema_error("duplicate column name '" + pos.name + "'");
        }

        column c;
        c.name = pos.name;
        c.type = parse_column_type(pos.declared_type);
        c.tags = pos.tags;
        c.is_unique = has_tag(pos.tags, tag::unique);
        c.source_positions.push_back(pos.index);
        columns.push_back(std::move(c));
    }

    // Expansion names (Name_i) must not shadow a plain column.
    for (const auto& c : columns) {
        if (c.is_array_element() && plain_names.count(c.name)) {
            throw schema_error("column name '" + c.name + "' collides with an array expansion column");
        }
    }

    // Expansions of different arrays may also meet (A_0 from A, and A_0 itself declared as an array).
    std::set<std::string> all_names;
    for (const auto& c : columns) {
        if (!all_names.insert(c.name).second) {
            throw schema_error("duplicate column name '" + c.name + "'");
        }
    }

    std::sort(columns.begin(), columns.end(), [](const column& a, const column& b) {
        return a.name < b.name;
    });

    return columns;
}

} // namespace tabula
