#include "tabula/row_converter.hpp"
#include "tabula/errors.hpp"
#include "tabula/log.hpp"
#include "tabula/util.hpp"

namespace tabula {

row_converter::row_converter(const table& t) : table_(t) {
    parsers_.reserve(t.columns.size());
    for (const auto& c : t.columns) {
        parsers_.push_back(make_parser(c));
    }
}

std::optional<std::string> row_converter::cell(const data_row& row, const column& c) const {
    if (c.is_aggregate()) {
        // Occurrence cells joined with ','; the array parser splits them again.
        std::vector<std::string> parts;
        for (size_t pos : c.source_positions) {
            if (pos < row.cells.size()) {
                parts.push_back(row.cells[pos]);
            }
        }
        if (parts.empty()) {
            return std::nullopt;
        }
        return join(parts, ",");
    }

    if (c.source_positions.empty() || c.source_positions.front() >= row.cells.size()) {
        return std::nullopt;
    }
    return row.cells[c.source_positions.front()];
}

std::vector<column_value_t> row_converter::convert(const data_row& row) {
    std::vector<column_value_t> values;
    values.reserve(table_.columns.size());

    for (size_t i = 0; i < table_.columns.size(); ++i) {
        const auto& c = table_.columns[i];
        auto raw = cell(row, c);
        if (!raw) {
            values.emplace_back(nullptr);
            continue;
        }

        try {
            values.push_back(parsers_[i]->parse(*raw).to_column_value());
        } catch (const parse_error& e) {
            ++error_count_;
            LOG_WARN("rows", "%s row %zu: %s", table_.name.c_str(), row.number, e.what());
            values.emplace_back(nullptr);
        }
    }

    return values;
}

} // namespace tabula
