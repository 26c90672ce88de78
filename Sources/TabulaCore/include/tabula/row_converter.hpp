#pragma once

#include "schema.hpp"
#include "value_parser.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace tabula {

// Converts raw data rows of one table into storage values aligned with
// column_names(table). Parsers are chosen once, at construction.
class row_converter {
public:
    explicit row_converter(const table& t);

    // Cells that fail to parse are logged and become NULL.
    std::vector<column_value_t> convert(const data_row& row);

    // Cell-level failures seen so far.
    size_t error_count() const { return error_count_; }

private:
    std::optional<std::string> cell(const data_row& row, const column& c) const;

    const table& table_;
    std::vector<std::unique_ptr<value_parser>> parsers_;
    size_t error_count_ = 0;
};

} // namespace tabula
