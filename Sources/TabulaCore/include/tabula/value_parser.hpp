#pragma once

#include "schema.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tabula {

// Typed result of parsing one cell: a scalar, or the element list of an array.
struct value {
    column_type type;
    std::variant<scalar_value, std::vector<scalar_value>> data;

    static value zero(const column_type& type);

    bool is_zero() const;
    bool is_array() const { return std::holds_alternative<std::vector<scalar_value>>(data); }

    const scalar_value& scalar() const { return std::get<scalar_value>(data); }
    const std::vector<scalar_value>& elements() const { return std::get<std::vector<scalar_value>>(data); }

    // Storage form: scalars via to_column_value, arrays as JSON text.
    column_value_t to_column_value() const;
};

// Converts raw cell text into a typed value for one column.
// Blank input yields the type's zero value; unparsable input throws parse_error.
class value_parser {
public:
    virtual ~value_parser() = default;

    virtual value parse(const std::string& raw) const = 0;

    virtual const column_type& type() const = 0;
};

// Selects the parser for a column type. Called once per column, not per row.
std::unique_ptr<value_parser> make_parser(const std::string& column_name, const column_type& type);

inline std::unique_ptr<value_parser> make_parser(const column& c) {
    return make_parser(c.name, c.type);
}

// Accepts, in order: "YYYY-MM-DD HH:MM:SS.fff", the same with a trailing Z,
// the T-separated pair, "YYYY-MM-DD HH:MM:SS", "YYYY-MM-DDTHH:MM:SS" with and
// without Z, and "YYYY-MM-DD". Zone-less values are taken as UTC.
std::optional<timestamp_t> parse_timestamp(const std::string& text);

// Accepts 1 t T TRUE true True and 0 f F FALSE false False.
std::optional<bool> parse_bool(const std::string& text);

} // namespace tabula
