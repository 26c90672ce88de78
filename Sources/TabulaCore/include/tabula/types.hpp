#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <variant>
#include <chrono>

namespace tabula {

// Timestamp type (UTC, microsecond resolution is enough for sheet data)
using timestamp_t = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

using bytes_t = std::vector<uint8_t>;

// Storage-ready values, as bound to / read from SQLite
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    bytes_t  // blob
>;

// Semantic column kinds
enum class column_kind {
    int32,
    int64,
    float64,
    boolean,
    string,
    date_time,
    bytes
};

// Typed value of a single scalar cell
using scalar_value = std::variant<
    int32_t,
    int64_t,
    double,
    bool,
    std::string,
    timestamp_t,
    bytes_t
>;

// Semantic type descriptor.
// For arrays, kind mirrors base_type->kind and base_type is always a scalar.
struct column_type {
    column_kind kind = column_kind::string;
    bool is_array = false;
    std::unique_ptr<column_type> base_type;

    column_type() = default;
    explicit column_type(column_kind k) : kind(k) {}

    column_type(const column_type& other);
    column_type& operator=(const column_type& other);
    column_type(column_type&&) noexcept = default;
    column_type& operator=(column_type&&) noexcept = default;

    // Wraps base in an array type. An array base is flattened to its scalar.
    static column_type array_of(const column_type& base);

    // Scalar element type: base_type for arrays, *this otherwise.
    const column_type& element() const { return is_array ? *base_type : *this; }

    bool operator==(const column_type& other) const;
    bool operator!=(const column_type& other) const { return !(*this == other); }
};

// Parses a declared type string ("int", "array<string>", ...).
// Unrecognized tokens degrade to string; never throws.
column_type parse_column_type(const std::string& declared);

// SQL storage type: INTEGER, BIGINT, REAL, TEXT, DATETIME, BLOB. Arrays are TEXT.
std::string sql_type_string(const column_type& type);

// Type string used in generated C++ sources.
std::string cpp_type_string(const column_type& type);

std::string to_string(column_kind kind);

// Canonical declared form, e.g. "array<int32>".
std::string type_name(const column_type& type);

// ============================================================================
// scalar_value helpers
// ============================================================================

scalar_value zero_value(column_kind kind);
bool is_zero(const scalar_value& v);

// Zero date: 0001-01-01 00:00:00 UTC. Distinct from the Unix epoch, which is a real date.
timestamp_t zero_timestamp();

// Storage conversion: bool -> 0/1, timestamp -> "YYYY-MM-DD HH:MM:SS[.ffffff]".
column_value_t to_column_value(const scalar_value& v);

// "YYYY-MM-DD HH:MM:SS", with fractional seconds when non-zero.
std::string format_timestamp(timestamp_t t);

// RFC 3339 form used inside JSON arrays: "YYYY-MM-DDTHH:MM:SS[.ffffff]Z".
std::string format_timestamp_rfc3339(timestamp_t t);

} // namespace tabula
