#include "tabula/types.hpp"
#include "tabula/util.hpp"
#include <ctime>
#include <cstdio>
#include <unordered_map>

namespace tabula {

column_type::column_type(const column_type& other)
    : kind(other.kind)
    , is_array(other.is_array)
    , base_type(other.base_type ? std::make_unique<column_type>(*other.base_type) : nullptr)
{}

column_type& column_type::operator=(const column_type& other) {
    if (this != &other) {
        kind = other.kind;
        is_array = other.is_array;
        base_type = other.base_type ? std::make_unique<column_type>(*other.base_type) : nullptr;
    }
    return *this;
}

column_type column_type::array_of(const column_type& base) {
    const column_type& scalar = base.element();
    column_type result(scalar.kind);
    result.is_array = true;
    result.base_type = std::make_unique<column_type>(scalar.kind);
    return result;
}

bool column_type::operator==(const column_type& other) const {
    if (kind != other.kind || is_array != other.is_array) {
        return false;
    }
    if (is_array) {
        return *base_type == *other.base_type;
    }
    return true;
}

column_type parse_column_type(const std::string& declared) {
    std::string s = trim(to_lower(declared));

    if (starts_with(s, "array<") && ends_with(s, ">")) {
        std::string inner = s.substr(6, s.size() - 7);
        return column_type::array_of(parse_column_type(inner));
    }

    static const std::unordered_map<std::string, column_kind> synonyms = {
        {"int", column_kind::int32},
        {"int32", column_kind::int32},
        {"integer", column_kind::int32},
        {"int64", column_kind::int64},
        {"bigint", column_kind::int64},
        {"float", column_kind::float64},
        {"float64", column_kind::float64},
        {"double", column_kind::float64},
        {"bool", column_kind::boolean},
        {"boolean", column_kind::boolean},
        {"time", column_kind::date_time},
        {"datetime", column_kind::date_time},
        {"timestamp", column_kind::date_time},
        {"date", column_kind::date_time},
        {"[]byte", column_kind::bytes},
        {"blob", column_kind::bytes},
        {"string", column_kind::string},
        {"text", column_kind::string},
        {"varchar", column_kind::string},
    };

    auto it = synonyms.find(s);
    if (it == synonyms.end()) {
        return column_type(column_kind::string);
    }
    return column_type(it->second);
}

std::string sql_type_string(const column_type& type) {
    if (type.is_array) {
        return "TEXT";  // JSON encoded
    }
    switch (type.kind) {
        case column_kind::int32: return "INTEGER";
        case column_kind::int64: return "BIGINT";
        case column_kind::float64: return "REAL";
        case column_kind::boolean: return "INTEGER";
        case column_kind::string: return "TEXT";
        case column_kind::date_time: return "DATETIME";
        case column_kind::bytes: return "BLOB";
    }
    return "TEXT";
}

std::string cpp_type_string(const column_type& type) {
    if (type.is_array) {
        return "std::vector<" + cpp_type_string(*type.base_type) + ">";
    }
    switch (type.kind) {
        case column_kind::int32: return "int32_t";
        case column_kind::int64: return "int64_t";
        case column_kind::float64: return "double";
        case column_kind::boolean: return "bool";
        case column_kind::string: return "std::string";
        case column_kind::date_time: return "std::chrono::system_clock::time_point";
        case column_kind::bytes: return "std::vector<uint8_t>";
    }
    return "std::string";
}

std::string to_string(column_kind kind) {
    switch (kind) {
        case column_kind::int32: return "int32";
        case column_kind::int64: return "int64";
        case column_kind::float64: return "float64";
        case column_kind::boolean: return "bool";
        case column_kind::string: return "string";
        case column_kind::date_time: return "datetime";
        case column_kind::bytes: return "blob";
    }
    return "string";
}

std::string type_name(const column_type& type) {
    if (type.is_array) {
        return "array<" + to_string(type.base_type->kind) + ">";
    }
    return to_string(type.kind);
}

// ============================================================================
// scalar_value helpers
// ============================================================================

scalar_value zero_value(column_kind kind) {
    switch (kind) {
        case column_kind::int32: return int32_t{0};
        case column_kind::int64: return int64_t{0};
        case column_kind::float64: return 0.0;
        case column_kind::boolean: return false;
        case column_kind::string: return std::string();
        case column_kind::date_time: return zero_timestamp();
        case column_kind::bytes: return bytes_t{};
    }
    return std::string();
}

bool is_zero(const scalar_value& v) {
    return std::visit([](auto&& x) -> bool {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, bytes_t>) {
            return x.empty();
        } else if constexpr (std::is_same_v<T, timestamp_t>) {
            return x == zero_timestamp();
        } else {
            return x == T{};
        }
    }, v);
}

timestamp_t zero_timestamp() {
    // Seconds from 0001-01-01 to 1970-01-01
    return timestamp_t(std::chrono::seconds(-62135596800LL));
}

column_value_t to_column_value(const scalar_value& v) {
    return std::visit([](auto&& x) -> column_value_t {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, int32_t>) {
            return static_cast<int64_t>(x);
        } else if constexpr (std::is_same_v<T, bool>) {
            return static_cast<int64_t>(x ? 1 : 0);
        } else if constexpr (std::is_same_v<T, timestamp_t>) {
            return format_timestamp(x);
        } else {
            return x;
        }
    }, v);
}

namespace {

struct broken_down_time {
    std::tm tm{};
    int64_t micros = 0;
};

broken_down_time break_down(timestamp_t t) {
    auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch());
    int64_t total_micros = since_epoch.count();
    int64_t seconds = total_micros / 1000000;
    int64_t micros = total_micros % 1000000;
    if (micros < 0) {
        micros += 1000000;
        seconds -= 1;
    }
    broken_down_time out;
    std::time_t tt = static_cast<std::time_t>(seconds);
    gmtime_r(&tt, &out.tm);
    out.micros = micros;
    return out;
}

std::string format_with(timestamp_t t, char separator, bool zulu) {
    auto parts = break_down(t);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d%c%02d:%02d:%02d",
                  parts.tm.tm_year + 1900, parts.tm.tm_mon + 1, parts.tm.tm_mday, separator,
                  parts.tm.tm_hour, parts.tm.tm_min, parts.tm.tm_sec);
    std::string out(buf);
    if (parts.micros != 0) {
        char frac[16];
        std::snprintf(frac, sizeof(frac), ".%06lld", static_cast<long long>(parts.micros));
        std::string f(frac);
        while (f.back() == '0') f.pop_back();
        out += f;
    }
    if (zulu) out += 'Z';
    return out;
}

} // namespace

std::string format_timestamp(timestamp_t t) {
    return format_with(t, ' ', false);
}

std::string format_timestamp_rfc3339(timestamp_t t) {
    return format_with(t, 'T', true);
}

} // namespace tabula
