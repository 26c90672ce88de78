#include "tabula/array_codec.hpp"
#include "tabula/errors.hpp"
#include "tabula/log.hpp"
#include "tabula/value_parser.hpp"
#include <nlohmann/json.hpp>
#include <limits>

namespace tabula {

namespace {

std::string to_hex(const bytes_t& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out += digits[b >> 4];
        out += digits[b & 0x0f];
    }
    return out;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool from_hex(const std::string& text, bytes_t& out) {
    if (text.size() % 2 != 0) return false;
    out.clear();
    out.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        int hi = hex_digit(text[i]);
        int lo = hex_digit(text[i + 1]);
        if (hi < 0 || lo < 0) return false;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return true;
}

nlohmann::json to_json(const scalar_value& v) {
    return std::visit([](auto&& x) -> nlohmann::json {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, timestamp_t>) {
            return format_timestamp_rfc3339(x);
        } else if constexpr (std::is_same_v<T, bytes_t>) {
            return to_hex(x);
        } else {
            return x;
        }
    }, v);
}

template <typename T>
T checked_integer(double d) {
    // Bounds are exact as doubles for both int32 and int64 (2^31, 2^63)
    if (!(d >= static_cast<double>(std::numeric_limits<T>::min()) &&
          d < -static_cast<double>(std::numeric_limits<T>::min()))) {
        throw parse_error("array", "value " + std::to_string(d) + " is out of range for " +
                                       (sizeof(T) == 4 ? "int32" : "int64"));
    }
    return static_cast<T>(d);
}

int32_t checked_int32(int64_t i) {
    if (i < std::numeric_limits<int32_t>::min() || i > std::numeric_limits<int32_t>::max()) {
        throw parse_error("array", "value " + std::to_string(i) + " is out of range for int32");
    }
    return static_cast<int32_t>(i);
}

int64_t json_int64(const nlohmann::json& j) {
    if (j.is_number_unsigned() &&
        j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw parse_error("array", "element " + j.dump() + " is out of range for int64");
    }
    return j.get<int64_t>();
}

scalar_value from_json(const nlohmann::json& j, column_kind kind) {
    switch (kind) {
        case column_kind::int32:
            if (j.is_number_integer()) return checked_int32(json_int64(j));
            break;
        case column_kind::int64:
            if (j.is_number_integer()) return json_int64(j);
            break;
        case column_kind::float64:
            if (j.is_number()) return j.get<double>();
            break;
        case column_kind::boolean:
            if (j.is_boolean()) return j.get<bool>();
            break;
        case column_kind::string:
            if (j.is_string()) return j.get<std::string>();
            break;
        case column_kind::date_time:
            if (j.is_string()) {
                if (auto t = parse_timestamp(j.get<std::string>())) return *t;
            }
            break;
        case column_kind::bytes:
            if (j.is_string()) {
                bytes_t bytes;
                if (from_hex(j.get<std::string>(), bytes)) return bytes;
            }
            break;
    }
    throw parse_error("array", "element " + j.dump() + " is not a valid " + to_string(kind));
}

} // namespace

std::string encode_array(const std::vector<scalar_value>& values) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& v : values) {
        if (!is_zero(v)) {
            result.push_back(to_json(v));
        }
    }
    return result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::vector<scalar_value> decode_array(const std::string& json_text, column_kind base) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw parse_error("array", std::string("invalid JSON: ") + e.what());
    }
    if (!parsed.is_array()) {
        throw parse_error("array", "expected a JSON array, got " + std::string(parsed.type_name()));
    }

    std::vector<scalar_value> values;
    values.reserve(parsed.size());
    for (const auto& element : parsed) {
        values.push_back(from_json(element, base));
    }
    return values;
}

std::vector<scalar_value> expand_array(const std::vector<scalar_value>& values,
                                       size_t slots, column_kind base) {
    if (values.size() > slots) {
        LOG_WARN("arrays", "Dropping %zu value(s) beyond %zu slot(s)", values.size() - slots, slots);
    }

    std::vector<scalar_value> out;
    out.reserve(slots);
    for (size_t i = 0; i < slots; ++i) {
        out.push_back(i < values.size() ? values[i] : zero_value(base));
    }
    return out;
}

std::vector<scalar_value> collect_array(const std::vector<scalar_value>& slots) {
    std::vector<scalar_value> out;
    for (const auto& v : slots) {
        if (is_zero(v)) break;
        out.push_back(v);
    }
    return out;
}

scalar_value from_column_value(const column_value_t& v, column_kind kind) {
    if (std::holds_alternative<std::nullptr_t>(v)) {
        return zero_value(kind);
    }

    switch (kind) {
        case column_kind::int32:
            if (auto* i = std::get_if<int64_t>(&v)) return checked_int32(*i);
            if (auto* d = std::get_if<double>(&v)) return checked_integer<int32_t>(*d);
            break;
        case column_kind::int64:
            if (auto* i = std::get_if<int64_t>(&v)) return *i;
            if (auto* d = std::get_if<double>(&v)) return checked_integer<int64_t>(*d);
            break;
        case column_kind::float64:
            if (auto* d = std::get_if<double>(&v)) return *d;
            if (auto* i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
            break;
        case column_kind::boolean:
            if (auto* i = std::get_if<int64_t>(&v)) return *i != 0;
            break;
        case column_kind::string:
            if (auto* s = std::get_if<std::string>(&v)) return *s;
            break;
        case column_kind::date_time:
            if (auto* s = std::get_if<std::string>(&v)) {
                if (auto t = parse_timestamp(*s)) return *t;
            }
            break;
        case column_kind::bytes:
            if (auto* b = std::get_if<bytes_t>(&v)) return *b;
            if (auto* s = std::get_if<std::string>(&v)) return bytes_t(s->begin(), s->end());
            break;
    }

    LOG_DEBUG("arrays", "Stored value does not match %s, using zero", to_string(kind).c_str());
    return zero_value(kind);
}

std::vector<scalar_value> reconstruct_array(const std::unordered_map<std::string, column_value_t>& row,
                                            const column& aggregate) {
    column_kind base = aggregate.type.element().kind;

    std::vector<scalar_value> out;
    for (size_t i = 0; i < aggregate.array_size; ++i) {
        auto it = row.find(aggregate.name + "_" + std::to_string(i));
        if (it == row.end() || std::holds_alternative<std::nullptr_t>(it->second)) {
            break;
        }
        scalar_value v = from_column_value(it->second, base);
        if (is_zero(v)) {
            break;
        }
        out.push_back(std::move(v));
    }
    return out;
}

} // namespace tabula
