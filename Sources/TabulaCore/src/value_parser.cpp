#include "tabula/value_parser.hpp"
#include "tabula/array_codec.hpp"
#include "tabula/errors.hpp"
#include "tabula/util.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <ctime>
#include <functional>

namespace tabula {

// ============================================================================
// value
// ============================================================================

value value::zero(const column_type& type) {
    value v;
    v.type = type;
    if (type.is_array) {
        v.data = std::vector<scalar_value>{};
    } else {
        v.data = zero_value(type.kind);
    }
    return v;
}

bool value::is_zero() const {
    if (is_array()) {
        return elements().empty();
    }
    return tabula::is_zero(scalar());
}

column_value_t value::to_column_value() const {
    if (is_array()) {
        return encode_array(elements());
    }
    return tabula::to_column_value(scalar());
}

// ============================================================================
// Primitive parsers
// ============================================================================

namespace {

bool parse_integer(const std::string& s, long long min, long long max, long long& out) {
    if (s.empty()) return false;
    size_t start = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    if (start == s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (s[i] < '0' || s[i] > '9') return false;
    }
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno == ERANGE || end != s.c_str() + s.size()) return false;
    if (v < min || v > max) return false;
    out = v;
    return true;
}

bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (errno == ERANGE || end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

bool read_digits(const std::string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    pos += count;
    out = v;
    return true;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && ((year % 4 == 0 && year % 100 != 0) || year % 400 == 0)) {
        return 29;
    }
    return days[month - 1];
}

struct time_format {
    bool has_time;
    char separator;   // between date and time
    bool fractional;  // optional .fff (1-9 digits) after seconds
    bool zulu;        // trailing 'Z' required
};

const time_format time_formats[] = {
    {true, ' ', true, false},
    {true, ' ', true, true},
    {true, 'T', true, false},
    {true, 'T', true, true},
    {true, ' ', false, false},
    {true, 'T', false, false},
    {true, 'T', false, true},
    {false, 0, false, false},
};

std::optional<timestamp_t> parse_with(const std::string& s, const time_format& fmt) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    long long nanos = 0;

    if (!read_digits(s, pos, 4, year) || pos >= s.size() || s[pos++] != '-') return std::nullopt;
    if (!read_digits(s, pos, 2, month) || pos >= s.size() || s[pos++] != '-') return std::nullopt;
    if (!read_digits(s, pos, 2, day)) return std::nullopt;

    if (fmt.has_time) {
        if (pos >= s.size() || s[pos++] != fmt.separator) return std::nullopt;
        if (!read_digits(s, pos, 2, hour) || pos >= s.size() || s[pos++] != ':') return std::nullopt;
        if (!read_digits(s, pos, 2, minute) || pos >= s.size() || s[pos++] != ':') return std::nullopt;
        if (!read_digits(s, pos, 2, second)) return std::nullopt;

        if (fmt.fractional && pos < s.size() && s[pos] == '.') {
            ++pos;
            size_t digits = 0;
            while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
                if (digits < 9) {
                    nanos = nanos * 10 + (s[pos] - '0');
                }
                ++digits;
                ++pos;
            }
            if (digits == 0 || digits > 9) return std::nullopt;
            for (size_t i = digits; i < 9; ++i) nanos *= 10;
        }
        if (fmt.zulu) {
            if (pos >= s.size() || s[pos++] != 'Z') return std::nullopt;
        }
    }

    if (pos != s.size()) return std::nullopt;
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t seconds = timegm(&tm);

    return timestamp_t(std::chrono::seconds(seconds) + std::chrono::microseconds(nanos / 1000));
}

// Parser built from a conversion function, one per scalar kind.
class scalar_parser : public value_parser {
public:
    using convert_fn = std::function<std::optional<scalar_value>(const std::string&)>;

    scalar_parser(std::string column_name, column_type type, convert_fn convert)
        : column_name_(std::move(column_name)), type_(std::move(type)), convert_(std::move(convert)) {}

    value parse(const std::string& raw) const override {
        std::string s = trim(raw);
        if (s.empty()) {
            return value::zero(type_);
        }
        auto parsed = convert_(s);
        if (!parsed) {
            throw parse_error(column_name_, "invalid " + to_string(type_.kind) + " value '" + s + "'");
        }
        value v;
        v.type = type_;
        v.data = std::move(*parsed);
        return v;
    }

    const column_type& type() const override { return type_; }

private:
    std::string column_name_;
    column_type type_;
    convert_fn convert_;
};

class time_parser : public value_parser {
public:
    time_parser(std::string column_name, column_type type)
        : column_name_(std::move(column_name)), type_(std::move(type)) {}

    value parse(const std::string& raw) const override {
        std::string s = trim(raw);
        if (s.empty()) {
            return value::zero(type_);
        }
        auto parsed = parse_timestamp(s);
        if (!parsed) {
            throw parse_error(column_name_, "failed to parse date '" + s + "'");
        }
        value v;
        v.type = type_;
        v.data = scalar_value(*parsed);
        return v;
    }

    const column_type& type() const override { return type_; }

private:
    std::string column_name_;
    column_type type_;
};

// Comma-separated cell; each item goes through the base parser, zero items are dropped.
class array_parser : public value_parser {
public:
    array_parser(std::string column_name, column_type type)
        : column_name_(column_name)
        , type_(std::move(type))
        , base_(make_parser(column_name, *type_.base_type)) {}

    value parse(const std::string& raw) const override {
        std::string s = trim(raw);
        if (s.empty()) {
            return value::zero(type_);
        }

        std::vector<scalar_value> items;
        for (const auto& piece : split(s, ',')) {
            value item = base_->parse(piece);
            if (!item.is_zero()) {
                items.push_back(item.scalar());
            }
        }

        value v;
        v.type = type_;
        v.data = std::move(items);
        return v;
    }

    const column_type& type() const override { return type_; }

private:
    std::string column_name_;
    column_type type_;
    std::unique_ptr<value_parser> base_;
};

} // namespace

std::optional<timestamp_t> parse_timestamp(const std::string& text) {
    std::string s = trim(text);
    for (const auto& fmt : time_formats) {
        if (auto t = parse_with(s, fmt)) {
            return t;
        }
    }
    return std::nullopt;
}

std::optional<bool> parse_bool(const std::string& text) {
    if (text == "1" || text == "t" || text == "T" || text == "TRUE" || text == "true" || text == "True") {
        return true;
    }
    if (text == "0" || text == "f" || text == "F" || text == "FALSE" || text == "false" || text == "False") {
        return false;
    }
    return std::nullopt;
}

std::unique_ptr<value_parser> make_parser(const std::string& column_name, const column_type& type) {
    if (type.is_array) {
        return std::make_unique<array_parser>(column_name, type);
    }

    switch (type.kind) {
        case column_kind::int32:
            return std::make_unique<scalar_parser>(column_name, type,
                [](const std::string& s) -> std::optional<scalar_value> {
                    long long v = 0;
                    if (!parse_integer(s, INT32_MIN, INT32_MAX, v)) return std::nullopt;
                    return scalar_value(static_cast<int32_t>(v));
                });
        case column_kind::int64:
            return std::make_unique<scalar_parser>(column_name, type,
                [](const std::string& s) -> std::optional<scalar_value> {
                    long long v = 0;
                    if (!parse_integer(s, INT64_MIN, INT64_MAX, v)) return std::nullopt;
                    return scalar_value(static_cast<int64_t>(v));
                });
        case column_kind::float64:
            return std::make_unique<scalar_parser>(column_name, type,
                [](const std::string& s) -> std::optional<scalar_value> {
                    double v = 0.0;
                    if (!parse_double(s, v)) return std::nullopt;
                    return scalar_value(v);
                });
        case column_kind::boolean:
            return std::make_unique<scalar_parser>(column_name, type,
                [](const std::string& s) -> std::optional<scalar_value> {
                    auto v = parse_bool(s);
                    if (!v) return std::nullopt;
                    return scalar_value(*v);
                });
        case column_kind::date_time:
            return std::make_unique<time_parser>(column_name, type);
        case column_kind::bytes:
            return std::make_unique<scalar_parser>(column_name, type,
                [](const std::string& s) -> std::optional<scalar_value> {
                    return scalar_value(bytes_t(s.begin(), s.end()));
                });
        case column_kind::string:
            break;
    }

    return std::make_unique<scalar_parser>(column_name, type,
        [](const std::string& s) -> std::optional<scalar_value> {
            return scalar_value(s);
        });
}

} // namespace tabula
