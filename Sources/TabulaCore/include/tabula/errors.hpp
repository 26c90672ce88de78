#pragma once

#include <stdexcept>
#include <string>

namespace tabula {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

// Table-level failure: the sheet or relation sheet is skipped, siblings continue.
class schema_error : public std::runtime_error {
public:
    explicit schema_error(const std::string& msg) : std::runtime_error(msg) {}
};

class io_error : public std::runtime_error {
public:
    explicit io_error(const std::string& msg) : std::runtime_error(msg) {}
};

class config_error : public std::runtime_error {
public:
    explicit config_error(const std::string& msg) : std::runtime_error(msg) {}
};

// Cell-level failure. row is the 1-based sheet row, 0 when unknown.
class parse_error : public std::runtime_error {
public:
    parse_error(const std::string& column, const std::string& msg, size_t row = 0)
        : std::runtime_error("column " + column + ": " + msg)
        , column_(column)
        , row_(row) {}

    const std::string& column() const { return column_; }
    size_t row() const { return row_; }

private:
    std::string column_;
    size_t row_;
};

} // namespace tabula
