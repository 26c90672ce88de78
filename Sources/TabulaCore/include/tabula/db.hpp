#pragma once

#include "errors.hpp"
#include "types.hpp"
#include <sqlite3.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace tabula {

class database {
public:
    enum class open_mode {
        read_write,  ///< Create if missing (default)
        read_only
    };

    /// ":memory:" opens a private in-memory database.
    explicit database(const std::string& path, open_mode mode = open_mode::read_write);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Moveable
    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    bool table_exists(const std::string& name) const;

    // Column name -> declared SQL type (uppercase), from PRAGMA table_info.
    std::unordered_map<std::string, std::string> table_info(const std::string& table) const;

    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Execute SQL with optional params. Without params the text may hold several statements.
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    int64_t last_insert_rowid() const;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

// Prepared statement, finalized on destruction.
class statement {
public:
    statement(database& db, const std::string& sql);
    ~statement();

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    void bind(int index, const column_value_t& value);   // 1-based
    void bind_all(const std::vector<column_value_t>& values);

    // true while a row is available
    bool step();

    // Runs to completion, then resets and clears bindings for reuse.
    void execute(const std::vector<column_value_t>& values);

    void reset();

    int column_count() const;
    std::string column_name(int index) const;
    column_value_t column(int index) const;

private:
    database& db_;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;
};

// RAII transaction guard; rolls back unless committed.
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace tabula
