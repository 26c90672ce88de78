#include "tabula/db.hpp"
#include "tabula/log.hpp"
#include <cctype>

namespace tabula {

namespace {

void bind_value(sqlite3* db, sqlite3_stmt* stmt, int index, const column_value_t& value) {
    int rc = std::visit([&](auto&& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(stmt, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, bytes_t>) {
            if (v.empty()) {
                return sqlite3_bind_zeroblob(stmt, index, 0);
            }
            return sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        }
    }, value);

    if (rc != SQLITE_OK) {
        throw db_error("Failed to bind parameter " + std::to_string(index) + ": " + sqlite3_errmsg(db));
    }
}

column_value_t extract_column(sqlite3_stmt* stmt, int index) {
    switch (sqlite3_column_type(stmt, index)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            int size = sqlite3_column_bytes(stmt, index);
            return std::string(text ? text : "", text ? static_cast<size_t>(size) : 0);
        }
        case SQLITE_BLOB: {
            const uint8_t* bytes = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, index));
            int size = sqlite3_column_bytes(stmt, index);
            return bytes ? bytes_t(bytes, bytes + size) : bytes_t{};
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

} // namespace

// ============================================================================
// database
// ============================================================================

database::database(const std::string& path, open_mode mode) : path_(path) {
    int flags = SQLITE_OPEN_FULLMUTEX;
    if (mode == open_mode::read_only) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw db_error("Failed to open database " + path + ": " + error);
    }

    execute("PRAGMA foreign_keys = ON");
    sqlite3_busy_timeout(db_, 5000);
    LOG_DEBUG("db", "Opened %s", path.c_str());
}

database::~database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

database::database(database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)) {
    other.db_ = nullptr;
}

database& database::operator=(database&& other) noexcept {
    if (this != &other) {
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = other.db_;
        path_ = std::move(other.path_);
        other.db_ = nullptr;
    }
    return *this;
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR("db", "%s in %s", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")");
        }
        return;
    }

    statement stmt(*this, sql);
    stmt.execute(params);
}

bool database::table_exists(const std::string& name) const {
    const char* sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";
    sqlite3_stmt* stmt = nullptr;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw db_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    sqlite3_finalize(stmt);

    return exists;
}

std::unordered_map<std::string, std::string> database::table_info(const std::string& table) const {
    std::unordered_map<std::string, std::string> columns;

    std::string sql = "PRAGMA table_info(\"" + table + "\")";
    sqlite3_stmt* stmt = nullptr;

    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw db_error("Failed to prepare table_info statement: " + std::string(sqlite3_errmsg(db_)));
    }

    // PRAGMA table_info returns: cid, name, type, notnull, dflt_value, pk
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        const char* type = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));

        if (name && type) {
            std::string type_str(type);
            for (char& c : type_str) {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            columns[name] = type_str;
        }
    }

    sqlite3_finalize(stmt);
    return columns;
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) {
    statement stmt(*this, sql);
    stmt.bind_all(params);

    std::vector<row_t> results;
    int col_count = stmt.column_count();
    while (stmt.step()) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            row[stmt.column_name(i)] = stmt.column(i);
        }
        results.push_back(std::move(row));
    }
    return results;
}

void database::begin_transaction() {
    execute("BEGIN IMMEDIATE");
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    return sqlite3_get_autocommit(db_) == 0;
}

int64_t database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

// ============================================================================
// statement
// ============================================================================

statement::statement(database& db, const std::string& sql) : db_(db), sql_(sql) {
    int rc = sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_.handle());
        LOG_ERROR("db", "%s in %s", error.c_str(), sql.c_str());
        throw db_error("Failed to prepare statement: " + error + " (SQL: " + sql + ")");
    }
}

statement::~statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

void statement::bind(int index, const column_value_t& value) {
    bind_value(db_.handle(), stmt_, index, value);
}

void statement::bind_all(const std::vector<column_value_t>& values) {
    int index = 1;
    for (const auto& v : values) {
        bind(index++, v);
    }
}

bool statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw db_error("Execution failed: " + std::string(sqlite3_errmsg(db_.handle())) + " (SQL: " + sql_ + ")");
}

void statement::execute(const std::vector<column_value_t>& values) {
    bind_all(values);
    while (step()) {
    }
    reset();
}

void statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int statement::column_count() const {
    return sqlite3_column_count(stmt_);
}

std::string statement::column_name(int index) const {
    const char* name = sqlite3_column_name(stmt_, index);
    return name ? name : "";
}

column_value_t statement::column(int index) const {
    return extract_column(stmt_, index);
}

// ============================================================================
// transaction
// ============================================================================

transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (!completed_ && db_.is_in_transaction()) {
        int rc = sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            LOG_ERROR("db", "Rollback failed: %s", sqlite3_errmsg(db_.handle()));
        }
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    db_.rollback();
    completed_ = true;
}

} // namespace tabula
