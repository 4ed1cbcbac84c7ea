#include "db/sqlite/sqlite_connection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>

namespace schemaport {

// ============================================================================
// SqliteStatement
// ============================================================================

SqliteStatement::~SqliteStatement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {}

SqliteStatement& SqliteStatement::operator=(SqliteStatement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

void SqliteStatement::bind(int index, const FieldValue& value) {
    int rc = SQLITE_OK;
    if (std::holds_alternative<std::monostate>(value)) {
        rc = sqlite3_bind_null(stmt_, index);
    } else if (const auto* i = std::get_if<int64_t>(&value)) {
        rc = sqlite3_bind_int64(stmt_, index, *i);
    } else if (const auto* d = std::get_if<double>(&value)) {
        rc = sqlite3_bind_double(stmt_, index, *d);
    } else if (const auto* b = std::get_if<bool>(&value)) {
        rc = sqlite3_bind_int(stmt_, index, *b ? 1 : 0);
    } else if (const auto* s = std::get_if<std::string>(&value)) {
        rc = sqlite3_bind_text(stmt_, index, s->data(), static_cast<int>(s->size()), SQLITE_TRANSIENT);
    } else if (const auto* date = std::get_if<Date>(&value)) {
        const std::string text = format_date(*date);
        rc = sqlite3_bind_text(stmt_, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    } else if (const auto* dt = std::get_if<DateTime>(&value)) {
        const std::string text = format_datetime(*dt);
        rc = sqlite3_bind_text(stmt_, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    } else if (const auto* blob = std::get_if<Blob>(&value)) {
        rc = sqlite3_bind_blob(stmt_, index, blob->data(), static_cast<int>(blob->size()), SQLITE_TRANSIENT);
    }

    if (rc != SQLITE_OK) {
        throw MigrationError(ErrorCategory::STORE_ERROR,
            std::format("Failed to bind parameter {}: {}", index, sqlite3_errmsg(db_)));
    }
}

bool SqliteStatement::step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw MigrationError(ErrorCategory::STORE_ERROR,
        std::format("Statement failed: {}", sqlite3_errmsg(db_)));
}

void SqliteStatement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int SqliteStatement::column_count() const {
    return sqlite3_column_count(stmt_);
}

std::string SqliteStatement::column_name(int index) const {
    const char* name = sqlite3_column_name(stmt_, index);
    return name ? name : "";
}

FieldValue SqliteStatement::column_value(int index) const {
    switch (sqlite3_column_type(stmt_, index)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt_, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt_, index);
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
            const int size = sqlite3_column_bytes(stmt_, index);
            return std::string(text ? text : "", static_cast<size_t>(size));
        }
        case SQLITE_BLOB: {
            const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, index));
            const int size = sqlite3_column_bytes(stmt_, index);
            return data ? Blob(data, data + size) : Blob{};
        }
        case SQLITE_NULL:
        default:
            return std::monostate{};
    }
}

// ============================================================================
// SqliteConnection
// ============================================================================

std::unique_ptr<SqliteConnection> SqliteConnection::open(const std::string& path, bool read_only) {
    sqlite3* db = nullptr;
    const int flags = read_only ? SQLITE_OPEN_READONLY
                                : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    const int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        throw MigrationError(ErrorCategory::CONNECTION_ERROR,
            std::format("Cannot open SQLite database {}: {}", path, message));
    }
    return std::make_unique<SqliteConnection>(db);
}

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {}

SqliteConnection::~SqliteConnection() {
    close();
}

DbResultSet SqliteConnection::execute(const std::string& sql) {
    DbResultSet result;
    if (!db_) {
        result.error_message = "Connection is null";
        return result;
    }

    try {
        auto stmt = prepare(sql);
        const int ncols = stmt.column_count();
        result.column_names.reserve(static_cast<size_t>(ncols));
        for (int c = 0; c < ncols; ++c) {
            result.column_names.push_back(stmt.column_name(c));
        }

        while (stmt.step()) {
            Row row;
            row.reserve(static_cast<size_t>(ncols));
            for (int c = 0; c < ncols; ++c) {
                row.push_back(stmt.column_value(c));
            }
            result.rows.push_back(std::move(row));
        }

        result.has_rows = ncols > 0;
        result.affected_rows = result.has_rows ? result.rows.size()
                                               : static_cast<uint64_t>(sqlite3_changes64(db_));
        result.success = true;
    } catch (const MigrationError& e) {
        result.success = false;
        result.error_message = e.what();
        result.rows.clear();
    }
    return result;
}

bool SqliteConnection::is_connected() const {
    return db_ != nullptr;
}

void SqliteConnection::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

void SqliteConnection::exec(const std::string& sql) {
    char* errmsg = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string message = errmsg ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        throw MigrationError(ErrorCategory::STORE_ERROR,
            std::format("SQL failed: {} ({})", message, sql));
    }
}

SqliteStatement SqliteConnection::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        throw MigrationError(ErrorCategory::STORE_ERROR,
            std::format("Failed to prepare: {} ({})", sqlite3_errmsg(db_), sql));
    }
    return SqliteStatement(db_, stmt);
}

// ============================================================================
// SqliteTransaction
// ============================================================================

SqliteTransaction::SqliteTransaction(SqliteConnection& conn)
    : conn_(conn), active_(false) {
    conn_.exec("BEGIN");
    active_ = true;
}

SqliteTransaction::~SqliteTransaction() {
    if (!active_) return;
    try {
        conn_.exec("ROLLBACK");
    } catch (const MigrationError& e) {
        utils::log::error(std::format("Rollback failed: {}", e.what()));
    }
}

void SqliteTransaction::commit() {
    conn_.exec("COMMIT");
    active_ = false;
}

} // namespace schemaport
