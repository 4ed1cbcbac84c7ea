#pragma once

#include "db/idb_connection.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace schemaport {

/**
 * @brief RAII prepared statement
 *
 * Values bind by 1-based index. Dates and date-times are bound as ISO text,
 * booleans as 0/1.
 */
class SqliteStatement {
public:
    SqliteStatement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;
    SqliteStatement(SqliteStatement&& other) noexcept;
    SqliteStatement& operator=(SqliteStatement&& other) noexcept;

    void bind(int index, const FieldValue& value);

    /**
     * @brief Advance the statement
     * @return true when a row is available, false when done
     * @throws MigrationError (STORE_ERROR) on failure
     */
    bool step();

    void reset();

    [[nodiscard]] int column_count() const;
    [[nodiscard]] std::string column_name(int index) const;
    [[nodiscard]] FieldValue column_value(int index) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps sqlite3* and provides database-agnostic interface.
 * All sqlite3 calls are encapsulated here.
 */
class SqliteConnection : public IDbConnection {
public:
    /**
     * @brief Open a database file (":memory:" for an in-memory store)
     * @throws MigrationError (CONNECTION_ERROR) when the file cannot be opened
     */
    [[nodiscard]] static std::unique_ptr<SqliteConnection> open(const std::string& path, bool read_only);

    /**
     * @brief Construct from existing sqlite3* (takes ownership)
     */
    explicit SqliteConnection(sqlite3* db);

    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    bool is_connected() const override;
    void close() override;

    /**
     * @brief Run one or more statements, no result rows
     * @throws MigrationError (STORE_ERROR) on failure
     */
    void exec(const std::string& sql);

    /**
     * @throws MigrationError (STORE_ERROR) on a syntax or schema error
     */
    [[nodiscard]] SqliteStatement prepare(const std::string& sql);

private:
    sqlite3* db_;
};

/**
 * @brief Scoped transaction, rolled back unless committed
 */
class SqliteTransaction {
public:
    explicit SqliteTransaction(SqliteConnection& conn);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit();

private:
    SqliteConnection& conn_;
    bool active_;
};

} // namespace schemaport
