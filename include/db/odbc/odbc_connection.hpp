#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "db/idb_connection.hpp"

#include <sql.h>
#include <sqlext.h>

#include <memory>
#include <string>
#include <vector>

namespace schemaport {

/**
 * @brief RAII owner of one ODBC handle (environment, connection or statement)
 */
class OdbcHandle {
public:
    /**
     * @throws MigrationError (CONNECTION_ERROR) when allocation fails
     */
    OdbcHandle(SQLSMALLINT type, SQLHANDLE parent);
    ~OdbcHandle();

    OdbcHandle(const OdbcHandle&) = delete;
    OdbcHandle& operator=(const OdbcHandle&) = delete;
    OdbcHandle(OdbcHandle&& other) noexcept;
    OdbcHandle& operator=(OdbcHandle&& other) = delete;

    [[nodiscard]] SQLHANDLE get() const { return handle_; }
    [[nodiscard]] SQLSMALLINT type() const { return type_; }

    /**
     * @brief All diagnostic records of the handle, joined with "; "
     */
    [[nodiscard]] std::string diagnostics() const;

    /**
     * @brief Throw a MigrationError carrying the diagnostics unless ret succeeded
     */
    void check(SQLRETURN ret, ErrorCategory category, const std::string& what) const;

private:
    SQLSMALLINT type_;
    SQLHANDLE handle_;
};

/**
 * @brief ODBC connection implementing IDbConnection
 *
 * Owns the environment and connection handles. Statements are allocated
 * per call and released when they go out of scope.
 */
class OdbcConnection : public IDbConnection {
public:
    /**
     * @brief Connect to a file through the configured driver
     *
     * Builds "DRIVER=<driver>;DBQ=<path>;" and requests read-only access
     * when configured.
     *
     * @throws MigrationError (CONNECTION_ERROR) on failure
     */
    [[nodiscard]] static std::unique_ptr<OdbcConnection> connect(
        const std::string& path, const SourceConfig& config);

    OdbcConnection(OdbcHandle env, OdbcHandle dbc);
    ~OdbcConnection() override;

    OdbcConnection(const OdbcConnection&) = delete;
    OdbcConnection& operator=(const OdbcConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    bool is_connected() const override;
    void close() override;

    /**
     * @brief Allocate a statement handle on this connection
     */
    [[nodiscard]] OdbcHandle statement();

    /**
     * @brief Fetch every remaining row of an executed statement
     *
     * Each column is read according to its described SQL type. Character
     * and binary data are read in chunks, so long memo fields survive.
     * Wide character columns are fetched as UTF-16 and stored as UTF-8.
     *
     * @throws MigrationError (EXTRACTION_ERROR) on a fetch failure
     */
    [[nodiscard]] static std::vector<Row> fetch_all(const OdbcHandle& stmt);

private:
    OdbcHandle env_;
    OdbcHandle dbc_;
    bool connected_;
};

} // namespace schemaport
