#include "db/odbc/odbc_connection.hpp"
#include "core/utils.hpp"

#include <array>
#include <chrono>
#include <cstring>
#include <format>
#include <string>
#include <utility>

namespace schemaport {

namespace {

constexpr SQLLEN kChunkSize = 4096;

struct ColumnDescription {
    std::string name;
    SQLSMALLINT sql_type = SQL_UNKNOWN_TYPE;
};

std::vector<ColumnDescription> describe_columns(const OdbcHandle& stmt) {
    SQLSMALLINT ncols = 0;
    stmt.check(SQLNumResultCols(stmt.get(), &ncols),
               ErrorCategory::EXTRACTION_ERROR, "SQLNumResultCols");

    std::vector<ColumnDescription> columns(static_cast<size_t>(ncols));
    for (SQLSMALLINT i = 1; i <= ncols; ++i) {
        std::array<SQLCHAR, 256> name{};
        SQLSMALLINT name_len = 0;
        SQLSMALLINT data_type = 0;
        SQLULEN column_size = 0;
        SQLSMALLINT decimal_digits = 0;
        SQLSMALLINT nullable = 0;
        stmt.check(SQLDescribeCol(stmt.get(), i, name.data(), static_cast<SQLSMALLINT>(name.size()),
                                  &name_len, &data_type, &column_size, &decimal_digits, &nullable),
                   ErrorCategory::EXTRACTION_ERROR, "SQLDescribeCol");
        auto& col = columns[static_cast<size_t>(i - 1)];
        col.name = reinterpret_cast<const char*>(name.data());
        col.sql_type = data_type;
    }
    return columns;
}

enum class ChunkMode { NARROW, WIDE, BINARY };

static_assert(sizeof(SQLWCHAR) == sizeof(char16_t), "SQLWCHAR must be UTF-16");

// Reads character or binary data in chunks until the driver reports completion.
// WIDE reads UTF-16 and converts it, so text outside the ANSI code page survives.
FieldValue read_chunked(const OdbcHandle& stmt, SQLUSMALLINT index, ChunkMode mode) {
    SQLSMALLINT c_type = SQL_C_CHAR;
    SQLLEN terminator = 1;
    if (mode == ChunkMode::WIDE) {
        c_type = SQL_C_WCHAR;
        terminator = sizeof(SQLWCHAR);
    } else if (mode == ChunkMode::BINARY) {
        c_type = SQL_C_BINARY;
        terminator = 0;
    }

    alignas(SQLWCHAR) std::array<char, kChunkSize> buffer{};
    std::string data;

    while (true) {
        SQLLEN indicator = 0;
        const SQLRETURN ret = SQLGetData(stmt.get(), index, c_type, buffer.data(),
                                         kChunkSize, &indicator);
        if (ret == SQL_NO_DATA) break;
        stmt.check(ret, ErrorCategory::EXTRACTION_ERROR, "SQLGetData");
        if (indicator == SQL_NULL_DATA) return std::monostate{};

        const SQLLEN capacity = kChunkSize - terminator;
        const SQLLEN got = (indicator == SQL_NO_TOTAL || indicator > capacity) ? capacity : indicator;
        data.append(buffer.data(), static_cast<size_t>(got));
        if (ret == SQL_SUCCESS) break;
    }

    if (mode == ChunkMode::BINARY) {
        return Blob(data.begin(), data.end());
    }
    if (mode == ChunkMode::WIDE) {
        std::u16string wide(data.size() / sizeof(char16_t), u'\0');
        std::memcpy(wide.data(), data.data(), wide.size() * sizeof(char16_t));
        return utils::utf16_to_utf8(wide);
    }
    return data;
}

FieldValue read_value(const OdbcHandle& stmt, SQLUSMALLINT index, SQLSMALLINT sql_type) {
    SQLLEN indicator = 0;
    switch (sql_type) {
        case SQL_BIT: {
            unsigned char value = 0;
            stmt.check(SQLGetData(stmt.get(), index, SQL_C_BIT, &value, 0, &indicator),
                       ErrorCategory::EXTRACTION_ERROR, "SQLGetData");
            if (indicator == SQL_NULL_DATA) return std::monostate{};
            return value != 0;
        }
        case SQL_TINYINT:
        case SQL_SMALLINT:
        case SQL_INTEGER:
        case SQL_BIGINT: {
            SQLBIGINT value = 0;
            stmt.check(SQLGetData(stmt.get(), index, SQL_C_SBIGINT, &value, 0, &indicator),
                       ErrorCategory::EXTRACTION_ERROR, "SQLGetData");
            if (indicator == SQL_NULL_DATA) return std::monostate{};
            return static_cast<int64_t>(value);
        }
        case SQL_REAL:
        case SQL_FLOAT:
        case SQL_DOUBLE:
        case SQL_DECIMAL:
        case SQL_NUMERIC: {
            SQLDOUBLE value = 0;
            stmt.check(SQLGetData(stmt.get(), index, SQL_C_DOUBLE, &value, 0, &indicator),
                       ErrorCategory::EXTRACTION_ERROR, "SQLGetData");
            if (indicator == SQL_NULL_DATA) return std::monostate{};
            return static_cast<double>(value);
        }
        case SQL_TYPE_DATE:
        case SQL_DATE: {
            SQL_DATE_STRUCT value{};
            stmt.check(SQLGetData(stmt.get(), index, SQL_C_TYPE_DATE, &value, 0, &indicator),
                       ErrorCategory::EXTRACTION_ERROR, "SQLGetData");
            if (indicator == SQL_NULL_DATA) return std::monostate{};
            return Date{std::chrono::year{value.year},
                        std::chrono::month{static_cast<unsigned>(value.month)},
                        std::chrono::day{static_cast<unsigned>(value.day)}};
        }
        case SQL_TYPE_TIMESTAMP:
        case SQL_TIMESTAMP: {
            SQL_TIMESTAMP_STRUCT value{};
            stmt.check(SQLGetData(stmt.get(), index, SQL_C_TYPE_TIMESTAMP, &value, 0, &indicator),
                       ErrorCategory::EXTRACTION_ERROR, "SQLGetData");
            if (indicator == SQL_NULL_DATA) return std::monostate{};
            const Date date{std::chrono::year{value.year},
                            std::chrono::month{static_cast<unsigned>(value.month)},
                            std::chrono::day{static_cast<unsigned>(value.day)}};
            return DateTime{std::chrono::sys_days{date}} +
                   std::chrono::hours{value.hour} +
                   std::chrono::minutes{value.minute} +
                   std::chrono::seconds{value.second};
        }
        case SQL_BINARY:
        case SQL_VARBINARY:
        case SQL_LONGVARBINARY:
            return read_chunked(stmt, index, ChunkMode::BINARY);
        case SQL_WCHAR:
        case SQL_WVARCHAR:
        case SQL_WLONGVARCHAR:
            return read_chunked(stmt, index, ChunkMode::WIDE);
        default:
            return read_chunked(stmt, index, ChunkMode::NARROW);
    }
}

} // anonymous namespace

// ============================================================================
// OdbcHandle
// ============================================================================

OdbcHandle::OdbcHandle(SQLSMALLINT type, SQLHANDLE parent)
    : type_(type), handle_(SQL_NULL_HANDLE) {
    const SQLRETURN ret = SQLAllocHandle(type, parent, &handle_);
    if (!SQL_SUCCEEDED(ret)) {
        handle_ = SQL_NULL_HANDLE;
        throw MigrationError(ErrorCategory::CONNECTION_ERROR,
            std::format("SQLAllocHandle failed for handle type {}", type));
    }
}

OdbcHandle::~OdbcHandle() {
    if (handle_ != SQL_NULL_HANDLE) {
        SQLFreeHandle(type_, handle_);
    }
}

OdbcHandle::OdbcHandle(OdbcHandle&& other) noexcept
    : type_(other.type_), handle_(std::exchange(other.handle_, SQL_NULL_HANDLE)) {}

std::string OdbcHandle::diagnostics() const {
    std::string result;
    for (SQLSMALLINT rec = 1;; ++rec) {
        std::array<SQLCHAR, 6> state{};
        std::array<SQLCHAR, SQL_MAX_MESSAGE_LENGTH> message{};
        SQLINTEGER native = 0;
        SQLSMALLINT len = 0;
        const SQLRETURN ret = SQLGetDiagRec(type_, handle_, rec, state.data(), &native,
                                            message.data(), static_cast<SQLSMALLINT>(message.size()), &len);
        if (!SQL_SUCCEEDED(ret)) break;
        if (!result.empty()) result += "; ";
        result += std::format("[{}] {}",
                              reinterpret_cast<const char*>(state.data()),
                              reinterpret_cast<const char*>(message.data()));
    }
    return result.empty() ? "no diagnostics" : result;
}

void OdbcHandle::check(SQLRETURN ret, ErrorCategory category, const std::string& what) const {
    if (!SQL_SUCCEEDED(ret)) {
        throw MigrationError(category, std::format("{}: {}", what, diagnostics()));
    }
}

// ============================================================================
// OdbcConnection
// ============================================================================

std::unique_ptr<OdbcConnection> OdbcConnection::connect(
    const std::string& path, const SourceConfig& config) {

    OdbcHandle env(SQL_HANDLE_ENV, SQL_NULL_HANDLE);
    env.check(SQLSetEnvAttr(env.get(), SQL_ATTR_ODBC_VERSION,
                            reinterpret_cast<SQLPOINTER>(SQL_OV_ODBC3), 0),
              ErrorCategory::CONNECTION_ERROR, "SQLSetEnvAttr");

    OdbcHandle dbc(SQL_HANDLE_DBC, env.get());
    if (config.read_only) {
        dbc.check(SQLSetConnectAttr(dbc.get(), SQL_ATTR_ACCESS_MODE,
                                    reinterpret_cast<SQLPOINTER>(SQL_MODE_READ_ONLY), 0),
                  ErrorCategory::CONNECTION_ERROR, "SQLSetConnectAttr");
    }

    std::string conn_str = std::format("DRIVER={};DBQ={};", config.odbc_driver, path);
    if (config.read_only) {
        conn_str += "ReadOnly=1;";
    }

    const SQLRETURN ret = SQLDriverConnect(
        dbc.get(), nullptr,
        reinterpret_cast<SQLCHAR*>(conn_str.data()), SQL_NTS,
        nullptr, 0, nullptr, SQL_DRIVER_NOPROMPT);
    if (!SQL_SUCCEEDED(ret)) {
        throw MigrationError(ErrorCategory::CONNECTION_ERROR,
            std::format("Cannot open {}: {}", path, dbc.diagnostics()));
    }

    utils::log::debug(std::format("ODBC connection opened: {}", path));
    return std::make_unique<OdbcConnection>(std::move(env), std::move(dbc));
}

OdbcConnection::OdbcConnection(OdbcHandle env, OdbcHandle dbc)
    : env_(std::move(env)), dbc_(std::move(dbc)), connected_(true) {}

OdbcConnection::~OdbcConnection() {
    close();
}

DbResultSet OdbcConnection::execute(const std::string& sql) {
    DbResultSet result;
    if (!connected_) {
        result.error_message = "Connection is closed";
        return result;
    }

    try {
        auto stmt = statement();
        std::string text = sql;
        const SQLRETURN ret = SQLExecDirect(stmt.get(), reinterpret_cast<SQLCHAR*>(text.data()), SQL_NTS);
        if (ret != SQL_NO_DATA) {
            stmt.check(ret, ErrorCategory::EXTRACTION_ERROR, "SQLExecDirect");
        }

        SQLSMALLINT ncols = 0;
        stmt.check(SQLNumResultCols(stmt.get(), &ncols),
                   ErrorCategory::EXTRACTION_ERROR, "SQLNumResultCols");
        if (ncols > 0) {
            for (const auto& col : describe_columns(stmt)) {
                result.column_names.push_back(col.name);
            }
            result.rows = fetch_all(stmt);
            result.has_rows = true;
            result.affected_rows = result.rows.size();
        } else {
            SQLLEN count = 0;
            stmt.check(SQLRowCount(stmt.get(), &count),
                       ErrorCategory::EXTRACTION_ERROR, "SQLRowCount");
            result.affected_rows = count > 0 ? static_cast<uint64_t>(count) : 0;
        }
        result.success = true;
    } catch (const MigrationError& e) {
        result.success = false;
        result.error_message = e.what();
        result.rows.clear();
    }
    return result;
}

bool OdbcConnection::is_connected() const {
    return connected_;
}

void OdbcConnection::close() {
    if (connected_) {
        SQLDisconnect(dbc_.get());
        connected_ = false;
    }
}

OdbcHandle OdbcConnection::statement() {
    return OdbcHandle(SQL_HANDLE_STMT, dbc_.get());
}

std::vector<Row> OdbcConnection::fetch_all(const OdbcHandle& stmt) {
    const auto columns = describe_columns(stmt);
    std::vector<Row> rows;

    while (true) {
        const SQLRETURN ret = SQLFetch(stmt.get());
        if (ret == SQL_NO_DATA) break;
        stmt.check(ret, ErrorCategory::EXTRACTION_ERROR, "SQLFetch");

        Row row;
        row.reserve(columns.size());
        for (size_t i = 0; i < columns.size(); ++i) {
            row.push_back(read_value(stmt, static_cast<SQLUSMALLINT>(i + 1), columns[i].sql_type));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace schemaport
