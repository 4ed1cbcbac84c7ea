#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"
#include "schema/naming_patterns.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace schemaport {

using ColumnEnumMap = std::map<std::string, EnumDomain>;
using ColumnNames = std::set<std::string>;

struct ScanResult {
    RowBatch batch;             // cast rows
    ColumnEnumMap enums;        // enum-like column -> observed string domain
    ColumnNames nullables;      // columns that produced at least one NULL
    size_t cast_failures = 0;   // non-null raw values that cast to NULL
};

/**
 * @brief Casts a table's full row set and infers domains and nullability
 *
 * The whole table is accumulated in memory: enum domains and nullability
 * are only final once every row has been seen. Column logical types must
 * already be refined; rows are positional against table.columns.
 */
class DataScanner {
public:
    explicit DataScanner(const PatternConfig& patterns);

    /**
     * @brief Cast every row and accumulate domains and nullability
     * @throws MigrationError (EXTRACTION_ERROR) when a row's width does not
     *         match the table's column count
     */
    [[nodiscard]] ScanResult scan(const TableMetadata& table, std::vector<Row> rows) const;

    /**
     * @brief Apply a scan result to its table
     *
     * Columns with a domain become ENUM; columns without a NULL become
     * NOT NULL.
     */
    static void apply(TableMetadata& table, const ScanResult& result);

private:
    NamingPatterns patterns_;
};

} // namespace schemaport
