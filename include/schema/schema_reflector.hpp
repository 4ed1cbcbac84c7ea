#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "db/isource_reader.hpp"
#include "schema/data_scanner.hpp"
#include "schema/type_refiner.hpp"

#include <cstddef>
#include <vector>

namespace schemaport {

struct ReflectionResult {
    Schema schema;
    std::vector<RowBatch> batches;          // one per table with at least one row
    std::vector<SkippedTable> skipped;      // data not migrated, schema may still be
    size_t cast_failures = 0;
};

/**
 * @brief Reflect-and-scan phase: builds the refined schema and its row batches
 *
 * For every table the reader lists: reflect the physical columns, refine
 * their types, read and scan every row, then apply the inferred enum
 * domains and nullability. A table whose rows cannot be read keeps its
 * refined schema and contributes no data. A table that cannot be
 * reflected at all is left out.
 */
class SchemaReflector {
public:
    explicit SchemaReflector(const ConversionConfig& config);

    /**
     * @return The reflected result, or CONNECTION_ERROR when the table list
     *         itself cannot be read
     */
    [[nodiscard]] Result<ReflectionResult> reflect(ISourceReader& reader) const;

private:
    TypeRefiner refiner_;
    DataScanner scanner_;
    bool without_rowid_;
};

} // namespace schemaport
