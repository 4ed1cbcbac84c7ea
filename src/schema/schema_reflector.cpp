#include "schema/schema_reflector.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>

namespace schemaport {

SchemaReflector::SchemaReflector(const ConversionConfig& config)
    : refiner_(config.patterns, config.overrides),
      scanner_(config.patterns),
      without_rowid_(config.target.without_rowid) {}

Result<ReflectionResult> SchemaReflector::reflect(ISourceReader& reader) const {
    std::vector<std::string> names;
    try {
        names = reader.list_tables();
    } catch (const MigrationError& e) {
        return Result<ReflectionResult>::error(ErrorCategory::CONNECTION_ERROR,
            std::format("Cannot list source tables: {}", e.what()));
    }

    ReflectionResult result;
    utils::Timer timer;

    for (const auto& name : names) {
        TableMetadata table;
        try {
            table = reader.reflect_table(name);
        } catch (const MigrationError& e) {
            utils::log::warn(std::format("Skipping table {}: {}", name, e.what()));
            result.skipped.push_back({name, e.what()});
            continue;
        }

        refiner_.refine_table(table);
        table.without_rowid = without_rowid_ && table.has_primary_key();

        try {
            auto scan = scanner_.scan(table, reader.read_rows(table));
            DataScanner::apply(table, scan);
            result.cast_failures += scan.cast_failures;

            utils::log::info(std::format("Scanned {}: {} rows, {} enum columns",
                                         name, scan.batch.rows.size(), scan.enums.size()));
            if (!scan.batch.rows.empty()) {
                result.batches.push_back(std::move(scan.batch));
            }
        } catch (const MigrationError& e) {
            if (e.category() == ErrorCategory::CONNECTION_ERROR) {
                return Result<ReflectionResult>::error(e.category(),
                    std::format("Lost source connection reading {}: {}", name, e.what()));
            }
            utils::log::warn(std::format("Data of table {} skipped: {}", name, e.what()));
            result.skipped.push_back({name, e.what()});
        }

        result.schema.add_table(std::move(table));
    }

    utils::log::info(std::format("Reflected {} tables in {}ms ({} skipped)",
                                 result.schema.size(), timer.elapsed_ms().count(), result.skipped.size()));
    return Result<ReflectionResult>::ok(std::move(result));
}

} // namespace schemaport
