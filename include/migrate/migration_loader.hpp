#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "migrate/ddl_builder.hpp"
#include "migrate/progress_reporter.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace schemaport {

class SqliteConnection;

struct LoadReport {
    std::filesystem::path database_path;
    size_t tables_created = 0;
    size_t tables_loaded = 0;
    uint64_t rows_inserted = 0;
    std::map<std::string, uint64_t> table_rows;   // table -> rows inserted
    std::vector<SkippedTable> skipped;            // created but left empty
};

/**
 * @brief Creates the refined schema in SQLite, loads the rows, saves one file
 *
 * Work happens in a staging database (in memory by default). Tables are
 * created in the given order; each table's rows go in through one reused
 * prepared statement inside a single transaction, so a failing table is
 * rolled back on its own and the rest continue. Rows are inserted in
 * chunks of batch_size; each chunk's values are released as soon as it is
 * in, and progress is reported once per chunk. The staging database is
 * then written with VACUUM INTO to "<target>.tmp" and renamed over the
 * target.
 *
 * An existing target is only replaced when overwrite is set; otherwise the
 * load fails with TARGET_CONFLICT before anything is written.
 */
class MigrationLoader {
public:
    using CompletionCallback = std::function<void(const LoadReport&)>;

    MigrationLoader(TargetConfig config, IProgressReporter& progress);

    /**
     * @param schema Refined, augmented schema
     * @param order Schema indices in creation order (each exactly once)
     * @param batches Row batches, matched to tables by name
     * @param target Final database file path
     */
    [[nodiscard]] Result<LoadReport> load(const Schema& schema,
                                          const std::vector<size_t>& order,
                                          std::vector<RowBatch> batches,
                                          const std::filesystem::path& target) const;

    /**
     * @brief TARGET_CONFLICT if the target exists and overwrite is off
     */
    [[nodiscard]] Result<std::filesystem::path> check_target(const std::filesystem::path& target) const;

    /**
     * @brief Called once after the target file is in place
     */
    void on_complete(CompletionCallback callback) { on_complete_ = std::move(callback); }

    /**
     * @brief Insert one table's rows into an open store, chunk by chunk
     *
     * The table must already exist. All chunks share one transaction. The
     * batch is consumed: every row is emptied once its chunk is inserted,
     * and the row vector is released at the end.
     *
     * @return Rows inserted
     * @throws MigrationError (STORE_ERROR) after rolling the table back
     */
    uint64_t insert_table(SqliteConnection& conn, RowBatch& batch) const;

private:
    void save(SqliteConnection& conn, const std::filesystem::path& target) const;

    TargetConfig config_;
    DdlBuilder ddl_;
    IProgressReporter& progress_;
    CompletionCallback on_complete_;
};

} // namespace schemaport
