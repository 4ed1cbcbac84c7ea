#include "migrate/migration_loader.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace schemaport {

namespace {

constexpr const char* kInMemory = ":memory:";

std::filesystem::path sibling(const std::filesystem::path& target, const std::string& suffix) {
    auto path = target;
    path += suffix;
    return path;
}

void remove_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        utils::log::warn(std::format("Cannot remove {}: {}", path.string(), ec.message()));
    }
}

} // anonymous namespace

MigrationLoader::MigrationLoader(TargetConfig config, IProgressReporter& progress)
    : config_(std::move(config)), ddl_(config_), progress_(progress) {}

Result<std::filesystem::path> MigrationLoader::check_target(const std::filesystem::path& target) const {
    std::error_code ec;
    if (std::filesystem::exists(target, ec) && !config_.overwrite) {
        return Result<std::filesystem::path>::error(ErrorCategory::TARGET_CONFLICT,
            std::format("Target database already exists: {} (use --overwrite to replace it)",
                        target.string()));
    }
    return Result<std::filesystem::path>::ok(target);
}

Result<LoadReport> MigrationLoader::load(const Schema& schema,
                                         const std::vector<size_t>& order,
                                         std::vector<RowBatch> batches,
                                         const std::filesystem::path& target) const {
    if (auto checked = check_target(target); checked.is_error()) {
        return Result<LoadReport>::error(checked.error_category(), checked.error_message());
    }

    LoadReport report;
    report.database_path = target;

    std::unordered_map<std::string, size_t> batch_index;
    for (size_t i = 0; i < batches.size(); ++i) {
        batch_index[batches[i].table] = i;
    }

    const auto staging = sibling(target, ".staging");
    try {
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path());
        }
        if (!config_.stage_in_memory) {
            remove_quietly(staging);
        }

        auto conn = SqliteConnection::open(config_.stage_in_memory ? kInMemory : staging.string(), false);
        if (!config_.stage_in_memory) {
            conn->exec("PRAGMA journal_mode = OFF; PRAGMA synchronous = OFF");
        }

        for (const size_t index : order) {
            const auto& table = schema.at(index);
            conn->exec(ddl_.create_table(table));
            ++report.tables_created;
            utils::log::debug(std::format("Created table {}", table.name));
        }

        for (const size_t index : order) {
            const auto& table = schema.at(index);
            const auto it = batch_index.find(table.name);
            if (it == batch_index.end()) continue;

            auto& batch = batches[it->second];
            try {
                const uint64_t inserted = insert_table(*conn, batch);
                report.table_rows[table.name] = inserted;
                report.rows_inserted += inserted;
                ++report.tables_loaded;
            } catch (const MigrationError& e) {
                utils::log::warn(std::format("Data of table {} rolled back: {}", table.name, e.what()));
                report.skipped.push_back({table.name, e.what()});
            }
            batch.rows = {};
        }

        save(*conn, target);
        conn->close();
    } catch (const MigrationError& e) {
        if (!config_.stage_in_memory) remove_quietly(staging);
        return Result<LoadReport>::error(ErrorCategory::STORE_ERROR, e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        if (!config_.stage_in_memory) remove_quietly(staging);
        return Result<LoadReport>::error(ErrorCategory::STORE_ERROR, e.what());
    }

    if (!config_.stage_in_memory) {
        remove_quietly(staging);
    }

    utils::log::info(std::format("Saved: {} ({} tables, {} rows)",
                                 target.string(), report.tables_created, report.rows_inserted));
    if (on_complete_) {
        on_complete_(report);
    }
    return Result<LoadReport>::ok(std::move(report));
}

uint64_t MigrationLoader::insert_table(SqliteConnection& conn, RowBatch& batch) const {
    const size_t total = batch.rows.size();
    progress_.start_table(batch.table, total);

    SqliteTransaction tx(conn);
    auto stmt = conn.prepare(DdlBuilder::insert_statement(batch.table, batch.columns));

    const size_t batch_size = std::max<size_t>(config_.batch_size, 1);
    uint64_t inserted = 0;
    for (size_t begin = 0; begin < total; begin += batch_size) {
        const size_t end = std::min(total, begin + batch_size);
        for (size_t r = begin; r < end; ++r) {
            const auto& row = batch.rows[r];
            for (size_t c = 0; c < row.size(); ++c) {
                stmt.bind(static_cast<int>(c + 1), row[c]);
            }
            stmt.step();
            stmt.reset();
        }

        // The chunk is in the transaction; its values are not needed again
        for (size_t r = begin; r < end; ++r) {
            Row().swap(batch.rows[r]);
        }
        inserted = end;
        progress_.update_progress(batch.table, inserted);
    }

    tx.commit();
    batch.rows = {};
    progress_.finish_table(batch.table);
    return inserted;
}

void MigrationLoader::save(SqliteConnection& conn, const std::filesystem::path& target) const {
    const auto tmp = sibling(target, ".tmp");
    remove_quietly(tmp);

    conn.exec(std::format("VACUUM INTO {}", utils::quote_literal(tmp.string())));

    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        remove_quietly(tmp);
        throw MigrationError(ErrorCategory::STORE_ERROR,
            std::format("Cannot move {} to {}: {}", tmp.string(), target.string(), ec.message()));
    }
}

} // namespace schemaport
