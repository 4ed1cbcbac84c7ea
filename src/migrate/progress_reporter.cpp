#include "migrate/progress_reporter.hpp"
#include "core/utils.hpp"

#include <format>

namespace schemaport {

void LoggingProgressReporter::start_table(const std::string& table, size_t total_rows) {
    totals_[table] = total_rows;
    utils::log::info(std::format("Loading table: {} ({} rows)", table, total_rows));
}

void LoggingProgressReporter::update_progress(const std::string& table, size_t processed_rows) {
    const auto it = totals_.find(table);
    if (it == totals_.end() || it->second == 0) return;

    const double percentage = 100.0 * static_cast<double>(processed_rows) / static_cast<double>(it->second);
    utils::log::debug(std::format("Table {}: {}/{} rows ({:.1f}%)",
                                  table, processed_rows, it->second, percentage));
}

void LoggingProgressReporter::finish_table(const std::string& table) {
    const auto it = totals_.find(table);
    const size_t total = it != totals_.end() ? it->second : 0;
    utils::log::info(std::format("Completed table: {} ({} rows)", table, total));
    if (it != totals_.end()) {
        totals_.erase(it);
    }
}

} // namespace schemaport
