#include "core/types.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <stdexcept>

namespace schemaport {

ColumnMetadata& TableMetadata::add_column(ColumnMetadata column) {
    if (column_index.count(column.name) > 0) {
        throw std::invalid_argument(
            std::format("Duplicate column {} in table {}", column.name, name));
    }
    column_index[column.name] = columns.size();
    columns.push_back(std::move(column));
    return columns.back();
}

bool TableMetadata::has_primary_key() const {
    for (const auto& col : columns) {
        if (col.is_primary_key) return true;
    }
    return false;
}

std::vector<std::string> TableMetadata::primary_key_columns() const {
    std::vector<const ColumnMetadata*> keys;
    for (const auto& col : columns) {
        if (col.is_primary_key) {
            keys.push_back(&col);
        }
    }
    std::stable_sort(keys.begin(), keys.end(), [](const ColumnMetadata* a, const ColumnMetadata* b) {
        const int pa = a->pk_position > 0 ? a->pk_position : std::numeric_limits<int>::max();
        const int pb = b->pk_position > 0 ? b->pk_position : std::numeric_limits<int>::max();
        return pa < pb;
    });

    std::vector<std::string> result;
    result.reserve(keys.size());
    for (const auto* col : keys) {
        result.push_back(col->name);
    }
    return result;
}

size_t Schema::add_table(TableMetadata table) {
    if (table_index_.count(table.name) > 0) {
        throw std::invalid_argument(std::format("Duplicate table {}", table.name));
    }
    const size_t index = tables_.size();
    table_index_[table.name] = index;
    tables_.push_back(std::move(table));
    return index;
}

std::optional<size_t> Schema::index_of(const std::string& table_name) const {
    const auto it = table_index_.find(table_name);
    if (it == table_index_.end()) return std::nullopt;
    return it->second;
}

const TableMetadata* Schema::find_table(const std::string& table_name) const {
    const auto it = table_index_.find(table_name);
    return it != table_index_.end() ? &tables_[it->second] : nullptr;
}

TableMetadata* Schema::find_table(const std::string& table_name) {
    const auto it = table_index_.find(table_name);
    return it != table_index_.end() ? &tables_[it->second] : nullptr;
}

} // namespace schemaport
