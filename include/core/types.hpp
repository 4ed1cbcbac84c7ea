#pragma once

#include "core/column_type.hpp"
#include "core/value.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace schemaport {

// ============================================================================
// Schema Types
// ============================================================================

struct ForeignKeyRef {
    std::string table;
    std::string column;
    bool augmented = false;     // injected from a naming convention

    ForeignKeyRef() = default;
    ForeignKeyRef(std::string t, std::string c, bool aug = false)
        : table(std::move(t)), column(std::move(c)), augmented(aug) {}
};

/**
 * @brief Distinct string values observed for a column across a full scan
 *
 * Sorted so that anything rendered from it is deterministic.
 */
using EnumDomain = std::set<std::string>;

struct ColumnMetadata {
    std::string name;
    ColumnTypeInfo physical;
    LogicalType logical;
    bool nullable;
    bool is_primary_key;
    int pk_position;            // 1-based sequence in the key; 0 = column order
    std::vector<ForeignKeyRef> foreign_keys;
    std::shared_ptr<const EnumDomain> enum_domain;  // set once, never mutated

    ColumnMetadata() : logical(LogicalType::TEXT), nullable(true), is_primary_key(false), pk_position(0) {}
    ColumnMetadata(std::string n, ColumnTypeInfo type)
        : name(std::move(n)), physical(std::move(type)),
          logical(LogicalType::TEXT), nullable(true), is_primary_key(false), pk_position(0) {}
};

struct TableMetadata {
    std::string name;
    std::vector<ColumnMetadata> columns;
    std::unordered_map<std::string, size_t> column_index; // name -> index
    bool without_rowid;

    TableMetadata() : without_rowid(false) {}
    explicit TableMetadata(std::string n) : name(std::move(n)), without_rowid(false) {}

    /**
     * @brief Append a column, keeping column_index in sync
     * @throws std::invalid_argument if the name is already present
     */
    ColumnMetadata& add_column(ColumnMetadata column);

    const ColumnMetadata* find_column(const std::string& col_name) const {
        auto it = column_index.find(col_name);
        if (it != column_index.end() && it->second < columns.size()) {
            return &columns[it->second];
        }
        return nullptr;
    }

    ColumnMetadata* find_column(const std::string& col_name) {
        auto it = column_index.find(col_name);
        if (it != column_index.end() && it->second < columns.size()) {
            return &columns[it->second];
        }
        return nullptr;
    }

    [[nodiscard]] bool has_primary_key() const;
    /**
     * @brief Key columns in key-sequence order
     *
     * Columns with a pk_position come in that order; columns flagged without
     * one follow in column order.
     */
    [[nodiscard]] std::vector<std::string> primary_key_columns() const;
};

/**
 * @brief Arena of tables addressed by stable index, with a name index
 *
 * Indices never change once a table is added. Stages that derive a new
 * schema take one by value and return it.
 */
class Schema {
public:
    /**
     * @brief Add a table
     * @return Index of the new table
     * @throws std::invalid_argument if a table with the same name exists
     */
    size_t add_table(TableMetadata table);

    [[nodiscard]] std::optional<size_t> index_of(const std::string& table_name) const;

    [[nodiscard]] const TableMetadata* find_table(const std::string& table_name) const;
    [[nodiscard]] TableMetadata* find_table(const std::string& table_name);

    [[nodiscard]] const TableMetadata& at(size_t index) const { return tables_.at(index); }
    [[nodiscard]] TableMetadata& at(size_t index) { return tables_.at(index); }

    [[nodiscard]] const std::vector<TableMetadata>& tables() const { return tables_; }
    [[nodiscard]] size_t size() const { return tables_.size(); }
    [[nodiscard]] bool empty() const { return tables_.empty(); }

private:
    std::vector<TableMetadata> tables_;
    std::unordered_map<std::string, size_t> table_index_;
};

// ============================================================================
// Row Data
// ============================================================================

/**
 * @brief All rows of one table, positional against `columns`
 *
 * Produced once by the scanner and consumed once by the loader.
 */
struct RowBatch {
    std::string table;
    std::vector<std::string> columns;
    std::vector<Row> rows;
};

/**
 * @brief A table whose data was not migrated, and why
 */
struct SkippedTable {
    std::string table;
    std::string reason;
};

} // namespace schemaport
