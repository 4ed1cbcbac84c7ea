#pragma once

#include "core/column_type.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace schemaport {

// ============================================================================
// Configuration Types
// ============================================================================

struct SourceConfig {
    std::vector<std::string> extensions;   // candidate file extensions, lowercase with dot
    std::string preferred_keyword;         // preferred when contained in the file stem
    std::string odbc_driver;               // ODBC driver name for Access files
    bool read_only;

    SourceConfig()
        : extensions{".accdb", ".mdb"},
          preferred_keyword("dpm"),
          odbc_driver("{Microsoft Access Driver (*.mdb, *.accdb)}"),
          read_only(true) {}
};

struct TargetConfig {
    std::string database_file;
    std::string model_file;
    bool overwrite;
    bool without_rowid;        // WITHOUT ROWID for tables with a primary key
    bool enum_constraints;     // CHECK (col IN (...)) for enum columns
    size_t batch_size;         // rows per insert chunk, released once inserted
    bool stage_in_memory;      // false = stage in a temporary file beside the target

    TargetConfig()
        : database_file("dpm.sqlite"),
          model_file("dpm.py"),
          overwrite(false),
          without_rowid(true),
          enum_constraints(true),
          batch_size(50000),
          stage_in_memory(true) {}
};

/**
 * @brief Naming patterns driving type refinement and enum detection
 *
 * All matches are case-insensitive.
 */
struct PatternConfig {
    std::vector<std::string> enum_suffixes;
    std::vector<std::string> guid_suffixes;
    std::vector<std::string> bool_prefixes;
    std::vector<std::string> date_suffixes;

    PatternConfig()
        : enum_suffixes{"type", "status", "sign", "optionality", "direction",
                        "number", "endorsement", "source", "severity", "errorcode"},
          guid_suffixes{"guid"},
          bool_prefixes{"is", "has"},
          date_suffixes{"date"} {}
};

struct ColumnOverride {
    std::string column;     // exact, case-sensitive column name
    LogicalType type;
};

struct ForeignKeyMapping {
    std::string column;          // source column name in any table
    std::string target_table;
    std::string target_column;
};

struct ModelConfig {
    std::string base_class;
    std::string indent;
    std::string hub_table;                 // always rendered with deferred references
    std::string identity_column;           // synthetic key for tables without a PK
    std::string self_reference_name;
    std::string related_prefix;
    std::vector<std::string> strip_suffixes;                    // tried in order, first match wins
    std::map<std::string, std::string> suffix_replacements;     // suffix -> replacement
    std::map<std::string, std::string> relation_names;          // column -> relation base name
    bool reverse_relationships;

    ModelConfig()
        : base_class("DPM"),
          indent("    "),
          hub_table("Concept"),
          identity_column("RowGUID"),
          self_reference_name("Self"),
          related_prefix("Related"),
          strip_suffixes{"GUID", "ID"},
          suffix_replacements{{"VID", "Version"}},
          relation_names{{"RowGUID", "RowConcept"}},
          reverse_relationships(true) {}
};

struct LoggingConfig {
    std::string level = "info";
};

struct ReportConfig {
    std::string summary_file;   // empty = no JSON summary
};

// ============================================================================
// ConversionConfig - Complete parsed configuration
// ============================================================================

struct ConversionConfig {
    SourceConfig source;
    TargetConfig target;
    PatternConfig patterns;
    std::vector<ColumnOverride> overrides;
    std::vector<ForeignKeyMapping> foreign_keys;
    ModelConfig model;
    LoggingConfig logging;
    ReportConfig report;

    ConversionConfig()
        : overrides{{"ParentFirst", LogicalType::BOOLEAN},
                    {"UseIntervalArithmetics", LogicalType::BOOLEAN},
                    {"StartDate", LogicalType::DATETIME},
                    {"EndDate", LogicalType::DATETIME}},
          foreign_keys{{"RowGUID", "Concept", "ConceptGUID"},
                       {"ParentItemID", "Item", "ItemID"}} {}
};

} // namespace schemaport
