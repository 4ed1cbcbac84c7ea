#include "convert/converter.hpp"
#include "codegen/model_synthesizer.hpp"
#include "codegen/sqlalchemy_renderer.hpp"
#include "core/database_type.hpp"
#include "core/utils.hpp"
#include "db/source_locator.hpp"
#include "db/source_registry.hpp"
#include "migrate/migration_loader.hpp"
#include "schema/dependency_orderer.hpp"
#include "schema/relationship_augmenter.hpp"
#include "schema/schema_reflector.hpp"

#include <format>
#include <fstream>
#include <memory>
#include <system_error>

namespace schemaport {

nlohmann::json summary_to_json(const ConversionSummary& summary) {
    nlohmann::json tables = nlohmann::json::object();
    for (const auto& [name, rows] : summary.table_rows) {
        tables[name] = rows;
    }

    nlohmann::json skipped = nlohmann::json::array();
    for (const auto& s : summary.skipped) {
        skipped.push_back({{"table", s.table}, {"reason", s.reason}});
    }

    return {
        {"source", summary.source.string()},
        {"database_file", summary.database_file.string()},
        {"model_file", summary.model_file.string()},
        {"tables", summary.tables},
        {"rows", summary.rows},
        {"table_rows", std::move(tables)},
        {"skipped", std::move(skipped)},
        {"advisories", summary.advisories},
        {"collisions", summary.collisions},
        {"cast_failures", summary.cast_failures},
        {"elapsed_ms", summary.elapsed.count()},
    };
}

Converter::Converter(ConversionConfig config, IProgressReporter& progress)
    : config_(std::move(config)), progress_(progress) {}

Result<ConversionSummary> Converter::convert(const std::filesystem::path& source,
                                             const std::filesystem::path& target_dir) const {
    utils::Timer timer;
    ConversionSummary summary;

    // Locate
    auto located = SourceLocator(config_.source).locate(source);
    if (located.is_error()) {
        return Result<ConversionSummary>::error(located.error_category(), located.error_message());
    }
    summary.source = located.value();
    utils::log::info(std::format("Processing: {}", summary.source.string()));

    const auto kind = database_type_for_path(summary.source);
    if (!kind) {
        return Result<ConversionSummary>::error(ErrorCategory::NOT_FOUND,
            std::format("Unsupported source file type: {}", summary.source.string()));
    }

    // Refuse before touching anything
    summary.database_file = target_dir / config_.target.database_file;
    summary.model_file = target_dir / config_.target.model_file;
    MigrationLoader loader(config_.target, progress_);
    for (const auto& path : {summary.database_file, summary.model_file}) {
        if (auto checked = loader.check_target(path); checked.is_error()) {
            return Result<ConversionSummary>::error(checked.error_category(), checked.error_message());
        }
    }

    // Reflect and scan
    if (!SourceRegistry::instance().has_reader(*kind)) {
        return Result<ConversionSummary>::error(ErrorCategory::CONNECTION_ERROR,
            std::format("No reader available for {} sources", database_type_to_string(*kind)));
    }
    std::unique_ptr<ISourceReader> reader;
    try {
        reader = SourceRegistry::instance().create(*kind, summary.source.string(), config_.source);
    } catch (const MigrationError& e) {
        return Result<ConversionSummary>::error(e.category(), e.what());
    }

    auto reflected = SchemaReflector(config_).reflect(*reader);
    reader.reset();
    if (reflected.is_error()) {
        return Result<ConversionSummary>::error(reflected.error_category(), reflected.error_message());
    }
    auto& reflection = reflected.value();
    summary.skipped = reflection.skipped;
    summary.cast_failures = reflection.cast_failures;

    // Augment and order
    Schema schema = RelationshipAugmenter(config_.foreign_keys).augment(std::move(reflection.schema));
    const TableOrder order = DependencyOrderer::order(schema);
    summary.tables = schema.size();

    // Load
    auto loaded = loader.load(schema, order.order, std::move(reflection.batches), summary.database_file);
    if (loaded.is_error()) {
        return Result<ConversionSummary>::error(loaded.error_category(), loaded.error_message());
    }
    const auto& report = loaded.value();
    summary.rows = report.rows_inserted;
    summary.table_rows = report.table_rows;
    summary.skipped.insert(summary.skipped.end(), report.skipped.begin(), report.skipped.end());

    // Synthesize
    const ModelSynthesizer synthesizer(config_.model);
    const auto model_file = synthesizer.plan(schema, order);
    summary.collisions = model_file.collisions;
    summary.advisories = model_file.advisories;
    auto written = write_model(SqlAlchemyRenderer(config_.model).render(model_file), summary.model_file);
    if (written.is_error()) {
        return Result<ConversionSummary>::error(written.error_category(), written.error_message());
    }

    summary.elapsed = timer.elapsed_ms();
    utils::log::info(std::format("Migrated {} in {}ms: {} tables, {} rows, {} skipped",
                                 summary.source.filename().string(), summary.elapsed.count(),
                                 summary.tables, summary.rows, summary.skipped.size()));

    if (!config_.report.summary_file.empty()) {
        write_summary(summary, target_dir);
    }
    if (on_complete_) {
        on_complete_(summary);
    }
    return Result<ConversionSummary>::ok(std::move(summary));
}

Result<std::filesystem::path> Converter::write_model(const std::string& content,
                                                     const std::filesystem::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<std::filesystem::path>::error(ErrorCategory::STORE_ERROR,
            std::format("Cannot write model file: {}", path.string()));
    }
    out << content;
    out.close();
    if (!out) {
        return Result<std::filesystem::path>::error(ErrorCategory::STORE_ERROR,
            std::format("Failed writing model file: {}", path.string()));
    }

    utils::log::info(std::format("Saved: {}", path.string()));
    return Result<std::filesystem::path>::ok(path);
}

void Converter::write_summary(const ConversionSummary& summary, const std::filesystem::path& target_dir) const {
    std::filesystem::path path = config_.report.summary_file;
    if (path.is_relative()) {
        path = target_dir / path;
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        utils::log::warn(std::format("Cannot write summary file: {}", path.string()));
        return;
    }
    out << summary_to_json(summary).dump(2) << '\n';
    utils::log::info(std::format("Summary written: {}", path.string()));
}

} // namespace schemaport
