#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

namespace schemaport {

/**
 * @brief Receives per-table progress while rows are loaded
 */
class IProgressReporter {
public:
    virtual ~IProgressReporter() = default;

    virtual void start_table(const std::string& table, size_t total_rows) = 0;
    virtual void update_progress(const std::string& table, size_t processed_rows) = 0;
    virtual void finish_table(const std::string& table) = 0;
};

/**
 * @brief Logs start and finish at INFO, intermediate progress at DEBUG
 */
class LoggingProgressReporter : public IProgressReporter {
public:
    void start_table(const std::string& table, size_t total_rows) override;
    void update_progress(const std::string& table, size_t processed_rows) override;
    void finish_table(const std::string& table) override;

private:
    std::unordered_map<std::string, size_t> totals_;
};

class SilentProgressReporter : public IProgressReporter {
public:
    void start_table(const std::string&, size_t) override {}
    void update_progress(const std::string&, size_t) override {}
    void finish_table(const std::string&) override {}
};

} // namespace schemaport
