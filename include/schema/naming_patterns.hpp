#pragma once

#include "config/config_types.hpp"
#include "core/utils.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace schemaport {

/**
 * @brief Column-name predicates shared by the refiner and the scanner
 *
 * Matching is case-insensitive, so "RowGUID", "rowguid" and "ROWGUID"
 * all end with the "guid" suffix.
 */
class NamingPatterns {
public:
    explicit NamingPatterns(PatternConfig config) : config_(std::move(config)) {}

    [[nodiscard]] bool is_guid(std::string_view column) const {
        return ends_with_any(column, config_.guid_suffixes);
    }

    [[nodiscard]] bool is_date(std::string_view column) const {
        return ends_with_any(column, config_.date_suffixes);
    }

    [[nodiscard]] bool is_bool(std::string_view column) const {
        for (const auto& prefix : config_.bool_prefixes) {
            if (utils::istarts_with(column, prefix)) return true;
        }
        return false;
    }

    [[nodiscard]] bool is_enum(std::string_view column) const {
        return ends_with_any(column, config_.enum_suffixes);
    }

    [[nodiscard]] const PatternConfig& config() const { return config_; }

private:
    static bool ends_with_any(std::string_view column, const std::vector<std::string>& suffixes) {
        for (const auto& suffix : suffixes) {
            if (utils::iends_with(column, suffix)) return true;
        }
        return false;
    }

    PatternConfig config_;
};

} // namespace schemaport
