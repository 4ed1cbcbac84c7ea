#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace schemaport {

using Blob = std::vector<uint8_t>;
using Date = std::chrono::year_month_day;
using DateTime = std::chrono::sys_seconds;

/**
 * @brief A single cell value read from a source or written to the store
 *
 * std::monostate is SQL NULL.
 */
using FieldValue = std::variant<std::monostate, int64_t, double, bool, std::string, Date, DateTime, Blob>;

using Row = std::vector<FieldValue>;

[[nodiscard]] inline bool is_null(const FieldValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

/**
 * @brief Parse "YYYY-MM-DD" (a trailing time part is accepted and dropped)
 * @return Calendar date, or std::nullopt for malformed or impossible dates
 */
[[nodiscard]] std::optional<Date> parse_iso_date(std::string_view text);

/**
 * @brief Parse "YYYY-MM-DD[ T]HH:MM[:SS[.fff]]" or a bare date (midnight)
 */
[[nodiscard]] std::optional<DateTime> parse_iso_datetime(std::string_view text);

[[nodiscard]] std::string format_date(const Date& date);
[[nodiscard]] std::string format_datetime(const DateTime& datetime);

} // namespace schemaport
