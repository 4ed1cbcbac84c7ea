#include "core/value.hpp"
#include "core/utils.hpp"

#include <format>

namespace schemaport {

namespace {

// Fixed-width unsigned field, digits only
std::optional<int> parse_field(std::string_view text, size_t pos, size_t width) {
    if (pos + width > text.size()) return std::nullopt;
    const auto field = text.substr(pos, width);
    for (const char c : field) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    return utils::try_parse_int<int>(field);
}

} // anonymous namespace

std::optional<Date> parse_iso_date(std::string_view text) {
    // YYYY-MM-DD
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    if (text.size() > 10 && text[10] != ' ' && text[10] != 'T') {
        return std::nullopt;
    }

    const auto year = parse_field(text, 0, 4);
    const auto month = parse_field(text, 5, 2);
    const auto day = parse_field(text, 8, 2);
    if (!year || !month || !day) return std::nullopt;

    const Date date{std::chrono::year{*year},
                    std::chrono::month{static_cast<unsigned>(*month)},
                    std::chrono::day{static_cast<unsigned>(*day)}};
    if (!date.ok()) return std::nullopt;
    return date;
}

std::optional<DateTime> parse_iso_datetime(std::string_view text) {
    const auto date = parse_iso_date(text);
    if (!date) return std::nullopt;

    int hours = 0;
    int minutes = 0;
    int seconds = 0;
    if (text.size() > 10) {
        // HH:MM after the separator
        const auto h = parse_field(text, 11, 2);
        const auto m = parse_field(text, 14, 2);
        if (!h || !m || text.size() < 16 || text[13] != ':') return std::nullopt;
        hours = *h;
        minutes = *m;
        if (text.size() > 16) {
            if (text[16] != ':') return std::nullopt;
            const auto s = parse_field(text, 17, 2);
            if (!s) return std::nullopt;
            seconds = *s;
            // Fractional seconds are truncated
            if (text.size() > 19 && text[19] != '.') return std::nullopt;
        }
        if (hours > 23 || minutes > 59 || seconds > 59) return std::nullopt;
    }

    return std::chrono::sys_days{*date} + std::chrono::hours{hours} +
           std::chrono::minutes{minutes} + std::chrono::seconds{seconds};
}

std::string format_date(const Date& date) {
    return std::format("{:04d}-{:02d}-{:02d}",
        static_cast<int>(date.year()),
        static_cast<unsigned>(date.month()),
        static_cast<unsigned>(date.day()));
}

std::string format_datetime(const DateTime& datetime) {
    const auto days = std::chrono::floor<std::chrono::days>(datetime);
    const std::chrono::hh_mm_ss time{datetime - days};
    return std::format("{} {:02d}:{:02d}:{:02d}",
        format_date(Date{days}),
        time.hours().count(),
        time.minutes().count(),
        static_cast<long long>(time.seconds().count()));
}

} // namespace schemaport
