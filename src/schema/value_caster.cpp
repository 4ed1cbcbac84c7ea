#include "schema/value_caster.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <string>
#include <unordered_set>

namespace schemaport {

namespace {

FieldValue to_date(const FieldValue& raw) {
    if (const auto* s = std::get_if<std::string>(&raw)) {
        if (auto date = parse_iso_date(utils::trim(*s))) return *date;
        return std::monostate{};
    }
    if (const auto* dt = std::get_if<DateTime>(&raw)) {
        return Date{std::chrono::floor<std::chrono::days>(*dt)};
    }
    if (std::holds_alternative<Date>(raw)) return raw;
    return std::monostate{};
}

FieldValue to_datetime(const FieldValue& raw) {
    if (const auto* s = std::get_if<std::string>(&raw)) {
        if (auto dt = parse_iso_datetime(utils::trim(*s))) return *dt;
        return std::monostate{};
    }
    if (const auto* d = std::get_if<Date>(&raw)) {
        return DateTime{std::chrono::sys_days{*d}};
    }
    if (std::holds_alternative<DateTime>(raw)) return raw;
    return std::monostate{};
}

FieldValue to_integer(const FieldValue& raw) {
    if (const auto* b = std::get_if<bool>(&raw)) {
        return static_cast<int64_t>(*b ? 1 : 0);
    }
    if (const auto* s = std::get_if<std::string>(&raw)) {
        if (auto v = utils::try_parse_int<int64_t>(utils::trim(*s))) return *v;
    }
    return raw;
}

} // anonymous namespace

FieldValue ValueCaster::cast(LogicalType type, const FieldValue& raw) {
    if (is_null(raw)) {
        return std::monostate{};
    }

    switch (type) {
        case LogicalType::IDENTIFIER:
            return to_identifier(raw);
        case LogicalType::DATE:
            return to_date(raw);
        case LogicalType::DATETIME:
            return to_datetime(raw);
        case LogicalType::BOOLEAN:
            return truthy(raw);
        case LogicalType::INTEGER:
            return to_integer(raw);
        case LogicalType::FLOAT:
        case LogicalType::NUMERIC:
        case LogicalType::ENUM:
        case LogicalType::TEXT:
        case LogicalType::BLOB:
        default:
            return raw;
    }
}

bool ValueCaster::truthy(const FieldValue& raw) {
    struct Visitor {
        bool operator()(std::monostate) const { return false; }
        bool operator()(int64_t v) const { return v != 0; }
        bool operator()(double v) const { return v != 0.0 && !std::isnan(v); }
        bool operator()(bool v) const { return v; }
        bool operator()(const std::string& v) const {
            static const std::unordered_set<std::string> falsy = {
                "", "0", "false", "no", "n", "f", "off"
            };
            return falsy.count(utils::to_lower(utils::trim(v))) == 0;
        }
        bool operator()(const Date&) const { return true; }
        bool operator()(const DateTime&) const { return true; }
        bool operator()(const Blob& v) const { return !v.empty(); }
    };
    return std::visit(Visitor{}, raw);
}

FieldValue ValueCaster::to_identifier(const FieldValue& raw) {
    if (const auto* i = std::get_if<int64_t>(&raw)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&raw)) {
        if (std::isfinite(*d) && *d == std::floor(*d)) {
            return std::to_string(static_cast<int64_t>(*d));
        }
        return std::monostate{};
    }
    if (const auto* s = std::get_if<std::string>(&raw)) {
        std::string text = utils::trim(*s);
        if (text.size() >= 2 && text.front() == '{' && text.back() == '}') {
            text = text.substr(1, text.size() - 2);
        }
        if (text.empty()) return std::monostate{};
        return text;
    }
    return raw;
}

} // namespace schemaport
