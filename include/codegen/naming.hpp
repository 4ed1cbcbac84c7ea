#pragma once

#include <string>
#include <string_view>

namespace schemaport::naming {

/**
 * @brief "CategoryGUID" -> "category_guid", "ItemID" -> "item_id"
 *
 * An underscore goes between a lowercase letter or digit and a following
 * capital, and between two capitals when the second starts a lowercase
 * word ("HTMLParser" -> "html_parser"). Matches are non-overlapping and
 * scanned left to right.
 *
 * Characters that cannot appear in a Python identifier (spaces, hyphens,
 * non-ASCII bytes) are replaced first, one underscore per run, and a
 * leading digit gets an underscore in front ("Order Date" -> "order_date").
 */
[[nodiscard]] std::string snake_case(std::string_view name);

/**
 * @brief "data_point" -> "DataPoint"; names without underscores keep their case
 *
 * Invalid identifier characters split words like underscores do
 * ("Order Details" -> "OrderDetails").
 */
[[nodiscard]] std::string pascal_case(std::string_view name);

[[nodiscard]] bool is_python_keyword(std::string_view name);

/**
 * @brief snake_case, with a trailing underscore for reserved words
 */
[[nodiscard]] std::string attribute_name(std::string_view name);

/**
 * @brief English plural good enough for generated collection names
 */
[[nodiscard]] std::string pluralize(std::string_view name);

} // namespace schemaport::naming
