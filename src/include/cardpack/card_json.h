#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

/**
 * \file card_json.h
 * \brief JSON document type used for card data.
 */

namespace cardpack {

/// Card documents keep their member order so re-serialized cards diff cleanly.
using CardJson = nlohmann::ordered_json;

/// Parses \p text without throwing. Returns false for invalid JSON.
bool
parse_card_json(std::string_view text, CardJson* out);

/// Compact serialization (no insignificant whitespace).
std::string
dump_card_json(const CardJson& doc);

/**
 * \brief Removes insignificant whitespace from a JSON text.
 *
 * Text that is not valid JSON is returned unchanged.
 */
std::string
minify_json(std::string_view text);

}  // namespace cardpack
