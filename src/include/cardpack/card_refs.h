#pragma once

#include "cardpack/card_json.h"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file card_refs.h
 * \brief Finds and rewrites reference tokens inside card string values.
 *
 * A token is a maximal run of characters that are neither whitespace nor
 * one of `"'()<>[]{}|\` or a backquote. Rewrites replace whole tokens only,
 * so a key never matches part of a longer URL or path. Object keys are
 * never inspected; only string values (at any depth) are.
 */

namespace cardpack {

/// Token to replacement.
using RefMapping = std::map<std::string, std::string, std::less<>>;

/// Per-token replacement counts.
using RefHits = std::map<std::string, size_t, std::less<>>;

/// True for characters that end a reference token.
bool
is_ref_delimiter(char c) noexcept;

/**
 * \brief Replaces every whole-token occurrence of a mapping key.
 *
 * A token that is not a key is retried with trailing sentence punctuation
 * (`.,;:!?`) removed. Returns the number of replacements; \p hits (when
 * given) receives counts per key.
 */
size_t
rewrite_refs(CardJson* doc, const RefMapping& mapping, RefHits* hits);

/// Counts whole-token occurrences of \p token in string values.
size_t
count_ref(const CardJson& doc, std::string_view token);

/// Counts raw substring occurrences of \p needle in string values.
size_t
count_substring(const CardJson& doc, std::string_view needle);

/// Distinct tokens starting with \p scheme (e.g. `embeded://`), in order.
std::vector<std::string>
find_scheme_refs(const CardJson& doc, std::string_view scheme);

/**
 * \brief Distinct remote image URLs, in document order.
 *
 * Recognizes markdown images `![alt](url)` and HTML `<img ... src="url">`
 * whose URL starts with `http://` or `https://`.
 */
std::vector<std::string>
find_external_image_refs(const CardJson& doc);

}  // namespace cardpack
