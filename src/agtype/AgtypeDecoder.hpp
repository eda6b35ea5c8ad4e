#pragma once

#include "agtype/Row.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace agegraph {
namespace agtype {

using json = nlohmann::json;

/// Separator between an agtype payload and its type tag
inline constexpr std::string_view TAG_SEPARATOR = "::";

/// Tags removed by the batch decoder
inline constexpr std::string_view VERTEX_TAG = "::vertex";
inline constexpr std::string_view EDGE_TAG = "::edge";

/**
 * True if the value is a string carrying an agtype tag ("::")
 */
bool isTagged(const json& value);

/**
 * Decode one agtype scalar.
 *
 * Text wrapped in {} is parsed as a JSON object, text wrapped in [] as a JSON
 * array. Anything else is returned unchanged as a JSON string.
 *
 * @throws errors::DecodeError if a {} or [] payload is not valid JSON
 */
json decodeScalar(const std::string& text);

/**
 * Remove every "::vertex" and "::edge" occurrence. Other tags are kept.
 */
std::string stripTags(std::string text);

/**
 * Decode one row: each tagged string value has its vertex/edge tags stripped
 * (same rule as decodeBatch) and is replaced by decodeScalar() of the
 * result. Other values are copied.
 *
 * @throws errors::DecodeError
 */
Row decodeRow(const Row& row);

/**
 * Decode many rows with a single JSON parse.
 *
 * All tagged strings (row order, then column order) are joined with ',',
 * stripped of their vertex/edge tags, wrapped in [] and parsed once.
 * Returns the elements of the parsed array, or an empty vector when no
 * tagged value exists. Built for one tagged column per row: with several,
 * the caller maps array positions back to rows.
 *
 * @throws errors::DecodeError if the combined text is not valid JSON; no
 *         partial result is returned
 */
std::vector<json> decodeBatch(const std::vector<Row>& rows);

} // namespace agtype
} // namespace agegraph
