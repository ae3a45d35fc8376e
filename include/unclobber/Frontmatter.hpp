/**
 * @file Frontmatter.hpp
 * @brief Classification of candidate chunks into metadata blocks and body
 *
 * A chunk is a metadata block iff both stages accept it:
 * - RULE V1: parse_block() reads it as exactly one YAML document whose root
 *   is a mapping with scalar keys.
 * - RULE V2: contains_implicit_null() finds no key whose null value came
 *   from an empty value rather than a written `null` or `~`.
 *
 * The first rejected chunk starts the body; everything from its offset to
 * the end of the document is body text, delimiters included.
 */

#ifndef UNCLOBBER_FRONTMATTER_HPP
#define UNCLOBBER_FRONTMATTER_HPP

#include "unclobber/Value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace unclobber {

/**
 * @brief Metadata blocks and body of one document
 */
struct Extraction {
    /// Accepted blocks, in document order
    std::vector<Value> blocks;

    /// Body text (see trim_body())
    std::string body;
};

/**
 * @brief Stage one: parse a chunk as a YAML mapping
 *
 * Plain scalars are typed with parse_scalar(); quoted scalars stay strings.
 * Keys are converted to their scalar text.
 *
 * @param chunk Raw chunk text
 * @return The mapping, or std::nullopt on a syntax error, on zero or
 *         several YAML documents, on a non-mapping root, or on a
 *         non-scalar key
 */
std::optional<Value> parse_block(const std::string& chunk);

/**
 * @brief Stage two: detect null values that were not written explicitly
 *
 * For each key of mapping whose value is null, looks for a line of chunk
 * matching `^\s*KEY\s*:\s*(null|~)\s*$` (case-insensitive).
 *
 * @param chunk Raw chunk text the mapping was parsed from
 * @param mapping Parsed mapping
 * @return true if some null-valued key has no such line
 *
 * Example:
 * ```cpp
 * contains_implicit_null("question:\n", {{"question", nullptr}});   // true
 * contains_implicit_null("question: ~\n", {{"question", nullptr}}); // false
 * ```
 */
bool contains_implicit_null(const std::string& chunk, const Value& mapping);

/**
 * @brief Both stages together
 * @return The mapping if chunk is a metadata block, std::nullopt otherwise
 */
std::optional<Value> classify_chunk(const std::string& chunk);

/**
 * @brief Remove one leading blank line and one trailing line terminator
 *
 * Everything else is kept byte for byte.
 */
std::string trim_body(std::string_view body);

/**
 * @brief Extract all consecutive metadata blocks from the top of a document
 *
 * Documents without an opening delimiter yield no blocks and the untouched
 * text as body.
 */
Extraction extract_frontmatter(std::string_view document);

} // namespace unclobber

#endif // UNCLOBBER_FRONTMATTER_HPP
