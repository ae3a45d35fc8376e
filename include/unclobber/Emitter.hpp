/**
 * @file Emitter.hpp
 * @brief Canonical YAML rendering of a merged frontmatter mapping
 *
 * Output layout with the default style:
 * ```
 * ---
 * title: Note
 * tags:
 *   - alpha
 *   - beta
 * ---
 *
 * Body text
 * ```
 */

#ifndef UNCLOBBER_EMITTER_HPP
#define UNCLOBBER_EMITTER_HPP

#include "unclobber/Value.hpp"

#include <cstddef>
#include <string>

namespace unclobber {

/**
 * @brief Rendering strategy handed to the emitter
 */
struct EmitStyle {
    /// Mapping indent; block sequences under a key get a dash at this
    /// indent and their items at twice this indent
    std::size_t indent = 2;

    /// Emit top-level list values in value_less() order
    bool sort_sequences = true;
};

/**
 * @brief Render a mapping as YAML, without delimiter lines
 *
 * Keys keep the mapping's order. Strings that would read back as null,
 * boolean or number are double-quoted; null is written `~`; floats use
 * their shortest round-trip text.
 *
 * @param mapping Object to render
 * @param style Rendering strategy
 * @return YAML text ending with a newline
 * @throws SerializationError if mapping is not an object or holds a value
 *         with no YAML form
 */
std::string emit_block(const Value& mapping, const EmitStyle& style = EmitStyle());

/**
 * @brief Build the replacement document
 *
 * `---\n` + emit_block(mapping) + `---\n\n` + body + `\n`
 */
std::string assemble_document(const Value& mapping, const std::string& body,
                              const EmitStyle& style = EmitStyle());

} // namespace unclobber

#endif // UNCLOBBER_EMITTER_HPP
