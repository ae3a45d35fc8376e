/**
 * @file Splitter.hpp
 * @brief Splits a document into delimiter-bounded candidate chunks
 *
 * A delimiter is a line whose whitespace-trimmed content is exactly `---`,
 * terminated by a newline or by the end of the text.
 *
 * Splitting rules:
 * - RULE B1: The document must open with a delimiter line. Leading
 *   whitespace-only lines are allowed before it. Otherwise there are no
 *   chunks and the whole text is body.
 * - RULE B2: Each chunk is the text strictly between two delimiter lines,
 *   without the line terminator (`\n` or `\r\n`) that precedes the
 *   closing delimiter.
 * - RULE B3: Adjacent delimiter lines enclose nothing; that empty segment
 *   is dropped (this is how `---\n---\n` between two blocks reads).
 * - RULE B4: Text after the last delimiter line is the tail. It is never a
 *   candidate because a metadata block is delimited on both sides.
 */

#ifndef UNCLOBBER_SPLITTER_HPP
#define UNCLOBBER_SPLITTER_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace unclobber {

/**
 * @brief One delimiter-bounded segment of a document
 */
struct Chunk {
    /// Raw segment text (no surrounding delimiter lines)
    std::string text;

    /// Byte offset of the first character of text in the document
    std::size_t offset = 0;
};

/**
 * @brief Result of splitting a document
 */
struct SplitResult {
    /// Whether the document opens with a delimiter line (RULE B1)
    bool has_opening = false;

    /// Candidate chunks in document order
    std::vector<Chunk> chunks;

    /// Byte offset where the tail starts (RULE B4); 0 without an opening
    std::size_t tail_offset = 0;
};

/**
 * @brief Check if a line is a delimiter line
 * @param line One line, with or without its line terminator
 */
bool is_delimiter_line(std::string_view line);

/**
 * @brief Split a document into candidate chunks
 *
 * Pure function: the document is only read.
 *
 * Examples:
 * ```cpp
 * split_candidates("---\na: 1\n---\nb: 2\n---\nBody\n");
 * // chunks: {"a: 1", 4}, {"b: 2", 13}; tail_offset: 22 ("Body\n")
 *
 * split_candidates("---\na: 1\n---\n---\nb: 2\n---\n");
 * // chunks: {"a: 1", 4}, {"b: 2", 17}; tail_offset: 26 ("")
 *
 * split_candidates("# Title\n---\n");
 * // has_opening: false, no chunks
 * ```
 */
SplitResult split_candidates(std::string_view document);

} // namespace unclobber

#endif // UNCLOBBER_SPLITTER_HPP
