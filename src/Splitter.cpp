/**
 * @file Splitter.cpp
 * @brief Implementation of the delimiter splitter
 */

#include "unclobber/Splitter.hpp"
#include "unclobber/Util.hpp"

namespace unclobber {

namespace {

/**
 * @brief Bounds of one line inside the document
 */
struct LineSpan {
    std::size_t begin;  ///< First character of the line
    std::size_t end;    ///< One past the last character, excluding '\n'
    std::size_t next;   ///< Start of the following line, or size() at EOF
};

LineSpan line_at(std::string_view text, std::size_t pos) {
    std::size_t nl = text.find('\n', pos);
    if (nl == std::string_view::npos) {
        return {pos, text.size(), text.size()};
    }
    return {pos, nl, nl + 1};
}

} // anonymous namespace

bool is_delimiter_line(std::string_view line) {
    return trim(line) == "---";
}

SplitResult split_candidates(std::string_view document) {
    SplitResult result;

    // RULE B1: skip blank lines, then require the opening delimiter
    std::size_t pos = 0;
    while (pos < document.size()) {
        LineSpan line = line_at(document, pos);
        std::string_view content = document.substr(line.begin, line.end - line.begin);
        if (!trim(content).empty()) {
            if (!is_delimiter_line(content)) {
                return result;
            }
            result.has_opening = true;
            pos = line.next;
            break;
        }
        pos = line.next;
    }
    if (!result.has_opening) {
        return result;
    }

    std::size_t chunk_start = pos;
    while (pos < document.size()) {
        LineSpan line = line_at(document, pos);
        if (is_delimiter_line(document.substr(line.begin, line.end - line.begin))) {
            // RULE B3: nothing between two adjacent delimiters
            if (line.begin > chunk_start) {
                // RULE B2: drop the "\n" or "\r\n" that ends the last chunk line
                std::size_t chunk_end = line.begin - 1;
                if (chunk_end > chunk_start && document[chunk_end - 1] == '\r') {
                    --chunk_end;
                }
                Chunk chunk;
                chunk.offset = chunk_start;
                chunk.text = std::string(document.substr(chunk_start, chunk_end - chunk_start));
                result.chunks.push_back(std::move(chunk));
            }
            chunk_start = line.next;
        }
        pos = line.next;
    }

    // RULE B4
    result.tail_offset = chunk_start;
    return result;
}

} // namespace unclobber
