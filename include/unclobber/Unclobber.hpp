/**
 * @file Unclobber.hpp
 * @brief Whole-document pipeline: split, classify, merge, re-emit
 *
 * The pipeline is a pure function of the document text and the options.
 * It never touches storage and keeps no state between calls, so callers
 * may run it on several documents at once.
 */

#ifndef UNCLOBBER_UNCLOBBER_HPP
#define UNCLOBBER_UNCLOBBER_HPP

#include "unclobber/Emitter.hpp"
#include "unclobber/Merge.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace unclobber {

/**
 * @brief Pipeline options
 */
struct UnclobberOptions {
    MergeOptions merge;
    EmitStyle style;
};

/**
 * @brief What the pipeline decided for a document
 */
enum class Status {
    Unchanged,  ///< Fewer than two blocks, or the resolver skipped the document
    Replaced    ///< text holds the replacement document
};

/**
 * @brief Pipeline output and advisory data
 */
struct UnclobberResult {
    Status status = Status::Unchanged;

    /// Replacement document; empty unless status is Replaced
    std::string text;

    /// Number of metadata blocks found at the top of the document
    std::size_t block_count = 0;

    /// Conflicts settled while merging
    std::vector<ConflictRecord> conflicts;

    /// The conflict resolver chose to skip this document
    bool skipped = false;

    bool replaced() const noexcept { return status == Status::Replaced; }
};

/**
 * @brief Repair a document carrying several frontmatter blocks
 *
 * @param document Full document text, UTF-8
 * @param options Merge policy and rendering style
 * @return Unchanged, or Replaced with the repaired text
 * @throws SerializationError if the merged mapping cannot be rendered
 * @throws MergeError if the merge options are unusable
 *
 * Example:
 * ```cpp
 * auto result = unclobber_document("---\na: 1\n---\na: 2\nb: 3\n---\nBody text\n");
 * // result.status == Status::Replaced
 * // result.text == "---\na: 2\nb: 3\n---\n\nBody text\n"
 * // result.conflicts: [{"a", 1, 2}]
 * ```
 */
UnclobberResult unclobber_document(std::string_view document,
                                   const UnclobberOptions& options = UnclobberOptions());

} // namespace unclobber

#endif // UNCLOBBER_UNCLOBBER_HPP
