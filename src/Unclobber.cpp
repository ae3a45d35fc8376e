/**
 * @file Unclobber.cpp
 * @brief Implementation of the document pipeline
 */

#include "unclobber/Unclobber.hpp"
#include "unclobber/Frontmatter.hpp"
#include "unclobber/Util.hpp"

#include <spdlog/spdlog.h>

namespace unclobber {

UnclobberResult unclobber_document(std::string_view document, const UnclobberOptions& options) {
    UnclobberResult result;

    // Repaired text is written with "\n" line endings throughout
    const std::string text = normalize_newlines(document);
    Extraction extraction = extract_frontmatter(text);
    result.block_count = extraction.blocks.size();

    // Nothing to unclobber
    if (extraction.blocks.size() <= 1) {
        return result;
    }

    spdlog::debug("{} metadata blocks found in document", result.block_count);

    MergeResult merge = merge_frontmatters(extraction.blocks, options.merge);
    result.conflicts = std::move(merge.conflicts);
    for (const auto& conflict : result.conflicts) {
        spdlog::debug("Conflict on key '{}': kept {} over {}", conflict.key,
                      display(conflict.winning), display(conflict.losing));
    }

    if (merge.skipped) {
        result.skipped = true;
        return result;
    }

    result.text = assemble_document(merge.merged, extraction.body, options.style);
    result.status = Status::Replaced;
    return result;
}

} // namespace unclobber
