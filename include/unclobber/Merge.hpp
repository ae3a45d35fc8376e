/**
 * @file Merge.hpp
 * @brief Key-by-key merge of several frontmatter blocks
 *
 * Blocks are applied in document order and keys in parse order. For each
 * (key, value) the first matching rule wins:
 * - RULE M1: Key not merged yet → inserted as-is
 * - RULE M2: Both values date-like → DatePolicy picks the instant
 * - RULE M3: Either value is a list and neither is a mapping → sorted,
 *   deduplicated union
 * - RULE M4: Values equal → existing kept
 * - RULE M5: Otherwise a conflict, settled by the ConflictMode
 *
 * Keys keep the position where they were first seen.
 */

#ifndef UNCLOBBER_MERGE_HPP
#define UNCLOBBER_MERGE_HPP

#include "unclobber/DateStamp.hpp"
#include "unclobber/Value.hpp"

#include <functional>
#include <string>
#include <vector>

namespace unclobber {

/**
 * @brief How RULE M5 conflicts are settled
 */
enum class ConflictMode {
    Automatic,   ///< Later value wins, conflict is recorded
    Interactive  ///< A ConflictResolver decides
};

/**
 * @brief Answer of a ConflictResolver
 */
enum class ConflictChoice {
    KeepExisting,  ///< Keep the value merged so far
    TakeIncoming,  ///< Replace it with the later value
    Skip           ///< Abandon the whole document
};

/**
 * @brief Decision function for interactive mode
 *
 * Called with the key, the value merged so far and the later value. May
 * block (e.g. on a terminal prompt); only the calling document waits.
 */
using ConflictResolver = std::function<ConflictChoice(const std::string& key,
                                                      const Value& existing,
                                                      const Value& incoming)>;

/**
 * @brief One settled conflict, for reporting only
 */
struct ConflictRecord {
    std::string key;
    Value losing;
    Value winning;
};

/**
 * @brief Merge policy
 */
struct MergeOptions {
    ConflictMode mode = ConflictMode::Automatic;
    DatePolicy date_policy = DatePolicy::Latest;

    /// Required when mode is Interactive, ignored otherwise
    ConflictResolver resolver;
};

/**
 * @brief Outcome of merge_frontmatters()
 */
struct MergeResult {
    /// Merged mapping, keys in first-seen order
    Value merged = Value::object();

    /// Conflicts settled by RULE M5, in the order they occurred
    std::vector<ConflictRecord> conflicts;

    /// True if the resolver answered ConflictChoice::Skip; merged is then partial
    bool skipped = false;
};

/**
 * @brief Merge frontmatter blocks into one mapping
 *
 * @param blocks Mappings in document order
 * @param options Merge policy
 * @return Merged mapping plus conflict records
 * @throws MergeError if a block is not a mapping, or if mode is Interactive
 *         without a resolver
 *
 * Example:
 * ```cpp
 * std::vector<Value> blocks = {
 *     {{"a", 1}, {"tags", Value::array({"x", "y"})}},
 *     {{"a", 2}, {"tags", Value::array({"y", "z"})}, {"b", 3}},
 * };
 * auto result = merge_frontmatters(blocks);
 * // result.merged: {"a": 2, "tags": ["x", "y", "z"], "b": 3}
 * // result.conflicts: [{"a", 1, 2}]
 * ```
 */
MergeResult merge_frontmatters(const std::vector<Value>& blocks,
                               const MergeOptions& options = MergeOptions());

/**
 * @brief Sorted, deduplicated union of two values
 *
 * Arrays contribute their elements, anything else contributes itself.
 */
Value union_sorted(const Value& a, const Value& b);

/**
 * @brief Total order used to sort list values
 *
 * Orders by type rank (null, boolean, number, object, array, string), then
 * by value. Integers and floats compare numerically; NaN sorts after every
 * other number.
 */
bool value_less(const Value& a, const Value& b);

/**
 * @brief Parse a mode name ("automatic" or "interactive", case-insensitive)
 * @throws ConfigError for any other name
 */
ConflictMode parse_conflict_mode(const std::string& name);

/**
 * @brief Lowercase name of a mode
 */
std::string to_string(ConflictMode mode);

} // namespace unclobber

#endif // UNCLOBBER_MERGE_HPP
