/**
 * @file Diff.hpp
 * @brief Structural diff engine
 *
 * Compares two canonical values and reports an ordered list of typed,
 * path-addressed entries:
 * - Added: only in the new tree
 * - Removed: only in the old tree
 * - Modified: in both, same kind, different under the active rules
 * - TypeChanged: in both, different kinds (no recursion below)
 *
 * Entry order follows traversal: old object keys in insertion order, then
 * new-only keys; array indices ascending, or identity-matched elements in
 * old order followed by new-only elements.
 *
 * Every function here is reentrant; independent calls may run on
 * separate threads.
 */

#ifndef DIFFX_DIFF_HPP
#define DIFFX_DIFF_HPP

#include "diffx/Options.hpp"
#include "diffx/Value.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace diffx {

/**
 * @brief Kind of a diff entry
 */
enum class DiffType {
    Added,
    Removed,
    Modified,
    TypeChanged
};

/**
 * @brief Name of a diff type ("Added", "Removed", "Modified", "TypeChanged")
 */
std::string diff_type_name(DiffType type);

/**
 * @brief Resolve a diff type name (exact match)
 */
std::optional<DiffType> diff_type_from_name(const std::string& name);

/**
 * @brief One reported difference
 *
 * Field population per type:
 * - Added: new_value
 * - Removed: old_value (also available as value())
 * - Modified / TypeChanged: old_value and new_value
 * Unused value fields are null.
 */
struct DiffEntry {
    DiffType type = DiffType::Modified;
    std::string path;
    Value old_value;
    Value new_value;

    static DiffEntry added(std::string path, Value value);
    static DiffEntry removed(std::string path, Value value);
    static DiffEntry modified(std::string path, Value old_value, Value new_value);
    static DiffEntry type_changed(std::string path, Value old_value, Value new_value);

    /**
     * @brief The single value carried by Added/Removed entries
     */
    const Value& value() const {
        return type == DiffType::Added ? new_value : old_value;
    }

    bool operator==(const DiffEntry& other) const {
        return type == other.type && path == other.path &&
               old_value == other.old_value && new_value == other.new_value;
    }
    bool operator!=(const DiffEntry& other) const { return !(*this == other); }
};

/**
 * @brief Outcome of a comparison
 *
 * In brief and quiet modes, entries stays empty and only differs is
 * meaningful.
 */
struct DiffReport {
    bool differs = false;
    std::vector<DiffEntry> entries;
};

/**
 * @brief Compare two trees
 *
 * Full mode collects every entry, then applies the path filter. Brief and
 * quiet modes stop at the first difference that passes the filter.
 *
 * @throws DepthExceededError if containers nest deeper than options.max_depth()
 */
DiffReport compare(const Value& old_value, const Value& new_value,
                   const DiffOptions& options = DiffOptions{});

/**
 * @brief Compare two trees and return the entry list
 *
 * Equivalent to compare(...).entries: empty in brief and quiet modes.
 *
 * @throws DepthExceededError if containers nest deeper than options.max_depth()
 *
 * Example:
 * ```cpp
 * Value a = {{"a", 1}, {"b", 2}};
 * Value b = {{"a", 1}, {"b", 3}};
 * auto entries = diff(a, b);
 * // [Modified("b", 2, 3)]
 * ```
 */
std::vector<DiffEntry> diff(const Value& old_value, const Value& new_value,
                            const DiffOptions& options = DiffOptions{});

/**
 * @brief Validate raw options, then diff
 *
 * @throws ConfigError subclasses before either tree is read
 * @throws DepthExceededError as above
 */
std::vector<DiffEntry> diff(const Value& old_value, const Value& new_value,
                            const RawDiffOptions& raw);

/**
 * @brief Status-only check: do the trees differ under these options?
 *
 * Short-circuits at the first qualifying difference whatever the
 * brief/quiet flags say.
 */
bool has_differences(const Value& old_value, const Value& new_value,
                     const DiffOptions& options = DiffOptions{});

/**
 * @brief Print an entry for test failure messages
 */
std::ostream& operator<<(std::ostream& os, const DiffEntry& entry);

} // namespace diffx

#endif // DIFFX_DIFF_HPP
