/**
 * @file Output.hpp
 * @brief Rendering of diff entries and the entry document model
 *
 * Renderers:
 * - native: one line per entry, prefixed by a change marker
 *   (`+` added, `-` removed, `~` modified, `!` type changed)
 * - json: array of entry documents, two-space indented
 * - yaml: the same documents as a YAML sequence of maps
 *
 * Entry documents have the shape
 * `{type, path, value | newValue | oldValue + newValue}`:
 * Removed carries `value`, Added carries `newValue`, Modified and
 * TypeChanged carry both `oldValue` and `newValue`.
 */

#ifndef DIFFX_OUTPUT_HPP
#define DIFFX_OUTPUT_HPP

#include "diffx/Diff.hpp"
#include "diffx/Options.hpp"
#include "diffx/Value.hpp"

#include <string>
#include <vector>

namespace diffx {

// ============================================================================
// Rendering
// ============================================================================

/**
 * @brief Render entries in the given format
 *
 * Invalid UTF-8 inside values is replaced with U+FFFD.
 *
 * @return Rendered text; "" for native and "[]" for json/yaml when entries
 *         is empty
 */
std::string format_output(const std::vector<DiffEntry>& entries, OutputFormat format);

/**
 * @brief Render entries in a format given by name
 *
 * @throws UnknownOutputFormatError if name is not native/diffx, json or
 *         yaml/yml
 */
std::string format_output(const std::vector<DiffEntry>& entries, const std::string& name);

std::string format_native(const std::vector<DiffEntry>& entries);
std::string format_json(const std::vector<DiffEntry>& entries);
std::string format_yaml(const std::vector<DiffEntry>& entries);

/// Path text shown for the root location in native output
inline constexpr const char* kRootPathLabel = "(root)";

// ============================================================================
// Entry documents
// ============================================================================

/**
 * @brief Convert an entry to its document form
 */
Value entry_to_value(const DiffEntry& entry);

/**
 * @brief Convert entries to an array of entry documents
 */
Value entries_to_value(const std::vector<DiffEntry>& entries);

/**
 * @brief Read an entry back from its document form
 *
 * The type may be given as `type` or `diffType`.
 *
 * @throws InvalidEntryError if doc is not an object, the type is missing or
 *         unknown, the path is missing, or a value field the type requires
 *         is absent
 */
DiffEntry entry_from_value(const Value& doc);

/**
 * @brief Read an array of entry documents
 *
 * @throws InvalidEntryError if doc is not an array or any element is invalid
 */
std::vector<DiffEntry> entries_from_value(const Value& doc);

} // namespace diffx

#endif // DIFFX_OUTPUT_HPP
