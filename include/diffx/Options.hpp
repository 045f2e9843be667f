/**
 * @file Options.hpp
 * @brief Diff options: raw input, validation and the validated form
 *
 * Options arrive as RawDiffOptions (every field optional, nothing checked)
 * and go through validate_options exactly once per run. The result,
 * DiffOptions, is read-only: the engine never mutates it and nothing is
 * cached between runs.
 *
 * Defaults:
 * - epsilon: 0 (exact numeric match)
 * - array_id_key: none (positional array comparison)
 * - ignore_keys_regex: none (no exclusions)
 * - path_filter: none (no filtering)
 * - output_format: native
 * - ignore_whitespace, ignore_case, brief_mode, quiet_mode: false
 * - max_depth: 512
 */

#ifndef DIFFX_OPTIONS_HPP
#define DIFFX_OPTIONS_HPP

#include "diffx/Value.hpp"

#include <cstddef>
#include <optional>
#include <regex>
#include <string>

namespace diffx {

/**
 * @brief Rendering targets for diff entries
 */
enum class OutputFormat {
    Native,
    Json,
    Yaml
};

/**
 * @brief Canonical name of an output format ("native", "json", "yaml")
 */
std::string output_format_name(OutputFormat format);

/**
 * @brief Resolve an output format name
 *
 * Case-insensitive. Accepts "native" (alias "diffx"), "json",
 * "yaml" (alias "yml").
 *
 * @return Format, or nullopt if the name is unknown
 */
std::optional<OutputFormat> output_format_from_name(const std::string& name);

/// Traversal depth limit applied when none is configured
constexpr std::size_t kDefaultMaxDepth = 512;

/**
 * @brief Unvalidated options, as supplied by a caller
 */
struct RawDiffOptions {
    std::optional<double> epsilon;
    std::optional<std::string> array_id_key;
    std::optional<std::string> ignore_keys_regex;
    std::optional<std::string> path_filter;
    std::optional<std::string> output_format;
    std::optional<bool> ignore_whitespace;
    std::optional<bool> ignore_case;
    std::optional<bool> brief_mode;
    std::optional<bool> quiet_mode;
    std::optional<std::size_t> max_depth;
};

class DiffOptions;

/**
 * @brief Validate raw options
 *
 * Compiles the key-exclusion pattern once and resolves the output format
 * name. Runs before any input tree is touched.
 *
 * @throws InvalidPatternError if ignore_keys_regex does not compile
 * @throws UnknownFormatError if output_format is not a known name
 * @throws InvalidOptionError for a negative or non-finite epsilon, or a
 *         max_depth of 0
 */
DiffOptions validate_options(const RawDiffOptions& raw);

/**
 * @brief Validated, immutable diff configuration
 *
 * A default-constructed DiffOptions carries the documented defaults.
 */
class DiffOptions {
public:
    DiffOptions() = default;

    double epsilon() const noexcept { return epsilon_; }
    const std::optional<std::string>& array_id_key() const noexcept { return array_id_key_; }

    /// Compiled exclusion pattern, nullopt when no keys are excluded
    const std::optional<std::regex>& ignore_keys() const noexcept { return ignore_keys_; }

    /// Pattern text as supplied, empty when unset
    const std::string& ignore_keys_pattern() const noexcept { return ignore_keys_pattern_; }

    const std::optional<std::string>& path_filter() const noexcept { return path_filter_; }
    OutputFormat output_format() const noexcept { return output_format_; }
    bool ignore_whitespace() const noexcept { return ignore_whitespace_; }
    bool ignore_case() const noexcept { return ignore_case_; }
    bool brief_mode() const noexcept { return brief_mode_; }
    bool quiet_mode() const noexcept { return quiet_mode_; }
    std::size_t max_depth() const noexcept { return max_depth_; }

    /**
     * @brief Check whether an object key is excluded from comparison
     *
     * Uses std::regex_search. libstdc++ matches recursively, so a pattern
     * with a repeated atom can exhaust the stack on keys tens of thousands
     * of bytes long; keep patterns anchored and keys of ordinary length.
     */
    bool is_ignored_key(const std::string& key) const;

    /**
     * @brief True when only a differs/does-not-differ answer is wanted
     */
    bool status_only() const noexcept { return brief_mode_ || quiet_mode_; }

private:
    friend DiffOptions validate_options(const RawDiffOptions& raw);

    double epsilon_ = 0.0;
    std::optional<std::string> array_id_key_;
    std::optional<std::regex> ignore_keys_;
    std::string ignore_keys_pattern_;
    std::optional<std::string> path_filter_;
    OutputFormat output_format_ = OutputFormat::Native;
    bool ignore_whitespace_ = false;
    bool ignore_case_ = false;
    bool brief_mode_ = false;
    bool quiet_mode_ = false;
    std::size_t max_depth_ = kDefaultMaxDepth;
};

/**
 * @brief Read raw options from an options document
 *
 * Accepts the snake_case field names (epsilon, array_id_key,
 * ignore_keys_regex, path_filter, output_format, ignore_whitespace,
 * ignore_case, brief_mode, quiet_mode, max_depth) and their camelCase
 * forms (arrayIdKey, ignoreKeysRegex, ...). Unknown keys are ignored.
 *
 * @param doc Object holding option fields (null yields empty options)
 * @throws InvalidOptionError if doc is not an object or a field has the
 *         wrong type
 */
RawDiffOptions raw_options_from_value(const Value& doc);

/**
 * @brief Overlay two raw option sets; fields set in top win
 */
RawDiffOptions merge_raw_options(const RawDiffOptions& base, const RawDiffOptions& top);

} // namespace diffx

#endif // DIFFX_OPTIONS_HPP
