/**
 * @file Parsers.hpp
 * @brief Text-to-Value parsers for every supported input format
 *
 * Each parser is a pure function of its input text: no I/O, no shared
 * state. Failures throw ParseError with the offending construct and, when
 * the underlying parser can tell, a 1-based line and column.
 *
 * - JSON (nlohmann::json)
 * - YAML (yaml-cpp, YAML 1.2 core schema for plain scalars)
 * - TOML (toml++)
 * - INI, XML, CSV (built-in parsers)
 */

#ifndef DIFFX_PARSERS_HPP
#define DIFFX_PARSERS_HPP

#include "diffx/Value.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace diffx {

/**
 * @brief Input formats understood by parse()
 */
enum class InputFormat {
    Json,
    Yaml,
    Toml,
    Ini,
    Xml,
    Csv
};

/**
 * @brief Lower-case name of a format ("json", "yaml", ...)
 */
std::string input_format_name(InputFormat format);

/**
 * @brief Resolve a format name (case-insensitive; "yml" accepted)
 * @return Format, or nullopt if the name is unknown
 */
std::optional<InputFormat> input_format_from_name(const std::string& name);

/**
 * @brief Options for the INI parser
 */
struct IniOptions {
    /// Run values through parse_scalar instead of keeping strings
    bool infer_types = false;
};

/**
 * @brief Options for the CSV parser
 */
struct CsvOptions {
    /// Run cells through parse_scalar instead of keeping strings
    bool infer_types = false;
};

// ============================================================================
// Natively typed formats
// ============================================================================

/**
 * @brief Parse JSON text
 * @throws ParseError on syntax errors
 */
Value parse_json(std::string_view text);

/**
 * @brief Parse YAML text (first document only)
 *
 * Quoted scalars are strings. Plain scalars resolve as null, bool,
 * integer, float or string following the YAML 1.2 core schema. An empty
 * document is null.
 *
 * @throws ParseError on syntax errors
 */
Value parse_yaml(std::string_view text);

/**
 * @brief Parse TOML text
 *
 * Integers and floats become Number. Dates and times become their TOML
 * text form.
 *
 * @throws ParseError on syntax errors
 */
Value parse_toml(std::string_view text);

// ============================================================================
// Formats mapped by convention
// ============================================================================

/**
 * @brief Parse INI text
 *
 * Convention:
 * - `[section]` → top-level key holding an object of its entries
 * - entries before the first section → top-level keys of the root object
 * - `key = value` or `key: value`; `;` and `#` start comment lines
 * - values are trimmed; one layer of matching quotes is removed
 * - repeated sections merge, repeated keys overwrite
 *
 * @throws ParseError for lines without a separator, empty keys or
 *         malformed section headers
 */
Value parse_ini(std::string_view text, const IniOptions& options = IniOptions{});

/**
 * @brief Parse XML text
 *
 * Convention:
 * - the document becomes {root_tag: element}
 * - attributes → "@name" keys, text content → "#text"
 * - one key per distinct child tag; a repeated tag holds an Array
 * - an element without attributes or children collapses to its text
 *   (null when empty)
 *
 * @throws ParseError on malformed markup
 */
Value parse_xml(std::string_view text);

/**
 * @brief Parse CSV text (RFC 4180, header row required)
 *
 * The result is an Array with one Object per data row, keyed by header
 * names. Empty input yields an empty Array.
 *
 * @throws ParseError for ragged rows or unterminated quotes
 */
Value parse_csv(std::string_view text, const CsvOptions& options = CsvOptions{});

/**
 * @brief Parse text in the given format with default options
 */
Value parse(std::string_view text, InputFormat format);

} // namespace diffx

#endif // DIFFX_PARSERS_HPP
