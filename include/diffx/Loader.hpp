/**
 * @file Loader.hpp
 * @brief Reading input documents from files and stdin
 *
 * Format detection by extension (case-insensitive):
 * - .json -> JSON
 * - .yaml, .yml -> YAML
 * - .toml -> TOML
 * - .ini, .cfg, .conf -> INI
 * - .xml -> XML
 * - .csv -> CSV
 */

#ifndef DIFFX_LOADER_HPP
#define DIFFX_LOADER_HPP

#include "diffx/Parsers.hpp"
#include "diffx/Value.hpp"

#include <istream>
#include <optional>
#include <string>

namespace diffx {

/// Path that stands for standard input
inline constexpr const char* kStdinPath = "-";

/**
 * @brief Read an entire file into a string
 *
 * @throws FileNotFoundError if the file does not exist or cannot be opened
 */
std::string read_file(const std::string& path);

/**
 * @brief Read an entire stream into a string
 */
std::string read_stream(std::istream& in);

/**
 * @brief Get file extension (lowercase)
 *
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Detect input format from a path's extension
 *
 * @return Format, or nullopt for an unknown or missing extension
 */
std::optional<InputFormat> detect_format(const std::string& path);

/**
 * @brief Resolve an input format name given by a user
 *
 * @throws UnsupportedInputError if the name is not a known format
 */
InputFormat parse_input_format_name(const std::string& name);

/**
 * @brief Load and parse one input document
 *
 * @param path File path, or "-" for standard input
 * @param format Explicit format; detected from the extension when nullopt
 * @param in Stream used for "-"
 * @throws FileNotFoundError if the file does not exist
 * @throws UnsupportedInputError if no format is given and none can be
 *         detected (always the case for stdin)
 * @throws ParseError if the content is malformed
 */
Value load_document(const std::string& path,
                    const std::optional<InputFormat>& format,
                    std::istream& in);

/**
 * @brief Load and parse one input document, reading "-" from std::cin
 */
Value load_document(const std::string& path,
                    const std::optional<InputFormat>& format = std::nullopt);

} // namespace diffx

#endif // DIFFX_LOADER_HPP
