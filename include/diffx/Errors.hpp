/**
 * @file Errors.hpp
 * @brief Exception types for diffx
 *
 * Error taxonomy:
 * - Error: Base class
 * - ParseError: Syntax failure in one of the input formats
 * - ConfigError: Diff options rejected before any diffing
 *   (InvalidPatternError, UnknownFormatError, InvalidOptionError)
 * - EngineError: Traversal failure (DepthExceededError)
 * - FormatError: Output rendering failure (UnknownOutputFormatError)
 * - InvalidEntryError: Diff entry document with the wrong shape
 * - FileNotFoundError / UnsupportedInputError: Loader failures
 */

#ifndef DIFFX_ERRORS_HPP
#define DIFFX_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <sstream>

namespace diffx {

/**
 * @brief Base class for all diffx exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Parsing
// ============================================================================

/**
 * @brief Input text could not be parsed
 *
 * Carries the format name, the parser's message and, when the parser
 * can tell, a 1-based line and column (0 when unknown).
 */
class ParseError : public Error {
public:
    /**
     * @brief Construct with format, details and optional position
     * @param format Input format name (e.g., "json", "ini")
     * @param details Message describing the offending construct
     * @param line 1-based line, 0 if unknown
     * @param column 1-based column, 0 if unknown
     */
    ParseError(std::string format, std::string details,
               std::size_t line = 0, std::size_t column = 0)
        : Error(format_message(format, details, line, column))
        , format_(std::move(format))
        , details_(std::move(details))
        , line_(line)
        , column_(column)
    {}

    /**
     * @brief Get the input format that failed
     */
    const std::string& format() const noexcept {
        return format_;
    }

    /**
     * @brief Get the detailed message from the parser
     */
    const std::string& details() const noexcept {
        return details_;
    }

    std::size_t line() const noexcept { return line_; }
    std::size_t column() const noexcept { return column_; }

private:
    std::string format_;
    std::string details_;
    std::size_t line_;
    std::size_t column_;

    static std::string format_message(const std::string& format,
                                      const std::string& details,
                                      std::size_t line, std::size_t column) {
        std::ostringstream oss;
        oss << format << " parse error";
        if (line > 0) {
            oss << " at line " << line;
            if (column > 0) oss << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Base class for rejected diff options
 */
class ConfigError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Key-exclusion pattern failed to compile
 */
class InvalidPatternError : public ConfigError {
public:
    /**
     * @brief Construct with the pattern and the regex engine's message
     * @param pattern Pattern text as supplied
     * @param details Compilation error description
     */
    InvalidPatternError(std::string pattern, std::string details)
        : ConfigError("Invalid ignore_keys_regex '" + pattern + "': " + details)
        , pattern_(std::move(pattern))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the pattern that failed to compile
     */
    const std::string& pattern() const noexcept {
        return pattern_;
    }

    /**
     * @brief Get the compilation error description
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string pattern_;
    std::string details_;
};

/**
 * @brief Output format name in the options is not recognized
 */
class UnknownFormatError : public ConfigError {
public:
    explicit UnknownFormatError(std::string name)
        : ConfigError("Unknown output_format '" + name +
                      "' (expected native, json or yaml)")
        , name_(std::move(name))
    {}

    /**
     * @brief Get the format name that was rejected
     */
    const std::string& name() const noexcept {
        return name_;
    }

private:
    std::string name_;
};

/**
 * @brief Option value out of range or of the wrong type
 */
class InvalidOptionError : public ConfigError {
public:
    /**
     * @brief Construct with option name and reason
     * @param option Option field name (e.g., "epsilon")
     * @param reason Why the value was rejected
     */
    InvalidOptionError(std::string option, const std::string& reason)
        : ConfigError("Invalid option '" + option + "': " + reason)
        , option_(std::move(option))
    {}

    const std::string& option() const noexcept {
        return option_;
    }

private:
    std::string option_;
};

// ============================================================================
// Engine
// ============================================================================

/**
 * @brief Base class for failures during tree traversal
 */
class EngineError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Traversal went deeper than the configured maximum depth
 */
class DepthExceededError : public EngineError {
public:
    /**
     * @brief Construct with the offending path and the limit
     * @param path Display path of the node that crossed the limit
     * @param max_depth Configured maximum depth
     */
    DepthExceededError(std::string path, std::size_t max_depth)
        : EngineError("Maximum depth " + std::to_string(max_depth) +
                      " exceeded at path '" + path + "'")
        , path_(std::move(path))
        , max_depth_(max_depth)
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    std::size_t max_depth() const noexcept {
        return max_depth_;
    }

private:
    std::string path_;
    std::size_t max_depth_;
};

// ============================================================================
// Formatting
// ============================================================================

/**
 * @brief Base class for output formatter failures
 */
class FormatError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Rendering target name is not recognized
 */
class UnknownOutputFormatError : public FormatError {
public:
    explicit UnknownOutputFormatError(std::string name)
        : FormatError("Unknown output format '" + name +
                      "' (expected native, json or yaml)")
        , name_(std::move(name))
    {}

    const std::string& name() const noexcept {
        return name_;
    }

private:
    std::string name_;
};

/**
 * @brief A serialized diff entry is missing fields or has an unknown type
 */
class InvalidEntryError : public Error {
public:
    using Error::Error;
};

// ============================================================================
// Loading
// ============================================================================

/**
 * @brief Input file not found
 */
class FileNotFoundError : public Error {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : Error("Input file not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Input format could not be determined or is not supported
 */
class UnsupportedInputError : public Error {
public:
    using Error::Error;
};

} // namespace diffx

#endif // DIFFX_ERRORS_HPP
