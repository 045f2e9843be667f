/**
 * @file Loader.cpp
 * @brief Implementation of input loading
 */

#include "diffx/Loader.hpp"
#include "diffx/Errors.hpp"
#include "diffx/Util.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace diffx {

namespace {

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

} // anonymous namespace

std::string read_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }
    return read_stream(file);
}

std::string read_stream(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

std::optional<InputFormat> detect_format(const std::string& path) {
    const std::string ext = get_file_extension(path);

    if (ext == ".json") return InputFormat::Json;
    if (ext == ".yaml" || ext == ".yml") return InputFormat::Yaml;
    if (ext == ".toml") return InputFormat::Toml;
    if (ext == ".ini" || ext == ".cfg" || ext == ".conf") return InputFormat::Ini;
    if (ext == ".xml") return InputFormat::Xml;
    if (ext == ".csv") return InputFormat::Csv;
    return std::nullopt;
}

InputFormat parse_input_format_name(const std::string& name) {
    auto format = input_format_from_name(name);
    if (!format) {
        throw UnsupportedInputError(
            "Unsupported input format: '" + name +
            "' (expected json, yaml, toml, ini, xml or csv)"
        );
    }
    return *format;
}

Value load_document(const std::string& path,
                    const std::optional<InputFormat>& format,
                    std::istream& in) {
    const bool from_stdin = (path == kStdinPath);

    std::optional<InputFormat> resolved = format;
    if (!resolved && !from_stdin) {
        resolved = detect_format(path);
    }
    if (!resolved) {
        if (from_stdin) {
            throw UnsupportedInputError(
                "Cannot detect the format of standard input; pass --format");
        }
        throw UnsupportedInputError(
            "Cannot detect the format of '" + path + "' from extension '" +
            get_file_extension(path) + "'; pass --format"
        );
    }

    const std::string text = from_stdin ? read_stream(in) : read_file(path);
    return parse(text, *resolved);
}

Value load_document(const std::string& path, const std::optional<InputFormat>& format) {
    return load_document(path, format, std::cin);
}

} // namespace diffx
