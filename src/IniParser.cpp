/**
 * @file IniParser.cpp
 * @brief INI parser
 *
 * INI has no nesting and no types. Sections become top-level objects;
 * entries that appear before any section header sit directly in the
 * root object. Values stay strings unless IniOptions::infer_types is set.
 */

#include "diffx/Parsers.hpp"
#include "diffx/Errors.hpp"
#include "diffx/Parse.hpp"
#include "diffx/Util.hpp"

#include <string>

namespace diffx {

namespace {

/**
 * @brief Remove one layer of matching single or double quotes
 */
std::string unquote(const std::string& s) {
    if (s.length() < 2) return s;

    const char first = s.front();
    const char last = s.back();
    if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
        return s.substr(1, s.length() - 2);
    }
    return s;
}

/**
 * @brief Next line of text without its terminator; advances pos
 */
std::string_view next_line(std::string_view text, std::size_t& pos) {
    const std::size_t start = pos;
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
        end = text.size();
        pos = text.size();
    } else {
        pos = end + 1;
    }
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

} // anonymous namespace

Value parse_ini(std::string_view text, const IniOptions& options) {
    Value root = Value::object();
    Value* section = &root;

    std::size_t pos = 0;
    std::size_t line_no = 0;

    // Skip a UTF-8 byte order mark
    if (text.size() >= 3 && text.substr(0, 3) == "\xEF\xBB\xBF") {
        pos = 3;
    }

    while (pos < text.size()) {
        ++line_no;
        const std::string line = trim(next_line(text, pos));

        // Skip empty lines and comments
        if (line.empty() || line[0] == ';' || line[0] == '#') {
            continue;
        }

        // Section header
        if (line[0] == '[') {
            if (line.back() != ']') {
                throw ParseError("ini", "unterminated section header '" + line + "'", line_no, 1);
            }
            const std::string name = trim(line.substr(1, line.size() - 2));
            if (name.empty()) {
                throw ParseError("ini", "empty section name", line_no, 1);
            }
            Value& target = root[name];
            if (!target.is_object()) {
                // A section replaces a same-named top-level entry
                target = Value::object();
            }
            section = &target;
            continue;
        }

        // key = value | key: value (first separator wins)
        const std::size_t sep = line.find_first_of("=:");
        if (sep == std::string::npos) {
            throw ParseError("ini", "expected 'key = value', got '" + line + "'", line_no, 1);
        }

        const std::string key = trim(line.substr(0, sep));
        if (key.empty()) {
            throw ParseError("ini", "missing key before '" + std::string(1, line[sep]) + "'",
                             line_no, 1);
        }

        const std::string raw = unquote(trim(line.substr(sep + 1)));
        (*section)[key] = options.infer_types ? parse_scalar(raw) : Value(raw);
    }

    return root;
}

} // namespace diffx
