/**
 * @file Parsers.cpp
 * @brief JSON, YAML and TOML parsers plus format dispatch
 *
 * Natively typed formats map directly onto the canonical value model:
 * - JSON via nlohmann::json (ordered objects)
 * - YAML via yaml-cpp, with core-schema scalar resolution
 * - TOML via toml++
 *
 * INI, XML and CSV live in their own translation units.
 */

#include "diffx/Parsers.hpp"
#include "diffx/Errors.hpp"
#include "diffx/Util.hpp"

#include <toml++/toml.hpp>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace diffx {

// ============================================================================
// Format names
// ============================================================================

std::string input_format_name(InputFormat format) {
    switch (format) {
        case InputFormat::Json: return "json";
        case InputFormat::Yaml: return "yaml";
        case InputFormat::Toml: return "toml";
        case InputFormat::Ini: return "ini";
        case InputFormat::Xml: return "xml";
        case InputFormat::Csv: return "csv";
    }
    return "unknown";
}

std::optional<InputFormat> input_format_from_name(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "json") return InputFormat::Json;
    if (lower == "yaml" || lower == "yml") return InputFormat::Yaml;
    if (lower == "toml") return InputFormat::Toml;
    if (lower == "ini") return InputFormat::Ini;
    if (lower == "xml") return InputFormat::Xml;
    if (lower == "csv") return InputFormat::Csv;
    return std::nullopt;
}

namespace {

// ============================================================================
// YAML scalar resolution
// ============================================================================

// [-+]?[0-9]+
bool is_yaml_int(std::string_view s) {
    if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
        s.remove_prefix(1);
    }
    return is_digits(s);
}

// [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?
bool is_yaml_float(std::string_view s) {
    if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
        s.remove_prefix(1);
    }
    std::string_view mantissa = s;
    const std::size_t exp = s.find_first_of("eE");
    if (exp != std::string_view::npos) {
        mantissa = s.substr(0, exp);
        std::string_view power = s.substr(exp + 1);
        if (!power.empty() && (power.front() == '-' || power.front() == '+')) {
            power.remove_prefix(1);
        }
        if (!is_digits(power)) {
            return false;
        }
    }

    const std::size_t dot = mantissa.find('.');
    if (dot == std::string_view::npos) {
        return is_digits(mantissa);
    }
    const std::string_view whole = mantissa.substr(0, dot);
    const std::string_view fraction = mantissa.substr(dot + 1);
    if (whole.empty()) {
        return is_digits(fraction);
    }
    return is_digits(whole) && (fraction.empty() || is_digits(fraction));
}

/**
 * @brief Resolve a plain (unquoted) YAML scalar
 */
Value resolve_plain_scalar(const std::string& s) {
    if (s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL") {
        return nullptr;
    }
    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;

    if (s == ".inf" || s == ".Inf" || s == ".INF" || s == "+.inf" || s == "+.Inf" || s == "+.INF") {
        return std::numeric_limits<double>::infinity();
    }
    if (s == "-.inf" || s == "-.Inf" || s == "-.INF") {
        return -std::numeric_limits<double>::infinity();
    }
    if (s == ".nan" || s == ".NaN" || s == ".NAN") {
        return std::numeric_limits<double>::quiet_NaN();
    }

    try {
        if (is_yaml_int(s)) {
            try {
                return static_cast<std::int64_t>(std::stoll(s));
            } catch (const std::out_of_range&) {
                return std::stod(s);
            }
        }
        if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'o')) {
            const int base = s[1] == 'x' ? 16 : 8;
            std::size_t pos = 0;
            const unsigned long long v = std::stoull(s.substr(2), &pos, base);
            if (pos == s.size() - 2) {
                return static_cast<std::uint64_t>(v);
            }
            return s;
        }
        if (is_yaml_float(s)) {
            return std::stod(s);
        }
    } catch (const std::invalid_argument&) {
        return s;
    } catch (const std::out_of_range&) {
        return s;
    }
    return s;
}

/// Sequences and maps nest at most this deep
constexpr std::size_t kMaxYamlDepth = 1024;

/**
 * @brief Convert a loaded YAML node tree
 *
 * ancestors holds the containers above node. An alias may refer back to
 * one of them, which yaml-cpp represents as a node that contains itself.
 */
Value yaml_node_to_value(const YAML::Node& node, std::vector<YAML::Node>& ancestors) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;

        case YAML::NodeType::Scalar: {
            const std::string& tag = node.Tag();
            if (tag == "!" || tag == "tag:yaml.org,2002:str") {
                return node.Scalar();
            }
            return resolve_plain_scalar(node.Scalar());
        }

        case YAML::NodeType::Sequence:
        case YAML::NodeType::Map:
            break;
    }

    for (const auto& ancestor : ancestors) {
        if (node.is(ancestor)) {
            throw ParseError("yaml", "recursive alias");
        }
    }
    if (ancestors.size() >= kMaxYamlDepth) {
        throw ParseError("yaml", "nesting exceeds " + std::to_string(kMaxYamlDepth) + " levels");
    }
    ancestors.push_back(node);

    Value out;
    if (node.IsSequence()) {
        out = Value::array();
        for (const auto& elem : node) {
            out.push_back(yaml_node_to_value(elem, ancestors));
        }
    } else {
        out = Value::object();
        for (const auto& kv : node) {
            if (kv.first.IsSequence() || kv.first.IsMap()) {
                throw ParseError("yaml", "mapping keys must be scalars");
            }
            const std::string key = kv.first.IsScalar() ? kv.first.Scalar()
                                                        : YAML::Dump(kv.first);
            out[key] = yaml_node_to_value(kv.second, ancestors);
        }
    }

    ancestors.pop_back();
    return out;
}

// ============================================================================
// TOML conversion
// ============================================================================

template <typename T>
std::string stream_to_string(const T& v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

Value toml_node_to_value(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return Value(stream_to_string(node.as_date()->get()));

        case toml::node_type::time:
            return Value(stream_to_string(node.as_time()->get()));

        case toml::node_type::date_time:
            return Value(stream_to_string(node.as_date_time()->get()));

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_node_to_value(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_node_to_value(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

// ============================================================================
// Parsers
// ============================================================================

Value parse_json(std::string_view text) {
    try {
        return Value::parse(text.begin(), text.end());
    } catch (const Value::parse_error& e) {
        const std::size_t offset = e.byte > 0 ? e.byte - 1 : 0;
        const auto [line, column] = line_column_at(text, offset);
        throw ParseError("json", e.what(), line, column);
    }
}

Value parse_yaml(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::ParserException& e) {
        throw ParseError("yaml", e.msg,
                         static_cast<std::size_t>(e.mark.line + 1),
                         static_cast<std::size_t>(e.mark.column + 1));
    } catch (const YAML::Exception& e) {
        throw ParseError("yaml", e.what());
    }
    std::vector<YAML::Node> ancestors;
    return yaml_node_to_value(root, ancestors);
}

Value parse_toml(std::string_view text) {
    toml::table table;
    try {
        table = toml::parse(text);
    } catch (const toml::parse_error& e) {
        throw ParseError(
            "toml",
            std::string(e.description()),
            static_cast<std::size_t>(e.source().begin.line),
            static_cast<std::size_t>(e.source().begin.column)
        );
    }
    return toml_node_to_value(table);
}

Value parse(std::string_view text, InputFormat format) {
    switch (format) {
        case InputFormat::Json: return parse_json(text);
        case InputFormat::Yaml: return parse_yaml(text);
        case InputFormat::Toml: return parse_toml(text);
        case InputFormat::Ini: return parse_ini(text);
        case InputFormat::Xml: return parse_xml(text);
        case InputFormat::Csv: return parse_csv(text);
    }
    throw UnsupportedInputError("Unsupported input format");
}

} // namespace diffx
