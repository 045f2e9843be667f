/**
 * @file Options.cpp
 * @brief Implementation of option validation
 */

#include "diffx/Options.hpp"
#include "diffx/Errors.hpp"
#include "diffx/Util.hpp"

#include <cmath>
#include <initializer_list>

namespace diffx {

// ============================================================================
// Output format names
// ============================================================================

std::string output_format_name(OutputFormat format) {
    switch (format) {
        case OutputFormat::Native: return "native";
        case OutputFormat::Json: return "json";
        case OutputFormat::Yaml: return "yaml";
    }
    return "unknown";
}

std::optional<OutputFormat> output_format_from_name(const std::string& name) {
    const std::string lower = to_lower(trim(name));
    if (lower == "native" || lower == "diffx") return OutputFormat::Native;
    if (lower == "json") return OutputFormat::Json;
    if (lower == "yaml" || lower == "yml") return OutputFormat::Yaml;
    return std::nullopt;
}

// ============================================================================
// Validation
// ============================================================================

bool DiffOptions::is_ignored_key(const std::string& key) const {
    return ignore_keys_.has_value() && std::regex_search(key, *ignore_keys_);
}

DiffOptions validate_options(const RawDiffOptions& raw) {
    DiffOptions opts;

    if (raw.ignore_keys_regex.has_value()) {
        try {
            opts.ignore_keys_.emplace(*raw.ignore_keys_regex, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw InvalidPatternError(*raw.ignore_keys_regex, e.what());
        }
        opts.ignore_keys_pattern_ = *raw.ignore_keys_regex;
    }

    if (raw.output_format.has_value()) {
        auto format = output_format_from_name(*raw.output_format);
        if (!format) {
            throw UnknownFormatError(*raw.output_format);
        }
        opts.output_format_ = *format;
    }

    if (raw.epsilon.has_value()) {
        const double eps = *raw.epsilon;
        if (!std::isfinite(eps) || eps < 0.0) {
            throw InvalidOptionError("epsilon", "must be a finite, non-negative number");
        }
        opts.epsilon_ = eps;
    }

    if (raw.max_depth.has_value()) {
        if (*raw.max_depth == 0) {
            throw InvalidOptionError("max_depth", "must be at least 1");
        }
        opts.max_depth_ = *raw.max_depth;
    }

    // Empty strings mean "not set"
    if (raw.array_id_key.has_value() && !raw.array_id_key->empty()) {
        opts.array_id_key_ = raw.array_id_key;
    }
    if (raw.path_filter.has_value() && !raw.path_filter->empty()) {
        opts.path_filter_ = raw.path_filter;
    }

    opts.ignore_whitespace_ = raw.ignore_whitespace.value_or(false);
    opts.ignore_case_ = raw.ignore_case.value_or(false);
    opts.brief_mode_ = raw.brief_mode.value_or(false);
    opts.quiet_mode_ = raw.quiet_mode.value_or(false);

    return opts;
}

// ============================================================================
// Options documents
// ============================================================================

namespace {

/**
 * @brief Find the first of several spellings of a field
 */
const Value* find_field(const Value& doc, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto it = doc.find(name);
        if (it != doc.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

void read_string(const Value& doc, std::initializer_list<const char*> names,
                 std::optional<std::string>& out) {
    const Value* v = find_field(doc, names);
    if (v == nullptr) return;
    if (!v->is_string()) {
        throw InvalidOptionError(*names.begin(), "expected a string, got " + type_name(*v));
    }
    out = v->get<std::string>();
}

void read_bool(const Value& doc, std::initializer_list<const char*> names,
               std::optional<bool>& out) {
    const Value* v = find_field(doc, names);
    if (v == nullptr) return;
    if (!v->is_boolean()) {
        throw InvalidOptionError(*names.begin(), "expected a boolean, got " + type_name(*v));
    }
    out = v->get<bool>();
}

} // anonymous namespace

RawDiffOptions raw_options_from_value(const Value& doc) {
    RawDiffOptions raw;
    if (doc.is_null()) {
        return raw;
    }
    if (!doc.is_object()) {
        throw InvalidOptionError("options", "expected an object, got " + type_name(doc));
    }

    if (const Value* v = find_field(doc, {"epsilon"})) {
        if (!v->is_number()) {
            throw InvalidOptionError("epsilon", "expected a number, got " + type_name(*v));
        }
        raw.epsilon = v->get<double>();
    }

    if (const Value* v = find_field(doc, {"max_depth", "maxDepth"})) {
        if (!v->is_number_integer() || v->get<long long>() < 0) {
            throw InvalidOptionError("max_depth", "expected a non-negative integer");
        }
        raw.max_depth = v->get<std::size_t>();
    }

    read_string(doc, {"array_id_key", "arrayIdKey"}, raw.array_id_key);
    read_string(doc, {"ignore_keys_regex", "ignoreKeysRegex"}, raw.ignore_keys_regex);
    read_string(doc, {"path_filter", "pathFilter"}, raw.path_filter);
    read_string(doc, {"output_format", "outputFormat"}, raw.output_format);
    read_bool(doc, {"ignore_whitespace", "ignoreWhitespace"}, raw.ignore_whitespace);
    read_bool(doc, {"ignore_case", "ignoreCase"}, raw.ignore_case);
    read_bool(doc, {"brief_mode", "briefMode"}, raw.brief_mode);
    read_bool(doc, {"quiet_mode", "quietMode"}, raw.quiet_mode);

    return raw;
}

RawDiffOptions merge_raw_options(const RawDiffOptions& base, const RawDiffOptions& top) {
    RawDiffOptions out = base;
    if (top.epsilon) out.epsilon = top.epsilon;
    if (top.array_id_key) out.array_id_key = top.array_id_key;
    if (top.ignore_keys_regex) out.ignore_keys_regex = top.ignore_keys_regex;
    if (top.path_filter) out.path_filter = top.path_filter;
    if (top.output_format) out.output_format = top.output_format;
    if (top.ignore_whitespace) out.ignore_whitespace = top.ignore_whitespace;
    if (top.ignore_case) out.ignore_case = top.ignore_case;
    if (top.brief_mode) out.brief_mode = top.brief_mode;
    if (top.quiet_mode) out.quiet_mode = top.quiet_mode;
    if (top.max_depth) out.max_depth = top.max_depth;
    return out;
}

} // namespace diffx
