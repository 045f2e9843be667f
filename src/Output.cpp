/**
 * @file Output.cpp
 * @brief Implementation of entry rendering and entry documents
 */

#include "diffx/Output.hpp"
#include "diffx/Errors.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <sstream>

namespace diffx {

namespace {

// ============================================================================
// Helpers
// ============================================================================

/**
 * @brief Replace invalid UTF-8 sequences with U+FFFD
 */
std::string sanitize_utf8(const std::string& s) {
    const std::string quoted = Value(s).dump(-1, ' ', false, Value::error_handler_t::replace);
    return Value::parse(quoted).get<std::string>();
}

char change_marker(DiffType type) {
    switch (type) {
        case DiffType::Added: return '+';
        case DiffType::Removed: return '-';
        case DiffType::Modified: return '~';
        case DiffType::TypeChanged: return '!';
    }
    return '?';
}

/**
 * @brief Emit a value as YAML
 *
 * Strings are always double-quoted. Numbers use the JSON spelling so
 * floats keep their shortest round-trip form.
 */
void emit_yaml_value(YAML::Emitter& out, const Value& val) {
    switch (val.type()) {
        case Value::value_t::null:
            out << YAML::Null;
            break;
        case Value::value_t::boolean:
            out << val.get<bool>();
            break;
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
            out << val.dump();
            break;
        case Value::value_t::number_float: {
            const double d = val.get<double>();
            if (std::isnan(d)) {
                out << ".nan";
            } else if (std::isinf(d)) {
                out << (d > 0 ? ".inf" : "-.inf");
            } else {
                out << val.dump();
            }
            break;
        }
        case Value::value_t::string:
            out << YAML::DoubleQuoted << sanitize_utf8(val.get_ref<const std::string&>());
            break;
        case Value::value_t::array:
            out << YAML::BeginSeq;
            for (const auto& item : val) {
                emit_yaml_value(out, item);
            }
            out << YAML::EndSeq;
            break;
        case Value::value_t::object:
            out << YAML::BeginMap;
            for (auto it = val.begin(); it != val.end(); ++it) {
                out << YAML::Key << YAML::DoubleQuoted << sanitize_utf8(it.key());
                out << YAML::Value;
                emit_yaml_value(out, it.value());
            }
            out << YAML::EndMap;
            break;
        case Value::value_t::binary:
        case Value::value_t::discarded:
            out << YAML::Null;
            break;
    }
}

const Value* find_field(const Value& doc, const char* name, const char* alias = nullptr) {
    auto it = doc.find(name);
    if (it != doc.end()) {
        return &*it;
    }
    if (alias != nullptr) {
        it = doc.find(alias);
        if (it != doc.end()) {
            return &*it;
        }
    }
    return nullptr;
}

const Value& require_field(const Value& doc, const std::string& type,
                           const char* name, const char* alias) {
    const Value* v = find_field(doc, name, alias);
    if (v == nullptr) {
        throw InvalidEntryError(type + " entry must have " + name);
    }
    return *v;
}

} // anonymous namespace

// ============================================================================
// Rendering
// ============================================================================

std::string format_native(const std::vector<DiffEntry>& entries) {
    std::ostringstream out;
    for (const auto& entry : entries) {
        out << change_marker(entry.type) << ' '
            << (entry.path.empty() ? kRootPathLabel : entry.path) << ": ";
        switch (entry.type) {
            case DiffType::Added:
            case DiffType::Removed:
                out << to_compact_string(entry.value());
                break;
            case DiffType::Modified:
            case DiffType::TypeChanged:
                out << to_compact_string(entry.old_value) << " -> "
                    << to_compact_string(entry.new_value);
                break;
        }
        out << '\n';
    }
    return out.str();
}

std::string format_json(const std::vector<DiffEntry>& entries) {
    return entries_to_value(entries).dump(2, ' ', false, Value::error_handler_t::replace);
}

std::string format_yaml(const std::vector<DiffEntry>& entries) {
    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const auto& entry : entries) {
        emit_yaml_value(out, entry_to_value(entry));
    }
    out << YAML::EndSeq;

    if (!out.good()) {
        throw FormatError("YAML emitter error: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

std::string format_output(const std::vector<DiffEntry>& entries, OutputFormat format) {
    switch (format) {
        case OutputFormat::Native: return format_native(entries);
        case OutputFormat::Json: return format_json(entries);
        case OutputFormat::Yaml: return format_yaml(entries);
    }
    throw UnknownOutputFormatError(output_format_name(format));
}

std::string format_output(const std::vector<DiffEntry>& entries, const std::string& name) {
    auto format = output_format_from_name(name);
    if (!format) {
        throw UnknownOutputFormatError(name);
    }
    return format_output(entries, *format);
}

// ============================================================================
// Entry documents
// ============================================================================

Value entry_to_value(const DiffEntry& entry) {
    Value doc = Value::object();
    doc["type"] = diff_type_name(entry.type);
    doc["path"] = entry.path;
    switch (entry.type) {
        case DiffType::Removed:
            doc["value"] = entry.old_value;
            break;
        case DiffType::Added:
            doc["newValue"] = entry.new_value;
            break;
        case DiffType::Modified:
        case DiffType::TypeChanged:
            doc["oldValue"] = entry.old_value;
            doc["newValue"] = entry.new_value;
            break;
    }
    return doc;
}

Value entries_to_value(const std::vector<DiffEntry>& entries) {
    Value out = Value::array();
    for (const auto& entry : entries) {
        out.push_back(entry_to_value(entry));
    }
    return out;
}

DiffEntry entry_from_value(const Value& doc) {
    if (!doc.is_object()) {
        throw InvalidEntryError("Diff entry must be an object, got " + type_name(doc));
    }

    const Value* type_field = find_field(doc, "type", "diffType");
    if (type_field == nullptr || !type_field->is_string()) {
        throw InvalidEntryError("Diff entry must have a string 'type'");
    }
    const std::string& type_text = type_field->get_ref<const std::string&>();
    auto type = diff_type_from_name(type_text);
    if (!type) {
        throw InvalidEntryError("Invalid diff entry type: " + type_text);
    }

    const Value* path_field = find_field(doc, "path");
    if (path_field == nullptr || !path_field->is_string()) {
        throw InvalidEntryError(type_text + " entry must have a string 'path'");
    }
    std::string path = path_field->get<std::string>();

    switch (*type) {
        case DiffType::Added:
            return DiffEntry::added(std::move(path),
                                    require_field(doc, type_text, "newValue", "new_value"));
        case DiffType::Removed:
            return DiffEntry::removed(std::move(path),
                                      require_field(doc, type_text, "value", nullptr));
        case DiffType::Modified:
            return DiffEntry::modified(std::move(path),
                                       require_field(doc, type_text, "oldValue", "old_value"),
                                       require_field(doc, type_text, "newValue", "new_value"));
        case DiffType::TypeChanged:
            return DiffEntry::type_changed(std::move(path),
                                           require_field(doc, type_text, "oldValue", "old_value"),
                                           require_field(doc, type_text, "newValue", "new_value"));
    }
    throw InvalidEntryError("Invalid diff entry type: " + type_text);
}

std::vector<DiffEntry> entries_from_value(const Value& doc) {
    if (!doc.is_array()) {
        throw InvalidEntryError("Diff entries must be an array, got " + type_name(doc));
    }
    std::vector<DiffEntry> entries;
    entries.reserve(doc.size());
    for (const auto& item : doc) {
        entries.push_back(entry_from_value(item));
    }
    return entries;
}

} // namespace diffx
