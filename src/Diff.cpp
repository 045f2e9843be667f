/**
 * @file Diff.cpp
 * @brief Implementation of the structural diff engine
 */

#include "diffx/Diff.hpp"
#include "diffx/Errors.hpp"
#include "diffx/Path.hpp"
#include "diffx/Util.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace diffx {

// ============================================================================
// Entry model
// ============================================================================

std::string diff_type_name(DiffType type) {
    switch (type) {
        case DiffType::Added: return "Added";
        case DiffType::Removed: return "Removed";
        case DiffType::Modified: return "Modified";
        case DiffType::TypeChanged: return "TypeChanged";
    }
    return "Unknown";
}

std::optional<DiffType> diff_type_from_name(const std::string& name) {
    if (name == "Added") return DiffType::Added;
    if (name == "Removed") return DiffType::Removed;
    if (name == "Modified") return DiffType::Modified;
    if (name == "TypeChanged") return DiffType::TypeChanged;
    return std::nullopt;
}

DiffEntry DiffEntry::added(std::string path, Value value) {
    return DiffEntry{DiffType::Added, std::move(path), Value(), std::move(value)};
}

DiffEntry DiffEntry::removed(std::string path, Value value) {
    return DiffEntry{DiffType::Removed, std::move(path), std::move(value), Value()};
}

DiffEntry DiffEntry::modified(std::string path, Value old_value, Value new_value) {
    return DiffEntry{DiffType::Modified, std::move(path), std::move(old_value), std::move(new_value)};
}

DiffEntry DiffEntry::type_changed(std::string path, Value old_value, Value new_value) {
    return DiffEntry{DiffType::TypeChanged, std::move(path), std::move(old_value), std::move(new_value)};
}

std::ostream& operator<<(std::ostream& os, const DiffEntry& entry) {
    os << diff_type_name(entry.type) << "(\"" << entry.path << "\", ";
    switch (entry.type) {
        case DiffType::Added:
        case DiffType::Removed:
            os << to_compact_string(entry.value());
            break;
        case DiffType::Modified:
        case DiffType::TypeChanged:
            os << to_compact_string(entry.old_value) << ", " << to_compact_string(entry.new_value);
            break;
    }
    return os << ")";
}

namespace {

// ============================================================================
// Helpers
// ============================================================================

/// Objects at or below this size are searched linearly
constexpr std::size_t kLinearLookupLimit = 16;

/**
 * @brief Canonical text for an identity value
 *
 * Integral numbers print without a fraction so 1 and 1.0 match; other
 * values print as compact JSON (strings keep their quotes).
 */
std::string id_token(const Value& id) {
    if (id.is_number_float()) {
        const double d = id.get<double>();
        if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9.0e15) {
            return std::to_string(static_cast<long long>(d));
        }
    }
    return to_compact_string(id);
}

/**
 * @brief Check whether a value nests more than limit containers deep
 *
 * Walks with an explicit stack so arbitrarily deep input cannot exhaust the
 * call stack; stops at the first container past the limit.
 */
bool nests_deeper_than(const Value& value, std::size_t limit) {
    if (!is_container(value)) {
        return false;
    }
    std::vector<std::pair<const Value*, std::size_t>> pending;
    pending.emplace_back(&value, 1);
    while (!pending.empty()) {
        const auto [node, level] = pending.back();
        pending.pop_back();
        if (level > limit) {
            return true;
        }
        for (const auto& child : *node) {
            if (is_container(child)) {
                pending.emplace_back(&child, level + 1);
            }
        }
    }
    return false;
}

/**
 * @brief Key lookup over an ordered object
 *
 * ordered_json lookups are linear; large objects get a hash index built
 * once per comparison of that object.
 */
class ObjectIndex {
public:
    explicit ObjectIndex(const Value& obj) : obj_(obj) {
        if (obj.size() > kLinearLookupLimit) {
            index_.reserve(obj.size());
            for (auto it = obj.begin(); it != obj.end(); ++it) {
                index_.emplace(std::string_view(it.key()), &it.value());
            }
        }
    }

    const Value* find(const std::string& key) const {
        if (obj_.size() > kLinearLookupLimit) {
            auto it = index_.find(std::string_view(key));
            return it == index_.end() ? nullptr : it->second;
        }
        auto it = obj_.find(key);
        return it == obj_.end() ? nullptr : &*it;
    }

private:
    const Value& obj_;
    std::unordered_map<std::string_view, const Value*> index_;
};

// ============================================================================
// Walker
// ============================================================================

/**
 * @brief One traversal over a pair of trees
 *
 * The current location is a stack of path segments; it is joined into a
 * display string only when an entry is emitted. In short-circuit mode the
 * walk stops at the first difference that passes the path filter and no
 * entries are kept.
 */
class DiffWalker {
public:
    DiffWalker(const DiffOptions& options, bool short_circuit)
        : options_(options)
        , short_circuit_(short_circuit)
    {
        path_.reserve(16);
    }

    void run(const Value& old_value, const Value& new_value) {
        walk(old_value, new_value, 0);
    }

    bool found() const noexcept { return found_; }

    std::vector<DiffEntry> take_entries() { return std::move(entries_); }

private:
    const DiffOptions& options_;
    bool short_circuit_;
    bool found_ = false;
    std::vector<PathSegment> path_;
    std::vector<DiffEntry> entries_;

    bool done() const noexcept { return short_circuit_ && found_; }

    /**
     * @brief Record a difference at the current path
     *
     * depth is the number of containers enclosing the compared values. A
     * whole subtree reported as a payload counts against max_depth the same
     * way a walked one does.
     */
    void emit(DiffType type, const Value* old_value, const Value* new_value, std::size_t depth) {
        const std::size_t max_depth = options_.max_depth();
        const std::size_t budget = depth < max_depth ? max_depth - depth : 0;
        if ((old_value != nullptr && nests_deeper_than(*old_value, budget)) ||
            (new_value != nullptr && nests_deeper_than(*new_value, budget))) {
            throw DepthExceededError(join_path(path_), max_depth);
        }

        if (short_circuit_) {
            const auto& filter = options_.path_filter();
            if (filter && join_path(path_).find(*filter) == std::string::npos) {
                return;
            }
            found_ = true;
            return;
        }

        found_ = true;
        std::string path = join_path(path_);
        switch (type) {
            case DiffType::Added:
                entries_.push_back(DiffEntry::added(std::move(path), *new_value));
                break;
            case DiffType::Removed:
                entries_.push_back(DiffEntry::removed(std::move(path), *old_value));
                break;
            case DiffType::Modified:
                entries_.push_back(DiffEntry::modified(std::move(path), *old_value, *new_value));
                break;
            case DiffType::TypeChanged:
                entries_.push_back(DiffEntry::type_changed(std::move(path), *old_value, *new_value));
                break;
        }
    }

    void emit_added(PathSegment seg, const Value& value, std::size_t depth) {
        path_.push_back(std::move(seg));
        emit(DiffType::Added, nullptr, &value, depth);
        path_.pop_back();
    }

    void emit_removed(PathSegment seg, const Value& value, std::size_t depth) {
        path_.push_back(std::move(seg));
        emit(DiffType::Removed, &value, nullptr, depth);
        path_.pop_back();
    }

    void walk_child(PathSegment seg, const Value& old_value, const Value& new_value,
                    std::size_t depth) {
        path_.push_back(std::move(seg));
        walk(old_value, new_value, depth);
        path_.pop_back();
    }

    /**
     * @brief Compare two nodes; depth counts the containers entered so far
     */
    void walk(const Value& old_value, const Value& new_value, std::size_t depth) {
        const ValueKind old_kind = kind_of(old_value);
        if (old_kind != kind_of(new_value)) {
            emit(DiffType::TypeChanged, &old_value, &new_value, depth);
            return;
        }

        if (is_container(old_value) && depth + 1 > options_.max_depth()) {
            throw DepthExceededError(join_path(path_), options_.max_depth());
        }

        switch (old_kind) {
            case ValueKind::Object:
                walk_object(old_value, new_value, depth);
                break;
            case ValueKind::Array:
                walk_array(old_value, new_value, depth);
                break;
            case ValueKind::Number:
                if (!numbers_equal(old_value, new_value)) {
                    emit(DiffType::Modified, &old_value, &new_value, depth);
                }
                break;
            case ValueKind::String:
                if (!strings_equal(old_value, new_value)) {
                    emit(DiffType::Modified, &old_value, &new_value, depth);
                }
                break;
            case ValueKind::Bool:
            case ValueKind::Null:
                if (old_value != new_value) {
                    emit(DiffType::Modified, &old_value, &new_value, depth);
                }
                break;
        }
    }

    // ------------------------------------------------------------------------
    // Objects
    // ------------------------------------------------------------------------

    void walk_object(const Value& old_obj, const Value& new_obj, std::size_t depth) {
        const ObjectIndex old_index(old_obj);
        const ObjectIndex new_index(new_obj);

        for (auto it = old_obj.begin(); it != old_obj.end() && !done(); ++it) {
            const std::string& key = it.key();
            if (options_.is_ignored_key(key)) {
                continue;
            }
            const Value* counterpart = new_index.find(key);
            if (counterpart == nullptr) {
                emit_removed(key_segment(key), it.value(), depth + 1);
            } else {
                walk_child(key_segment(key), it.value(), *counterpart, depth + 1);
            }
        }

        for (auto it = new_obj.begin(); it != new_obj.end() && !done(); ++it) {
            const std::string& key = it.key();
            if (options_.is_ignored_key(key) || old_index.find(key) != nullptr) {
                continue;
            }
            emit_added(key_segment(key), it.value(), depth + 1);
        }
    }

    // ------------------------------------------------------------------------
    // Arrays
    // ------------------------------------------------------------------------

    const Value* identity_of(const Value& element) const {
        if (!element.is_object()) {
            return nullptr;
        }
        auto it = element.find(*options_.array_id_key());
        return it == element.end() ? nullptr : &*it;
    }

    bool uses_identity(const Value& old_arr, const Value& new_arr) const {
        if (!options_.array_id_key()) {
            return false;
        }
        auto keyed = [this](const Value& e) { return identity_of(e) != nullptr; };
        return std::any_of(old_arr.begin(), old_arr.end(), keyed) &&
               std::any_of(new_arr.begin(), new_arr.end(), keyed);
    }

    void walk_array(const Value& old_arr, const Value& new_arr, std::size_t depth) {
        if (uses_identity(old_arr, new_arr)) {
            walk_array_by_identity(old_arr, new_arr, depth);
            return;
        }

        std::vector<const Value*> old_items;
        std::vector<const Value*> new_items;
        old_items.reserve(old_arr.size());
        new_items.reserve(new_arr.size());
        for (const auto& e : old_arr) old_items.push_back(&e);
        for (const auto& e : new_arr) new_items.push_back(&e);
        walk_positional(old_items, new_items, depth);
    }

    /**
     * @brief Compare element lists index by index
     */
    void walk_positional(const std::vector<const Value*>& old_items,
                         const std::vector<const Value*>& new_items,
                         std::size_t depth) {
        const std::size_t common = std::min(old_items.size(), new_items.size());
        for (std::size_t i = 0; i < common && !done(); ++i) {
            walk_child(index_segment(i), *old_items[i], *new_items[i], depth + 1);
        }
        for (std::size_t i = common; i < old_items.size() && !done(); ++i) {
            emit_removed(index_segment(i), *old_items[i], depth + 1);
        }
        for (std::size_t i = common; i < new_items.size() && !done(); ++i) {
            emit_added(index_segment(i), *new_items[i], depth + 1);
        }
    }

    /**
     * @brief Match elements by identity key value
     *
     * Keyed elements pair up by id (duplicates in order of occurrence);
     * elements without the key fall back to positional comparison among
     * themselves.
     */
    void walk_array_by_identity(const Value& old_arr, const Value& new_arr, std::size_t depth) {
        const std::string& id_key = *options_.array_id_key();

        std::unordered_map<std::string, std::deque<std::size_t>> new_by_id;
        std::vector<std::string> new_tokens(new_arr.size());
        std::vector<bool> new_matched(new_arr.size(), false);
        std::vector<const Value*> old_unkeyed;
        std::vector<const Value*> new_unkeyed;

        for (std::size_t j = 0; j < new_arr.size(); ++j) {
            const Value& element = new_arr[j];
            if (const Value* id = identity_of(element)) {
                new_tokens[j] = id_token(*id);
                new_by_id[new_tokens[j]].push_back(j);
            } else {
                new_unkeyed.push_back(&element);
            }
        }

        for (std::size_t i = 0; i < old_arr.size() && !done(); ++i) {
            const Value& element = old_arr[i];
            const Value* id = identity_of(element);
            if (id == nullptr) {
                old_unkeyed.push_back(&element);
                continue;
            }

            const std::string token = id_token(*id);
            auto match = new_by_id.find(token);
            if (match == new_by_id.end() || match->second.empty()) {
                emit_removed(identity_segment(id_key, token), element, depth + 1);
                continue;
            }
            const std::size_t j = match->second.front();
            match->second.pop_front();
            new_matched[j] = true;
            walk_child(identity_segment(id_key, token), element, new_arr[j], depth + 1);
        }

        for (std::size_t j = 0; j < new_arr.size() && !done(); ++j) {
            if (!new_tokens[j].empty() && !new_matched[j]) {
                emit_added(identity_segment(id_key, new_tokens[j]), new_arr[j], depth + 1);
            }
        }

        if (!done()) {
            walk_positional(old_unkeyed, new_unkeyed, depth);
        }
    }

    // ------------------------------------------------------------------------
    // Scalars
    // ------------------------------------------------------------------------

    bool numbers_equal(const Value& a, const Value& b) const {
        if (a == b) {
            return true;
        }
        const double x = a.get<double>();
        const double y = b.get<double>();
        if (std::isnan(x) && std::isnan(y)) {
            return true;
        }
        // Exact mode must not let the double conversion merge large integers
        if (options_.epsilon() == 0.0) {
            return false;
        }
        return std::fabs(x - y) <= options_.epsilon();
    }

    bool strings_equal(const Value& a, const Value& b) const {
        if (a == b) {
            return true;
        }
        if (!options_.ignore_whitespace() && !options_.ignore_case()) {
            return false;
        }
        return normalize(a.get_ref<const std::string&>()) ==
               normalize(b.get_ref<const std::string&>());
    }

    std::string normalize(const std::string& s) const {
        std::string out = options_.ignore_whitespace() ? collapse_whitespace(s) : s;
        return options_.ignore_case() ? to_lower(std::move(out)) : out;
    }
};

} // anonymous namespace

// ============================================================================
// Entry points
// ============================================================================

DiffReport compare(const Value& old_value, const Value& new_value, const DiffOptions& options) {
    DiffReport report;

    if (options.status_only()) {
        DiffWalker walker(options, true);
        walker.run(old_value, new_value);
        report.differs = walker.found();
        return report;
    }

    DiffWalker walker(options, false);
    walker.run(old_value, new_value);
    std::vector<DiffEntry> entries = walker.take_entries();

    // Filter after the walk so traversal order never depends on it
    if (const auto& filter = options.path_filter()) {
        entries.erase(
            std::remove_if(entries.begin(), entries.end(), [&filter](const DiffEntry& e) {
                return e.path.find(*filter) == std::string::npos;
            }),
            entries.end());
    }

    report.differs = !entries.empty();
    report.entries = std::move(entries);
    return report;
}

std::vector<DiffEntry> diff(const Value& old_value, const Value& new_value, const DiffOptions& options) {
    return compare(old_value, new_value, options).entries;
}

std::vector<DiffEntry> diff(const Value& old_value, const Value& new_value, const RawDiffOptions& raw) {
    const DiffOptions options = validate_options(raw);
    return diff(old_value, new_value, options);
}

bool has_differences(const Value& old_value, const Value& new_value, const DiffOptions& options) {
    DiffWalker walker(options, true);
    walker.run(old_value, new_value);
    return walker.found();
}

} // namespace diffx
