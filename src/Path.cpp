/**
 * @file Path.cpp
 * @brief Implementation of path segments
 */

#include "diffx/Path.hpp"
#include <utility>

namespace diffx {

PathSegment key_segment(std::string key) {
    return PathSegment{std::move(key), false};
}

PathSegment index_segment(std::size_t index) {
    return PathSegment{"[" + std::to_string(index) + "]", true};
}

PathSegment identity_segment(const std::string& id_key, const std::string& id_token) {
    return PathSegment{"[" + id_key + "=" + id_token + "]", true};
}

std::string join_path(const std::vector<PathSegment>& segments) {
    std::size_t total = 0;
    for (const auto& seg : segments) {
        total += seg.text.size() + 1;
    }

    std::string out;
    out.reserve(total);
    for (const auto& seg : segments) {
        if (!seg.bracketed && !out.empty()) {
            out += '.';
        }
        out += seg.text;
    }
    return out;
}

} // namespace diffx
