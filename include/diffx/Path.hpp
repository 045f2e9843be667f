/**
 * @file Path.hpp
 * @brief Path segments and display paths for diff entries
 *
 * During traversal the engine keeps the current location as a stack of
 * segments and only joins them into a display string when it emits an
 * entry.
 *
 * Display rules:
 * - Object keys are joined with '.'
 * - Array indices render as "[i]"
 * - Identity-matched array elements render as "[key=id]"
 * - Bracketed segments attach without a separator
 *
 * Examples: "a.b[2].c", "[id=1].v", "users[id=\"u7\"].name"
 */

#ifndef DIFFX_PATH_HPP
#define DIFFX_PATH_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace diffx {

/**
 * @brief One step of a path
 *
 * `text` holds the rendered token: the bare key for object members, the
 * full bracket expression for array elements.
 */
struct PathSegment {
    std::string text;
    bool bracketed = false;

    bool operator==(const PathSegment& other) const {
        return text == other.text && bracketed == other.bracketed;
    }
};

/**
 * @brief Segment for an object member
 */
PathSegment key_segment(std::string key);

/**
 * @brief Segment for an array element addressed by position
 */
PathSegment index_segment(std::size_t index);

/**
 * @brief Segment for an array element matched by identity key
 * @param id_key Name of the identity field (e.g., "id")
 * @param id_token Canonical text of the identity value (e.g., "1", "\"u7\"")
 */
PathSegment identity_segment(const std::string& id_key, const std::string& id_token);

/**
 * @brief Join segments into a display path
 *
 * Examples:
 * - [a, b, [2], c] → "a.b[2].c"
 * - [[id=1], v] → "[id=1].v"
 * - [] → ""
 */
std::string join_path(const std::vector<PathSegment>& segments);

} // namespace diffx

#endif // DIFFX_PATH_HPP
