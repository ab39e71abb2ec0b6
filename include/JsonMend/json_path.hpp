#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace JsonMend {

// Ordered segments: property names, or "[N]" for array positions.
using Path = std::vector<std::string>;

using IncompleteSet = std::set<std::string, std::less<>>;

inline std::string index_segment(std::size_t index) {
    return "[" + std::to_string(index) + "]";
}

// ["user", "tags", "[0]", "name"] -> "user.tags[0].name"
inline std::string join_path(const Path& path) {
    std::string out;
    for (const std::string& segment : path) {
        if (!out.empty() && !(segment.size() > 0 && segment.front() == '[')) {
            out += '.';
        }
        out += segment;
    }
    return out;
}

inline IncompleteSet build_incomplete_set(const std::vector<Path>& paths) {
    IncompleteSet set;
    for (const Path& p : paths) {
        set.insert(join_path(p));
    }
    return set;
}

// True when `path` itself, or any prefix of it ending right before a '.' or '[', is in the set.
inline bool is_path_or_parent_incomplete(std::string_view path, const IncompleteSet& incomplete) {
    if (incomplete.contains(path)) {
        return true;
    }
    for (std::size_t i = 0; i < path.size(); i ++) {
        if (path[i] == '.' || path[i] == '[') {
            if (incomplete.contains(path.substr(0, i))) {
                return true;
            }
        }
    }
    return false;
}

} // namespace JsonMend
