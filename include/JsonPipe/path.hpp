#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace JsonPipe {
namespace path {

/// One level of a path: an object member or an array slot.
struct PathElement {
    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

    std::size_t array_index = npos;   // npos for object members
    std::string field_name;
    bool        pending = true;       // no key/element seen yet at this level

    static PathElement object() {
        return PathElement{};
    }
    static PathElement array() {
        PathElement e;
        e.array_index = 0;
        return e;
    }
    static PathElement member(std::string key) {
        PathElement e;
        e.field_name = std::move(key);
        e.pending = false;
        return e;
    }
    static PathElement index(std::size_t i) {
        PathElement e;
        e.array_index = i;
        e.pending = false;
        return e;
    }

    bool is_array() const {
        return array_index != npos;
    }

    void advance() {
        if(pending) {
            pending = false;
        } else {
            ++array_index;
        }
    }

    void set_key(std::string key) {
        field_name = std::move(key);
        pending = false;
    }

    bool operator==(const PathElement &) const = default;
};

using PathStack = std::vector<PathElement>;

// Levels that have not seen a key or element yet render as empty strings
inline std::string JoinPath(const PathStack & stack, std::string_view separator) {
    std::string out;
    bool first = true;
    for(const PathElement & e : stack) {
        if(!first) {
            out += separator;
        }
        first = false;
        if(e.pending) {
            continue;
        }
        if(e.is_array()) {
            out += std::to_string(e.array_index);
        } else {
            out += e.field_name;
        }
    }
    return out;
}

/// "$.a.b[2]" rendering used in diagnostics.
inline std::string ToJsonPath(const PathStack & stack) {
    std::string jsonPath = "$";
    for(const PathElement & e : stack) {
        if(e.pending) {
            break;
        }
        if(e.is_array()) {
            jsonPath += "[" + std::to_string(e.array_index) + "]";
        } else {
            jsonPath += "." + e.field_name;
        }
    }
    return jsonPath;
}

} // namespace path
} // namespace JsonPipe
