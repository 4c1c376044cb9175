// base.hpp -- common aliases and source locations for glua

#ifndef __GLUA_BASE_HPP
#define __GLUA_BASE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace glua {

/// aliases imported from std
template<class T> using optional = std::optional<T>;
using string = std::string;

template<class T> using shared_ptr = std::shared_ptr<T>;
template<class T> using weak_ptr = std::weak_ptr<T>;
template<class T> using unique_ptr = std::unique_ptr<T>;

/// integer/float typedefs by bitwidth
typedef uint8_t u8;
typedef uint32_t u32;
typedef uint64_t u64;

typedef int32_t i32;
typedef int64_t i64;

// Lua 5.4 integers and floats are 64 bits wide in the default configuration
static_assert(sizeof(double) == 8);
typedef double f64;

// an ordered sequence of table keys, resolved from the global environment
typedef std::vector<string> key_path;

// Used to track where a guest failure originated. An empty filename means the
// code came from a string rather than a file.
struct source_loc {
    string filename;
    int line = 0;
    int col = 0;
    bool operator==(const source_loc& other) const;
    bool operator!=(const source_loc& other) const;
};

// join a key path with dots for messages, e.g. "math.max"
string format_path(const key_path& keys);

}

#endif
