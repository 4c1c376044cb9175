// path.hpp -- reading and writing nested table paths from the global
// environment

#ifndef __GLUA_PATH_HPP
#define __GLUA_PATH_HPP

#include "glua/base.hpp"
#include "glua/error.hpp"
#include "glua/state.hpp"
#include "glua/value.hpp"

namespace glua {

// Resolve keys left to right starting at the global table. __index
// metamethods are honoured. An absent or non-table intermediate, or a nil final
// value, is an undefined_path error; an empty path is invalid_path.
result<value> get(const vm_state& state, const key_path& keys);

// like get(), but the result is left undecoded
result<value_ref> ref_get(const vm_state& state, const key_path& keys);

// Assign v at keys, creating empty tables for missing intermediate segments.
// If an existing intermediate is not a table, fails with path_collision and
// writes nothing.
result<vm_state> set(vm_state&& state, const key_path& keys, const value& v);

}

#endif
