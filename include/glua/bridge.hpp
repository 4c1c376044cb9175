// bridge.hpp -- calling guest functions and exposing host closures to the
// guest

#ifndef __GLUA_BRIDGE_HPP
#define __GLUA_BRIDGE_HPP

#include "glua/base.hpp"
#include "glua/error.hpp"
#include "glua/state.hpp"
#include "glua/value.hpp"

#include <functional>

namespace glua {

// The calling convention for host closures. The closure receives the state as
// of the guest call and must return the newest state of the same lineage,
// including after any nested calls back into the guest.
//
// To fail, throw. The exception message is raised in the guest as a Lua error.
typedef std::function<step<value_list>(vm_state&&, value_list)> host_function;

// Wrap fn as a guest function value. Throws std::logic_error if state is empty
// or not the current handle of its lineage, and std::bad_alloc if the guest is
// out of memory.
step<value> expose(vm_state&& state, host_function fn);

// Call a guest value with args. Guest functions and exposed host closures are
// called the same way. Calling something that is not callable is a
// runtime_error.
result<step<value_list>> call(vm_state&& state,
        const value_ref& target,
        const value_list& args);

// ref_get() followed by call(). A path that does not resolve, or resolves to a
// value that is not callable, is an undefined_path error.
result<step<value_list>> call_by_name(vm_state&& state,
        const key_path& keys,
        const value_list& args);

}

#endif
