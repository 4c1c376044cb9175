// state.hpp -- the interpreter state handle threaded through every operation

#ifndef __GLUA_STATE_HPP
#define __GLUA_STATE_HPP

#include "glua/base.hpp"
#include "glua/error.hpp"

namespace glua {

class logger;
struct lua_heap;

struct vm_options {
    // open the Lua standard libraries (base, string, table, math, ...)
    bool open_libs = true;
    // directories searched by require(), ahead of the default package.path.
    // Ignored when open_libs is false.
    std::vector<string> package_path;
    // if non-null, must outlive every handle of the lineage
    logger* log = nullptr;
};

// An opaque handle to one snapshot of interpreter state.
//
// Handles are move-only. Operations that mutate the interpreter take the handle
// as vm_state&& and, on success, move out of it and return the successor. On
// failure the caller's handle is left in place and remains the latest one.
//
// Every handle produced from one init() belongs to the same lineage. Only the
// newest generation of a lineage is accepted by operations; an empty or
// outdated handle yields a stale_state error.
//
// A lineage must be used from one thread at a time.
class vm_state {
public:
    // an empty handle; no interpreter is attached
    vm_state() = default;
    vm_state(const vm_state&) = delete;
    vm_state& operator=(const vm_state&) = delete;
    vm_state(vm_state&& other) noexcept;
    vm_state& operator=(vm_state&& other) noexcept;
    ~vm_state();

    // false for empty and moved-from handles
    bool valid() const;
    // identifies the init() call this handle descends from. 0 if empty.
    u64 lineage() const;
    u64 generation() const;

private:
    shared_ptr<lua_heap> heap;
    u64 gen = 0;

    vm_state(shared_ptr<lua_heap> heap, u64 gen);
    friend struct state_access;
};

// A result paired with the successor state
template<typename T>
struct step {
    T out;
    vm_state state;
};

// create a fresh interpreter and start a new lineage
vm_state init(const vm_options& options = vm_options{});

}

#endif
