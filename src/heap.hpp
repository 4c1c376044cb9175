// heap.hpp -- internal glue between glua handles and the Lua C API. Not
// installed; only the library sources include this.

#ifndef __GLUA_HEAP_HPP
#define __GLUA_HEAP_HPP

#include "glua/base.hpp"
#include "glua/chunk.hpp"
#include "glua/error.hpp"
#include "glua/state.hpp"
#include "glua/value.hpp"

extern "C" {
#include <lua.h>
#include <lauxlib.h>
#include <lualib.h>
}

namespace glua {

class logger;

// One Lua interpreter. Every handle of a lineage shares the same heap; the Lua
// state is closed when the last handle is destroyed.
struct lua_heap : std::enable_shared_from_this<lua_heap> {
    lua_State* L;
    u64 lineage;
    // generation of the one handle operations currently accept
    u64 current_gen = 0;
    // highest generation handed out so far; never reused
    u64 last_gen = 0;
    logger* log;

    lua_heap(lua_State* L, u64 lineage, logger* log);
    ~lua_heap();
    lua_heap(const lua_heap&) = delete;
    lua_heap& operator=(const lua_heap&) = delete;

    // log a classified failure, if logging is enabled
    void report(const lua_error& err);
};

struct guest_ref {
    weak_ptr<lua_heap> heap;
    u64 lineage;
    // slot in LUA_REGISTRYINDEX
    int slot;
    value_tag tag;

    guest_ref(const shared_ptr<lua_heap>& heap, int slot, value_tag tag);
    ~guest_ref();
    guest_ref(const guest_ref&) = delete;
    guest_ref& operator=(const guest_ref&) = delete;
};

struct state_access {
    static const shared_ptr<lua_heap>& heap_of(const vm_state& state) {
        return state.heap;
    }
    // a handle with a brand new generation, which becomes the current one
    static vm_state fresh(const shared_ptr<lua_heap>& heap) {
        heap->current_gen = ++heap->last_gen;
        return vm_state{heap, heap->current_gen};
    }
    // consume state and return its successor
    static vm_state advance(vm_state&& state);
    // nullopt if the handle may be used, otherwise the reason it may not
    static optional<lua_error> check(const vm_state& state);
};

struct value_access {
    static value make(shared_ptr<const guest_ref> ref) {
        return value{std::move(ref)};
    }
    static value_ref make_ref(shared_ptr<const guest_ref> ref) {
        return value_ref{std::move(ref)};
    }
    static const shared_ptr<const guest_ref>& ref_of(const value_ref& r) {
        return r.ref;
    }
};

struct chunk_access {
    static chunk make(string name, string code) {
        return chunk{std::move(name), std::move(code)};
    }
    static const string& code_of(const chunk& c) {
        return c.code;
    }
};

// Check that v can be pushed into heap: guest objects must belong to the same,
// still living, lineage.
optional<lua_error> check_value(const lua_heap& heap, const value& v);
optional<lua_error> check_values(const lua_heap& heap, const value_list& vs);

// Push v onto the stack of L, which may be any thread of the lineage. v must
// have passed check_value(). Strings allocate, so outside of a C function
// this must run in protected mode.
void push_value(lua_State* L, const value& v);
// Convert the value at stack index idx of thread L, which may be a coroutine
// of the heap's main thread. Guest objects are pinned in the registry; nothing
// is popped. Throws std::bad_alloc if the registry cannot grow.
value read_value(const shared_ptr<lua_heap>& heap, lua_State* L, int idx);
// pin the value at idx of L, whatever its type, as a reference
value_ref read_ref(const shared_ptr<lua_heap>& heap, lua_State* L, int idx);
value_tag guest_tag(lua_State* L, int idx);

// Call the function below nargs arguments on the stack in protected mode with
// a traceback handler. On success the results are left on the stack above
// base, where base is the stack top before the function was pushed. On
// failure the stack is restored to base and a runtime_error is returned.
optional<lua_error> protected_call(lua_State* L, int base, int nargs);

// pop every value above base into a list
value_list collect_results(const shared_ptr<lua_heap>& heap, int base);

// turn a failed load of the chunk called chunk_name (the message is on top of
// the stack) into a lua_error and pop the message
lua_error load_failure(lua_State* L, int status, const string& chunk_name);

// registry key under which each Lua state stores its lua_heap*
extern const char HEAP_REGISTRY_KEY;
lua_heap* heap_from_registry(lua_State* L);

}

#endif
