#include "glua/bridge.hpp"

#include "glua/log.hpp"
#include "heap.hpp"

#include <new>
#include <stdexcept>

namespace glua {

// a host_function stored in a Lua full userdata
struct host_closure_box {
    host_function fn;
};

static const char* HOST_CLOSURE_META = "glua.host_function";

static int collect_box(lua_State* L) {
    auto box = static_cast<host_closure_box*>(lua_touserdata(L, 1));
    box->~host_closure_box();
    return 0;
}

// Stack: pointer to a value_list. Pushes every value in it.
static int push_results(lua_State* L) {
    auto out = static_cast<const value_list*>(lua_touserdata(L, 1));
    luaL_checkstack(L, static_cast<int>(out->size()), "too many results");
    for (auto& v : *out) {
        push_value(L, v);
    }
    return static_cast<int>(out->size());
}

// Stack: pointer to a string. Pushes a copy of it.
static int push_message(lua_State* L) {
    auto msg = static_cast<const string*>(lua_touserdata(L, 1));
    lua_pushlstring(L, msg->data(), msg->size());
    return 1;
}

// Run the boxed host function against the arguments on the stack of L, which
// is the calling thread and may be a coroutine. Returns the number of results
// pushed, or -1 with an error message pushed. Nothing with a destructor is
// alive in the caller when it raises that message.
static int invoke_host(lua_State* L) {
    auto box = static_cast<host_closure_box*>(lua_touserdata(L, lua_upvalueindex(1)));
    string failure;
    {
        // null once the last handle is gone and lua_close() is running
        // finalizers
        auto heap = heap_from_registry(L)->weak_from_this().lock();
        if (!heap) {
            failure = "host function called while its lineage is closing";
        } else {
            // the closure works on a handle of its own. Whatever it hands
            // back, the handle of the operation that called into the guest
            // stays current.
            u64 saved = heap->current_gen;
            try {
                int nargs = lua_gettop(L);
                value_list args;
                args.reserve(nargs);
                for (int i = 1; i <= nargs; ++i) {
                    args.push_back(read_value(heap, L, i));
                }

                auto out = box->fn(state_access::fresh(heap), std::move(args));
                optional<lua_error> err;
                if (out.state.valid() && state_access::heap_of(out.state) != heap) {
                    err = lua_error{stale_state{"host function returned a state of lineage "
                        + std::to_string(out.state.lineage()) + " instead of "
                        + std::to_string(heap->lineage)}};
                }
                if (!err) {
                    err = state_access::check(out.state);
                }
                if (!err) {
                    err = check_values(*heap, out.out);
                }
                if (!err) {
                    int top = lua_gettop(L);
                    lua_pushcfunction(L, push_results);
                    lua_pushlightuserdata(L, &out.out);
                    if (lua_pcall(L, 1, LUA_MULTRET, 0) == LUA_OK) {
                        heap->current_gen = saved;
                        return lua_gettop(L) - top;
                    }
                    const char* msg = lua_tostring(L, -1);
                    failure = msg ? msg : "could not push host function results";
                    lua_settop(L, top);
                } else {
                    failure = err->describe();
                }
            } catch (const std::exception& e) {
                failure = e.what();
            } catch (...) {
                failure = "host function threw a non-standard exception";
            }
            heap->current_gen = saved;
            if (heap->log != nullptr) {
                heap->log->log_warning("call", "host function failed: " + failure);
            }
        }
    }
    lua_pushcfunction(L, push_message);
    lua_pushlightuserdata(L, &failure);
    // if the copy fails, Lua's memory error message is raised in its place
    int status = lua_pcall(L, 1, 1, 0);
    static_cast<void>(status);
    return -1;
}

static int host_trampoline(lua_State* L) {
    int n = invoke_host(L);
    if (n < 0) {
        return ::lua_error(L);
    }
    return n;
}

// Stack: pointer to the host_function to take. Returns the guest closure.
static int make_host_closure(lua_State* L) {
    auto fn = static_cast<host_function*>(lua_touserdata(L, 1));
    if (luaL_newmetatable(L, HOST_CLOSURE_META)) {
        lua_pushcfunction(L, collect_box);
        lua_setfield(L, -2, "__gc");
    }
    // once constructed, the box is only released by its __gc
    void* mem = lua_newuserdatauv(L, sizeof(host_closure_box), 0);
    new (mem) host_closure_box{std::move(*fn)};
    lua_insert(L, -2);
    lua_setmetatable(L, -2);
    lua_pushcclosure(L, host_trampoline, 1);
    return 1;
}

step<value> expose(vm_state&& state, host_function fn) {
    if (auto err = state_access::check(state)) {
        throw std::logic_error{"glua::expose: " + err->describe()};
    }
    auto& heap = state_access::heap_of(state);
    auto L = heap->L;

    int base = lua_gettop(L);
    lua_pushcfunction(L, make_host_closure);
    lua_pushlightuserdata(L, &fn);
    if (auto err = protected_call(L, base, 1)) {
        heap->report(*err);
        throw std::bad_alloc{};
    }
    auto res = read_value(heap, L, -1);
    lua_settop(L, base);
    return step<value>{std::move(res), state_access::advance(std::move(state))};
}

struct call_frame {
    // registry slot of the target
    int slot;
    const value_list* args;
};

// Stack: pointer to a call_frame. Calls the target and returns its results.
static int call_target(lua_State* L) {
    auto frame = static_cast<const call_frame*>(lua_touserdata(L, 1));
    int nargs = static_cast<int>(frame->args->size());
    luaL_checkstack(L, nargs + 1, "too many arguments");
    lua_rawgeti(L, LUA_REGISTRYINDEX, frame->slot);
    for (auto& v : *frame->args) {
        push_value(L, v);
    }
    lua_call(L, nargs, LUA_MULTRET);
    return lua_gettop(L) - 1;
}

result<step<value_list>> call(vm_state&& state,
        const value_ref& target,
        const value_list& args) {
    if (auto err = state_access::check(state)) {
        return *err;
    }
    auto& heap = state_access::heap_of(state);
    auto fail = [&heap](lua_error err) {
        heap->report(err);
        return err;
    };
    auto& g = value_access::ref_of(target);
    if (g->lineage != heap->lineage) {
        return fail(lua_error{stale_state{"a "
            + string{tag_name(g->tag)} + " from lineage "
            + std::to_string(g->lineage) + " was called with lineage "
            + std::to_string(heap->lineage)}});
    }
    if (auto err = check_values(*heap, args)) {
        return fail(*err);
    }

    auto L = heap->L;
    int base = lua_gettop(L);
    call_frame frame{g->slot, &args};
    lua_pushcfunction(L, call_target);
    lua_pushlightuserdata(L, &frame);
    if (auto err = protected_call(L, base, 1)) {
        return fail(*err);
    }
    auto out = collect_results(heap, base);
    return step<value_list>{std::move(out), state_access::advance(std::move(state))};
}

// Stack: the target. Returns true for functions and anything with a __call
// metamethod.
static int check_callable(lua_State* L) {
    bool res = lua_isfunction(L, 1)
        || luaL_getmetafield(L, 1, "__call") != LUA_TNIL;
    lua_pushboolean(L, res);
    return 1;
}

static result<bool> is_callable(lua_State* L, const value_ref& target) {
    if (target.tag() == vt_function) {
        return true;
    }
    int base = lua_gettop(L);
    lua_pushcfunction(L, check_callable);
    lua_rawgeti(L, LUA_REGISTRYINDEX, value_access::ref_of(target)->slot);
    if (auto err = protected_call(L, base, 1)) {
        return *err;
    }
    bool res = lua_toboolean(L, -1);
    lua_settop(L, base);
    return res;
}

result<step<value_list>> call_by_name(vm_state&& state,
        const key_path& keys,
        const value_list& args) {
    auto target = ref_get(state, keys);
    if (!target) {
        return target.error();
    }
    auto& heap = state_access::heap_of(state);
    auto callable = is_callable(heap->L, target.get());
    if (!callable) {
        heap->report(callable.error());
        return callable.error();
    }
    if (!callable.get()) {
        lua_error err{undefined_path{keys}};
        heap->report(err);
        return err;
    }
    return call(std::move(state), target.get(), args);
}

}
