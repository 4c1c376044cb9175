#include "glua/path.hpp"

#include "heap.hpp"

namespace glua {

static void push_key(lua_State* L, const string& k) {
    lua_pushlstring(L, k.data(), k.size());
}

// Protected walk for get(). Stack: pointer to the key_path. Returns the
// resolved value followed by a boolean telling whether it was found.
static int walk_get(lua_State* L) {
    auto keys = static_cast<const key_path*>(lua_touserdata(L, 1));
    lua_pushglobaltable(L);
    for (auto& k : *keys) {
        if (!lua_istable(L, -1)) {
            lua_pushboolean(L, 0);
            return 2;
        }
        push_key(L, k);
        lua_gettable(L, -2);
        lua_remove(L, -2);
    }
    lua_pushboolean(L, !lua_isnil(L, -1));
    return 2;
}

struct path_write {
    const key_path* keys;
    const value* v;
};

// Protected walk for set(). Stack: pointer to a path_write. Returns nothing on
// success. If an existing intermediate is not a table, returns the 1-based
// index of its key without having written anything.
static int walk_set(lua_State* L) {
    auto w = static_cast<const path_write*>(lua_touserdata(L, 1));
    auto& keys = *w->keys;
    size_t n = keys.size();
    lua_pushglobaltable(L);

    // first pass: follow the part of the path that already exists
    size_t missing = n - 1;
    for (size_t i = 0; i + 1 < n; ++i) {
        push_key(L, keys[i]);
        lua_gettable(L, -2);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            missing = i;
            break;
        }
        if (!lua_istable(L, -1)) {
            lua_pushinteger(L, static_cast<lua_Integer>(i + 1));
            return 1;
        }
        lua_remove(L, -2);
    }

    // second pass: link a fresh table for each missing segment
    for (size_t i = missing; i + 1 < n; ++i) {
        lua_newtable(L);
        push_key(L, keys[i]);
        lua_pushvalue(L, -2);
        lua_settable(L, -4);
        lua_remove(L, -2);
    }

    push_key(L, keys[n - 1]);
    push_value(L, *w->v);
    lua_settable(L, -3);
    return 0;
}

// Resolve keys and leave the value on top of the stack
static optional<lua_error> resolve(const vm_state& state, const key_path& keys) {
    if (auto err = state_access::check(state)) {
        return err;
    }
    auto& heap = state_access::heap_of(state);
    if (keys.empty()) {
        return lua_error{invalid_path{"key path is empty"}};
    }

    auto L = heap->L;
    int base = lua_gettop(L);
    lua_pushcfunction(L, walk_get);
    lua_pushlightuserdata(L, const_cast<key_path*>(&keys));
    if (auto err = protected_call(L, base, 1)) {
        return err;
    }
    bool found = lua_toboolean(L, -1);
    lua_pop(L, 1);
    if (!found) {
        lua_settop(L, base);
        return lua_error{undefined_path{keys}};
    }
    return std::nullopt;
}

result<value> get(const vm_state& state, const key_path& keys) {
    if (auto err = resolve(state, keys)) {
        if (state.valid()) {
            state_access::heap_of(state)->report(*err);
        }
        return *err;
    }
    auto& heap = state_access::heap_of(state);
    auto res = read_value(heap, heap->L, -1);
    lua_pop(heap->L, 1);
    return res;
}

result<value_ref> ref_get(const vm_state& state, const key_path& keys) {
    if (auto err = resolve(state, keys)) {
        if (state.valid()) {
            state_access::heap_of(state)->report(*err);
        }
        return *err;
    }
    auto& heap = state_access::heap_of(state);
    auto res = read_ref(heap, heap->L, -1);
    lua_pop(heap->L, 1);
    return res;
}

result<vm_state> set(vm_state&& state, const key_path& keys, const value& v) {
    if (auto err = state_access::check(state)) {
        return *err;
    }
    auto& heap = state_access::heap_of(state);
    auto fail = [&heap](lua_error err) {
        heap->report(err);
        return err;
    };
    if (keys.empty()) {
        return fail(lua_error{invalid_path{"key path is empty"}});
    }
    if (auto err = check_value(*heap, v)) {
        return fail(*err);
    }

    auto L = heap->L;
    int base = lua_gettop(L);
    path_write w{&keys, &v};
    lua_pushcfunction(L, walk_set);
    lua_pushlightuserdata(L, &w);
    if (auto err = protected_call(L, base, 1)) {
        return fail(*err);
    }
    if (lua_gettop(L) > base) {
        auto i = static_cast<size_t>(lua_tointeger(L, -1));
        lua_settop(L, base);
        return fail(lua_error{path_collision{
            key_path{keys.begin(), keys.begin() + i}}});
    }
    return state_access::advance(std::move(state));
}

}
