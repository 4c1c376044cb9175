#include "glua/codec.hpp"

#include "heap.hpp"

#include <cmath>
#include <new>

namespace glua {

step<value> encode_nil(vm_state&& state) {
    return step<value>{value{}, std::move(state)};
}

step<value> encode_bool(vm_state&& state, bool b) {
    return step<value>{value{b}, std::move(state)};
}

step<value> encode_int(vm_state&& state, i64 i) {
    return step<value>{value{i}, std::move(state)};
}

step<value> encode_float(vm_state&& state, f64 f) {
    return step<value>{value{f}, std::move(state)};
}

step<value> encode_string(vm_state&& state, const string& s) {
    return step<value>{value{s}, std::move(state)};
}

// Lua refuses nil and NaN as table keys
static optional<lua_error> check_key(const value& k) {
    if (k.is_nil()) {
        return lua_error{runtime_error{"table index is nil", ""}};
    }
    if (k.tag() == vt_float && std::isnan(k.as_float())) {
        return lua_error{runtime_error{"table index is NaN", ""}};
    }
    return std::nullopt;
}

using entry_list = std::vector<std::pair<value, value>>;

// Stack: pointer to an entry_list. Returns the new table.
static int build_table(lua_State* L) {
    auto entries = static_cast<const entry_list*>(lua_touserdata(L, 1));
    lua_createtable(L, 0, static_cast<int>(entries->size()));
    for (auto& e : *entries) {
        push_value(L, e.first);
        push_value(L, e.second);
        lua_rawset(L, -3);
    }
    return 1;
}

result<step<value>> table(vm_state&& state,
        const std::vector<std::pair<value, value>>& entries) {
    if (auto err = state_access::check(state)) {
        return *err;
    }
    auto& heap = state_access::heap_of(state);
    for (auto& e : entries) {
        auto err = check_key(e.first);
        if (!err) {
            err = check_value(*heap, e.first);
        }
        if (!err) {
            err = check_value(*heap, e.second);
        }
        if (err) {
            heap->report(*err);
            return *err;
        }
    }

    auto L = heap->L;
    int base = lua_gettop(L);
    lua_pushcfunction(L, build_table);
    lua_pushlightuserdata(L, const_cast<entry_list*>(&entries));
    if (auto err = protected_call(L, base, 1)) {
        heap->report(*err);
        return *err;
    }
    auto res = read_value(heap, L, -1);
    lua_settop(L, base);
    return step<value>{std::move(res), state_access::advance(std::move(state))};
}

static lua_error mismatch(const char* expected, const value& v) {
    return lua_error{decode_failure{expected, tag_name(v.tag())}};
}

result<std::monostate> decode_nil(const value& v) {
    if (!v.is_nil()) {
        return mismatch("nil", v);
    }
    return std::monostate{};
}

result<bool> decode_bool(const value& v) {
    if (v.tag() != vt_bool) {
        return mismatch("boolean", v);
    }
    return v.as_bool();
}

result<i64> decode_int(const value& v) {
    if (v.tag() != vt_int) {
        return mismatch("integer", v);
    }
    return v.as_int();
}

result<f64> decode_float(const value& v) {
    if (v.tag() != vt_float) {
        return mismatch("float", v);
    }
    return v.as_float();
}

result<string> decode_string(const value& v) {
    if (v.tag() != vt_string) {
        return mismatch("string", v);
    }
    return v.as_string();
}

result<value_ref> decode_ref(const value& v) {
    auto& g = v.guest();
    if (!g) {
        return mismatch("ref", v);
    }
    return value_access::make_ref(g);
}

result<std::vector<std::pair<value, value>>> table_entries(const value& v) {
    if (v.tag() != vt_table) {
        return mismatch("table", v);
    }
    auto heap = v.guest()->heap.lock();
    if (!heap) {
        return lua_error{stale_state{
            "the lineage of a table has been discarded"}};
    }

    auto L = heap->L;
    int base = lua_gettop(L);
    entry_list res;
    lua_rawgeti(L, LUA_REGISTRYINDEX, v.guest()->slot);
    lua_pushnil(L);
    try {
        while (lua_next(L, -2) != 0) {
            auto key = read_value(heap, L, -2);
            res.emplace_back(std::move(key), read_value(heap, L, -1));
            lua_pop(L, 1);
        }
    } catch (const std::bad_alloc&) {
        lua_settop(L, base);
        throw;
    }
    lua_settop(L, base);
    return res;
}

}
