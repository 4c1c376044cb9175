#include "glua/value.hpp"

#include "heap.hpp"

#include <iomanip>
#include <new>
#include <sstream>

namespace glua {

const char* tag_name(value_tag tag) {
    switch (tag) {
    case vt_nil:
        return "nil";
    case vt_bool:
        return "boolean";
    case vt_int:
        return "integer";
    case vt_float:
        return "float";
    case vt_string:
        return "string";
    case vt_table:
        return "table";
    case vt_function:
        return "function";
    case vt_ref:
        return "ref";
    }
    return "unknown";
}

guest_ref::guest_ref(const shared_ptr<lua_heap>& heap, int slot, value_tag tag)
    : heap{heap}
    , lineage{heap->lineage}
    , slot{slot}
    , tag{tag} {
}

guest_ref::~guest_ref() {
    // once the lineage is gone the registry went with it
    if (auto h = heap.lock()) {
        luaL_unref(h->L, LUA_REGISTRYINDEX, slot);
    }
}

value::value(bool b) : data{b} { }
value::value(int i) : data{static_cast<i64>(i)} { }
value::value(i64 i) : data{i} { }
value::value(f64 f) : data{f} { }
value::value(const string& s) : data{s} { }
value::value(string&& s) : data{std::move(s)} { }
value::value(const char* s) : data{string{s}} { }
value::value(shared_ptr<const guest_ref> ref) : data{std::move(ref)} { }

value_tag value::tag() const {
    switch (data.index()) {
    case 0:
        return vt_nil;
    case 1:
        return vt_bool;
    case 2:
        return vt_int;
    case 3:
        return vt_float;
    case 4:
        return vt_string;
    default:
        return std::get<5>(data)->tag;
    }
}

bool value::as_bool() const {
    return std::get<bool>(data);
}

i64 value::as_int() const {
    return std::get<i64>(data);
}

f64 value::as_float() const {
    return std::get<f64>(data);
}

const string& value::as_string() const {
    return std::get<string>(data);
}

const shared_ptr<const guest_ref>& value::guest() const {
    static const shared_ptr<const guest_ref> none;
    if (auto p = std::get_if<shared_ptr<const guest_ref>>(&data)) {
        return *p;
    }
    return none;
}

// compare two pinned guest objects by identity
static bool same_guest(const guest_ref& a, const guest_ref& b) {
    if (&a == &b) {
        return true;
    }
    if (a.lineage != b.lineage) {
        return false;
    }
    auto h = a.heap.lock();
    if (!h) {
        return a.slot == b.slot;
    }
    lua_rawgeti(h->L, LUA_REGISTRYINDEX, a.slot);
    lua_rawgeti(h->L, LUA_REGISTRYINDEX, b.slot);
    bool res = lua_rawequal(h->L, -1, -2);
    lua_pop(h->L, 2);
    return res;
}

bool value::operator==(const value& other) const {
    if (data.index() != other.data.index()) {
        return false;
    }
    if (auto p = std::get_if<shared_ptr<const guest_ref>>(&data)) {
        return same_guest(**p, *other.guest());
    }
    return data == other.data;
}

value_ref::value_ref(shared_ptr<const guest_ref> ref) : ref{std::move(ref)} { }

value_tag value_ref::tag() const {
    return ref->tag;
}

u64 value_ref::lineage() const {
    return ref->lineage;
}

bool value_ref::alive() const {
    return !ref->heap.expired();
}

string to_string(const value& v, bool quote_strings) {
    std::ostringstream ss;
    switch (v.tag()) {
    case vt_nil:
        ss << "nil";
        break;
    case vt_bool:
        ss << (v.as_bool() ? "true" : "false");
        break;
    case vt_int:
        ss << v.as_int();
        break;
    case vt_float:
        // match Lua's "%.14g" and keep a trailing .0 for integral floats
        ss << std::setprecision(14) << v.as_float();
        if (ss.str().find_first_of(".eEni") == string::npos) {
            ss << ".0";
        }
        break;
    case vt_string:
        if (quote_strings) {
            ss << std::quoted(v.as_string());
        } else {
            ss << v.as_string();
        }
        break;
    default:
        ss << tag_name(v.tag()) << ": #" << v.guest()->slot;
        break;
    }
    return ss.str();
}

std::ostream& operator<<(std::ostream& out, const value& v) {
    return out << to_string(v, true);
}

value_tag guest_tag(lua_State* L, int idx) {
    switch (lua_type(L, idx)) {
    case LUA_TNIL:
    case LUA_TNONE:
        return vt_nil;
    case LUA_TBOOLEAN:
        return vt_bool;
    case LUA_TNUMBER:
        return lua_isinteger(L, idx) ? vt_int : vt_float;
    case LUA_TSTRING:
        return vt_string;
    case LUA_TTABLE:
        return vt_table;
    case LUA_TFUNCTION:
        return vt_function;
    default:
        return vt_ref;
    }
}

// Stack: any value. Moves it into the registry and returns the slot.
static int ref_top(lua_State* L) {
    lua_pushinteger(L, luaL_ref(L, LUA_REGISTRYINDEX));
    return 1;
}

// pin the value at idx of thread L in the registry
static shared_ptr<const guest_ref> pin(const shared_ptr<lua_heap>& heap,
        lua_State* L,
        int idx,
        value_tag tag) {
    if (!lua_checkstack(L, 2)) {
        throw std::bad_alloc{};
    }
    lua_pushcfunction(L, ref_top);
    lua_pushvalue(L, idx);
    if (lua_pcall(L, 1, 1, 0) != LUA_OK) {
        lua_pop(L, 1);
        throw std::bad_alloc{};
    }
    int slot = static_cast<int>(lua_tointeger(L, -1));
    lua_pop(L, 1);
    try {
        return std::make_shared<const guest_ref>(heap, slot, tag);
    } catch (const std::bad_alloc&) {
        luaL_unref(L, LUA_REGISTRYINDEX, slot);
        throw;
    }
}

value read_value(const shared_ptr<lua_heap>& heap, lua_State* L, int idx) {
    idx = lua_absindex(L, idx);
    auto tag = guest_tag(L, idx);
    switch (tag) {
    case vt_nil:
        return value{};
    case vt_bool:
        return value{static_cast<bool>(lua_toboolean(L, idx))};
    case vt_int:
        return value{static_cast<i64>(lua_tointeger(L, idx))};
    case vt_float:
        return value{static_cast<f64>(lua_tonumber(L, idx))};
    case vt_string: {
        size_t len;
        const char* s = lua_tolstring(L, idx, &len);
        return value{string{s, len}};
    }
    default:
        return value_access::make(pin(heap, L, idx, tag));
    }
}

value_ref read_ref(const shared_ptr<lua_heap>& heap, lua_State* L, int idx) {
    idx = lua_absindex(L, idx);
    return value_access::make_ref(pin(heap, L, idx, guest_tag(L, idx)));
}

optional<lua_error> check_value(const lua_heap& heap, const value& v) {
    auto& g = v.guest();
    if (!g) {
        return std::nullopt;
    }
    if (g->lineage != heap.lineage) {
        return lua_error{stale_state{"a " + string{tag_name(g->tag)}
            + " from lineage " + std::to_string(g->lineage)
            + " was used with lineage " + std::to_string(heap.lineage)}};
    }
    if (g->heap.expired()) {
        return lua_error{stale_state{"the lineage of a "
            + string{tag_name(g->tag)} + " has been discarded"}};
    }
    return std::nullopt;
}

optional<lua_error> check_values(const lua_heap& heap, const value_list& vs) {
    for (auto& v : vs) {
        if (auto err = check_value(heap, v)) {
            return err;
        }
    }
    return std::nullopt;
}

void push_value(lua_State* L, const value& v) {
    switch (v.tag()) {
    case vt_nil:
        lua_pushnil(L);
        break;
    case vt_bool:
        lua_pushboolean(L, v.as_bool());
        break;
    case vt_int:
        lua_pushinteger(L, static_cast<lua_Integer>(v.as_int()));
        break;
    case vt_float:
        lua_pushnumber(L, static_cast<lua_Number>(v.as_float()));
        break;
    case vt_string:
        lua_pushlstring(L, v.as_string().data(), v.as_string().size());
        break;
    default:
        lua_rawgeti(L, LUA_REGISTRYINDEX, v.guest()->slot);
        break;
    }
}

}
