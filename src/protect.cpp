// protect.cpp -- running guest code in protected mode and classifying what
// comes back

#include "heap.hpp"

#include <cctype>
#include <cstring>
#include <new>

namespace glua {

// Message handler for lua_pcall. Replaces the error object with the table
// {message, traceback}. The message is the guest's string unchanged.
static int message_handler(lua_State* L) {
    const char* msg = lua_tostring(L, 1);
    if (msg == nullptr) {
        if (luaL_callmeta(L, 1, "__tostring") && lua_type(L, -1) == LUA_TSTRING) {
            msg = lua_tostring(L, -1);
        } else {
            msg = lua_pushfstring(L, "(error object is a %s value)",
                    luaL_typename(L, 1));
        }
    }
    lua_createtable(L, 2, 0);
    lua_pushstring(L, msg);
    lua_rawseti(L, -2, 1);
    luaL_traceback(L, L, nullptr, 1);
    lua_rawseti(L, -2, 2);
    return 1;
}

static string field_string(lua_State* L, int table_idx, int n) {
    lua_rawgeti(L, table_idx, n);
    size_t len = 0;
    const char* s = lua_tolstring(L, -1, &len);
    string res = s ? string{s, len} : string{};
    lua_pop(L, 1);
    return res;
}

optional<lua_error> protected_call(lua_State* L, int base, int nargs) {
    lua_pushcfunction(L, message_handler);
    lua_insert(L, base + 1);
    int status = lua_pcall(L, nargs, LUA_MULTRET, base + 1);
    if (status == LUA_OK) {
        lua_remove(L, base + 1);
        return std::nullopt;
    }

    runtime_error err;
    if (lua_istable(L, -1)) {
        err.message = field_string(L, lua_gettop(L), 1);
        err.traceback = field_string(L, lua_gettop(L), 2);
    } else {
        // memory and handler errors bypass the message handler
        const char* s = lua_tostring(L, -1);
        err.message = s ? s : "error in error handling";
    }
    lua_settop(L, base);
    return lua_error{std::move(err)};
}

value_list collect_results(const shared_ptr<lua_heap>& heap, int base) {
    auto L = heap->L;
    int top = lua_gettop(L);
    value_list res;
    res.reserve(top - base);
    try {
        for (int i = base + 1; i <= top; ++i) {
            res.push_back(read_value(heap, L, i));
        }
    } catch (const std::bad_alloc&) {
        lua_settop(L, base);
        throw;
    }
    lua_settop(L, base);
    return res;
}

// Length of the id Lua gives a chunk loaded from a string: [string "..."] with
// the source cut at its first newline or once it gets too long
static size_t string_chunk_id_length(const string& name) {
    const size_t pre = 9;    // [string "
    const size_t dots = 3;   // ...
    const size_t post = 2;   // "]
    size_t avail = LUA_IDSIZE - (pre + dots + post) - 1;
    // Lua sees the name as a C string
    size_t len = std::strlen(name.c_str());
    size_t nl = name.find('\n');
    if (len < avail && nl == string::npos) {
        return pre + len + post;
    }
    if (nl != string::npos && nl < len) {
        len = nl;
    }
    if (len > avail) {
        len = avail;
    }
    return pre + len + dots + post;
}

// Read ":N:" starting at msg[i]. On success sets line and returns true.
static bool line_at(const string& msg, size_t i, int& line) {
    if (i >= msg.size() || msg[i] != ':') {
        return false;
    }
    auto j = i + 1;
    while (j < msg.size() && std::isdigit(static_cast<unsigned char>(msg[j]))) {
        ++j;
    }
    if (j == i + 1 || j >= msg.size() || msg[j] != ':') {
        return false;
    }
    line = std::stoi(msg.substr(i + 1, j - i - 1));
    return true;
}

// Lua prefixes compile errors with "chunkid:line:". For a string chunk the id
// quotes the source, which may itself contain anything, so its length is
// worked out from the chunk name instead of searched for. Those get an empty
// filename.
static source_loc parse_location(const string& msg, const string& chunk_name) {
    source_loc loc;
    bool from_string = chunk_name.empty()
        || (chunk_name[0] != '=' && chunk_name[0] != '@');
    if (from_string) {
        line_at(msg, string_chunk_id_length(chunk_name), loc.line);
        return loc;
    }
    for (auto i = msg.find(':'); i != string::npos; i = msg.find(':', i + 1)) {
        if (line_at(msg, i, loc.line)) {
            loc.filename = msg.substr(0, i);
            return loc;
        }
    }
    return loc;
}

lua_error load_failure(lua_State* L, int status, const string& chunk_name) {
    size_t len = 0;
    const char* s = lua_tolstring(L, -1, &len);
    string msg = s ? string{s, len} : string{"unknown load failure"};
    lua_pop(L, 1);
    if (status == LUA_ERRSYNTAX) {
        return lua_error{syntax_error{msg, parse_location(msg, chunk_name)}};
    }
    return lua_error{runtime_error{msg, ""}};
}

}
