#include "glua/chunk.hpp"

#include "heap.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <new>
#include <sstream>

namespace glua {

namespace fs = std::filesystem;

chunk::chunk(string name, string code)
    : chunk_name{std::move(name)}
    , code{std::move(code)} {
}

// lua_dump writer. A nonzero return stops the dump.
static int write_chunk(lua_State*, const void* p, size_t sz, void* ud) {
    try {
        static_cast<string*>(ud)->append(static_cast<const char*>(p), sz);
    } catch (const std::bad_alloc&) {
        return 1;
    }
    return 0;
}

// read a source file into memory. A first line starting with # (e.g. a shebang)
// is commented out so that line numbers stay the same.
static result<string> read_source(const string& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return lua_error{io_error{path, "no such file"}};
    }
    if (fs::is_directory(status)) {
        return lua_error{io_error{path, "is a directory"}};
    }
    std::ifstream in{path, std::ios::binary};
    if (!in) {
        return lua_error{io_error{path, std::strerror(errno)}};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return lua_error{io_error{path, "read failed"}};
    }
    string src = ss.str();
    if (!src.empty() && src[0] == '#') {
        src.insert(0, "--");
    }
    return src;
}

// compile source as text and push the resulting function
static int compile(lua_State* L, const string& source, const string& name) {
    return luaL_loadbufferx(L, source.data(), source.size(), name.c_str(), "t");
}

// run the function on top of the stack, which sits just above base
static result<value_list> execute(const shared_ptr<lua_heap>& heap, int base) {
    if (auto err = protected_call(heap->L, base, 0)) {
        return *err;
    }
    return collect_results(heap, base);
}

static result<step<chunk>> load_named(vm_state&& state,
        const string& source,
        const string& name) {
    auto& heap = state_access::heap_of(state);
    auto L = heap->L;
    int status = compile(L, source, name);
    if (status != LUA_OK) {
        auto err = load_failure(L, status, name);
        heap->report(err);
        return err;
    }
    string code;
    int dumped = lua_dump(L, write_chunk, &code, 0);
    lua_pop(L, 1);
    if (dumped != 0) {
        lua_error err{runtime_error{"not enough memory", ""}};
        heap->report(err);
        return err;
    }
    return step<chunk>{chunk_access::make(name, std::move(code)),
        state_access::advance(std::move(state))};
}

static result<step<value_list>> run_named(vm_state&& state,
        const string& source,
        const string& name) {
    auto& heap = state_access::heap_of(state);
    auto L = heap->L;
    int base = lua_gettop(L);
    int status = compile(L, source, name);
    if (status != LUA_OK) {
        auto err = load_failure(L, status, name);
        heap->report(err);
        return err;
    }
    auto res = execute(heap, base);
    if (!res) {
        heap->report(res.error());
        return res.error();
    }
    return step<value_list>{res.take(), state_access::advance(std::move(state))};
}

result<step<chunk>> load(vm_state&& state, const string& source) {
    if (auto err = state_access::check(state)) {
        return *err;
    }
    return load_named(std::move(state), source, source);
}

result<step<chunk>> load_file(vm_state&& state, const string& path) {
    if (auto err = state_access::check(state)) {
        return *err;
    }
    auto src = read_source(path);
    if (!src) {
        state_access::heap_of(state)->report(src.error());
        return src.error();
    }
    return load_named(std::move(state), src.get(), "@" + path);
}

result<step<value_list>> run(vm_state&& state, const string& source) {
    if (auto err = state_access::check(state)) {
        return *err;
    }
    return run_named(std::move(state), source, source);
}

result<step<value_list>> run_chunk(vm_state&& state, const chunk& c) {
    if (auto err = state_access::check(state)) {
        return *err;
    }
    auto& heap = state_access::heap_of(state);
    auto L = heap->L;
    int base = lua_gettop(L);
    auto& code = chunk_access::code_of(c);
    int status = luaL_loadbufferx(L, code.data(), code.size(), c.name().c_str(), "b");
    if (status != LUA_OK) {
        auto err = load_failure(L, status, c.name());
        heap->report(err);
        return err;
    }
    auto res = execute(heap, base);
    if (!res) {
        heap->report(res.error());
        return res.error();
    }
    return step<value_list>{res.take(), state_access::advance(std::move(state))};
}

result<step<value_list>> run_file(vm_state&& state, const string& path) {
    if (auto err = state_access::check(state)) {
        return *err;
    }
    auto src = read_source(path);
    if (!src) {
        state_access::heap_of(state)->report(src.error());
        return src.error();
    }
    return run_named(std::move(state), src.get(), "@" + path);
}

}
