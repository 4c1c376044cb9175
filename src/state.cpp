#include "glua/state.hpp"

#include "glua/log.hpp"
#include "heap.hpp"

#include <atomic>
#include <new>

namespace glua {

extern const char HEAP_REGISTRY_KEY = 0;

// lineage ids are unique for the lifetime of the process
static std::atomic<u64> next_lineage{1};

lua_heap::lua_heap(lua_State* L, u64 lineage, logger* log)
    : L{L}
    , lineage{lineage}
    , log{log} {
}

lua_heap::~lua_heap() {
    if (log != nullptr) {
        log->log_info("state", "closing lineage " + std::to_string(lineage));
    }
    lua_close(L);
}

void lua_heap::report(const lua_error& err) {
    if (log != nullptr) {
        log->log_failure(err);
    }
}

lua_heap* heap_from_registry(lua_State* L) {
    lua_rawgetp(L, LUA_REGISTRYINDEX, &HEAP_REGISTRY_KEY);
    auto res = static_cast<lua_heap*>(lua_touserdata(L, -1));
    lua_pop(L, 1);
    return res;
}

vm_state::vm_state(shared_ptr<lua_heap> heap, u64 gen)
    : heap{std::move(heap)}
    , gen{gen} {
}

vm_state::vm_state(vm_state&& other) noexcept
    : heap{std::move(other.heap)}
    , gen{other.gen} {
    other.gen = 0;
}

vm_state& vm_state::operator=(vm_state&& other) noexcept {
    if (this != &other) {
        heap = std::move(other.heap);
        gen = other.gen;
        other.gen = 0;
    }
    return *this;
}

vm_state::~vm_state() = default;

bool vm_state::valid() const {
    return heap != nullptr;
}

u64 vm_state::lineage() const {
    return heap ? heap->lineage : 0;
}

u64 vm_state::generation() const {
    return gen;
}

vm_state state_access::advance(vm_state&& state) {
    vm_state next = std::move(state);
    next.heap->current_gen = ++next.heap->last_gen;
    next.gen = next.heap->current_gen;
    return next;
}

optional<lua_error> state_access::check(const vm_state& state) {
    if (!state.heap) {
        return lua_error{stale_state{
            "the handle is empty; it was consumed by an earlier operation"}};
    }
    if (state.gen != state.heap->current_gen) {
        return lua_error{stale_state{"handle generation "
            + std::to_string(state.gen) + " is not the current generation "
            + std::to_string(state.heap->current_gen) + " of lineage "
            + std::to_string(state.heap->lineage)}};
    }
    return std::nullopt;
}

struct state_setup {
    lua_heap* heap;
    bool open_libs;
    // prepended to package.path, empty for none
    const string* package_prefix;
};

// Stack: pointer to a state_setup. Registers the heap and opens the
// standard libraries.
static int setup_state(lua_State* L) {
    auto setup = static_cast<const state_setup*>(lua_touserdata(L, 1));
    lua_pushlightuserdata(L, setup->heap);
    lua_rawsetp(L, LUA_REGISTRYINDEX, &HEAP_REGISTRY_KEY);
    if (!setup->open_libs) {
        return 0;
    }
    luaL_openlibs(L);
    auto& prefix = *setup->package_prefix;
    if (prefix.empty()) {
        return 0;
    }
    lua_getglobal(L, "package");
    if (!lua_istable(L, -1)) {
        return 0;
    }
    lua_pushlstring(L, prefix.data(), prefix.size());
    lua_getfield(L, -2, "path");
    if (!lua_isstring(L, -1)) {
        lua_pop(L, 1);
        lua_pushliteral(L, "");
    }
    lua_concat(L, 2);
    lua_setfield(L, -2, "path");
    return 0;
}

vm_state init(const vm_options& options) {
    // dir/?.lua and dir/?/init.lua for each directory, ahead of the default
    string prefix;
    for (auto& d : options.package_path) {
        prefix += d + "/?.lua;" + d + "/?/init.lua;";
    }

    lua_State* L = luaL_newstate();
    if (L == nullptr) {
        throw std::bad_alloc{};
    }
    shared_ptr<lua_heap> heap;
    try {
        heap = std::make_shared<lua_heap>(L, next_lineage++, options.log);
    } catch (...) {
        lua_close(L);
        throw;
    }

    // on failure the heap closes L on the way out
    state_setup setup{heap.get(), options.open_libs, &prefix};
    lua_pushcfunction(L, setup_state);
    lua_pushlightuserdata(L, &setup);
    if (lua_pcall(L, 1, 0, 0) != LUA_OK) {
        throw std::bad_alloc{};
    }

    if (options.log != nullptr) {
        options.log->log_info("state", "created lineage "
                + std::to_string(heap->lineage) + " (" LUA_RELEASE ")");
    }
    return state_access::fresh(heap);
}

}
