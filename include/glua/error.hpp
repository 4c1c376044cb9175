// error.hpp -- classified failures and the result type returned by every
// fallible glua operation

#ifndef __GLUA_ERROR_HPP
#define __GLUA_ERROR_HPP

#include "glua/base.hpp"

#include <ostream>
#include <stdexcept>
#include <variant>

namespace glua {

// Lua rejected the source text at compile time
struct syntax_error {
    string message;
    source_loc origin;
};

// The guest raised an error while running. message is the guest payload,
// unchanged; traceback is the output of luaL_traceback at the raise point.
struct runtime_error {
    string message;
    string traceback;
};

// A key path did not resolve to a non-nil value
struct undefined_path {
    key_path keys;
};

// The caller passed a key path that can never be resolved (e.g. empty)
struct invalid_path {
    string reason;
};

// set() hit an existing non-table value partway down the path. keys ends with
// the offending segment.
struct path_collision {
    key_path keys;
};

struct decode_failure {
    string expected;
    string observed;
};

struct io_error {
    string path;
    string cause;
};

// The handle was consumed or outdated, or a value came from another lineage
struct stale_state {
    string reason;
};

// order matches the alternatives of lua_error::detail
enum error_kind {
    ek_syntax = 0,
    ek_runtime,
    ek_undefined_path,
    ek_invalid_path,
    ek_path_collision,
    ek_decode_failure,
    ek_io,
    ek_stale_state
};

const char* kind_name(error_kind kind);

class lua_error {
public:
    using detail_type = std::variant<syntax_error,
          runtime_error,
          undefined_path,
          invalid_path,
          path_collision,
          decode_failure,
          io_error,
          stale_state>;

    lua_error(syntax_error e) : detail{std::move(e)} { }
    lua_error(runtime_error e) : detail{std::move(e)} { }
    lua_error(undefined_path e) : detail{std::move(e)} { }
    lua_error(invalid_path e) : detail{std::move(e)} { }
    lua_error(path_collision e) : detail{std::move(e)} { }
    lua_error(decode_failure e) : detail{std::move(e)} { }
    lua_error(io_error e) : detail{std::move(e)} { }
    lua_error(stale_state e) : detail{std::move(e)} { }

    error_kind kind() const {
        return static_cast<error_kind>(detail.index());
    }

    template<typename T> bool is() const {
        return std::holds_alternative<T>(detail);
    }
    // throws std::bad_variant_access if the error is of another kind
    template<typename T> const T& as() const {
        return std::get<T>(detail);
    }

    const detail_type& get_detail() const {
        return detail;
    }

    // one line human readable description, prefixed with the kind name
    string describe() const;
    // name of the subsystem a failure of this kind is logged under
    const char* subsystem() const;

private:
    detail_type detail;
};

std::ostream& operator<<(std::ostream& out, const lua_error& err);

// Holds either a T or a lua_error. T may be move-only.
template<typename T>
class result {
public:
    typedef T value_type;

    result(T v) : data{std::in_place_index<0>, std::move(v)} { }
    result(lua_error e) : data{std::in_place_index<1>, std::move(e)} { }

    bool ok() const {
        return data.index() == 0;
    }
    explicit operator bool() const {
        return ok();
    }

    // access the held value. Throws std::logic_error on an error result.
    T& get() {
        check();
        return std::get<0>(data);
    }
    const T& get() const {
        check();
        return std::get<0>(data);
    }
    // move the held value out
    T take() {
        check();
        return std::move(std::get<0>(data));
    }

    const lua_error& error() const {
        if (ok()) {
            throw std::logic_error{"glua::result: no error in a successful result"};
        }
        return std::get<1>(data);
    }

private:
    std::variant<T, lua_error> data;

    void check() const {
        if (!ok()) {
            throw std::logic_error{"glua::result: " + std::get<1>(data).describe()};
        }
    }
};

}

#endif
