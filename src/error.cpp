#include "glua/error.hpp"

#include <sstream>

namespace glua {

const char* kind_name(error_kind kind) {
    switch (kind) {
    case ek_syntax:
        return "syntax error";
    case ek_runtime:
        return "runtime error";
    case ek_undefined_path:
        return "undefined path";
    case ek_invalid_path:
        return "invalid path";
    case ek_path_collision:
        return "path collision";
    case ek_decode_failure:
        return "decode failure";
    case ek_io:
        return "I/O error";
    case ek_stale_state:
        return "stale state";
    }
    return "unknown error";
}

string lua_error::describe() const {
    std::ostringstream ss;
    ss << kind_name(kind()) << ": ";
    switch (kind()) {
    case ek_syntax: {
        auto& e = as<syntax_error>();
        ss << e.message;
        break;
    }
    case ek_runtime:
        ss << as<runtime_error>().message;
        break;
    case ek_undefined_path:
        ss << format_path(as<undefined_path>().keys) << " is not defined";
        break;
    case ek_invalid_path:
        ss << as<invalid_path>().reason;
        break;
    case ek_path_collision:
        ss << format_path(as<path_collision>().keys) << " is not a table";
        break;
    case ek_decode_failure: {
        auto& e = as<decode_failure>();
        ss << "expected " << e.expected << ", got " << e.observed;
        break;
    }
    case ek_io: {
        auto& e = as<io_error>();
        ss << e.path << ": " << e.cause;
        break;
    }
    case ek_stale_state:
        ss << as<stale_state>().reason;
        break;
    }
    return ss.str();
}

const char* lua_error::subsystem() const {
    switch (kind()) {
    case ek_syntax:
    case ek_runtime:
        return "run";
    case ek_undefined_path:
    case ek_invalid_path:
    case ek_path_collision:
        return "path";
    case ek_decode_failure:
        return "codec";
    case ek_io:
        return "io";
    case ek_stale_state:
        return "state";
    }
    return "glua";
}

std::ostream& operator<<(std::ostream& out, const lua_error& err) {
    out << err.describe();
    if (err.is<runtime_error>() && !err.as<runtime_error>().traceback.empty()) {
        out << '\n' << err.as<runtime_error>().traceback;
    }
    return out;
}

}
