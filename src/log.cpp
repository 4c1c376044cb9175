#include "glua/log.hpp"

namespace glua {

logger::logger(std::ostream* err_out, std::ostream* info_out)
    : err_out{err_out}
    , info_out{info_out} {
}

void logger::log_failure(const lua_error& err) {
    if (err.is<syntax_error>()) {
        log_error(err.as<syntax_error>().origin, err.subsystem(), err.describe());
    } else {
        log_error(err.subsystem(), err.describe());
    }
}

static void print_loc(std::ostream* out, const source_loc& origin) {
    (*out) << "line " << origin.line;
    if (origin.col != 0) {
        (*out) << ", col " << origin.col;
    }
    if (!origin.filename.empty()) {
        (*out) << " in " << origin.filename;
    }
}

static void print_entry(std::ostream* out,
        const char* level,
        const source_loc* origin,
        const string& subsystem,
        const string& message) {
    if (out == nullptr) {
        return;
    }
    (*out) << level << ' ' << subsystem;
    if (origin != nullptr) {
        (*out) << ": ";
        print_loc(out, *origin);
    }
    (*out) << ":\n\t" << message << '\n';
}

void logger::log_error(const source_loc& origin,
        const string& subsystem,
        const string& message) {
    print_entry(err_out, "[ERROR]", &origin, subsystem, message);
}

void logger::log_error(const string& subsystem,
        const string& message) {
    print_entry(err_out, "[ERROR]", nullptr, subsystem, message);
}

void logger::log_warning(const source_loc& origin,
        const string& subsystem,
        const string& message) {
    print_entry(err_out, "[WARNING]", &origin, subsystem, message);
}

void logger::log_warning(const string& subsystem,
        const string& message) {
    print_entry(err_out, "[WARNING]", nullptr, subsystem, message);
}

void logger::log_info(const source_loc& origin,
        const string& subsystem,
        const string& message) {
    print_entry(info_out, "[INFO]", &origin, subsystem, message);
}

void logger::log_info(const string& subsystem,
        const string& message) {
    print_entry(info_out, "[INFO]", nullptr, subsystem, message);
}

}
