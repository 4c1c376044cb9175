// log.hpp -- diagnostics for interpreter lineages and the driver

#ifndef __GLUA_LOG_HPP
#define __GLUA_LOG_HPP

#include "glua/base.hpp"
#include "glua/error.hpp"

#include <ostream>

namespace glua {

// Writes tagged messages to two streams. Errors and warnings share err_out;
// info messages go to info_out. A null stream drops everything sent to it, so
// logger{&std::cerr, nullptr} is a quiet logger.
class logger {
private:
    std::ostream* err_out;
    std::ostream* info_out;

public:
    // the streams are not owned and must outlive the logger
    logger(std::ostream* err_out, std::ostream* info_out);

    // log a classified failure as an error under its subsystem. Syntax errors
    // carry their source location.
    void log_failure(const lua_error& err);

    void log_error(const source_loc& origin,
            const string& subsystem,
            const string& message);
    void log_error(const string& subsystem, const string& message);

    void log_warning(const string& subsystem, const string& message);
    void log_warning(const source_loc& origin,
            const string& subsystem,
            const string& message);

    void log_info(const string& subsystem, const string& message);
    void log_info(const source_loc& origin,
            const string& subsystem,
            const string& message);
};

}

#endif
