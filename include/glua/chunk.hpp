// chunk.hpp -- compiling and running guest source

#ifndef __GLUA_CHUNK_HPP
#define __GLUA_CHUNK_HPP

#include "glua/base.hpp"
#include "glua/error.hpp"
#include "glua/state.hpp"
#include "glua/value.hpp"

namespace glua {

// A compiled unit of guest code that has not been run. Chunks hold Lua
// bytecode rather than a guest object, so one chunk can be run any number of
// times against any state.
class chunk {
public:
    // the name Lua uses for this chunk in messages and tracebacks
    const string& name() const {
        return chunk_name;
    }
    // size of the compiled code in bytes
    size_t size() const {
        return code.size();
    }

private:
    string chunk_name;
    string code;

    chunk(string name, string code);
    friend struct chunk_access;
};

// compile source without running it
result<step<chunk>> load(vm_state&& state, const string& source);
// read and compile a file. A first line starting with # is skipped.
result<step<chunk>> load_file(vm_state&& state, const string& path);

// compile and run source, returning every value it returns
result<step<value_list>> run(vm_state&& state, const string& source);
result<step<value_list>> run_chunk(vm_state&& state, const chunk& c);
result<step<value_list>> run_file(vm_state&& state, const string& path);

}

#endif
