// glua.hpp -- everything needed to embed a Lua interpreter

#ifndef __GLUA_GLUA_HPP
#define __GLUA_GLUA_HPP

#include "glua/base.hpp"
#include "glua/bridge.hpp"
#include "glua/chunk.hpp"
#include "glua/codec.hpp"
#include "glua/error.hpp"
#include "glua/log.hpp"
#include "glua/path.hpp"
#include "glua/state.hpp"
#include "glua/value.hpp"

#endif
