//--------------------------------------------------------------------------
// Copyright (C) 2015-2024 Cisco and/or its affiliates. All rights reserved.
//
// This program is free software; you can redistribute it and/or modify it
// under the terms of the GNU General Public License Version 2 as published
// by the Free Software Foundation.  You may not use, modify or distribute
// this program under any other version of the GNU General Public License.
//
// This program is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
// General Public License for more details.
//
// You should have received a copy of the GNU General Public License along
// with this program; if not, write to the Free Software Foundation, Inc.,
// 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
//--------------------------------------------------------------------------
// lua.cc author Joel Cornett <jocornet@cisco.com>

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "lua.h"

#include <cstring>
#include <utility>

#include "log/messages.h"

namespace Lua
{
State::State(bool openlibs)
{
    state = luaL_newstate();

    if ( !state )
        asn1opt::FatalError("Lua state instantiation failed\n");

    if ( openlibs )
        luaL_openlibs(state);
}

State::State(State&& o) :
    state { std::exchange(o.state, nullptr) } { }

State::~State()
{
    if ( state )
        lua_close(state);
}

ManageStack::ManageStack(lua_State* L, int extra) :
    state ( L )
{
    top = lua_gettop(state);

    if ( extra > 0 and !lua_checkstack(state, extra) )
        asn1opt::FatalError("Lua stack cannot grow by %d\n", extra);
}

ManageStack::~ManageStack()
{
    if ( lua_gettop(state) > top )
        lua_settop(state, top);
}

static bool run_loaded(lua_State* L, int status, std::string& err)
{
    if ( !status )
        status = lua_pcall(L, 0, 0, 0);

    if ( !status )
        return true;

    const char* msg = lua_tostring(L, -1);
    err = msg ? msg : "unknown Lua error";
    lua_pop(L, 1);
    return false;
}

bool run_file(lua_State* L, const char* path, std::string& err)
{
    ManageStack ms(L);
    set_script_dir(L, SCRIPT_DIR_VARNAME, path);
    return run_loaded(L, luaL_loadfile(L, path), err);
}

bool run_string(lua_State* L, const char* chunk, const char* name, std::string& err)
{
    ManageStack ms(L);
    return run_loaded(L, luaL_loadbuffer(L, chunk, strlen(chunk), name), err);
}
}

