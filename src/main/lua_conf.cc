//--------------------------------------------------------------------------
// Copyright (C) 2024-2024 Cisco and/or its affiliates. All rights reserved.
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

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "lua_conf.h"

#include <cstring>
#include <vector>

#include "log/messages.h"

#ifdef UNIT_TEST
#include <catch2/catch.hpp>
#endif

using namespace asn1opt;

bool LuaConf::load_file(const char* path)
{
    std::lock_guard<std::mutex> guard(lock);
    std::string err;

    if ( Lua::run_file(state, path, err) )
        return true;

    ParseError("can't load %s: %s", path, err.c_str());
    return false;
}

bool LuaConf::load_string(const char* chunk, const char* name)
{
    std::lock_guard<std::mutex> guard(lock);
    std::string err;

    if ( Lua::run_string(state, chunk, name, err) )
        return true;

    ParseError("can't load %s: %s", name, err.c_str());
    return false;
}

namespace
{
struct Lookup
{
    const std::vector<std::string>* names;
    std::string* value;
    bool found;
};
}

// runs under lua_cpcall because __index metamethods can raise; nothing
// here may own memory across a call that raises
static int lookup(lua_State* L)
{
    Lookup* lk = static_cast<Lookup*>(lua_touserdata(L, 1));
    const std::vector<std::string>& names = *lk->names;

    lua_getglobal(L, names[0].c_str());

    for ( size_t i = 1; i < names.size(); ++i )
    {
        if ( !lua_istable(L, -1) )
            return 0;

        lua_getfield(L, -1, names[i].c_str());
        lua_remove(L, -2);
    }

    switch ( lua_type(L, -1) )
    {
    case LUA_TNIL:
        return 0;

    case LUA_TNUMBER:
    case LUA_TSTRING:
    {
        size_t len = 0;
        const char* s = lua_tolstring(L, -1, &len);
        lk->value->assign(s, len);
        break;
    }
    case LUA_TBOOLEAN:
        *lk->value = lua_toboolean(L, -1) ? "true" : "false";
        break;

    default:
        // present but not a scalar; let the caller reject it
        *lk->value = lua_typename(L, lua_type(L, -1));
        break;
    }
    lk->found = true;
    return 0;
}

bool LuaConf::get(const char* key, std::string& value) const
{
    std::vector<std::string> names;
    const char* s = key;

    while ( const char* dot = strchr(s, '.') )
    {
        names.emplace_back(s, dot - s);
        s = dot + 1;
    }
    names.emplace_back(s);

    std::string tmp;
    Lookup lk { &names, &tmp, false };

    std::lock_guard<std::mutex> guard(lock);

    lua_State* L = state;
    Lua::ManageStack ms(L, 1);

    if ( lua_cpcall(L, lookup, &lk) )
    {
        const char* err = lua_tostring(L, -1);
        DebugMessage("can't get %s: %s\n", key, err ? err : "unknown Lua error");
        return false;
    }

    if ( lk.found )
        value = tmp;

    return lk.found;
}

//--------------------------------------------------------------------------
// unit tests
//--------------------------------------------------------------------------

#ifdef UNIT_TEST
TEST_CASE("nested lookup", "[LuaConf]")
{
    LuaConf conf;
    REQUIRE(conf.load_string("asn1 = { max_frames = 64 }"));

    std::string v;
    CHECK(conf.get("asn1.max_frames", v));
    CHECK(v == "64");

    CHECK(!conf.get("asn1.missing", v));
    CHECK(!conf.get("nothing.here", v));
    CHECK(!conf.get("asn1.max_frames.deeper", v));
}

TEST_CASE("scalar conversions", "[LuaConf]")
{
    LuaConf conf;
    REQUIRE(conf.load_string("a = '17' b = true c = { } d = 2.5"));

    std::string v;
    CHECK(conf.get("a", v));
    CHECK(v == "17");

    CHECK(conf.get("b", v));
    CHECK(v == "true");

    CHECK(conf.get("c", v));
    CHECK(v == "table");

    CHECK(conf.get("d", v));
    CHECK(v == "2.5");
}

TEST_CASE("later chunks override", "[LuaConf]")
{
    LuaConf conf;
    REQUIRE(conf.load_string("asn1 = { max_frames = 1 }"));
    REQUIRE(conf.load_string("asn1.max_frames = 2"));

    std::string v;
    CHECK(conf.get("asn1.max_frames", v));
    CHECK(v == "2");
}

TEST_CASE("strict globals", "[LuaConf]")
{
    LuaConf conf;
    REQUIRE(conf.load_string(
        "setmetatable(_G, { __index = function(_, k) error('undefined ' .. k) end })"));

    std::string v = "unchanged";
    CHECK(!conf.get("asn1.max_frames", v));
    CHECK(v == "unchanged");

    REQUIRE(conf.load_string("rawset(_G, 'asn1', { max_frames = 8 })"));
    CHECK(conf.get("asn1.max_frames", v));
    CHECK(v == "8");
}

TEST_CASE("raising nested table", "[LuaConf]")
{
    LuaConf conf;
    REQUIRE(conf.load_string(
        "asn1 = setmetatable({ }, { __index = function() error('no such key') end })"));

    std::string v;
    CHECK(!conf.get("asn1.max_frames", v));

    // the state stays usable after a failed lookup
    REQUIRE(conf.load_string("other = 3"));
    CHECK(conf.get("other", v));
    CHECK(v == "3");
}

TEST_CASE("bad chunk", "[LuaConf]")
{
    reset_parse_errors();

    LuaConf conf;
    CHECK(!conf.load_string("asn1 = {", "broken"));
    CHECK(get_parse_errors() == 1);

    CHECK(!conf.load_file("/nonexistent/asn1opt.lua"));
    CHECK(get_parse_errors() == 1);
}
#endif

