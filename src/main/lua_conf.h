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

#ifndef LUA_CONF_H
#define LUA_CONF_H

// LuaConf is a ConfProvider backed by a Lua configuration script:
//
//     asn1 = { max_frames = 64 }
//
// dotted keys walk nested tables, so "asn1.max_frames" yields "64".

#include <mutex>
#include <string>

#include "lua/lua.h"
#include "main/conf_provider.h"

namespace asn1opt
{
class ASN1OPT_PUBLIC LuaConf : public ConfProvider
{
public:
    LuaConf() = default;

    LuaConf(LuaConf&) = delete;
    LuaConf& operator=(const LuaConf&) = delete;

    // errors are reported with ParseError
    bool load_file(const char* path);
    bool load_string(const char* chunk, const char* name = "lua");

    bool get(const char* key, std::string& value) const override;

private:
    mutable std::mutex lock;
    mutable Lua::State state;
};
}

#endif

