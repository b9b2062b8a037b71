//--------------------------------------------------------------------------
// Copyright (C) 2014-2024 Cisco and/or its affiliates. All rights reserved.
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
// arg_list.cc author Russ Combs <rucombs@cisco.com>

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "arg_list.h"

#include <cstring>

#ifdef UNIT_TEST
#include <catch2/catch.hpp>
#endif

bool ArgList::get_arg(const char*& key, const char*& val)
{
    while ( ++idx < argc )
    {
        char* s = argv[idx];

        if ( positional )
        {
            key = "";
            val = s;
            return true;
        }
        if ( arg )
        {
            key = arg;
            if ( s[0] != '-' )
                val = s;
            else
            {
                val = "";
                --idx;
            }
            arg = nullptr;
            return true;
        }
        if ( s[0] != '-' )
        {
            key = "";
            val = s;
            return true;
        }
        if ( !strcmp(s, "--") )
        {
            positional = true;
            continue;
        }
        if ( s[1] != '-' )
        {
            s += 1;
            if ( strlen(s) > 1 )
            {
                buf.assign(s, 1);
                key = buf.c_str();
                val = s + 1;
                return true;
            }
            else if ( strlen(s) > 0 )
                arg = s;
            else
                arg = "-";
        }
        else
        {
            s += 2;
            char* eq = strchr(s, '=');

            if ( eq )
            {
                buf.assign(s, eq-s);
                key = buf.c_str();
                val = eq + 1;
                return true;
            }
            else
                arg = s;
        }
    }
    if ( arg )
    {
        key = arg;
        val = "";
        arg = nullptr;
        return true;
    }
    return false;
}

#ifdef UNIT_TEST
TEST_CASE("short and long options", "[ArgList]")
{
    char a0[] = "asn1opt", a1[] = "-q", a2[] = "-cfile.lua", a3[] = "--lua=x = 1",
        a4[] = "--catch-test", a5[] = "all";
    char* argv[] = { a0, a1, a2, a3, a4, a5 };

    ArgList al(6, argv);
    const char* key, * val;

    REQUIRE(al.get_arg(key, val));
    CHECK(!strcmp(key, "q"));
    CHECK(!strcmp(val, ""));

    REQUIRE(al.get_arg(key, val));
    CHECK(!strcmp(key, "c"));
    CHECK(!strcmp(val, "file.lua"));

    REQUIRE(al.get_arg(key, val));
    CHECK(!strcmp(key, "lua"));
    CHECK(!strcmp(val, "x = 1"));

    REQUIRE(al.get_arg(key, val));
    CHECK(!strcmp(key, "catch-test"));
    CHECK(!strcmp(val, "all"));

    CHECK(!al.get_arg(key, val));
}

TEST_CASE("positional args", "[ArgList]")
{
    char a0[] = "asn1opt", a1[] = "bitstring_overflow", a2[] = "--", a3[] = "-d";
    char* argv[] = { a0, a1, a2, a3 };

    ArgList al(4, argv);
    const char* key, * val;

    REQUIRE(al.get_arg(key, val));
    CHECK(!strcmp(key, ""));
    CHECK(!strcmp(val, "bitstring_overflow"));

    REQUIRE(al.get_arg(key, val));
    CHECK(!strcmp(key, ""));
    CHECK(!strcmp(val, "-d"));

    CHECK(!al.get_arg(key, val));
}
#endif

