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
// parameter.cc author Russ Combs <rucombs@cisco.com>

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "parameter.h"

#include <cstdlib>
#include <cstring>

#ifdef UNIT_TEST
#include <catch2/catch.hpp>
#endif

using namespace asn1opt;

//--------------------------------------------------------------------------
// helpers
//--------------------------------------------------------------------------

// RV allows the symbol to be followed by the range separator
template <bool RV>
static bool str2num(const char* r, int64_t& t)
{
    const int n = 5;
    bool neg = false;

    if ( *r == '-' )
    {
        neg = true;
        ++r;
    }

    if ( *r != 'm' )
        return false;

    bool res = true;

    if ( !strncmp(r, "max31", n) )
        t = 2147483647;

    else if ( !strncmp(r, "max32", n) )
        t = 4294967295;

    else
        res = false;

    if ( res and neg )
        t = -t;

    return res and (r[n] == '\0' or (RV and r[n] == ':'));
}

int64_t Parameter::get_int(const char* r)
{
    bool is_correct;
    return get_int(r, is_correct);
}

int64_t Parameter::get_int(const char* r, bool& is_correct)
{
    char* end = nullptr;
    int64_t i = (int64_t)strtoll(r, &end, 0);

    is_correct = str2num<true>(r, i) or !*end or *end == ':';

    return i;
}

//--------------------------------------------------------------------------
// public methods
//--------------------------------------------------------------------------

const char* Parameter::get_type() const
{
    switch ( type )
    {
    case PT_INT:     return "int";
    case PT_STRING:  return "string";
    case PT_IMPLIED: return "implied";
    default:         break;
    }
    return "error";
}

const char* Parameter::get_range() const
{
    if ( type == PT_IMPLIED )
        return nullptr;

    return range;
}

bool Parameter::is_signed() const
{
    if ( type != PT_INT )
        return false;

    return !range or range[0] == '-';
}

// require no leading or trailing whitespace in the range
// and either # | #: | :# | #:#
bool Parameter::validate(int64_t d) const
{
    if ( type != PT_INT )
        return false;

    const char* r = range;

    if ( !r or !*r )
        return true;

    const char* t = strchr(r, ':');

    if ( *r != ':' )
    {
        int64_t low = get_int(r);

        if ( d < low )
            return false;

        if ( !t )
            return d == low;
    }

    if ( t and *++t )
    {
        int64_t hi = get_int(t);

        if ( d > hi )
            return false;
    }
    return true;
}

const Parameter* Parameter::find(const Parameter* p, const char* s)
{
    while ( p->name )
    {
        if ( !strcmp(p->name, s) )
            return p;
        ++p;
    }
    return nullptr;
}

//--------------------------------------------------------------------------
// unit tests
//--------------------------------------------------------------------------

#ifdef UNIT_TEST
static const Parameter s_test_params[] =
{
    { "flag", Parameter::PT_IMPLIED, nullptr, nullptr, "implied" },
    { "count", Parameter::PT_INT, "0:max32", nullptr, "unsigned" },
    { "delta", Parameter::PT_INT, "-2147483648:2147483647", nullptr, "signed" },
    { "exact", Parameter::PT_INT, "7", nullptr, "single value" },
    { "any", Parameter::PT_INT, nullptr, nullptr, "unbounded" },
    { nullptr, Parameter::PT_MAX, nullptr, nullptr, nullptr }
};

TEST_CASE("range symbols", "[Parameter]")
{
    CHECK(Parameter::get_int("max31") == 2147483647);
    CHECK(Parameter::get_int("max32") == 4294967295);
    CHECK(Parameter::get_int("-max31") == -2147483647);
    CHECK(Parameter::get_int("0x10") == 16);

    bool ok = true;
    Parameter::get_int("12abc", ok);
    CHECK(!ok);
}

TEST_CASE("unsigned range", "[Parameter]")
{
    const Parameter* p = Parameter::find(s_test_params, "count");
    REQUIRE(p);

    CHECK(!p->is_signed());
    CHECK(p->validate(0));
    CHECK(p->validate(4294967295));
    CHECK(!p->validate(4294967296));
    CHECK(!p->validate(-1));
}

TEST_CASE("signed range", "[Parameter]")
{
    const Parameter* p = Parameter::find(s_test_params, "delta");
    REQUIRE(p);

    CHECK(p->is_signed());
    CHECK(p->validate(-2147483648LL));
    CHECK(p->validate(2147483647));
    CHECK(!p->validate(2147483648LL));
    CHECK(!p->validate(-2147483649LL));
}

TEST_CASE("exact and open ranges", "[Parameter]")
{
    const Parameter* p = Parameter::find(s_test_params, "exact");
    REQUIRE(p);
    CHECK(p->validate(7));
    CHECK(!p->validate(8));

    p = Parameter::find(s_test_params, "any");
    REQUIRE(p);
    CHECK(p->is_signed());
    CHECK(p->validate(-99));
}

TEST_CASE("implied parameters", "[Parameter]")
{
    const Parameter* p = Parameter::find(s_test_params, "flag");
    REQUIRE(p);

    CHECK(!strcmp(p->get_type(), "implied"));
    CHECK(p->get_range() == nullptr);
    CHECK(!p->validate(0));
    CHECK(Parameter::find(s_test_params, "nope") == nullptr);
}
#endif

