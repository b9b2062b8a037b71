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

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "util_utf.h"

#ifdef UNIT_TEST
#include <cstring>

#include <catch2/catch.hpp>
#endif

#define DSTATE_LEAD   0
#define DSTATE_CONT   1

namespace asn1opt
{
// each lead byte fixes the number of continuation bytes and the allowed
// range of the first one; the remaining ones are always 0x80-0xBF
static bool check_lead(uint8_t c, unsigned& need, uint8_t& lo, uint8_t& hi)
{
    lo = 0x80;
    hi = 0xBF;

    if ( c < 0x80 )
        need = 0;

    else if ( c >= 0xC2 and c <= 0xDF )
        need = 1;

    else if ( c == 0xE0 )
    {
        need = 2;
        lo = 0xA0;
    }
    else if ( c == 0xED )
    {
        need = 2;
        hi = 0x9F;
    }
    else if ( c >= 0xE1 and c <= 0xEF )
        need = 2;

    else if ( c == 0xF0 )
    {
        need = 3;
        lo = 0x90;
    }
    else if ( c >= 0xF1 and c <= 0xF3 )
        need = 3;

    else if ( c == 0xF4 )
    {
        need = 3;
        hi = 0x8F;
    }
    else
        return false;

    return true;
}

bool validate_utf8(const uint8_t* src, size_t n, size_t* off)
{
    int state = DSTATE_LEAD;
    unsigned need = 0;
    uint8_t lo = 0x80, hi = 0xBF;
    size_t lead = 0;

    for ( size_t i = 0; i < n; ++i )
    {
        uint8_t c = src[i];

        switch ( state )
        {
        case DSTATE_LEAD:
            lead = i;

            if ( !check_lead(c, need, lo, hi) )
            {
                if ( off )
                    *off = i;
                return false;
            }
            if ( need )
                state = DSTATE_CONT;
            break;

        case DSTATE_CONT:
            if ( c < lo or c > hi )
            {
                if ( off )
                    *off = lead;
                return false;
            }
            lo = 0x80;
            hi = 0xBF;

            if ( !--need )
                state = DSTATE_LEAD;
            break;
        }
    }

    // truncated sequence
    if ( state != DSTATE_LEAD )
    {
        if ( off )
            *off = lead;
        return false;
    }
    return true;
}
}

#ifdef UNIT_TEST
using asn1opt::validate_utf8;

static bool utf8(const char* s)
{ return validate_utf8((const uint8_t*)s, strlen(s)); }

TEST_CASE("ascii", "[utf8]")
{
    CHECK(utf8(""));
    CHECK(utf8("oversize_length 1024, relative_offset -7"));
    CHECK(utf8("\t\r\n"));
}

TEST_CASE("multibyte", "[utf8]")
{
    CHECK(utf8("\xC3\xA9"));              // U+00E9
    CHECK(utf8("\xE2\x82\xAC"));          // U+20AC
    CHECK(utf8("\xF0\x9F\x98\x80"));      // U+1F600
    CHECK(utf8("\xF4\x8F\xBF\xBF"));      // U+10FFFF
}

TEST_CASE("malformed", "[utf8]")
{
    CHECK(!utf8("\x80"));                 // lone continuation
    CHECK(!utf8("\xC0\xAF"));             // overlong
    CHECK(!utf8("\xE0\x80\xAF"));         // overlong
    CHECK(!utf8("\xED\xA0\x80"));         // surrogate
    CHECK(!utf8("\xF4\x90\x80\x80"));     // above U+10FFFF
    CHECK(!utf8("\xFF"));
    CHECK(!utf8("\xE2\x82"));             // truncated
}

TEST_CASE("error offset", "[utf8]")
{
    const char* s = "abc\xE2\x82" "d";
    size_t off = 0;

    CHECK(!validate_utf8((const uint8_t*)s, strlen(s), &off));
    CHECK(off == 3);
}
#endif

