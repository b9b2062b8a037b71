//--------------------------------------------------------------------------
// Copyright (C) 2014-2024 Cisco and/or its affiliates. All rights reserved.
// Copyright (C) 2003-2013 Sourcefire, Inc.
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

#include "hashfcn.h"

#include <cstring>

#ifdef UNIT_TEST
#include <catch2/catch.hpp>
#endif

namespace asn1opt
{
void mix_str(
    uint32_t& a, uint32_t& b, uint32_t& c,
    const char* s, unsigned n)
{
    unsigned j = 0;

    if ( !n )
        n = strlen(s);

    for ( unsigned i = 0; i < n; i += 4 )
    {
        uint32_t tmp = 0;
        unsigned k = n - i;

        if ( k > 4 )
            k = 4;

        for ( unsigned l = 0; l < k; l++ )
            tmp |= (uint32_t)(unsigned char)s[i + l] << l*8;

        switch ( j++ )
        {
        case 0: a += tmp; break;
        case 1: b += tmp; break;
        case 2: c += tmp; break;
        }

        if ( j == 3 )
        {
            mix(a,b,c);
            j = 0;
        }
    }

    if ( j )
        mix(a,b,c);
}
}

#ifdef UNIT_TEST
TEST_CASE("mix_str is stable", "[hashfcn]")
{
    uint32_t a1 = 1, b1 = 2, c1 = 3;
    uint32_t a2 = 1, b2 = 2, c2 = 3;

    asn1opt::mix_str(a1, b1, c1, "asn1");
    asn1opt::mix_str(a2, b2, c2, "asn1", 4);

    CHECK(a1 == a2);
    CHECK(b1 == b2);
    CHECK(c1 == c2);
}

TEST_CASE("mix_str depends on content", "[hashfcn]")
{
    uint32_t a1 = 0, b1 = 0, c1 = 0;
    uint32_t a2 = 0, b2 = 0, c2 = 0;

    asn1opt::mix_str(a1, b1, c1, "bitstring_overflow");
    asn1opt::mix_str(a2, b2, c2, "double_overflow");

    finalize(a1, b1, c1);
    finalize(a2, b2, c2);

    CHECK(c1 != c2);
}
#endif

