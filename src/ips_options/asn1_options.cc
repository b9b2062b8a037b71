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

#include "asn1_options.h"

#include "hash/hashfcn.h"
#include "log/messages.h"

#ifdef UNIT_TEST
#include <catch2/catch.hpp>
#endif

using namespace asn1opt;

#define s_name "asn1"

uint32_t Asn1Options::hash() const
{
    uint32_t a, b, c;

    a = bitstring_overflow;
    b = double_overflow;
    c = max_frames;

    mix(a,b,c);

    a += oversize_length.value_or(0);
    b += absolute_offset.value_or(0);
    c += (uint32_t)relative_offset.value_or(0);

    mix(a,b,c);
    mix_str(a,b,c,s_name);

    // presence bits keep an absent option apart from a zero one
    a += (oversize_length ? 1 : 0) | (absolute_offset ? 2 : 0) | (relative_offset ? 4 : 0);

    finalize(a,b,c);

    return c;
}

bool Asn1Options::operator==(const Asn1Options& rhs) const
{
    return bitstring_overflow == rhs.bitstring_overflow and
        double_overflow == rhs.double_overflow and
        oversize_length == rhs.oversize_length and
        absolute_offset == rhs.absolute_offset and
        relative_offset == rhs.relative_offset and
        max_frames == rhs.max_frames;
}

void Asn1Options::show() const
{
    ConfigLogger::log_option(s_name);
    ConfigLogger::log_flag("bitstring_overflow", bitstring_overflow, true);
    ConfigLogger::log_flag("double_overflow", double_overflow, true);

    if ( oversize_length )
        ConfigLogger::log_value("oversize_length", (uint64_t)*oversize_length, true);
    else
        ConfigLogger::log_value("oversize_length", "none", true);

    if ( absolute_offset )
        ConfigLogger::log_value("absolute_offset", (uint64_t)*absolute_offset, true);
    else
        ConfigLogger::log_value("absolute_offset", "none", true);

    if ( relative_offset )
        ConfigLogger::log_value("relative_offset", (int64_t)*relative_offset, true);
    else
        ConfigLogger::log_value("relative_offset", "none", true);

    ConfigLogger::log_value("max_frames", (uint64_t)max_frames, true);
}

//--------------------------------------------------------------------------
// unit tests
//--------------------------------------------------------------------------

#ifdef UNIT_TEST
TEST_CASE("defaults", "[Asn1Options]")
{
    Asn1Options opts;

    CHECK(!opts.bitstring_overflow);
    CHECK(!opts.double_overflow);
    CHECK(!opts.oversize_length);
    CHECK(!opts.absolute_offset);
    CHECK(!opts.relative_offset);
    CHECK(!opts.is_relative());
    CHECK(opts.max_frames == 30);
}

TEST_CASE("equality", "[Asn1Options]")
{
    Asn1Options a, b;
    CHECK(a == b);

    a.oversize_length = 1024;
    CHECK(a != b);

    b.oversize_length = 1024;
    CHECK(a == b);

    b.max_frames = 31;
    CHECK(a != b);
}

TEST_CASE("hash follows equality", "[Asn1Options]")
{
    Asn1Options a, b;
    a.double_overflow = b.double_overflow = true;
    a.relative_offset = b.relative_offset = -7;

    CHECK(a.hash() == b.hash());

    b.relative_offset = 7;
    CHECK(a.hash() != b.hash());
}

TEST_CASE("absent differs from zero", "[Asn1Options]")
{
    Asn1Options a, b;
    b.absolute_offset = 0;

    CHECK(a != b);
    CHECK(a.hash() != b.hash());
}
#endif

