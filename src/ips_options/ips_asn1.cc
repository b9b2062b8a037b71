//--------------------------------------------------------------------------
// Copyright (C) 2014-2024 Cisco and/or its affiliates. All rights reserved.
// Copyright (C) 2002-2013 Sourcefire, Inc.
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

#include "ips_asn1.h"

#include <cstring>
#include <string>

#include "framework/parameter.h"
#include "log/messages.h"
#include "main/conf_provider.h"
#include "utils/cpp_macros.h"
#include "utils/util_utf.h"

#ifdef UNIT_TEST
#include <catch2/catch.hpp>
#endif

using namespace asn1opt;

#define s_name "asn1"

static const Parameter s_max_frames =
{
    ASN1_MAX_FRAMES_KEY, Parameter::PT_INT, "0:65535", STRINGIFY_MX(ASN1_DEFAULT_MAX_FRAMES),
    "maximum number of ASN.1 frames decoded per buffer"
};

// decimal digits only, no sign; leading zeros are allowed
static bool get_max_frames(const std::string& s, uint16_t& n)
{
    if ( s.empty() )
        return false;

    int64_t v = 0;

    for ( char c : s )
    {
        if ( c < '0' or c > '9' )
            return false;

        // keep scanning so that trailing junk is still rejected
        if ( v <= UINT16_MAX )
            v = v * 10 + (c - '0');
    }

    if ( !s_max_frames.validate(v) )
        return false;

    n = (uint16_t)v;
    return true;
}

bool asn1opt::asn1_apply_conf(Asn1Options& opts, const ConfProvider& conf)
{
    std::string val;

    if ( !conf.get(ASN1_MAX_FRAMES_KEY, val) )
        return true;

    uint16_t n;

    if ( !get_max_frames(val, n) )
    {
        DebugMessage("%s: could not parse %s: %s\n", s_name, ASN1_MAX_FRAMES_KEY, val.c_str());
        return false;
    }

    opts.max_frames = n;
    return true;
}

std::unique_ptr<Asn1Options> asn1opt::asn1_parse(
    const char* text, const ConfProvider* conf, Asn1Status* ps)
{
    Asn1Status local;
    Asn1Status& status = ps ? *ps : local;
    status.clear();

    if ( !text )
    {
        status.error = ASN1_NULL_INPUT;
        ParseError("%s: no option argument", s_name);
        return nullptr;
    }

    size_t len = strlen(text);
    size_t off = 0;

    if ( !validate_utf8((const uint8_t*)text, len, &off) )
    {
        status.set(ASN1_INVALID_ENCODING, text + off, len - off);
        ParseError("%s: invalid UTF-8 at offset %zu", s_name, off);
        return nullptr;
    }

    std::unique_ptr<Asn1Options> opts(new Asn1Options);

    if ( !asn1_parse_options(text, len, *opts, status) )
    {
        if ( status.remainder.empty() )
            ParseError("%s: %s", s_name, status.get_error_name());
        else
            ParseError("%s: %s at '%s'", s_name, status.get_error_name(),
                status.remainder.c_str());

        return nullptr;
    }

    // a bad override is not fatal
    if ( conf )
        asn1_apply_conf(*opts, *conf);

    return opts;
}

//--------------------------------------------------------------------------
// unit tests
//--------------------------------------------------------------------------

#ifdef UNIT_TEST
TEST_CASE("max_frames default", "[asn1]")
{
    CHECK(Parameter::get_int(s_max_frames.deflt) == ASN1_DEFAULT_MAX_FRAMES);
    CHECK(Asn1Options().max_frames == ASN1_DEFAULT_MAX_FRAMES);
    CHECK(s_max_frames.validate(ASN1_DEFAULT_MAX_FRAMES));
}
#endif
