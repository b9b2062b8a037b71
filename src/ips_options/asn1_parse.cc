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

/*
**  asn1: [detection function],[arguments],[offset type],[size]
**
**  Detection Functions:
**
**  bitstring_overflow: no arguments
**  double_overflow:    no arguments
**  oversize_length:    max size
**
**  Offset Types:
**
**  absolute_offset:    offset from the start of the buffer
**  relative_offset:    signed offset from the cursor
**
**  alert udp any any -> any 161 (msg:"foo"; \
**      asn1: oversize_length 10000, absolute_offset 0;)
**
**  alert tcp any any -> any 162 (msg:"foo2"; \
**      asn1: bitstring_overflow, oversize_length 500, relative_offset 7;)
*/

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "asn1_parse.h"

#include <cstring>

#include "framework/parameter.h"

#include "asn1_options.h"

using namespace asn1opt;

#define BITSTRING_OPT  "bitstring_overflow"
#define DOUBLE_OPT     "double_overflow"

#define LENGTH_OPT     "oversize_length"
#define ABS_OFFSET_OPT "absolute_offset"
#define REL_OFFSET_OPT "relative_offset"

// order is match priority
static const Parameter s_params[] =
{
    { BITSTRING_OPT, Parameter::PT_IMPLIED, nullptr, nullptr,
      "detects invalid bitstring encodings that are known to be remotely exploitable" },

    { DOUBLE_OPT, Parameter::PT_IMPLIED, nullptr, nullptr,
      "detects a double ASCII encoding that is larger than a standard buffer" },

    { LENGTH_OPT, Parameter::PT_INT, "0:max32", nullptr,
      "compares ASN.1 type lengths with the supplied argument" },

    { ABS_OFFSET_OPT, Parameter::PT_INT, "0:max32", nullptr,
      "absolute offset from the beginning of the buffer" },

    { REL_OFFSET_OPT, Parameter::PT_INT, "-2147483648:2147483647", nullptr,
      "relative offset from the cursor" },

    { nullptr, Parameter::PT_MAX, nullptr, nullptr, nullptr }
};

static const char* s_error_names[ASN1_ERROR_MAX] =
{
    "ok",
    "empty input",
    "unrecognized option",
    "numeric overflow",
    "invalid encoding",
    "null input",
};

const char* Asn1Status::get_error_name() const
{
    if ( (unsigned)error >= ASN1_ERROR_MAX )
        return "unknown";

    return s_error_names[error];
}

const Parameter* asn1opt::asn1_get_params()
{ return s_params; }

//--------------------------------------------------------------------------
// lexing
//--------------------------------------------------------------------------

static inline bool is_space(char c)
{ return c == ' ' or c == '\t' or c == '\r' or c == '\n'; }

static inline bool is_digit(char c)
{ return c >= '0' and c <= '9'; }

// a clause must be followed by a separator or the end of input so that
// abutting clauses like bitstring_overflowdouble_overflow are rejected
static inline bool at_boundary(const char* s, const char* end)
{ return s == end or is_space(*s) or *s == ','; }

static const char* skip_space(const char* s, const char* end)
{
    while ( s < end and is_space(*s) )
        ++s;
    return s;
}

//--------------------------------------------------------------------------
// clause matching
//--------------------------------------------------------------------------

enum MatchResult { MR_NONE, MR_MATCH, MR_OVERFLOW };

// digits are consumed even after the magnitude exceeds 32 bits so that the
// whole argument is reported as overflowing rather than partially matched
static MatchResult match_number(
    const Parameter* p, const char*& s, const char* end, int64_t& val)
{
    const char* t = s;
    bool neg = false;

    if ( t < end and *t == '-' and p->is_signed() )
    {
        neg = true;
        ++t;
    }

    if ( t == end or !is_digit(*t) )
        return MR_NONE;

    uint64_t mag = 0;
    bool overflow = false;

    while ( t < end and is_digit(*t) )
    {
        if ( !overflow )
        {
            mag = mag * 10 + (uint64_t)(*t - '0');

            if ( mag > UINT32_MAX )
                overflow = true;
        }
        ++t;
    }

    if ( !at_boundary(t, end) )
        return MR_NONE;

    s = t;

    if ( overflow )
        return MR_OVERFLOW;

    val = neg ? -(int64_t)mag : (int64_t)mag;

    if ( !p->validate(val) )
        return MR_OVERFLOW;

    return MR_MATCH;
}

static MatchResult match_clause(
    const Parameter* p, const char*& s, const char* end, int64_t& val)
{
    size_t len = strlen(p->name);

    if ( (size_t)(end - s) < len or memcmp(s, p->name, len) )
        return MR_NONE;

    const char* t = s + len;

    if ( p->type == Parameter::PT_IMPLIED )
    {
        if ( !at_boundary(t, end) )
            return MR_NONE;

        s = t;
        return MR_MATCH;
    }

    // keyword and argument need at least one whitespace between them
    if ( t == end or !is_space(*t) )
        return MR_NONE;

    t = skip_space(t, end);

    MatchResult mr = match_number(p, t, end, val);

    if ( mr != MR_NONE )
        s = t;

    return mr;
}

static void set(Asn1Options& opts, const Parameter* p, int64_t val)
{
    const char* name = p->name;

    if ( !strcmp(name, BITSTRING_OPT) )
        opts.bitstring_overflow = true;

    else if ( !strcmp(name, DOUBLE_OPT) )
        opts.double_overflow = true;

    else if ( !strcmp(name, LENGTH_OPT) )
        opts.oversize_length = (uint32_t)val;

    else if ( !strcmp(name, ABS_OFFSET_OPT) )
        opts.absolute_offset = (uint32_t)val;

    else if ( !strcmp(name, REL_OFFSET_OPT) )
        opts.relative_offset = (int32_t)val;
}

//--------------------------------------------------------------------------
// parser
//--------------------------------------------------------------------------

bool asn1opt::asn1_parse_options(
    const char* s, size_t n, Asn1Options& opts, Asn1Status& status)
{
    status.clear();

    if ( !n )
    {
        status.error = ASN1_EMPTY_INPUT;
        return false;
    }

    const char* end = s + n;

    while ( s < end )
    {
        s = skip_space(s, end);

        const Parameter* p = s_params;
        MatchResult mr = MR_NONE;
        int64_t val = 0;
        const char* t = s;

        for ( ; p->name; ++p )
        {
            mr = match_clause(p, t, end, val);

            if ( mr != MR_NONE )
                break;
        }

        if ( mr == MR_NONE )
        {
            status.set(ASN1_UNRECOGNIZED_OPTION, s, end - s);
            return false;
        }

        if ( mr == MR_OVERFLOW )
        {
            status.set(ASN1_NUMERIC_OVERFLOW, s, end - s);
            return false;
        }

        // duplicates are allowed; the last one wins
        set(opts, p, val);
        s = t;

        // at most one separator: a run of whitespace or a single comma
        if ( s < end and is_space(*s) )
            s = skip_space(s, end);

        else if ( s < end and *s == ',' )
            ++s;
    }

    return true;
}

