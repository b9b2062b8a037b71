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

#ifndef ASN1_PARSE_H
#define ASN1_PARSE_H

// grammar and parser for the asn1 rule option argument:
//
//     asn1: bitstring_overflow, oversize_length 500, relative_offset 7;
//
// clauses are separated by a run of whitespace or a single comma.

#include <string>

#include "main/asn1opt_types.h"

namespace asn1opt
{
struct Asn1Options;
struct Parameter;

enum Asn1Error
{
    ASN1_OK = 0,
    ASN1_EMPTY_INPUT,
    ASN1_UNRECOGNIZED_OPTION,
    ASN1_NUMERIC_OVERFLOW,
    ASN1_INVALID_ENCODING,
    ASN1_NULL_INPUT,
    ASN1_ERROR_MAX
};

struct ASN1OPT_PUBLIC Asn1Status
{
    Asn1Error error = ASN1_OK;

    // unparsed input where the error was found
    std::string remainder;

    bool ok() const
    { return error == ASN1_OK; }

    const char* get_error_name() const;

    void set(Asn1Error e, const char* s, size_t n)
    { error = e; remainder.assign(s, n); }

    void clear()
    { error = ASN1_OK; remainder.clear(); }
};

// the recognized clauses in match priority order, nullptr terminated
ASN1OPT_PUBLIC const Parameter* asn1_get_params();

// parse n bytes at s into opts, which is modified in place.  on failure
// opts is left partially updated and must be discarded by the caller.
ASN1OPT_PUBLIC bool asn1_parse_options(
    const char* s, size_t n, Asn1Options& opts, Asn1Status& status);

inline bool asn1_parse_options(const std::string& s, Asn1Options& opts, Asn1Status& status)
{ return asn1_parse_options(s.c_str(), s.size(), opts, status); }
}

#endif

