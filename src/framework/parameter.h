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
// parameter.h author Russ Combs <rucombs@cisco.com>

#ifndef PARAMETER_H
#define PARAMETER_H

// Parameter describes one rule option keyword and how its argument is
// checked.  Rule options are declared as a nullptr terminated table of
// parameters.
//
// number ranges are given by:
// nullptr -> any
// # | #: | :# | #:#
// where # is any valid pos|neg dec|hex|octal number or one of the
// symbols max31, max32

#include "main/asn1opt_types.h"

namespace asn1opt
{
struct ASN1OPT_PUBLIC Parameter
{
    enum Type
    {
        PT_INT,        // signed 64 bits or less determined by range
        PT_STRING,     // any string; range = "(optional)" if it may be empty
        PT_IMPLIED,    // rule option args w/o values eg relative
        PT_MAX
    };
    const char* name;
    Type type;
    const char* range;
    const char* deflt;
    const char* help;

    const char* get_type() const;
    const char* get_range() const;

    // true if the lower bound of the range is negative
    bool is_signed() const;

    bool validate(int64_t) const;

    static const Parameter* find(const Parameter*, const char*);

    static int64_t get_int(const char*);
    static int64_t get_int(const char*, bool& is_correct);
};
}
#endif

