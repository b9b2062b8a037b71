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

#ifndef UTIL_UTF_H
#define UTIL_UTF_H

// UTF-8 validation for rule text handed across the C boundary

#include "main/asn1opt_types.h"

namespace asn1opt
{
// true if the n bytes at src form well formed UTF-8 per RFC 3629;
// overlong forms, surrogates and code points above U+10FFFF are rejected.
// off is set to the offset of the first bad byte on failure.
ASN1OPT_PUBLIC bool validate_utf8(const uint8_t* src, size_t n, size_t* off = nullptr);
}

#endif

