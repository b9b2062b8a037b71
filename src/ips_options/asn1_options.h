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

#ifndef ASN1_OPTIONS_H
#define ASN1_OPTIONS_H

// Asn1Options is the parsed form of the asn1 rule option argument.  It is
// what the ASN.1 detection code consumes.

#include <optional>

#include "main/asn1opt_types.h"

#define ASN1_DEFAULT_MAX_FRAMES 30

namespace asn1opt
{
struct ASN1OPT_PUBLIC Asn1Options
{
    bool bitstring_overflow = false;
    bool double_overflow = false;

    std::optional<uint32_t> oversize_length;
    std::optional<uint32_t> absolute_offset;
    std::optional<int32_t> relative_offset;

    uint16_t max_frames = ASN1_DEFAULT_MAX_FRAMES;

    bool is_relative() const
    { return relative_offset.has_value(); }

    uint32_t hash() const;

    // dump to the config log
    void show() const;

    bool operator==(const Asn1Options&) const;

    bool operator!=(const Asn1Options& rhs) const
    { return !(*this == rhs); }
};
}

#endif

