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

#ifndef IPS_ASN1_H
#define IPS_ASN1_H

// entry point for building asn1 rule option state from the option
// argument isolated by the rule reader

#include <memory>

#include "ips_options/asn1_options.h"
#include "ips_options/asn1_parse.h"
#include "main/asn1opt_types.h"

#define ASN1_MAX_FRAMES_KEY "asn1.max_frames"

namespace asn1opt
{
class ConfProvider;

// returns nullptr on failure; status, if given, says why.  conf may be
// nullptr in which case max_frames keeps its default.
ASN1OPT_PUBLIC std::unique_ptr<Asn1Options> asn1_parse(
    const char* text, const ConfProvider* conf, Asn1Status* status = nullptr);

// applies the ASN1_MAX_FRAMES_KEY override if conf has a valid one.
// returns false if the key is set to something other than 0-65535.
ASN1OPT_PUBLIC bool asn1_apply_conf(Asn1Options&, const ConfProvider&);
}

#endif

