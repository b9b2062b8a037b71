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

#ifndef ASN1_API_H
#define ASN1_API_H

// C interface for rule readers written in other languages.  a handle
// returned by asn1opt_parse() is owned by the caller until it is passed
// to asn1opt_free() exactly once.

#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
#include "main/asn1opt_types.h"

namespace asn1opt
{
struct Asn1Options;
}
typedef asn1opt::Asn1Options asn1opt_options_t;

extern "C"
{
#else
typedef struct asn1opt_options asn1opt_options_t;

#ifndef ASN1OPT_PUBLIC
#define ASN1OPT_PUBLIC
#endif
#endif

// returns NULL if text is NULL, is not UTF-8, or does not parse
ASN1OPT_PUBLIC asn1opt_options_t* asn1opt_parse(const char* text);

// NULL is ignored
ASN1OPT_PUBLIC void asn1opt_free(asn1opt_options_t*);

ASN1OPT_PUBLIC bool asn1opt_bitstring_overflow(const asn1opt_options_t*);
ASN1OPT_PUBLIC bool asn1opt_double_overflow(const asn1opt_options_t*);

// optional fields return false if unset; otherwise the value is stored
// through the pointer if it is not NULL
ASN1OPT_PUBLIC bool asn1opt_oversize_length(const asn1opt_options_t*, uint32_t*);
ASN1OPT_PUBLIC bool asn1opt_absolute_offset(const asn1opt_options_t*, uint32_t*);
ASN1OPT_PUBLIC bool asn1opt_relative_offset(const asn1opt_options_t*, int32_t*);

ASN1OPT_PUBLIC uint16_t asn1opt_max_frames(const asn1opt_options_t*);

// process wide configuration consulted by asn1opt_parse(); call these at
// startup before parsing from multiple threads.  0 on success, -1 on error
// in which case the previous configuration is kept.
ASN1OPT_PUBLIC int asn1opt_conf_load_file(const char* path);
ASN1OPT_PUBLIC int asn1opt_conf_load_string(const char* chunk);
ASN1OPT_PUBLIC void asn1opt_conf_clear(void);

ASN1OPT_PUBLIC const char* asn1opt_version(void);

#ifdef __cplusplus
}
#endif

#endif

