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

#ifndef ASN1OPT_TYPES_H
#define ASN1OPT_TYPES_H

// defines common types and visibility macros

#include <cinttypes>
#include <cstddef>
#include <cstdint>

#define ASN1OPT_VERSION "1.0.0"

/* use these macros for 64 bit format portability */
#define STDu64 "%" PRIu64
#define STDi64 "%" PRIi64

#ifndef ASN1OPT_PUBLIC
#  ifdef HAVE_VISIBILITY
#    define ASN1OPT_PUBLIC  __attribute__ ((visibility("default")))
#  else
#    define ASN1OPT_PUBLIC
#  endif
#endif

#if !defined(__GNUC__) || __GNUC__ < 2 || \
    (__GNUC__ == 2 && __GNUC_MINOR__ < 5)
#define __attribute__(x)    /* delete __attribute__ if non-gcc or gcc1 */
#endif

#endif

