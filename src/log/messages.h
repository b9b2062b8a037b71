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

#ifndef MESSAGES_H
#define MESSAGES_H

#include <cstdio>
#include <cstdarg>

#include "main/asn1opt_types.h"

#define LOG_DIV "--------------------------------------------------"

#ifndef __GNUC__
#define __attribute__(x)  /*NOTHING*/
#endif

#define STD_BUF 1024

// output controls; these are process wide and set once at startup
ASN1OPT_PUBLIC void set_log_quiet(bool);
ASN1OPT_PUBLIC void set_log_syslog(bool);
ASN1OPT_PUBLIC void set_log_debug(bool);

// the location is per thread.  name is not copied and must outlive the
// location; line 0 means none
ASN1OPT_PUBLIC void set_parse_location(const char* name, unsigned line);
ASN1OPT_PUBLIC void get_parse_location(const char*& name, unsigned& line);

ASN1OPT_PUBLIC void reset_parse_errors();

// returns the count since the last call and resets it
ASN1OPT_PUBLIC unsigned get_parse_errors();

namespace asn1opt
{
ASN1OPT_PUBLIC void ParseError(const char*, ...) __attribute__((format (printf, 1, 2)));

ASN1OPT_PUBLIC void LogMessage(const char*, ...) __attribute__((format (printf, 1, 2)));
ASN1OPT_PUBLIC void LogMessage(FILE*, const char*, ...) __attribute__((format (printf, 2, 3)));
ASN1OPT_PUBLIC void ErrorMessage(const char*, ...) __attribute__((format (printf, 1, 2)));

// only printed when debug output is enabled
ASN1OPT_PUBLIC void DebugMessage(const char*, ...) __attribute__((format (printf, 1, 2)));

[[noreturn]] ASN1OPT_PUBLIC void FatalError(const char*, ...) __attribute__((format (printf, 1, 2)));

class ASN1OPT_PUBLIC ConfigLogger final
{
public:
    ConfigLogger() = delete;

    static void log_option(const char* caption);

    static bool log_flag(const char* caption, bool flag, bool subopt = false);

    static void log_value(const char* caption, int64_t n, bool subopt = false);
    static void log_value(const char* caption, uint64_t n, bool subopt = false);
    static void log_value(const char* caption, const char* str, bool subopt = false);

private:
    static constexpr int indention = 25;
};
}

#endif

