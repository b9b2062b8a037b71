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

#include "messages.h"

#include <syslog.h>

#include <atomic>
#include <cstdlib>
#include <cstring>

#ifdef UNIT_TEST
#include <thread>
#include <vector>

#include <catch2/catch.hpp>
#endif

using namespace asn1opt;

static bool s_quiet = false;
static bool s_syslog = false;
static bool s_debug = false;

static std::atomic<bool> already_fatal { false };

// parse calls may fail concurrently
static std::atomic<unsigned> parse_errors { 0 };

static thread_local const char* parse_file_name = nullptr;
static thread_local unsigned parse_file_line = 0;

void set_log_quiet(bool b)
{ s_quiet = b; }

void set_log_syslog(bool b)
{ s_syslog = b; }

void set_log_debug(bool b)
{ s_debug = b; }

void set_parse_location(const char* name, unsigned line)
{
    parse_file_name = name;
    parse_file_line = line;
}

void get_parse_location(const char*& name, unsigned& line)
{
    name = parse_file_name;
    line = parse_file_line;
}

void reset_parse_errors()
{
    parse_errors = 0;
}

unsigned get_parse_errors()
{
    return parse_errors.exchange(0);
}

static void log_message(FILE* file, const char* type, const char* msg)
{
    const char* file_name;
    unsigned file_line;
    get_parse_location(file_name, file_line);

    if ( file_line )
        LogMessage(file, "%s: %s:%u %s\n", type, file_name ? file_name : "", file_line, msg);

    else if ( file_name )
        LogMessage(file, "%s: %s: %s\n", type, file_name, msg);

    else
        LogMessage(file, "%s: %s\n", type, msg);
}

static void WriteLogMessage(FILE* fh, bool prefer_fh, int priority, const char* format, va_list& ap)
{
    if ( prefer_fh or !s_syslog )
    {
        vfprintf(fh, format, ap);
        return;
    }
    char buf[STD_BUF+1];
    vsnprintf(buf, STD_BUF, format, ap);
    buf[STD_BUF] = '\0';
    syslog(LOG_DAEMON | priority, "%s", buf);
}

namespace asn1opt
{
void ParseError(const char* format, ...)
{
    char buf[STD_BUF+1];
    va_list ap;

    va_start(ap, format);
    vsnprintf(buf, STD_BUF, format, ap);
    va_end(ap);

    buf[STD_BUF] = '\0';
    log_message(stderr, "ERROR", buf);

    parse_errors++;
}

// print an info message to stdout or syslog
void LogMessage(const char* format,...)
{
    if ( s_quiet )
        return;

    va_list ap;
    va_start(ap, format);

    WriteLogMessage(stdout, false, LOG_NOTICE, format, ap);

    va_end(ap);
}

void LogMessage(FILE* fh, const char* format,...)
{
    if ( fh == stdout and s_quiet )
        return;

    va_list ap;
    va_start(ap, format);

    WriteLogMessage(fh, (fh != stdout && fh != stderr), LOG_NOTICE, format, ap);

    va_end(ap);
}

// print an error message to stderr or syslog
void ErrorMessage(const char* format,...)
{
    va_list ap;
    va_start(ap, format);

    WriteLogMessage(stderr, false, LOG_ERR, format, ap);

    va_end(ap);
}

void DebugMessage(const char* format,...)
{
    if ( !s_debug )
        return;

    char buf[STD_BUF+1];
    va_list ap;

    va_start(ap, format);
    vsnprintf(buf, STD_BUF, format, ap);
    va_end(ap);

    buf[STD_BUF] = '\0';

    if ( s_syslog )
        syslog(LOG_DAEMON | LOG_DEBUG, "%s", buf);
    else
        fprintf(stderr, "DEBUG: %s", buf);
}

// when a fatal error occurs, this function prints the error message
// and exits
[[noreturn]] void FatalError(const char* format,...)
{
    char buf[STD_BUF+1];
    va_list ap;

    // bail now if we are reentering
    if ( already_fatal.exchange(true) )
        exit(1);

    va_start(ap, format);
    vsnprintf(buf, STD_BUF, format, ap);
    va_end(ap);

    buf[STD_BUF] = '\0';

    if ( s_syslog )
        syslog(LOG_CONS | LOG_DAEMON | LOG_ERR, "FATAL ERROR: %s", buf);
    else
    {
        fprintf(stderr, "FATAL: %s", buf);
        fprintf(stderr, "Fatal Error, Quitting..\n");
    }

    exit(EXIT_FAILURE);
}

#define CAPTION "%*s: "
#define SUB_CAPTION "%*s = "

void ConfigLogger::log_option(const char* caption)
{
    LogMessage("%*s:\n", indention, caption);
}

bool ConfigLogger::log_flag(const char* caption, bool flag, bool subopt)
{
    auto fmt = subopt ? SUB_CAPTION "%s\n" : CAPTION "%s\n";
    auto ind = subopt ? indention + strlen(caption) + 2 : indention;

    LogMessage(fmt, (int)ind, caption, flag ? "enabled" : "disabled");
    return flag;
}

void ConfigLogger::log_value(const char* caption, int64_t n, bool subopt)
{
    auto fmt = subopt ? SUB_CAPTION STDi64 "\n" : CAPTION STDi64 "\n";
    auto ind = subopt ? indention + strlen(caption) + 2 : indention;

    LogMessage(fmt, (int)ind, caption, n);
}

void ConfigLogger::log_value(const char* caption, uint64_t n, bool subopt)
{
    auto fmt = subopt ? SUB_CAPTION STDu64 "\n" : CAPTION STDu64 "\n";
    auto ind = subopt ? indention + strlen(caption) + 2 : indention;

    LogMessage(fmt, (int)ind, caption, n);
}

void ConfigLogger::log_value(const char* caption, const char* str, bool subopt)
{
    if ( !str or !str[0] )
        return;

    auto fmt = subopt ? SUB_CAPTION "%s\n" : CAPTION "%s\n";
    auto ind = subopt ? indention + strlen(caption) + 2 : indention;

    LogMessage(fmt, (int)ind, caption, str);
}
}

#ifdef UNIT_TEST
TEST_CASE("parse error counting", "[messages]")
{
    reset_parse_errors();
    set_parse_location("unit", 3);

    ParseError("bad %s", "thing");
    ParseError("worse");

    CHECK(get_parse_errors() == 2);
    CHECK(get_parse_errors() == 0);

    set_parse_location(nullptr, 0);
}

TEST_CASE("parse location", "[messages]")
{
    const char* name = "x";
    unsigned line = 9;

    set_parse_location(nullptr, 0);
    get_parse_location(name, line);

    CHECK(name == nullptr);
    CHECK(line == 0);

    set_parse_location("stdin", 12);
    get_parse_location(name, line);

    CHECK(!strcmp(name, "stdin"));
    CHECK(line == 12);

    set_parse_location(nullptr, 0);
}

TEST_CASE("concurrent parse errors", "[messages]")
{
    const unsigned threads = 4;
    const unsigned per_thread = 200;

    reset_parse_errors();
    set_parse_location("main", 1);

    std::vector<std::thread> workers;
    std::atomic<unsigned> misplaced { 0 };

    for ( unsigned i = 0; i < threads; ++i )
    {
        workers.emplace_back([i, &misplaced]()
        {
            set_parse_location("worker", i + 2);

            for ( unsigned n = 0; n < per_thread; ++n )
            {
                ParseError("bogus");

                const char* name;
                unsigned line;
                get_parse_location(name, line);

                if ( !name or line != i + 2 )
                    ++misplaced;
            }
        });
    }

    for ( auto& t : workers )
        t.join();

    CHECK(get_parse_errors() == threads * per_thread);
    CHECK(misplaced.load() == 0);

    const char* name;
    unsigned line;
    get_parse_location(name, line);

    CHECK(!strcmp(name, "main"));
    CHECK(line == 1);

    set_parse_location(nullptr, 0);
}
#endif

