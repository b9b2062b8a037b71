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
// cmd_line.cc author Russ Combs <rucombs@cisco.com>

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "cmd_line.h"

#include <cstring>
#include <string>

#include "framework/parameter.h"
#include "log/messages.h"
#include "main/help.h"

#ifdef UNIT_TEST
#include <catch2/catch.hpp>

#include "catch/unit_test.h"
#endif

#include "arg_list.h"

using namespace asn1opt;
using namespace std;

static const Parameter s_cmd_params[] =
{
    { "-?", Parameter::PT_IMPLIED, nullptr, nullptr,
      "list command line options" },

    { "-c", Parameter::PT_STRING, nullptr, nullptr,
      "<conf> use this Lua configuration" },

    { "-d", Parameter::PT_IMPLIED, nullptr, nullptr,
      "enable debug messages" },

    { "-M", Parameter::PT_IMPLIED, nullptr, nullptr,
      "log messages to syslog (not alerts)" },

    { "-q", Parameter::PT_IMPLIED, nullptr, nullptr,
      "quiet mode - suppress normal logging on stdout" },

    { "-V", Parameter::PT_IMPLIED, nullptr, nullptr,
      "(same as --version)" },

    { "--catch-test", Parameter::PT_STRING, "(optional)", nullptr,
      "comma separated list of catch unit test tags or 'all'" },

    { "--help", Parameter::PT_IMPLIED, nullptr, nullptr,
      "list command line options" },

    { "--help-options", Parameter::PT_IMPLIED, nullptr, nullptr,
      "list the asn1 rule option keywords" },

    { "--lua", Parameter::PT_STRING, nullptr, nullptr,
      "<chunk> extend/override conf with chunk; may be repeated" },

    { "--version", Parameter::PT_IMPLIED, nullptr, nullptr,
      "show version number (same as -V)" },

    { nullptr, Parameter::PT_MAX, nullptr, nullptr, nullptr }
};

const Parameter* get_cmd_params()
{ return s_cmd_params; }

//-------------------------------------------------------------------------

static bool set_arg(
    const Parameter* p, const char* val, Asn1optConfig& sc, const char* prog)
{
    const char* name = p->name;

    switch ( p->type )
    {
    case Parameter::PT_IMPLIED:
        if ( *val )
            return false;
        break;

    case Parameter::PT_STRING:
        if ( !*val and !(p->range and !strcmp(p->range, "(optional)")) )
            return false;
        break;

    default:
        return false;
    }

    if ( !strcmp(name, "-?") or !strcmp(name, "--help") )
        help_usage(prog);

    else if ( !strcmp(name, "--help-options") )
        help_rule_options();

    else if ( !strcmp(name, "-V") or !strcmp(name, "--version") )
        help_version();

    else if ( !strcmp(name, "-c") )
        sc.conf_file = val;

    else if ( !strcmp(name, "-d") )
        sc.debug = true;

    else if ( !strcmp(name, "-M") )
        sc.syslog = true;

    else if ( !strcmp(name, "-q") )
        sc.quiet = true;

    else if ( !strcmp(name, "--lua") )
    {
        if ( !sc.lua.empty() )
            sc.lua += "\n";
        sc.lua += val;
    }
    else if ( !strcmp(name, "--catch-test") )
    {
#ifdef UNIT_TEST
        catch_set_filter(*val ? val : "all");
#else
        ParseError("--catch-test requires a build with unit tests");
#endif
    }
    else
        return false;

    return true;
}

static void set(const char* key, const char* val, Asn1optConfig& sc, const char* prog)
{
    if ( !*key )
    {
        sc.inputs.emplace_back(val);
        return;
    }

    string k = "-";
    if ( strlen(key) > 1 )
        k += "-";
    k += key;

    const Parameter* p = Parameter::find(s_cmd_params, k.c_str());

    if ( !p )
    {
        ParseError("unknown option %s %s", k.c_str(), val);
        return;
    }

    // flags don't take values so anything picked up is an input
    if ( p->type == Parameter::PT_IMPLIED and *val )
    {
        sc.inputs.emplace_back(val);
        val = "";
    }

    if ( !set_arg(p, val, sc, prog) )
    {
        ParseError("can't set %s %s", k.c_str(), val);
        ParseError("usage: %s %s", k.c_str(), p->help);
    }
}

//-------------------------------------------------------------------------

std::unique_ptr<Asn1optConfig> parse_cmd_line(int argc, char* argv[])
{
    std::unique_ptr<Asn1optConfig> sc(new Asn1optConfig);

    ArgList al(argc, argv);
    const char* key, * val;

    while ( al.get_arg(key, val) )
        ::set(key, val, *sc, argv[0]);

    if ( unsigned k = get_parse_errors() )
        FatalError("see prior %u errors\n", k);

    return sc;
}

//-------------------------------------------------------------------------
// unit tests
//-------------------------------------------------------------------------

#ifdef UNIT_TEST
TEST_CASE("flags and inputs", "[cmd_line]")
{
    char a0[] = "asn1opt", a1[] = "-q", a2[] = "bitstring_overflow", a3[] = "-d",
        a4[] = "--lua", a5[] = "asn1 = { max_frames = 5 }", a6[] = "--", a7[] = "-c";
    char* argv[] = { a0, a1, a2, a3, a4, a5, a6, a7 };

    std::unique_ptr<Asn1optConfig> sc = parse_cmd_line(8, argv);

    CHECK(sc->quiet);
    CHECK(sc->debug);
    CHECK(!sc->syslog);
    CHECK(sc->conf_file.empty());
    CHECK(sc->lua == "asn1 = { max_frames = 5 }");

    REQUIRE(sc->inputs.size() == 2);
    CHECK(sc->inputs[0] == "bitstring_overflow");
    CHECK(sc->inputs[1] == "-c");
}
#endif
