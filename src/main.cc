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
// main.cc author Russ Combs <rucombs@cisco.com>

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <iostream>
#include <memory>
#include <string>

#include "ips_options/ips_asn1.h"
#include "log/messages.h"
#include "main/asn1opt_config.h"
#include "main/lua_conf.h"
#include "parser/cmd_line.h"

#ifdef UNIT_TEST
#include "catch/unit_test.h"
#endif

using namespace asn1opt;

//-------------------------------------------------------------------------

static bool parse_one(const std::string& text, const ConfProvider* conf)
{
    std::unique_ptr<Asn1Options> opts = asn1_parse(text.c_str(), conf);

    if ( !opts )
        return false;

    LogMessage("%s\n", text.c_str());
    opts->show();
    return true;
}

static unsigned parse_args(const Asn1optConfig& sc, const ConfProvider* conf)
{
    unsigned failed = 0;
    unsigned n = 0;

    for ( const auto& text : sc.inputs )
    {
        set_parse_location("arg", ++n);

        if ( !parse_one(text, conf) )
            ++failed;
    }
    return failed;
}

static unsigned parse_stdin(const ConfProvider* conf)
{
    unsigned failed = 0;
    unsigned line = 0;
    std::string text;

    while ( std::getline(std::cin, text) )
    {
        set_parse_location("stdin", ++line);

        if ( text.empty() or text[0] == '#' )
            continue;

        if ( !parse_one(text, conf) )
            ++failed;
    }
    return failed;
}

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    std::unique_ptr<Asn1optConfig> sc = parse_cmd_line(argc, argv);

    set_log_quiet(sc->quiet);
    set_log_debug(sc->debug);
    set_log_syslog(sc->syslog);

#ifdef UNIT_TEST
    if ( catch_enabled() )
        return catch_test();
#endif

    std::unique_ptr<LuaConf> conf;

    if ( !sc->conf_file.empty() or !sc->lua.empty() )
    {
        conf.reset(new LuaConf);

        if ( !sc->conf_file.empty() )
            conf->load_file(sc->conf_file.c_str());

        if ( !sc->lua.empty() )
            conf->load_string(sc->lua.c_str(), "--lua");

        if ( unsigned k = get_parse_errors() )
            FatalError("see prior %u errors\n", k);
    }

    unsigned failed = sc->inputs.empty() ?
        parse_stdin(conf.get()) : parse_args(*sc, conf.get());

    set_parse_location(nullptr, 0);

    if ( failed )
    {
        ErrorMessage("%u option strings failed to parse\n", failed);
        return 1;
    }
    return 0;
}

