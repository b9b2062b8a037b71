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
// help.cc author Russ Combs <rucombs@cisco.com>

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "help.h"

#include <cstdlib>
#include <iostream>

#include "framework/parameter.h"
#include "ips_options/asn1_parse.h"
#include "ips_options/ips_asn1.h"
#include "lua/lua.h"
#include "parser/cmd_line.h"

using namespace asn1opt;
using namespace std;

static void help_args(const Parameter* p)
{
    while ( p->name )
    {
        if ( p->help )
        {
            cout << "    " << p->name;
            cout << " " << p->help;

            if ( const char* r = p->get_range() )
            {
                if ( *r == '(' )
                    cout << " " << r;
                else
                    cout << " (" << r << ")";
            }
            cout << endl;
        }
        ++p;
    }
}

[[noreturn]] void help_usage(const char* s)
{
    cout << "usage:" << endl;
    cout << "    " << s << " [-options] <option string>...: parse option strings" << endl;
    cout << "    " << s << " [-options] < rules.txt: parse one option string per line" << endl;
    cout << endl;
    cout << "options:" << endl;
    help_args(get_cmd_params());
    exit(0);
}

[[noreturn]] void help_rule_options()
{
    cout << "asn1: rule option for asn1 detection" << endl;
    help_args(asn1_get_params());
    cout << endl;
    cout << "config:" << endl;
    cout << "    " << ASN1_MAX_FRAMES_KEY << " = <0:65535>" << endl;
    exit(0);
}

[[noreturn]] void help_version()
{
    cout << "asn1opt version " << ASN1OPT_VERSION << endl;
    cout << "Using " << LUAJIT_VERSION << endl;
    exit(0);
}

