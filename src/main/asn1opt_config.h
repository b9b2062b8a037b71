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

#ifndef ASN1OPT_CONFIG_H
#define ASN1OPT_CONFIG_H

// settings of the asn1opt tool gathered from the command line

#include <string>
#include <vector>

struct Asn1optConfig
{
    std::string conf_file;
    std::string lua;

    // option strings given on the command line; stdin is read if empty
    std::vector<std::string> inputs;

    bool quiet = false;
    bool debug = false;
    bool syslog = false;
};

#endif

