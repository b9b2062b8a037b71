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
// cmd_line.h author Russ Combs <rucombs@cisco.com>

#ifndef CMD_LINE_H
#define CMD_LINE_H

#include <memory>

#include "main/asn1opt_config.h"

namespace asn1opt
{
struct Parameter;
}

// help and version options exit immediately
std::unique_ptr<Asn1optConfig> parse_cmd_line(int argc, char* argv[]);

const asn1opt::Parameter* get_cmd_params();

#endif

