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

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "asn1_api.h"

#include <exception>
#include <memory>

#include "ips_options/ips_asn1.h"
#include "log/messages.h"
#include "main/lua_conf.h"

using namespace asn1opt;

static std::unique_ptr<LuaConf> s_conf;

asn1opt_options_t* asn1opt_parse(const char* text)
{
    try
    {
        return asn1_parse(text, s_conf.get()).release();
    }
    catch ( const std::exception& e )
    {
        ErrorMessage("asn1: %s\n", e.what());
    }
    return nullptr;
}

void asn1opt_free(asn1opt_options_t* p)
{
    delete p;
}

bool asn1opt_bitstring_overflow(const asn1opt_options_t* p)
{ return p->bitstring_overflow; }

bool asn1opt_double_overflow(const asn1opt_options_t* p)
{ return p->double_overflow; }

template <typename T>
static bool get_opt(const std::optional<T>& o, T* v)
{
    if ( !o )
        return false;

    if ( v )
        *v = *o;

    return true;
}

bool asn1opt_oversize_length(const asn1opt_options_t* p, uint32_t* v)
{ return get_opt(p->oversize_length, v); }

bool asn1opt_absolute_offset(const asn1opt_options_t* p, uint32_t* v)
{ return get_opt(p->absolute_offset, v); }

bool asn1opt_relative_offset(const asn1opt_options_t* p, int32_t* v)
{ return get_opt(p->relative_offset, v); }

uint16_t asn1opt_max_frames(const asn1opt_options_t* p)
{ return p->max_frames; }

template <typename F>
static int load_conf(F load)
{
    try
    {
        std::unique_ptr<LuaConf> conf(new LuaConf);

        if ( !load(*conf) )
            return -1;

        s_conf = std::move(conf);
        return 0;
    }
    catch ( const std::exception& e )
    {
        ErrorMessage("asn1: %s\n", e.what());
    }
    return -1;
}

int asn1opt_conf_load_file(const char* path)
{
    if ( !path )
        return -1;

    return load_conf([path](LuaConf& c) { return c.load_file(path); });
}

int asn1opt_conf_load_string(const char* chunk)
{
    if ( !chunk )
        return -1;

    return load_conf([chunk](LuaConf& c) { return c.load_string(chunk); });
}

void asn1opt_conf_clear()
{
    s_conf.reset();
}

const char* asn1opt_version()
{
    return ASN1OPT_VERSION;
}

