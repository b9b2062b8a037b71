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
// ips_asn1_test.cc

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <map>
#include <memory>
#include <string>

#include "ips_options/ips_asn1.h"
#include "log/messages.h"
#include "main/conf_provider.h"

#include <CppUTest/CommandLineTestRunner.h>
#include <CppUTest/TestHarness.h>

using namespace asn1opt;

//-------------------------------------------------------------------------
// stubs, spies, etc.
//-------------------------------------------------------------------------

static unsigned s_parse_errors = 0;
static unsigned s_debug_messages = 0;

namespace asn1opt
{
void ParseError(const char*, ...)
{ s_parse_errors++; }

void DebugMessage(const char*, ...)
{ s_debug_messages++; }

void ConfigLogger::log_option(const char*) { }
bool ConfigLogger::log_flag(const char*, bool flag, bool) { return flag; }
void ConfigLogger::log_value(const char*, int64_t, bool) { }
void ConfigLogger::log_value(const char*, uint64_t, bool) { }
void ConfigLogger::log_value(const char*, const char*, bool) { }
}

class MapConf : public ConfProvider
{
public:
    bool get(const char* key, std::string& value) const override
    {
        ++queries;
        auto it = values.find(key);

        if ( it == values.end() )
            return false;

        value = it->second;
        return true;
    }

    std::map<std::string, std::string> values;
    mutable unsigned queries = 0;
};

//-------------------------------------------------------------------------
// input validation
//-------------------------------------------------------------------------

TEST_GROUP(ips_asn1_input)
{
    void setup() override
    {
        s_parse_errors = 0;
        s_debug_messages = 0;
    }
};

TEST(ips_asn1_input, null_input)
{
    Asn1Status status;
    std::unique_ptr<Asn1Options> opts = asn1_parse(nullptr, nullptr, &status);

    CHECK(!opts);
    LONGS_EQUAL(ASN1_NULL_INPUT, status.error);
    UNSIGNED_LONGS_EQUAL(1, s_parse_errors);
}

TEST(ips_asn1_input, invalid_utf8)
{
    Asn1Status status;
    std::unique_ptr<Asn1Options> opts = asn1_parse("oversize_length 1\xC3(", nullptr, &status);

    CHECK(!opts);
    LONGS_EQUAL(ASN1_INVALID_ENCODING, status.error);
    STRCMP_EQUAL("\xC3(", status.remainder.c_str());
    UNSIGNED_LONGS_EQUAL(1, s_parse_errors);
}

TEST(ips_asn1_input, utf8_but_not_grammar)
{
    Asn1Status status;
    std::unique_ptr<Asn1Options> opts = asn1_parse("oversize_length \xC3\xA9", nullptr, &status);

    CHECK(!opts);
    LONGS_EQUAL(ASN1_UNRECOGNIZED_OPTION, status.error);
}

TEST(ips_asn1_input, empty_input)
{
    Asn1Status status;
    std::unique_ptr<Asn1Options> opts = asn1_parse("", nullptr, &status);

    CHECK(!opts);
    LONGS_EQUAL(ASN1_EMPTY_INPUT, status.error);
    UNSIGNED_LONGS_EQUAL(1, s_parse_errors);
}

TEST(ips_asn1_input, failure_exposes_nothing)
{
    std::unique_ptr<Asn1Options> opts = asn1_parse("bitstring_overflow, bogus", nullptr);

    CHECK(!opts);
    UNSIGNED_LONGS_EQUAL(1, s_parse_errors);
}

TEST(ips_asn1_input, status_is_optional)
{
    std::unique_ptr<Asn1Options> opts = asn1_parse("double_overflow", nullptr);

    CHECK(opts != nullptr);
    CHECK_TRUE(opts->double_overflow);
    UNSIGNED_LONGS_EQUAL(0, s_parse_errors);
}

TEST(ips_asn1_input, status_cleared_on_success)
{
    Asn1Status status;
    status.error = ASN1_NUMERIC_OVERFLOW;
    status.remainder = "stale";

    std::unique_ptr<Asn1Options> opts = asn1_parse("absolute_offset 3", nullptr, &status);

    CHECK(opts != nullptr);
    CHECK_TRUE(status.ok());
    CHECK_TRUE(status.remainder.empty());
}

TEST(ips_asn1_input, independent_results)
{
    std::unique_ptr<Asn1Options> a = asn1_parse("oversize_length 5", nullptr);
    std::unique_ptr<Asn1Options> b = asn1_parse("oversize_length 5", nullptr);

    CHECK(a != nullptr);
    CHECK(b != nullptr);
    CHECK(a.get() != b.get());
    CHECK(*a == *b);

    a->oversize_length = 6;
    UNSIGNED_LONGS_EQUAL(5, *b->oversize_length);
}

//-------------------------------------------------------------------------
// max_frames override
//-------------------------------------------------------------------------

TEST_GROUP(ips_asn1_conf)
{
    MapConf conf;

    void setup() override
    {
        s_parse_errors = 0;
        s_debug_messages = 0;
    }

    unsigned max_frames(const char* val)
    {
        conf.values[ASN1_MAX_FRAMES_KEY] = val;
        std::unique_ptr<Asn1Options> opts = asn1_parse("bitstring_overflow", &conf);
        CHECK(opts != nullptr);
        return opts ? opts->max_frames : 0;
    }
};

TEST(ips_asn1_conf, no_provider)
{
    std::unique_ptr<Asn1Options> opts = asn1_parse("bitstring_overflow", nullptr);

    CHECK(opts != nullptr);
    UNSIGNED_LONGS_EQUAL(ASN1_DEFAULT_MAX_FRAMES, opts->max_frames);
}

TEST(ips_asn1_conf, key_not_set)
{
    std::unique_ptr<Asn1Options> opts = asn1_parse("bitstring_overflow", &conf);

    CHECK(opts != nullptr);
    UNSIGNED_LONGS_EQUAL(30, opts->max_frames);
    UNSIGNED_LONGS_EQUAL(1, conf.queries);
    UNSIGNED_LONGS_EQUAL(0, s_debug_messages);
}

TEST(ips_asn1_conf, valid_override)
{
    UNSIGNED_LONGS_EQUAL(64, max_frames("64"));
    UNSIGNED_LONGS_EQUAL(0, max_frames("0"));
    UNSIGNED_LONGS_EQUAL(65535, max_frames("65535"));
    UNSIGNED_LONGS_EQUAL(0, s_debug_messages);
}

TEST(ips_asn1_conf, leading_zeros)
{
    UNSIGNED_LONGS_EQUAL(64, max_frames("00064"));
    UNSIGNED_LONGS_EQUAL(64, max_frames("000064"));
    UNSIGNED_LONGS_EQUAL(64, max_frames("0000000000064"));
    UNSIGNED_LONGS_EQUAL(65535, max_frames("0000000065535"));
    UNSIGNED_LONGS_EQUAL(0, max_frames("0000000000000"));
    UNSIGNED_LONGS_EQUAL(0, s_debug_messages);

    UNSIGNED_LONGS_EQUAL(30, max_frames("0000000065536"));
    UNSIGNED_LONGS_EQUAL(30, max_frames("00000000000064x"));
    UNSIGNED_LONGS_EQUAL(2, s_debug_messages);
}

TEST(ips_asn1_conf, invalid_override_ignored)
{
    UNSIGNED_LONGS_EQUAL(30, max_frames("65536"));
    UNSIGNED_LONGS_EQUAL(30, max_frames("-1"));
    UNSIGNED_LONGS_EQUAL(30, max_frames("abc"));
    UNSIGNED_LONGS_EQUAL(30, max_frames(""));
    UNSIGNED_LONGS_EQUAL(30, max_frames(" 64"));
    UNSIGNED_LONGS_EQUAL(30, max_frames("64.5"));
    UNSIGNED_LONGS_EQUAL(30, max_frames("0x40"));
    UNSIGNED_LONGS_EQUAL(30, max_frames("999999999999"));
    UNSIGNED_LONGS_EQUAL(30, max_frames("99999999999999999999999999"));

    UNSIGNED_LONGS_EQUAL(9, s_debug_messages);
    UNSIGNED_LONGS_EQUAL(0, s_parse_errors);
}

TEST(ips_asn1_conf, not_queried_on_failure)
{
    conf.values[ASN1_MAX_FRAMES_KEY] = "64";
    std::unique_ptr<Asn1Options> opts = asn1_parse("nope", &conf);

    CHECK(!opts);
    UNSIGNED_LONGS_EQUAL(0, conf.queries);
}

TEST(ips_asn1_conf, apply_conf)
{
    Asn1Options opts;

    conf.values[ASN1_MAX_FRAMES_KEY] = "12";
    CHECK_TRUE(asn1_apply_conf(opts, conf));
    UNSIGNED_LONGS_EQUAL(12, opts.max_frames);

    conf.values[ASN1_MAX_FRAMES_KEY] = "70000";
    CHECK_FALSE(asn1_apply_conf(opts, conf));
    UNSIGNED_LONGS_EQUAL(12, opts.max_frames);
}

int main(int argc, char* argv[])
{
    return CommandLineTestRunner::RunAllTests(argc, argv);
}

