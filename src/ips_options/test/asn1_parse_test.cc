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
// asn1_parse_test.cc

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <cstring>
#include <string>

#include "framework/parameter.h"
#include "ips_options/asn1_options.h"
#include "ips_options/asn1_parse.h"

#include <CppUTest/CommandLineTestRunner.h>
#include <CppUTest/TestHarness.h>

using namespace asn1opt;

//-------------------------------------------------------------------------
// helpers
//-------------------------------------------------------------------------

static bool parse(const char* s, Asn1Options& opts, Asn1Status& status)
{
    return asn1_parse_options(s, strlen(s), opts, status);
}

static Asn1Options expect_ok(const char* s)
{
    Asn1Options opts;
    Asn1Status status;

    CHECK_TRUE(parse(s, opts, status));
    LONGS_EQUAL(ASN1_OK, status.error);
    CHECK_TRUE(status.remainder.empty());

    return opts;
}

static void expect_error(const char* s, Asn1Error e, const char* rest)
{
    Asn1Options opts;
    Asn1Status status;

    CHECK_FALSE(parse(s, opts, status));
    LONGS_EQUAL(e, status.error);
    STRCMP_EQUAL(rest, status.remainder.c_str());
}

//-------------------------------------------------------------------------
// grammar
//-------------------------------------------------------------------------

TEST_GROUP(asn1_grammar)
{ };

TEST(asn1_grammar, keyword_table)
{
    const Parameter* p = asn1_get_params();

    STRCMP_EQUAL("bitstring_overflow", p[0].name);
    STRCMP_EQUAL("double_overflow", p[1].name);
    STRCMP_EQUAL("oversize_length", p[2].name);
    STRCMP_EQUAL("absolute_offset", p[3].name);
    STRCMP_EQUAL("relative_offset", p[4].name);
    CHECK(p[5].name == nullptr);

    CHECK(p[0].type == Parameter::PT_IMPLIED);
    CHECK(p[2].type == Parameter::PT_INT);
    CHECK_FALSE(p[2].is_signed());
    CHECK_TRUE(p[4].is_signed());
}

TEST(asn1_grammar, bitstring_overflow)
{
    Asn1Options opts = expect_ok("bitstring_overflow");
    Asn1Options expected;
    expected.bitstring_overflow = true;

    CHECK(opts == expected);
}

TEST(asn1_grammar, double_overflow)
{
    Asn1Options opts = expect_ok("double_overflow");
    Asn1Options expected;
    expected.double_overflow = true;

    CHECK(opts == expected);
}

TEST(asn1_grammar, oversize_length)
{
    Asn1Options opts = expect_ok("oversize_length 1024");

    CHECK_TRUE(opts.oversize_length.has_value());
    UNSIGNED_LONGS_EQUAL(1024, *opts.oversize_length);
    CHECK_FALSE(opts.absolute_offset.has_value());
    CHECK_FALSE(opts.relative_offset.has_value());
    UNSIGNED_LONGS_EQUAL(30, opts.max_frames);
}

TEST(asn1_grammar, absolute_offset)
{
    Asn1Options opts = expect_ok("absolute_offset 1024");

    CHECK_TRUE(opts.absolute_offset.has_value());
    UNSIGNED_LONGS_EQUAL(1024, *opts.absolute_offset);
    CHECK_FALSE(opts.is_relative());
}

TEST(asn1_grammar, relative_offset)
{
    Asn1Options opts = expect_ok("relative_offset 1024");

    CHECK_TRUE(opts.is_relative());
    LONGS_EQUAL(1024, *opts.relative_offset);

    opts = expect_ok("relative_offset -7");
    LONGS_EQUAL(-7, *opts.relative_offset);
}

TEST(asn1_grammar, argument_after_whitespace_run)
{
    Asn1Options opts = expect_ok("oversize_length \t\n 12");
    UNSIGNED_LONGS_EQUAL(12, *opts.oversize_length);
}

TEST(asn1_grammar, missing_argument)
{
    expect_error("oversize_length", ASN1_UNRECOGNIZED_OPTION, "oversize_length");
    expect_error("absolute_offset", ASN1_UNRECOGNIZED_OPTION, "absolute_offset");
    expect_error("relative_offset", ASN1_UNRECOGNIZED_OPTION, "relative_offset");
    expect_error("oversize_length ", ASN1_UNRECOGNIZED_OPTION, "oversize_length ");
}

TEST(asn1_grammar, argument_needs_whitespace)
{
    expect_error("oversize_length,5", ASN1_UNRECOGNIZED_OPTION, "oversize_length,5");
    expect_error("oversize_length5", ASN1_UNRECOGNIZED_OPTION, "oversize_length5");
}

TEST(asn1_grammar, unsigned_rejects_sign)
{
    expect_error("absolute_offset -1", ASN1_UNRECOGNIZED_OPTION, "absolute_offset -1");
    expect_error("oversize_length +1", ASN1_UNRECOGNIZED_OPTION, "oversize_length +1");
}

TEST(asn1_grammar, case_sensitive)
{
    expect_error("Bitstring_overflow", ASN1_UNRECOGNIZED_OPTION, "Bitstring_overflow");
    expect_error("DOUBLE_OVERFLOW", ASN1_UNRECOGNIZED_OPTION, "DOUBLE_OVERFLOW");
}

//-------------------------------------------------------------------------
// numeric limits
//-------------------------------------------------------------------------

TEST_GROUP(asn1_numbers)
{ };

TEST(asn1_numbers, unsigned_max)
{
    Asn1Options opts = expect_ok("oversize_length 4294967295");
    UNSIGNED_LONGS_EQUAL(4294967295u, *opts.oversize_length);

    opts = expect_ok("absolute_offset 0");
    UNSIGNED_LONGS_EQUAL(0, *opts.absolute_offset);
}

TEST(asn1_numbers, unsigned_overflow)
{
    expect_error("oversize_length 4294967296", ASN1_NUMERIC_OVERFLOW,
        "oversize_length 4294967296");

    expect_error("bitstring_overflow, absolute_offset 99999999999999999999999",
        ASN1_NUMERIC_OVERFLOW, "absolute_offset 99999999999999999999999");
}

TEST(asn1_numbers, signed_limits)
{
    Asn1Options opts = expect_ok("relative_offset 2147483647");
    LONGS_EQUAL(2147483647, *opts.relative_offset);

    opts = expect_ok("relative_offset -2147483648");
    CHECK(*opts.relative_offset == INT32_MIN);
}

TEST(asn1_numbers, signed_overflow)
{
    expect_error("relative_offset 2147483648", ASN1_NUMERIC_OVERFLOW,
        "relative_offset 2147483648");

    expect_error("relative_offset -2147483649", ASN1_NUMERIC_OVERFLOW,
        "relative_offset -2147483649");

    expect_error("relative_offset -4294967296", ASN1_NUMERIC_OVERFLOW,
        "relative_offset -4294967296");
}

TEST(asn1_numbers, negative_zero)
{
    Asn1Options opts = expect_ok("relative_offset -0");

    CHECK_TRUE(opts.relative_offset.has_value());
    LONGS_EQUAL(0, *opts.relative_offset);
}

TEST(asn1_numbers, leading_zeros)
{
    Asn1Options opts = expect_ok("oversize_length 000000000000010");
    UNSIGNED_LONGS_EQUAL(10, *opts.oversize_length);
}

//-------------------------------------------------------------------------
// parser engine
//-------------------------------------------------------------------------

TEST_GROUP(asn1_parser)
{ };

TEST(asn1_parser, empty_input)
{
    expect_error("", ASN1_EMPTY_INPUT, "");
}

TEST(asn1_parser, whitespace_only)
{
    expect_error(" \t\n", ASN1_UNRECOGNIZED_OPTION, "");
}

TEST(asn1_parser, unknown_option)
{
    expect_error("oversize_length 1024, some_other_param 360",
        ASN1_UNRECOGNIZED_OPTION, "some_other_param 360");
}

TEST(asn1_parser, double_comma)
{
    expect_error("oversize_length 1024,,", ASN1_UNRECOGNIZED_OPTION, ",");
}

TEST(asn1_parser, leading_comma)
{
    expect_error(",bitstring_overflow", ASN1_UNRECOGNIZED_OPTION, ",bitstring_overflow");
}

TEST(asn1_parser, space_before_comma)
{
    expect_error("bitstring_overflow , double_overflow", ASN1_UNRECOGNIZED_OPTION,
        ", double_overflow");
}

TEST(asn1_parser, trailing_separator)
{
    Asn1Options expected;
    expected.bitstring_overflow = true;

    CHECK(expect_ok("bitstring_overflow,") == expected);
    CHECK(expect_ok("bitstring_overflow \n") == expected);
    CHECK(expect_ok("\n\t bitstring_overflow") == expected);
}

TEST(asn1_parser, combinations)
{
    Asn1Options expected;
    expected.oversize_length = 1024;
    expected.relative_offset = 10;

    CHECK(expect_ok("oversize_length 1024, relative_offset 10") == expected);

    expected = Asn1Options();
    expected.oversize_length = 1024;
    expected.absolute_offset = 10;
    expected.bitstring_overflow = true;

    CHECK(expect_ok("oversize_length 1024 absolute_offset 10, bitstring_overflow") == expected);
}

TEST(asn1_parser, mixed_separators)
{
    Asn1Options expected;
    expected.double_overflow = true;
    expected.bitstring_overflow = true;
    expected.oversize_length = 1024;
    expected.absolute_offset = 10;

    CHECK(expect_ok(
        "double_overflow, oversize_length 1024 absolute_offset 10,\n bitstring_overflow")
        == expected);

    expected.absolute_offset.reset();
    expected.relative_offset = 10;

    CHECK(expect_ok(
        "\n\t double_overflow, oversize_length 1024 relative_offset 10,\n bitstring_overflow")
        == expected);
}

TEST(asn1_parser, separator_forms_agree)
{
    Asn1Options canonical = expect_ok("oversize_length 1024 absolute_offset 10");

    CHECK(expect_ok("oversize_length 1024,absolute_offset 10") == canonical);
    CHECK(expect_ok("oversize_length 1024, absolute_offset 10") == canonical);
    CHECK(expect_ok("oversize_length 1024,\n\tabsolute_offset 10") == canonical);
    CHECK(expect_ok("oversize_length 1024\n\tabsolute_offset 10") == canonical);
    CHECK(expect_ok("oversize_length 1024\r\nabsolute_offset 10") == canonical);
}

TEST(asn1_parser, order_independent)
{
    Asn1Options a = expect_ok("oversize_length 1024 absolute_offset 10");
    Asn1Options b = expect_ok("absolute_offset 10 oversize_length 1024");

    CHECK(a == b);
    UNSIGNED_LONGS_EQUAL(a.hash(), b.hash());
    UNSIGNED_LONGS_EQUAL(1024, *a.oversize_length);
    UNSIGNED_LONGS_EQUAL(10, *a.absolute_offset);
    CHECK_FALSE(a.bitstring_overflow);
    CHECK_FALSE(a.double_overflow);
    CHECK_FALSE(a.relative_offset.has_value());
}

TEST(asn1_parser, deterministic)
{
    const char* s = "bitstring_overflow, relative_offset -12 oversize_length 7";

    Asn1Options a = expect_ok(s);
    Asn1Options b = expect_ok(s);

    CHECK(a == b);
    UNSIGNED_LONGS_EQUAL(a.hash(), b.hash());
}

TEST(asn1_parser, duplicates_last_wins)
{
    Asn1Options opts = expect_ok("oversize_length 1, oversize_length 2");
    UNSIGNED_LONGS_EQUAL(2, *opts.oversize_length);

    opts = expect_ok("relative_offset 5 relative_offset -5");
    LONGS_EQUAL(-5, *opts.relative_offset);

    opts = expect_ok("bitstring_overflow bitstring_overflow");
    CHECK_TRUE(opts.bitstring_overflow);
}

TEST(asn1_parser, abutting_clauses_rejected)
{
    expect_error("bitstring_overflowabsolute_offset 1", ASN1_UNRECOGNIZED_OPTION,
        "bitstring_overflowabsolute_offset 1");

    expect_error("double_overflow, bitstring_overflowdouble_overflow",
        ASN1_UNRECOGNIZED_OPTION, "bitstring_overflowdouble_overflow");

    expect_error("oversize_length 10bitstring_overflow", ASN1_UNRECOGNIZED_OPTION,
        "oversize_length 10bitstring_overflow");

    expect_error("bitstring_overflowx", ASN1_UNRECOGNIZED_OPTION, "bitstring_overflowx");
}

TEST(asn1_parser, error_names)
{
    Asn1Status status;
    STRCMP_EQUAL("ok", status.get_error_name());

    status.error = ASN1_EMPTY_INPUT;
    STRCMP_EQUAL("empty input", status.get_error_name());

    status.error = ASN1_UNRECOGNIZED_OPTION;
    STRCMP_EQUAL("unrecognized option", status.get_error_name());

    status.error = ASN1_NUMERIC_OVERFLOW;
    STRCMP_EQUAL("numeric overflow", status.get_error_name());

    status.error = ASN1_INVALID_ENCODING;
    STRCMP_EQUAL("invalid encoding", status.get_error_name());
}

TEST(asn1_parser, string_overload)
{
    std::string s = "double_overflow";
    Asn1Options opts;
    Asn1Status status;

    CHECK_TRUE(asn1_parse_options(s, opts, status));
    CHECK_TRUE(opts.double_overflow);
}

TEST(asn1_parser, length_bounds_input)
{
    // only the first n bytes are parsed
    const char* s = "bitstring_overflow garbage";
    Asn1Options opts;
    Asn1Status status;

    CHECK_TRUE(asn1_parse_options(s, strlen("bitstring_overflow"), opts, status));
    CHECK_TRUE(opts.bitstring_overflow);
}

int main(int argc, char* argv[])
{
    return CommandLineTestRunner::RunAllTests(argc, argv);
}

