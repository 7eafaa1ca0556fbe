/*

test_codec.cpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE codec_test

#include <string>
#include <tuple>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailcast/codec/base64.hpp>
#include <mailcast/codec/charset.hpp>
#include <mailcast/codec/codec.hpp>
#include <mailcast/codec/q_codec.hpp>
#include <mailcast/codec/quoted_printable.hpp>


using std::string;
using std::vector;
using mailcast::base64;
using mailcast::charset_converter;
using mailcast::codec;
using mailcast::codec_error;
using mailcast::decode_policy_t;
using mailcast::q_codec;
using mailcast::quoted_printable;

static const auto MANDATORY = static_cast<string::size_type>(codec::line_len_policy_t::MANDATORY);
static const auto NONE = static_cast<string::size_type>(codec::line_len_policy_t::NONE);


/**
Splitting text on both line ending styles.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(split_lines_crlf_and_lf)
{
    vector<string> lines = codec::split_lines("first\r\nsecond\nthird");
    BOOST_REQUIRE_EQUAL(lines.size(), 3u);
    BOOST_CHECK_EQUAL(lines[0], "first");
    BOOST_CHECK_EQUAL(lines[1], "second");
    BOOST_CHECK_EQUAL(lines[2], "third");

    BOOST_CHECK_EQUAL(codec::split_lines("one\n\n").size(), 2u);
}


/**
Decoding Base64 with a quantum spanning two lines.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_base64_multiline)
{
    base64 b64(MANDATORY);
    BOOST_CHECK_EQUAL(b64.decode(vector<string>{"PHA+U29tZSBjb250", "ZW50IGhlcmUuPC9wPg=="}), "<p>Some content here.</p>");
    BOOST_CHECK_EQUAL(b64.decode(string("aGVsbG8=")), "hello");
    BOOST_CHECK_EQUAL(b64.decode(string("aGk")), "hi");
}


/**
Skipping transport noise in lenient mode, rejecting it in strict mode.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_base64_noise)
{
    base64 lenient(MANDATORY);
    BOOST_CHECK_EQUAL(lenient.decode(string("aGVs!bG8=")), "hello");

    base64 strict(MANDATORY);
    strict.strict_mode(true);
    BOOST_CHECK_THROW(strict.decode(string("aGVs!bG8=")), codec_error);
    BOOST_CHECK_THROW(strict.decode(string("aGVsb")), codec_error);
}


/**
Decoding Quoted-Printable soft breaks and escapes.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_quoted_printable)
{
    quoted_printable qp(MANDATORY);
    BOOST_CHECK_EQUAL(qp.decode(vector<string>{"Second line=", "more text"}), "Second linemore text");
    BOOST_CHECK_EQUAL(qp.decode(vector<string>{"Caf=C3=A9 au lait=  ", "!"}), "Caf\xC3\xA9 au lait!");
    BOOST_CHECK_EQUAL(qp.decode(vector<string>{"one", "two"}), "one\ntwo");
    BOOST_CHECK_EQUAL(qp.decode(vector<string>{"<p style=3D\"x\">"}), "<p style=\"x\">");
}


/**
Copying bad escapes through in lenient mode, rejecting them in strict mode.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_quoted_printable_bad_escape)
{
    quoted_printable lenient(MANDATORY);
    BOOST_CHECK_EQUAL(lenient.decode(vector<string>{"100=% sure"}), "100=% sure");

    quoted_printable strict(MANDATORY);
    strict.strict_mode(true);
    BOOST_CHECK_THROW(strict.decode(vector<string>{"100=% sure"}), codec_error);
}


/**
Decoding adjacent encoded words, dropping the whitespace between them.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_encoded_words)
{
    q_codec qc(NONE);
    auto [text, charset, method] = qc.check_decode("=?UTF-8?B?TXkgYXBvY2FseXBzZQ==?= =?UTF-8?Q?:_the_end?= is near!");
    BOOST_CHECK_EQUAL(text, "My apocalypse: the end is near!");
    BOOST_CHECK_EQUAL(charset, "UTF-8");
    BOOST_CHECK(method == codec::codec_t::QUOTED_PRINTABLE);

    auto latin = qc.check_decode("=?iso-8859-1?q?Caf=E9?=");
    BOOST_CHECK_EQUAL(std::get<0>(latin), "Caf\xC3\xA9");
}


/**
Keeping text which only looks like an encoded word.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_plain_header)
{
    q_codec qc(NONE);
    auto plain = qc.check_decode("Price =? unknown");
    BOOST_CHECK_EQUAL(std::get<0>(plain), "Price =? unknown");
    BOOST_CHECK(std::get<2>(plain) == codec::codec_t::ASCII);
}


/**
Reporting an encoded word of an unknown charset.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_encoded_word_unknown_charset)
{
    q_codec qc(NONE);
    BOOST_CHECK_THROW(qc.check_decode("=?x-no-such-charset?Q?abc?="), codec_error);
}


/**
Converting legacy charsets to UTF-8 under both policies.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(convert_charsets)
{
    BOOST_CHECK_EQUAL(mailcast::to_utf8("Caf\xE9", "iso-8859-1"), "Caf\xC3\xA9");
    BOOST_CHECK_EQUAL(mailcast::to_utf8("\x93quoted\x94", "windows-1252"), "\xE2\x80\x9Cquoted\xE2\x80\x9D");
    BOOST_CHECK_EQUAL(mailcast::to_utf8("plain", ""), "plain");

    BOOST_CHECK_THROW(mailcast::to_utf8("bad \xFF byte", "utf-8"), codec_error);
    BOOST_CHECK_EQUAL(mailcast::to_utf8("bad \xFF byte", "utf-8", decode_policy_t::REPLACE), "bad \xEF\xBF\xBD byte");
    BOOST_CHECK_THROW(charset_converter("x-no-such-charset"), codec_error);
}
