/*

test_message.cpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE message_test

#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailcast/detail/result.hpp>
#include <mailcast/mime/message.hpp>
#include <mailcast/mime/mime.hpp>


using std::string;
using std::vector;
using mailcast::content_type_t;
using mailcast::error_code;
using mailcast::message;
using mailcast::mime;


/**
Parsing a single part message with folded headers and CRLF line endings.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_single_part)
{
    message msg;
    auto res = msg.parse("From: mailcast <address@mailcast.dev>\r\n"
        "Subject: Hello,\r\n"
        "  World!\r\n"
        "Content-Type: text/html; charset=\"ISO-8859-1\"\r\n"
        "\r\n"
        "<p>Hello, World!</p>\r\n");
    BOOST_REQUIRE(res);
    BOOST_CHECK_EQUAL(msg.header("subject"), "Hello,  World!");
    BOOST_CHECK_EQUAL(msg.content_type(), "text/html");
    BOOST_REQUIRE(msg.charset());
    BOOST_CHECK_EQUAL(*msg.charset(), "iso-8859-1");
    BOOST_CHECK(!msg.is_multipart());
    BOOST_CHECK(msg.raw_content().find("<p>Hello, World!</p>") == 0);
}


/**
Looking up headers by name, ignoring case, with defaults and repeated fields.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(header_lookup)
{
    message msg;
    BOOST_REQUIRE(msg.parse("Received: first\nreceived: second\nX-Empty:\n\nbody\n"));
    BOOST_CHECK_EQUAL(msg.header("RECEIVED"), "first");
    BOOST_CHECK_EQUAL(msg.header("X-Missing", "fallback"), "fallback");
    BOOST_CHECK(!msg.find_header("X-Missing"));
    BOOST_CHECK(msg.find_header("X-Empty") && msg.find_header("X-Empty")->empty());
    BOOST_CHECK(!msg.subject_raw());

    vector<string> received = msg.header_all("Received");
    BOOST_REQUIRE_EQUAL(received.size(), 2u);
    BOOST_CHECK_EQUAL(received[1], "second");
    BOOST_CHECK_EQUAL(msg.content_type(), "text/plain");
}


/**
Rejecting inputs which are not messages.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_malformed)
{
    message msg;
    auto empty = msg.parse(" \r\n\t\n");
    BOOST_REQUIRE(!empty);
    BOOST_CHECK(empty.error().is(error_code::malformed_message));

    auto no_header = msg.parse("Just some words\n\nand a body\n");
    BOOST_REQUIRE(!no_header);
    BOOST_CHECK(no_header.error().is(error_code::malformed_message));

    auto dangling_continuation = msg.parse("  folded\nSubject: x\n\nbody\n");
    BOOST_REQUIRE(!dangling_continuation);
    BOOST_CHECK(dangling_continuation.error().is_malformed_message());
}


/**
Rejecting multipart containers without boundary or without any delimiter.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_bad_multipart)
{
    message msg;
    auto no_boundary = msg.parse("Content-Type: multipart/mixed\n\n--x\n\nbody\n--x--\n");
    BOOST_REQUIRE(!no_boundary);
    BOOST_CHECK(no_boundary.error().is(error_code::missing_boundary));
    BOOST_CHECK(no_boundary.error().is_malformed_message());

    auto no_delimiter = msg.parse("Content-Type: multipart/mixed; boundary=x\n\nno parts at all\n");
    BOOST_REQUIRE(!no_delimiter);
    BOOST_CHECK(no_delimiter.error().is(error_code::malformed_message));
}


/**
Splitting a multipart alternative message, dropping its preamble and epilogue.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_multipart_alternative)
{
    message msg;
    auto res = msg.parse("Content-Type: multipart/alternative; boundary=\"ABC\"\n"
        "MIME-Version: 1.0\n"
        "\n"
        "This is a multi-part message.\n"
        "--ABC\n"
        "Content-Type: text/plain\n"
        "\n"
        "This is plain text content.\n"
        "\n"
        "--ABC\n"
        "Content-Type: text/html\n"
        "Content-Transfer-Encoding: quoted-printable\n"
        "\n"
        "<p>This is an HTML part.</p>\n"
        "\n"
        "--ABC--\n"
        "epilogue\n");
    BOOST_REQUIRE(res);
    BOOST_CHECK(msg.is_multipart());
    BOOST_CHECK_EQUAL(msg.content_type_info().boundary(), "ABC");
    BOOST_REQUIRE_EQUAL(msg.parts().size(), 2u);
    BOOST_CHECK_EQUAL(msg.parts()[0].content_type(), "text/plain");
    BOOST_CHECK_EQUAL(msg.parts()[1].content_type(), "text/html");
    BOOST_CHECK(msg.parts()[1].content_transfer_encoding() == mime::content_transfer_encoding_t::QUOTED_PRINTABLE);
    BOOST_CHECK(msg.parts()[1].raw_content().find("epilogue") == string::npos);
}


/**
Ending the last part at the end of the body when the close delimiter is missing.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_multipart_unclosed)
{
    message msg;
    BOOST_REQUIRE(msg.parse("Content-Type: multipart/mixed; boundary=b1\n\n--b1\nContent-Type: text/html\n\n<p>cut</p>\n"));
    BOOST_REQUIRE_EQUAL(msg.parts().size(), 1u);
    BOOST_CHECK_EQUAL(msg.parts()[0].raw_content(), "<p>cut</p>");
}


/**
Defaulting the parts of a digest to encapsulated messages.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_digest)
{
    message msg;
    auto res = msg.parse("Content-Type: multipart/digest; boundary=d\n"
        "\n"
        "--d\n"
        "\n"
        "Subject: inner\n"
        "Content-Type: text/html\n"
        "\n"
        "<p>inner body</p>\n"
        "--d--\n");
    BOOST_REQUIRE(res);
    BOOST_REQUIRE_EQUAL(msg.parts().size(), 1u);
    const mime& digest_part = msg.parts()[0];
    BOOST_CHECK_EQUAL(digest_part.content_type(), content_type_t::MESSAGE_RFC822);
    BOOST_REQUIRE_EQUAL(digest_part.parts().size(), 1u);
    BOOST_CHECK_EQUAL(digest_part.parts()[0].header("Subject"), "inner");
    BOOST_CHECK_EQUAL(digest_part.parts()[0].content_type(), "text/html");
}


/**
Parsing an encapsulated message inside a mixed container.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_rfc822_attachment)
{
    message msg;
    auto res = msg.parse("Subject: forwarded\n"
        "Content-Type: multipart/mixed; boundary=\"outer\"\n"
        "\n"
        "--outer\n"
        "Content-Type: text/plain\n"
        "\n"
        "See below.\n"
        "--outer\n"
        "Content-Type: message/rfc822\n"
        "\n"
        "Subject: original\n"
        "Content-Type: text/html; charset=utf-8\n"
        "\n"
        "<p>Original</p>\n"
        "--outer--\n");
    BOOST_REQUIRE(res);
    BOOST_REQUIRE_EQUAL(msg.parts().size(), 2u);
    BOOST_REQUIRE_EQUAL(msg.parts()[1].parts().size(), 1u);
    const mime& original = msg.parts()[1].parts()[0];
    BOOST_CHECK_EQUAL(original.header("Subject"), "original");
    BOOST_CHECK_EQUAL(original.content_type(), "text/html");
}


/**
Falling back to plain text for an invalid content type, and skipping an mbox envelope line.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_lenient_headers)
{
    message msg;
    BOOST_REQUIRE(msg.parse("From someone@example.com Tue Feb  1 10:11:12 2022\n"
        "Subject: envelope\n"
        "Content-Type: garbage\n"
        "Content-Transfer-Encoding: x-unknown\n"
        "\n"
        "body\n"));
    BOOST_CHECK_EQUAL(msg.header("Subject"), "envelope");
    BOOST_CHECK_EQUAL(msg.content_type(), "text/plain");
    BOOST_CHECK(msg.content_transfer_encoding() == mime::content_transfer_encoding_t::BIT_7);
}


/**
Parsing content type parameters with quoted values.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_content_type)
{
    auto ct = content_type_t::parse("Multipart/Related; type=\"text/html\"; BOUNDARY=\"a;b=c\"");
    BOOST_REQUIRE(ct);
    BOOST_CHECK_EQUAL(ct->type(), "multipart/related");
    BOOST_CHECK_EQUAL(ct->boundary(), "a;b=c");
    BOOST_CHECK(!ct->charset());

    BOOST_CHECK(!content_type_t::parse("text"));
    BOOST_CHECK(!content_type_t::parse("a/b/c"));
}


/**
Undoing the transfer encoding, strictly when asked to.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(payload_decoding)
{
    message msg;
    BOOST_REQUIRE(msg.parse("Content-Type: text/html\nContent-Transfer-Encoding: base64\n\nPHA+SGk8L3A+\n"));
    auto payload = msg.payload();
    BOOST_REQUIRE(payload);
    BOOST_CHECK_EQUAL(*payload, "<p>Hi</p>");

    message strict_msg;
    strict_msg.strict_codec_mode(true);
    BOOST_REQUIRE(strict_msg.parse("Content-Type: text/html\nContent-Transfer-Encoding: base64\n\nPHA+SGk8L3A+!!\n"));
    auto bad = strict_msg.payload();
    BOOST_REQUIRE(!bad);
    BOOST_CHECK(bad.error().is(error_code::decode_error));
}
