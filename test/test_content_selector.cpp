/*

test_content_selector.cpp
-------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE content_selector_test

#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailcast/codec/charset.hpp>
#include <mailcast/detail/result.hpp>
#include <mailcast/mime/content_selector.hpp>
#include <mailcast/mime/message.hpp>


using std::string;
using std::vector;
using mailcast::decode_policy_t;
using mailcast::error_code;
using mailcast::message;
using mailcast::mime;


namespace
{

message parse_or_fail(const string& raw)
{
    message msg;
    auto res = msg.parse(raw);
    BOOST_REQUIRE(res);
    return msg;
}

} // namespace


/**
Selecting the html part which follows a plain text alternative.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(select_html_after_plain)
{
    message msg = parse_or_fail("Content-Type: multipart/alternative; boundary=\"ABC\"\n"
        "MIME-Version: 1.0\n"
        "\n"
        "--ABC\n"
        "Content-Type: text/plain\n"
        "\n"
        "This is plain text content.\n"
        "\n"
        "--ABC\n"
        "Content-Type: text/html\n"
        "\n"
        "<html><body><p>This is an HTML part.</p></body></html>\n"
        "\n"
        "--ABC--\n");
    auto html = mailcast::select_renderable(msg);
    BOOST_REQUIRE(html);
    BOOST_CHECK(html->find("<html>") != string::npos);
    BOOST_CHECK(html->find("<body>") != string::npos);
    BOOST_CHECK(html->find("This is an HTML part.") != string::npos);
    BOOST_CHECK(html->find("plain text") == string::npos);
}


/**
Selecting a single part html message.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(select_single_part)
{
    message msg = parse_or_fail("Content-Type: text/html\r\n"
        "MIME-Version: 1.0\r\n"
        "\r\n"
        "<html>\r\n"
        "<body>\r\n"
        "    <p>Single part HTML content.</p>\r\n"
        "</body>\r\n"
        "</html>\r\n");
    auto html = mailcast::select_renderable(msg);
    BOOST_REQUIRE(html);
    BOOST_CHECK(html->find("Single part HTML content.") != string::npos);
    BOOST_CHECK(html->find('\r') == string::npos);
}


/**
Reporting a message without html as a distinct error.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(select_no_html)
{
    message msg = parse_or_fail("Content-Type: text/plain\nMIME-Version: 1.0\n\nPlain text only.\n");
    auto html = mailcast::select_renderable(msg);
    BOOST_REQUIRE(!html);
    BOOST_CHECK(html.error().is(error_code::no_renderable_content));
    BOOST_CHECK(!html.error().is_malformed_message());
}


/**
Taking the first html part in document order, nested containers included.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(select_first_in_document_order)
{
    message msg = parse_or_fail("Content-Type: multipart/mixed; boundary=outer\n"
        "\n"
        "--outer\n"
        "Content-Type: multipart/alternative; boundary=inner\n"
        "\n"
        "--inner\n"
        "Content-Type: text/plain\n"
        "\n"
        "plain\n"
        "--inner\n"
        "Content-Type: text/html\n"
        "\n"
        "<p>first</p>\n"
        "--inner--\n"
        "--outer\n"
        "Content-Type: text/html\n"
        "\n"
        "<p>second</p>\n"
        "--outer--\n");
    auto html = mailcast::select_renderable(msg);
    BOOST_REQUIRE(html);
    BOOST_CHECK_EQUAL(*html, "<p>first</p>");

    vector<string> visited;
    mailcast::walk(msg, [&visited](const mime& part)
    {
        visited.push_back(part.content_type());
        return true;
    });
    BOOST_REQUIRE_EQUAL(visited.size(), 5u);
    BOOST_CHECK_EQUAL(visited[0], "multipart/mixed");
    BOOST_CHECK_EQUAL(visited[1], "multipart/alternative");
    BOOST_CHECK_EQUAL(visited[4], "text/html");
}


/**
Finding html inside a forwarded message.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(select_inside_rfc822)
{
    message msg = parse_or_fail("Content-Type: message/rfc822\n"
        "\n"
        "Subject: inner\n"
        "Content-Type: text/html\n"
        "\n"
        "<p>forwarded</p>\n");
    auto html = mailcast::select_renderable(msg);
    BOOST_REQUIRE(html);
    BOOST_CHECK_EQUAL(*html, "<p>forwarded</p>");
}


/**
Undoing Base64 and Quoted-Printable transfer encodings and converting the charset.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_transfer_encodings)
{
    message b64 = parse_or_fail("Content-Type: text/html; charset=utf-8\n"
        "Content-Transfer-Encoding: base64\n"
        "\n"
        "PHA+U29tZSBjb250\n"
        "ZW50IGhlcmUuPC9wPg==\n");
    auto b64_html = mailcast::select_renderable(b64);
    BOOST_REQUIRE(b64_html);
    BOOST_CHECK_EQUAL(*b64_html, "<p>Some content here.</p>");

    message qp = parse_or_fail("Content-Type: text/html; charset=\"iso-8859-1\"\n"
        "Content-Transfer-Encoding: quoted-printable\n"
        "\n"
        "<p class=3D\"x\">Caf=E9 cr=\n"
        "=E8me</p>\n");
    auto qp_html = mailcast::select_renderable(qp);
    BOOST_REQUIRE(qp_html);
    BOOST_CHECK_EQUAL(*qp_html, "<p class=\"x\">Caf\xC3\xA9 cr\xC3\xA8me</p>");
}


/**
Applying the default charset to parts which declare none.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_default_charset)
{
    message msg = parse_or_fail("Content-Type: text/html\n\n<p>na\xEFve</p>\n");
    auto strict = mailcast::select_renderable(msg);
    BOOST_REQUIRE(!strict);
    BOOST_CHECK(strict.error().is(error_code::decode_error));

    auto latin = mailcast::select_renderable(msg, "windows-1252");
    BOOST_REQUIRE(latin);
    BOOST_CHECK_EQUAL(*latin, "<p>na\xC3\xAFve</p>");
}


/**
Reporting an unknown charset as a decoding error, and replacing undecodable bytes on request.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_unknown_charset)
{
    message msg = parse_or_fail("Content-Type: text/html; charset=x-klingon\n\n<p>qapla'</p>\n");
    auto html = mailcast::select_renderable(msg);
    BOOST_REQUIRE(!html);
    BOOST_CHECK(html.error().is(error_code::decode_error));

    message bad_bytes = parse_or_fail("Content-Type: text/plain; charset=utf-8\n\nbad \xFF byte\n");
    auto text = mailcast::decode_text(bad_bytes, decode_policy_t::REPLACE);
    BOOST_REQUIRE(text);
    BOOST_CHECK_EQUAL(*text, "bad \xEF\xBF\xBD byte");
}
