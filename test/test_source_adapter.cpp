/*

test_source_adapter.cpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE source_adapter_test

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailcast/mime/message.hpp>
#include <mailcast/sources/source_adapter.hpp>


using std::optional;
using std::string;
using std::vector;
using mailcast::episode_info;
using mailcast::get_source_adapter;
using mailcast::message;


namespace
{

message parse_or_fail(const string& raw)
{
    message msg;
    auto res = msg.parse(raw);
    BOOST_REQUIRE(res);
    return msg;
}


message levine_email(const string& body)
{
    return parse_or_fail("Subject: Money Stuff: Insider Trading on War\n"
        "Date: Thu, 12 Feb 2026 18:27:14 +0000\n"
        "Content-Type: text/plain; charset=utf-8\n"
        "\n" + body + "\n");
}


const episode_info LEVINE_EPISODE{"2026-02-12", "Money Stuff: Insider Trading on War", "Money-Stuff-Insider-Trading-on-War"};

const string LEVINE_URL{"https://www.bloomberg.com/opinion/newsletters/2026-02-12/insider-trading-on-war"};

} // namespace


/**
Mapping feed names onto their adapters.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(adapter_lookup)
{
    BOOST_CHECK(std::holds_alternative<mailcast::levine_adapter>(get_source_adapter("levine")));
    BOOST_CHECK(std::holds_alternative<mailcast::default_adapter>(get_source_adapter("unknown")));

    auto silver = get_source_adapter("silver");
    BOOST_REQUIRE(std::holds_alternative<mailcast::substack_adapter>(silver));
    BOOST_CHECK_EQUAL(std::get<mailcast::substack_adapter>(silver).brand_name, "Silver Bulletin");
    BOOST_CHECK_EQUAL(std::get<mailcast::substack_adapter>(silver).domain, "natesilver.net");
}


/**
Normalizing the Money Stuff titles.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(levine_title)
{
    BOOST_CHECK_EQUAL(mailcast::format_title(get_source_adapter("levine"), LEVINE_EPISODE),
        "2026-02-12 - Money Stuff - Insider Trading on War");
    BOOST_CHECK_EQUAL(mailcast::format_title(get_source_adapter("levine"), {"2026-02-13", "money stuff:   Lower Case", ""}),
        "2026-02-13 - Money Stuff - Lower Case");
    BOOST_CHECK_EQUAL(mailcast::format_title(get_source_adapter("levine"), {"2026-02-14", "Programming note", ""}),
        "2026-02-14 - Programming note");
}


/**
Using the raw subject, or the slug without hyphens, for feeds without rules.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(default_title)
{
    auto adapter = get_source_adapter("other");
    BOOST_CHECK_EQUAL(mailcast::format_title(adapter, {"2026-02-12", " Slow Boring: Housing Policy ", "Slow-Boring-Housing-Policy"}),
        "Slow Boring: Housing Policy");
    BOOST_CHECK_EQUAL(mailcast::format_title(adapter, {"2026-02-12", "  ", "Slow-Boring-Housing-Policy"}), "Slow Boring Housing Policy");
}


/**
Stripping the brand prefix of Substack titles.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(substack_title)
{
    BOOST_CHECK_EQUAL(mailcast::format_title(get_source_adapter("yglesias"), {"2026-02-12", "Slow Boring: Housing Policy", ""}),
        "2026-02-12 - Slow Boring - Housing Policy");
    BOOST_CHECK_EQUAL(mailcast::format_title(get_source_adapter("silver"), {"2026-02-18", "Who wins the primary?", ""}),
        "2026-02-18 - Silver Bulletin - Who wins the primary?");
}


/**
Finding the newsletter address among the links of the body.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(levine_source_from_direct_url)
{
    message msg = levine_email("View in browser <" + LEVINE_URL + "?utm_source=newsletter>");
    optional<string> url = mailcast::extract_source_url(get_source_adapter("levine"), msg, LEVINE_EPISODE);
    BOOST_REQUIRE(url);
    BOOST_CHECK_EQUAL(*url, LEVINE_URL);
}


/**
Following a shortlink through the resolver.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(levine_source_resolves_shortlink)
{
    message msg = levine_email("View in browser <https://bloom.bg/4aeB1mX>");
    vector<string> requested;
    auto resolver = [&requested](const string& link) -> optional<string>
    {
        requested.push_back(link);
        return LEVINE_URL + "?cmpid=foo";
    };
    optional<string> url = mailcast::extract_source_url(get_source_adapter("levine"), msg, LEVINE_EPISODE, resolver);
    BOOST_REQUIRE(url);
    BOOST_CHECK_EQUAL(*url, LEVINE_URL);
    BOOST_REQUIRE_EQUAL(requested.size(), 1u);
    BOOST_CHECK_EQUAL(requested[0], "https://bloom.bg/4aeB1mX");
}


/**
Inferring the address from the date and subject when the body has no link.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(levine_source_inferred)
{
    message msg = levine_email("No links here");
    optional<string> url = mailcast::extract_source_url(get_source_adapter("levine"), msg, LEVINE_EPISODE);
    BOOST_REQUIRE(url);
    BOOST_CHECK_EQUAL(*url, LEVINE_URL);

    optional<string> none = mailcast::extract_source_url(get_source_adapter("levine"), msg, {"2026-02-12", "Other subject", ""});
    BOOST_CHECK(!none);
}


/**
Taking the Substack address from the `List-Post` header.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(substack_source_from_list_post)
{
    message msg = parse_or_fail("Subject: A.I. progress is giving me writer's block\n"
        "Date: Wed, 18 Feb 2026 11:03:05 +0000\n"
        "List-Post: <https://www.slowboring.com/p/ai-progress-is-giving-me-writers>\n"
        "Content-Type: text/plain; charset=utf-8\n"
        "\n"
        "Text body\n");
    optional<string> url = mailcast::extract_source_url(get_source_adapter("yglesias"), msg, {});
    BOOST_REQUIRE(url);
    BOOST_CHECK_EQUAL(*url, "https://www.slowboring.com/p/ai-progress-is-giving-me-writers");
}


/**
Taking the Substack address from a body link.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(substack_source_from_body_link)
{
    message msg = parse_or_fail("Subject: A.I. progress is giving me writer's block\n"
        "Date: Wed, 18 Feb 2026 11:03:05 +0000\n"
        "Content-Type: text/plain; charset=utf-8\n"
        "\n"
        "View this post on the web at https://www.slowboring.com/p/ai-progress-is-giving-me-writers?utm_source=email\n");
    optional<string> url = mailcast::extract_source_url(get_source_adapter("yglesias"), msg, {});
    BOOST_REQUIRE(url);
    BOOST_CHECK_EQUAL(*url, "https://www.slowboring.com/p/ai-progress-is-giving-me-writers");

    BOOST_CHECK(!mailcast::extract_source_url(get_source_adapter("silver"), msg, {}));
    BOOST_CHECK(!mailcast::extract_source_url(get_source_adapter("other"), msg, {}));
}


/**
Preferring the plain text part and removing the Substack noise.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(substack_body_cleanup)
{
    message msg = parse_or_fail("Subject: Democrats need to think bigger on utilities\n"
        "Content-Type: multipart/alternative; boundary=\"x\"\n"
        "\n"
        "--x\n"
        "Content-Type: text/plain; charset=utf-8\n"
        "\n"
        "View this post on the web at https://www.slowboring.com/p/demo\n"
        "\n"
        "Paragraph one [ https://substack.com/redirect/abc ] text.\n"
        "READ IN APP\n"
        "Unsubscribe https://substack.com/redirect/unsub\n"
        "--x--\n");
    const string cleaned = mailcast::clean_body(get_source_adapter("yglesias"), msg, "fallback");
    BOOST_CHECK(cleaned.find("View this post on the web") == string::npos);
    BOOST_CHECK(cleaned.find("substack.com/redirect") == string::npos);
    BOOST_CHECK(cleaned.find("READ IN APP") == string::npos);
    BOOST_CHECK(cleaned.find("Unsubscribe") == string::npos);
    BOOST_CHECK_EQUAL(cleaned, "Paragraph one text.");

    BOOST_CHECK_EQUAL(mailcast::clean_body(get_source_adapter("levine"), msg, "fallback"), "fallback");
}


/**
Cleaning the fallback body when there is no plain text part.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(substack_body_fallback)
{
    message msg = parse_or_fail("Content-Type: text/html\n\n<p>html only</p>\n");
    BOOST_CHECK_EQUAL(mailcast::clean_body(get_source_adapter("silver"), msg, "Line\xC2\xAD one  \n\n\n\nSubscribed\nLine two\r\n"),
        "Line one\n\nLine two");
}


/**
Collecting candidate links, URL helpers and relative redirects.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(link_helpers)
{
    message msg = parse_or_fail("Content-Type: multipart/alternative; boundary=b\n"
        "\n"
        "--b\n"
        "Content-Type: text/plain\n"
        "\n"
        "See (https://example.com/a). Also https://example.com/b, then https://example.com/a.\n"
        "--b\n"
        "Content-Type: text/html\n"
        "\n"
        "<a href=\"https://example.com/c\">c</a>\n"
        "--b--\n");
    vector<string> links = mailcast::extract_candidate_links(msg);
    BOOST_REQUIRE_EQUAL(links.size(), 3u);
    BOOST_CHECK_EQUAL(links[0], "https://example.com/a");
    BOOST_CHECK_EQUAL(links[1], "https://example.com/b");
    BOOST_CHECK_EQUAL(links[2], "https://example.com/c");

    BOOST_CHECK_EQUAL(mailcast::canonicalize_url("https://host.com/path/x;p=1?q=2#f"), "https://host.com/path/x");
    BOOST_CHECK_EQUAL(mailcast::canonicalize_url("https://host.com"), "https://host.com");
    BOOST_CHECK_EQUAL(mailcast::slugify_for_url("  Insider Trading on War!  "), "insider-trading-on-war");
    BOOST_CHECK_EQUAL(mailcast::slugify_for_url("A -- B"), "a-b");

    auto relative = [](const string&) -> optional<string> { return string("/p/post"); };
    BOOST_CHECK(mailcast::resolve_once("https://host.com/redirect/1", relative) == string("https://host.com/p/post"));
    BOOST_CHECK(!mailcast::resolve_once("https://host.com/redirect/1", mailcast::no_redirects));
}
