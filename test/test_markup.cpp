/*

test_markup.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE markup_test

#include <string>
#include <string_view>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailcast/text/html_entities.hpp>
#include <mailcast/text/markup.hpp>


using std::string;
using std::vector;
using mailcast::markup_document;
using node_kind_t = mailcast::markup_document::node_kind_t;


/**
Building the tree of nested elements with their attributes.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_elements)
{
    markup_document doc = markup_document::parse("<DIV Class=\"a\" id=main data-x='q \"x\"' hidden><p>one</p><P>two</P></div>");
    vector<markup_document::node_id> divs = doc.find_elements({"div"});
    BOOST_REQUIRE_EQUAL(divs.size(), 1u);
    BOOST_CHECK(doc.attribute(divs[0], "class") == string("a"));
    BOOST_CHECK(doc.attribute(divs[0], "id") == string("main"));
    BOOST_CHECK(doc.attribute(divs[0], "data-x") == string("q \"x\""));
    BOOST_CHECK(doc.attribute(divs[0], "hidden") == string(""));
    BOOST_CHECK(!doc.attribute(divs[0], "style"));

    vector<markup_document::node_id> paragraphs = doc.find_elements({"p"});
    BOOST_REQUIRE_EQUAL(paragraphs.size(), 2u);
    BOOST_CHECK_EQUAL(doc.at(paragraphs[0]).parent, divs[0]);
    BOOST_CHECK_EQUAL(doc.at(paragraphs[1]).parent, divs[0]);
    BOOST_CHECK_EQUAL(doc.flatten(), "onetwo");
}


/**
Closing elements at the nearest matching open element and ignoring stray end tags.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_unbalanced)
{
    markup_document doc = markup_document::parse("<div><span>a</div>b</span></em>c<br>d<img src=x/>e");
    vector<markup_document::node_id> divs = doc.find_elements({"div"});
    BOOST_REQUIRE_EQUAL(divs.size(), 1u);
    BOOST_CHECK_EQUAL(doc.at(divs[0]).parent, markup_document::ROOT);

    vector<markup_document::node_id> breaks = doc.find_elements({"br", "img"});
    BOOST_REQUIRE_EQUAL(breaks.size(), 2u);
    BOOST_CHECK(doc.at(breaks[0]).children.empty());
    BOOST_CHECK_EQUAL(doc.at(breaks[1]).parent, markup_document::ROOT);
    BOOST_CHECK_EQUAL(doc.flatten(), "abcde");
}


/**
Leaving comments, scripts, styles and declarations out of the text.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(flatten_skips_non_text)
{
    markup_document doc = markup_document::parse("<!DOCTYPE html><?xml version=\"1.0\"?><html><head><style>p { color: red; }</style>"
        "<script>if (a < b && c) { x = \"</p>\"; }</script></head><body><!-- hidden -->Hello<![CDATA[ <raw> ]]>world</body></html>");
    BOOST_CHECK_EQUAL(doc.flatten(), "Hello <raw> world");

    auto comments = doc.find_all([](const markup_document::node_t& n) { return n.kind == node_kind_t::COMMENT; });
    BOOST_REQUIRE_EQUAL(comments.size(), 1u);
    BOOST_CHECK_EQUAL(doc.at(comments[0]).text, " hidden ");
}


/**
Keeping a lone `<` which does not open a tag.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_literal_less_than)
{
    markup_document doc = markup_document::parse("<p>1 < 2 and 3 <= 4</p>");
    BOOST_CHECK_EQUAL(doc.flatten(), "1 < 2 and 3 <= 4");
}


/**
Removing subtrees, then inserting text around the remaining elements.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(edit_document)
{
    markup_document doc = markup_document::parse("<div><p>keep</p><p>drop <b>me</b></p><p>tail</p></div>");
    vector<markup_document::node_id> paragraphs = doc.find_elements({"p"});
    BOOST_REQUIRE_EQUAL(paragraphs.size(), 3u);

    doc.remove(paragraphs[1]);
    doc.compact();
    BOOST_CHECK_EQUAL(doc.flatten(), "keeptail");
    BOOST_CHECK(doc.find_elements({"b"}).empty());

    doc.insert_text_before(paragraphs[2], "[");
    doc.insert_text_after(paragraphs[2], "]");
    BOOST_CHECK_EQUAL(doc.flatten(), "keep[tail]");

    doc.remove_following_siblings(paragraphs[0]);
    doc.compact();
    BOOST_CHECK_EQUAL(doc.flatten(), "keep");
}


/**
Decoding named and numeric character references in text and attributes.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_references)
{
    markup_document doc = markup_document::parse("<a title=\"Tom &amp; Jerry\">caf&eacute; &#8220;x&#8221; &#x2014; &lt;b&gt;</a>");
    vector<markup_document::node_id> links = doc.find_elements({"a"});
    BOOST_REQUIRE_EQUAL(links.size(), 1u);
    BOOST_CHECK(doc.attribute(links[0], "title") == string("Tom & Jerry"));
    BOOST_CHECK_EQUAL(doc.flatten(), "caf\xC3\xA9 \xE2\x80\x9Cx\xE2\x80\x9D \xE2\x80\x94 <b>");
}


/**
Mapping references the way browsers do: legacy names without semicolon, Windows-1252 controls and invalid code points.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_reference_edge_cases)
{
    using mailcast::html::decode_character_references;
    BOOST_CHECK_EQUAL(decode_character_references("AT&T &amp co"), "AT&T & co");
    BOOST_CHECK_EQUAL(decode_character_references("&hellip &hellip;"), "&hellip \xE2\x80\xA6");
    BOOST_CHECK_EQUAL(decode_character_references("&#150;&#x92;"), "\xE2\x80\x93\xE2\x80\x99");
    BOOST_CHECK_EQUAL(decode_character_references("&#0;&#xD800;&#99999999;"), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
    BOOST_CHECK_EQUAL(decode_character_references("&#; &unknown; &"), "&#; &unknown; &");
    BOOST_CHECK_EQUAL(decode_character_references("a&nbsp;b"), "a\xC2\xA0" "b");
}


/**
Decoding every named reference of HTML5, including the ones spelled with several code points.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_full_entity_table)
{
    using mailcast::html::decode_character_references;
    BOOST_CHECK_EQUAL(decode_character_references("Done &check; see &lsqb;1&rsqb; and &frac13;"),
        "Done \xE2\x9C\x93 see [1] and \xE2\x85\x93");
    BOOST_CHECK_EQUAL(decode_character_references("&NewLine;x &NotEqualTilde;"), "\nx \xE2\x89\x82\xCC\xB8");
    BOOST_CHECK_EQUAL(decode_character_references("&copy2025 &amp. &notit;"), "\xC2\xA9" "2025 &. \xC2\xAC" "it;");
    BOOST_CHECK_EQUAL(decode_character_references("&check &lsqb"), "&check &lsqb");
    BOOST_CHECK(mailcast::html::find_entity("zwnj;") == std::string_view("\xE2\x80\x8C"));
    BOOST_CHECK(!mailcast::html::find_entity("zwnj"));
}


/**
Parsing and flattening nesting far deeper than any call stack would allow.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(deeply_nested_elements)
{
    string markup;
    for (int i = 0; i < 200000; ++i)
        markup += "<font>";
    markup += "deep text";
    markup_document doc = markup_document::parse(markup);
    BOOST_CHECK_EQUAL(doc.flatten(), "deep text");
    BOOST_CHECK_EQUAL(doc.find_elements({"font"}).size(), 200000u);
}
