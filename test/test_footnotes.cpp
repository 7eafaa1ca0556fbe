/*

test_footnotes.cpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE footnotes_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <mailcast/detail/result.hpp>
#include <mailcast/text/footnotes.hpp>


using std::string;
using mailcast::error_code;
using mailcast::footnote_inliner;


/**
Moving every definition to the place which points at it.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(inline_footnotes)
{
    auto inlined = footnote_inliner().inline_footnotes("Banks like deposits.[1] Regulators do not.[2]\n\n"
        "[1] Mostly cheap ones.\n"
        "[2]   Usually.  \n");
    BOOST_REQUIRE(inlined);
    BOOST_CHECK_EQUAL(*inlined, "Banks like deposits.Footnote begins. Mostly cheap ones. Footnote ends. "
        "Regulators do not.Footnote begins. Usually. Footnote ends.");
    BOOST_CHECK(inlined->find('[') == string::npos);
}


/**
Keeping text without footnotes unchanged apart from trimming.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(inline_without_footnotes)
{
    auto inlined = footnote_inliner().inline_footnotes("\n Nothing to see here. \n");
    BOOST_REQUIRE(inlined);
    BOOST_CHECK_EQUAL(*inlined, "Nothing to see here.");
}


/**
Reporting a pointer without definition, naming it.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(dangling_footnote)
{
    auto inlined = footnote_inliner().inline_footnotes("See the note.[3]\n\n[1] A note nobody points at.\n");
    BOOST_REQUIRE(!inlined);
    BOOST_CHECK(inlined.error().is(error_code::dangling_footnote));
    BOOST_CHECK_EQUAL(inlined.error().message(), "Footnote 3 not found.");
    BOOST_CHECK_EQUAL(inlined.error().detail(), "3");
}


/**
Letting the last definition of a number win.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(collect_duplicates)
{
    footnote_inliner inliner;
    string text = "Body [12] text.\n[12] First.\nMiddle line.\n[12] Second.";
    footnote_inliner::footnote_table_t table = inliner.collect(text);
    BOOST_REQUIRE_EQUAL(table.size(), 1u);
    BOOST_CHECK_EQUAL(table["12"], "Second.");
    BOOST_CHECK(text.find("First.") == string::npos);
    BOOST_CHECK(text.find("Middle line.") != string::npos);

    auto substituted = inliner.substitute(text, table);
    BOOST_REQUIRE(substituted);
    BOOST_CHECK(substituted->find("Body Footnote begins. Second. Footnote ends. text.") != string::npos);
}


/**
Taking only whole lines starting with a bracketed number as definitions.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(definitions_are_line_anchored)
{
    footnote_inliner inliner;
    string text = "Prices rose [1] sharply.\n[1] Per the index.";
    footnote_inliner::footnote_table_t table = inliner.collect(text);
    BOOST_REQUIRE_EQUAL(table.size(), 1u);
    BOOST_CHECK_EQUAL(table["1"], "Per the index.");
    BOOST_CHECK(text.find("Prices rose [1] sharply.") != string::npos);
}
