/*

test_processor.cpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE processor_test

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailcast/detail/log.hpp>
#include <mailcast/processor.hpp>
#include <mailcast/throwing.hpp>


using std::string;
using std::vector;
using mailcast::email_processor;
using mailcast::email_record;
using mailcast::error_code;
using mailcast::processor_options;


namespace
{

/**
Temporary directory removed at the end of the test.
**/
struct temp_dir
{
    temp_dir()
        : path(std::filesystem::temp_directory_path() /
            ("mailcast-test-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count())))
    {
    }

    ~temp_dir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path path;
};


string read_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    return string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace


/**
Processing a message without date into the sentinel date, its subject and its body.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(process_end_to_end)
{
    email_processor processor("Subject: My apocalypse: the end is near!\n"
        "Date: sometime soon\n"
        "Content-Type: text/html; charset=utf-8\n"
        "\n"
        "<p>Some content here.</p>\n");
    auto record = processor.parse();
    BOOST_REQUIRE(record);
    BOOST_CHECK_EQUAL(record->date, "9999-12-31");
    BOOST_CHECK_EQUAL(record->subject_slug, "My-apocalypse-the-end-is-near");
    BOOST_CHECK_EQUAL(record->subject_raw, "My apocalypse: the end is near!");
    BOOST_CHECK_EQUAL(record->body, "Some content here.");
}


/**
Running the whole pipeline on a multipart newsletter with hidden preview, quotes and footnotes.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(process_newsletter)
{
    email_processor processor("Subject: =?UTF-8?Q?Money_Stuff:_Insider_Trading_on_War?=\r\n"
        "Date: Thu, 12 Feb 2026 18:27:14 +0000\r\n"
        "Content-Type: multipart/alternative; boundary=\"ABC\"\r\n"
        "MIME-Version: 1.0\r\n"
        "\r\n"
        "--ABC\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "This is plain text part.\r\n"
        "--ABC\r\n"
        "Content-Type: text/html; charset=utf-8\r\n"
        "Content-Transfer-Encoding: quoted-printable\r\n"
        "\r\n"
        "<html><body><div style=3D\"display: none;\">Preview text</div>\r\n"
        "<p>Some visible paragraph.[1]</p>\r\n"
        "<blockquote><p>A quoted line.</p></blockquote>\r\n"
        "<div id=3D\"footnote-1\"><p>[1] A very long =\r\n"
        "note.</p></div>\r\n"
        "<div><h2>Related Articles</h2></div>\r\n"
        "</body></html>\r\n"
        "--ABC--\r\n");
    auto record = processor.parse();
    BOOST_REQUIRE(record);
    BOOST_CHECK_EQUAL(record->date, "2026-02-12");
    BOOST_CHECK_EQUAL(record->subject_raw, "Money Stuff: Insider Trading on War");
    BOOST_CHECK_EQUAL(record->subject_slug, "Money-Stuff-Insider-Trading-on-War");
    BOOST_CHECK_EQUAL(record->body,
        "Some visible paragraph.Footnote begins. A very long note. Footnote ends.\n\n"
        "Block quote begins.\n\n"
        "A quoted line.\n\n"
        "Block quote ends.");
}


/**
Inlining footnotes whose brackets are written as character references.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(process_referenced_footnotes)
{
    auto record = email_processor("Content-Type: text/html\n\n"
        "<p>Claim.&lsqb;1&rsqb;</p><p>&lsqb;1&rsqb; Source&emsp;&emsp;here.</p>\n").parse();
    BOOST_REQUIRE(record);
    BOOST_CHECK_EQUAL(record->body, "Claim.Footnote begins. Source here. Footnote ends.");
}


/**
Reporting each failure kind distinctly.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(process_failures)
{
    auto no_html = email_processor("Content-Type: text/plain\n\nJust some text, no HTML here.\n").parse();
    BOOST_REQUIRE(!no_html);
    BOOST_CHECK(no_html.error().is(error_code::no_renderable_content));

    auto malformed = email_processor("").parse();
    BOOST_REQUIRE(!malformed);
    BOOST_CHECK(malformed.error().is(error_code::malformed_message));

    auto dangling = email_processor("Content-Type: text/html\n\n<p>Claim.[3]</p>\n").parse();
    BOOST_REQUIRE(!dangling);
    BOOST_CHECK(dangling.error().is(error_code::dangling_footnote));
    BOOST_CHECK_EQUAL(dangling.error().detail(), "3");

    auto undecodable = email_processor("Content-Type: text/html; charset=x-unknown\n\n<p>x</p>\n").parse();
    BOOST_REQUIRE(!undecodable);
    BOOST_CHECK(undecodable.error().is(error_code::decode_error));
}


/**
Applying the strict and default charset options.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(process_options)
{
    const string noisy = "Content-Type: text/html\nContent-Transfer-Encoding: base64\n\nPHA+SGk8L3A+!\n";
    auto lenient = email_processor(noisy, processor_options::lenient()).parse();
    BOOST_REQUIRE(lenient);
    BOOST_CHECK_EQUAL(lenient->body, "Hi");

    auto strict = email_processor(noisy, processor_options::strict()).parse();
    BOOST_REQUIRE(!strict);
    BOOST_CHECK(strict.error().is(error_code::decode_error));

    processor_options latin;
    latin.default_charset = "iso-8859-1";
    latin.default_subject = "Untitled";
    auto record = email_processor("Content-Type: text/html\n\n<p>Caf\xE9</p>\n", latin).parse();
    BOOST_REQUIRE(record);
    BOOST_CHECK_EQUAL(record->body, "Caf\xC3\xA9");
    BOOST_CHECK_EQUAL(record->subject_raw, "Untitled");
}


/**
Writing the body into a file named after the date and the subject.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(write_text_file)
{
    temp_dir tmp;
    email_processor processor("Date: Tue, 01 Feb 2022 10:11:12 +0000\n"
        "Subject: This is the Title\n"
        "Content-Type: text/html\n"
        "MIME-Version: 1.0\n"
        "\n"
        "<html>\n<head>\n    <title>This is the Title</title>\n</head>\n"
        "<body>\n<h1>My Main Header</h1>\n<p>Some text here.</p>\n</body>\n</html>\n",
        processor_options::writing_to(tmp.path / "emails"));

    auto path = processor.write_text_file();
    BOOST_REQUIRE(path);
    BOOST_CHECK_EQUAL(path->filename().string(), "2022-02-01-This-is-the-Title.txt");
    BOOST_CHECK(std::filesystem::exists(*path));

    auto record = processor.parse();
    BOOST_REQUIRE(record);
    BOOST_CHECK_EQUAL(read_file(*path), record->body);
    BOOST_CHECK(record->body.find("My Main Header") != string::npos);

    auto other = processor.write_text_file(tmp.path / "other");
    BOOST_REQUIRE(other);
    BOOST_CHECK_EQUAL(other->parent_path(), tmp.path / "other");
}


/**
Reporting a directory which cannot be created.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(write_text_file_io_error)
{
    temp_dir tmp;
    std::filesystem::create_directories(tmp.path);
    {
        std::ofstream blocker(tmp.path / "file");
        blocker << "not a directory";
    }
    email_record record{"2022-02-01", "Title", "Title", "Body"};
    auto path = email_processor::write_text_file(record, tmp.path / "file" / "emails");
    BOOST_REQUIRE(!path);
    BOOST_CHECK(path.error().is(error_code::io_error));
}


/**
Routing log records through a callback and converting errors into exceptions.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(logging_and_exceptions)
{
    vector<string> warnings;
    auto& logger = mailcast::log::logger::instance();
    logger.set_level(mailcast::log::level::warn);
    logger.set_callback([&warnings](const mailcast::log::entry& e) { warnings.push_back(e.message); });

    auto record = email_processor("Subject: x\nDate: garbage\nContent-Type: text/html\n\n<p>y</p>\n").parse();
    logger.clear_callback();
    logger.set_level(mailcast::log::level::off);

    BOOST_REQUIRE(record);
    BOOST_REQUIRE(!warnings.empty());
    BOOST_CHECK(warnings.front().find("garbage") != string::npos);

    BOOST_CHECK_EQUAL(mailcast::unwrap(email_processor("Content-Type: text/html\n\n<p>ok</p>\n").parse()).body, "ok");
    BOOST_CHECK_THROW(mailcast::unwrap(email_processor("Content-Type: text/plain\n\nno\n").parse()), mailcast::exception);
}


/**
Raising one exception class per kind of failure.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(exception_kinds)
{
    BOOST_CHECK_THROW(mailcast::unwrap(email_processor("Content-Type: text/plain\n\nno\n").parse()),
        mailcast::no_renderable_content_error);
    BOOST_CHECK_THROW(mailcast::unwrap(email_processor("").parse()), mailcast::malformed_message_error);
    BOOST_CHECK_THROW(mailcast::unwrap(email_processor("Content-Type: text/html; charset=x-unknown\n\n<p>x</p>\n").parse()),
        mailcast::decode_error);

    try
    {
        mailcast::unwrap(email_processor("Content-Type: text/html\n\n<p>Claim.[3]</p>\n").parse());
        BOOST_FAIL("dangling footnote not raised");
    }
    catch (const mailcast::dangling_footnote_error& exc)
    {
        BOOST_CHECK_EQUAL(exc.footnote(), "3");
        BOOST_CHECK(exc.code() == error_code::dangling_footnote);
        BOOST_CHECK(string(exc.what()).find("300") != string::npos);
    }

    BOOST_CHECK_THROW(mailcast::throw_error(mailcast::error(error_code::io_error, "disk")), mailcast::exception);
    BOOST_CHECK_NO_THROW(mailcast::unwrap(mailcast::ok()));
}


/**
Taking the build defaults for the output directory and the nesting limit.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(configured_defaults)
{
    BOOST_CHECK_EQUAL(processor_options{}.output_dir, std::filesystem::path(MAILCAST_DEFAULT_OUTPUT_DIR));
    BOOST_CHECK_EQUAL(mailcast::mime::MAX_NESTING_DEPTH, static_cast<unsigned>(MAILCAST_MAX_NESTING_DEPTH));
}
