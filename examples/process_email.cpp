/*

process_email.cpp
-----------------

Processes a raw newsletter message into its date, subject and narration ready body.
The message is read from `--input-file`, the first argument or the standard input.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the MIT license, see the accompanying file LICENSE or
copy at https://opensource.org/licenses/MIT.

*/


#include <cstdlib>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <boost/json.hpp>
#include <mailcast/mailcast.hpp>
#include <mailcast/net/http_resolver.hpp>
#include <mailcast/throwing.hpp>


using std::cerr;
using std::cout;
using std::string;
using mailcast::email_processor;
using mailcast::email_record;
using mailcast::processor_options;


namespace
{

constexpr int EXIT_NO_RENDERABLE_CONTENT = 1;
constexpr int EXIT_OTHER_FAILURE = 2;


struct cli_options
{
    std::optional<string> input_file;
    std::optional<string> raw_email;
    bool json_output = false;
    bool write_text_file = false;
    std::optional<string> output_dir;
    std::optional<string> feed;
    bool follow_redirects = true;
};


void print_usage(const char* program)
{
    cerr << "Usage: " << program << " [options] [RAW_EMAIL]\n"
         << "  --input-file FILE   read the message from FILE\n"
         << "  --json-output       print the processed message as JSON\n"
         << "  --write-text-file   write the body into <output dir>/<date>-<subject>.txt\n"
         << "  --output-dir DIR    directory of the body file (default: " << MAILCAST_DEFAULT_OUTPUT_DIR << ")\n"
         << "  --feed SLUG         apply the rules of a feed (levine, yglesias, silver)\n"
         << "  --no-redirects      do not request tracking links when looking for the source address\n"
         << "  --log-level LEVEL   trace, debug, info, warn, error or off\n";
}


void pretty_print(std::ostream& os, const boost::json::value& jv, const string& indent = "")
{
    switch (jv.kind())
    {
        case boost::json::kind::object:
        {
            const auto& obj = jv.get_object();
            if (obj.empty())
            {
                os << "{}";
                break;
            }
            os << "{\n";
            const string inner = indent + "  ";
            for (auto it = obj.begin(); it != obj.end(); ++it)
            {
                if (it != obj.begin())
                    os << ",\n";
                os << inner << boost::json::serialize(boost::json::string(it->key())) << ": ";
                pretty_print(os, it->value(), inner);
            }
            os << "\n" << indent << "}";
            break;
        }
        default:
            os << boost::json::serialize(jv);
    }
}


string read_input(const cli_options& opts)
{
    if (opts.input_file)
    {
        std::ifstream in(*opts.input_file, std::ios::binary);
        if (!in)
            mailcast::throw_error(mailcast::error(mailcast::error_code::io_error, "Cannot read the input file.", *opts.input_file));
        return string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    if (opts.raw_email)
        return *opts.raw_email;
    std::ostringstream content;
    content << std::cin.rdbuf();
    return content.str();
}


int run(const cli_options& opts)
{
    processor_options popts;
    if (opts.output_dir)
        popts.output_dir = *opts.output_dir;
    email_processor processor(read_input(opts), popts);

    email_record record = mailcast::unwrap(processor.parse());
    boost::json::object obj;
    obj["date"] = record.date;
    obj["subject"] = record.subject_slug;
    obj["subject_raw"] = record.subject_raw;

    if (opts.feed)
    {
        const mailcast::message msg = mailcast::unwrap(processor.parse_message());
        const auto adapter = mailcast::get_source_adapter(*opts.feed);
        const mailcast::episode_info info{record.date, record.subject_raw, record.subject_slug};
        mailcast::url_resolver resolver = mailcast::no_redirects;
        if (opts.follow_redirects)
            resolver = mailcast::net::http_redirect_resolver();

        record.body = mailcast::clean_body(adapter, msg, record.body);
        obj["title"] = mailcast::format_title(adapter, info);
        if (auto source_url = mailcast::extract_source_url(adapter, msg, info, resolver))
            obj["source_url"] = *source_url;
        else
            obj["source_url"] = nullptr;
    }
    obj["body"] = record.body;

    if (opts.json_output)
    {
        pretty_print(cout, obj);
        cout << '\n';
    }

    if (opts.write_text_file)
    {
        auto path = mailcast::unwrap(email_processor::write_text_file(record, popts.output_dir));
        cout << "Body text saved to " << path.string() << '\n';
    }

    if (!opts.json_output && !opts.write_text_file)
        cout << "Processing complete. Use --json-output or --write-text-file to output the results.\n";
    return EXIT_SUCCESS;
}


int report(const mailcast::exception& exc, int status)
{
    const mailcast::error& err = exc.info();
    cerr << "Error: " << err.message();
    if (!err.detail().empty())
        cerr << " (" << err.detail() << ")";
    cerr << '\n';
    MAILCAST_DEBUG(exc.what());
    return status;
}

} // namespace


int main(int argc, char* argv[])
{
    enum option_id {INPUT_FILE = 1, JSON_OUTPUT, WRITE_TEXT_FILE, OUTPUT_DIR, FEED, NO_REDIRECTS, LOG_LEVEL, HELP};
    static const option long_options[] =
    {
        {"input-file", required_argument, nullptr, INPUT_FILE},
        {"json-output", no_argument, nullptr, JSON_OUTPUT},
        {"write-text-file", no_argument, nullptr, WRITE_TEXT_FILE},
        {"output-dir", required_argument, nullptr, OUTPUT_DIR},
        {"feed", required_argument, nullptr, FEED},
        {"no-redirects", no_argument, nullptr, NO_REDIRECTS},
        {"log-level", required_argument, nullptr, LOG_LEVEL},
        {"help", no_argument, nullptr, HELP},
        {nullptr, 0, nullptr, 0}
    };

    cli_options opts;
    int ch;
    while ((ch = getopt_long(argc, argv, "", long_options, nullptr)) != -1)
    {
        switch (ch)
        {
            case INPUT_FILE:
                opts.input_file = optarg;
                break;
            case JSON_OUTPUT:
                opts.json_output = true;
                break;
            case WRITE_TEXT_FILE:
                opts.write_text_file = true;
                break;
            case OUTPUT_DIR:
                opts.output_dir = optarg;
                break;
            case FEED:
                opts.feed = optarg;
                break;
            case NO_REDIRECTS:
                opts.follow_redirects = false;
                break;
            case LOG_LEVEL:
            {
                auto lvl = mailcast::log::level_from_string(optarg);
                if (!lvl)
                {
                    cerr << "Unknown log level `" << optarg << "`.\n";
                    return EXIT_OTHER_FAILURE;
                }
                mailcast::log::logger::instance().set_level(*lvl);
                break;
            }
            case HELP:
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            default:
                print_usage(argv[0]);
                return EXIT_OTHER_FAILURE;
        }
    }
    if (optind < argc)
        opts.raw_email = argv[optind++];
    if (optind < argc)
    {
        print_usage(argv[0]);
        return EXIT_OTHER_FAILURE;
    }

    try
    {
        return run(opts);
    }
    catch (const mailcast::no_renderable_content_error& exc)
    {
        return report(exc, EXIT_NO_RENDERABLE_CONTENT);
    }
    catch (const mailcast::exception& exc)
    {
        return report(exc, EXIT_OTHER_FAILURE);
    }
}
