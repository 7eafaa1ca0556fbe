/*

processor.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <mailcast/codec/codec.hpp>
#include <mailcast/config.hpp>
#include <mailcast/detail/log.hpp>
#include <mailcast/detail/result.hpp>
#include <mailcast/mime/content_selector.hpp>
#include <mailcast/mime/message.hpp>
#include <mailcast/mime/metadata.hpp>
#include <mailcast/text/cleaner.hpp>
#include <mailcast/text/footnotes.hpp>
#include <mailcast/text/normalizer.hpp>


namespace mailcast
{


/**
 * Runtime options of the email processor.
 */
struct processor_options
{
    /// Charset of text parts which declare none
    std::string default_charset = codec::CHARSET_UTF8;

    /// Reject malformed Base64 / Quoted-Printable payloads instead of skipping the noise
    bool strict_codec_mode = false;

    /// Subject of messages without `Subject` header
    std::string default_subject = DEFAULT_SUBJECT;

    /// Directory of the body files
    std::filesystem::path output_dir = MAILCAST_DEFAULT_OUTPUT_DIR;

    // ==================== Factory Methods ====================

    /// Lenient decoding, as mail clients do
    static processor_options lenient()
    {
        return processor_options{};
    }

    /// Strict decoding, for validating archives
    static processor_options strict()
    {
        processor_options opts;
        opts.strict_codec_mode = true;
        return opts;
    }

    /// Options writing the body files into the given directory
    static processor_options writing_to(std::filesystem::path dir)
    {
        processor_options opts;
        opts.output_dir = std::move(dir);
        return opts;
    }
};


/**
 * Result of processing one message.
 */
struct email_record
{
    /// `YYYY-MM-DD`, or `9999-12-31` if unknown
    std::string date;

    std::string subject_slug;

    std::string subject_raw;

    /// Narration ready body text
    std::string body;
};


/**
Turning a raw newsletter message into a date, a subject and a narration ready body.

The processor owns its copy of the raw message; each call to `parse()` runs the whole pipeline again.
**/
class email_processor
{
public:

    /**
    Taking a raw message.

    @param raw_email Message text or octets.
    @param options   Processing options.
    **/
    explicit email_processor(std::string raw_email, processor_options options = {})
        : raw_email_(std::move(raw_email)), options_(std::move(options))
    {
    }

    const processor_options& options() const
    {
        return options_;
    }

    /**
    Processing the message.

    @return Record, or `malformed_message`, `missing_boundary`, `no_renderable_content`, `decode_error` or `dangling_footnote`.
    **/
    result<email_record> parse() const
    {
        auto msg = parse_message();
        if (!msg)
            return forward_error<email_record>(msg);

        auto markup = select_renderable(*msg, options_.default_charset);
        if (!markup)
        {
            MAILCAST_DEBUG("no body: " + markup.error().to_string());
            return forward_error<email_record>(markup);
        }

        message_metadata meta = extract_metadata(*msg, options_.default_subject);

        const std::string flattened = structural_cleaner().clean(*markup);
        auto body = footnote_inliner().inline_footnotes(whitespace_normalizer().normalize(flattened));
        if (!body)
        {
            MAILCAST_WARN(body.error().to_string());
            return forward_error<email_record>(body);
        }

        MAILCAST_INFO("processed `" + meta.subject_raw + "` of " + meta.date + ", " + std::to_string(body->size()) + " octets of text");
        return email_record{std::move(meta.date), std::move(meta.subject_slug), std::move(meta.subject_raw), std::move(*body)};
    }

    /**
    Parsing the raw message alone, for callers which need the part tree.
    **/
    result<message> parse_message() const
    {
        message msg;
        msg.strict_codec_mode(options_.strict_codec_mode);
        auto res = msg.parse(raw_email_);
        if (!res)
            return forward_error<message>(res);
        return msg;
    }

    /**
    Processing the message and writing its body into `<date>-<subject slug>.txt`.

    @param output_dir Directory, created if missing; the configured directory if not given.
    @return           Path of the file written, an error of `parse()`, or `io_error`.
    **/
    result<std::filesystem::path> write_text_file(std::optional<std::filesystem::path> output_dir = std::nullopt) const
    {
        auto record = parse();
        if (!record)
            return forward_error<std::filesystem::path>(record);
        return write_text_file(*record, output_dir.value_or(options_.output_dir));
    }

    /**
    Writing the body of a record into `<dir>/<date>-<subject slug>.txt`.
    **/
    static result<std::filesystem::path> write_text_file(const email_record& record, const std::filesystem::path& dir)
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return fail<std::filesystem::path>(error_code::io_error, "Cannot create the output directory.", dir.string() + ": " + ec.message());

        const std::filesystem::path path = dir / (record.date + "-" + record.subject_slug + ".txt");
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out)
            return fail<std::filesystem::path>(error_code::io_error, "Cannot open the output file.", path.string());
        out << record.body;
        out.close();
        if (!out)
            return fail<std::filesystem::path>(error_code::io_error, "Cannot write the output file.", path.string());

        MAILCAST_INFO("wrote " + path.string());
        return path;
    }

private:

    std::string raw_email_;
    processor_options options_;
};


} // namespace mailcast
