/*

mime.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <mailcast/codec/base64.hpp>
#include <mailcast/codec/codec.hpp>
#include <mailcast/codec/quoted_printable.hpp>
#include <mailcast/config.hpp>
#include <mailcast/detail/ascii.hpp>
#include <mailcast/detail/result.hpp>


namespace mailcast
{


/**
Content type of a MIME part, as `media_type/media_subtype; attribute=value`.
**/
class content_type_t
{
public:

    /**
    Attributes of the content type, keyed by lowercase name.
    **/
    using attributes_t = std::map<std::string, std::string>;

    /**
    Charset attribute name.
    **/
    inline static const std::string ATTR_CHARSET{"charset"};

    /**
    Boundary attribute name.
    **/
    inline static const std::string ATTR_BOUNDARY{"boundary"};

    /**
    Default content type of a part without a valid header.
    **/
    inline static const std::string TEXT_PLAIN{"text/plain"};

    /**
    Default content type of a part inside a digest.
    **/
    inline static const std::string MESSAGE_RFC822{"message/rfc822"};

    content_type_t() = default;

    /**
    Setting the media type, subtype and attributes.

    @param media_type    Media type, lowercased.
    @param media_subtype Media subtype, lowercased.
    @param attributes    Attributes.
    **/
    content_type_t(std::string media_type, std::string media_subtype, attributes_t attributes = {})
        : media_type_(detail::to_lower_copy(media_type)), media_subtype_(detail::to_lower_copy(media_subtype)),
        attributes_(std::move(attributes))
    {
    }

    /**
    Parsing a `Content-Type` header value.

    A value without exactly one slash in its type part is invalid.

    @param value Header value.
    @return      Content type, or nothing if the value is invalid.
    **/
    static std::optional<content_type_t> parse(std::string_view value)
    {
        std::vector<std::string> fields = split_parameters(value);
        if (fields.empty())
            return std::nullopt;

        std::string type = detail::trim_copy(fields.front());
        std::string::size_type slash_pos = type.find('/');
        if (slash_pos == std::string::npos || slash_pos == 0 || slash_pos + 1 == type.size() ||
            type.find('/', slash_pos + 1) != std::string::npos)
            return std::nullopt;

        attributes_t attributes;
        for (std::size_t i = 1; i < fields.size(); i++)
        {
            std::string::size_type eq_pos = fields[i].find('=');
            if (eq_pos == std::string::npos)
                continue;
            std::string name = detail::to_lower_copy(detail::trim_view(std::string_view(fields[i]).substr(0, eq_pos)));
            if (name.empty())
                continue;
            attributes[name] = unquote(detail::trim_view(std::string_view(fields[i]).substr(eq_pos + 1)));
        }

        return content_type_t(detail::trim_copy(type.substr(0, slash_pos)), detail::trim_copy(type.substr(slash_pos + 1)),
            std::move(attributes));
    }

    const std::string& media_type() const
    {
        return media_type_;
    }

    const std::string& media_subtype() const
    {
        return media_subtype_;
    }

    /**
    Returning the type as `media_type/media_subtype`.
    **/
    std::string type() const
    {
        return media_type_ + "/" + media_subtype_;
    }

    const attributes_t& attributes() const
    {
        return attributes_;
    }

    /**
    Returning the lowercased charset attribute, if declared.
    **/
    std::optional<std::string> charset() const
    {
        auto it = attributes_.find(ATTR_CHARSET);
        if (it == attributes_.end() || it->second.empty())
            return std::nullopt;
        return detail::to_lower_copy(it->second);
    }

    /**
    Returning the boundary attribute, empty if not declared.
    **/
    std::string boundary() const
    {
        auto it = attributes_.find(ATTR_BOUNDARY);
        return it == attributes_.end() ? std::string() : it->second;
    }

private:

    /**
    Splitting a header value at semicolons which are not inside quotes.
    **/
    static std::vector<std::string> split_parameters(std::string_view value)
    {
        std::vector<std::string> fields;
        std::string field;
        bool quoted = false;
        for (std::string_view::size_type i = 0; i < value.size(); i++)
        {
            char ch = value[i];
            if (quoted && ch == '\\' && i + 1 < value.size())
            {
                field += ch;
                field += value[++i];
                continue;
            }
            if (ch == '"')
                quoted = !quoted;
            if (ch == ';' && !quoted)
            {
                fields.push_back(field);
                field.clear();
                continue;
            }
            field += ch;
        }
        if (!detail::trim_view(field).empty() || fields.empty())
            fields.push_back(field);
        return fields;
    }

    /**
    Removing the quotes and escapes of a quoted string.
    **/
    static std::string unquote(std::string_view value)
    {
        if (value.size() < 2 || value.front() != '"' || value.back() != '"')
            return std::string(value);
        std::string out;
        value = value.substr(1, value.size() - 2);
        for (std::string_view::size_type i = 0; i < value.size(); i++)
        {
            if (value[i] == '\\' && i + 1 < value.size())
                i++;
            out += value[i];
        }
        return out;
    }

    std::string media_type_;
    std::string media_subtype_;
    attributes_t attributes_;
};


/**
MIME part: header fields, content type and body, with the nested parts of a container.

A part is built by parsing and never changes afterwards.
**/
class mime
{
public:

    /**
    Content transfer encodings.
    **/
    enum class content_transfer_encoding_t {BIT_7, BIT_8, BINARY, BASE_64, QUOTED_PRINTABLE};

    /**
    Header field as name and unfolded value.
    **/
    using header_t = std::pair<std::string, std::string>;

    inline static const std::string CONTENT_TYPE_HEADER{"Content-Type"};
    inline static const std::string CONTENT_TRANSFER_ENCODING_HEADER{"Content-Transfer-Encoding"};

    /**
    Boundary delimiter prefix and close delimiter suffix.
    **/
    inline static const std::string BOUNDARY_DELIMITER{"--"};

    /**
    Nesting deeper than this is rejected as malformed.
    **/
    static constexpr unsigned MAX_NESTING_DEPTH = MAILCAST_MAX_NESTING_DEPTH;

    mime() = default;

    mime(const mime&) = default;

    mime(mime&&) = default;

    virtual ~mime() = default;

    mime& operator=(const mime&) = default;

    mime& operator=(mime&&) = default;

    /**
    Returning the header fields in arrival order.
    **/
    const std::vector<header_t>& headers() const
    {
        return headers_;
    }

    /**
    Looking up the first header field with the given name, ignoring case.

    @param name Header name.
    @return     Header value, or nothing if absent.
    **/
    std::optional<std::string> find_header(std::string_view name) const
    {
        for (const auto& h : headers_)
            if (detail::iequals_ascii(h.first, name))
                return h.second;
        return std::nullopt;
    }

    /**
    Looking up the first header field with the given name, ignoring case.

    @param name          Header name.
    @param default_value Value returned if the header is absent.
    @return              Header value or the default.
    **/
    std::string header(std::string_view name, std::string_view default_value = "") const
    {
        auto value = find_header(name);
        return value ? *value : std::string(default_value);
    }

    /**
    Returning the values of every header field with the given name, ignoring case.
    **/
    std::vector<std::string> header_all(std::string_view name) const
    {
        std::vector<std::string> values;
        for (const auto& h : headers_)
            if (detail::iequals_ascii(h.first, name))
                values.push_back(h.second);
        return values;
    }

    const content_type_t& content_type_info() const
    {
        return content_type_;
    }

    /**
    Returning the content type as lowercased `type/subtype`.
    **/
    std::string content_type() const
    {
        return content_type_.type();
    }

    /**
    Returning the declared charset, lowercased.
    **/
    std::optional<std::string> charset() const
    {
        return content_type_.charset();
    }

    content_transfer_encoding_t content_transfer_encoding() const
    {
        return encoding_;
    }

    bool is_multipart() const
    {
        return content_type_.media_type() == "multipart";
    }

    /**
    Returning the nested parts: the parts of a multipart container, or the encapsulated message of a `message/rfc822` part.
    **/
    const std::vector<mime>& parts() const
    {
        return parts_;
    }

    /**
    Returning the body as found in the message, without transfer decoding.
    **/
    const std::string& raw_content() const
    {
        return content_;
    }

    /**
    Returning the body with the transfer encoding undone.

    @return Decoded octets, or `decode_error`.
    **/
    result<std::string> payload() const
    {
        try
        {
            if (encoding_ == content_transfer_encoding_t::BASE_64)
            {
                base64 b64(static_cast<std::string::size_type>(codec::line_len_policy_t::MANDATORY));
                b64.strict_mode(strict_codec_mode_);
                return b64.decode(codec::split_lines(content_));
            }
            if (encoding_ == content_transfer_encoding_t::QUOTED_PRINTABLE)
            {
                quoted_printable qp(static_cast<std::string::size_type>(codec::line_len_policy_t::MANDATORY));
                qp.strict_mode(strict_codec_mode_);
                return qp.decode(codec::split_lines(content_));
            }
        }
        catch (const codec_error& exc)
        {
            return fail<std::string>(error_code::decode_error, "Cannot undo the transfer encoding of a `" + content_type() + "` part.",
                exc.what());
        }
        return content_;
    }

    /**
    Enabling/disabling strict transfer decoding of this part and the parts parsed after the call.
    **/
    void strict_codec_mode(bool mode)
    {
        strict_codec_mode_ = mode;
    }

    bool strict_codec_mode() const
    {
        return strict_codec_mode_;
    }

protected:

    using lines_t = std::vector<std::string>;

    /**
    Parsing the lines of a part.

    @param begin        First line of the part.
    @param end          One past the last line of the part.
    @param default_type Content type assumed when the header is absent or invalid.
    @param depth        Nesting depth of the part.
    @param top_level    True for the outermost message, whose header section is mandatory.
    @return             Success, or `malformed_message` / `missing_boundary`.
    **/
    result_void parse_lines(lines_t::const_iterator begin, lines_t::const_iterator end, const std::string& default_type, unsigned depth,
        bool top_level)
    {
        if (depth > MAX_NESTING_DEPTH)
            return fail(error_code::malformed_message, "Too deeply nested message.", std::to_string(depth) + " levels.");

        auto line = begin;
        // Unix mbox envelope line.
        if (top_level && line != end && line->rfind("From ", 0) == 0)
            ++line;

        for (; line != end && !line->empty(); ++line)
        {
            if (line->front() == codec::SPACE_CHAR || line->front() == codec::TAB_CHAR)
            {
                if (headers_.empty())
                {
                    if (top_level)
                        return fail(error_code::malformed_message, "Header continuation without a header.", *line);
                    break;
                }
                headers_.back().second += *line;
                continue;
            }

            std::string header_name, header_value;
            if (!parse_header_name_value(*line, header_name, header_value))
            {
                if (top_level && headers_.empty())
                    return fail(error_code::malformed_message, "Message does not start with a header.", *line);
                // Body without the separating empty line.
                break;
            }
            headers_.emplace_back(std::move(header_name), std::move(header_value));
        }
        for (auto& h : headers_)
            detail::trim_inplace(h.second);

        if (line != end && line->empty())
            ++line;

        auto ct = find_header(CONTENT_TYPE_HEADER);
        std::optional<content_type_t> parsed_ct = ct ? content_type_t::parse(*ct) : std::nullopt;
        if (parsed_ct)
            content_type_ = std::move(*parsed_ct);
        else
            content_type_ = *content_type_t::parse(default_type);
        encoding_ = parse_content_transfer_encoding(header(CONTENT_TRANSFER_ENCODING_HEADER));

        if (is_multipart())
            return parse_multipart(line, end, depth);

        content_ = join_lines(line, end);
        if (content_type() == content_type_t::MESSAGE_RFC822)
        {
            mime encapsulated;
            encapsulated.strict_codec_mode(strict_codec_mode_);
            auto res = encapsulated.parse_lines(line, end, content_type_t::TEXT_PLAIN, depth + 1, false);
            if (!res)
                return res;
            parts_.push_back(std::move(encapsulated));
        }
        return ok();
    }

    /**
    Splitting a header line into name and value.

    @return True if the line is a header field, false if not.
    **/
    static bool parse_header_name_value(const std::string& header_line, std::string& header_name, std::string& header_value)
    {
        std::string::size_type colon_pos = header_line.find(':');
        if (colon_pos == std::string::npos)
            return false;
        std::string name = detail::trim_copy(std::string_view(header_line).substr(0, colon_pos));
        if (!detail::is_valid_header_name(name))
            return false;
        header_name = std::move(name);
        header_value = header_line.substr(colon_pos + 1);
        return true;
    }

    static content_transfer_encoding_t parse_content_transfer_encoding(std::string_view value)
    {
        value = detail::trim_view(value);
        if (detail::iequals_ascii(value, "base64"))
            return content_transfer_encoding_t::BASE_64;
        if (detail::iequals_ascii(value, "quoted-printable"))
            return content_transfer_encoding_t::QUOTED_PRINTABLE;
        if (detail::iequals_ascii(value, "8bit"))
            return content_transfer_encoding_t::BIT_8;
        if (detail::iequals_ascii(value, "binary"))
            return content_transfer_encoding_t::BINARY;
        return content_transfer_encoding_t::BIT_7;
    }

    static std::string join_lines(lines_t::const_iterator begin, lines_t::const_iterator end)
    {
        std::string text;
        for (auto line = begin; line != end; ++line)
        {
            if (line != begin)
                text += codec::END_OF_LINE;
            text += *line;
        }
        return text;
    }

    std::vector<header_t> headers_;
    content_type_t content_type_;
    content_transfer_encoding_t encoding_ = content_transfer_encoding_t::BIT_7;
    std::string content_;
    std::vector<mime> parts_;
    bool strict_codec_mode_ = false;

private:

    /**
    Splitting the body of a multipart container at its boundary delimiters.

    The preamble and the epilogue are dropped. A missing close delimiter ends the last part at the end of the body.
    **/
    result_void parse_multipart(lines_t::const_iterator begin, lines_t::const_iterator end, unsigned depth)
    {
        const std::string boundary = content_type_.boundary();
        if (boundary.empty())
            return fail(error_code::missing_boundary, "Multipart content without boundary.", content_type());

        const std::string delimiter = BOUNDARY_DELIMITER + boundary;
        const std::string close_delimiter = delimiter + BOUNDARY_DELIMITER;
        const std::string child_type = content_type_.media_subtype() == "digest" ? content_type_t::MESSAGE_RFC822 : content_type_t::TEXT_PLAIN;

        auto is_delimiter = [](const std::string& line, const std::string& delim)
        {
            return line.compare(0, delim.size(), delim) == 0 && detail::trim_view(std::string_view(line).substr(delim.size())).empty();
        };

        auto line = begin;
        while (line != end && !is_delimiter(*line, delimiter))
            ++line;
        if (line == end)
            return fail(error_code::malformed_message, "Multipart boundary not found.", boundary);
        content_ = join_lines(begin, line);

        auto part_begin = ++line;
        bool closed = false;
        for (; line != end && !closed; ++line)
        {
            closed = is_delimiter(*line, close_delimiter);
            if (!closed && !is_delimiter(*line, delimiter))
                continue;

            auto res = add_part(part_begin, line, child_type, depth);
            if (!res)
                return res;
            part_begin = line + 1;
        }
        if (!closed && part_begin < end)
            return add_part(part_begin, end, child_type, depth);
        return ok();
    }

    result_void add_part(lines_t::const_iterator begin, lines_t::const_iterator end, const std::string& default_type, unsigned depth)
    {
        mime part;
        part.strict_codec_mode(strict_codec_mode_);
        auto res = part.parse_lines(begin, end, default_type, depth + 1, false);
        if (!res)
            return res;
        parts_.push_back(std::move(part));
        return ok();
    }
};


} // namespace mailcast
