/*

message.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <mailcast/codec/codec.hpp>
#include <mailcast/detail/log.hpp>
#include <mailcast/detail/result.hpp>
#include <mailcast/mime/mime.hpp>


namespace mailcast
{


/**
Mail message: the outermost MIME part of a raw RFC 5322 text.
**/
class message : public mime
{
public:

    inline static const std::string SUBJECT_HEADER{"Subject"};
    inline static const std::string DATE_HEADER{"Date"};
    inline static const std::string FROM_HEADER{"From"};

    message() = default;

    message(const message&) = default;

    message(message&&) = default;

    ~message() override = default;

    message& operator=(const message&) = default;

    message& operator=(message&&) = default;

    /**
    Parsing a raw message.

    CRLF and LF line endings are both accepted. The header section must start on the first line, an optional Unix mbox envelope line aside.

    @param raw Message text.
    @return    Success, or `malformed_message` / `missing_boundary`.
    **/
    result_void parse(std::string_view raw)
    {
        headers_.clear();
        parts_.clear();
        content_.clear();

        if (detail::trim_view(raw).empty())
            return fail(error_code::malformed_message, "Empty message.");

        const lines_t lines = codec::split_lines(raw);
        MAILCAST_TRACE("parsing message of " + std::to_string(lines.size()) + " lines");
        auto res = parse_lines(lines.begin(), lines.end(), content_type_t::TEXT_PLAIN, 0, true);
        if (!res)
            MAILCAST_DEBUG("message rejected: " + res.error().to_string());
        return res;
    }

    /**
    Returning the raw `Subject` header, if present.
    **/
    std::optional<std::string> subject_raw() const
    {
        return find_header(SUBJECT_HEADER);
    }

    /**
    Returning the raw `Date` header, if present.
    **/
    std::optional<std::string> date_raw() const
    {
        return find_header(DATE_HEADER);
    }
};


} // namespace mailcast
