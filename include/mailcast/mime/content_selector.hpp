/*

content_selector.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <mailcast/codec/charset.hpp>
#include <mailcast/codec/codec.hpp>
#include <mailcast/detail/log.hpp>
#include <mailcast/detail/result.hpp>
#include <mailcast/mime/mime.hpp>


namespace mailcast
{


/**
Content type of the part which carries the renderable body.
**/
inline const std::string RENDERABLE_CONTENT_TYPE{"text/html"};


/**
Visiting a part and then its nested parts, depth first in document order.

@param part    Part to start from.
@param visitor Called for every part; returning false stops the walk.
@return        False if the visitor stopped the walk.
**/
inline bool walk(const mime& part, const std::function<bool(const mime&)>& visitor)
{
    if (!visitor(part))
        return false;
    for (const auto& child : part.parts())
        if (!walk(child, visitor))
            return false;
    return true;
}


/**
Finding the first part of the given content type, depth first in document order.

@param root         Part to search from, itself included.
@param content_type Lowercase `type/subtype`.
@return             Part found, or null.
**/
inline const mime* find_first_part(const mime& root, std::string_view content_type)
{
    const mime* found = nullptr;
    walk(root, [&found, content_type](const mime& part)
    {
        if (part.content_type() != content_type)
            return true;
        found = &part;
        return false;
    });
    return found;
}


/**
Decoding the body of a text part into UTF-8.

The transfer encoding is undone, then the octets are converted from the declared charset. CRLF line endings become LF.

@param part            Text part.
@param policy          Treatment of undecodable charset sequences.
@param default_charset Charset assumed when the part declares none.
@return                UTF-8 text, or `decode_error`.
**/
inline result<std::string> decode_text(const mime& part, decode_policy_t policy = decode_policy_t::STRICT,
    std::string_view default_charset = codec::CHARSET_UTF8)
{
    auto octets = part.payload();
    if (!octets)
        return octets;

    const std::string charset = part.charset().value_or(std::string(default_charset));
    std::string text;
    try
    {
        text = to_utf8(*octets, charset, policy);
    }
    catch (const codec_error& exc)
    {
        return fail<std::string>(error_code::decode_error, "Cannot decode `" + part.content_type() + "` part as " + charset + ".", exc.what());
    }

    std::string out;
    out.reserve(text.size());
    for (std::string::size_type i = 0; i < text.size(); i++)
    {
        if (text[i] == codec::CR_CHAR && i + 1 < text.size() && text[i + 1] == codec::LF_CHAR)
            continue;
        out += text[i];
    }
    return out;
}


/**
Selecting the renderable content of a message: the decoded text of its first `text/html` part.

@param msg             Parsed message.
@param default_charset Charset assumed when the part declares none.
@return                UTF-8 markup, `no_renderable_content` if no part qualifies, or `decode_error`.
**/
inline result<std::string> select_renderable(const mime& msg, std::string_view default_charset = codec::CHARSET_UTF8)
{
    const mime* part = find_first_part(msg, RENDERABLE_CONTENT_TYPE);
    if (part == nullptr)
        return fail<std::string>(error_code::no_renderable_content);

    MAILCAST_DEBUG("selected `" + part->content_type() + "` part, charset " + part->charset().value_or(std::string(default_charset)));
    return decode_text(*part, decode_policy_t::STRICT, default_charset);
}


} // namespace mailcast
