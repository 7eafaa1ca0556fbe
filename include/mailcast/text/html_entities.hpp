/*

html_entities.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <mailcast/detail/ascii.hpp>
#include <mailcast/detail/utf8.hpp>
#include <mailcast/text/html_entity_table.hpp>


namespace mailcast
{
namespace html
{


/// Longest name the references are scanned for.
inline constexpr std::string_view::size_type MAX_NAME_LENGTH = 32;


/**
Code points of the Windows-1252 characters at 0x80-0x9F, which numeric references in that range denote.
**/
inline constexpr char32_t WINDOWS_1252_C1[32] =
{
    0x20AC, 0x81, 0x201A, 0x192, 0x201E, 0x2026, 0x2020, 0x2021, 0x2C6, 0x2030, 0x160, 0x2039, 0x152, 0x8D, 0x17D, 0x8F,
    0x90, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014, 0x2DC, 0x2122, 0x161, 0x203A, 0x153, 0x9D, 0x17E, 0x178
};


/**
Looking up a named reference, given with its semicolon for the regular form or without it for the legacy form.
**/
inline std::optional<std::string_view> find_entity(std::string_view name)
{
    auto it = std::lower_bound(std::begin(NAMED_ENTITIES), std::end(NAMED_ENTITIES), name,
        [](const entity_t& e, std::string_view n) { return e.name < n; });
    if (it == std::end(NAMED_ENTITIES) || it->name != name)
        return std::nullopt;
    return it->value;
}


/**
Mapping the value of a numeric character reference to the code point it denotes.
**/
constexpr char32_t numeric_reference_code_point(std::uint32_t value)
{
    if (value >= 0x80 && value <= 0x9F)
        return WINDOWS_1252_C1[value - 0x80];
    if (value == 0 || !detail::is_valid_code_point(value))
        return detail::REPLACEMENT_CODE_POINT;
    return value;
}


/**
Decoding the character references of a text.

A reference which cannot be resolved is kept literally.

@param text Text with character references.
@return     UTF-8 text.
**/
inline std::string decode_character_references(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    std::string_view::size_type pos = 0;
    while (pos < text.size())
    {
        std::string_view::size_type amp = text.find('&', pos);
        if (amp == std::string_view::npos)
        {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, amp - pos));
        pos = amp + 1;

        if (pos < text.size() && text[pos] == '#')
        {
            bool hex = pos + 1 < text.size() && (text[pos + 1] == 'x' || text[pos + 1] == 'X');
            std::string_view::size_type digits_begin = pos + (hex ? 2 : 1);
            std::string_view::size_type digits_end = digits_begin;
            std::uint32_t value = 0;
            while (digits_end < text.size() &&
                (hex ? std::isxdigit(static_cast<unsigned char>(text[digits_end])) : detail::is_ascii_digit(text[digits_end])))
            {
                int digit = detail::is_ascii_digit(text[digits_end]) ? text[digits_end] - '0' : (detail::ascii_tolower(text[digits_end]) - 'a' + 10);
                if (value <= 0x10FFFF)
                    value = value * (hex ? 16 : 10) + digit;
                digits_end++;
            }
            if (digits_end == digits_begin)
            {
                out += '&';
                continue;
            }
            detail::append_utf8(out, numeric_reference_code_point(value));
            pos = digits_end < text.size() && text[digits_end] == ';' ? digits_end + 1 : digits_end;
            continue;
        }

        std::string_view::size_type name_end = pos;
        while (name_end < text.size() && name_end - pos < MAX_NAME_LENGTH && detail::is_ascii_alnum(text[name_end]))
            name_end++;
        std::string_view name = text.substr(pos, name_end - pos);
        if (name_end < text.size() && text[name_end] == ';')
        {
            if (auto value = find_entity(text.substr(pos, name.size() + 1)))
            {
                out.append(*value);
                pos = name_end + 1;
                continue;
            }
        }

        // Longest legacy name the text starts with, as in `&copy2025` or `&amp.`.
        std::string_view::size_type len = name.size();
        std::optional<std::string_view> value;
        while (len >= 2 && !(value = find_entity(name.substr(0, len))))
            len--;
        if (!value)
        {
            out += '&';
            continue;
        }
        out.append(*value);
        pos += len;
    }
    return out;
}


} // namespace html
} // namespace mailcast
