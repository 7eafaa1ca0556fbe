/*

normalizer.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <mailcast/detail/regex.hpp>
#include <mailcast/detail/utf8.hpp>


namespace mailcast
{


/**
Collapsing the whitespace left over by flattening markup.

The rewrites run in a fixed order, and running them again on their output changes nothing.
**/
class whitespace_normalizer
{
public:

    whitespace_normalizer()
        : soft_break_(detail::make_u32regex(R"(=\s*\n)")),
        blank_lines_(detail::make_u32regex(R"(\n\s*\n\s*\n+)")),
        horizontal_space_(detail::make_u32regex(R"((?:(?![\r\n])\s)+)")),
        trailing_space_(detail::make_u32regex(R"( +\n)"))
    {
    }

    /**
    Normalizing text.

    Whitespace is any Unicode space, so em spaces, thin spaces and ideographic spaces collapse like ASCII ones. Malformed UTF-8
    sequences become U+FFFD first.

    @param text Flattened text.
    @return     Text with soft breaks removed, blank lines and space runs collapsed, and ends trimmed.
    **/
    std::string normalize(const std::string& text) const
    {
        std::string out = detail::u32regex_replace(detail::valid_utf8_copy(text), soft_break_, "");
        out = detail::u32regex_replace(out, blank_lines_, "\n\n");
        out = detail::u32regex_replace(out, horizontal_space_, " ");
        out = detail::u32regex_replace(out, trailing_space_, "\n");
        return detail::trim_unicode_copy(out);
    }

private:

    // Quoted-printable residue such as `=\n` or `=  \n`.
    detail::u32regex soft_break_;
    detail::u32regex blank_lines_;
    // Spaces other than line breaks.
    detail::u32regex horizontal_space_;
    detail::u32regex trailing_space_;
};


} // namespace mailcast
