/*

quoted_printable.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cctype>
#include <string>
#include <vector>
#include <mailcast/codec/codec.hpp>


namespace mailcast
{


/**
Quoted Printable decoder, also used by the Q codec in its header mode.
**/
class quoted_printable : public codec
{
public:

    /**
    Setting the decoder line policy.

    @param lines_policy Line policy enforced in strict mode.
    **/
    explicit quoted_printable(std::string::size_type lines_policy)
        : codec(lines_policy), q_codec_mode_(false)
    {
    }

    quoted_printable(const quoted_printable&) = delete;

    quoted_printable(quoted_printable&&) = delete;

    /**
    Default destructor.
    **/
    ~quoted_printable() = default;

    void operator=(const quoted_printable&) = delete;

    void operator=(quoted_printable&&) = delete;

    /**
    Decoding a vector of quoted printable strings to string.

    Lines are joined by line feeds unless a line ends with a soft break. Outside of strict mode, an escape which is not followed by two hex digits
    is copied as is.

    @param text        Vector of quoted printable encoded strings.
    @return            Decoded string.
    @throw codec_error Bad line policy.
    @throw codec_error Bad character.
    @throw codec_error Bad hexadecimal digit.
    **/
    std::string decode(const std::vector<std::string>& text) const
    {
        std::string dec_text;
        for (std::vector<std::string>::size_type l = 0; l < text.size(); l++)
        {
            const std::string& line = text[l];
            if (strict_mode_ && line.length() > lines_policy_ - 2)
                throw codec_error("Bad line policy.");

            // Whitespace after a soft break is transport padding.
            std::string::size_type line_end = line.length();
            bool soft_break = false;
            if (!q_codec_mode_)
            {
                std::string::size_type last = line.find_last_not_of(" \t");
                if (last != std::string::npos && line[last] == EQUAL_CHAR)
                {
                    soft_break = true;
                    line_end = last;
                }
            }

            for (std::string::size_type ch = 0; ch < line_end; ch++)
            {
                if (strict_mode_ && !is_allowed(line[ch]))
                    throw codec_error("Bad character `" + std::string(1, line[ch]) + "`.");

                if (line[ch] == EQUAL_CHAR)
                {
                    char next_char = ch + 1 < line_end ? static_cast<char>(std::toupper(static_cast<unsigned char>(line[ch + 1]))) : '\0';
                    char next_next_char = ch + 2 < line_end ? static_cast<char>(std::toupper(static_cast<unsigned char>(line[ch + 2]))) : '\0';
                    if (next_char == '\0' || next_next_char == '\0' ||
                        HEX_DIGITS.find(next_char) == std::string::npos || HEX_DIGITS.find(next_next_char) == std::string::npos)
                    {
                        if (strict_mode_)
                            throw codec_error("Bad hexadecimal digit.");
                        dec_text += EQUAL_CHAR;
                        continue;
                    }
                    int nc_val = hex_digit_to_int(next_char);
                    int nnc_val = hex_digit_to_int(next_next_char);
                    dec_text += static_cast<char>((nc_val << 4) + nnc_val);
                    ch += 2;
                }
                else
                {
                    if (q_codec_mode_ && line[ch] == UNDERSCORE_CHAR)
                        dec_text += SPACE_CHAR;
                    else
                        dec_text += line[ch];
                }
            }
            if (!soft_break && !q_codec_mode_ && l + 1 < text.size())
                dec_text += END_OF_LINE;
        }

        return dec_text;
    }

    /**
    Setting Q codec mode.

    @param mode True to set, false to unset.
    **/
    void q_codec_mode(bool mode)
    {
        q_codec_mode_ = mode;
    }

private:

    /**
    Check if a character is in the Quoted Printable character set.

    @param ch Character to check.
    @return   True if it is, false if not.
    **/
    bool is_allowed(char ch) const
    {
        return ((ch >= SPACE_CHAR && ch <= TILDE_CHAR) || ch == TAB_CHAR);
    }

    /**
    Flag for the Q codec mode.
    **/
    bool q_codec_mode_;
};


} // namespace mailcast
