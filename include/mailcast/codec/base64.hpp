/*

base64.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <vector>
#include <mailcast/codec/codec.hpp>
#include <mailcast/detail/ascii.hpp>


namespace mailcast
{


/**
Base64 decoder.
**/
class base64 : public codec
{
public:

    /**
    Base64 character set.
    **/
    inline static const std::string CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    /**
    Setting the decoder line policy.

    @param lines_policy Line policy enforced in strict mode.
    **/
    explicit base64(std::string::size_type lines_policy)
        : codec(lines_policy)
    {
    }

    base64(const base64&) = delete;

    base64(base64&&) = delete;

    /**
    Default destructor.
    **/
    ~base64() = default;

    void operator=(const base64&) = delete;

    void operator=(base64&&) = delete;

    /**
    Decoding a vector of Base64 encoded strings to string.

    A quantum may span two lines. Padding closes the current quantum. Outside of strict mode the characters not belonging to the alphabet are
    skipped, as transports tend to insert them.

    @param text        Vector of Base64 encoded strings.
    @return            Decoded string.
    @throw codec_error Bad line policy.
    @throw codec_error Bad character.
    **/
    std::string decode(const std::vector<std::string>& text) const
    {
        std::string dec_text;
        unsigned char sextets[SEXTETS_NO];
        int count_4_chars = 0;

        auto flush = [&dec_text, &sextets](int count)
        {
            unsigned char octets[OCTETS_NO];
            octets[0] = (sextets[0] << 2) + ((sextets[1] & 0x30) >> 4);
            octets[1] = ((sextets[1] & 0xf) << 4) + ((sextets[2] & 0x3c) >> 2);
            octets[2] = ((sextets[2] & 0x3) << 6) + sextets[3];
            for (int i = 0; i < count - 1; i++)
                dec_text += static_cast<char>(octets[i]);
        };

        for (const auto& line : text)
        {
            if (strict_mode_ && line.length() > lines_policy_)
                throw codec_error("Bad line policy.");

            for (char ch : line)
            {
                if (ch == EQUAL_CHAR)
                {
                    // decode remaining characters if any
                    if (count_4_chars > 1)
                    {
                        for (int i = count_4_chars; i < SEXTETS_NO; i++)
                            sextets[i] = 0;
                        flush(count_4_chars);
                    }
                    count_4_chars = 0;
                    continue;
                }

                if (!is_allowed(ch))
                {
                    if (strict_mode_ && !detail::is_ascii_space(ch))
                        throw codec_error("Bad character `" + std::string(1, ch) + "`.");
                    continue;
                }

                sextets[count_4_chars++] = static_cast<unsigned char>(CHARSET.find(ch));
                if (count_4_chars == SEXTETS_NO)
                {
                    flush(OCTETS_NO + 1);
                    count_4_chars = 0;
                }
            }
        }

        if (count_4_chars > 1)
        {
            for (int i = count_4_chars; i < SEXTETS_NO; i++)
                sextets[i] = 0;
            flush(count_4_chars);
        }
        else if (count_4_chars == 1 && strict_mode_)
            throw codec_error("Bad Base64 length.");

        return dec_text;
    }

    /**
    Decoding a Base64 string to a string.

    @param text Base64 encoded string.
    @return     Decoded string.
    @throw *    `decode(const std::vector<std::string>&)`.
    **/
    std::string decode(const std::string& text) const
    {
        std::vector<std::string> v;
        v.push_back(text);
        return decode(v);
    }

private:

    /**
    Checking if the given character is in the base64 character set.

    @param ch Character to check.
    @return   True if it is, false if not.
    **/
    bool is_allowed(char ch) const
    {
        return (detail::is_ascii_alnum(ch) || ch == PLUS_CHAR || ch == SLASH_CHAR);
    }

    /**
    Number of six bit chunks.
    **/
    static constexpr unsigned short SEXTETS_NO = 4;

    /**
    Number of eight bit characters.
    **/
    static constexpr unsigned short OCTETS_NO = SEXTETS_NO - 1;
};


} // namespace mailcast
