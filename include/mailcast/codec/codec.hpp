/*

codec.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <climits>
#include <string>
#include <string_view>
#include <stdexcept>
#include <vector>


namespace mailcast
{


/**
Base class for decoders, contains various constants and miscellaneous functions for decoding purposes.
**/
class codec
{
public:

    /**
    Calculating value of the given hex digit.

    @param digit Uppercase hexadecimal digit.
    **/
    static constexpr int hex_digit_to_int(char digit)
    {
        return digit >= ZERO_CHAR && digit <= NINE_CHAR ? digit - ZERO_CHAR : digit - A_CHAR + 10;
    }

    /**
    Checking if a character is eight bit.

    @param ch Character to check.
    @return   True if eight bit, false if seven bit.
    **/
    static constexpr bool is_8bit_char(char ch)
    {
        return static_cast<unsigned char>(ch) > 127;
    }

    /**
    Checking if a string contains eight bit characters.

    @param txt String to check.
    @return    True if it's eight bit, false if not.
    **/
    static bool is_8bit_string(std::string_view txt)
    {
        for (auto ch : txt)
            if (is_8bit_char(ch))
                return true;
        return false;
    }

    /**
    Splitting a text into lines, accepting both CRLF and LF as line separators.

    @param text Text to split.
    @return     Lines without their terminators.
    **/
    static std::vector<std::string> split_lines(std::string_view text)
    {
        std::vector<std::string> lines;
        std::string::size_type begin = 0;
        while (begin <= text.size())
        {
            std::string::size_type end = text.find(LF_CHAR, begin);
            if (end == std::string_view::npos)
            {
                if (begin < text.size())
                    lines.emplace_back(text.substr(begin));
                break;
            }
            std::string_view line = text.substr(begin, end - begin);
            if (!line.empty() && line.back() == CR_CHAR)
                line.remove_suffix(1);
            lines.emplace_back(line);
            begin = end + 1;
        }
        return lines;
    }

    /**
    Carriage return character.
    **/
    static constexpr char CR_CHAR = '\r';

    /**
    Line feed character.
    **/
    static constexpr char LF_CHAR = '\n';

    /**
    Plus character.
    **/
    static constexpr char PLUS_CHAR = '+';

    /**
    Slash character.
    **/
    static constexpr char SLASH_CHAR = '/';

    /**
    Equal character.
    **/
    static constexpr char EQUAL_CHAR = '=';

    /**
    Space character.
    **/
    static constexpr char SPACE_CHAR = ' ';

    /**
    Tab character.
    **/
    static constexpr char TAB_CHAR = '\t';

    /**
    Question mark character.
    **/
    static constexpr char QUESTION_MARK_CHAR = '?';

    /**
    Zero number character.
    **/
    static constexpr char ZERO_CHAR = '0';

    /**
    Nine number character.
    **/
    static constexpr char NINE_CHAR = '9';

    /**
    Letter A character.
    **/
    static constexpr char A_CHAR = 'A';

    /**
    Tilde character.
    **/
    static constexpr char TILDE_CHAR = '~';

    /**
    Underscore character.
    **/
    static constexpr char UNDERSCORE_CHAR = '_';

    /**
    Hexadecimal alphabet.
    **/
    inline static const std::string HEX_DIGITS{"0123456789ABCDEF"};

    /**
    Line feed as string, the line separator of decoded text.
    **/
    inline static const std::string END_OF_LINE{"\n"};

    /**
    ASCII charset label.
    **/
    inline static const std::string CHARSET_ASCII{"US-ASCII"};

    /**
    UTF-8 charset label.
    **/
    inline static const std::string CHARSET_UTF8{"UTF-8"};

    /**
    Line length policy.
    **/
    enum class line_len_policy_t : std::string::size_type {MANDATORY = 998, NONE = UINT_MAX};

    /**
    Methods used for the MIME header decoding.
    **/
    enum class codec_t {ASCII, BASE64, QUOTED_PRINTABLE, UTF8};

    /**
    Setting the decoder line policy.

    @param lines_policy Line policy to enforce in strict mode.
    **/
    explicit codec(std::string::size_type lines_policy)
        : lines_policy_(lines_policy), strict_mode_(false)
    {
    }

    codec(const codec&) = delete;

    codec(codec&&) = delete;

    /**
    Default destructor.
    **/
    virtual ~codec() = default;

    void operator=(const codec&) = delete;

    void operator=(codec&&) = delete;

    /**
    Enabling/disabling the strict mode.

    In strict mode malformed input is reported by throwing `codec_error`, otherwise the decoders recover the way mail user agents do.

    @param mode True to enable strict mode, false to disable.
    **/
    void strict_mode(bool mode)
    {
        strict_mode_ = mode;
    }

    /**
    Returning the strict mode status.

    @return True if strict mode enabled, false if disabled.
    **/
    bool strict_mode() const
    {
        return strict_mode_;
    }

protected:

    /**
    Policy applied for decoding of all lines.
    **/
    std::string::size_type lines_policy_;

    /**
    Strict mode for decoding.
    **/
    bool strict_mode_;
};


/**
Error thrown by codecs.
**/
class codec_error : public std::runtime_error
{
public:

    /**
    Calling parent constructor.

    @param msg Error message.
    **/
    explicit codec_error(const std::string& msg) : std::runtime_error(msg)
    {
    }

    /**
    Calling parent constructor.

    @param msg Error message.
    **/
    explicit codec_error(const char* msg) : std::runtime_error(msg)
    {
    }
};


} // namespace mailcast
