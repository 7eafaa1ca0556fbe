#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unicode/uchar.h>

namespace mailcast
{
namespace detail
{
    constexpr char32_t REPLACEMENT_CODE_POINT = 0xFFFD;

    [[nodiscard]] constexpr bool is_valid_code_point(char32_t cp) noexcept
    {
        return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
    }

    inline void append_utf8(std::string& out, char32_t cp)
    {
        if (!is_valid_code_point(cp))
            cp = REPLACEMENT_CODE_POINT;

        if (cp < 0x80)
        {
            out += static_cast<char>(cp);
        }
        else if (cp < 0x800)
        {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x10000)
        {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else
        {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    /// Decode the code point at `pos` and advance past it; a malformed sequence yields U+FFFD and consumes one byte.
    [[nodiscard]] inline char32_t next_code_point(std::string_view text, std::size_t& pos) noexcept
    {
        auto byte = [&text](std::size_t i) { return static_cast<unsigned char>(text[i]); };
        const unsigned char lead = byte(pos);
        std::size_t len = 0;
        char32_t cp = 0;
        if (lead < 0x80)
        {
            ++pos;
            return lead;
        }
        if ((lead & 0xE0) == 0xC0)
        {
            len = 2;
            cp = lead & 0x1F;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            len = 3;
            cp = lead & 0x0F;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            len = 4;
            cp = lead & 0x07;
        }
        else
        {
            ++pos;
            return REPLACEMENT_CODE_POINT;
        }

        if (pos + len > text.size())
        {
            ++pos;
            return REPLACEMENT_CODE_POINT;
        }
        for (std::size_t i = 1; i < len; ++i)
        {
            if ((byte(pos + i) & 0xC0) != 0x80)
            {
                ++pos;
                return REPLACEMENT_CODE_POINT;
            }
            cp = (cp << 6) | (byte(pos + i) & 0x3F);
        }

        constexpr char32_t min_for_len[] = {0, 0, 0x80, 0x800, 0x10000};
        if (cp < min_for_len[len] || !is_valid_code_point(cp))
        {
            ++pos;
            return REPLACEMENT_CODE_POINT;
        }
        pos += len;
        return cp;
    }

    /// The White_Space property plus the information separators U+001C-U+001F.
    [[nodiscard]] inline bool is_unicode_space(char32_t cp) noexcept
    {
        return (cp >= 0x1C && cp <= 0x1F) || u_hasBinaryProperty(static_cast<UChar32>(cp), UCHAR_WHITE_SPACE);
    }

    /// Letters, numbers and underscore, by general category; marks, punctuation and symbols are not word characters.
    [[nodiscard]] inline bool is_word_code_point(char32_t cp) noexcept
    {
        return cp == '_' || (U_GET_GC_MASK(static_cast<UChar32>(cp)) & (U_GC_L_MASK | U_GC_N_MASK)) != 0;
    }

    /// Copy of the text where every malformed sequence is replaced by U+FFFD.
    [[nodiscard]] inline std::string valid_utf8_copy(std::string_view text)
    {
        std::string out;
        out.reserve(text.size());
        for (std::size_t pos = 0; pos < text.size();)
            append_utf8(out, next_code_point(text, pos));
        return out;
    }

    /// Strip leading and trailing Unicode whitespace.
    [[nodiscard]] inline std::string trim_unicode_copy(std::string_view text)
    {
        std::size_t begin = text.size();
        std::size_t end = 0;
        std::size_t pos = 0;
        while (pos < text.size())
        {
            std::size_t start = pos;
            char32_t cp = next_code_point(text, pos);
            if (is_unicode_space(cp))
                continue;
            if (begin == text.size())
                begin = start;
            end = pos;
        }
        return begin < end ? std::string(text.substr(begin, end - begin)) : std::string();
    }
} // namespace detail
} // namespace mailcast
