#pragma once

#include <string>
#include <string_view>
#include <cctype>

namespace mailcast
{
namespace detail
{
    [[nodiscard]] constexpr char ascii_tolower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
    }

    [[nodiscard]] inline std::string to_lower_copy(std::string_view sv)
    {
        std::string out(sv);
        for (char& c : out)
            c = ascii_tolower(c);
        return out;
    }

    [[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size())
            return false;

        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (ascii_tolower(a[i]) != ascii_tolower(b[i]))
                return false;
        }
        return true;
    }

    [[nodiscard]] inline bool istarts_with_ascii(std::string_view text, std::string_view prefix) noexcept
    {
        return text.size() >= prefix.size() && iequals_ascii(text.substr(0, prefix.size()), prefix);
    }

    // Space, tab, CR, LF, vertical tab and form feed.
    [[nodiscard]] constexpr bool is_ascii_space(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
    }

    [[nodiscard]] inline std::string_view trim_view(std::string_view sv) noexcept
    {
        while (!sv.empty() && is_ascii_space(sv.front()))
            sv.remove_prefix(1);
        while (!sv.empty() && is_ascii_space(sv.back()))
            sv.remove_suffix(1);
        return sv;
    }

    [[nodiscard]] inline std::string trim_copy(std::string_view sv)
    {
        sv = trim_view(sv);
        return std::string(sv);
    }

    inline void trim_inplace(std::string& s)
    {
        std::string_view sv = trim_view(s);
        if (sv.size() == s.size())
            return;
        s.assign(sv.begin(), sv.end());
    }

    // RFC 5322: field-name = 1*ftext; ftext = %d33-57 / %d59-126 (printable US-ASCII except ":")
    [[nodiscard]] inline bool is_valid_header_name(std::string_view name) noexcept
    {
        if (name.empty())
            return false;

        for (char ch : name)
        {
            unsigned char c = static_cast<unsigned char>(ch);
            const bool ok = ((c >= 33 && c <= 57) || (c >= 59 && c <= 126));
            if (!ok)
                return false;
        }
        return true;
    }

    [[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    [[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept
    {
        return (c >= '0' && c <= '9');
    }

    [[nodiscard]] constexpr bool is_ascii_alnum(char c) noexcept
    {
        return is_ascii_alpha(c) || is_ascii_digit(c);
    }

    [[nodiscard]] constexpr bool is_all_digits(std::string_view s) noexcept
    {
        if (s.empty())
            return false;
        for (char ch : s)
        {
            if (!is_ascii_digit(ch))
                return false;
        }
        return true;
    }
}
}
