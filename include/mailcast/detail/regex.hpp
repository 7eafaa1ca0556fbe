#pragma once

#include <string>
#include <string_view>
#include <boost/regex.hpp>
#include <boost/regex/icu.hpp>

namespace mailcast::detail
{
using regex = boost::regex;
using smatch = boost::smatch;
using sregex_iterator = boost::sregex_iterator;
using match_flag_type = boost::match_flag_type;

template<typename It>
using match_results = boost::match_results<It>;

constexpr match_flag_type match_default = boost::match_default;
constexpr match_flag_type match_not_null = boost::match_not_null;

// Perl syntax where `.` never crosses a line break; `^` and `$` anchor at lines.
constexpr boost::regex::flag_type regex_syntax = boost::regex::perl | boost::regex::no_mod_s;

inline bool regex_match(const std::string& input, smatch& matches, const regex& pattern)
{
    return boost::regex_match(input, matches, pattern);
}

inline bool regex_match(const std::string& input, const regex& pattern)
{
    return boost::regex_match(input, pattern);
}

template<typename It>
inline bool regex_search(It begin, It end, match_results<It>& matches, const regex& pattern, match_flag_type flags)
{
    return boost::regex_search(begin, end, matches, pattern, flags);
}

inline bool regex_search(const std::string& input, smatch& matches, const regex& pattern)
{
    return boost::regex_search(input, matches, pattern);
}

inline bool regex_search(const std::string& input, const regex& pattern)
{
    return boost::regex_search(input, pattern);
}

// Match anchored at the start of the input, not necessarily reaching its end.
inline bool regex_match_prefix(const std::string& input, const regex& pattern)
{
    smatch matches;
    return boost::regex_search(input, matches, pattern, boost::match_continuous);
}

inline std::string regex_escape(std::string_view text)
{
    static const std::string special{R"(\^$.|?*+()[]{}-/)"};
    std::string out;
    for (char ch : text)
    {
        if (special.find(ch) != std::string::npos)
            out += '\\';
        out += ch;
    }
    return out;
}

inline std::string regex_replace(const std::string& input, const regex& pattern, const std::string& replacement)
{
    return boost::regex_replace(input, pattern, replacement, boost::format_perl);
}

// Unicode aware patterns over UTF-8 text, with `\s` and `\w` taken from the ICU character properties.
using u32regex = boost::u32regex;

inline u32regex make_u32regex(const std::string& pattern)
{
    return boost::make_u32regex(pattern, regex_syntax);
}

// The input must be valid UTF-8.
inline std::string u32regex_replace(const std::string& input, const u32regex& pattern, const std::string& replacement)
{
    return boost::u32regex_replace(input, pattern, replacement, boost::format_perl);
}
} // namespace mailcast::detail
