/*

metadata.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <array>
#include <charconv>
#include <chrono>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <mailcast/codec/codec.hpp>
#include <mailcast/codec/q_codec.hpp>
#include <mailcast/detail/ascii.hpp>
#include <mailcast/detail/log.hpp>
#include <mailcast/detail/utf8.hpp>
#include <mailcast/mime/message.hpp>


namespace mailcast
{


/**
Date written for messages whose date cannot be recovered.
**/
inline const std::string UNKNOWN_DATE{"9999-12-31"};


/**
Subject assumed for messages without a `Subject` header.
**/
inline const std::string DEFAULT_SUBJECT{"No Subject"};


/**
Date, subject and subject slug of a message.
**/
struct message_metadata
{
    std::string date;
    std::string subject_raw;
    std::string subject_slug;
};


namespace detail
{

    /// Parse a whole token as an unsigned decimal number.
    inline bool parse_number(std::string_view token, int& out)
    {
        if (token.empty() || !is_all_digits(token))
            return false;
        auto res = std::from_chars(token.data(), token.data() + token.size(), out);
        return res.ec == std::errc{} && res.ptr == token.data() + token.size();
    }

    inline void strip_trailing_comma(std::string& token)
    {
        if (!token.empty() && token.back() == ',')
            token.pop_back();
    }

    inline unsigned month_from_name(std::string_view name)
    {
        constexpr std::array<std::string_view, 12> abbrevs = {"jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};
        constexpr std::array<std::string_view, 12> names = {"january", "february", "march", "april", "may", "june", "july", "august",
            "september", "october", "november", "december"};
        for (unsigned i = 0; i < 12; i++)
            if (iequals_ascii(name, abbrevs[i]) || iequals_ascii(name, names[i]))
                return i + 1;
        return 0;
    }

    inline bool is_day_name(std::string_view name)
    {
        constexpr std::array<std::string_view, 7> days = {"mon", "tue", "wed", "thu", "fri", "sat", "sun"};
        for (auto d : days)
            if (iequals_ascii(name, d))
                return true;
        return false;
    }

} // namespace detail


/**
Parsing a `Date` header into the calendar date it is written in.

Follows RFC 5322 with the obsolete syntax leniency of mail software: optional day name, day and month in either order, `DD-Mon-YYYY`,
two digit years, `HH:MM` or `HH:MM:SS`, numeric, named or missing zone. The zone is checked but not applied.

@param date_str Header value.
@return         Date, or nothing if it cannot be recovered.
**/
inline std::optional<std::chrono::year_month_day> parse_date(std::string_view date_str)
{
    std::vector<std::string> data;
    std::istringstream tokenizer{std::string(date_str)};
    for (std::string token; tokenizer >> token;)
        data.push_back(token);
    if (data.empty())
        return std::nullopt;

    if (data[0].back() == ',' || detail::is_day_name(data[0]))
        data.erase(data.begin());
    else
    {
        // `Tue,01` without space.
        std::string::size_type comma = data[0].rfind(',');
        if (comma != std::string::npos)
            data[0] = data[0].substr(comma + 1);
    }

    if (data.size() == 3)
    {
        // RFC 850 `DD-Mon-YYYY`.
        std::vector<std::string> fields;
        std::istringstream splitter(data[0]);
        for (std::string field; std::getline(splitter, field, '-');)
            fields.push_back(field);
        if (fields.size() == 3)
        {
            fields.insert(fields.end(), data.begin() + 1, data.end());
            data = fields;
        }
    }
    if (data.size() == 4)
    {
        std::string::size_type sign = data[3].find_first_of("+-");
        if (sign != std::string::npos && sign > 0)
        {
            std::string zone = data[3].substr(sign);
            data[3].erase(sign);
            data.push_back(zone);
        }
        else
            data.emplace_back();
    }
    if (data.size() < 5)
        return std::nullopt;

    std::string dd = data[0], mm = data[1], yy = data[2], tm = data[3], tz = data[4];
    unsigned month = detail::month_from_name(mm);
    if (month == 0)
    {
        std::swap(dd, mm);
        month = detail::month_from_name(mm);
        if (month == 0)
            return std::nullopt;
    }
    detail::strip_trailing_comma(dd);

    if (yy.find(':') != std::string::npos && yy.find(':') > 0)
        std::swap(yy, tm);
    detail::strip_trailing_comma(yy);
    if (yy.empty())
        return std::nullopt;
    if (!detail::is_ascii_digit(yy.front()))
        std::swap(yy, tz);
    detail::strip_trailing_comma(tm);

    std::vector<std::string> time_fields;
    std::istringstream time_splitter(tm);
    for (std::string field; std::getline(time_splitter, field, ':');)
        time_fields.push_back(field);
    if (time_fields.size() == 1 && tm.find('.') != std::string::npos)
    {
        time_fields.clear();
        std::istringstream dot_splitter(tm);
        for (std::string field; std::getline(dot_splitter, field, '.');)
            time_fields.push_back(field);
    }
    if (time_fields.size() == 2)
        time_fields.emplace_back("0");
    if (time_fields.size() != 3)
        return std::nullopt;

    int day = 0, year = 0, hour = 0, minute = 0, second = 0;
    if (!detail::parse_number(dd, day) || !detail::parse_number(yy, year) || !detail::parse_number(time_fields[0], hour) ||
        !detail::parse_number(time_fields[1], minute) || !detail::parse_number(time_fields[2], second))
        return std::nullopt;

    if (year < 100)
        year += year > 68 ? 1900 : 2000;
    if (day < 1 || day > 31 || hour > 23 || minute > 59 || second > 59 || year < 1 || year > 9999)
        return std::nullopt;

    if (tz.size() > 1 && (tz.front() == '+' || tz.front() == '-'))
    {
        int offset = 0;
        if (detail::parse_number(std::string_view(tz).substr(1), offset) && (offset / 100) * 3600 + (offset % 100) * 60 >= 24 * 3600)
            return std::nullopt;
    }

    std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok())
        return std::nullopt;
    return ymd;
}


/**
Formatting a date as `YYYY-MM-DD`, or as the unknown date if there is none.
**/
inline std::string format_date(const std::optional<std::chrono::year_month_day>& date)
{
    if (!date)
        return UNKNOWN_DATE;
    std::ostringstream out;
    out << std::setfill('0') << std::setw(4) << static_cast<int>(date->year()) << '-' << std::setw(2)
        << static_cast<unsigned>(date->month()) << '-' << std::setw(2) << static_cast<unsigned>(date->day());
    return out.str();
}


/**
Decoding the encoded words of a subject into trimmed UTF-8 text.

@param subject Header value.
@return        Decoded subject, or the trimmed header value if it cannot be decoded.
**/
inline std::string decode_subject(const std::string& subject)
{
    try
    {
        q_codec qc(static_cast<std::string::size_type>(codec::line_len_policy_t::NONE));
        return detail::trim_unicode_copy(std::get<0>(qc.check_decode(subject)));
    }
    catch (const codec_error& exc)
    {
        MAILCAST_WARN(std::string("subject kept undecoded: ") + exc.what());
        return detail::trim_unicode_copy(subject);
    }
}


/**
Turning a subject into a file name friendly slug.

Every character which is not a word character, whitespace or hyphen is deleted, the result is trimmed, and whitespace runs become a
single hyphen.
**/
inline std::string slugify(std::string_view subject)
{
    std::string kept;
    kept.reserve(subject.size());
    for (std::size_t pos = 0; pos < subject.size();)
    {
        const std::size_t start = pos;
        char32_t cp = detail::next_code_point(subject, pos);
        if (detail::is_word_code_point(cp) || detail::is_unicode_space(cp) || cp == '-')
            kept.append(subject.substr(start, pos - start));
    }
    kept = detail::trim_unicode_copy(kept);

    std::string slug;
    slug.reserve(kept.size());
    bool in_space = false;
    for (std::size_t pos = 0; pos < kept.size();)
    {
        const std::size_t start = pos;
        char32_t cp = detail::next_code_point(kept, pos);
        if (detail::is_unicode_space(cp))
        {
            if (!in_space)
                slug += '-';
            in_space = true;
            continue;
        }
        in_space = false;
        slug.append(kept, start, pos - start);
    }
    return slug;
}


/**
Extracting the date, subject and slug of a message.

@param msg             Parsed message.
@param default_subject Subject of a message without `Subject` header.
@return                Metadata; a date which cannot be recovered is the unknown date.
**/
inline message_metadata extract_metadata(const message& msg, const std::string& default_subject = DEFAULT_SUBJECT)
{
    message_metadata meta;
    const std::string date_header = msg.header(message::DATE_HEADER);
    meta.date = format_date(parse_date(date_header));
    if (meta.date == UNKNOWN_DATE)
        MAILCAST_WARN("cannot recover the date from `" + date_header + "`");

    meta.subject_raw = decode_subject(msg.header(message::SUBJECT_HEADER, default_subject));
    meta.subject_slug = slugify(meta.subject_raw);
    MAILCAST_DEBUG("metadata: " + meta.date + " " + meta.subject_slug);
    return meta;
}


} // namespace mailcast
