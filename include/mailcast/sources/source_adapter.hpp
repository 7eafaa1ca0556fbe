/*

source_adapter.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <mailcast/codec/charset.hpp>
#include <mailcast/detail/ascii.hpp>
#include <mailcast/detail/log.hpp>
#include <mailcast/detail/regex.hpp>
#include <mailcast/detail/utf8.hpp>
#include <mailcast/mime/content_selector.hpp>
#include <mailcast/mime/message.hpp>


namespace mailcast
{


/**
Following one redirect of a link: returns the `Location` it points to, or nothing.
**/
using url_resolver = std::function<std::optional<std::string>(const std::string&)>;


/**
Resolver which follows no redirect.
**/
inline std::optional<std::string> no_redirects(const std::string&)
{
    return std::nullopt;
}


/**
Fields of a processed message which the adapters work from.
**/
struct episode_info
{
    std::string date;
    std::string subject_raw;
    std::string subject_slug;
};


/**
Newsletters without their own rules.
**/
struct default_adapter
{
};


/**
Money Stuff, published by Bloomberg.
**/
struct levine_adapter
{
    inline static const std::string NEWSLETTER_URL_PREFIX{"https://www.bloomberg.com/opinion/newsletters/"};
};


/**
Newsletters published through Substack under their own domain.
**/
struct substack_adapter
{
    std::string brand_name;
    std::string domain;
};


using source_adapter = std::variant<default_adapter, levine_adapter, substack_adapter>;


/**
Looking up the adapter of a feed.

@param feed_slug Feed name, such as `levine`, `yglesias` or `silver`.
@return          Adapter of the feed, the default one for unknown feeds.
**/
inline source_adapter get_source_adapter(std::string_view feed_slug)
{
    if (feed_slug == "levine")
        return levine_adapter{};
    if (feed_slug == "yglesias")
        return substack_adapter{"Slow Boring", "slowboring.com"};
    if (feed_slug == "silver")
        return substack_adapter{"Silver Bulletin", "natesilver.net"};
    return default_adapter{};
}


/**
Dropping the parameters, query and fragment of a URL.
**/
inline std::string canonicalize_url(std::string_view url)
{
    std::string_view::size_type scheme_end = url.find("://");
    std::string_view::size_type path_begin = scheme_end == std::string_view::npos ? 0 : url.find_first_of("/?#;", scheme_end + 3);
    if (path_begin == std::string_view::npos)
        return std::string(url);

    std::string_view::size_type end = url.find_first_of("?#", path_begin);
    std::string_view path_part = url.substr(0, end);
    std::string_view::size_type last_segment = path_part.rfind('/');
    std::string_view::size_type params = path_part.find(';', last_segment == std::string_view::npos ? path_begin : last_segment);
    return std::string(path_part.substr(0, params));
}


/**
Lowercase ASCII slug of a title, as newsletter URLs use.
**/
inline std::string slugify_for_url(std::string_view text)
{
    std::string lower = detail::to_lower_copy(detail::trim_view(text));
    lower = detail::regex_replace(lower, detail::regex(R"([^a-z0-9\s-])", detail::regex_syntax), "");
    lower = detail::regex_replace(lower, detail::regex(R"(\s+)", detail::regex_syntax), "-");
    lower = detail::regex_replace(lower, detail::regex(R"(-+)", detail::regex_syntax), "-");
    boost::trim_if(lower, boost::is_any_of("-"));
    return lower;
}


/**
Following one redirect, resolving a location relative to the host of the link.
**/
inline std::optional<std::string> resolve_once(const std::string& url, const url_resolver& resolver)
{
    std::optional<std::string> location = resolver(url);
    if (!location || location->empty())
        return std::nullopt;
    if (location->front() != '/')
        return location;

    std::string::size_type scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        return location;
    std::string::size_type host_end = url.find_first_of("/?#", scheme_end + 3);
    return url.substr(0, host_end) + *location;
}


namespace detail
{

    /// Text parts of a message worth scanning for links, leniently decoded.
    inline std::vector<std::string> link_sources(const message& msg)
    {
        std::vector<std::string> chunks;
        auto add = [&chunks](const mime& part)
        {
            auto text = decode_text(part, decode_policy_t::REPLACE);
            if (text)
                chunks.push_back(std::move(*text));
            else
                MAILCAST_DEBUG("part skipped for links: " + text.error().to_string());
        };

        if (!msg.is_multipart())
        {
            add(msg);
            return chunks;
        }
        walk(msg, [&add](const mime& part)
        {
            if (part.content_type() == "text/plain" || part.content_type() == "text/html")
                add(part);
            return true;
        });
        return chunks;
    }

} // namespace detail


/**
Collecting the web links of a message's text parts, in order and without duplicates.
**/
inline std::vector<std::string> extract_candidate_links(const message& msg)
{
    const std::string text = boost::join(detail::link_sources(msg), "\n");
    const detail::regex url_pattern(R"(https?://[^\s<>'"]+)", detail::regex_syntax);

    std::vector<std::string> links;
    detail::sregex_iterator end;
    for (detail::sregex_iterator it(text.begin(), text.end(), url_pattern); it != end; ++it)
    {
        std::string link = (*it)[0].str();
        boost::trim_right_if(link, boost::is_any_of(").,>"));
        if (std::find(links.begin(), links.end(), link) == links.end())
            links.push_back(std::move(link));
    }
    return links;
}


/**
Returning the leniently decoded text of the first `text/plain` part, if any.
**/
inline std::optional<std::string> extract_plain_text(const message& msg)
{
    const mime* part = msg.is_multipart() ? find_first_part(msg, "text/plain") : (msg.content_type() == "text/plain" ? &msg : nullptr);
    if (part == nullptr)
        return std::nullopt;
    auto text = decode_text(*part, decode_policy_t::REPLACE);
    if (!text)
        return std::nullopt;
    return std::move(*text);
}


namespace detail
{

    inline std::string subject_or_slug(const episode_info& info)
    {
        std::string subject = trim_unicode_copy(info.subject_raw);
        if (subject.empty())
            subject = boost::replace_all_copy(info.subject_slug, "-", " ");
        return subject;
    }

    inline const regex& money_stuff_subject()
    {
        static const regex pattern(R"(Money Stuff:\s*(.+))", regex_syntax | regex::icase);
        return pattern;
    }

    inline std::string format_title(const default_adapter&, const episode_info& info)
    {
        return subject_or_slug(info);
    }

    inline std::string format_title(const levine_adapter&, const episode_info& info)
    {
        const std::string subject = subject_or_slug(info);
        smatch match;
        if (detail::regex_match(subject, match, money_stuff_subject()))
            return info.date + " - Money Stuff - " + trim_unicode_copy(match[1].str());
        return info.date + " - " + subject;
    }

    inline std::string format_title(const substack_adapter& adapter, const episode_info& info)
    {
        const regex brand_prefix("^" + regex_escape(adapter.brand_name) + R"(:\s*)", regex_syntax | regex::icase);
        std::string subject = subject_or_slug(info);
        smatch match;
        if (detail::regex_search(subject.cbegin(), subject.cend(), match, brand_prefix, boost::match_continuous))
            subject.erase(0, match[0].length());
        return info.date + " - " + adapter.brand_name + " - " + subject;
    }

    inline std::string clean_body(const default_adapter&, const message&, const std::string& body)
    {
        return body;
    }

    inline std::string clean_body(const levine_adapter&, const message&, const std::string& body)
    {
        return body;
    }

    /// Plain text part cleared of Substack's web links, app banners and footer.
    inline std::string clean_body(const substack_adapter&, const message& msg, const std::string& body)
    {
        std::string text = extract_plain_text(msg).value_or("");
        if (text.empty())
            text = body;
        boost::erase_all(text, "\r");
        // Soft hyphen and combining grapheme joiner.
        boost::erase_all(text, "\xC2\xAD");
        boost::erase_all(text, "\xCD\x8F");

        text = detail::regex_replace(text, regex(R"(\AView this post on the web at .*\n+)", regex_syntax), "");
        text = detail::regex_replace(text, regex(R"(\s*\[\s*https?://[^\]]+\s*\])", regex_syntax), "");
        text = detail::regex_replace(text, regex(R"(\nUnsubscribe\s+https?://[\s\S]*)", regex_syntax), "");
        boost::erase_all(text, "READ IN APP");
        boost::erase_all(text, "Subscribed");

        text = detail::regex_replace(text, regex(R"(\n{3,})", regex_syntax), "\n\n");
        text = detail::regex_replace(text, regex(R"([ \t]+)", regex_syntax), " ");
        text = detail::regex_replace(text, regex(R"( +\n)", regex_syntax), "\n");
        return trim_unicode_copy(text);
    }

    inline std::optional<std::string> extract_source_url(const default_adapter&, const message&, const episode_info&, const url_resolver&)
    {
        return std::nullopt;
    }

    inline std::optional<std::string> extract_source_url(const levine_adapter&, const message& msg, const episode_info& info,
        const url_resolver& resolver)
    {
        const std::vector<std::string> links = extract_candidate_links(msg);
        const regex newsletter(R"(https://www\.bloomberg\.com/opinion/newsletters/\d{4}-\d{2}-\d{2}/[^/?#]+)", regex_syntax | regex::icase);

        for (const auto& link : links)
            if (detail::regex_match_prefix(link, newsletter))
                return canonicalize_url(link);

        for (const auto& link : links)
        {
            if (!boost::starts_with(link, "https://bloom.bg/") && !boost::starts_with(link, "https://links.message.bloomberg.com/"))
                continue;
            auto redirected = resolve_once(link, resolver);
            if (redirected && detail::regex_match_prefix(*redirected, newsletter))
                return canonicalize_url(*redirected);
        }

        smatch match;
        const std::string subject = trim_unicode_copy(info.subject_raw);
        if (detail::regex_match(subject, match, money_stuff_subject()))
        {
            const std::string slug = slugify_for_url(match[1].str());
            if (!slug.empty())
            {
                MAILCAST_DEBUG("source link inferred from the subject");
                return levine_adapter::NEWSLETTER_URL_PREFIX + info.date + "/" + slug;
            }
        }
        return std::nullopt;
    }

    inline std::optional<std::string> extract_source_url(const substack_adapter& adapter, const message& msg, const episode_info&,
        const url_resolver& resolver)
    {
        const regex post(R"(https://(?:www\.)?)" + regex_escape(adapter.domain) + R"(/p/[^\s<>?#]+)", regex_syntax | regex::icase);

        const std::string list_post = msg.header("List-Post");
        smatch match;
        if (!list_post.empty() && detail::regex_search(list_post, match, post))
            return canonicalize_url(match[0].str());

        const std::vector<std::string> links = extract_candidate_links(msg);
        for (const auto& link : links)
            if (detail::regex_match_prefix(link, post))
                return canonicalize_url(link);

        for (const auto& link : links)
        {
            if (!boost::starts_with(link, "https://substack.com/redirect/") && link.find(adapter.domain + "/action/") == std::string::npos)
                continue;
            auto redirected = resolve_once(link, resolver);
            if (redirected && detail::regex_match_prefix(*redirected, post))
                return canonicalize_url(*redirected);
        }
        return std::nullopt;
    }

} // namespace detail


/**
Formatting the episode title of a newsletter issue.

@param adapter Adapter of the feed.
@param info    Date, subject and slug of the issue.
@return        Title.
**/
inline std::string format_title(const source_adapter& adapter, const episode_info& info)
{
    return std::visit([&info](const auto& a) { return detail::format_title(a, info); }, adapter);
}


/**
Cleaning the body of a newsletter issue with the rules of its publisher.

@param adapter Adapter of the feed.
@param msg     Parsed message.
@param body    Body produced by the email processor.
@return        Cleaned body.
**/
inline std::string clean_body(const source_adapter& adapter, const message& msg, const std::string& body)
{
    return std::visit([&msg, &body](const auto& a) { return detail::clean_body(a, msg, body); }, adapter);
}


/**
Finding the web address of a newsletter issue.

@param adapter  Adapter of the feed.
@param msg      Parsed message.
@param info     Date, subject and slug of the issue.
@param resolver Redirect follower for tracking links.
@return         Canonical address, or nothing if it cannot be found.
**/
inline std::optional<std::string> extract_source_url(const source_adapter& adapter, const message& msg, const episode_info& info,
    const url_resolver& resolver = no_redirects)
{
    return std::visit([&](const auto& a) { return detail::extract_source_url(a, msg, info, resolver); }, adapter);
}


} // namespace mailcast
