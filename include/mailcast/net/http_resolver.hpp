/*

http_resolver.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <openssl/ssl.h>
#include <mailcast/config.hpp>
#include <mailcast/detail/ascii.hpp>
#include <mailcast/detail/log.hpp>
#include <mailcast/detail/result.hpp>


namespace mailcast
{
namespace net
{

namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;


/// Longest response head read before giving up on a redirect.
inline constexpr std::size_t MAX_RESPONSE_HEAD = 64 * 1024;


struct url_parts
{
    bool secure = false;
    std::string host;
    std::string port;
    // Path and query, never empty.
    std::string target;
};


/**
Splitting an absolute `http` or `https` address.

@param url Address to split.
@return    Parts, or nothing for another scheme or a missing host.
**/
inline std::optional<url_parts> split_url(std::string_view url)
{
    url_parts parts;
    std::string_view rest;
    if (detail::istarts_with_ascii(url, "https://"))
    {
        parts.secure = true;
        rest = url.substr(8);
    }
    else if (detail::istarts_with_ascii(url, "http://"))
        rest = url.substr(7);
    else
        return std::nullopt;

    rest = rest.substr(0, rest.find('#'));
    std::string_view::size_type authority_end = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, authority_end);
    parts.target = authority_end == std::string_view::npos ? "/" : std::string(rest.substr(authority_end));
    if (parts.target.front() == '?')
        parts.target.insert(0, 1, '/');

    std::string_view::size_type at = authority.rfind('@');
    if (at != std::string_view::npos)
        authority.remove_prefix(at + 1);

    std::string_view host = authority;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[')
    {
        std::string_view::size_type close = authority.find(']');
        if (close == std::string_view::npos)
            return std::nullopt;
        host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':')
            port = authority.substr(close + 2);
    }
    else if (std::string_view::size_type colon = authority.rfind(':'); colon != std::string_view::npos)
    {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }
    if (host.empty())
        return std::nullopt;

    parts.host = std::string(host);
    parts.port = port.empty() ? (parts.secure ? "443" : "80") : std::string(port);
    return parts;
}


/**
Finding the `Location` field of a response head.

@param head Status line and header fields.
@return     Trimmed field value, or nothing if the field is absent or empty.
**/
inline std::optional<std::string> location_from_response(std::string_view head)
{
    std::string_view::size_type pos = head.find('\n');
    while (pos != std::string_view::npos && pos + 1 < head.size())
    {
        std::string_view::size_type end = head.find('\n', pos + 1);
        std::string_view line = head.substr(pos + 1, end == std::string_view::npos ? std::string_view::npos : end - pos - 1);
        pos = end;
        std::string_view::size_type colon = line.find(':');
        if (colon == std::string_view::npos || !detail::iequals_ascii(detail::trim_view(line.substr(0, colon)), "location"))
            continue;
        std::string value = detail::trim_copy(line.substr(colon + 1));
        if (value.empty())
            return std::nullopt;
        return value;
    }
    return std::nullopt;
}


/**
Following one redirect hop over HTTP or HTTPS.

Each call sends a single `GET` without following the answer, and returns the `Location` the server gives. Certificates are verified
against the default trust store and the host name. Any failure, the timeout included, yields no location.
**/
class http_redirect_resolver
{
public:

    using duration = std::chrono::steady_clock::duration;

    explicit http_redirect_resolver(duration timeout = std::chrono::seconds(MAILCAST_REDIRECT_TIMEOUT_S), bool verify_peer = true)
        : timeout_(timeout), verify_peer_(verify_peer)
    {
    }

    std::optional<std::string> operator()(const std::string& url) const
    {
        auto head = request_head(url);
        if (!head)
        {
            MAILCAST_WARN("redirect of `" + url + "` not followed: " + head.error().to_string());
            return std::nullopt;
        }
        auto location = location_from_response(*head);
        MAILCAST_DEBUG("`" + url + "` redirects to `" + location.value_or("") + "`");
        return location;
    }

    /**
    Sending the request and reading the response head.

    @param url Absolute address.
    @return    Head of the response, or `invalid_argument` for an address which is not HTTP, or `io_error`.
    **/
    result<std::string> request_head(const std::string& url) const
    {
        auto parts = split_url(url);
        if (!parts)
            return fail<std::string>(error_code::invalid_argument, "Not an HTTP address.", url);

        asio::io_context io_ctx;
        result<std::string> head = fail<std::string>(error_code::io_error, "HTTP request timed out.", url);
        asio::steady_timer timer(io_ctx);
        timer.expires_after(timeout_);
        timer.async_wait([&io_ctx](const boost::system::error_code& ec)
        {
            if (!ec)
                io_ctx.stop();
        });

        asio::co_spawn(io_ctx, exchange(std::move(*parts)), [&head, &timer](std::exception_ptr eptr, result<std::string> res)
        {
            timer.cancel();
            if (!eptr)
            {
                head = std::move(res);
                return;
            }
            try
            {
                std::rethrow_exception(eptr);
            }
            catch (const std::exception& exc)
            {
                head = fail<std::string>(error_code::io_error, "HTTP request failed.", exc.what());
            }
        });
        io_ctx.run();
        return head;
    }

private:

    asio::awaitable<result<std::string>> exchange(url_parts url) const
    {
        auto executor = co_await asio::this_coro::executor;
        boost::system::error_code ec;
        tcp::resolver resolver(executor);
        auto endpoints = co_await resolver.async_resolve(url.host, url.port, asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            co_return fail<std::string>(error_code::io_error, "Cannot resolve the host.", url.host + ": " + ec.message());

        const std::string request = "GET " + url.target + " HTTP/1.1\r\n"
            "Host: " + url.host + "\r\n"
            "User-Agent: mailcast\r\n"
            "Accept: */*\r\n"
            "Connection: close\r\n\r\n";

        if (!url.secure)
        {
            tcp::socket socket(executor);
            co_await asio::async_connect(socket, endpoints, asio::redirect_error(asio::use_awaitable, ec));
            if (ec)
                co_return fail<std::string>(error_code::io_error, "Cannot connect.", url.host + ": " + ec.message());
            co_return co_await read_head(socket, request);
        }

        ssl::context context(ssl::context::tls_client);
        context.set_default_verify_paths();
        ssl::stream<tcp::socket> stream(executor, context);
        SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str());
        if (verify_peer_)
        {
            stream.set_verify_mode(ssl::verify_peer);
            stream.set_verify_callback(ssl::host_name_verification(url.host));
        }
        else
            stream.set_verify_mode(ssl::verify_none);

        co_await asio::async_connect(stream.lowest_layer(), endpoints, asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            co_return fail<std::string>(error_code::io_error, "Cannot connect.", url.host + ": " + ec.message());
        co_await stream.async_handshake(ssl::stream_base::client, asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            co_return fail<std::string>(error_code::io_error, "TLS handshake failed.", url.host + ": " + ec.message());
        co_return co_await read_head(stream, request);
    }

    template<typename Stream>
    static asio::awaitable<result<std::string>> read_head(Stream& stream, const std::string& request)
    {
        boost::system::error_code ec;
        co_await asio::async_write(stream, asio::buffer(request), asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            co_return fail<std::string>(error_code::io_error, "Cannot send the request.", ec.message());

        std::string head;
        std::size_t size = co_await asio::async_read_until(stream, asio::dynamic_buffer(head, MAX_RESPONSE_HEAD), "\r\n\r\n",
            asio::redirect_error(asio::use_awaitable, ec));
        // A server closing the connection right after the head is fine.
        if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated)
            co_return fail<std::string>(error_code::io_error, "Cannot read the response.", ec.message());
        if (!ec)
            head.resize(size);
        if (head.empty())
            co_return fail<std::string>(error_code::io_error, "Empty response.");
        co_return head;
    }

    duration timeout_;
    bool verify_peer_;
};


} // namespace net
} // namespace mailcast
