/*

test_http_resolver.cpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE http_resolver_test

#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <boost/asio.hpp>
#include <boost/test/unit_test.hpp>
#include <mailcast/net/http_resolver.hpp>
#include <mailcast/sources/source_adapter.hpp>


using std::optional;
using std::string;
using mailcast::error_code;
using mailcast::net::http_redirect_resolver;
using mailcast::net::location_from_response;
using mailcast::net::split_url;
namespace asio = boost::asio;
using tcp = boost::asio::ip::tcp;


namespace
{

/**
Loopback server answering a single connection with a canned response.

With `hold` set, the server keeps the connection open without answering until the client goes away.
**/
class canned_server
{
public:

    explicit canned_server(string response, bool hold = false)
        : acceptor_(io_ctx_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)), response_(std::move(response)), hold_(hold)
    {
        thread_ = std::thread([this] { serve(); });
    }

    ~canned_server()
    {
        if (thread_.joinable())
            thread_.join();
    }

    string url(const string& target) const
    {
        return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + target;
    }

    /// Waits for the exchange to end and returns the request the server read.
    const string& request()
    {
        if (thread_.joinable())
            thread_.join();
        return request_;
    }

private:

    void serve()
    {
        boost::system::error_code ec;
        tcp::socket socket(io_ctx_);
        acceptor_.accept(socket, ec);
        if (ec)
            return;
        std::size_t size = asio::read_until(socket, asio::dynamic_buffer(request_), "\r\n\r\n", ec);
        if (!ec)
            request_.resize(size);
        if (hold_)
        {
            char byte;
            asio::read(socket, asio::buffer(&byte, 1), ec);
            return;
        }
        asio::write(socket, asio::buffer(response_), ec);
        socket.shutdown(tcp::socket::shutdown_both, ec);
    }

    asio::io_context io_ctx_;
    tcp::acceptor acceptor_;
    string response_;
    bool hold_;
    string request_;
    std::thread thread_;
};

} // namespace


/**
Splitting addresses into scheme, host, port and target.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(split_addresses)
{
    auto plain = split_url("http://example.com");
    BOOST_REQUIRE(plain);
    BOOST_CHECK(!plain->secure);
    BOOST_CHECK_EQUAL(plain->host, "example.com");
    BOOST_CHECK_EQUAL(plain->port, "80");
    BOOST_CHECK_EQUAL(plain->target, "/");

    auto secure = split_url("HTTPS://user:pw@substack.com:8443/redirect/2/abc?x=1#frag");
    BOOST_REQUIRE(secure);
    BOOST_CHECK(secure->secure);
    BOOST_CHECK_EQUAL(secure->host, "substack.com");
    BOOST_CHECK_EQUAL(secure->port, "8443");
    BOOST_CHECK_EQUAL(secure->target, "/redirect/2/abc?x=1");

    auto query_only = split_url("https://example.com?utm=1");
    BOOST_REQUIRE(query_only);
    BOOST_CHECK_EQUAL(query_only->port, "443");
    BOOST_CHECK_EQUAL(query_only->target, "/?utm=1");

    auto ipv6 = split_url("http://[::1]:8080/p");
    BOOST_REQUIRE(ipv6);
    BOOST_CHECK_EQUAL(ipv6->host, "::1");
    BOOST_CHECK_EQUAL(ipv6->port, "8080");

    BOOST_CHECK(!split_url("ftp://example.com/file"));
    BOOST_CHECK(!split_url("http:///nohost"));
    BOOST_CHECK(!split_url("http://[::1/p"));
    BOOST_CHECK(!split_url("example.com"));
}


/**
Finding the location field in response heads.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(find_location)
{
    BOOST_CHECK_EQUAL(location_from_response("HTTP/1.1 302 Found\r\nServer: x\r\nlocation:  https://a.com/p  \r\n\r\n").value_or(""),
        "https://a.com/p");
    BOOST_CHECK_EQUAL(location_from_response("HTTP/1.1 301 Moved\nLOCATION: /rel\n\n").value_or(""), "/rel");
    BOOST_CHECK(!location_from_response("HTTP/1.1 200 OK\r\nContent-Type: text/html\r\n\r\n"));
    BOOST_CHECK(!location_from_response("HTTP/1.1 302 Found\r\nLocation:\r\n\r\n"));
    BOOST_CHECK(!location_from_response("Location: https://status-line.only"));
}


/**
Reading one redirect from a loopback server and making a relative location absolute.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(follow_loopback_redirect)
{
    canned_server server("HTTP/1.1 301 Moved Permanently\r\nLocation: /p/post\r\nContent-Length: 0\r\n\r\n");
    const string link = server.url("/redirect/2/abc?x=1");
    const http_redirect_resolver resolver(std::chrono::seconds(5));

    optional<string> absolute = mailcast::resolve_once(link, resolver);
    BOOST_REQUIRE(absolute);
    BOOST_CHECK_EQUAL(*absolute, server.url("/p/post"));

    const string& request = server.request();
    BOOST_CHECK(request.rfind("GET /redirect/2/abc?x=1 HTTP/1.1\r\n", 0) == 0);
    BOOST_CHECK(request.find("Host: 127.0.0.1\r\n") != string::npos);
    BOOST_CHECK(request.find("Connection: close\r\n") != string::npos);
}


/**
Returning no location for a final response and for a server which does not answer in time.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(no_location_or_timeout)
{
    {
        canned_server server("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");
        const http_redirect_resolver resolver(std::chrono::seconds(5));
        BOOST_CHECK(!resolver(server.url("/")));
    }
    {
        canned_server server("", true);
        const http_redirect_resolver resolver(std::chrono::milliseconds(200));
        auto head = resolver.request_head(server.url("/slow"));
        BOOST_REQUIRE(!head);
        BOOST_CHECK(head.error().is(error_code::io_error));
    }
}


/**
Rejecting addresses which are not HTTP without any request.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(reject_other_schemes)
{
    const http_redirect_resolver resolver;
    auto head = resolver.request_head("mailto:someone@example.com");
    BOOST_REQUIRE(!head);
    BOOST_CHECK(head.error().is(error_code::invalid_argument));
    BOOST_CHECK(!resolver("mailto:someone@example.com"));
}
