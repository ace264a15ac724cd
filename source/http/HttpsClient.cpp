#include "HttpsClient.hpp"
#include "CookieJar.hpp"
#include "Errors.hpp"

#include <chrono>

namespace {

constexpr uint64_t max_body_size = 64 * 1024 * 1024;

// peers that close the stream without a close_notify still delivered a complete message
bool is_benign_close(const boost::system::error_code& ec) {
    return ec == http::error::end_of_stream || ec == net::ssl::error::stream_truncated;
}

}

HttpResponse HttpsClient::send(const HttpRequest& request) {
    auto result = net::co_spawn(_ioc, async_send(request), net::use_future);

    _ioc.restart();
    _ioc.run();

    return result.get();
}

std::optional<boost::urls::url> next_hop(const boost::urls::url& current, unsigned status, std::string_view location,
                                         http::verb& method, bool& with_body) {
    bool redirect = status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
    if (!redirect || location.empty()) return std::nullopt;

    auto ref = boost::urls::parse_uri_reference(location);
    if (!ref) throw NetworkError("Invalid redirect location: " + std::string(location));

    boost::urls::url next;
    if (!boost::urls::resolve(current, *ref, next)) throw NetworkError("Cannot resolve redirect location: " + std::string(location));

    // 307 and 308 repeat the request as is
    if (status != 307 && status != 308) {
        method = http::verb::get;
        with_body = false;
    }

    return next;
}

net::awaitable<HttpResponse> HttpsClient::async_send(HttpRequest request) {
    auto rv = boost::urls::parse_uri(request.url);
    if (!rv) throw NetworkError("Invalid URL: " + request.url);

    boost::urls::url url = *rv;
    auto method = request.method == HttpMethod::Post ? http::verb::post : http::verb::get;
    bool with_body = request.method == HttpMethod::Post;

    for (int hops = 0;; ++hops) {
        auto response = co_await async_exchange(url, method, request, with_body);

        auto next = next_hop(url, response.status, response.location, method, with_body);
        if (!next) co_return response;
        if (hops >= _config.max_redirects) throw NetworkError("Too many redirects from " + request.url);

        url = std::move(*next);
    }
}

net::awaitable<HttpResponse> HttpsClient::async_exchange(const boost::urls::url& url, http::verb method, const HttpRequest& request, bool with_body) {
    auto executor = co_await net::this_coro::executor;
    boost::system::error_code ec;

    if (url.scheme() != "https") throw NetworkError("Unsupported URL scheme: " + std::string(url.buffer()));

    std::string host(url.host());
    std::string port = url.has_port() ? std::string(url.port()) : "443";
    std::string path = url.path().empty() ? "/" : std::string(url.path());
    std::string target(url.encoded_target());
    if (target.empty() || target.front() != '/') target.insert(0, "/");

    tcp::resolver resolver(executor);
    ssl::stream<tcp::socket> stream(executor, _ssl_ctx);

    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        throw NetworkError("Could not set SNI host name " + host);
    }
    stream.set_verify_callback(ssl::host_name_verification(host));

    http::request<http::string_body> req { method, target, 11 };
    req.set(http::field::host, host);
    req.set(http::field::user_agent, _config.user_agent);
    req.set(http::field::accept_encoding, "identity");

    if (request.cookies) {
        auto cookie = request.cookies->header_for(host, path, true, std::chrono::system_clock::now());
        if (!cookie.empty()) req.set(http::field::cookie, cookie);
    }

    if (with_body) {
        if (!request.content_type.empty()) req.set(http::field::content_type, request.content_type);
        req.body() = request.body;
    }
    req.prepare_payload();

    auto results = co_await resolver.async_resolve(host, port, net::redirect_error(net::use_awaitable, ec));
    if (ec) throw NetworkError("Could not resolve " + host + ": " + ec.message());

    co_await net::async_connect(stream.next_layer(), results, net::redirect_error(net::use_awaitable, ec));
    if (ec) throw NetworkError("Could not connect to " + host + ": " + ec.message());

    co_await stream.async_handshake(ssl::stream_base::client, net::redirect_error(net::use_awaitable, ec));
    if (ec) throw NetworkError("TLS handshake with " + host + " failed: " + ec.message());

    co_await http::async_write(stream, req, net::redirect_error(net::use_awaitable, ec));
    if (ec) throw NetworkError("Could not send request to " + host + ": " + ec.message());

    boost::beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(max_body_size);

    co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
    if (ec && !(is_benign_close(ec) && parser.is_done())) {
        throw NetworkError("Could not read response from " + host + ": " + ec.message());
    }

    co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    // shutdown errors are irrelevant once the response is in hand

    auto res = parser.release();

    HttpResponse out;
    out.status = res.result_int();
    out.body = std::move(res.body());
    out.url = std::string(url.buffer());
    if (auto it = res.find(http::field::content_type); it != res.end()) out.content_type = std::string(it->value());
    if (auto it = res.find(http::field::location); it != res.end()) out.location = std::string(it->value());

    co_return out;
}
