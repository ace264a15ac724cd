#pragma once

#include "HttpTransport.hpp"
#include "UploaderConfig.hpp"

#include <optional>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/url.hpp>

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

class HttpsClient : public HttpTransport {
public:
    explicit HttpsClient(const UploaderConfig& config): _config(config), _ssl_ctx(ssl::context::tlsv12_client) {
        _ssl_ctx.set_default_verify_paths();
        _ssl_ctx.set_verify_mode(ssl::verify_peer);
    }

    ~HttpsClient() = default;

    // blocks until the request and its redirects complete
    HttpResponse send(const HttpRequest& request) override;

private:
    const UploaderConfig& _config;
    net::io_context _ioc;
    ssl::context _ssl_ctx;

    net::awaitable<HttpResponse> async_send(HttpRequest request);
    net::awaitable<HttpResponse> async_exchange(const boost::urls::url& url, http::verb method, const HttpRequest& request, bool with_body);
};

// the url a redirect response leads to, nullopt when the response is final. 301, 302 and 303
// turn method into GET and drop the body, 307 and 308 keep both. Throws NetworkError on a bad location
std::optional<boost::urls::url> next_hop(const boost::urls::url& current, unsigned status, std::string_view location,
                                         http::verb& method, bool& with_body);
