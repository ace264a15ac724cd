#pragma once

#include <string>

class CookieJar;

enum class HttpMethod {
    Get,
    Post
};

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string url;
    std::string content_type;
    std::string body;

    // attached per hop to every request whose host and path match
    const CookieJar* cookies = nullptr;
};

struct HttpResponse {
    unsigned status = 0;
    std::string body;
    std::string content_type;
    std::string location;

    // the url that produced this response, after any redirects
    std::string url;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // throws NetworkError when no response could be obtained
    virtual HttpResponse send(const HttpRequest& request) = 0;
};
