#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

struct Cookie {
    std::string domain;
    bool include_subdomains = false;
    std::string path = "/";
    bool secure = false;
    int64_t expires = 0;    // unix seconds, 0 for a session cookie
    std::string name;
    std::string value;
    bool http_only = false;
};

// cookies from a Netscape format cookie file (as written by curl, wget and browser exporters)
class CookieJar {
public:
    // throws CookieFileError
    static CookieJar load(const std::filesystem::path& path);
    static CookieJar parse(std::string_view text);

    // Cookie header value for a request, empty when nothing matches
    std::string header_for(std::string_view host, std::string_view path, bool secure, std::chrono::system_clock::time_point now) const;

    const std::vector<Cookie>& cookies() const { return _cookies; }
    bool empty() const { return _cookies.empty(); }

private:
    std::vector<Cookie> _cookies;

    static bool domain_matches(const Cookie& cookie, std::string_view host);
    static bool path_matches(const Cookie& cookie, std::string_view path);
};
