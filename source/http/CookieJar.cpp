#include "CookieJar.hpp"
#include "Errors.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ranges>

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool parse_flag(std::string_view field, size_t line_no) {
    if (field == "TRUE") return true;
    if (field == "FALSE") return false;
    throw CookieFileError("Invalid boolean '" + std::string(field) + "' on cookie line " + std::to_string(line_no));
}

}

CookieJar CookieJar::load(const std::filesystem::path& path) {
    if (!std::filesystem::is_regular_file(path)) throw CookieFileError("Cookie file not found: " + path.string());

    try {
        return parse(read_from_file(path));
    }
    catch (const CookieFileError& ex) {
        throw CookieFileError(path.string() + ": " + ex.what());
    }
    catch (const std::runtime_error& ex) {
        throw CookieFileError(ex.what());
    }
}

CookieJar CookieJar::parse(std::string_view text) {
    static constexpr std::string_view http_only_prefix = "#HttpOnly_";

    CookieJar jar;
    size_t line_no = 0;

    for (auto range: text | std::views::split('\n')) {
        std::string_view line(range.begin(), range.end());
        ++line_no;

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        bool http_only = false;
        if (line.starts_with(http_only_prefix)) {
            http_only = true;
            line.remove_prefix(http_only_prefix.size());
        }
        else if (line.starts_with('#')) continue;

        if (std::ranges::all_of(line, [](unsigned char c) { return std::isspace(c); })) continue;

        auto fields = line | std::views::split('\t')
            | std::views::transform([](auto&& f) { return std::string_view(f.begin(), f.end()); })
            | std::ranges::to<std::vector<std::string_view>>();

        // some exporters drop the trailing empty value
        if (fields.size() == 6) fields.emplace_back();

        if (fields.size() != 7) {
            throw CookieFileError("Malformed cookie line " + std::to_string(line_no) + ", expected 7 tab separated fields");
        }

        Cookie c;
        c.domain = to_lower(fields[0]);
        c.include_subdomains = parse_flag(fields[1], line_no);
        c.path = fields[2].empty() ? "/" : std::string(fields[2]);
        c.secure = parse_flag(fields[3], line_no);

        auto expires = fields[4];
        if (!expires.empty()) {
            auto [ptr, ec] = std::from_chars(expires.data(), expires.data() + expires.size(), c.expires);
            if (ec != std::errc{} || ptr != expires.data() + expires.size()) {
                throw CookieFileError("Invalid expiry on cookie line " + std::to_string(line_no));
            }
        }

        c.name = std::string(fields[5]);
        c.value = std::string(fields[6]);
        c.http_only = http_only;

        jar._cookies.push_back(std::move(c));
    }

    return jar;
}

bool CookieJar::domain_matches(const Cookie& cookie, std::string_view host) {
    std::string_view domain = cookie.domain;
    bool dotted = domain.starts_with('.');
    if (dotted) domain.remove_prefix(1);

    if (host == domain) return true;
    if (!cookie.include_subdomains && !dotted) return false;

    return host.size() > domain.size()
        && host.ends_with(domain)
        && host[host.size() - domain.size() - 1] == '.';
}

bool CookieJar::path_matches(const Cookie& cookie, std::string_view path) {
    const auto& cp = cookie.path;
    if (!path.starts_with(cp)) return false;
    return path.size() == cp.size() || cp.ends_with('/') || path[cp.size()] == '/';
}

std::string CookieJar::header_for(std::string_view host, std::string_view path, bool secure, std::chrono::system_clock::time_point now) const {
    auto lowered = to_lower(host);
    auto now_secs = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

    std::string header;

    for (const auto& c: _cookies) {
        if (c.secure && !secure) continue;
        if (c.expires != 0 && c.expires <= now_secs) continue;
        if (!domain_matches(c, lowered) || !path_matches(c, path)) continue;

        if (!header.empty()) header += "; ";
        header += c.name;
        header += '=';
        header += c.value;
    }

    return header;
}
