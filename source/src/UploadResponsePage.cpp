#include "UploadResponsePage.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <regex>
#include <sstream>

#include <boost/url.hpp>

namespace {

struct Tag {
    std::string_view name;
    std::string_view attributes;
    size_t begin = 0;   // offset of '<'
    size_t end = 0;     // offset just past '>'
    bool closing = false;
};

bool iequals(std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == ':';
}

// next start or end tag at or after pos; comments and declarations are skipped
std::optional<Tag> next_tag(std::string_view html, size_t pos) {
    while ((pos = html.find('<', pos)) != std::string_view::npos) {
        if (html.substr(pos, 4) == "<!--") {
            auto close = html.find("-->", pos + 4);
            if (close == std::string_view::npos) return std::nullopt;
            pos = close + 3;
            continue;
        }

        Tag tag;
        tag.begin = pos;

        size_t i = pos + 1;
        if (i < html.size() && html[i] == '/') {
            tag.closing = true;
            ++i;
        }

        size_t name_start = i;
        while (i < html.size() && is_name_char(html[i])) ++i;

        if (i == name_start) {
            ++pos;
            continue;
        }

        tag.name = html.substr(name_start, i - name_start);

        // '>' inside quoted attribute values does not end the tag
        char quote = 0;
        size_t attr_start = i;
        for (; i < html.size(); ++i) {
            char c = html[i];
            if (quote) { if (c == quote) quote = 0; }
            else if (c == '"' || c == '\'') quote = c;
            else if (c == '>') break;
        }
        if (i >= html.size()) {
            // unbalanced quote, settle for the first '>'
            i = html.find('>', attr_start);
            if (i == std::string_view::npos) return std::nullopt;
        }

        tag.attributes = html.substr(attr_start, i - attr_start);
        tag.end = i + 1;
        return tag;
    }
    return std::nullopt;
}

// where scanning resumes after tag; script and style bodies are not markup
size_t after(std::string_view html, const Tag& tag) {
    if (tag.closing || !(iequals(tag.name, "script") || iequals(tag.name, "style"))) return tag.end;

    size_t pos = tag.end;
    while ((pos = html.find("</", pos)) != std::string_view::npos) {
        if (iequals(html.substr(pos + 2, tag.name.size()), tag.name)) return pos;
        pos += 2;
    }
    return html.size();
}

std::optional<std::string> attribute(std::string_view attrs, std::string_view wanted) {
    size_t i = 0;

    auto skip_space = [&] { while (i < attrs.size() && std::isspace(static_cast<unsigned char>(attrs[i]))) ++i; };

    while (i < attrs.size()) {
        skip_space();
        size_t name_start = i;
        while (i < attrs.size() && !std::isspace(static_cast<unsigned char>(attrs[i])) && attrs[i] != '=' && attrs[i] != '/') ++i;
        auto name = attrs.substr(name_start, i - name_start);
        if (name.empty()) { ++i; continue; }

        skip_space();
        std::string_view value;
        if (i < attrs.size() && attrs[i] == '=') {
            ++i;
            skip_space();
            if (i < attrs.size() && (attrs[i] == '"' || attrs[i] == '\'')) {
                char q = attrs[i++];
                size_t close = attrs.find(q, i);
                if (close == std::string_view::npos) close = attrs.size();
                value = attrs.substr(i, close - i);
                i = close + 1;
            }
            else {
                size_t value_start = i;
                while (i < attrs.size() && !std::isspace(static_cast<unsigned char>(attrs[i]))) ++i;
                value = attrs.substr(value_start, i - value_start);
            }
        }

        if (iequals(name, wanted)) return std::string(value);
    }
    return std::nullopt;
}

// offset just past the end tag matching an element opened at from, or the end of input
size_t element_end(std::string_view html, std::string_view name, size_t from) {
    int depth = 1;
    size_t pos = from;

    while (auto tag = next_tag(html, pos)) {
        pos = after(html, *tag);
        if (!iequals(tag->name, name)) continue;

        if (tag->closing) {
            if (--depth == 0) return tag->begin;
        }
        else if (!tag->attributes.ends_with('/')) {
            ++depth;
        }
    }
    return html.size();
}

std::optional<std::string> search(std::string_view text, const std::regex& re) {
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_search(text.begin(), text.end(), m, re)) return std::nullopt;
    return m[1].str();
}

TorrentRow parse_row(std::string_view id_suffix, std::string_view content) {
    static const std::regex owner_link(R"re(user\.php\?id=(\d+)")re");

    TorrentRow row;
    row.id = std::string(id_suffix);
    row.owner_id = search(content, owner_link);

    size_t pos = 0;
    while (auto tag = next_tag(content, pos)) {
        pos = after(content, *tag);
        if (tag->closing || !iequals(tag->name, "span")) continue;

        // only the first span carries the upload time
        if (auto title = attribute(tag->attributes, "title")) row.added = parse_row_timestamp(*title);
        break;
    }

    return row;
}

}

std::optional<std::chrono::sys_seconds> parse_row_timestamp(std::string_view text) {
    std::chrono::sys_time<std::chrono::minutes> tp;

    std::istringstream in{ std::string(text) };
    in >> std::chrono::parse("%b %d %Y, %H:%M", tp);

    if (in.fail()) return std::nullopt;
    return std::chrono::time_point_cast<std::chrono::seconds>(tp);
}

UploadResponsePage parse_upload_response(std::string_view html) {
    static const std::regex user_id_var(R"(var\s+userid\s*=\s*(\d+)\s*;)");
    static const std::regex authkey_var(R"re(var\s+authkey\s*=\s*"([^"]*)"\s*;)re");
    static const std::regex passkey_param(R"re(passkey=([^&"'\s]+)&)re");

    UploadResponsePage page;

    auto user_id = search(html, user_id_var);
    auto authkey = search(html, authkey_var);
    auto passkey = search(html, passkey_param);

    if (!user_id) throw LinkExtractionError("No user id on the response page");
    if (!authkey) throw LinkExtractionError("No authkey on the response page");
    if (!passkey) throw LinkExtractionError("No passkey on the response page");

    page.user_id = std::move(*user_id);
    page.authkey = std::move(*authkey);
    page.passkey = std::move(*passkey);

    static constexpr std::string_view row_prefix = "torrent_";

    size_t pos = 0;
    while (auto tag = next_tag(html, pos)) {
        pos = after(html, *tag);
        if (tag->closing) continue;

        auto id = attribute(tag->attributes, "id");
        if (!id || !id->starts_with(row_prefix)) continue;

        // torrent_<id>[_...]
        std::string_view suffix = std::string_view(*id).substr(row_prefix.size());
        suffix = suffix.substr(0, suffix.find('_'));
        if (suffix.empty() || !std::ranges::all_of(suffix, [](unsigned char c) { return std::isdigit(c); })) continue;

        auto end = element_end(html, tag->name, tag->end);
        page.rows.push_back(parse_row(suffix, html.substr(tag->end, end - tag->end)));
    }

    return page;
}

std::string select_download_link(const UploadResponsePage& page, std::chrono::system_clock::time_point now,
                                 std::chrono::minutes window, const std::string& download_url) {
    const TorrentRow* latest = nullptr;

    for (const auto& row: page.rows) {
        if (!row.owner_id || *row.owner_id != page.user_id || !row.added) continue;
        if (!latest || *row.added > *latest->added) latest = &row;
    }

    if (!latest) throw LinkExtractionError("No torrents owned by user " + page.user_id + " on the response page");

    auto age = now - *latest->added;
    if (age < decltype(age)::zero()) age = -age;

    if (age >= window) {
        throw LinkExtractionError(std::format("Newest torrent {} was added {} ago, outside the {} window",
            latest->id, std::chrono::duration_cast<std::chrono::seconds>(age), window));
    }

    boost::urls::url url(download_url);
    url.params().set("action", "download");
    url.params().set("id", latest->id);
    url.params().set("authkey", page.authkey);
    url.params().set("torrent_pass", page.passkey);

    return std::string(url.buffer());
}

std::string extract_download_link(std::string_view html, std::chrono::system_clock::time_point now,
                                  std::chrono::minutes window, const std::string& download_url) {
    return select_download_link(parse_upload_response(html), now, window, download_url);
}
