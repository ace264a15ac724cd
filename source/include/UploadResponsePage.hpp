#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// the response page did not identify the torrent we just uploaded
struct LinkExtractionError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct TorrentRow {
    std::string id;
    std::optional<std::string> owner_id;
    std::optional<std::chrono::sys_seconds> added;
};

// what the page that follows an upload tells us about the user and the listed torrents
struct UploadResponsePage {
    std::string user_id;
    std::string authkey;
    std::string passkey;
    std::vector<TorrentRow> rows;
};

// throws LinkExtractionError when the user id, authkey or passkey is missing
UploadResponsePage parse_upload_response(std::string_view html);

// "MMM DD YYYY, HH:mm", read as UTC
std::optional<std::chrono::sys_seconds> parse_row_timestamp(std::string_view text);

// newest row owned by the user, which must have been added within window of now
std::string select_download_link(const UploadResponsePage& page, std::chrono::system_clock::time_point now,
                                 std::chrono::minutes window, const std::string& download_url);

std::string extract_download_link(std::string_view html, std::chrono::system_clock::time_point now,
                                  std::chrono::minutes window, const std::string& download_url);
