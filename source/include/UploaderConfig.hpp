#pragma once

#include <chrono>
#include <filesystem>
#include <string>

struct UploaderConfig {
    std::string tracker_base = "https://awesome-hd.me";
    std::string upload_path = "/upload.php";
    std::string download_path = "/torrents.php";
    std::string gallery_upload_url = "https://img.awesome-hd.me/api/upload";

    std::string mktorrent = "mktorrent";
    std::string mediainfo = "mediainfo";
    std::string ffprobe = "ffprobe";
    std::string ffmpeg = "ffmpeg";

    // mktorrent -l, 2^23 = 8 MiB pieces
    int piece_size_exponent = 23;

    std::filesystem::path temp_dir = std::filesystem::temp_directory_path();

    std::chrono::minutes recency_window{ 2 };
    int max_redirects = 10;
    std::string user_agent = "ahd-uploader/1.2";

    std::string upload_url() const { return tracker_base + upload_path; }
    std::string download_url() const { return tracker_base + download_path; }
};
