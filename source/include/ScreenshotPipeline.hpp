#pragma once

#include "HttpTransport.hpp"
#include "ProcessRunner.hpp"
#include "UploaderConfig.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

struct Screenshot {
    int offset;     // seconds into the media
    std::filesystem::path image;
};

// ordered by offset, strictly increasing
using ScreenshotSet = std::vector<Screenshot>;

class ScreenshotPipeline {
public:
    ScreenshotPipeline(ProcessRunner& runner, HttpTransport& transport, const UploaderConfig& config): _runner(runner), _transport(transport), _config(config) {}

    // duration in seconds as reported by ffprobe
    double get_duration(const std::filesystem::path& file);

    // interior points of n+1 equal intervals over the whole seconds of duration
    static std::vector<int> compute_offsets(double duration, int n);

    std::filesystem::path take_screenshot(const std::filesystem::path& file, int offset, const std::filesystem::path& out_dir);

    // recreates <temp>/<name>_screens and fills it with n frames
    ScreenshotSet take_screenshots(const std::filesystem::path& file, int n);

    // uploads to a new gallery, returns the concatenated BBCode of every image
    std::string upload_screenshots(const std::string& title, const ScreenshotSet& screenshots, const std::string& api_key);

    // screenshots of the media file (first entry for a directory) as release description markup
    std::string release_description(const std::filesystem::path& media, const std::string& api_key, int n);

    static std::string parse_gallery_response(std::string_view body);

private:
    ProcessRunner& _runner;
    HttpTransport& _transport;
    const UploaderConfig& _config;
};
