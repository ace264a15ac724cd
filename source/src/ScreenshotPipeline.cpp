#include "ScreenshotPipeline.hpp"
#include "Errors.hpp"
#include "Multipart.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <functional>
#include <limits>
#include <print>

#include <boost/json.hpp>

double ScreenshotPipeline::get_duration(const std::filesystem::path& file) {
    auto result = _runner.run(_config.ffprobe, {
        "-v", "error",
        "-show_entries", "format=duration",
        "-of", "default=noprint_wrappers=1:nokey=1",
        file.string()
    }, Capture::Stdout);

    if (result.exit_code == 127) throw ToolMissingError(_config.ffprobe + " is not installed or not in PATH");
    if (result.exit_code != 0) throw ToolError("Error occurred while running ffprobe on " + file.string(), result.output);

    std::string_view out = result.output;
    while (!out.empty() && std::isspace(static_cast<unsigned char>(out.front()))) out.remove_prefix(1);
    while (!out.empty() && std::isspace(static_cast<unsigned char>(out.back()))) out.remove_suffix(1);

    double duration = 0;
    auto [ptr, ec] = std::from_chars(out.data(), out.data() + out.size(), duration);
    // offsets are whole seconds held in an int
    if (ec != std::errc{} || ptr != out.data() + out.size() || !std::isfinite(duration) || duration < 0
        || duration > std::numeric_limits<int>::max()) {
        throw ValidationError("ffprobe reported an unusable duration '" + std::string(out) + "' for " + file.string());
    }

    return duration;
}

std::vector<int> ScreenshotPipeline::compute_offsets(double duration, int n) {
    // whole seconds first, then truncate each product; keep this order so offsets stay reproducible
    double whole = std::trunc(duration);

    std::vector<int> offsets;
    if (n <= 0 || whole < 0 || whole > std::numeric_limits<int>::max()) return offsets;
    offsets.reserve(n);

    for (int i = 1; i <= n; ++i) {
        offsets.push_back(static_cast<int>(1.0 / (n + 1.0) * i * whole));
    }

    return offsets;
}

std::filesystem::path ScreenshotPipeline::take_screenshot(const std::filesystem::path& file, int offset, const std::filesystem::path& out_dir) {
    auto screenshot_path = out_dir / std::format("{}_{}.png", file.stem().string(), offset);

    auto result = _runner.run(_config.ffmpeg, {
        "-ss", std::to_string(offset),
        "-i", file.string(),
        "-vframes", "1",
        screenshot_path.string()
    }, Capture::Combined);

    if (result.exit_code == 127) throw ToolMissingError(_config.ffmpeg + " is not installed or not in PATH");
    if (result.exit_code != 0) throw ToolError("Error occurred while running ffmpeg at offset " + std::to_string(offset), result.output);
    if (!std::filesystem::exists(screenshot_path)) throw ToolError("ffmpeg did not write " + screenshot_path.string(), result.output);

    return screenshot_path;
}

ScreenshotSet ScreenshotPipeline::take_screenshots(const std::filesystem::path& file, int n) {
    auto duration = get_duration(file);

    // n distinct positive whole-second offsets need more than n seconds
    std::vector<int> offsets;
    if (n > 0 && n < std::trunc(duration)) offsets = compute_offsets(duration, n);

    if (offsets.empty() || offsets.front() <= 0 || std::ranges::adjacent_find(offsets, std::greater_equal<>{}) != offsets.end()) {
        throw ValidationError(std::format("{} is too short ({:.0f}s) for {} distinct screenshots", file.filename().string(), duration, n));
    }

    auto out_dir = _config.temp_dir / (file.filename().string() + "_screens");

    std::filesystem::remove_all(out_dir);
    std::filesystem::create_directories(out_dir);

    ScreenshotSet screenshots;
    screenshots.reserve(offsets.size());

    for (auto offset: offsets) {
        std::println("Taking screenshot at {}s", offset);
        screenshots.push_back({ offset, take_screenshot(file, offset, out_dir) });
    }

    return screenshots;
}

std::string ScreenshotPipeline::upload_screenshots(const std::string& title, const ScreenshotSet& screenshots, const std::string& api_key) {
    MultipartBody body;
    body.add_field("apikey", api_key);
    body.add_field("galleryid", "new");
    body.add_field("gallerytitle", title);

    for (const auto& s: screenshots) {
        body.add_file("image[]", s.image.filename().string(), read_from_file(s.image), "image/png");
    }

    HttpRequest req;
    req.method = HttpMethod::Post;
    req.url = _config.gallery_upload_url;
    req.content_type = body.content_type();
    req.body = body.finish();

    std::println("Uploading {} screenshots to gallery '{}'", screenshots.size(), title);

    auto res = _transport.send(req);

    try {
        return parse_gallery_response(res.body);
    }
    catch (const UploadError& ex) {
        throw UploadError(std::format("{} (HTTP {})", ex.what(), res.status));
    }
}

std::string ScreenshotPipeline::parse_gallery_response(std::string_view body) {
    boost::system::error_code ec;
    auto jv = boost::json::parse(body, ec);
    if (ec) throw UploadError("Error uploading screenshots: gallery returned invalid JSON");

    const auto* obj = jv.if_object();
    const auto* files = obj ? obj->if_contains("files") : nullptr;

    if (!files || !files->is_array()) {
        std::string reason = "no files in response";
        if (obj) {
            if (const auto* err = obj->if_contains("error"); err && err->is_string()) reason = std::string(err->as_string());
        }
        throw UploadError("Error uploading screenshots: " + reason);
    }

    std::string markup;

    for (const auto& f: files->as_array()) {
        const auto* fo = f.if_object();
        const auto* bbcode = fo ? fo->if_contains("bbcode") : nullptr;
        if (!bbcode || !bbcode->is_string()) throw UploadError("Error uploading screenshots: file entry without bbcode");

        markup += std::string_view(bbcode->as_string());
    }

    return markup;
}

std::string ScreenshotPipeline::release_description(const std::filesystem::path& media, const std::string& api_key, int n) {
    auto file = resolve_media_file(media);
    auto screenshots = take_screenshots(file, n);
    return upload_screenshots(file.filename().string(), screenshots, api_key);
}
