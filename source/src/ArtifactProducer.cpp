#include "ArtifactProducer.hpp"
#include "Errors.hpp"
#include "Utils.hpp"

#include <print>

std::filesystem::path ArtifactProducer::torrent_path_for(const std::filesystem::path& media) const {
    auto p = normalized(media);
    auto torrent_name = std::filesystem::is_directory(p) ? p.filename().string() : p.stem().string();
    return _config.temp_dir / (torrent_name + ".torrent");
}

std::filesystem::path ArtifactProducer::create_torrent(const std::filesystem::path& media) {
    auto torrent_path = torrent_path_for(media);

    // mktorrent refuses to overwrite
    std::error_code ec;
    std::filesystem::remove(torrent_path, ec);
    if (ec) throw ToolError("Could not remove stale torrent " + torrent_path.string() + ": " + ec.message(), "");

    std::println("Creating torrent {}", torrent_path.string());

    auto result = _runner.run(_config.mktorrent, {
        "-l", std::to_string(_config.piece_size_exponent),
        "-p",
        "-o", torrent_path.string(),
        normalized(media).string()
    }, Capture::Combined);

    if (result.exit_code == 127) throw ToolMissingError(_config.mktorrent + " is not installed or not in PATH");
    if (result.exit_code != 0) throw ToolError("Error creating torrent", result.output);
    if (!std::filesystem::exists(torrent_path)) throw ToolError("mktorrent did not write " + torrent_path.string(), result.output);

    return torrent_path;
}

std::string ArtifactProducer::get_media_info(const std::filesystem::path& media) {
    auto file = resolve_media_file(media);

    auto result = _runner.run(_config.mediainfo, { file.string() }, Capture::Stdout);

    if (result.exit_code == 127) throw ToolMissingError(_config.mediainfo + " is not installed or not in PATH");
    if (result.exit_code != 0) throw ToolError("Error running mediainfo on " + file.string(), result.output);

    return result.output;
}
