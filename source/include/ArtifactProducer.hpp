#pragma once

#include "ProcessRunner.hpp"
#include "UploaderConfig.hpp"

#include <filesystem>
#include <string>

class ArtifactProducer {
public:
    ArtifactProducer(ProcessRunner& runner, const UploaderConfig& config): _runner(runner), _config(config) {}

    // runs mktorrent into <temp>/<name>.torrent and returns that path
    std::filesystem::path create_torrent(const std::filesystem::path& media);

    // mediainfo report of the media file (first entry for a directory)
    std::string get_media_info(const std::filesystem::path& media);

    std::filesystem::path torrent_path_for(const std::filesystem::path& media) const;

private:
    ProcessRunner& _runner;
    const UploaderConfig& _config;
};
