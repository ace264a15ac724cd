#pragma once

#include "ArtifactProducer.hpp"
#include "HttpTransport.hpp"
#include "ProcessRunner.hpp"
#include "ScreenshotPipeline.hpp"
#include "SubmissionClient.hpp"
#include "UploadForm.hpp"
#include "UploadTypes.hpp"
#include "UploaderConfig.hpp"

#include <filesystem>
#include <map>
#include <string>

class Uploader {
public:
    Uploader(ProcessRunner& runner, HttpTransport& transport, const UploaderConfig& config, SubmissionClient::Clock clock = [] { return std::chrono::system_clock::now(); })
        : _artifacts(runner, config), _screenshots(runner, transport, config), _submission(transport, config, std::move(clock)) {}

    // builds the complete upload form for media and writes it to output_form
    UploadForm prepare(const std::filesystem::path& media, const std::filesystem::path& output_form, const UploadAttributes& attributes);

    std::map<std::string, std::string> examine(const std::filesystem::path& form_path);

    // deletes the form afterwards when asked to, but only once the tracker accepted it
    SubmissionResult upload(const std::filesystem::path& form_path, const std::filesystem::path& cookie_file, bool delete_on_success);

private:
    ArtifactProducer _artifacts;
    ScreenshotPipeline _screenshots;
    SubmissionClient _submission;

    FileBlob read_torrent(const std::filesystem::path& torrent_path);
};
