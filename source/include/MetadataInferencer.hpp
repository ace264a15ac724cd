#pragma once

#include "UploadTypes.hpp"

#include <filesystem>
#include <optional>
#include <string>

// fills every setting left at AutoDetect from the media path, then validates;
// throws DetectionError or ValidationError
ResolvedAttributes infer_attributes(const std::filesystem::path& media, const UploadAttributes& attributes);

ContentType detect_content_type(const std::filesystem::path& media);
MediaType detect_media_type(const std::filesystem::path& media);
std::optional<Codec> detect_codec(const std::filesystem::path& media);
std::string detect_group(const std::filesystem::path& media);

// web sources tagged in the release name, e.g. AMZN or NF
std::optional<std::string> detect_streaming_edition(const std::filesystem::path& media);
