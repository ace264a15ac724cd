#include "MetadataInferencer.hpp"
#include "Errors.hpp"
#include "Utils.hpp"

#include <print>
#include <regex>

namespace {

std::string name_of(const std::filesystem::path& path) {
    return normalized(path).filename().string();
}

}

ContentType detect_content_type(const std::filesystem::path& media) {
    static const std::regex season_marker(R"(\.S\d{2})");

    if (std::regex_search(name_of(media), season_marker)) return ContentType::TVShows;
    return ContentType::Movies;
}

MediaType detect_media_type(const std::filesystem::path& media) {
    auto name = resolve_media_file(media).filename().string();

    if (name.contains("UHD.BluRay")) return MediaType::UhdBluRay;
    if (name.contains("BluRay")) return MediaType::BluRay;

    for (auto m: all_media_types) {
        if (name.contains(to_string(m))) return m;
    }

    throw DetectionError("Unable to detect media type from " + name);
}

std::optional<Codec> detect_codec(const std::filesystem::path& media) {
    auto name = resolve_media_file(media).filename().string();

    for (auto c: all_codecs) {
        if (name.contains(to_string(c))) return c;
    }

    return std::nullopt;
}

std::string detect_group(const std::filesystem::path& media) {
    auto stem = resolve_media_file(media).stem().string();

    auto dash = stem.rfind('-');
    if (dash == std::string::npos) return stem;
    return stem.substr(dash + 1);
}

std::optional<std::string> detect_streaming_edition(const std::filesystem::path& media) {
    auto name = name_of(media);

    // Netflix wins when both are present
    if (name.contains("Netflix") || name.contains(".NF.")) return "Netflix";
    if (name.contains("AMZN")) return "Amazon";
    return std::nullopt;
}

ResolvedAttributes infer_attributes(const std::filesystem::path& media, const UploadAttributes& attributes) {
    if (!std::filesystem::exists(media)) throw DetectionError("Media path does not exist: " + media.string());

    ResolvedAttributes out;
    out.special_edition = attributes.special_edition;
    out.user_release = attributes.user_release;
    out.num_screens = attributes.num_screens;
    out.imdb = attributes.imdb;
    out.passkey = attributes.passkey;

    out.type = is_auto(attributes.type) ? detect_content_type(media) : std::get<ContentType>(attributes.type);
    out.group = is_auto(attributes.group) ? detect_group(media) : std::get<std::string>(attributes.group);
    out.media = is_auto(attributes.media) ? detect_media_type(media) : std::get<MediaType>(attributes.media);

    std::optional<Codec> codec;

    if (is_auto(attributes.codec)) {
        codec = detect_codec(media);

        // web sources are untouched streams, so the encoder is reported as a remux
        if (out.media == MediaType::WebDL) {
            auto name = name_of(media);
            if (codec == Codec::X264 || name.contains("H.264")) codec = Codec::H264Remux;
            if (codec == Codec::X265 || name.contains("H.265") || name.contains("HEVC")) codec = Codec::H265Remux;
        }
    }
    else {
        codec = std::get<Codec>(attributes.codec);
    }

    if (!codec) throw ValidationError("Unable to detect codec from " + name_of(media) + ", specify it with --codec");
    out.codec = *codec;

    if (out.type == ContentType::Movies) {
        if (auto edition = detect_streaming_edition(media)) {
            if (out.special_edition && *out.special_edition != *edition)
                std::println("Overriding special edition '{}' with '{}'", *out.special_edition, *edition);
            out.special_edition = edition;
        }
    }

    if (out.num_screens <= 0) throw ValidationError("Number of screenshots must be a positive integer");

    return out;
}
