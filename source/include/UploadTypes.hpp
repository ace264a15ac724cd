#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

enum class ContentType {
    Movies = 0,
    TVShows
};

enum class MediaType {
    BluRay = 0,
    HDDVD,
    HDTV,
    WebDL,
    WebRip,
    DTheater,
    XDCAM,
    UhdBluRay
};

enum class Codec {
    X264 = 0,
    VC1Remux,
    H264Remux,
    MPEG2Remux,
    H265Remux,
    X265
};

enum class KnownEdition {
    DirectorsCut = 0,
    Unrated,
    ExtendedEdition,
    TwoInOne,
    CriterionCollection
};

// enumeration order is also the order used when matching literals in file names
inline constexpr std::array<ContentType, 2> all_content_types{ ContentType::Movies, ContentType::TVShows };

inline constexpr std::array<MediaType, 8> all_media_types{
    MediaType::BluRay, MediaType::HDDVD, MediaType::HDTV, MediaType::WebDL,
    MediaType::WebRip, MediaType::DTheater, MediaType::XDCAM, MediaType::UhdBluRay
};

inline constexpr std::array<Codec, 6> all_codecs{
    Codec::X264, Codec::VC1Remux, Codec::H264Remux, Codec::MPEG2Remux, Codec::H265Remux, Codec::X265
};

inline constexpr std::array<KnownEdition, 5> all_known_editions{
    KnownEdition::DirectorsCut, KnownEdition::Unrated, KnownEdition::ExtendedEdition,
    KnownEdition::TwoInOne, KnownEdition::CriterionCollection
};

// wire values as the upload form expects them
std::string_view to_string(ContentType type);
std::string_view to_string(MediaType media);
std::string_view to_string(Codec codec);
std::string_view to_string(KnownEdition edition);

std::optional<ContentType> parse_content_type(std::string_view value);
std::optional<MediaType> parse_media_type(std::string_view value);
std::optional<Codec> parse_codec(std::string_view value);
std::optional<KnownEdition> parse_known_edition(std::string_view value);

struct AutoDetect {
    bool operator==(const AutoDetect&) const = default;
};

// either left for inference or set by the operator
template <typename T>
using Setting = std::variant<AutoDetect, T>;

template <typename T>
bool is_auto(const Setting<T>& setting) { return std::holds_alternative<AutoDetect>(setting); }

inline constexpr std::string_view unknown_group_name = "UNKNOWN";

struct UploadAttributes {
    Setting<ContentType> type;
    Setting<MediaType> media;
    Setting<Codec> codec;
    Setting<std::string> group;

    std::optional<std::string> special_edition;
    bool user_release = false;
    int num_screens = 4;

    std::string imdb;
    std::string passkey;
};

struct ResolvedAttributes {
    ContentType type = ContentType::Movies;
    MediaType media = MediaType::BluRay;
    Codec codec = Codec::X264;
    std::string group;

    std::optional<std::string> special_edition;
    bool user_release = false;
    int num_screens = 4;

    std::string imdb;
    std::string passkey;

    bool is_unknown_group() const { return group == unknown_group_name; }
};
