#include "UploadTypes.hpp"

#include <algorithm>

std::string_view to_string(ContentType type) {
    switch (type) {
        case ContentType::Movies:  return "Movies";
        case ContentType::TVShows: return "TV-Shows";
    }
    return {};
}

std::string_view to_string(MediaType media) {
    switch (media) {
        case MediaType::BluRay:    return "Blu-ray";
        case MediaType::HDDVD:     return "HD-DVD";
        case MediaType::HDTV:      return "HDTV";
        case MediaType::WebDL:     return "WEB-DL";
        case MediaType::WebRip:    return "WEBRip";
        case MediaType::DTheater:  return "DTheater";
        case MediaType::XDCAM:     return "XDCAM";
        case MediaType::UhdBluRay: return "UHD Blu-ray";
    }
    return {};
}

std::string_view to_string(Codec codec) {
    switch (codec) {
        case Codec::X264:       return "x264";
        case Codec::VC1Remux:   return "VC-1 Remux";
        case Codec::H264Remux:  return "h.264 Remux";
        case Codec::MPEG2Remux: return "MPEG2 Remux";
        case Codec::H265Remux:  return "h.265 Remux";
        case Codec::X265:       return "x265";
    }
    return {};
}

std::string_view to_string(KnownEdition edition) {
    switch (edition) {
        case KnownEdition::DirectorsCut:        return "Director's Cut";
        case KnownEdition::Unrated:             return "Unrated";
        case KnownEdition::ExtendedEdition:     return "Extended Edition";
        case KnownEdition::TwoInOne:            return "2 in 1";
        case KnownEdition::CriterionCollection: return "The Criterion Collection";
    }
    return {};
}

namespace {

template <typename Enum, size_t N>
std::optional<Enum> parse_wire_value(const std::array<Enum, N>& values, std::string_view value) {
    auto it = std::ranges::find_if(values, [value](Enum e) { return to_string(e) == value; });
    if (it == values.end()) return std::nullopt;
    return *it;
}

}

std::optional<ContentType> parse_content_type(std::string_view value) { return parse_wire_value(all_content_types, value); }
std::optional<MediaType> parse_media_type(std::string_view value) { return parse_wire_value(all_media_types, value); }
std::optional<Codec> parse_codec(std::string_view value) { return parse_wire_value(all_codecs, value); }
std::optional<KnownEdition> parse_known_edition(std::string_view value) { return parse_wire_value(all_known_editions, value); }
