#include "Errors.hpp"
#include "MetadataInferencer.hpp"
#include "TestDoubles.hpp"
#include "Utils.hpp"

#include <cassert>
#include <print>

namespace {

UploadAttributes auto_attributes() {
    UploadAttributes a;
    a.imdb = "tt0111161";
    a.passkey = "key";
    return a;
}

std::filesystem::path touch(const std::filesystem::path& dir, const std::string& name) {
    auto p = dir / name;
    write_file(p, "media");
    return p;
}

template <typename E, typename F>
void expect_throw(F&& f) {
    bool thrown = false;
    try { f(); }
    catch (const E&) { thrown = true; }
    assert(thrown);
}

void TestWireValues() {
    assert(to_string(ContentType::TVShows) == "TV-Shows");
    assert(to_string(MediaType::UhdBluRay) == "UHD Blu-ray");
    assert(to_string(Codec::H264Remux) == "h.264 Remux");
    assert(to_string(KnownEdition::TwoInOne) == "2 in 1");

    assert(parse_media_type("WEB-DL") == MediaType::WebDL);
    assert(parse_codec("VC-1 Remux") == Codec::VC1Remux);
    assert(parse_known_edition("The Criterion Collection") == KnownEdition::CriterionCollection);
    assert(!parse_codec("x266"));
    assert(!parse_content_type("movies"));
}

void TestContentType() {
    assert(detect_content_type("Show.S01.1080p.BluRay.x264-GRP") == ContentType::TVShows);
    assert(detect_content_type("Show.S01E03.1080p.HDTV.x264-GRP.mkv") == ContentType::TVShows);
    assert(detect_content_type("/data/Show.S02.1080p.BluRay.x264-GRP/") == ContentType::TVShows);
    assert(detect_content_type("Movie.2010.1080p.BluRay.x264-GRP.mkv") == ContentType::Movies);
    assert(detect_content_type("Movie.Sequel.2010.1080p.BluRay.x264-GRP.mkv") == ContentType::Movies);
}

void TestMediaType() {
    assert(detect_media_type("Movie.2010.2160p.UHD.BluRay.x265-GRP.mkv") == MediaType::UhdBluRay);
    assert(detect_media_type("Movie.2010.1080p.BluRay.x264-GRP.mkv") == MediaType::BluRay);
    assert(detect_media_type("Movie.2010.1080p.HDTV.x264-GRP.mkv") == MediaType::HDTV);
    assert(detect_media_type("Movie.2010.1080p.WEB-DL.H.264-GRP.mkv") == MediaType::WebDL);
    assert(detect_media_type("Movie.2010.1080p.WEBRip.x264-GRP.mkv") == MediaType::WebRip);
    assert(detect_media_type("Movie.2010.1080p.HD-DVD.VC-1 Remux-GRP.mkv") == MediaType::HDDVD);

    expect_throw<DetectionError>([] { detect_media_type("Movie.2010.1080p.x264-GRP.mkv"); });
}

void TestCodecAndGroup() {
    assert(detect_codec("Movie.2010.1080p.BluRay.x264-GRP.mkv") == Codec::X264);
    assert(detect_codec("Movie.2010.2160p.UHD.BluRay.x265-GRP.mkv") == Codec::X265);
    assert(!detect_codec("Movie.2010.1080p.BluRay.AVC-GRP.mkv"));

    assert(detect_group("Movie.2010.1080p.BluRay.x264-GRP.mkv") == "GRP");
    assert(detect_group("Movie-Title.2010.1080p.BluRay.x264-Team.mkv") == "Team");
}

void TestStreamingEdition() {
    assert(detect_streaming_edition("Movie.2010.1080p.AMZN.WEB-DL.H.264-GRP.mkv") == "Amazon");
    assert(detect_streaming_edition("Movie.2010.1080p.NF.WEB-DL.H.264-GRP.mkv") == "Netflix");
    assert(detect_streaming_edition("Movie.2010.1080p.Netflix.AMZN.WEB-DL-GRP.mkv") == "Netflix");
    assert(!detect_streaming_edition("Movie.2010.1080p.BluRay.x264-GRP.mkv"));
}

void TestInferBluRayMovie() {
    auto dir = scratch_dir("infer_bluray");
    auto media = touch(dir, "Movie.2010.1080p.BluRay.x264-GRP.mkv");

    auto r = infer_attributes(media, auto_attributes());

    assert(r.type == ContentType::Movies);
    assert(r.media == MediaType::BluRay);
    assert(r.codec == Codec::X264);
    assert(r.group == "GRP");
    assert(!r.special_edition);
    assert(r.num_screens == 4);
    assert(r.imdb == "tt0111161");
}

void TestInferWebSources() {
    auto dir = scratch_dir("infer_web");

    auto h264 = infer_attributes(touch(dir, "Movie.2010.1080p.AMZN.WEB-DL.DDP5.1.H.264-GRP.mkv"), auto_attributes());
    assert(h264.media == MediaType::WebDL);
    assert(h264.codec == Codec::H264Remux);
    assert(h264.special_edition == "Amazon");

    auto x265 = infer_attributes(touch(dir, "Movie.2010.2160p.NF.WEB-DL.x265-GRP.mkv"), auto_attributes());
    assert(x265.codec == Codec::H265Remux);
    assert(x265.special_edition == "Netflix");

    auto hevc = infer_attributes(touch(dir, "Movie.2010.2160p.WEB-DL.HEVC-GRP.mkv"), auto_attributes());
    assert(hevc.codec == Codec::H265Remux);

    // explicit codecs are never rewritten
    auto a = auto_attributes();
    a.codec = Codec::X264;
    assert(infer_attributes(dir / "Movie.2010.1080p.AMZN.WEB-DL.DDP5.1.H.264-GRP.mkv", a).codec == Codec::X264);

    // rips are re-encodes
    auto rip = infer_attributes(touch(dir, "Movie.2010.1080p.WEBRip.x264-GRP.mkv"), auto_attributes());
    assert(rip.codec == Codec::X264);
}

void TestExplicitSettingsWin() {
    auto dir = scratch_dir("infer_explicit");
    auto media = touch(dir, "Movie.2010.1080p.BluRay.x264-GRP.mkv");

    auto a = auto_attributes();
    a.type = ContentType::TVShows;
    a.media = MediaType::HDTV;
    a.group = std::string(unknown_group_name);
    a.special_edition = "Unrated";
    a.user_release = true;

    auto r = infer_attributes(media, a);
    assert(r.type == ContentType::TVShows);
    assert(r.media == MediaType::HDTV);
    assert(r.is_unknown_group());
    assert(r.special_edition == "Unrated");
    assert(r.user_release);
}

void TestStreamingEditionOverridesMoviesOnly() {
    auto dir = scratch_dir("infer_edition");

    auto a = auto_attributes();
    a.special_edition = "Unrated";
    auto movie = infer_attributes(touch(dir, "Movie.2010.1080p.AMZN.WEB-DL.H.264-GRP.mkv"), a);
    assert(movie.special_edition == "Amazon");

    auto show = infer_attributes(touch(dir, "Show.S01.1080p.AMZN.WEB-DL.H.264-GRP.mkv"), auto_attributes());
    assert(show.type == ContentType::TVShows);
    assert(!show.special_edition);
}

void TestDirectoryUsesFirstEntry() {
    auto root = scratch_dir("infer_directory");
    auto release = root / "Show.S01.1080p.BluRay.x264-GRP";
    std::filesystem::create_directories(release);
    touch(release, "Show.S01E02.1080p.BluRay.x264-GRP.mkv");
    touch(release, "Show.S01E01.1080p.BluRay.x264-GRP.mkv");

    assert(resolve_media_file(release).filename() == "Show.S01E01.1080p.BluRay.x264-GRP.mkv");

    auto r = infer_attributes(release.string() + "/", auto_attributes());
    assert(r.type == ContentType::TVShows);
    assert(r.media == MediaType::BluRay);
    assert(r.codec == Codec::X264);
    assert(r.group == "GRP");
}

void TestFailures() {
    auto dir = scratch_dir("infer_failures");

    expect_throw<DetectionError>([&] { infer_attributes(dir / "missing.mkv", auto_attributes()); });

    auto empty = dir / "Empty.2010.1080p.BluRay.x264-GRP";
    std::filesystem::create_directories(empty);
    expect_throw<DetectionError>([&] { infer_attributes(empty, auto_attributes()); });

    expect_throw<ValidationError>([&] { infer_attributes(touch(dir, "Movie.2010.1080p.BluRay.AVC-GRP.mkv"), auto_attributes()); });

    auto a = auto_attributes();
    a.num_screens = 0;
    expect_throw<ValidationError>([&] { infer_attributes(touch(dir, "Movie.2010.1080p.BluRay.x264-GRP.mkv"), a); });
}

}

int main() {
    TestWireValues();
    TestContentType();
    TestMediaType();
    TestCodecAndGroup();
    TestStreamingEdition();
    TestInferBluRayMovie();
    TestInferWebSources();
    TestExplicitSettingsWin();
    TestStreamingEditionOverridesMoviesOnly();
    TestDirectoryUsesFirstEntry();
    TestFailures();

    std::println("metadata_inferencer_test passed");
    return 0;
}
