#include "Uploader.hpp"
#include "CookieJar.hpp"
#include "Errors.hpp"
#include "FormAssembler.hpp"
#include "FormStore.hpp"
#include "MetadataInferencer.hpp"
#include "TorrentInfo.hpp"
#include "Utils.hpp"

#include <print>

FileBlob Uploader::read_torrent(const std::filesystem::path& torrent_path) {
    std::string data;

    try {
        data = read_from_file(torrent_path);
    }
    catch (const std::runtime_error& ex) {
        throw ToolError(ex.what(), "");
    }

    try {
        TorrentInfo info(data);

        if (!info.is_private) throw ToolError(torrent_path.string() + " is not marked private", "");

        std::println("Torrent '{}': {} file(s), {} pieces of {} bytes, info hash {}",
            info.name, info.file_count, info.piece_count, info.piece_length, info.info_hash_hex);
    }
    catch (const BEncodeError& ex) {
        throw ToolError("mktorrent wrote an unreadable torrent " + torrent_path.string() + ": " + ex.what(), "");
    }

    return { torrent_path.filename().string(), std::move(data) };
}

UploadForm Uploader::prepare(const std::filesystem::path& media, const std::filesystem::path& output_form, const UploadAttributes& attributes) {
    auto resolved = infer_attributes(media, attributes);

    std::println("Type: {}, media: {}, codec: {}, group: {}{}",
        to_string(resolved.type), to_string(resolved.media), to_string(resolved.codec), resolved.group,
        resolved.special_edition ? ", edition: " + *resolved.special_edition : std::string());

    auto torrent_path = _artifacts.create_torrent(media);
    auto torrent = read_torrent(torrent_path);

    auto media_info = _artifacts.get_media_info(media);
    auto release_desc = _screenshots.release_description(media, resolved.passkey, resolved.num_screens);

    auto form = assemble_form(resolved, { std::move(torrent), std::move(media_info), std::move(release_desc) });

    save_form(form, output_form);
    std::println("Upload form written to {}", output_form.string());

    return form;
}

std::map<std::string, std::string> Uploader::examine(const std::filesystem::path& form_path) {
    return examine_form(load_form(form_path));
}

SubmissionResult Uploader::upload(const std::filesystem::path& form_path, const std::filesystem::path& cookie_file, bool delete_on_success) {
    auto cookies = CookieJar::load(cookie_file);
    auto form = load_form(form_path);

    auto result = _submission.upload(form, cookies);

    if (delete_on_success) {
        std::error_code ec;
        std::filesystem::remove(form_path, ec);
        if (ec) std::println("Warning: could not delete {}: {}", form_path.string(), ec.message());
    }

    return result;
}
