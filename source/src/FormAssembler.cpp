#include "FormAssembler.hpp"

UploadForm assemble_form(const ResolvedAttributes& attributes, FormArtifacts artifacts) {
    UploadForm form;

    auto set = [&form](std::string_view name, std::string_view value) {
        form.set(std::string(name), FormValue{ std::string(value) });
    };

    set("submit", "true");
    form.set(std::string(torrent_field), FormValue{ std::move(artifacts.torrent) });
    set("nfo_input", "");
    set("type", to_string(attributes.type));
    set("imdblink", attributes.imdb);
    set("file_media", "");
    set("pastelog", artifacts.media_info);
    set("group", attributes.group);
    set("remaster_title", default_remaster_title);
    set("othereditions", "");
    set("media", to_string(attributes.media));
    set("encoder", to_string(attributes.codec));
    set("release_desc", artifacts.release_desc);

    if (attributes.is_unknown_group()) {
        set("unknown_group", "on");
        set("group", "");
    }

    if (attributes.user_release) set("user", "on");

    if (attributes.special_edition && !attributes.special_edition->empty()) {
        const auto& edition = *attributes.special_edition;
        set("remaster", "on");

        // anything the tracker has no preset for goes through the free text field
        if (parse_known_edition(edition)) {
            set("remaster_title", edition);
        }
        else {
            set("othereditions", edition);
            set("unknown", "on");
        }
    }

    return form;
}
