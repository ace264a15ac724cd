#pragma once

#include "UploadForm.hpp"
#include "UploadTypes.hpp"

#include <string>

inline constexpr std::string_view torrent_field = "file_input";
inline constexpr std::string_view default_remaster_title = "Director's Cut";

struct FormArtifacts {
    FileBlob torrent;
    std::string media_info;
    std::string release_desc;
};

UploadForm assemble_form(const ResolvedAttributes& attributes, FormArtifacts artifacts);
