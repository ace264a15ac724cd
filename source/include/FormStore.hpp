#pragma once

#include "UploadForm.hpp"

#include <filesystem>
#include <map>
#include <string>

inline constexpr std::string_view torrent_placeholder = "<torrent_content>";

// bencoded {format, version, fields}; fields is a list of [name, value] in form order,
// text values are strings, files are {filename, content}
void save_form(const UploadForm& form, const std::filesystem::path& path);

// throws CorruptFormError on anything that is not a form written by save_form
UploadForm load_form(const std::filesystem::path& path);

UploadForm decode_form(std::string_view data);
std::string encode_form(const UploadForm& form);

// printable copy of the form, attached files shown as a placeholder
std::map<std::string, std::string> examine_form(const UploadForm& form);
