#pragma once

#include <string>
#include <stdexcept>
#include <fstream>
#include <filesystem>

std::string read_from_file(const std::filesystem::path& path);

// strips a trailing separator so "Movie/" and "Movie" name the same entry
std::filesystem::path normalized(const std::filesystem::path& path);

// a directory stands for its first entry (sorted by name), a file for itself
std::filesystem::path resolve_media_file(const std::filesystem::path& path);
