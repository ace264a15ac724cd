#include "Utils.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <vector>

std::string read_from_file(const std::filesystem::path& path) {
	std::ifstream file(path, std::ios::binary | std::ios::ate);

	if (!file.is_open()) {
		throw std::runtime_error("Could not open file: " + path.string());
	}

	std::streamsize size = file.tellg();
	file.seekg(0, std::ios::beg);

	std::string data(size, '\0');
	if (!file.read(data.data(), size)) {
		throw std::runtime_error("Could not read file: " + path.string());
	}

    return data;
}

std::filesystem::path normalized(const std::filesystem::path& path) {
    auto p = path.lexically_normal();
    if (!p.has_filename() && p.has_parent_path()) p = p.parent_path();
    return p;
}

std::filesystem::path resolve_media_file(const std::filesystem::path& path) {
    auto p = normalized(path);
    if (!std::filesystem::is_directory(p)) return p;

    std::vector<std::filesystem::path> entries;
    for (const auto& entry: std::filesystem::directory_iterator(p)) entries.push_back(entry.path());

    if (entries.empty()) throw DetectionError("Directory is empty: " + p.string());

    return *std::ranges::min_element(entries);
}
