#pragma once

#include "BEncode.hpp"

#include <array>
#include <cstdint>
#include <string>

// summary of a .torrent file produced for upload
struct TorrentInfo {
    explicit TorrentInfo(std::string data): in(std::move(data)) {
        parse_torrent();
        compute_info_hash_hex();
    }

    std::string name;
    uint64_t piece_length = 0;
    size_t piece_count = 0;
    uint64_t total_size = 0;
    size_t file_count = 0;
    bool is_private = false;

    std::array<unsigned char, 20> info_hash{};
    std::string info_hash_hex;

private:
    std::string in;

    void parse_torrent();
    void compute_info_hash_hex();
};
