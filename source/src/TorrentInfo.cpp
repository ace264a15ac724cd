#include "TorrentInfo.hpp"

#include <openssl/sha.h>

void TorrentInfo::parse_torrent() {
    BEncodeParser parser(in);

    auto root = parser.parse();
    if (!root.is_dict()) throw BEncodeError("Torrent is not a dictionary");
    const auto& dict = root.as_dict();

    auto it = dict.find("info");
    if (it == dict.end() || !it->second.is_dict())
        throw BEncodeError("Missing info dictionary");
    const auto& info = it->second.as_dict();

    auto name_it = info.find("name");
    if (name_it != info.end() && name_it->second.is_string()) name = name_it->second.as_string();

    auto pl_it = info.find("piece length");
    if (pl_it != info.end() && pl_it->second.is_int()) piece_length = static_cast<uint64_t>(pl_it->second.as_int());

    // concatenated SHA1 hashes
    auto pieces_it = info.find("pieces");
    if (pieces_it != info.end() && pieces_it->second.is_string()) piece_count = pieces_it->second.as_string().size() / 20;

    auto private_it = info.find("private");
    is_private = private_it != info.end() && private_it->second.is_int() && private_it->second.as_int() == 1;

    auto files_it = info.find("files");
    if (files_it != info.end() && files_it->second.is_list()) {
        for (const auto& fval : files_it->second.as_list()) {
            if (!fval.is_dict()) continue;
            auto len_it = fval.as_dict().find("length");
            if (len_it != fval.as_dict().end() && len_it->second.is_int()) total_size += static_cast<uint64_t>(len_it->second.as_int());
            ++file_count;
        }
    }
    else {
        auto len_it = info.find("length");
        if (len_it != info.end() && len_it->second.is_int()) total_size = static_cast<uint64_t>(len_it->second.as_int());
        file_count = 1;
    }

    const auto& [start, end] = parser.get_info_start_end();

    SHA1(reinterpret_cast<const unsigned char*>(in.data() + start), end - start, info_hash.data());
}

void TorrentInfo::compute_info_hash_hex() {
    static const char* hex = "0123456789abcdef";

    info_hash_hex.resize(40);

    for (size_t i = 0; i < 20; ++i) {
        unsigned char b = info_hash[i];
        info_hash_hex[2*i]     = hex[(b >> 4) & 0xF];
        info_hash_hex[2*i + 1] = hex[b & 0xF];
    }
}
