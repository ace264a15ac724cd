#pragma once

#include "BEncode.hpp"
#include "HttpTransport.hpp"
#include "ProcessRunner.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <vector>

struct ToolCall {
    std::string tool;
    std::vector<std::string> args;
    Capture capture;
};

// records every invocation and answers through handler
struct FakeProcessRunner : ProcessRunner {
    std::vector<ToolCall> calls;
    std::function<ToolResult(const ToolCall&)> handler;

    ToolResult run(const std::string& tool, const std::vector<std::string>& args, Capture capture) override {
        calls.push_back({ tool, args, capture });
        if (!handler) return {};
        return handler(calls.back());
    }
};

struct FakeTransport : HttpTransport {
    std::vector<HttpRequest> requests;
    std::function<HttpResponse(const HttpRequest&)> handler;

    HttpResponse send(const HttpRequest& request) override {
        requests.push_back(request);
        if (!handler) return { 200, "", "", "", request.url };
        return handler(request);
    }
};

// fresh empty directory under the system temp directory
inline std::filesystem::path scratch_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "ahd_uploader_tests" / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

// single file torrent the way mktorrent -p writes one
inline std::string private_torrent(const std::string& name, int64_t length, bool is_private = true) {
    BEncodeValue::Dict info{
        { "length", BEncodeValue{ length } },
        { "name", BEncodeValue{ name } },
        { "piece length", BEncodeValue{ int64_t{ 1 } << 23 } },
        { "pieces", BEncodeValue{ std::string(20, 'x') } }
    };
    if (is_private) info.emplace("private", BEncodeValue{ int64_t{ 1 } });

    BEncodeValue::Dict root{
        { "created by", BEncodeValue{ std::string("mktorrent 1.1") } },
        { "info", BEncodeValue{ std::move(info) } }
    };
    return bencode(BEncodeValue{ std::move(root) });
}
