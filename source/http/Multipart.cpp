#include "Multipart.hpp"

#include <format>
#include <random>

namespace {

uint32_t random_u32() {
    static std::mt19937 rng{ std::random_device{}() };
    return rng();
}

// header parameters are quoted strings, keep them on one line and unambiguous
std::string quote(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c: value) {
        if (c == '"') out += "%22";
        else if (c == '\r' || c == '\n') out += ' ';
        else out += c;
    }
    return out;
}

}

MultipartBody::MultipartBody() {
    _boundary = std::format("----ahd-uploader-{:08x}{:08x}{:08x}", random_u32(), random_u32(), random_u32());
}

void MultipartBody::open_part(std::string_view name) {
    _body += "--";
    _body += _boundary;
    _body += "\r\n";
    _body += std::format("Content-Disposition: form-data; name=\"{}\"", quote(name));
}

void MultipartBody::add_field(std::string_view name, std::string_view value) {
    open_part(name);
    _body += "\r\n\r\n";
    _body += value;
    _body += "\r\n";
}

void MultipartBody::add_file(std::string_view name, std::string_view filename, std::string_view content, std::string_view content_type) {
    open_part(name);
    _body += std::format("; filename=\"{}\"\r\n", quote(filename));
    _body += std::format("Content-Type: {}\r\n\r\n", content_type);
    _body += content;
    _body += "\r\n";
}

std::string MultipartBody::finish() {
    _body += "--";
    _body += _boundary;
    _body += "--\r\n";
    return std::move(_body);
}
