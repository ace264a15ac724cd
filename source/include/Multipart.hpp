#pragma once

#include <string>
#include <string_view>

// multipart/form-data request body
class MultipartBody {
public:
    MultipartBody();
    explicit MultipartBody(std::string boundary): _boundary(std::move(boundary)) {}

    void add_field(std::string_view name, std::string_view value);
    void add_file(std::string_view name, std::string_view filename, std::string_view content, std::string_view content_type);

    // appends the closing delimiter, call once after the last part
    std::string finish();

    std::string content_type() const { return "multipart/form-data; boundary=" + _boundary; }
    const std::string& boundary() const { return _boundary; }

private:
    std::string _boundary;
    std::string _body;

    void open_part(std::string_view name);
};
