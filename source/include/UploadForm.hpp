#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

struct FileBlob {
    std::string filename;
    std::string content;

    bool operator==(const FileBlob&) const = default;
};

// a field is either plain text or an attached file
using FormValue = std::variant<std::string, FileBlob>;

// the upload form as submitted, fields in assembly order; free of references to local files
class UploadForm {
public:
    using Field = std::pair<std::string, FormValue>;
    using Fields = std::vector<Field>;

    UploadForm() = default;

    // a repeated name keeps its first position and takes the last value
    explicit UploadForm(Fields fields) {
        for (auto& [name, value]: fields) set(std::move(name), std::move(value));
    }

    const Fields& fields() const { return _fields; }
    size_t size() const { return _fields.size(); }
    bool contains(std::string_view name) const { return find(name) != nullptr; }

    const FormValue* find(std::string_view name) const {
        auto it = std::ranges::find(_fields, name, &Field::first);
        return it == _fields.end() ? nullptr : &it->second;
    }

    std::optional<std::string> text(std::string_view name) const {
        const auto* v = find(name);
        if (!v || !std::holds_alternative<std::string>(*v)) return std::nullopt;
        return std::get<std::string>(*v);
    }

    // replaces the value in place, or appends a new field
    void set(std::string name, FormValue value) {
        auto it = std::ranges::find(_fields, name, &Field::first);
        if (it != _fields.end()) it->second = std::move(value);
        else _fields.emplace_back(std::move(name), std::move(value));
    }

    bool operator==(const UploadForm&) const = default;

private:
    Fields _fields;
};
