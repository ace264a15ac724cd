#include "FormStore.hpp"
#include "BEncode.hpp"
#include "Errors.hpp"
#include "Utils.hpp"

#include <fstream>

namespace {

constexpr std::string_view form_format = "ahd-upload-form";
constexpr int64_t form_version = 1;

const BEncodeValue& require(const BEncodeValue::Dict& dict, const std::string& key) {
    auto it = dict.find(key);
    if (it == dict.end()) throw CorruptFormError("Form is missing '" + key + "'");
    return it->second;
}

BEncodeValue encode_value(const FormValue& value) {
    if (const auto* text = std::get_if<std::string>(&value)) return BEncodeValue{ *text };

    const auto& blob = std::get<FileBlob>(value);
    return BEncodeValue{ BEncodeValue::Dict{
        { "filename", BEncodeValue{ blob.filename } },
        { "content", BEncodeValue{ blob.content } }
    } };
}

FormValue decode_value(const std::string& name, const BEncodeValue& value) {
    if (value.is_string()) return value.as_string();

    if (!value.is_dict()) throw CorruptFormError("Field '" + name + "' has an unsupported type");

    const auto& blob = value.as_dict();
    auto filename = blob.find("filename");
    auto content = blob.find("content");

    if (blob.size() != 2 || filename == blob.end() || content == blob.end()
        || !filename->second.is_string() || !content->second.is_string()) {
        throw CorruptFormError("Field '" + name + "' is not a valid file");
    }

    return FileBlob{ filename->second.as_string(), content->second.as_string() };
}

}

std::string encode_form(const UploadForm& form) {
    // a list of [name, value] pairs, dictionaries would lose the field order
    BEncodeValue::List fields;

    for (const auto& [name, value]: form.fields()) {
        fields.push_back(BEncodeValue{ BEncodeValue::List{ BEncodeValue{ name }, encode_value(value) } });
    }

    BEncodeValue::Dict root{
        { "format", BEncodeValue{ std::string(form_format) } },
        { "version", BEncodeValue{ form_version } },
        { "fields", BEncodeValue{ std::move(fields) } }
    };

    return bencode(BEncodeValue{ std::move(root) });
}

UploadForm decode_form(std::string_view data) {
    BEncodeValue root;

    try {
        BEncodeParser parser(data);
        root = parser.parse();
        if (!parser.at_end()) throw CorruptFormError("Trailing data after form");
    }
    catch (const BEncodeError& ex) {
        throw CorruptFormError(std::string("Form is not valid bencode: ") + ex.what());
    }

    if (!root.is_dict()) throw CorruptFormError("Form is not a dictionary");
    const auto& dict = root.as_dict();

    const auto& format = require(dict, "format");
    if (!format.is_string() || format.as_string() != form_format) throw CorruptFormError("Not an upload form");

    const auto& version = require(dict, "version");
    if (!version.is_int() || version.as_int() != form_version) throw CorruptFormError("Unsupported form version");

    const auto& fields = require(dict, "fields");
    if (!fields.is_list()) throw CorruptFormError("Form fields are not a list");

    UploadForm form;

    for (const auto& field: fields.as_list()) {
        if (!field.is_list() || field.as_list().size() != 2 || !field.as_list()[0].is_string()) {
            throw CorruptFormError("Form field is not a [name, value] pair");
        }

        const auto& name = field.as_list()[0].as_string();
        if (form.contains(name)) throw CorruptFormError("Duplicate form field '" + name + "'");

        form.set(name, decode_value(name, field.as_list()[1]));
    }

    return form;
}

void save_form(const UploadForm& form, const std::filesystem::path& path) {
    auto data = encode_form(form);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw UploaderError("Could not open " + path.string() + " for writing");

    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) throw UploaderError("Could not write form to " + path.string());
}

UploadForm load_form(const std::filesystem::path& path) {
    if (!std::filesystem::is_regular_file(path)) throw CorruptFormError("Form file not found: " + path.string());

    std::string data;
    try {
        data = read_from_file(path);
    }
    catch (const std::runtime_error& ex) {
        throw CorruptFormError(ex.what());
    }

    return decode_form(data);
}

std::map<std::string, std::string> examine_form(const UploadForm& form) {
    std::map<std::string, std::string> out;

    for (const auto& [name, value]: form.fields()) {
        if (const auto* text = std::get_if<std::string>(&value)) out.emplace(name, *text);
        else out.emplace(name, std::string(torrent_placeholder));
    }

    return out;
}
