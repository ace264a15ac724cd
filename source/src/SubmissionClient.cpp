#include "SubmissionClient.hpp"
#include "CookieJar.hpp"
#include "Errors.hpp"
#include "Multipart.hpp"
#include "UploadResponsePage.hpp"

#include <format>
#include <print>
#include <regex>

HttpResponse SubmissionClient::submit(const UploadForm& form, const CookieJar& cookies) {
    MultipartBody body;

    for (const auto& [name, value]: form.fields()) {
        if (const auto* text = std::get_if<std::string>(&value)) body.add_field(name, *text);
        else {
            const auto& blob = std::get<FileBlob>(value);
            body.add_file(name, blob.filename, blob.content, "application/x-bittorrent");
        }
    }

    HttpRequest req;
    req.method = HttpMethod::Post;
    req.url = _config.upload_url();
    req.content_type = body.content_type();
    req.body = body.finish();
    req.cookies = &cookies;

    return _transport.send(req);
}

SubmissionResult SubmissionClient::upload(const UploadForm& form, const CookieJar& cookies) {
    auto res = submit(form, cookies);

    if (res.status != 200) {
        throw SubmissionError(std::format("Something went wrong while uploading (HTTP {}). Check the tracker to verify that "
                                          "no malformed or incorrect torrent was uploaded.", res.status), res.status);
    }

    try {
        auto link = extract_download_link(res.body, _clock(), _config.recency_window, _config.download_url());
        return { std::move(link), true, res.status };
    }
    catch (const LinkExtractionError& ex) {
        std::println("Could not identify the new torrent ({}), falling back to the response url", ex.what());
    }
    catch (const std::regex_error& ex) {
        std::println("Could not scan the response page ({}), falling back to the response url", ex.what());
    }

    return { res.url, false, res.status };
}
