#pragma once

#include "HttpTransport.hpp"
#include "UploadForm.hpp"
#include "UploaderConfig.hpp"

#include <chrono>
#include <functional>
#include <string>

class CookieJar;

struct SubmissionResult {
    std::string url;
    bool direct_link = false;   // false when url is only the page the upload landed on
    unsigned status = 0;
};

class SubmissionClient {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    SubmissionClient(HttpTransport& transport, const UploaderConfig& config, Clock clock = [] { return std::chrono::system_clock::now(); })
        : _transport(transport), _config(config), _clock(std::move(clock)) {}

    // posts the form as multipart/form-data to the tracker's upload endpoint
    HttpResponse submit(const UploadForm& form, const CookieJar& cookies);

    // throws SubmissionError unless the tracker answered 200
    SubmissionResult upload(const UploadForm& form, const CookieJar& cookies);

private:
    HttpTransport& _transport;
    const UploaderConfig& _config;
    Clock _clock;
};
