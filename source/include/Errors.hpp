#pragma once

#include <stdexcept>
#include <string>

// every failure that aborts a command derives from this
struct UploaderError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct DetectionError : UploaderError {
    using UploaderError::UploaderError;
};

struct ValidationError : UploaderError {
    using UploaderError::UploaderError;
};

struct ToolMissingError : UploaderError {
    using UploaderError::UploaderError;
};

struct ToolError : UploaderError {
    ToolError(const std::string& message, std::string output)
        : UploaderError(output.empty() ? message : message + ":\n" + output), _output(std::move(output)) {}

    const std::string& output() const { return _output; }

private:
    std::string _output;
};

struct UploadError : UploaderError {
    using UploaderError::UploaderError;
};

struct SubmissionError : UploaderError {
    SubmissionError(const std::string& message, unsigned status): UploaderError(message), _status(status) {}

    unsigned status() const { return _status; }

private:
    unsigned _status;
};

struct CorruptFormError : UploaderError {
    using UploaderError::UploaderError;
};

struct NetworkError : UploaderError {
    using UploaderError::UploaderError;
};

struct CookieFileError : UploaderError {
    using UploaderError::UploaderError;
};

struct UsageError : UploaderError {
    using UploaderError::UploaderError;
};
