#pragma once

#include <string>
#include <vector>

struct ToolResult {
    int exit_code = 0;
    std::string output;
};

enum class Capture {
    Stdout,     // stderr goes to the terminal
    Combined    // stderr merged into the captured output
};

// runs an external tool to completion and reports its exit code and output
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // throws ToolMissingError when the tool cannot be found on PATH
    virtual ToolResult run(const std::string& tool, const std::vector<std::string>& args, Capture capture) = 0;
};

class SystemProcessRunner : public ProcessRunner {
public:
    ToolResult run(const std::string& tool, const std::vector<std::string>& args, Capture capture) override;
};
