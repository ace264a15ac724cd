#include "ProcessRunner.hpp"
#include "Errors.hpp"

#include <optional>

#include <boost/asio.hpp>
#include <boost/process/v2.hpp>

namespace net = boost::asio;
namespace bp = boost::process::v2;

ToolResult SystemProcessRunner::run(const std::string& tool, const std::vector<std::string>& args, Capture capture) {
    auto exe = bp::environment::find_executable(tool);
    if (exe.empty()) throw ToolMissingError(tool + " is not installed or not in PATH");

    net::io_context ioc;
    net::readable_pipe rp(ioc);
    net::writable_pipe wp(ioc);
    net::connect_pipe(rp, wp);

    ToolResult result;
    boost::system::error_code ec;

    try {
        // the child gets the write end; for Combined both stdout and stderr share it
        std::optional<bp::process> proc;
        if (capture == Capture::Combined) proc.emplace(ioc, exe, args, bp::process_stdio{ {}, wp, wp });
        else proc.emplace(ioc, exe, args, bp::process_stdio{ {}, wp, {} });

        // drop our copy of the write end, otherwise the read below never sees eof
        wp.close();

        net::read(rp, net::dynamic_buffer(result.output), ec);
        if (ec && ec != net::error::eof) throw ToolError("Could not read output of " + tool + ": " + ec.message(), result.output);

        result.exit_code = proc->wait();
    }
    catch (const boost::system::system_error& ex) {
        throw ToolError("Could not run " + tool + ": " + ex.what(), result.output);
    }

    return result;
}
