#include "execkit/process_exec.hpp"

#include <reproc++/run.hpp>

#include <string>
#include <system_error>
#include <vector>

namespace execkit {

Result<ExecutionResult, LaunchFailure> process_exec(const std::vector<std::string> &args,
                                                    const std::filesystem::path &working_dir) {
    if (args.empty()) {
        return std::unexpected(
            LaunchFailure{args, working_dir, std::make_error_code(std::errc::invalid_argument)});
    }

    reproc::options options;
    options.redirect.in.type = reproc::redirect::parent;
    options.stop.first = {reproc::stop::wait, reproc::infinite};

    const std::string dir = working_dir.string();
    if (!dir.empty()) {
        options.working_directory = dir.c_str();
    }

    ExecutionResult result;
    reproc::sink::string out_sink(result.out);
    reproc::sink::string err_sink(result.err);

    auto [status, ec] = reproc::run(args, options, out_sink, err_sink);
    if (ec) {
        return std::unexpected(LaunchFailure{args, working_dir, ec});
    }

    result.status = status;
    return result;
}

} // namespace execkit
