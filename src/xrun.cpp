#include "execkit/command.hpp"
#include "execkit/directory.hpp"
#include "execkit/logger.hpp"
#include "execkit/runner.hpp"

#include <charconv>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int EXIT_USAGE = 2;
constexpr int EXIT_LAUNCH = 127;

void print_help() {
    std::println("Usage: xrun [options] -- <command> [args...]");
    std::println("       xrun [options] -c \"<command line>\"");
    std::println("Options:");
    std::println("  -h, --help              Show this help message");
    std::println("  -v, --version           Show version");
    std::println("  -C <dir>                Run the command in <dir>");
    std::println("  -c <line>               Split <line> into words and run it");
    std::println("  -r, --retries <N>       Attempts before giving up (default: 1)");
    std::println("  -p, --pollrate <SEC>    Seconds to wait between attempts (default: 60)");
    std::println("  --on-retry <line>       Command to run before each retry");
    std::println("  --gather                Run once and exit with the command's status");
    std::println("  --json                  Print the result as JSON");
    std::println("  --log-level <LEVEL>     debug, info, warning or error (default: warning)");
}

void print_version() {
    std::println("xrun {}", EXECKIT_PROJ_VER);
}

std::optional<size_t> parse_count(const char *text) {
    size_t value = 0;
    auto res = std::from_chars(text, text + strlen(text), value);
    if (res.ec != std::errc() || *res.ptr != '\0')
        return std::nullopt;
    return value;
}

int status_exit_code(int status) {
    return (status > 0 && status < 256) ? status : 1;
}

} // namespace

int main(const int argc, const char *const *argv) {
    using json = nlohmann::json;

    execkit::CheckOptions options;
    execkit::LogLevel log_level = execkit::LogLevel::warning;
    std::optional<std::string> work_dir;
    std::optional<std::string> command_line;
    std::vector<std::string> command_args;
    bool gather_only = false;
    bool as_json = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto next_value = [&]() -> const char * {
            if (i + 1 < argc)
                return argv[++i];
            std::println(std::cerr, "Missing argument for {}", arg);
            return nullptr;
        };

        if (arg == "--") {
            command_args.assign(argv + i + 1, argv + argc);
            break;
        } else if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "-C") {
            const char *value = next_value();
            if (!value)
                return EXIT_USAGE;
            work_dir = value;
        } else if (arg == "-c") {
            const char *value = next_value();
            if (!value)
                return EXIT_USAGE;
            command_line = value;
        } else if (arg == "-r" || arg == "--retries") {
            const char *value = next_value();
            if (!value)
                return EXIT_USAGE;
            auto retries = parse_count(value);
            if (!retries || *retries == 0) {
                std::println(std::cerr, "Invalid retry count: {}", value);
                return EXIT_USAGE;
            }
            options.retries = *retries;
        } else if (arg == "-p" || arg == "--pollrate") {
            const char *value = next_value();
            if (!value)
                return EXIT_USAGE;
            auto seconds = parse_count(value);
            if (!seconds) {
                std::println(std::cerr, "Invalid pollrate: {}", value);
                return EXIT_USAGE;
            }
            options.pollrate = std::chrono::seconds(*seconds);
        } else if (arg == "--on-retry") {
            const char *value = next_value();
            if (!value)
                return EXIT_USAGE;
            auto on_retry = execkit::Command::parse(value);
            if (!on_retry) {
                std::println(std::cerr, "Invalid --on-retry command: {}", on_retry.error());
                return EXIT_USAGE;
            }
            options.on_retry = std::move(*on_retry);
        } else if (arg == "--gather") {
            gather_only = true;
        } else if (arg == "--json") {
            as_json = true;
        } else if (arg == "--log-level") {
            const char *value = next_value();
            if (!value)
                return EXIT_USAGE;
            auto level = execkit::parse_log_level(value);
            if (!level) {
                std::println(std::cerr, "{}", level.error());
                return EXIT_USAGE;
            }
            log_level = *level;
        } else {
            std::println(std::cerr, "Unknown argument: {}", arg);
            print_help();
            return EXIT_USAGE;
        }
    }

    if (command_line && !command_args.empty()) {
        std::println(std::cerr, "Use either -c or -- <command>, not both");
        return EXIT_USAGE;
    }

    auto cmd = command_line ? execkit::Command::parse(*command_line)
                            : execkit::Command::from_args(std::move(command_args));
    if (!cmd) {
        std::println(std::cerr, "Invalid command: {}", cmd.error());
        return EXIT_USAGE;
    }

    execkit::StreamLogger logger{log_level};
    execkit::DirectoryContext directory;

    std::optional<execkit::DirectoryContext::Scope> scope;
    if (work_dir) {
        auto pushed = directory.push(*work_dir);
        if (!pushed) {
            std::println(std::cerr, "Failed to change directory: {}", pushed.error());
            return EXIT_USAGE;
        }
        scope.emplace(std::move(*pushed));
    }

    execkit::CommandRunner runner{logger, directory};

    json report;
    report["args"] = cmd->args();
    report["cwd"] = directory.getcwd().value_or(std::filesystem::path{}).string();

    auto emit = [&](const std::string &out, const std::string &err) {
        if (as_json) {
            report["stdout"] = out;
            report["stderr"] = err;
            std::println("{}", report.dump(4, ' ', false, json::error_handler_t::replace));
        } else {
            std::print("{}", out);
            std::print(stderr, "{}", err);
        }
    };

    if (gather_only) {
        auto res = runner.gather(*cmd);
        if (!res) {
            std::println(std::cerr, "{}", res.error().message());
            return EXIT_LAUNCH;
        }
        report["status"] = res->status;
        emit(res->out, res->err);
        return res->status == execkit::SUCCESS ? 0 : status_exit_code(res->status);
    }

    auto res = runner.check_assert(*cmd, options);
    if (res) {
        report["status"] = execkit::SUCCESS;
        emit(res->out, res->err);
        return 0;
    }

    if (const auto *failure = std::get_if<execkit::AssertionFailure>(&res.error())) {
        if (as_json) {
            report["status"] = failure->status;
            report["attempts"] = failure->attempts;
            report["error"] = failure->message();
            emit("", failure->stderr_output);
        } else {
            std::println(std::cerr, "{}", failure->message());
        }
        return status_exit_code(failure->status);
    }

    const auto &launch = std::get<execkit::LaunchFailure>(res.error());
    if (as_json) {
        report["error"] = launch.message();
        std::println("{}", report.dump(4, ' ', false, json::error_handler_t::replace));
    } else {
        std::println(std::cerr, "{}", launch.message());
    }
    return EXIT_LAUNCH;
}
