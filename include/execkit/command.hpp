#pragma once

#include "execkit/utility.hpp"

#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace execkit {

/**
 * @brief Splits a line into words using POSIX shell quoting rules.
 *
 * Whitespace separates words. Single quotes keep their contents literally,
 * double quotes keep their contents except for `\"` and `\\`, and an unquoted
 * backslash escapes the next character. Pipes, redirections and globs are not
 * interpreted.
 *
 * @param line The text to split.
 * @return The words, or an error for an unterminated quote or trailing escape.
 */
Result<std::vector<std::string>> split(std::string_view line);

/**
 * @brief Quotes a single argument so that `split` yields it back unchanged.
 */
std::string quote(std::string_view arg);

/**
 * @brief A command in canonical form: a non-empty argument vector.
 *
 * The first argument is the executable. Both factories reject input that
 * would produce an empty vector, so every `Command` is launchable.
 */
class Command {
public:
    /**
     * @brief Builds a command from pre-tokenized arguments.
     * @param args The arguments (first argument is the executable).
     * @return The command, or an error if `args` is empty.
     */
    static Result<Command> from_args(std::vector<std::string> args);

    /**
     * @brief Builds a command by shell-word splitting `line`.
     * @param line The command text, e.g. `echo 'a b' c`.
     * @return The command, or an error if splitting fails or yields no words.
     */
    static Result<Command> parse(std::string_view line);

    const std::vector<std::string> &args() const {
        return args_;
    }

    const std::string &program() const {
        return args_.front();
    }

    /** @brief The arguments quoted and joined by spaces. */
    std::string str() const;

    bool operator==(const Command &) const = default;

private:
    explicit Command(std::vector<std::string> &&args) : args_(std::move(args)) {
    }

    std::vector<std::string> args_;
};

/** @brief Quotes and joins `args` the same way `Command::str` does. */
std::string join_args(const std::vector<std::string> &args);

} // namespace execkit

template <>
struct std::formatter<execkit::Command> : std::formatter<std::string> {
    auto format(const execkit::Command &cmd, std::format_context &ctx) const {
        return std::formatter<std::string>::format(cmd.str(), ctx);
    }
};
