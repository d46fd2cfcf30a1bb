#include "execkit/command.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace execkit {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_safe(char c) {
    if (std::isalnum(static_cast<unsigned char>(c)))
        return true;
    constexpr std::string_view safe = "@%+=:,./_-";
    return safe.find(c) != std::string_view::npos;
}

} // namespace

Result<std::vector<std::string>> split(std::string_view line) {
    std::vector<std::string> words;
    std::string current;
    // Quoted empty strings ('' or "") still produce a word.
    bool in_word = false;

    enum class Quote { None, Single, Double };
    Quote quote = Quote::None;

    auto flush_word = [&]() {
        if (in_word) {
            words.push_back(std::move(current));
            current.clear();
            in_word = false;
        }
    };

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (quote == Quote::None) {
            if (is_space(c)) {
                flush_word();
                continue;
            }
            in_word = true;
            if (c == '\'') {
                quote = Quote::Single;
            } else if (c == '"') {
                quote = Quote::Double;
            } else if (c == '\\') {
                if (i + 1 >= line.size())
                    return std::unexpected(std::format("No escaped character after trailing backslash: {}", line));
                current += line[++i];
            } else {
                current += c;
            }
        } else if (quote == Quote::Single) {
            if (c == '\'')
                quote = Quote::None;
            else
                current += c;
        } else {
            if (c == '"') {
                quote = Quote::None;
            } else if (c == '\\') {
                if (i + 1 >= line.size())
                    return std::unexpected(std::format("No closing quotation: {}", line));
                char next = line[i + 1];
                // Inside double quotes only the quote and the backslash itself are escapable.
                if (next == '"' || next == '\\') {
                    current += next;
                    ++i;
                } else {
                    current += c;
                }
            } else {
                current += c;
            }
        }
    }

    if (quote != Quote::None)
        return std::unexpected(std::format("No closing quotation: {}", line));

    flush_word();
    return words;
}

std::string quote(std::string_view arg) {
    if (arg.empty())
        return "''";
    if (std::ranges::all_of(arg, is_safe))
        return std::string(arg);

    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted += '\'';
    for (char c : arg) {
        if (c == '\'')
            quoted += "'\"'\"'";
        else
            quoted += c;
    }
    quoted += '\'';
    return quoted;
}

std::string join_args(const std::vector<std::string> &args) {
    std::string joined;
    for (const auto &arg : args) {
        if (!joined.empty())
            joined += ' ';
        joined += quote(arg);
    }
    return joined;
}

Result<Command> Command::from_args(std::vector<std::string> args) {
    if (args.empty())
        return std::unexpected("Cannot build a command from an empty argument list");
    if (args.front().empty())
        return std::unexpected("Command executable name is empty");
    return Command{std::move(args)};
}

Result<Command> Command::parse(std::string_view line) {
    auto words = split(line);
    if (!words)
        return std::unexpected(words.error());
    if (words->empty())
        return std::unexpected(std::format("Command contains no words: '{}'", line));
    return from_args(std::move(*words));
}

std::string Command::str() const {
    return join_args(args_);
}

} // namespace execkit
