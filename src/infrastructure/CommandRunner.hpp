/**
 * @file CommandRunner.hpp
 * @brief Runs desktop helper tools (clipboard, key synthesis, notifications) through the shell.
 */

#pragma once

#include <string>

namespace writher::infrastructure {

/**
 * @struct CommandResult
 * @brief Exit code and captured standard output of a command.
 */
struct CommandResult {
    int exitCode = -1;
    std::string output;

    bool ok() const { return exitCode == 0; }
};

class CommandRunner {
public:
    /** @brief Runs `cmd` and captures its standard output. */
    static CommandResult Capture(const std::string& cmd);

    /**
     * @brief Runs `cmd` with `input` on its standard input.
     *
     * Fails with exit code -1 when the command stops reading early. The
     * process must ignore SIGPIPE for that case to be reported.
     */
    static CommandResult Feed(const std::string& cmd, const std::string& input);

    /** @brief Quotes `value` as a single POSIX shell word. */
    static std::string ShellQuote(const std::string& value);
};

} // namespace writher::infrastructure
