#include "infrastructure/CommandRunner.hpp"
#include <array>
#include <cstdio>
#include <sys/wait.h>

namespace writher::infrastructure {

namespace {

int DecodeStatus(int status) {
    if (status == -1) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

} // namespace

CommandResult CommandRunner::Capture(const std::string& cmd) {
    CommandResult result;
    FILE* pipe = popen((cmd + " 2>/dev/null").c_str(), "r");
    if (!pipe) {
        return result;
    }

    std::array<char, 4096> buffer{};
    size_t n = 0;
    while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), n);
    }
    result.exitCode = DecodeStatus(pclose(pipe));
    return result;
}

CommandResult CommandRunner::Feed(const std::string& cmd, const std::string& input) {
    CommandResult result;
    FILE* pipe = popen((cmd + " >/dev/null 2>&1").c_str(), "w");
    if (!pipe) {
        return result;
    }

    const size_t written = fwrite(input.data(), 1, input.size(), pipe);
    const int status = pclose(pipe);
    result.exitCode = written == input.size() ? DecodeStatus(status) : -1;
    return result;
}

std::string CommandRunner::ShellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char ch : value) {
        if (ch == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(ch);
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace writher::infrastructure
