#include "infrastructure/DesktopNotifier.hpp"
#include "infrastructure/CommandRunner.hpp"
#include <iostream>

namespace writher::infrastructure {

bool DesktopNotifier::fire(const std::string& title, const std::string& body) {
    const std::string cmd = "notify-send -a Writher -u normal " + CommandRunner::ShellQuote(title) + " " +
                            CommandRunner::ShellQuote(body);
    const bool ok = CommandRunner::Capture(cmd).ok();
    if (ok) {
        std::cout << "[DesktopNotifier] " << title << ": " << body << std::endl;
    } else {
        std::cerr << "[DesktopNotifier] notify-send failed for: " << title << std::endl;
    }
    return ok;
}

} // namespace writher::infrastructure
