#include <csignal>
#include "app/WritherApp.hpp"

namespace {

void HandleSignal(int) {
    writher::app::WritherApp::RequestExit();
}

} // namespace

int main(int, char**) {
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    // A helper tool that exits before reading its input must fail the write, not the process.
    std::signal(SIGPIPE, SIG_IGN);

    writher::app::WritherApp app;
    return app.Run() == 0 ? 0 : 1;
}
