#include <atomic>
#include <csignal>
#include <string>
#include <vector>

#include "app/GitDuApp.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

void HandleInterrupt(int) {
    g_interrupted.store(true);
}

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, HandleInterrupt);
    std::signal(SIGTERM, HandleInterrupt);

    std::vector<std::string> args(argv + 1, argv + argc);
    gitdu::app::GitDuApp app(g_interrupted);
    return app.Run(args);
}
