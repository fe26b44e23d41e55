/**
 * @file GitDuApp.hpp
 * @brief Main application class for gitdu.
 */

#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "app/CommandLine.hpp"

namespace gitdu::application {
class GitDuSession;
}

namespace gitdu::app {

/**
 * @class GitDuApp
 * @brief Orchestrates one invocation: configuration, session setup, scan, output.
 */
class GitDuApp {
public:
    /**
     * @param interrupted Set asynchronously (SIGINT); checked while waiting for the scan.
     */
    explicit GitDuApp(const std::atomic<bool>& interrupted);

    /**
     * @brief Runs the command.
     * @return Exit code: 0 success or clean interrupt, 1 fatal error, 2 usage error.
     */
    int Run(const std::vector<std::string>& args);

private:
    int RunSession(const CommandLineOptions& options);

    /**
     * @brief Waits for background work, forwarding interrupts and drawing progress on a terminal.
     */
    void WaitForSession(application::GitDuSession& session);

    const std::atomic<bool>& m_interrupted;
};

} // namespace gitdu::app
