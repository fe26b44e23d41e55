/**
 * @file GitDuApp.cpp
 * @brief Implementation of GitDuApp.
 */

#include "app/GitDuApp.hpp"

#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>

#include "application/GitDuSession.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/GitCliDataSource.hpp"
#include "infrastructure/PathUtils.hpp"
#include "ui/TreePrinter.hpp"

#ifndef GITDU_VERSION
#define GITDU_VERSION "dev"
#endif

namespace gitdu::app {

GitDuApp::GitDuApp(const std::atomic<bool>& interrupted) : m_interrupted(interrupted) {}

int GitDuApp::Run(const std::vector<std::string>& args) {
    CommandLineOptions options;
    try {
        options = ParseCommandLine(args);
    } catch (const UsageError& e) {
        std::cerr << "gitdu: " << e.what() << "\n\n" << UsageText();
        return 2;
    }

    if (options.showHelp) {
        std::cout << UsageText();
        return 0;
    }
    if (options.showVersion) {
        std::cout << "gitdu " << GITDU_VERSION << std::endl;
        return 0;
    }

    try {
        return RunSession(options);
    } catch (const domain::GitDuError& e) {
        std::cerr << "gitdu: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "gitdu: unexpected error: " << e.what() << std::endl;
        return 1;
    }
}

int GitDuApp::RunSession(const CommandLineOptions& options) {
    const std::filesystem::path configPath = options.configFile
        ? std::filesystem::path(*options.configFile)
        : infrastructure::PathUtils::GetSettingsFile();
    if (options.configFile && !std::filesystem::exists(configPath)) {
        std::cerr << "[ConfigLoader] " << configPath << " not found, using defaults" << std::endl;
    }

    application::SessionOptions sessionOptions;
    sessionOptions.config = infrastructure::ConfigLoader::Load(configPath);
    if (options.cacheDir) sessionOptions.config.cacheDir = *options.cacheDir;
    if (options.sortKey) sessionOptions.config.defaultSort = *options.sortKey;
    if (options.depth) sessionOptions.config.printDepth = *options.depth;
    if (options.glob) sessionOptions.glob = *options.glob;
    sessionOptions.refresh = options.refresh;
    sessionOptions.resume = options.resume;
    sessionOptions.lazyOverride = options.lazy;

    auto source = std::make_shared<infrastructure::GitCliDataSource>(options.repoPath);
    application::GitDuSession session(source, sessionOptions);
    session.open();

    const int depth = sessionOptions.config.printDepth;
    if (session.lazy()) {
        // Only the levels that get printed are loaded.
        if (depth > 0) {
            for (const auto& child : session.children("")) {
                session.requestExpand(child.path);
            }
        }
    } else {
        session.startBackgroundScan();
    }

    WaitForSession(session);

    const application::ScanStatus status = session.status();
    if (session.cancelled()) {
        std::cerr << "Scan interrupted. Progress has been saved; run the same command again to resume."
                  << std::endl;
        return 0;
    }

    ui::TreePrinter printer(std::cout);
    printer.print(session, "", depth);
    std::cerr << ui::TreePrinter::StatusLine(status) << std::endl;
    return status.error ? 1 : 0;
}

void GitDuApp::WaitForSession(application::GitDuSession& session) {
    const bool tty = ::isatty(STDERR_FILENO) == 1;
    std::thread waiter([&session] { session.waitForIdle(); });

    bool drewProgress = false;
    while (true) {
        const application::ScanStatus status = session.status();
        if (!status.scanning && status.expansionsRunning == 0) break;

        if (m_interrupted.load() && !session.cancelled()) {
            session.cancel();
        }
        if (tty && status.scanning) {
            std::cerr << "\r" << ui::TreePrinter::StatusLine(status) << "\033[K" << std::flush;
            drewProgress = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    if (m_interrupted.load()) session.cancel();
    waiter.join();
    if (drewProgress) std::cerr << "\r\033[K" << std::flush;
}

} // namespace gitdu::app
