/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>

#include "domain/Errors.hpp"

namespace gitdu::infrastructure {

namespace fs = std::filesystem;

namespace {

void WriteAll(int fd, const std::string& content, const fs::path& path) {
    const char* data = content.data();
    std::size_t remaining = content.size();
    while (remaining > 0) {
        const ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw domain::CacheIoError("write failed: " + path.string() + ": " + std::strerror(errno));
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }
}

void SyncDirectory(const fs::path& dir) {
    const int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) return;
    ::fsync(fd);
    ::close(fd);
}

} // namespace

PersistenceService::PersistenceService() : m_running(true) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void PersistenceService::replaceAsync(const std::string& path, const std::string& content) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push(PendingWrite{path, content});
    }
    m_cv.notify_one();
}

std::size_t PersistenceService::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size() + (m_busy ? 1 : 0);
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] { return m_queue.empty() && !m_busy; });
}

void PersistenceService::workerLoop() {
    while (true) {
        PendingWrite write;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                m_idleCv.notify_all();
                return;
            }

            write = std::move(m_queue.front());
            m_queue.pop();
            m_busy = true;
        }

        try {
            writeAtomic(write.path, write.content);
        } catch (const std::exception& e) {
            std::cerr << "[PersistenceService] " << e.what() << std::endl;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
        }
        m_idleCv.notify_all();
    }
}

void PersistenceService::writeAtomic(const std::string& path, const std::string& content) {
    fs::path finalPath = path;

    // Unique temp path: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            throw domain::CacheIoError("cannot create directory " + finalPath.parent_path().string() +
                                       ": " + ec.message());
        }
    }

    // 2. Write and sync the temp file
    const int fd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw domain::CacheIoError("cannot open temp file " + tempPath.string() + ": " + std::strerror(errno));
    }
    try {
        WriteAll(fd, content, tempPath);
        if (::fsync(fd) != 0) {
            throw domain::CacheIoError("fsync failed: " + tempPath.string() + ": " + std::strerror(errno));
        }
    } catch (...) {
        ::close(fd);
        fs::remove(tempPath, ec);
        throw;
    }
    ::close(fd);

    // 3. Atomic rename
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw domain::CacheIoError("rename failed: " + finalPath.string() + ": " + ec.message());
    }
    SyncDirectory(finalPath.parent_path());
}

} // namespace gitdu::infrastructure
