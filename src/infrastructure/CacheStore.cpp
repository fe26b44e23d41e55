/**
 * @file CacheStore.cpp
 * @brief Implementation of CacheStore.
 */

#include "infrastructure/CacheStore.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include "domain/Errors.hpp"
#include "domain/PathNode.hpp"
#include "infrastructure/CacheRecordCodec.hpp"

namespace gitdu::infrastructure {

namespace fs = std::filesystem;
using namespace gitdu::domain;

namespace {

std::string Errno(const std::string& what, const fs::path& path) {
    return what + ": " + path.string() + ": " + std::strerror(errno);
}

std::int64_t NowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool SameScope(const CacheHeader& a, const CacheHeader& b) {
    return a.version == b.version && a.order == b.order && a.repo == b.repo && a.glob == b.glob;
}

/**
 * @brief Decodes one log line, reporting failures as CacheCorruptionError.
 */
CacheRecord DecodeLine(const std::string& line, std::size_t lineNumber) {
    try {
        return DecodeRecord(line);
    } catch (const std::exception& e) {
        throw CacheCorruptionError("invalid record at line " + std::to_string(lineNumber) + ": " + e.what(),
                                   lineNumber);
    }
}

} // namespace

std::string CacheStatusToString(CacheStore::Status status) {
    switch (status) {
        case CacheStore::Status::Empty: return "empty";
        case CacheStore::Status::Incomplete: return "incomplete";
        case CacheStore::Status::Stale: return "stale";
        case CacheStore::Status::Fresh: return "fresh";
        default: return "unknown";
    }
}

CacheStore::CacheStore(fs::path logPath, CacheHeader scope, std::shared_ptr<PersistenceService> persistence)
    : m_logPath(std::move(logPath)), m_scope(std::move(scope)), m_persistence(std::move(persistence)) {}

CacheStore::~CacheStore() {
    try {
        close();
    } catch (const std::exception& e) {
        std::cerr << "[CacheStore] Error while closing " << m_logPath << ": " << e.what() << std::endl;
    }
}

fs::path CacheStore::LockPathFor(const fs::path& logPath) {
    fs::path p = logPath;
    p += ".lock";
    return p;
}

fs::path CacheStore::CursorPathFor(const fs::path& logPath) {
    fs::path p = logPath;
    p += ".cursor.json";
    return p;
}

std::string CacheStore::EventKey(const std::string& path, const std::string& commitId) {
    std::string key;
    key.reserve(path.size() + commitId.size() + 1);
    key.append(commitId).push_back('\0');
    key.append(path);
    return key;
}

void CacheStore::open() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_lockFd >= 0) return;

    std::error_code ec;
    if (m_logPath.has_parent_path()) {
        fs::create_directories(m_logPath.parent_path(), ec);
        if (ec) {
            throw CacheIoError("cannot create cache directory " + m_logPath.parent_path().string() + ": " +
                               ec.message());
        }
    }

    acquireLock();
    try {
        loadLocked();
        openLogFdLocked();
    } catch (...) {
        if (m_logFd >= 0) {
            ::close(m_logFd);
            m_logFd = -1;
        }
        ::close(m_lockFd);
        m_lockFd = -1;
        throw;
    }
}

void CacheStore::acquireLock() {
    const fs::path lockPath = LockPathFor(m_logPath);
    const int fd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw CacheIoError(Errno("cannot open lock file", lockPath));
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        std::string holder;
        char buf[64] = {0};
        const ssize_t n = ::pread(fd, buf, sizeof(buf) - 1, 0);
        if (n > 0) holder.assign(buf, static_cast<std::size_t>(n));
        ::close(fd);
        if (err == EWOULDBLOCK) {
            std::string message = "cache " + m_logPath.string() + " is in use by another gitdu session";
            if (!holder.empty()) message += " (pid " + holder + ")";
            throw ConcurrentWriterError(message);
        }
        errno = err;
        throw CacheIoError(Errno("cannot lock", lockPath));
    }

    // Informational only; the flock is what excludes other writers.
    const std::string pid = std::to_string(::getpid());
    if (::ftruncate(fd, 0) == 0) {
        if (::pwrite(fd, pid.data(), pid.size(), 0) < 0) {
            std::cerr << "[CacheStore] Could not record pid in " << lockPath << std::endl;
        }
    }
    m_lockFd = fd;
}

void CacheStore::loadLocked() {
    clearMemoryLocked();
    m_report = LoadReport{};

    std::string content;
    {
        std::ifstream in(m_logPath, std::ios::binary);
        if (in) {
            std::stringstream buffer;
            buffer << in.rdbuf();
            content = buffer.str();
        }
    }

    if (content.empty()) {
        resetLocked();
        return;
    }

    std::size_t offset = 0;
    std::size_t validLength = 0;
    std::size_t lineNumber = 0;
    bool headerSeen = false;

    while (offset < content.size()) {
        const std::size_t newline = content.find('\n', offset);
        ++lineNumber;

        if (newline == std::string::npos) {
            // Torn final write: the record never became durable.
            m_report.truncatedTail = true;
            m_report.discardedLines = 1;
            std::cerr << "[CacheStore] Discarding incomplete trailing record at line " << lineNumber
                      << " of " << m_logPath << std::endl;
            break;
        }

        const std::string line = content.substr(offset, newline - offset);
        try {
            CacheRecord record = DecodeLine(line, lineNumber);
            if (!headerSeen) {
                const auto* header = std::get_if<CacheHeader>(&record);
                if (!header) {
                    throw CacheCorruptionError("cache log does not start with a header", lineNumber);
                }
                if (!SameScope(*header, m_scope)) {
                    std::cerr << "[CacheStore] Header of " << m_logPath << " (version " << header->version
                              << ", order " << header->order << ") does not match; rebuilding cache" << std::endl;
                    m_report.scopeMismatch = true;
                    resetLocked();
                    return;
                }
                headerSeen = true;
            } else {
                applyLocked(record);
            }
        } catch (const CacheCorruptionError& e) {
            const bool lastLine = newline + 1 >= content.size();
            if (lastLine) {
                m_report.truncatedTail = true;
            } else {
                m_report.corruptionRepaired = true;
            }
            m_report.discardedLines = static_cast<std::size_t>(
                std::count(content.begin() + static_cast<std::ptrdiff_t>(offset), content.end(), '\n'));
            if (content.back() != '\n') ++m_report.discardedLines;
            std::cerr << "[CacheStore] " << e.what() << "; truncating " << m_logPath << " to line "
                      << (e.lineNumber() - 1) << " (" << m_report.discardedLines << " line(s) dropped)"
                      << std::endl;
            break;
        }

        ++m_report.validRecords;
        offset = newline + 1;
        validLength = offset;
    }

    if (!headerSeen) {
        resetLocked();
        return;
    }

    if (validLength < content.size()) {
        std::error_code ec;
        fs::resize_file(m_logPath, validLength, ec);
        if (ec) {
            throw CacheIoError("cannot truncate " + m_logPath.string() + ": " + ec.message());
        }
    }
    m_logSize = validLength;

    if (m_report.validRecords > 1) {
        std::cerr << "[CacheStore] Loaded " << m_events.size() << " events from " << m_logPath;
        if (m_cursor) {
            std::cerr << " (cursor at " << m_cursor->processedCount << " commits)";
        }
        std::cerr << std::endl;
    }
}

void CacheStore::openLogFdLocked() {
    const int fd = ::open(m_logPath.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
    if (fd < 0) {
        throw CacheIoError(Errno("cannot open cache log", m_logPath));
    }
    m_logFd = fd;
}

void CacheStore::close() {
    if (m_persistence) {
        m_persistence->flush();
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logFd >= 0) {
        ::close(m_logFd);
        m_logFd = -1;
    }
    if (m_lockFd >= 0) {
        ::flock(m_lockFd, LOCK_UN);
        ::close(m_lockFd);
        m_lockFd = -1;
    }
}

bool CacheStore::isOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lockFd >= 0 && m_logFd >= 0;
}

void CacheStore::writeLocked(const std::string& bytes) {
    if (m_logFd < 0) {
        throw CacheIoError("cache " + m_logPath.string() + " is not open");
    }

    const char* data = bytes.data();
    std::size_t remaining = bytes.size();
    while (remaining > 0) {
        const ssize_t written = ::write(m_logFd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            const std::string message = Errno("write failed", m_logPath);
            // Drop the partial batch so the next append starts on a line boundary.
            if (::ftruncate(m_logFd, static_cast<off_t>(m_logSize)) != 0) {
                std::cerr << "[CacheStore] " << Errno("could not roll back partial write", m_logPath) << std::endl;
            }
            throw CacheIoError(message);
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }

    if (::fdatasync(m_logFd) != 0) {
        throw CacheIoError(Errno("fdatasync failed", m_logPath));
    }
    m_logSize += bytes.size();
}

void CacheStore::applyLocked(const CacheRecord& record) {
    std::visit([this](auto&& r) {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, ChangeEvent>) {
            if (m_eventKeys.insert(EventKey(r.path, r.commitId)).second) {
                m_events.push_back(r);
            }
        }
        else if constexpr (std::is_same_v<T, Checkpoint>) {
            m_cursor = r.cursor;
        }
        else if constexpr (std::is_same_v<T, CommitSkip>) {
            m_skips.push_back(r);
        }
        else if constexpr (std::is_same_v<T, ScopeMark>) {
            m_scopes[r.prefix] = r.head;
        }
        // A header after the first line carries no state.
    }, record);
}

void CacheStore::clearMemoryLocked() {
    m_events.clear();
    m_eventKeys.clear();
    m_cursor.reset();
    m_skips.clear();
    m_scopes.clear();
    m_logSize = 0;
}

std::size_t CacheStore::append(const std::vector<CacheRecord>& records) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string bytes;
    std::vector<const CacheRecord*> accepted;
    std::unordered_set<std::string> batchKeys;

    for (const auto& record : records) {
        if (const auto* event = std::get_if<ChangeEvent>(&record)) {
            const std::string key = EventKey(event->path, event->commitId);
            if (m_eventKeys.count(key) > 0 || !batchKeys.insert(key).second) {
                continue;
            }
        }
        if (std::holds_alternative<CacheHeader>(record)) {
            continue;
        }
        bytes += EncodeRecord(record);
        bytes += '\n';
        accepted.push_back(&record);
    }

    if (accepted.empty()) return 0;

    writeLocked(bytes);
    for (const auto* record : accepted) {
        applyLocked(*record);
    }
    return accepted.size();
}

void CacheStore::checkpoint(const ScanCursor& cursor) {
    Checkpoint record{cursor, NowSeconds()};
    std::string sidecar;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cursor && cursor.processedCount < m_cursor->processedCount) {
            throw std::invalid_argument("cursor cannot move backwards (" + std::to_string(cursor.processedCount) +
                                        " < " + std::to_string(m_cursor->processedCount) + ")");
        }
        if (m_cursor && *m_cursor == cursor) return;

        sidecar = EncodeRecord(record);
        writeLocked(sidecar + "\n");
        applyLocked(record);
    }

    if (m_persistence) {
        m_persistence->replaceAsync(CursorPathFor(m_logPath).string(), sidecar + "\n");
    }
}

void CacheStore::recordScope(const std::string& prefix, const std::string& head) {
    append({ScopeMark{prefix, head}});
}

void CacheStore::reset() {
    if (m_persistence) {
        // A queued sidecar write must not land after the reset.
        m_persistence->flush();
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    const bool wasOpen = m_logFd >= 0;
    if (wasOpen) {
        ::close(m_logFd);
        m_logFd = -1;
    }
    resetLocked();
    if (wasOpen) {
        openLogFdLocked();
    }
    std::cerr << "[CacheStore] Cache reset: " << m_logPath << std::endl;
}

void CacheStore::resetLocked() {
    clearMemoryLocked();
    const std::string header = EncodeRecord(m_scope) + "\n";
    PersistenceService::writeAtomic(m_logPath.string(), header);
    m_logSize = header.size();

    std::error_code ec;
    fs::remove(CursorPathFor(m_logPath), ec);
}

std::optional<ScanCursor> CacheStore::cursor() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cursor;
}

std::vector<ChangeEvent> CacheStore::events() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events;
}

std::vector<ChangeEvent> CacheStore::eventsUnder(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ChangeEvent> result;
    for (const auto& e : m_events) {
        if (IsUnderPrefix(e.path, prefix)) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<CommitSkip> CacheStore::skippedCommits() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_skips;
}

std::size_t CacheStore::eventCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

bool CacheStore::containsEvent(const std::string& path, const std::string& commitId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_eventKeys.count(EventKey(path, commitId)) > 0;
}

std::vector<std::string> CacheStore::coverageHeads(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> heads;
    if (m_cursor && !m_cursor->scanBase.empty()) {
        heads.push_back(m_cursor->scanBase);
    }
    for (const auto& [scopePrefix, head] : m_scopes) {
        if (IsUnderPrefix(prefix, scopePrefix) &&
            std::find(heads.begin(), heads.end(), head) == heads.end()) {
            heads.push_back(head);
        }
    }
    return heads;
}

CacheStore::Status CacheStore::status(const std::optional<std::string>& liveHead) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_cursor) {
        return m_events.empty() ? Status::Empty : Status::Incomplete;
    }
    if (!m_cursor->segmentComplete()) {
        return Status::Incomplete;
    }
    if (!liveHead || *liveHead != m_cursor->repoHeadAtScanStart) {
        return Status::Stale;
    }
    return Status::Fresh;
}

CacheStore::LoadReport CacheStore::lastLoadReport() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_report;
}

std::optional<ScanCursor> CacheStore::ReadCursorFile(const fs::path& logPath) {
    std::ifstream in(CursorPathFor(logPath));
    if (!in) return std::nullopt;

    std::string line;
    std::getline(in, line);
    try {
        const CacheRecord record = DecodeRecord(line);
        if (const auto* checkpoint = std::get_if<Checkpoint>(&record)) {
            return checkpoint->cursor;
        }
    } catch (const std::exception& e) {
        std::cerr << "[CacheStore] Ignoring unreadable cursor file for " << logPath << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace gitdu::infrastructure
