/**
 * @file GitCliDataSource.cpp
 * @brief Implementation of GitCliDataSource.
 */

#include "infrastructure/GitCliDataSource.hpp"

#include <sys/wait.h>

#include <cstdio>
#include <filesystem>
#include <sstream>

#include "domain/Errors.hpp"

namespace gitdu::infrastructure {

using namespace gitdu::domain;

namespace {

constexpr const char* kMarker = "@@gitdu";
constexpr char kFieldSep = '\x1f';

std::vector<std::string> SplitFields(const std::string& line, char sep) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true) {
        const std::size_t pos = line.find(sep, start);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

std::string TrimNewline(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

bool ParseCount(const std::string& text, std::int64_t& value, bool& binary) {
    if (text == "-") {
        value = 0;
        binary = true;
        return true;
    }
    // 18 digits always fit in int64.
    if (text.empty() || text.size() > 18) return false;
    std::int64_t v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    value = v;
    return true;
}

} // namespace

const char* const ShowFormat = "@@gitdu%x1f%H%x1f%P%x1f%ae%x1f%at%x1f%s";

GitCliDataSource::GitCliDataSource(const std::string& location) {
    std::error_code ec;
    if (!std::filesystem::is_directory(location, ec)) {
        throw RepositoryAccessError("not a directory: " + location);
    }

    CommandResult result = RunShell("git -C " + ShellQuote(location) + " rev-parse --show-toplevel 2>/dev/null");
    if (result.exitCode == 127) {
        throw RepositoryAccessError("git executable not found");
    }
    const std::string root = TrimNewline(result.output);
    if (result.exitCode != 0 || root.empty()) {
        throw RepositoryAccessError("not a git repository (or not a work tree): " + location);
    }
    m_root = root;
}

std::string GitCliDataSource::ShellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string GitCliDataSource::PathspecArg(const std::string& pathspec) {
    if (pathspec.empty()) return "";
    // Literal magic: a prefix containing '*' or '[' must not be treated as a pattern.
    return " -- " + ShellQuote(":(top,literal)" + pathspec);
}

GitCliDataSource::CommandResult GitCliDataSource::RunShell(const std::string& command) {
    CommandResult result;
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        throw RepositoryAccessError("failed to run: " + command);
    }

    char buffer[8192];
    std::size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.output.append(buffer, n);
    }

    const int status = pclose(pipe);
    if (status == -1) {
        result.exitCode = -1;
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else {
        result.exitCode = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    return result;
}

GitCliDataSource::CommandResult GitCliDataSource::run(const std::string& args) const {
    return RunShell("git -C " + ShellQuote(m_root) + " -c core.quotepath=off " + args + " 2>/dev/null");
}

std::optional<std::string> GitCliDataSource::headCommitId() {
    CommandResult result = run("rev-parse --verify -q HEAD^{commit}");
    if (result.exitCode != 0) {
        // Unborn branch: a repository without commits.
        return std::nullopt;
    }
    const std::string head = TrimNewline(result.output);
    if (head.empty()) return std::nullopt;
    return head;
}

bool GitCliDataSource::hasCommit(const std::string& commitId) {
    if (commitId.empty()) return false;
    return run("cat-file -e " + ShellQuote(commitId + "^{commit}")).exitCode == 0;
}

bool GitCliDataSource::isAncestor(const std::string& ancestor, const std::string& descendant) {
    // Exit 1 means "not an ancestor"; higher codes mean a commit is missing.
    return run("merge-base --is-ancestor " + ShellQuote(ancestor) + " " + ShellQuote(descendant)).exitCode == 0;
}

std::vector<std::string> GitCliDataSource::listCommits(const std::string& tip,
                                                       const std::vector<std::string>& excludes,
                                                       const std::string& pathspec) {
    if (tip.empty()) return {};

    std::string args = "rev-list --reverse --topo-order --full-history " + ShellQuote(tip);
    for (const auto& ex : excludes) {
        if (!ex.empty()) args += " " + ShellQuote("^" + ex);
    }
    args += PathspecArg(pathspec);

    CommandResult result = run(args);
    if (result.exitCode != 0) {
        throw RepositoryAccessError("git rev-list failed for " + tip + " (exit " +
                                    std::to_string(result.exitCode) + ")");
    }

    std::vector<std::string> commits;
    std::istringstream in(result.output);
    std::string line;
    while (std::getline(in, line)) {
        line = TrimNewline(line);
        if (!line.empty()) commits.push_back(line);
    }
    return commits;
}

CommitRecord GitCliDataSource::readCommit(const std::string& commitId, const std::string& pathspec) {
    const std::string args = "show --no-renames --no-color --numstat " +
                             ShellQuote(std::string("--format=") + ShowFormat) + " " + ShellQuote(commitId) +
                             PathspecArg(pathspec);
    CommandResult result = run(args);
    if (result.exitCode != 0) {
        throw CommitReadError(commitId, "git show failed for " + commitId + " (exit " +
                                            std::to_string(result.exitCode) + ")");
    }
    return ParseShowOutput(commitId, result.output);
}

std::vector<std::string> GitCliDataSource::listTrackedFiles() {
    CommandResult result = run("ls-files -z");
    if (result.exitCode != 0) {
        throw RepositoryAccessError("git ls-files failed in " + m_root);
    }

    std::vector<std::string> files;
    std::size_t start = 0;
    while (start < result.output.size()) {
        std::size_t end = result.output.find('\0', start);
        if (end == std::string::npos) end = result.output.size();
        if (end > start) files.push_back(result.output.substr(start, end - start));
        start = end + 1;
    }
    return files;
}

std::string UnquoteGitPath(const std::string& path) {
    if (path.size() < 2 || path.front() != '"' || path.back() != '"') {
        return path;
    }

    std::string out;
    const std::size_t end = path.size() - 1;
    for (std::size_t i = 1; i < end; ++i) {
        char c = path[i];
        if (c != '\\' || i + 1 >= end) {
            out += c;
            continue;
        }
        c = path[++i];
        switch (c) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case 'a': out += '\a'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'v': out += '\v'; break;
            case '\\': out += '\\'; break;
            case '"': out += '"'; break;
            default:
                if (c >= '0' && c <= '7') {
                    int value = c - '0';
                    for (int k = 0; k < 2 && i + 1 < end && path[i + 1] >= '0' && path[i + 1] <= '7'; ++k) {
                        value = value * 8 + (path[++i] - '0');
                    }
                    out += static_cast<char>(value);
                } else {
                    out += c;
                }
        }
    }
    return out;
}

CommitRecord ParseShowOutput(const std::string& commitId, const std::string& output) {
    std::istringstream in(output);
    std::string line;

    bool headerFound = false;
    while (std::getline(in, line)) {
        if (line.rfind(kMarker, 0) == 0) {
            headerFound = true;
            break;
        }
    }
    if (!headerFound) {
        throw CommitReadError(commitId, "missing commit header in git show output for " + commitId);
    }

    const std::vector<std::string> fields = SplitFields(TrimNewline(line), kFieldSep);
    if (fields.size() < 6) {
        throw CommitReadError(commitId, "truncated commit header for " + commitId);
    }

    CommitRecord record;
    record.commitId = fields[1];
    std::istringstream parents(fields[2]);
    std::string parent;
    while (parents >> parent) record.parentIds.push_back(parent);
    record.author = fields[3];
    try {
        record.timestamp = std::stoll(fields[4]);
    } catch (const std::exception&) {
        throw CommitReadError(commitId, "invalid author time '" + fields[4] + "' in " + commitId);
    }
    // A subject may legitimately contain the separator.
    record.subject = fields[5];
    for (std::size_t i = 6; i < fields.size(); ++i) {
        record.subject += kFieldSep;
        record.subject += fields[i];
    }

    if (record.commitId.empty()) {
        throw CommitReadError(commitId, "empty commit id in git show output for " + commitId);
    }

    while (std::getline(in, line)) {
        line = TrimNewline(line);
        if (line.empty()) continue;

        const std::size_t tab1 = line.find('\t');
        const std::size_t tab2 = tab1 == std::string::npos ? std::string::npos : line.find('\t', tab1 + 1);
        if (tab2 == std::string::npos) {
            throw CommitReadError(commitId, "malformed numstat line in " + commitId + ": " + line);
        }

        FileDiffStat stat;
        if (!ParseCount(line.substr(0, tab1), stat.insertions, stat.binary) ||
            !ParseCount(line.substr(tab1 + 1, tab2 - tab1 - 1), stat.deletions, stat.binary)) {
            throw CommitReadError(commitId, "malformed numstat counts in " + commitId + ": " + line);
        }
        stat.path = UnquoteGitPath(line.substr(tab2 + 1));
        if (stat.path.empty()) {
            throw CommitReadError(commitId, "numstat line without path in " + commitId);
        }
        record.files.push_back(std::move(stat));
    }

    if (record.parentIds.size() > 1) {
        // Combined diffs are not attributed.
        record.files.clear();
    }
    return record;
}

} // namespace gitdu::infrastructure
