/**
 * @file CacheRecordCodec.cpp
 * @brief Implementation of the cache record codec.
 */

#include "infrastructure/CacheRecordCodec.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <type_traits>

namespace gitdu::infrastructure {

using json = nlohmann::json;
using namespace gitdu::domain;

namespace {

const char* const kHexSuffix = "_hex";

// Same acceptance as the json serializer: no overlongs, surrogates or code points past U+10FFFF.
bool IsValidUtf8(const std::string& s) {
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    const auto* end = p + s.size();
    while (p < end) {
        const unsigned char c = *p;
        std::size_t length = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c < 0x80) { ++p; continue; }
        else if (c >= 0xC2 && c <= 0xDF) length = 1;
        else if (c == 0xE0) { length = 2; lo = 0xA0; }
        else if (c == 0xED) { length = 2; hi = 0x9F; }
        else if (c >= 0xE1 && c <= 0xEF) length = 2;
        else if (c == 0xF0) { length = 3; lo = 0x90; }
        else if (c == 0xF4) { length = 3; hi = 0x8F; }
        else if (c >= 0xF1 && c <= 0xF3) length = 3;
        else return false;

        if (static_cast<std::size_t>(end - p) <= length) return false;
        if (p[1] < lo || p[1] > hi) return false;
        for (std::size_t i = 2; i <= length; ++i) {
            if (p[i] < 0x80 || p[i] > 0xBF) return false;
        }
        p += length + 1;
    }
    return true;
}

std::string ToHex(const std::string& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        out += digits[c >> 4];
        out += digits[c & 0x0F];
    }
    return out;
}

int HexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string FromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) throw std::invalid_argument("odd-length hex field");
    std::string out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int high = HexDigit(hex[i]);
        const int low = HexDigit(hex[i + 1]);
        if (high < 0 || low < 0) throw std::invalid_argument("bad hex field");
        out += static_cast<char>((high << 4) | low);
    }
    return out;
}

// Git paths and names are raw bytes. Anything json cannot carry verbatim goes under "<key>_hex".
void PutText(json& j, const std::string& key, const std::string& value) {
    if (IsValidUtf8(value)) {
        j[key] = value;
    } else {
        j[key + kHexSuffix] = ToHex(value);
    }
}

std::string GetText(const json& j, const std::string& key) {
    auto hex = j.find(key + kHexSuffix);
    if (hex != j.end()) return FromHex(hex->get<std::string>());
    return j.at(key).get<std::string>();
}

std::string GetText(const json& j, const std::string& key, const std::string& fallback) {
    if (j.contains(key + kHexSuffix) || j.contains(key)) return GetText(j, key);
    return fallback;
}

} // namespace

std::string EncodeRecord(const CacheRecord& record) {
    json j;
    std::visit([&](auto&& r) {
        using T = std::decay_t<decltype(r)>;
        j["kind"] = T::Kind;

        if constexpr (std::is_same_v<T, CacheHeader>) {
            j["version"] = r.version;
            PutText(j, "repo", r.repo);
            PutText(j, "glob", r.glob);
            j["order"] = r.order;
        }
        else if constexpr (std::is_same_v<T, ChangeEvent>) {
            PutText(j, "path", r.path);
            j["commit"] = r.commitId;
            PutText(j, "author", r.author);
            j["ts"] = r.timestamp;
            j["ins"] = r.insertions;
            j["del"] = r.deletions;
        }
        else if constexpr (std::is_same_v<T, CommitSkip>) {
            j["commit"] = r.commitId;
            PutText(j, "reason", r.reason);
        }
        else if constexpr (std::is_same_v<T, ScopeMark>) {
            PutText(j, "prefix", r.prefix);
            j["head"] = r.head;
        }
        else if constexpr (std::is_same_v<T, Checkpoint>) {
            j["last"] = r.cursor.lastProcessedCommitId;
            j["count"] = r.cursor.processedCount;
            j["head"] = r.cursor.repoHeadAtScanStart;
            j["base"] = r.cursor.scanBase;
            j["written"] = r.writtenAt;
        }
    }, record);
    return j.dump();
}

CacheRecord DecodeRecord(const std::string& line) {
    const json j = json::parse(line);
    const std::string kind = j.at("kind").get<std::string>();

    if (kind == ChangeEvent::Kind) {
        ChangeEvent e;
        e.path = GetText(j, "path");
        e.commitId = j.at("commit").get<std::string>();
        e.author = GetText(j, "author");
        e.timestamp = j.at("ts").get<std::int64_t>();
        e.insertions = j.at("ins").get<std::int64_t>();
        e.deletions = j.at("del").get<std::int64_t>();
        if (e.path.empty() || e.commitId.empty()) {
            throw std::invalid_argument("event without path or commit");
        }
        return e;
    }
    if (kind == Checkpoint::Kind) {
        Checkpoint c;
        c.cursor.lastProcessedCommitId = j.at("last").get<std::string>();
        c.cursor.processedCount = j.at("count").get<std::uint64_t>();
        c.cursor.repoHeadAtScanStart = j.at("head").get<std::string>();
        c.cursor.scanBase = j.value("base", std::string());
        c.writtenAt = j.value("written", std::int64_t{0});
        return c;
    }
    if (kind == CommitSkip::Kind) {
        CommitSkip s;
        s.commitId = j.at("commit").get<std::string>();
        s.reason = GetText(j, "reason", std::string());
        return s;
    }
    if (kind == ScopeMark::Kind) {
        ScopeMark m;
        m.prefix = GetText(j, "prefix");
        m.head = j.at("head").get<std::string>();
        return m;
    }
    if (kind == CacheHeader::Kind) {
        CacheHeader h;
        h.version = j.at("version").get<int>();
        h.repo = GetText(j, "repo", std::string());
        h.glob = GetText(j, "glob", std::string());
        h.order = j.value("order", std::string());
        return h;
    }
    throw std::invalid_argument("unknown record kind: " + kind);
}

} // namespace gitdu::infrastructure
