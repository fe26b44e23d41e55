/**
 * @file CacheRecordCodec.hpp
 * @brief JSON lines encoding of cache records.
 */

#pragma once

#include <string>

#include "domain/CacheRecord.hpp"

namespace gitdu::infrastructure {

/**
 * @brief Serializes one record as a single-line JSON object (no trailing newline).
 */
std::string EncodeRecord(const domain::CacheRecord& record);

/**
 * @brief Parses one line.
 * @throws nlohmann::json::exception or std::invalid_argument when the line is not a
 *         complete, well-formed record.
 */
domain::CacheRecord DecodeRecord(const std::string& line);

} // namespace gitdu::infrastructure
