/**
 * @file ScanPipeline.hpp
 * @brief Scanner -> cache store -> aggregator chain over bounded queues.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "application/AsyncTaskManager.hpp"
#include "application/HistoryScanner.hpp"
#include "domain/ChangeEvent.hpp"
#include "domain/ScanCursor.hpp"
#include "infrastructure/CacheStore.hpp"

namespace gitdu::application {

struct PipelineOptions {
    std::size_t batchSize = 64;
    std::size_t queueCapacity = 256;
};

struct PipelineResult {
    std::uint64_t commitsProcessed = 0; ///< In this run.
    std::uint64_t eventsWritten = 0;
    std::uint64_t commitsSkipped = 0;
    bool cancelled = false;
    std::optional<domain::ScanCursor> finalCursor;
};

/**
 * @class ScanPipeline
 * @brief Runs one ScanPlan to completion (or cancellation).
 *
 * Stages:
 * - producer thread: HistoryScanner::next()
 * - writer thread: CacheStore::append() then checkpoint(), once per batch
 * - calling thread: hands durable events to the apply callback
 *
 * A checkpoint is written only after the events and skip markers it covers.
 */
class ScanPipeline {
public:
    using ApplyFn = std::function<void(const std::vector<domain::ChangeEvent>&)>;

    ScanPipeline(HistoryScanner& scanner, infrastructure::CacheStore& store, ApplyFn apply,
                 PipelineOptions options = {}, std::shared_ptr<TaskStatus> status = nullptr);

    /**
     * @brief Blocks until the plan is exhausted or the scanner was cancelled.
     * @throws The first error raised by any stage (RepositoryAccessError, CacheIoError, ...).
     */
    PipelineResult run();

private:
    HistoryScanner& m_scanner;
    infrastructure::CacheStore& m_store;
    ApplyFn m_apply;
    PipelineOptions m_options;
    std::shared_ptr<TaskStatus> m_status;
};

} // namespace gitdu::application
