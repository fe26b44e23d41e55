/**
 * @file ScanPipeline.cpp
 * @brief Implementation of ScanPipeline.
 */

#include "application/ScanPipeline.hpp"

#include <exception>
#include <iostream>
#include <mutex>
#include <thread>

#include "application/BoundedQueue.hpp"

namespace gitdu::application {

using namespace gitdu::domain;

ScanPipeline::ScanPipeline(HistoryScanner& scanner, infrastructure::CacheStore& store, ApplyFn apply,
                           PipelineOptions options, std::shared_ptr<TaskStatus> status)
    : m_scanner(scanner), m_store(store), m_apply(std::move(apply)), m_options(options),
      m_status(std::move(status)) {
    if (m_options.batchSize == 0) m_options.batchSize = 1;
}

PipelineResult ScanPipeline::run() {
    BoundedQueue<ScannedCommit> scanned(m_options.queueCapacity);
    BoundedQueue<std::vector<ChangeEvent>> durable(m_options.queueCapacity);

    PipelineResult result;
    std::mutex errorMutex;
    std::exception_ptr firstError;

    auto fail = [&](std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(errorMutex);
            if (!firstError) firstError = error;
        }
        // Unblock every stage.
        scanned.close();
        durable.close();
    };

    const std::uint64_t alreadyProcessed = m_scanner.plan().alreadyProcessed;
    const std::uint64_t total = alreadyProcessed + m_scanner.plan().pendingCommits();
    if (m_status) m_status->total = total;

    std::thread producer([&] {
        try {
            while (auto item = m_scanner.next()) {
                if (!scanned.push(std::move(*item))) break;
            }
        } catch (...) {
            fail(std::current_exception());
        }
        scanned.close();
    });

    std::thread writer([&] {
        try {
            std::vector<CacheRecord> records;
            std::vector<ChangeEvent> events;
            std::optional<ScanCursor> cursor;
            std::size_t commitsInBatch = 0;

            auto flush = [&] {
                if (!cursor) return;
                result.eventsWritten += m_store.append(records);
                m_store.checkpoint(*cursor);
                result.finalCursor = cursor;
                if (m_status) {
                    m_status->processed = cursor->processedCount;
                    if (total > 0) {
                        m_status->progress = static_cast<float>(cursor->processedCount) / static_cast<float>(total);
                    }
                }
                if (!events.empty()) durable.push(std::move(events));
                records.clear();
                events.clear();
                cursor.reset();
                commitsInBatch = 0;
            };

            while (auto item = scanned.pop()) {
                if (item->skipped) {
                    records.push_back(CommitSkip{item->commitId, item->skipReason});
                    ++result.commitsSkipped;
                }
                for (auto& e : item->events) {
                    records.push_back(e);
                    events.push_back(std::move(e));
                }
                if (!item->commitId.empty()) ++result.commitsProcessed;
                cursor = item->cursor;
                if (++commitsInBatch >= m_options.batchSize) flush();
            }
            // Commits already extracted are kept even on cancellation.
            flush();
        } catch (...) {
            fail(std::current_exception());
        }
        durable.close();
    });

    try {
        while (auto batch = durable.pop()) {
            m_apply(*batch);
        }
    } catch (...) {
        fail(std::current_exception());
    }

    producer.join();
    writer.join();

    if (firstError) std::rethrow_exception(firstError);

    result.cancelled = !m_scanner.finished();
    if (result.cancelled) {
        std::cerr << "[ScanPipeline] Scan interrupted after " << m_scanner.processed() << " of " << total
                  << " commits; progress saved" << std::endl;
    }
    return result;
}

} // namespace gitdu::application
