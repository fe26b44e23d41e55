/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized management for background tasks.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <mutex>
#include <thread>
#include <atomic>
#include <memory>
#include <algorithm>
#include <cstdint>
#include <iterator>

namespace gitdu::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    HistoryScan,
    SubtreeExpansion
};

inline std::string TaskTypeToString(TaskType type) {
    switch (type) {
        case TaskType::HistoryScan: return "scan";
        case TaskType::SubtreeExpansion: return "expand";
        default: return "unknown";
    }
}

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<float> progress{0.0f};
    std::atomic<std::uint64_t> processed{0};
    std::atomic<std::uint64_t> total{0};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};

    void fail(const std::string& message) {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        m_errorMessage = message;
        failed = true;
    }

    std::string errorMessage() const {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        return m_errorMessage;
    }

private:
    mutable std::mutex m_errorMutex;
    std::string m_errorMessage;
};

/**
 * @class AsyncTaskManager
 * @brief Manages background execution and provides unified status tracking.
 *
 * Task threads are owned and joined by the manager, so everything a task captures
 * must outlive it (or the manager). Threads that have finished are joined on the next
 * submission.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    ~AsyncTaskManager() {
        WaitAll();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /** @brief Submits a new task to be executed in the background. */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        ReapFinished();

        auto finished = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.push_back(status);

        std::thread thread([this, status, finished](auto userFunc, auto... userArgs) {
            try {
                // Call the user function with status as first arg, followed by other args
                userFunc(status, std::move(userArgs)...);
                if (!status->failed) status->progress = 1.0f;
            } catch (const std::exception& e) {
                status->fail(e.what());
            } catch (...) {
                status->fail("Unknown error during task execution.");
            }
            status->isCompleted = true;
            CleanupCompletedTasks();
            *finished = true;
        }, std::forward<F>(f), std::forward<Args>(args)...);
        m_workers.push_back(Worker{std::move(thread), finished});

        return status;
    }

    /** @brief Returns snapshots of all active tasks. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    /** @brief Blocks until every submitted task (including ones submitted meanwhile) has finished. */
    void WaitAll() {
        while (true) {
            std::vector<Worker> workers;
            {
                std::lock_guard<std::mutex> lock(m_tasksMutex);
                workers.swap(m_workers);
            }
            if (workers.empty()) return;
            JoinAll(workers);
        }
    }

    /** @brief Joins the threads of tasks that have returned. */
    void ReapFinished() {
        std::vector<Worker> done;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            auto split = std::stable_partition(m_workers.begin(), m_workers.end(),
                [](const Worker& w) { return !w.finished->load(); });
            std::move(split, m_workers.end(), std::back_inserter(done));
            m_workers.erase(split, m_workers.end());
        }
        JoinAll(done);
    }

    /** @brief Threads not yet joined, after reaping the finished ones. */
    std::size_t ThreadCount() {
        ReapFinished();
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_workers.size();
    }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    static void JoinAll(std::vector<Worker>& workers) {
        for (auto& w : workers) {
            if (w.thread.joinable() && w.thread.get_id() != std::this_thread::get_id()) {
                w.thread.join();
            } else if (w.thread.joinable()) {
                w.thread.detach();
            }
        }
    }

    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::vector<Worker> m_workers;
    std::mutex m_tasksMutex;
};

} // namespace gitdu::application
