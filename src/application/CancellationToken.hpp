/**
 * @file CancellationToken.hpp
 * @brief Cooperative stop flag checked at commit boundaries.
 */

#pragma once

#include <atomic>

namespace gitdu::application {

class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }
    bool isCancelled() const { return m_cancelled.load(); }

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace gitdu::application
