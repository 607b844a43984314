/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation flag shared between a job and whoever may cancel it.
 */

#pragma once

#include <atomic>

namespace exporthub::application {

class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }
    bool isCancellationRequested() const { return m_cancelled.load(); }

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace exporthub::application
