/**
 * @file CancellationToken.hpp
 * @brief Cooperative stop request shared between the signal handler and the engine.
 */

#pragma once

#include <atomic>

namespace chatvault::application {

/**
 * @class CancellationToken
 * @brief Flag polled by long running loops between units of work.
 *
 * requestStop() only touches a lock-free atomic and may be called from a signal handler.
 */
class CancellationToken {
public:
    void requestStop() { m_stop.store(true); }
    bool stopRequested() const { return m_stop.load(); }

private:
    std::atomic<bool> m_stop{false};
};

} // namespace chatvault::application
