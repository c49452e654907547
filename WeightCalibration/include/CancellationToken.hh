#ifndef CANCELLATION_TOKEN_HH
#define CANCELLATION_TOKEN_HH

/**
 * @file CancellationToken.hh
 * @brief Cooperative cancellation for long optimizer runs
 *
 * The optimizer polls the token once per outer iteration (one
 * coordinate descent round, or one factor of a grid sweep). A token
 * fires when cancel() was called or when its deadline has passed.
 * cancel() may be called from another thread.
 */

#include <atomic>
#include <chrono>

namespace WeightCalibration {

class CancellationToken {
public:
    typedef std::chrono::steady_clock Clock;

    CancellationToken() : m_cancelled(false), m_hasDeadline(false) {}

    /**
     * @brief Token that fires once the given time budget is used up
     */
    explicit CancellationToken(std::chrono::milliseconds budget)
        : m_cancelled(false)
        , m_hasDeadline(true)
        , m_deadline(Clock::now() + budget)
    {}

    void cancel() { m_cancelled.store(true); }

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    bool isCancelled() const {
        if (m_cancelled.load()) return true;
        return m_hasDeadline && Clock::now() >= m_deadline;
    }

private:
    std::atomic<bool> m_cancelled;
    bool m_hasDeadline;
    Clock::time_point m_deadline;
};

} // namespace WeightCalibration

#endif // CANCELLATION_TOKEN_HH
