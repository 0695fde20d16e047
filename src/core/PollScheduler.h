/**
 * chiralmon - Poll Scheduler
 *
 * Fixed-interval ticker on a boost::asio::io_context.
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace chiral {

/**
 * PollScheduler class
 *
 * Fires a callback every interval, paced by the wall clock rather than by
 * callback completion: a callback that starts asynchronous work does not
 * delay the next tick, so callers must tolerate overlapping requests.
 *
 * - start() while running is a no-op
 * - stop() is idempotent and no callback runs after it returns, even one
 *   whose timer already expired and is queued on the io_context
 */
class PollScheduler {
public:
    using Callback = std::function<void()>;

    /**
     * Constructor
     *
     * @param io   Context the timer runs on
     * @param name Label used in log messages
     */
    PollScheduler(boost::asio::io_context& io, std::string name);

    /**
     * Destructor (stops the scheduler)
     */
    ~PollScheduler();

    // Non-copyable
    PollScheduler(const PollScheduler&) = delete;
    PollScheduler& operator=(const PollScheduler&) = delete;

    /**
     * Start firing callback every interval
     *
     * The first tick happens one interval after start.
     *
     * @return false if already running or interval is not positive
     */
    bool start(std::chrono::milliseconds interval, Callback callback);

    /**
     * Stop firing
     */
    void stop();

    bool isRunning() const { return static_cast<bool>(m_token); }

    /**
     * Number of callbacks fired since construction
     */
    uint64_t tickCount() const { return m_ticks; }

    std::chrono::milliseconds interval() const { return m_interval; }

    const std::string& name() const { return m_name; }

private:
    /**
     * Wait for the current expiry
     */
    void arm();

    /**
     * Timer expired for the active run
     */
    void onTick();

private:
    boost::asio::steady_timer m_timer;
    std::string m_name;
    Callback m_callback;
    std::chrono::milliseconds m_interval{0};

    // Identifies the active run; handlers of earlier runs see it expired
    std::shared_ptr<int> m_token;

    uint64_t m_ticks{0};
};

}  // namespace chiral
