/**
 * chiralmon - Timer Scope
 *
 * Owns every timer a component starts so that teardown is a single call.
 */

#pragma once

#include "PollScheduler.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace chiral {

/**
 * TimerScope class
 *
 * Holds named pollers and keyed one-shot timers. close() runs exactly once
 * (the destructor calls it), cancels everything the scope started, and makes
 * later schedule()/addPoller() calls fail. A one-shot timer scheduled under a
 * key that is already pending replaces it; timers never stack per key.
 */
class TimerScope {
public:
    /**
     * Constructor
     *
     * @param io   Context the timers run on
     * @param name Owner label for log messages
     */
    TimerScope(boost::asio::io_context& io, std::string name);

    /**
     * Destructor (closes the scope)
     */
    ~TimerScope();

    // Non-copyable
    TimerScope(const TimerScope&) = delete;
    TimerScope& operator=(const TimerScope&) = delete;

    /**
     * Create a named poller owned by this scope
     *
     * @return Poller, or nullptr if the scope is closed or the name is taken
     */
    PollScheduler* addPoller(const std::string& name);

    /**
     * Look up a poller created with addPoller()
     */
    PollScheduler* poller(const std::string& name) const;

    /**
     * Schedule fn to run once after delay under key
     *
     * Any pending timer with the same key is cancelled first. The key stops
     * being pending before fn runs.
     *
     * @return false if the scope is closed
     */
    bool schedule(const std::string& key, std::chrono::milliseconds delay,
                  std::function<void()> fn);

    /**
     * Cancel the one-shot timer under key
     *
     * @return true if a timer was pending
     */
    bool cancel(const std::string& key);

    bool pending(const std::string& key) const;

    size_t pendingCount() const { return m_timers.size(); }

    /**
     * Number of one-shot timers that fired
     */
    uint64_t firedCount() const { return m_fired; }

    /**
     * Cancel everything and refuse further timers
     */
    void close();

    bool isClosed() const { return m_closed; }

private:
    struct OneShot {
        std::unique_ptr<boost::asio::steady_timer> timer;
        std::shared_ptr<int> token;
    };

    void onFire(const std::string& key);

private:
    boost::asio::io_context& m_io;
    std::string m_name;
    bool m_closed{false};
    uint64_t m_fired{0};

    std::map<std::string, OneShot> m_timers;
    std::map<std::string, std::function<void()>> m_actions;
    std::map<std::string, std::unique_ptr<PollScheduler>> m_pollers;
};

}  // namespace chiral
