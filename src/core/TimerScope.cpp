/**
 * chiralmon - Timer Scope Implementation
 */

#include "TimerScope.h"
#include "util/Log.h"
#include <exception>

namespace chiral {

TimerScope::TimerScope(boost::asio::io_context& io, std::string name)
    : m_io(io)
    , m_name(std::move(name))
{
}

TimerScope::~TimerScope() {
    close();
}

PollScheduler* TimerScope::addPoller(const std::string& name) {
    if (m_closed) {
        Log::warning(m_name + ": cannot add poller " + name + " to closed scope");
        return nullptr;
    }
    if (m_pollers.count(name)) {
        return nullptr;
    }

    auto poller = std::make_unique<PollScheduler>(m_io, m_name + "/" + name);
    PollScheduler* raw = poller.get();
    m_pollers.emplace(name, std::move(poller));
    return raw;
}

PollScheduler* TimerScope::poller(const std::string& name) const {
    auto it = m_pollers.find(name);
    return it != m_pollers.end() ? it->second.get() : nullptr;
}

bool TimerScope::schedule(const std::string& key, std::chrono::milliseconds delay,
                          std::function<void()> fn) {
    if (m_closed) {
        return false;
    }

    cancel(key);

    OneShot shot;
    shot.timer = std::make_unique<boost::asio::steady_timer>(m_io);
    shot.token = std::make_shared<int>(0);
    shot.timer->expires_after(delay);

    std::weak_ptr<int> token = shot.token;
    shot.timer->async_wait([this, key, token](const boost::system::error_code& ec) {
        if (ec || token.expired()) {
            return;
        }
        onFire(key);
    });

    m_timers.emplace(key, std::move(shot));
    m_actions[key] = std::move(fn);
    return true;
}

bool TimerScope::cancel(const std::string& key) {
    auto it = m_timers.find(key);
    if (it == m_timers.end()) {
        return false;
    }

    it->second.token.reset();
    it->second.timer->cancel();
    m_timers.erase(it);
    m_actions.erase(key);
    return true;
}

bool TimerScope::pending(const std::string& key) const {
    return m_timers.find(key) != m_timers.end();
}

void TimerScope::onFire(const std::string& key) {
    auto action = m_actions.find(key);
    std::function<void()> fn;
    if (action != m_actions.end()) {
        fn = std::move(action->second);
        m_actions.erase(action);
    }

    // Drop the reference before running so fn may reschedule the same key
    m_timers.erase(key);
    m_fired++;

    if (!fn) {
        return;
    }

    try {
        fn();
    } catch (const std::exception& e) {
        Log::error(m_name + ": timer " + key + " failed: " + std::string(e.what()));
    }
}

void TimerScope::close() {
    if (m_closed) {
        return;
    }
    m_closed = true;

    for (auto& entry : m_timers) {
        entry.second.token.reset();
        entry.second.timer->cancel();
    }
    m_timers.clear();
    m_actions.clear();

    for (auto& entry : m_pollers) {
        entry.second->stop();
    }

    Log::debug(m_name + ": timer scope closed");
}

}  // namespace chiral
