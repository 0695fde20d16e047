/**
 * chiralmon - Poll Scheduler Implementation
 */

#include "PollScheduler.h"
#include "util/Log.h"
#include <exception>

namespace chiral {

PollScheduler::PollScheduler(boost::asio::io_context& io, std::string name)
    : m_timer(io)
    , m_name(std::move(name))
{
}

PollScheduler::~PollScheduler() {
    stop();
}

bool PollScheduler::start(std::chrono::milliseconds interval, Callback callback) {
    if (m_token) {
        Log::debug("Poller " + m_name + " already running, start ignored");
        return false;
    }

    if (interval.count() <= 0 || !callback) {
        Log::warning("Poller " + m_name + " needs a positive interval and a callback");
        return false;
    }

    m_interval = interval;
    m_callback = std::move(callback);
    m_token = std::make_shared<int>(0);

    m_timer.expires_after(m_interval);
    arm();

    Log::debug("Poller " + m_name + " started (" + std::to_string(m_interval.count()) + " ms)");
    return true;
}

void PollScheduler::stop() {
    if (!m_token) {
        return;
    }

    // Expiring the token makes an already-queued handler a no-op
    m_token.reset();
    m_timer.cancel();
    m_callback = nullptr;

    Log::debug("Poller " + m_name + " stopped");
}

void PollScheduler::arm() {
    std::weak_ptr<int> token = m_token;
    m_timer.async_wait([this, token](const boost::system::error_code& ec) {
        if (ec || token.expired()) {
            return;
        }
        onTick();
    });
}

void PollScheduler::onTick() {
    m_ticks++;

    // Re-arm first so the period does not drift with callback duration
    auto next = m_timer.expiry() + m_interval;
    auto now = boost::asio::steady_timer::clock_type::now();
    if (next <= now) {
        // Fell behind (blocked loop); skip missed ticks rather than bursting
        next = now + m_interval;
    }
    m_timer.expires_at(next);
    arm();

    // Copy: the callback may stop or restart this scheduler
    Callback callback = m_callback;
    try {
        callback();
    } catch (const std::exception& e) {
        Log::error("Poller " + m_name + " callback failed: " + std::string(e.what()));
    }
}

}  // namespace chiral
