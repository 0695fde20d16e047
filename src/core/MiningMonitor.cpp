/**
 * chiralmon - Mining Session Monitor Implementation
 */

#include "MiningMonitor.h"
#include "Errors.h"
#include "util/Units.h"
#include "util/Log.h"
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <thread>

namespace chiral {

MiningMonitor::MiningMonitor(boost::asio::io_context& io, MiningBackend& backend,
                             BlockLedger& ledger, MonitorSettings settings)
    : m_io(io)
    , m_backend(backend)
    , m_ledger(ledger)
    , m_settings(std::move(settings))
    , m_timers(io, "mining")
    , m_alive(std::make_shared<int>(0))
    , m_average(m_settings.historyLength == 0 ? 1 : m_settings.historyLength)
{
    m_maxWorkers = m_settings.maxWorkers;
    if (m_maxWorkers == 0) {
        m_maxWorkers = std::max(1u, std::thread::hardware_concurrency());
    }
    m_intensity = std::clamp(m_settings.intensityPercent, 1u, 100u);
    m_activeWorkers = workersForIntensity();
    m_lastApplyAt = SteadyClock::now();
}

MiningMonitor::~MiningMonitor() {
    close();
}

bool MiningMonitor::open() {
    if (m_open || m_timers.isClosed()) {
        return false;
    }

    PollScheduler* stats = m_timers.addPoller("stats");
    PollScheduler* network = m_timers.addPoller("network");
    if (!stats || !network) {
        return false;
    }

    stats->start(m_settings.pollInterval, [this]() { poll(); });
    network->start(m_settings.networkInterval, [this]() { pollNetwork(); });
    m_open = true;

    // First refresh without waiting a full interval
    std::weak_ptr<int> alive = m_alive;
    boost::asio::post(m_io, [this, alive]() {
        if (alive.expired()) return;
        pollNetwork();
        poll();
    });

    Log::info("Mining monitor polling every " +
              std::to_string(m_settings.pollInterval.count()) + " ms");
    return true;
}

void MiningMonitor::close() {
    if (!m_alive) {
        return;
    }

    m_alive.reset();
    m_timers.close();
    m_open = false;
    Log::debug("Mining monitor closed");
}

void MiningMonitor::start(const std::string& account, unsigned workerCount, StartHandler handler) {
    auto reject = [&handler](errc e, const std::string& why) {
        Log::warning("Cannot start mining: " + why);
        if (handler) {
            handler(make_error_code(e));
        }
    };

    if (!m_alive) {
        reject(errc::scope_closed, "monitor closed");
        return;
    }
    if (m_state != SessionState::Stopped) {
        reject(errc::session_active, "session already " + std::string(toString(m_state)));
        return;
    }
    if (account.empty()) {
        reject(errc::no_account, "no account configured");
        return;
    }
    if (!m_backend.isBackendRunning()) {
        reject(errc::backend_unavailable, "mining engine is not running");
        return;
    }

    unsigned workers = workerCount == 0
        ? workersForIntensity()
        : std::clamp(workerCount, 1u, m_maxWorkers);

    m_state = SessionState::Starting;
    m_account = account;
    m_totalHashes = 0;
    uint64_t generation = ++m_generation;

    Log::info("Starting mining for " + account + " with " + std::to_string(workers) + " worker(s)...");

    std::weak_ptr<int> alive = m_alive;
    m_backend.startMining(account, workers,
        [this, alive, generation, workers, handler](const boost::system::error_code& ec) {
            if (alive.expired()) {
                return;
            }

            if (generation != m_generation || m_state != SessionState::Starting) {
                // stop() arrived before the acknowledgement
                if (handler) {
                    handler(boost::asio::error::operation_aborted);
                }
                return;
            }

            if (ec) {
                m_state = SessionState::Stopped;
                Log::error("Failed to start mining: " + ec.message());
                if (handler) {
                    handler(ec);
                }
                return;
            }

            auto now = SteadyClock::now();
            m_state = SessionState::Running;
            m_sessionStartedAt = SystemClock::now();
            m_sessionStartSteady = now;
            m_activeWorkers = workers;
            m_totalHashes = 0;
            m_lastApplyAt = now;
            m_lastCounters.reset();
            m_history.clear();
            m_average.reset();

            Log::info("Mining started (" + std::to_string(workers) + " worker(s))");
            if (handler) {
                handler(boost::system::error_code());
            }
        });
}

void MiningMonitor::stop() {
    if (m_state == SessionState::Stopped) {
        return;
    }

    std::ostringstream ss;
    ss << "Stopping mining (session total ~" << m_totalHashes << " hashes)";
    Log::info(ss.str());

    // Invalidates in-flight responses of the session being stopped
    ++m_generation;
    clearSession();

    m_backend.stopMining([](const boost::system::error_code& ec) {
        if (ec) {
            Log::warning("Backend did not acknowledge stop: " + ec.message());
        }
    });
}

void MiningMonitor::clearSession() {
    m_state = SessionState::Stopped;
    m_hashRate = HashRate();
    m_activeWorkers = 0;
    m_sessionStartedAt.reset();
    m_lastCounters.reset();
    m_history.clear();
    m_average.reset();
    m_blockRate.reset();
}

void MiningMonitor::setIntensity(unsigned percent) {
    m_intensity = std::clamp(percent, 1u, 100u);
    if (m_state == SessionState::Stopped) {
        m_activeWorkers = workersForIntensity();
    }
}

unsigned MiningMonitor::workersForIntensity() const {
    double workers = std::ceil(static_cast<double>(m_intensity) / 100.0 * m_maxWorkers);
    return std::max(1u, static_cast<unsigned>(workers));
}

void MiningMonitor::poll() {
    if (!m_alive) {
        return;
    }

    m_backendRunning = m_backend.isBackendRunning();
    if (!m_backendRunning) {
        Log::debug("Mining engine not running, skipping engine queries");
        return;
    }

    uint64_t tick = ++m_tickSeq;
    uint64_t generation = m_generation;
    std::weak_ptr<int> alive = m_alive;

    m_backend.getHashRate([this, alive, tick, generation](const boost::system::error_code& ec,
                                                          const std::string& text) {
        if (alive.expired()) return;
        if (ec) {
            recordFailure("hash rate", ec);
            return;
        }

        double backendRate = parseRate(text);

        m_backend.getBlockHeight([this, alive, tick, generation, backendRate](
                                     const boost::system::error_code& ec, uint64_t height) {
            if (alive.expired()) return;
            if (ec) {
                recordFailure("block height", ec);
                return;
            }

            bool needCounters = backendRate <= 0 && m_state == SessionState::Running &&
                                generation == m_generation;
            if (!needCounters) {
                applyTick(tick, generation, backendRate, height, std::nullopt);
                fetchBlocks();
                return;
            }

            m_backend.getPerformanceCounters(m_settings.dataDir,
                [this, alive, tick, generation, backendRate, height](
                    const boost::system::error_code& ec, const PerformanceCounters& counters) {
                    if (alive.expired()) return;
                    if (ec) {
                        Log::debug("Performance counters unavailable: " + ec.message());
                        applyTick(tick, generation, backendRate, height, std::nullopt);
                    } else {
                        applyTick(tick, generation, backendRate, height, counters);
                    }
                    fetchBlocks();
                });
        });
    });
}

void MiningMonitor::applyTick(uint64_t tick, uint64_t generation, double backendRate,
                              uint64_t height, const std::optional<PerformanceCounters>& counters) {
    if (generation != m_generation) {
        Log::debug("Dropping tick " + std::to_string(tick) + " from a previous session");
        return;
    }
    if (tick < m_lastAppliedTick) {
        Log::debug("Dropping tick " + std::to_string(tick) + " older than applied tick " +
                   std::to_string(m_lastAppliedTick));
        return;
    }

    m_lastAppliedTick = tick;
    m_ticksApplied++;
    recordSuccess();

    auto now = SteadyClock::now();
    bool running = m_state == SessionState::Running;

    m_blockHeight = height;
    m_blockRate.add(height, now);

    std::optional<HashRate> next;
    if (backendRate > 0) {
        next = HashRate::fromRate(backendRate, HashRateSource::Authoritative);
    } else if (counters) {
        double rate = counterRate(*counters, now);
        if (rate > 0) {
            next = HashRate::fromRate(rate, HashRateSource::Authoritative);
        }
    }

    if (!next && running && m_activeWorkers >= 1) {
        double elapsed = std::chrono::duration<double>(now - m_sessionStartSteady).count();
        next = HashRate::fromRate(simulatedRate(elapsed), HashRateSource::Simulated);
    }

    if (next) {
        m_hashRate = *next;
    }

    if (running) {
        double seconds = std::chrono::duration<double>(now - m_lastApplyAt).count();
        if (seconds > 0) {
            m_totalHashes += static_cast<uint64_t>(m_hashRate.rate() * seconds);
        }
        m_lastApplyAt = now;

        m_history.push_back({SystemClock::now(), m_hashRate.rate(), m_hashRate.source});
        while (m_history.size() > m_settings.historyLength) {
            m_history.pop_front();
        }
        m_average.add(m_hashRate.rate());
    }
}

double MiningMonitor::counterRate(const PerformanceCounters& counters, SteadyClock::time_point now) {
    double rate = 0;

    // Estimated log rates never count as authoritative
    if (counters.rateFromLogs > 0 && !counters.estimated) {
        rate = counters.rateFromLogs;
    } else if (m_lastCounters && counters.blocksFound > m_lastCounters->blocksFound &&
               m_network.difficulty > 0) {
        double seconds = std::chrono::duration<double>(now - m_lastCountersAt).count();
        if (seconds > 0) {
            uint64_t found = counters.blocksFound - m_lastCounters->blocksFound;
            rate = static_cast<double>(found) * static_cast<double>(m_network.difficulty) / seconds;
        }
    }

    m_lastCounters = counters;
    m_lastCountersAt = now;
    return rate;
}

double MiningMonitor::simulatedRate(double elapsedSeconds) const {
    double oscillation = 0.05 * std::sin(elapsedSeconds / 7.0);
    return m_activeWorkers * m_settings.basePerWorkerRate * (1.0 + oscillation);
}

void MiningMonitor::fetchBlocks() {
    if (m_account.empty() || !m_alive) {
        return;
    }

    std::weak_ptr<int> alive = m_alive;
    m_backend.getRecentMinedBlocks(m_account, m_settings.blockLookback, m_settings.blockLimit,
        [this, alive](const boost::system::error_code& ec, const std::vector<BlockReport>& blocks) {
            if (alive.expired()) return;
            if (ec) {
                Log::warning("Recent block query failed: " + ec.message());
                return;
            }

            auto credited = m_ledger.ingest(blocks);
            if (!credited.empty()) {
                Log::info(std::to_string(credited.size()) + " new block(s) credited, total " +
                          std::to_string(m_ledger.blocksFound()));
            }
            m_ledger.confirmMatured(m_blockHeight);
        });
}

void MiningMonitor::pollNetwork() {
    if (!m_alive || !m_backend.isBackendRunning()) {
        return;
    }

    std::weak_ptr<int> alive = m_alive;
    m_backend.getNetworkStats([this, alive](const boost::system::error_code& ec,
                                            const NetworkStats& stats) {
        if (alive.expired()) return;
        if (ec) {
            Log::warning("Network stats query failed: " + ec.message());
            return;
        }
        m_network = stats;
    });
}

void MiningMonitor::recordFailure(const std::string& what, const boost::system::error_code& ec) {
    m_consecutiveFailures++;
    Log::warning("Poll failed (" + what + "): " + ec.message() + ", keeping previous values");

    if (m_consecutiveFailures == m_settings.failureStreak) {
        Log::error("Mining backend failing for " + std::to_string(m_consecutiveFailures) +
                   " consecutive polls");
    }
}

void MiningMonitor::recordSuccess() {
    if (m_consecutiveFailures >= m_settings.failureStreak) {
        Log::info("Mining backend polling recovered");
    }
    m_consecutiveFailures = 0;
}

MiningSessionSnapshot MiningMonitor::snapshot() const {
    MiningSessionSnapshot s;
    s.state = m_state;
    s.isActive = m_state == SessionState::Running;
    s.sessionStartedAt = m_sessionStartedAt;
    s.activeWorkers = m_activeWorkers;
    s.maxWorkers = m_maxWorkers;
    s.intensityPercent = m_intensity;
    s.hashRate = m_hashRate;
    s.averageRate = m_average.get();
    s.totalHashesEstimate = m_totalHashes;
    s.blockHeight = m_blockHeight;
    s.blocksPerMinute = m_blockRate.blocksPerMinute();
    s.network = m_network;
    s.backendRunning = m_backendRunning;
    s.consecutiveFailures = m_consecutiveFailures;
    return s;
}

}  // namespace chiral
