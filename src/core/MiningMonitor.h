/**
 * chiralmon - Mining Session Monitor
 *
 * Owns the mining session timeline and reconciles the displayed hash rate
 * from backend polls.
 */

#pragma once

#include "BlockLedger.h"
#include "TimerScope.h"
#include "Types.h"
#include "backend/MiningBackend.h"
#include "util/MovingAverage.h"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace chiral {

/**
 * Monitor settings
 */
struct MonitorSettings {
    std::string dataDir = "bin/geth-data";
    unsigned maxWorkers = 0;          // 0 = host concurrency
    unsigned intensityPercent = 50;   // 1..100
    std::chrono::milliseconds pollInterval{2000};
    std::chrono::milliseconds networkInterval{10000};
    double basePerWorkerRate = 85000.0;  // H/s per worker for the simulated rate
    uint64_t blockLookback = 100;
    size_t blockLimit = 50;
    size_t historyLength = 60;
    unsigned failureStreak = 3;       // consecutive failed ticks before an error is logged
};

/**
 * Session start completion
 */
using StartHandler = std::function<void(const boost::system::error_code&)>;

/**
 * MiningMonitor class
 *
 * Session lifecycle Stopped -> Starting -> Running -> Stopped. Every tick
 * queries hash rate and height and reconciles in priority order:
 *   1. non-zero backend rate (authoritative)
 *   2. rate derived from performance counters (authoritative)
 *   3. simulated rate while a session runs (display only)
 *   4. previous value
 *
 * Responses that belong to an earlier session, or to a tick older than the
 * last applied one, are dropped. Backend failures keep previous values.
 */
class MiningMonitor {
public:
    /**
     * Constructor
     *
     * @param io       Context driving the pollers and backend handlers
     * @param backend  Mining engine collaborator
     * @param ledger   Ledger fed with backend block reports
     * @param settings Monitor settings
     */
    MiningMonitor(boost::asio::io_context& io, MiningBackend& backend, BlockLedger& ledger,
                  MonitorSettings settings = MonitorSettings());

    /**
     * Destructor (closes the monitor)
     */
    ~MiningMonitor();

    // Non-copyable
    MiningMonitor(const MiningMonitor&) = delete;
    MiningMonitor& operator=(const MiningMonitor&) = delete;

    /**
     * Start the stats and network pollers
     *
     * @return false if already open or closed
     */
    bool open();

    /**
     * Cancel every timer and drop in-flight responses (runs once)
     */
    void close();

    bool isOpen() const { return m_open; }

    /**
     * Start a mining session
     *
     * @param account     Reward account
     * @param workerCount Worker threads, 0 derives from intensity
     * @param handler     Completion (no_account, backend_unavailable,
     *                    session_active, or the backend error)
     */
    void start(const std::string& account, unsigned workerCount, StartHandler handler = nullptr);

    /**
     * Stop the session
     *
     * Local state is cleared immediately whether or not the backend
     * acknowledges the stop.
     */
    void stop();

    /**
     * Set the account used for block discovery without starting a session
     */
    void setAccount(const std::string& account) { m_account = account; }

    const std::string& account() const { return m_account; }

    /**
     * Set intensity (clamped to 1..100)
     *
     * While no session runs, activeWorkers follows the intensity.
     */
    void setIntensity(unsigned percent);

    /**
     * ceil(intensity / 100 * maxWorkers), at least 1
     */
    unsigned workersForIntensity() const;

    /**
     * Run one stats tick now
     */
    void poll();

    /**
     * Run one network-stats tick now
     */
    void pollNetwork();

    /**
     * Copy of the current session state
     */
    MiningSessionSnapshot snapshot() const;

    /**
     * Hash-rate history, oldest first
     */
    const std::deque<HistoryPoint>& history() const { return m_history; }

    SessionState state() const { return m_state; }

    uint64_t ticksApplied() const { return m_ticksApplied; }

    const MonitorSettings& settings() const { return m_settings; }

private:
    /**
     * Merge one tick result into session state in a single step
     */
    void applyTick(uint64_t tick, uint64_t generation, double backendRate, uint64_t height,
                   const std::optional<PerformanceCounters>& counters);

    /**
     * Rate derived from log counters, 0 if none
     */
    double counterRate(const PerformanceCounters& counters, SteadyClock::time_point now);

    /**
     * Display-only rate for backend warm-up
     */
    double simulatedRate(double elapsedSeconds) const;

    /**
     * Fetch recent blocks for the account and feed the ledger
     */
    void fetchBlocks();

    void recordFailure(const std::string& what, const boost::system::error_code& ec);
    void recordSuccess();

    void clearSession();

private:
    boost::asio::io_context& m_io;
    MiningBackend& m_backend;
    BlockLedger& m_ledger;
    MonitorSettings m_settings;
    TimerScope m_timers;

    // Expired by close(); handlers check it before touching state
    std::shared_ptr<int> m_alive;
    bool m_open{false};

    // Session
    SessionState m_state{SessionState::Stopped};
    std::string m_account;
    unsigned m_maxWorkers{1};
    unsigned m_intensity{50};
    unsigned m_activeWorkers{0};
    std::optional<SystemClock::time_point> m_sessionStartedAt;
    SteadyClock::time_point m_sessionStartSteady;
    uint64_t m_generation{0};

    // Reconciled values
    HashRate m_hashRate;
    uint64_t m_totalHashes{0};
    SteadyClock::time_point m_lastApplyAt;
    uint64_t m_blockHeight{0};
    NetworkStats m_network;
    std::optional<PerformanceCounters> m_lastCounters;
    SteadyClock::time_point m_lastCountersAt;

    // Tick ordering
    uint64_t m_tickSeq{0};
    uint64_t m_lastAppliedTick{0};
    uint64_t m_ticksApplied{0};

    // Windows
    std::deque<HistoryPoint> m_history;
    SimpleMovingAverage m_average;
    BlockRateWindow m_blockRate;

    // Failures
    unsigned m_consecutiveFailures{0};
    bool m_backendRunning{false};
};

}  // namespace chiral
