/**
 * chiralmon - Core Types
 */

#pragma once

#include "util/Units.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chiral {

using SystemClock = std::chrono::system_clock;
using SteadyClock = std::chrono::steady_clock;

// ---------------------------------------------------------------------------
// Mining session
// ---------------------------------------------------------------------------

/**
 * Where a hash rate value came from
 *
 * Simulated values only keep the display alive during backend warm-up and
 * are never used for anything balance-affecting.
 */
enum class HashRateSource {
    Authoritative,
    Simulated
};

inline const char* toString(HashRateSource source) {
    return source == HashRateSource::Authoritative ? "authoritative" : "simulated";
}

/**
 * Hash rate as mantissa + unit
 */
struct HashRate {
    double value{0};
    RateUnit unit{RateUnit::H};
    HashRateSource source{HashRateSource::Authoritative};

    // Rate in H/s
    double rate() const { return value * rateUnitScale(unit); }

    bool isZero() const { return value <= 0; }

    static HashRate fromRate(double rate, HashRateSource source) {
        HashRate hr;
        if (rate > 0) {
            hr.unit = rateUnitOf(rate);
            hr.value = rate / rateUnitScale(hr.unit);
        }
        hr.source = source;
        return hr;
    }
};

/**
 * One point of hash-rate history
 */
struct HistoryPoint {
    SystemClock::time_point at;
    double rate{0};
    HashRateSource source{HashRateSource::Authoritative};
};

/**
 * Session state machine
 */
enum class SessionState {
    Stopped,
    Starting,
    Running
};

inline const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Stopped:  return "stopped";
        case SessionState::Starting: return "starting";
        case SessionState::Running:  return "running";
        default:                     return "unknown";
    }
}

/**
 * Network-wide statistics reported by the node
 */
struct NetworkStats {
    uint64_t difficulty{0};
    double networkHashRate{0};
};

/**
 * Counters derived from the engine's own logs
 */
struct PerformanceCounters {
    uint64_t blocksFound{0};
    double rateFromLogs{0};
    bool estimated{false};  // rate is a per-thread guess, not a measurement
};

/**
 * Copyable view of the mining session
 */
struct MiningSessionSnapshot {
    SessionState state{SessionState::Stopped};
    bool isActive{false};
    std::optional<SystemClock::time_point> sessionStartedAt;
    unsigned activeWorkers{0};
    unsigned maxWorkers{1};
    unsigned intensityPercent{50};
    HashRate hashRate;
    double averageRate{0};
    uint64_t totalHashesEstimate{0};
    uint64_t blockHeight{0};
    double blocksPerMinute{0};
    NetworkStats network;
    bool backendRunning{false};
    unsigned consecutiveFailures{0};

    double elapsedSeconds(SystemClock::time_point now = SystemClock::now()) const {
        if (!sessionStartedAt) return 0;
        return std::chrono::duration<double>(now - *sessionStartedAt).count();
    }
};

// ---------------------------------------------------------------------------
// Block ledger
// ---------------------------------------------------------------------------

/**
 * Mined block as reported by the backend
 */
struct BlockReport {
    std::string hash;
    std::optional<uint64_t> nonce;
    std::optional<uint64_t> difficulty;
    uint64_t timestamp{0};     // unix seconds
    uint64_t number{0};
    std::optional<double> reward;
};

/**
 * Ledger entry, immutable once created
 */
struct MinedBlockRecord {
    std::string hash;
    uint64_t blockNumber{0};
    uint64_t nonce{0};
    uint64_t difficulty{0};
    double reward{0};
    uint64_t discoveredAt{0};  // unix seconds
};

/**
 * Two-phase credit state
 */
enum class TransactionStatus {
    Pending,
    Completed
};

inline const char* toString(TransactionStatus status) {
    return status == TransactionStatus::Pending ? "pending" : "completed";
}

/**
 * Wallet credit produced by a newly mined block
 */
struct LedgerTransaction {
    uint64_t id{0};
    std::string blockHash;
    uint64_t blockNumber{0};
    double amount{0};
    TransactionStatus status{TransactionStatus::Pending};
    SystemClock::time_point createdAt;
    std::optional<SystemClock::time_point> confirmedAt;
};

// ---------------------------------------------------------------------------
// Proxy nodes
// ---------------------------------------------------------------------------

/**
 * Proxy node status, declared in display priority order
 */
enum class ProxyStatus {
    Online,
    Connecting,
    Offline,
    Timeout,
    Error
};

inline const char* toString(ProxyStatus status) {
    switch (status) {
        case ProxyStatus::Online:     return "online";
        case ProxyStatus::Connecting: return "connecting";
        case ProxyStatus::Offline:    return "offline";
        case ProxyStatus::Timeout:    return "timeout";
        case ProxyStatus::Error:      return "error";
        default:                      return "error";
    }
}

inline std::optional<ProxyStatus> parseProxyStatus(const std::string& str) {
    if (str == "online") return ProxyStatus::Online;
    if (str == "connecting") return ProxyStatus::Connecting;
    if (str == "offline") return ProxyStatus::Offline;
    if (str == "timeout") return ProxyStatus::Timeout;
    if (str == "error") return ProxyStatus::Error;
    return std::nullopt;
}

// Lower sorts first
inline int statusPriority(ProxyStatus status) {
    return static_cast<int>(status);
}

/**
 * Proxy node as held by the connection manager
 */
struct ProxyNode {
    std::string id;
    std::optional<std::string> address;  // empty only for non-addressable peers
    ProxyStatus status{ProxyStatus::Connecting};
    std::optional<double> latencyMs;
    std::string region{"unknown"};
    std::string error;
    SteadyClock::time_point lastChange;

    // Map key: the address when known, otherwise the peer id
    const std::string& key() const { return address ? *address : id; }
};

/**
 * Authoritative status update from the transport
 */
struct ProxyStatusEvent {
    std::string id;
    std::optional<std::string> address;
    ProxyStatus status{ProxyStatus::Offline};
    std::optional<double> latencyMs;
    std::optional<std::string> region;
    std::string error;
};

}  // namespace chiral
