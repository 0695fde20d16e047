/**
 * chiralmon - Geth JSON-RPC Mining Backend
 */

#pragma once

#include "JsonRpcClient.h"
#include "MiningBackend.h"
#include "core/TimerScope.h"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace chiral {

/**
 * Backend settings
 */
struct GethSettings {
    RpcEndpoint rpc;
    std::chrono::milliseconds probeInterval{5000};
    double blockTimeSeconds = 15.0;   // for network hash rate from difficulty
};

/**
 * GethRpcBackend class
 *
 * MiningBackend over a geth node's HTTP JSON-RPC endpoint. Reachability
 * comes from a periodic net_version probe, so isBackendRunning() reflects
 * the last probe result.
 */
class GethRpcBackend : public MiningBackend {
public:
    GethRpcBackend(boost::asio::io_context& io, GethSettings settings = GethSettings());
    ~GethRpcBackend() override;

    // Non-copyable
    GethRpcBackend(const GethRpcBackend&) = delete;
    GethRpcBackend& operator=(const GethRpcBackend&) = delete;

    /**
     * Start the liveness probe (first probe runs immediately)
     */
    void open();

    /**
     * Stop probing and abort in-flight requests
     */
    void close();

    bool isBackendRunning() const override { return m_reachable; }

    void startMining(const std::string& account, unsigned workerCount,
                     CommandHandler handler) override;
    void stopMining(CommandHandler handler) override;
    void getHashRate(HashRateHandler handler) override;
    void getBlockHeight(HeightHandler handler) override;
    void getPerformanceCounters(const std::string& dataDir, CountersHandler handler) override;
    void getRecentMinedBlocks(const std::string& account, uint64_t lookbackBlocks,
                              size_t limit, BlocksHandler handler) override;
    void getNetworkStats(NetworkHandler handler) override;

    /**
     * Run one liveness probe now
     */
    void probe();

    JsonRpcClient& rpc() { return m_rpc; }

private:
    void scanBlocks(const std::string& account, uint64_t head, uint64_t lookbackBlocks,
                    size_t limit, BlocksHandler handler);

    static std::optional<BlockReport> toReport(const json& block);

private:
    boost::asio::io_context& m_io;
    GethSettings m_settings;
    JsonRpcClient m_rpc;
    TimerScope m_timers;
    std::shared_ptr<int> m_alive;

    bool m_reachable{false};
    std::string m_networkId;
};

}  // namespace chiral
