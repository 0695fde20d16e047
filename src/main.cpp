/**
 * chiralmon - Main Entry Point
 *
 * Mining session, block ledger and proxy monitor for a geth node
 */

#include "MonitorCLI.h"
#include "Version.h"
#include "api/ApiServer.h"
#include "backend/GethRpcBackend.h"
#include "core/BlockLedger.h"
#include "core/MiningMonitor.h"
#include "core/TimerScope.h"
#include "proxy/ProxyManager.h"
#include "proxy/TcpProxyTransport.h"
#include "util/Log.h"
#include "util/Units.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

using namespace chiral;

namespace {

void printSummary(const MiningMonitor& monitor, const BlockLedger& ledger, const ProxyManager& proxies) {
    auto s = monitor.snapshot();

    std::ostringstream ss;
    ss << toString(s.state);
    if (s.isActive) {
        ss << " " << formatRate(s.hashRate.rate());
        if (s.hashRate.source == HashRateSource::Simulated) {
            ss << " (est.)";
        }
        ss << " avg " << formatRate(s.averageRate)
           << " | workers " << s.activeWorkers << "/" << s.maxWorkers;
    }
    ss << " | height " << s.blockHeight
       << " | blocks " << ledger.blocksFound()
       << " | credited " << std::fixed << std::setprecision(2) << ledger.totalCredited();

    if (proxies.size() > 0) {
        ss << " | proxies " << proxies.countByStatus(ProxyStatus::Online) << "/" << proxies.size();
    }
    if (!s.backendRunning) {
        ss << " | node offline";
    }

    Log::info(ss.str());
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse command line
    MonitorConfig config = MonitorCLI::parse(argc, argv);

    if (config.invalid) {
        MonitorCLI::printHelp();
        return 1;
    }

    // Handle help/version
    if (config.showHelp) {
        MonitorCLI::printHelp();
        return 0;
    }

    if (config.showVersion) {
        MonitorCLI::printVersion();
        return 0;
    }

    // Configure logging
    Log::setLevel(parseLogLevel(config.logLevel));
    if (config.verbose) {
        Log::setLevel(LogLevel::Debug);
    } else if (config.quiet) {
        Log::setLevel(LogLevel::Error);
    }

    Log::setShowTimestamp(true);

    if (config.startMining && config.account.empty()) {
        Log::error("Account required to start mining. Use -a 0x...");
        return 1;
    }

    boost::asio::io_context io;

    // Node backend
    GethSettings gethSettings;
    gethSettings.rpc.host = config.rpcHost;
    gethSettings.rpc.port = config.rpcPort;
    gethSettings.rpc.timeout = std::chrono::milliseconds(config.rpcTimeoutMs);
    gethSettings.probeInterval = std::chrono::milliseconds(config.probeIntervalMs);
    GethRpcBackend backend(io, gethSettings);

    // Ledger
    LedgerSettings ledgerSettings;
    ledgerSettings.capacity = config.ledgerCapacity;
    ledgerSettings.defaultReward = config.defaultReward;
    ledgerSettings.pageSize = config.pageSize;
    ledgerSettings.confirmationDepth = config.confirmationDepth;
    BlockLedger ledger(ledgerSettings);

    // Mining monitor
    MonitorSettings monitorSettings;
    monitorSettings.dataDir = config.dataDir;
    monitorSettings.maxWorkers = config.maxWorkers;
    monitorSettings.intensityPercent = config.intensity;
    monitorSettings.pollInterval = std::chrono::milliseconds(config.pollIntervalMs);
    monitorSettings.networkInterval = std::chrono::milliseconds(config.networkIntervalMs);
    monitorSettings.blockLookback = config.blockLookback;
    monitorSettings.blockLimit = config.blockLimit;
    MiningMonitor monitor(io, backend, ledger, monitorSettings);
    monitor.setAccount(config.account);

    // Proxies
    TcpProxyTransport transport(io);
    ProxySettings proxySettings;
    proxySettings.connectTimeout = std::chrono::milliseconds(config.proxyTimeoutMs);
    proxySettings.refreshInterval = std::chrono::milliseconds(config.proxyRefreshMs);
    proxySettings.pageSize = config.pageSize;
    ProxyManager proxies(io, transport, proxySettings);

    Log::info("Starting " + getVersionString() + "...");

    backend.open();
    monitor.open();
    proxies.open();

    for (const auto& address : config.proxies) {
        auto ec = proxies.addOrConnect(address, config.proxyToken);
        if (ec) {
            Log::warning("Skipping proxy " + address + ": " + ec.message());
        }
    }

    // Start API server if configured
    std::unique_ptr<ApiServer> apiServer;
    if (config.apiPort > 0) {
        apiServer = std::make_unique<ApiServer>(io, config.apiPort, monitor, ledger, &proxies);
        if (!apiServer->start()) {
            Log::warning("Failed to start API server, continuing without it");
            apiServer.reset();
        }
    }

    TimerScope timers(io, "main");

    // Start once the node answers its first probe
    if (config.startMining) {
        PollScheduler* autostart = timers.addPoller("autostart");
        if (autostart) {
            autostart->start(std::chrono::seconds(1), [&, autostart]() {
                if (!backend.isBackendRunning() || monitor.state() != SessionState::Stopped) {
                    return;
                }
                autostart->stop();
                monitor.start(config.account, config.workers, [](const boost::system::error_code& ec) {
                    if (ec) {
                        Log::error("Mining did not start: " + ec.message());
                    }
                });
            });
        }
    }

    // Print stats periodically
    if (config.statsIntervalMs > 0) {
        if (PollScheduler* stats = timers.addPoller("stats")) {
            stats->start(std::chrono::milliseconds(config.statsIntervalMs), [&]() {
                printSummary(monitor, ledger, proxies);
            });
        }
    }

    // Graceful shutdown
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) {
            return;
        }
        Log::info("Shutdown requested...");

        if (apiServer) {
            apiServer->stop();
        }
        timers.close();
        proxies.close();
        transport.shutdown();

        bool wasMining = monitor.state() != SessionState::Stopped;
        monitor.close();

        if (!wasMining) {
            backend.close();
            return;
        }

        // Leave the node idle; the loop ends once the stop completes
        backend.stopMining([&backend](const boost::system::error_code& ec) {
            if (ec) {
                Log::warning("Node did not confirm mining stop: " + ec.message());
            } else {
                Log::info("Mining stopped");
            }
            backend.close();
        });
    });

    io.run();

    Log::info("Shutdown complete");
    return 0;
}
