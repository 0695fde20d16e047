/**
 * chiralmon - CLI Argument Parsing
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chiral {

/**
 * CLI configuration
 */
struct MonitorConfig {
    // Node connection
    std::string rpcHost = "127.0.0.1";
    unsigned rpcPort = 8545;
    unsigned rpcTimeoutMs = 5000;
    unsigned probeIntervalMs = 5000;

    // Mining session
    std::string account;
    std::string dataDir = "bin/geth-data";
    unsigned intensity = 50;        // 1..100
    unsigned maxWorkers = 0;        // 0 = host concurrency
    unsigned workers = 0;           // 0 = derive from intensity
    bool startMining = false;

    // Polling
    unsigned pollIntervalMs = 2000;
    unsigned networkIntervalMs = 10000;
    unsigned statsIntervalMs = 10000;   // console summary, 0 = off

    // Ledger
    size_t ledgerCapacity = 50;
    uint64_t blockLookback = 100;
    size_t blockLimit = 50;
    double defaultReward = 2.0;
    uint64_t confirmationDepth = 12;
    size_t pageSize = 10;

    // Proxies
    std::vector<std::string> proxies;
    std::string proxyToken;
    unsigned proxyTimeoutMs = 15000;
    unsigned proxyRefreshMs = 30000;

    // API/Monitoring
    unsigned apiPort = 0;    // 0 = disabled

    // Logging
    std::string logLevel = "info";
    bool verbose = false;
    bool quiet = false;

    // Help
    bool showHelp = false;
    bool showVersion = false;
    bool invalid = false;
};

/**
 * MonitorCLI class
 *
 * Parses command line arguments and an optional INI config file. Command
 * line values win over the file.
 */
class MonitorCLI {
public:
    /**
     * Parse command line arguments
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed configuration (invalid set on error)
     */
    static MonitorConfig parse(int argc, const char* const argv[]);

    /**
     * Print help message
     */
    static void printHelp();

    /**
     * Print version
     */
    static void printVersion();

    /**
     * Split a comma separated list, dropping empty entries
     */
    static std::vector<std::string> splitList(const std::string& str);

    /**
     * Page sizes offered by the views
     */
    static bool isAllowedPageSize(size_t size);
};

}  // namespace chiral
