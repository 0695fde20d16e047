/**
 * chiralmon - Mining Backend Interface
 *
 * Abstract request/response interface to the mining engine and chain node.
 * Every call completes through a handler invoked on the io_context that
 * drives the monitor; implementations never call handlers from another
 * thread.
 */

#pragma once

#include "core/Types.h"
#include <boost/system/error_code.hpp>
#include <functional>
#include <string>
#include <vector>

namespace chiral {

using CommandHandler = std::function<void(const boost::system::error_code&)>;
using HashRateHandler = std::function<void(const boost::system::error_code&, const std::string&)>;
using HeightHandler = std::function<void(const boost::system::error_code&, uint64_t)>;
using CountersHandler = std::function<void(const boost::system::error_code&, const PerformanceCounters&)>;
using BlocksHandler = std::function<void(const boost::system::error_code&, const std::vector<BlockReport>&)>;
using NetworkHandler = std::function<void(const boost::system::error_code&, const NetworkStats&)>;

/**
 * MiningBackend class
 */
class MiningBackend {
public:
    virtual ~MiningBackend() = default;

    /**
     * Whether the engine is currently reachable
     */
    virtual bool isBackendRunning() const = 0;

    /**
     * Start mining for account with workerCount threads
     */
    virtual void startMining(const std::string& account, unsigned workerCount,
                             CommandHandler handler) = 0;

    virtual void stopMining(CommandHandler handler) = 0;

    /**
     * Current engine hash rate as display text ("1.50 MH/s")
     */
    virtual void getHashRate(HashRateHandler handler) = 0;

    virtual void getBlockHeight(HeightHandler handler) = 0;

    /**
     * Counters derived from engine logs under dataDir
     */
    virtual void getPerformanceCounters(const std::string& dataDir, CountersHandler handler) = 0;

    /**
     * Blocks mined by account within the last lookbackBlocks, newest first
     */
    virtual void getRecentMinedBlocks(const std::string& account, uint64_t lookbackBlocks,
                                      size_t limit, BlocksHandler handler) = 0;

    virtual void getNetworkStats(NetworkHandler handler) = 0;
};

}  // namespace chiral
