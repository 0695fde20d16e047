/**
 * chiralmon - Geth JSON-RPC Mining Backend Implementation
 */

#include "GethRpcBackend.h"
#include "GethLogScanner.h"
#include "core/Errors.h"
#include "util/Log.h"
#include "util/Units.h"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <cctype>

namespace chiral {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

GethRpcBackend::GethRpcBackend(boost::asio::io_context& io, GethSettings settings)
    : m_io(io)
    , m_settings(std::move(settings))
    , m_rpc(io, m_settings.rpc)
    , m_timers(io, "geth")
    , m_alive(std::make_shared<int>(0))
{
}

GethRpcBackend::~GethRpcBackend() {
    close();
}

void GethRpcBackend::open() {
    PollScheduler* poller = m_timers.addPoller("probe");
    if (!poller) {
        return;
    }
    poller->start(m_settings.probeInterval, [this]() { probe(); });
    probe();
}

void GethRpcBackend::close() {
    if (!m_alive) {
        return;
    }
    m_alive.reset();
    m_timers.close();
    m_rpc.cancelAll();
}

void GethRpcBackend::probe() {
    std::weak_ptr<int> alive = m_alive;
    m_rpc.call("net_version", json::array(), [this, alive](const boost::system::error_code& ec,
                                                           const json& result) {
        if (alive.expired()) return;

        bool reachable = !ec;
        if (reachable && result.is_string()) {
            m_networkId = result.get<std::string>();
        }

        if (reachable && !m_reachable) {
            Log::info("Node reachable at " + m_settings.rpc.host + ":" +
                      std::to_string(m_settings.rpc.port) + " (network " + m_networkId + ")");
        } else if (!reachable && m_reachable) {
            Log::warning("Node unreachable: " + ec.message());
        }
        m_reachable = reachable;
    });
}

void GethRpcBackend::startMining(const std::string& account, unsigned workerCount,
                                 CommandHandler handler) {
    std::weak_ptr<int> alive = m_alive;
    m_rpc.call("miner_setEtherbase", json::array({account}),
        [this, alive, workerCount, handler](const boost::system::error_code& ec, const json&) {
            if (alive.expired()) return;
            if (ec) {
                Log::warning("miner_setEtherbase failed: " + ec.message());
                handler(ec);
                return;
            }

            m_rpc.call("miner_start", json::array({workerCount}),
                [handler](const boost::system::error_code& ec, const json&) {
                    handler(ec);
                });
        });
}

void GethRpcBackend::stopMining(CommandHandler handler) {
    m_rpc.call("miner_stop", json::array(), [handler](const boost::system::error_code& ec, const json&) {
        handler(ec);
    });
}

void GethRpcBackend::getHashRate(HashRateHandler handler) {
    auto deliver = [handler](const boost::system::error_code& ec, const json& result) {
        if (ec) {
            handler(ec, std::string());
            return;
        }
        auto rate = parseQuantity(result);
        if (!rate) {
            handler(make_error_code(errc::bad_response), std::string());
            return;
        }
        handler(boost::system::error_code(), formatRate(static_cast<double>(*rate)));
    };

    std::weak_ptr<int> alive = m_alive;
    m_rpc.call("eth_hashrate", json::array(),
        [this, alive, deliver](const boost::system::error_code& ec, const json& result) {
            if (alive.expired()) return;
            if (!ec) {
                deliver(ec, result);
                return;
            }
            Log::debug("eth_hashrate unavailable (" + ec.message() + "), trying miner_hashrate");
            m_rpc.call("miner_hashrate", json::array(), deliver);
        });
}

void GethRpcBackend::getBlockHeight(HeightHandler handler) {
    m_rpc.call("eth_blockNumber", json::array(), [handler](const boost::system::error_code& ec,
                                                          const json& result) {
        if (ec) {
            handler(ec, 0);
            return;
        }
        auto height = parseQuantity(result);
        if (!height) {
            handler(make_error_code(errc::bad_response), 0);
            return;
        }
        handler(boost::system::error_code(), *height);
    });
}

void GethRpcBackend::getPerformanceCounters(const std::string& dataDir, CountersHandler handler) {
    std::weak_ptr<int> alive = m_alive;
    boost::asio::post(m_io, [alive, dataDir, handler]() {
        if (alive.expired()) return;
        handler(boost::system::error_code(), GethLogScanner::scanDataDir(dataDir));
    });
}

void GethRpcBackend::getRecentMinedBlocks(const std::string& account, uint64_t lookbackBlocks,
                                          size_t limit, BlocksHandler handler) {
    std::weak_ptr<int> alive = m_alive;
    getBlockHeight([this, alive, account, lookbackBlocks, limit, handler](
                       const boost::system::error_code& ec, uint64_t head) {
        if (alive.expired()) return;
        if (ec) {
            handler(ec, {});
            return;
        }
        scanBlocks(account, head, lookbackBlocks, limit, handler);
    });
}

void GethRpcBackend::scanBlocks(const std::string& account, uint64_t head, uint64_t lookbackBlocks,
                                size_t limit, BlocksHandler handler) {
    uint64_t first = head > lookbackBlocks ? head - lookbackBlocks : 0;

    // Newest first
    std::vector<std::pair<std::string, json>> calls;
    for (uint64_t n = head + 1; n-- > first;) {
        calls.emplace_back("eth_getBlockByNumber", json::array({toQuantity(n), false}));
    }

    std::string target = lower(account);
    m_rpc.batch(calls, [target, limit, handler](const boost::system::error_code& ec,
                                                const std::vector<json>& blocks) {
        if (ec) {
            handler(ec, {});
            return;
        }

        std::vector<BlockReport> reports;
        for (const auto& block : blocks) {
            if (reports.size() >= limit) {
                break;
            }
            if (!block.is_object()) {
                continue;
            }

            std::string miner;
            if (block.contains("author") && block["author"].is_string()) {
                miner = block["author"].get<std::string>();
            } else if (block.contains("miner") && block["miner"].is_string()) {
                miner = block["miner"].get<std::string>();
            }
            if (lower(miner) != target) {
                continue;
            }

            if (auto report = toReport(block)) {
                reports.push_back(std::move(*report));
            }
        }
        handler(boost::system::error_code(), reports);
    });
}

std::optional<BlockReport> GethRpcBackend::toReport(const json& block) {
    if (!block.contains("hash") || !block["hash"].is_string()) {
        return std::nullopt;
    }

    BlockReport report;
    report.hash = block["hash"].get<std::string>();
    if (block.contains("nonce")) {
        report.nonce = parseQuantity(block["nonce"]);
    }
    if (block.contains("difficulty")) {
        report.difficulty = parseQuantity(block["difficulty"]);
    }
    if (block.contains("timestamp")) {
        report.timestamp = parseQuantity(block["timestamp"]).value_or(0);
    }
    if (block.contains("number")) {
        report.number = parseQuantity(block["number"]).value_or(0);
    }
    return report;
}

void GethRpcBackend::getNetworkStats(NetworkHandler handler) {
    double blockTime = m_settings.blockTimeSeconds > 0 ? m_settings.blockTimeSeconds : 15.0;
    m_rpc.call("eth_getBlockByNumber", json::array({"latest", false}),
        [blockTime, handler](const boost::system::error_code& ec, const json& block) {
            NetworkStats stats;
            if (ec) {
                handler(ec, stats);
                return;
            }
            if (!block.is_object() || !block.contains("difficulty")) {
                handler(make_error_code(errc::bad_response), stats);
                return;
            }

            auto difficulty = parseQuantity(block["difficulty"]);
            if (!difficulty) {
                handler(make_error_code(errc::bad_response), stats);
                return;
            }
            stats.difficulty = *difficulty;
            stats.networkHashRate = static_cast<double>(*difficulty) / blockTime;
            handler(boost::system::error_code(), stats);
        });
}

}  // namespace chiral
