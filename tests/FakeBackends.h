/**
 * chiralmon - Test doubles for MiningBackend and ProxyTransport
 */

#pragma once

#include "../src/backend/MiningBackend.h"
#include "../src/core/Errors.h"
#include "../src/proxy/ProxyTransport.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <map>
#include <string>
#include <vector>

namespace chiral {
namespace test {

/**
 * Scripted mining backend
 *
 * Replies are posted to the io_context. With deferRates set, hash-rate
 * handlers are queued in pendingRates for the test to complete in any order.
 */
class FakeBackend : public MiningBackend {
public:
    explicit FakeBackend(boost::asio::io_context& io) : m_io(io) {}

    bool running = true;

    boost::system::error_code startError;
    bool deferStart = false;
    std::vector<CommandHandler> pendingStarts;
    unsigned startCalls = 0;
    unsigned lastWorkerCount = 0;
    std::string lastAccount;

    boost::system::error_code stopError;
    unsigned stopCalls = 0;

    std::string rateText = "0 H/s";
    boost::system::error_code rateError;
    bool deferRates = false;
    std::vector<HashRateHandler> pendingRates;
    unsigned rateCalls = 0;

    uint64_t height = 100;
    boost::system::error_code heightError;

    PerformanceCounters counters;
    boost::system::error_code countersError;
    unsigned countersCalls = 0;

    std::vector<BlockReport> blocks;
    boost::system::error_code blocksError;
    unsigned blocksCalls = 0;

    NetworkStats network;
    unsigned networkCalls = 0;

    bool isBackendRunning() const override { return running; }

    void startMining(const std::string& account, unsigned workerCount, CommandHandler handler) override {
        startCalls++;
        lastAccount = account;
        lastWorkerCount = workerCount;
        if (deferStart) {
            pendingStarts.push_back(handler);
            return;
        }
        auto ec = startError;
        boost::asio::post(m_io, [handler, ec]() { handler(ec); });
    }

    void stopMining(CommandHandler handler) override {
        stopCalls++;
        auto ec = stopError;
        boost::asio::post(m_io, [handler, ec]() { handler(ec); });
    }

    void getHashRate(HashRateHandler handler) override {
        rateCalls++;
        if (deferRates) {
            pendingRates.push_back(handler);
            return;
        }
        auto ec = rateError;
        auto text = rateText;
        boost::asio::post(m_io, [handler, ec, text]() { handler(ec, text); });
    }

    void getBlockHeight(HeightHandler handler) override {
        auto ec = heightError;
        auto h = height;
        boost::asio::post(m_io, [handler, ec, h]() { handler(ec, h); });
    }

    void getPerformanceCounters(const std::string&, CountersHandler handler) override {
        countersCalls++;
        auto ec = countersError;
        auto c = counters;
        boost::asio::post(m_io, [handler, ec, c]() { handler(ec, c); });
    }

    void getRecentMinedBlocks(const std::string&, uint64_t, size_t, BlocksHandler handler) override {
        blocksCalls++;
        auto ec = blocksError;
        auto b = blocks;
        boost::asio::post(m_io, [handler, ec, b]() { handler(ec, b); });
    }

    void getNetworkStats(NetworkHandler handler) override {
        networkCalls++;
        auto n = network;
        boost::asio::post(m_io, [handler, n]() { handler(boost::system::error_code(), n); });
    }

private:
    boost::asio::io_context& m_io;
};

/**
 * Recording proxy transport
 *
 * Commands are recorded; events are pushed by the test through emit().
 */
class FakeTransport : public ProxyTransport {
public:
    explicit FakeTransport(boost::asio::io_context& io) : m_io(io) {}

    std::vector<std::string> connects;
    std::vector<std::string> disconnects;
    std::vector<std::string> credentials;
    boost::system::error_code connectError;
    std::vector<ProxyStatusEvent> listed;

    void connectProxy(const std::string& address, const std::string& credential,
                      ProxyCommandHandler handler) override {
        connects.push_back(address);
        credentials.push_back(credential);
        auto ec = connectError;
        boost::asio::post(m_io, [handler, ec]() { handler(ec); });
    }

    void disconnectProxy(const std::string& address, ProxyCommandHandler handler) override {
        disconnects.push_back(address);
        boost::asio::post(m_io, [handler]() { handler(boost::system::error_code()); });
    }

    void listProxies(ProxyListHandler handler) override {
        auto events = listed;
        boost::asio::post(m_io, [handler, events]() { handler(boost::system::error_code(), events); });
    }

    uint64_t subscribe(ProxyEventCallback callback) override {
        uint64_t id = m_next++;
        m_subscribers[id] = std::move(callback);
        return id;
    }

    void unsubscribe(uint64_t id) override {
        m_subscribers.erase(id);
    }

    size_t subscriberCount() const { return m_subscribers.size(); }

    void emit(const ProxyStatusEvent& event) {
        auto subscribers = m_subscribers;
        for (auto& entry : subscribers) {
            entry.second(event);
        }
    }

private:
    boost::asio::io_context& m_io;
    std::map<uint64_t, ProxyEventCallback> m_subscribers;
    uint64_t m_next{1};
};

}  // namespace test
}  // namespace chiral
