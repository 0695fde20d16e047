/**
 * chiralmon - TCP Proxy Transport Tests
 */

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../src/core/Errors.h"
#include "../src/proxy/ProxyManager.h"
#include "../src/proxy/TcpProxyTransport.h"
#include "../src/util/Log.h"

using namespace chiral;
using namespace std::chrono_literals;

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

static int passed = 0;
static int failed = 0;

static void check(bool ok, const std::string& name) {
    if (ok) {
        std::cout << "[PASS] " << name << std::endl;
        passed++;
    } else {
        std::cout << "[FAIL] " << name << std::endl;
        failed++;
    }
}

template <typename Pred>
static bool runUntil(asio::io_context& io, Pred done, std::chrono::milliseconds limit = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    io.restart();
    while (!done() && std::chrono::steady_clock::now() < deadline) {
        io.run_for(5ms);
    }
    return done();
}

/**
 * Loopback listener that keeps accepted sockets until told to drop them
 */
class Listener {
public:
    explicit Listener(asio::io_context& io)
        : m_acceptor(io, tcp::endpoint(asio::ip::address_v4::loopback(), 0))
    {
        accept();
    }

    // Ports below 1024 are refused by the validator, ephemeral ports never are
    std::string address() const {
        return "127.0.0.1:" + std::to_string(m_acceptor.local_endpoint().port());
    }

    size_t accepted() const { return m_peers.size(); }

    void dropAll() {
        for (auto& peer : m_peers) {
            boost::system::error_code ec;
            peer->close(ec);
        }
        m_peers.clear();
    }

private:
    void accept() {
        m_acceptor.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec) return;
            m_peers.push_back(std::make_shared<tcp::socket>(std::move(socket)));
            accept();
        });
    }

    tcp::acceptor m_acceptor;
    std::vector<std::shared_ptr<tcp::socket>> m_peers;
};

static void testOnlineThenPeerClose() {
    asio::io_context io;
    Listener listener(io);
    TcpProxyTransport transport(io);

    std::vector<ProxyStatusEvent> events;
    transport.subscribe([&](const ProxyStatusEvent& e) { events.push_back(e); });

    bool issued = false;
    transport.connectProxy(listener.address(), "token", [&](const boost::system::error_code& ec) {
        issued = !ec;
    });

    runUntil(io, [&]() { return !events.empty(); });
    check(issued, "connect request issued");
    check(events.size() == 1 && events[0].status == ProxyStatus::Online, "online after connect");
    check(!events.empty() && events[0].latencyMs && *events[0].latencyMs >= 0, "latency measured");
    check(!events.empty() && events[0].address == listener.address(), "event keyed by address");

    std::vector<ProxyStatusEvent> listed;
    transport.listProxies([&](const boost::system::error_code&, const std::vector<ProxyStatusEvent>& l) {
        listed = l;
    });
    runUntil(io, [&]() { return !listed.empty(); });
    check(listed.size() == 1 && listed[0].status == ProxyStatus::Online, "list reports online node");

    runUntil(io, [&]() { return listener.accepted() == 1; });
    listener.dropAll();
    runUntil(io, [&]() { return events.size() >= 2; });
    check(events.size() == 2 && events[1].status == ProxyStatus::Offline, "offline when the peer closes");
}

static void testDisconnect() {
    asio::io_context io;
    Listener listener(io);
    TcpProxyTransport transport(io);

    std::vector<ProxyStatusEvent> events;
    uint64_t id = transport.subscribe([&](const ProxyStatusEvent& e) { events.push_back(e); });

    transport.connectProxy(listener.address(), "", nullptr);
    runUntil(io, [&]() { return !events.empty(); });

    std::optional<boost::system::error_code> done;
    transport.disconnectProxy(listener.address(), [&](const boost::system::error_code& ec) { done = ec; });
    runUntil(io, [&]() { return done.has_value(); });
    check(done && !*done, "disconnect acknowledged");
    check(events.size() == 2 && events[1].status == ProxyStatus::Offline, "offline after disconnect");

    done.reset();
    transport.disconnectProxy(listener.address(), [&](const boost::system::error_code& ec) { done = ec; });
    runUntil(io, [&]() { return done.has_value(); });
    check(done && *done == errc::unknown_node, "second disconnect finds nothing");

    transport.unsubscribe(id);
    transport.connectProxy(listener.address(), "", nullptr);
    io.restart();
    io.run_for(100ms);
    check(events.size() == 2, "no events after unsubscribe");
}

static void testRefused() {
    asio::io_context io;
    std::string address;
    {
        Listener closed(io);
        address = closed.address();
    }

    TcpProxyTransport transport(io);
    std::vector<ProxyStatusEvent> events;
    transport.subscribe([&](const ProxyStatusEvent& e) { events.push_back(e); });

    transport.connectProxy(address, "", nullptr);
    runUntil(io, [&]() { return !events.empty(); });
    check(events.size() == 1 && events[0].status == ProxyStatus::Error, "refused dial reports error");
    check(!events.empty() && !events[0].error.empty(), "error text present");

    std::optional<boost::system::error_code> rejected;
    transport.connectProxy("127.0.0.1:22", "", [&](const boost::system::error_code& ec) { rejected = ec; });
    runUntil(io, [&]() { return rejected.has_value(); });
    check(rejected && *rejected == errc::validation_failed, "invalid address rejected");
}

static void testWithManager() {
    asio::io_context io;
    Listener listener(io);
    TcpProxyTransport transport(io);

    ProxySettings settings;
    settings.connectTimeout = 1000ms;
    ProxyManager manager(io, transport, settings);
    manager.open();

    check(!manager.addOrConnect(listener.address(), ""), "manager add");
    runUntil(io, [&]() {
        auto node = manager.node(listener.address());
        return node && node->status == ProxyStatus::Online;
    });
    auto node = manager.node(listener.address());
    check(node && node->status == ProxyStatus::Online && node->latencyMs, "manager sees node online");
    check(!manager.hasPendingTimeout(listener.address()), "timeout cancelled by transport event");

    manager.disconnect(listener.address());
    runUntil(io, [&]() {
        auto n = manager.node(listener.address());
        return n && n->status == ProxyStatus::Offline;
    });
    check(manager.node(listener.address())->status == ProxyStatus::Offline, "manager sees node offline");
    check(!manager.remove(listener.address()) && manager.size() == 0, "offline node removed");

    manager.close();
    transport.shutdown();
}

int main() {
    Log::setConsole(false);

    std::cout << "=== TcpProxyTransport ===" << std::endl;
    testOnlineThenPeerClose();
    testDisconnect();
    testRefused();
    testWithManager();

    std::cout << "\n=== Summary ===" << std::endl;
    std::cout << "Passed: " << passed << ", Failed: " << failed << std::endl;

    return failed == 0 ? 0 : 1;
}
