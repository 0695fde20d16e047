/**
 * chiralmon - TCP Proxy Transport
 *
 * ProxyTransport that dials proxies over plain TCP. Connect time is the
 * reported latency; the socket is then held open and watched for peer close.
 */

#pragma once

#include "ProxyTransport.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <array>
#include <map>
#include <memory>
#include <string>

namespace chiral {

/**
 * TcpProxyTransport class
 *
 * Events: online after connect, error when resolve or connect fails,
 * offline on peer close or local disconnect.
 */
class TcpProxyTransport : public ProxyTransport {
public:
    explicit TcpProxyTransport(boost::asio::io_context& io);
    ~TcpProxyTransport() override;

    // Non-copyable
    TcpProxyTransport(const TcpProxyTransport&) = delete;
    TcpProxyTransport& operator=(const TcpProxyTransport&) = delete;

    void connectProxy(const std::string& address, const std::string& credential,
                      ProxyCommandHandler handler) override;
    void disconnectProxy(const std::string& address, ProxyCommandHandler handler) override;
    void listProxies(ProxyListHandler handler) override;
    uint64_t subscribe(ProxyEventCallback callback) override;
    void unsubscribe(uint64_t id) override;

    /**
     * Close every socket without emitting events
     */
    void shutdown();

private:
    struct Connection {
        explicit Connection(boost::asio::io_context& io)
            : socket(io), resolver(io) {}

        std::string address;
        std::string host;
        std::string port;
        boost::asio::ip::tcp::socket socket;
        boost::asio::ip::tcp::resolver resolver;
        SteadyClock::time_point startedAt;
        ProxyStatus status{ProxyStatus::Connecting};
        std::optional<double> latencyMs;
        std::string error;
        std::array<char, 512> buffer{};
    };

    using ConnectionPtr = std::shared_ptr<Connection>;

    bool isCurrent(const ConnectionPtr& conn) const;
    void onConnected(const ConnectionPtr& conn, const boost::system::error_code& ec);
    void fail(const ConnectionPtr& conn, const boost::system::error_code& ec);
    void readLoop(const ConnectionPtr& conn);
    void closeSocket(Connection& conn);

    ProxyStatusEvent eventFor(const Connection& conn) const;
    void emit(const ProxyStatusEvent& event);

private:
    boost::asio::io_context& m_io;
    std::shared_ptr<int> m_alive;

    std::map<std::string, ConnectionPtr> m_connections;
    std::map<uint64_t, ProxyEventCallback> m_subscribers;
    uint64_t m_nextSubscription{1};
};

}  // namespace chiral
