/**
 * chiralmon - TCP Proxy Transport Implementation
 */

#include "TcpProxyTransport.h"
#include "AddressValidator.h"
#include "core/Errors.h"
#include "util/Log.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

namespace asio = boost::asio;
using boost::asio::ip::tcp;

namespace chiral {

TcpProxyTransport::TcpProxyTransport(asio::io_context& io)
    : m_io(io)
    , m_alive(std::make_shared<int>(0))
{
}

TcpProxyTransport::~TcpProxyTransport() {
    shutdown();
    m_alive.reset();
}

void TcpProxyTransport::shutdown() {
    for (auto& entry : m_connections) {
        closeSocket(*entry.second);
    }
    m_connections.clear();
}

void TcpProxyTransport::connectProxy(const std::string& address, const std::string& /*credential*/,
                                     ProxyCommandHandler handler) {
    // Plain TCP dial, the credential is not forwarded
    AddressCheck check = AddressValidator::check(address);
    if (!check.ok()) {
        asio::post(m_io, [handler]() {
            if (handler) handler(make_error_code(errc::validation_failed));
        });
        return;
    }

    auto existing = m_connections.find(check.canonical);
    if (existing != m_connections.end()) {
        closeSocket(*existing->second);
        m_connections.erase(existing);
    }

    auto conn = std::make_shared<Connection>(m_io);
    conn->address = check.canonical;
    conn->host = check.host;
    conn->port = std::to_string(check.port);
    conn->startedAt = SteadyClock::now();
    m_connections[conn->address] = conn;

    Log::debug("Dialing proxy " + conn->address);

    std::weak_ptr<int> alive = m_alive;
    conn->resolver.async_resolve(conn->host, conn->port,
        [this, alive, conn](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            if (alive.expired() || !isCurrent(conn)) return;
            if (ec) {
                fail(conn, ec);
                return;
            }

            asio::async_connect(conn->socket, results,
                [this, alive, conn](const boost::system::error_code& ec, const tcp::endpoint&) {
                    if (alive.expired()) return;
                    onConnected(conn, ec);
                });
        });

    asio::post(m_io, [handler]() {
        if (handler) handler(boost::system::error_code());
    });
}

bool TcpProxyTransport::isCurrent(const ConnectionPtr& conn) const {
    auto it = m_connections.find(conn->address);
    return it != m_connections.end() && it->second == conn;
}

void TcpProxyTransport::onConnected(const ConnectionPtr& conn, const boost::system::error_code& ec) {
    if (!isCurrent(conn)) {
        return;
    }
    if (ec) {
        fail(conn, ec);
        return;
    }

    conn->status = ProxyStatus::Online;
    conn->latencyMs = std::chrono::duration<double, std::milli>(SteadyClock::now() - conn->startedAt).count();
    conn->error.clear();
    emit(eventFor(*conn));

    readLoop(conn);
}

void TcpProxyTransport::fail(const ConnectionPtr& conn, const boost::system::error_code& ec) {
    conn->status = ProxyStatus::Error;
    conn->error = ec.message();
    conn->latencyMs.reset();
    closeSocket(*conn);

    Log::debug("Proxy " + conn->address + " dial failed: " + conn->error);
    emit(eventFor(*conn));
}

void TcpProxyTransport::readLoop(const ConnectionPtr& conn) {
    std::weak_ptr<int> alive = m_alive;
    conn->socket.async_read_some(asio::buffer(conn->buffer),
        [this, alive, conn](const boost::system::error_code& ec, size_t) {
            if (alive.expired() || !isCurrent(conn)) return;

            if (!ec) {
                // Payload is not interpreted, only liveness matters
                readLoop(conn);
                return;
            }

            conn->status = ProxyStatus::Offline;
            conn->latencyMs.reset();
            if (ec != asio::error::eof) {
                conn->error = ec.message();
            }
            closeSocket(*conn);
            emit(eventFor(*conn));
        });
}

void TcpProxyTransport::disconnectProxy(const std::string& address, ProxyCommandHandler handler) {
    AddressCheck check = AddressValidator::check(address);
    auto it = m_connections.find(check.ok() ? check.canonical : address);
    if (it == m_connections.end()) {
        asio::post(m_io, [handler]() {
            if (handler) handler(make_error_code(errc::unknown_node));
        });
        return;
    }

    ConnectionPtr conn = it->second;
    m_connections.erase(it);
    closeSocket(*conn);

    conn->status = ProxyStatus::Offline;
    conn->latencyMs.reset();
    conn->error.clear();
    ProxyStatusEvent event = eventFor(*conn);

    std::weak_ptr<int> alive = m_alive;
    asio::post(m_io, [this, alive, event, handler]() {
        if (alive.expired()) return;
        emit(event);
        if (handler) handler(boost::system::error_code());
    });
}

void TcpProxyTransport::listProxies(ProxyListHandler handler) {
    std::vector<ProxyStatusEvent> events;
    events.reserve(m_connections.size());
    for (const auto& entry : m_connections) {
        // Dials still in flight report through their own completion
        if (entry.second->status == ProxyStatus::Connecting) continue;
        events.push_back(eventFor(*entry.second));
    }

    asio::post(m_io, [handler, events]() {
        if (handler) handler(boost::system::error_code(), events);
    });
}

uint64_t TcpProxyTransport::subscribe(ProxyEventCallback callback) {
    uint64_t id = m_nextSubscription++;
    m_subscribers[id] = std::move(callback);
    return id;
}

void TcpProxyTransport::unsubscribe(uint64_t id) {
    m_subscribers.erase(id);
}

void TcpProxyTransport::closeSocket(Connection& conn) {
    conn.resolver.cancel();
    if (!conn.socket.is_open()) {
        return;
    }

    boost::system::error_code ec;
    conn.socket.close(ec);
    if (ec) {
        Log::debug("Proxy " + conn.address + " socket close: " + ec.message());
    }
}

ProxyStatusEvent TcpProxyTransport::eventFor(const Connection& conn) const {
    ProxyStatusEvent event;
    event.id = conn.address;
    event.address = conn.address;
    event.status = conn.status;
    event.latencyMs = conn.latencyMs;
    event.error = conn.error;
    return event;
}

void TcpProxyTransport::emit(const ProxyStatusEvent& event) {
    // Copy: a subscriber may unsubscribe while being notified
    auto subscribers = m_subscribers;
    for (auto& entry : subscribers) {
        if (entry.second) {
            entry.second(event);
        }
    }
}

}  // namespace chiral
