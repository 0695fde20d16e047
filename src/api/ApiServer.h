/**
 * chiralmon - Status API Server
 *
 * Minimal HTTP server exposing monitor state as JSON
 */

#pragma once

#include "core/BlockLedger.h"
#include "core/MiningMonitor.h"
#include "proxy/ProxyManager.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace chiral {

using json = nlohmann::json;

/**
 * Status API Server
 *
 * Runs on the shared io_context. Endpoints (GET only):
 * - /status                        - Session, history and ledger totals
 * - /blocks?page=N&size=N          - Ledger page
 * - /transactions                  - Credit transactions, newest first
 * - /proxies?status=S&page=N       - Proxy node page
 */
class ApiServer {
public:
    /**
     * Constructor
     *
     * @param io      Context shared with the monitor
     * @param port    Port to listen on (0 = disabled)
     * @param monitor Mining monitor
     * @param ledger  Block ledger
     * @param proxies Proxy manager, may be null
     */
    ApiServer(boost::asio::io_context& io, unsigned port, const MiningMonitor& monitor,
              const BlockLedger& ledger, const ProxyManager* proxies);

    /**
     * Destructor
     */
    ~ApiServer();

    // Non-copyable
    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    /**
     * Bind and start accepting
     *
     * @return true if started successfully
     */
    bool start();

    /**
     * Stop accepting
     */
    void stop();

    bool isRunning() const { return m_running; }

    unsigned getPort() const { return m_port; }

    /**
     * Produce the full HTTP response for a request line ("GET /path HTTP/1.1")
     */
    std::string handleRequest(const std::string& requestLine) const;

    /**
     * Split "a=1&b=2" into a map
     */
    static std::map<std::string, std::string> parseQuery(const std::string& query);

private:
    struct Client;

    void doAccept();

    void serve(std::shared_ptr<Client> client);

    std::string route(const std::string& path, const std::map<std::string, std::string>& query,
                      int& status) const;

    static std::optional<size_t> number(const std::map<std::string, std::string>& query,
                                        const std::string& key);

    /**
     * Create HTTP response
     */
    static std::string createResponse(int status, const std::string& body);

private:
    boost::asio::io_context& m_io;
    unsigned m_port;
    const MiningMonitor& m_monitor;
    const BlockLedger& m_ledger;
    const ProxyManager* m_proxies;

    std::unique_ptr<boost::asio::ip::tcp::acceptor> m_acceptor;
    std::shared_ptr<int> m_alive;
    bool m_running{false};
};

}  // namespace chiral
