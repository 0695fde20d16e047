/**
 * chiralmon - Status API Server Implementation
 */

#include "ApiServer.h"
#include "JsonView.h"
#include "Version.h"
#include "util/Log.h"
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace chiral {

struct ApiServer::Client {
    explicit Client(asio::io_context& io) : socket(io) {}

    tcp::socket socket;
    asio::streambuf buffer;
    std::string response;
};

ApiServer::ApiServer(asio::io_context& io, unsigned port, const MiningMonitor& monitor,
                     const BlockLedger& ledger, const ProxyManager* proxies)
    : m_io(io)
    , m_port(port)
    , m_monitor(monitor)
    , m_ledger(ledger)
    , m_proxies(proxies)
{
}

ApiServer::~ApiServer() {
    stop();
}

bool ApiServer::start() {
    if (m_running || m_port == 0) {
        return false;
    }

    try {
        m_acceptor = std::make_unique<tcp::acceptor>(m_io);
        tcp::endpoint endpoint(tcp::v4(), static_cast<unsigned short>(m_port));
        m_acceptor->open(endpoint.protocol());
        m_acceptor->set_option(asio::socket_base::reuse_address(true));
        m_acceptor->bind(endpoint);
        m_acceptor->listen();
    } catch (const boost::system::system_error& e) {
        Log::error("Failed to start API server: " + std::string(e.what()));
        m_acceptor.reset();
        return false;
    }

    m_alive = std::make_shared<int>(0);
    m_running = true;
    doAccept();

    Log::info("API server started on port " + std::to_string(m_port));
    return true;
}

void ApiServer::stop() {
    if (!m_running) {
        return;
    }

    m_running = false;
    m_alive.reset();

    if (m_acceptor) {
        boost::system::error_code ec;
        m_acceptor->close(ec);
        if (ec) {
            Log::debug("API acceptor close: " + ec.message());
        }
    }

    Log::info("API server stopped");
}

void ApiServer::doAccept() {
    auto client = std::make_shared<Client>(m_io);
    std::weak_ptr<int> alive = m_alive;

    m_acceptor->async_accept(client->socket, [this, alive, client](const boost::system::error_code& ec) {
        if (alive.expired()) return;

        if (ec) {
            Log::debug("API accept error: " + ec.message());
        } else {
            serve(client);
        }
        doAccept();
    });
}

void ApiServer::serve(std::shared_ptr<Client> client) {
    std::weak_ptr<int> alive = m_alive;

    asio::async_read_until(client->socket, client->buffer, "\r\n\r\n",
        [this, alive, client](const boost::system::error_code& ec, size_t) {
            if (alive.expired()) return;
            if (ec) {
                Log::debug("API read error: " + ec.message());
                return;
            }

            std::istream is(&client->buffer);
            std::string request;
            std::getline(is, request);

            client->response = handleRequest(request);

            asio::async_write(client->socket, asio::buffer(client->response),
                [client](const boost::system::error_code& ec, size_t) {
                    if (ec) {
                        Log::debug("API write error: " + ec.message());
                    }
                    boost::system::error_code closeEc;
                    client->socket.shutdown(tcp::socket::shutdown_both, closeEc);
                    client->socket.close(closeEc);
                });
        });
}

std::string ApiServer::handleRequest(const std::string& requestLine) const {
    // Parse HTTP request line: "GET /path?query HTTP/1.1"
    std::string method, target;
    std::istringstream iss(requestLine);
    iss >> method >> target;

    if (method != "GET") {
        return createResponse(405, R"({"error":"Method not allowed"})");
    }

    std::string path = target;
    std::map<std::string, std::string> query;
    size_t mark = target.find('?');
    if (mark != std::string::npos) {
        path = target.substr(0, mark);
        query = parseQuery(target.substr(mark + 1));
    }

    int status = 200;
    std::string body = route(path, query, status);
    return createResponse(status, body);
}

std::string ApiServer::route(const std::string& path, const std::map<std::string, std::string>& query,
                             int& status) const {
    if (path == "/" || path == "/status") {
        return JsonView::status(m_monitor, m_ledger).dump(2);
    }

    if (path == "/blocks") {
        return JsonView::blocksPage(m_ledger, number(query, "page"), number(query, "size")).dump(2);
    }

    if (path == "/transactions") {
        return JsonView::transactions(m_ledger).dump(2);
    }

    if (path == "/proxies") {
        if (!m_proxies) {
            status = 404;
            return R"({"error":"Proxy management disabled"})";
        }

        std::optional<ProxyStatus> filter;
        auto it = query.find("status");
        if (it != query.end() && !it->second.empty() && it->second != "all") {
            filter = parseProxyStatus(it->second);
            if (!filter) {
                status = 400;
                return R"({"error":"Unknown status filter"})";
            }
        }
        return JsonView::proxiesPage(*m_proxies, filter, number(query, "page"),
                                     number(query, "size")).dump(2);
    }

    status = 404;
    return R"({"error":"Not found"})";
}

std::map<std::string, std::string> ApiServer::parseQuery(const std::string& query) {
    std::map<std::string, std::string> out;
    std::istringstream iss(query);
    std::string pair;
    while (std::getline(iss, pair, '&')) {
        if (pair.empty()) {
            continue;
        }
        size_t eq = pair.find('=');
        if (eq == std::string::npos) {
            out[pair] = std::string();
        } else {
            out[pair.substr(0, eq)] = pair.substr(eq + 1);
        }
    }
    return out;
}

std::optional<size_t> ApiServer::number(const std::map<std::string, std::string>& query,
                                        const std::string& key) {
    auto it = query.find(key);
    if (it == query.end() || it->second.empty()) {
        return std::nullopt;
    }
    for (char c : it->second) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    return static_cast<size_t>(std::strtoull(it->second.c_str(), nullptr, 10));
}

std::string ApiServer::createResponse(int status, const std::string& body) {
    std::string statusText;
    switch (status) {
        case 200: statusText = "OK"; break;
        case 400: statusText = "Bad Request"; break;
        case 404: statusText = "Not Found"; break;
        case 405: statusText = "Method Not Allowed"; break;
        default: statusText = "Error"; break;
    }

    std::ostringstream response;
    response << "HTTP/1.1 " << status << " " << statusText << "\r\n";
    response << "Server: " << SERVER_NAME << "\r\n";
    response << "Content-Type: application/json\r\n";
    response << "Content-Length: " << body.length() << "\r\n";
    response << "Connection: close\r\n";
    response << "Access-Control-Allow-Origin: *\r\n";
    response << "\r\n";
    response << body;

    return response.str();
}

}  // namespace chiral
