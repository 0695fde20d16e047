/**
 * chiralmon - JSON-RPC over HTTP Client
 *
 * Asynchronous JSON-RPC 2.0 client for a node's HTTP endpoint. One TCP
 * connection per request (Connection: close), each guarded by a deadline.
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/system/error_code.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace chiral {

using json = nlohmann::json;

/**
 * Node endpoint
 */
struct RpcEndpoint {
    std::string host = "127.0.0.1";
    unsigned port = 8545;
    std::chrono::milliseconds timeout{5000};
};

/**
 * Single call completion: result member on success
 */
using RpcHandler = std::function<void(const boost::system::error_code&, const json&)>;

/**
 * Batch completion: one entry per call in request order, null where that
 * call returned an error object
 */
using RpcBatchHandler = std::function<void(const boost::system::error_code&, const std::vector<json>&)>;

/**
 * Parse a JSON-RPC quantity ("0x1a") into an integer
 *
 * Values wider than 64 bits saturate.
 */
std::optional<uint64_t> parseQuantity(const json& value);

/**
 * Encode an integer as a JSON-RPC quantity
 */
std::string toQuantity(uint64_t value);

/**
 * JsonRpcClient class
 *
 * Errors: timed_out when the deadline passes, rpc_error when the node
 * returns an error object (message in lastRpcError()), bad_response for
 * malformed HTTP or JSON, and asio errors for connection failures.
 */
class JsonRpcClient {
public:
    JsonRpcClient(boost::asio::io_context& io, RpcEndpoint endpoint);
    ~JsonRpcClient();

    // Non-copyable
    JsonRpcClient(const JsonRpcClient&) = delete;
    JsonRpcClient& operator=(const JsonRpcClient&) = delete;

    /**
     * Issue one call
     */
    void call(const std::string& method, const json& params, RpcHandler handler);

    /**
     * Issue several calls in one HTTP request
     */
    void batch(const std::vector<std::pair<std::string, json>>& calls, RpcBatchHandler handler);

    /**
     * Abort every in-flight request (handlers get operation_aborted)
     */
    void cancelAll();

    size_t inFlight() const { return m_exchanges.size(); }

    const std::string& lastRpcError() const { return m_lastRpcError; }

    const RpcEndpoint& endpoint() const { return m_endpoint; }

private:
    using BodyHandler = std::function<void(const boost::system::error_code&, const std::string&)>;

    struct Exchange {
        explicit Exchange(boost::asio::io_context& io)
            : socket(io), resolver(io), deadline(io) {}

        boost::asio::ip::tcp::socket socket;
        boost::asio::ip::tcp::resolver resolver;
        boost::asio::steady_timer deadline;
        std::string request;
        boost::asio::streambuf response;
        BodyHandler complete;
        bool done{false};
    };

    using ExchangePtr = std::shared_ptr<Exchange>;

    /**
     * POST body and deliver the HTTP response body
     */
    void post(const std::string& body, BodyHandler handler);

    void finish(const ExchangePtr& ex, const boost::system::error_code& ec, const std::string& body);

    /**
     * Split an HTTP response, checking status and decoding chunked bodies
     */
    static boost::system::error_code parseHttp(const std::string& raw, std::string& body);

    json envelope(const std::string& method, const json& params);

private:
    boost::asio::io_context& m_io;
    RpcEndpoint m_endpoint;
    std::shared_ptr<int> m_alive;

    std::set<ExchangePtr> m_exchanges;
    uint64_t m_nextId{1};
    std::string m_lastRpcError;
};

}  // namespace chiral
