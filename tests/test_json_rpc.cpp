/**
 * chiralmon - JSON-RPC Client and Geth Backend Tests
 *
 * Runs against a loopback HTTP node served from the same io_context.
 */

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>
#include <chrono>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include "../src/backend/GethRpcBackend.h"
#include "../src/backend/JsonRpcClient.h"
#include "../src/core/Errors.h"
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

static std::string httpReply(const std::string& body, int code = 200) {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << code << (code == 200 ? " OK" : " Error") << "\r\n"
       << "Content-Type: application/json\r\n"
       << "Content-Length: " << body.size() << "\r\n"
       << "Connection: close\r\n"
       << "\r\n"
       << body;
    return ss.str();
}

static std::string result(const json& request, const json& value) {
    return httpReply(json{{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", value}}.dump());
}

/**
 * Minimal HTTP JSON-RPC node
 *
 * respond() returns the raw HTTP reply; an empty string leaves the
 * connection open without answering.
 */
class FakeNode {
public:
    explicit FakeNode(asio::io_context& io)
        : m_acceptor(io, tcp::endpoint(asio::ip::address_v4::loopback(), 0))
    {
        accept();
    }

    unsigned port() const { return m_acceptor.local_endpoint().port(); }

    std::function<std::string(const json&)> respond;
    std::vector<json> requests;

private:
    struct Conn {
        explicit Conn(tcp::socket s) : socket(std::move(s)) {}
        tcp::socket socket;
        asio::streambuf buffer;
        std::string reply;
    };
    using ConnPtr = std::shared_ptr<Conn>;

    void accept() {
        m_acceptor.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec) return;
            auto conn = std::make_shared<Conn>(std::move(socket));
            readHeaders(conn);
            accept();
        });
    }

    void readHeaders(const ConnPtr& conn) {
        asio::async_read_until(conn->socket, conn->buffer, "\r\n\r\n",
            [this, conn](const boost::system::error_code& ec, size_t headerBytes) {
                if (ec) return;

                auto data = conn->buffer.data();
                std::string head(asio::buffers_begin(data), asio::buffers_begin(data) + headerBytes);
                size_t length = 0;
                size_t pos = head.find("Content-Length: ");
                if (pos != std::string::npos) {
                    length = std::stoul(head.substr(pos + 16));
                }

                size_t buffered = conn->buffer.size() - headerBytes;
                size_t missing = length > buffered ? length - buffered : 0;
                asio::async_read(conn->socket, conn->buffer, asio::transfer_exactly(missing),
                    [this, conn, headerBytes, length](const boost::system::error_code& ec, size_t) {
                        if (ec) return;
                        auto all = conn->buffer.data();
                        std::string body(asio::buffers_begin(all) + headerBytes,
                                         asio::buffers_begin(all) + headerBytes + length);
                        answer(conn, json::parse(body));
                    });
            });
    }

    void answer(const ConnPtr& conn, const json& request) {
        requests.push_back(request);
        conn->reply = respond ? respond(request) : std::string();
        if (conn->reply.empty()) {
            m_held.push_back(conn);
            return;
        }
        asio::async_write(conn->socket, asio::buffer(conn->reply),
            [conn](const boost::system::error_code&, size_t) {
                boost::system::error_code ignored;
                conn->socket.shutdown(tcp::socket::shutdown_both, ignored);
                conn->socket.close(ignored);
            });
    }

    tcp::acceptor m_acceptor;
    std::vector<ConnPtr> m_held;
};

// Run the loop until done is set or the limit passes
template <typename Pred>
static bool runUntil(asio::io_context& io, Pred done, std::chrono::milliseconds limit = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    io.restart();
    while (!done() && std::chrono::steady_clock::now() < deadline) {
        io.run_for(5ms);
    }
    return done();
}

static RpcEndpoint endpointFor(const FakeNode& node, std::chrono::milliseconds timeout = 1000ms) {
    RpcEndpoint endpoint;
    endpoint.host = "127.0.0.1";
    endpoint.port = node.port();
    endpoint.timeout = timeout;
    return endpoint;
}

static void testQuantities() {
    check(parseQuantity(json("0x1a")) == uint64_t(26), "hex quantity");
    check(parseQuantity(json("0X10")) == uint64_t(16), "upper-case prefix");
    check(parseQuantity(json("0x0")) == uint64_t(0), "zero");
    check(parseQuantity(json(uint64_t(7))) == uint64_t(7), "plain number");
    check(!parseQuantity(json("12")), "missing prefix rejected");
    check(!parseQuantity(json("0x")), "empty digits rejected");
    check(!parseQuantity(json("0xzz")), "bad digits rejected");
    check(!parseQuantity(json(nullptr)), "null rejected");
    check(parseQuantity(json("0x1ffffffffffffffff")) == std::numeric_limits<uint64_t>::max(),
          "wide value saturates");
    check(toQuantity(255) == "0xff" && toQuantity(0) == "0x0", "encode quantity");
}

static void testCall() {
    asio::io_context io;
    FakeNode node(io);
    node.respond = [](const json& request) { return result(request, "0x10"); };

    JsonRpcClient client(io, endpointFor(node));
    std::optional<boost::system::error_code> status;
    json value;
    client.call("eth_blockNumber", json::array(), [&](const boost::system::error_code& ec, const json& r) {
        status = ec;
        value = r;
    });
    check(client.inFlight() == 1, "request in flight");

    runUntil(io, [&]() { return status.has_value(); });
    check(status && !*status && value == "0x10", "result delivered");
    check(client.inFlight() == 0, "exchange released");
    check(node.requests.size() == 1 && node.requests[0]["method"] == "eth_blockNumber" &&
          node.requests[0]["jsonrpc"] == "2.0", "request envelope");
}

static void testErrors() {
    asio::io_context io;
    FakeNode node(io);
    JsonRpcClient client(io, endpointFor(node));

    std::optional<boost::system::error_code> status;
    auto capture = [&](const boost::system::error_code& ec, const json&) { status = ec; };

    node.respond = [](const json& request) {
        return httpReply(json{{"jsonrpc", "2.0"}, {"id", request["id"]},
                              {"error", {{"code", -32601}, {"message", "method not found"}}}}.dump());
    };
    client.call("miner_hashrate", json::array(), capture);
    runUntil(io, [&]() { return status.has_value(); });
    check(status && *status == errc::rpc_error, "error object gives rpc_error");
    check(client.lastRpcError() == "method not found", "error message kept");

    status.reset();
    node.respond = [](const json&) { return httpReply("{}", 500); };
    client.call("eth_hashrate", json::array(), capture);
    runUntil(io, [&]() { return status.has_value(); });
    check(status && *status == errc::rpc_error, "HTTP 500 gives rpc_error");

    status.reset();
    node.respond = [](const json&) { return httpReply("not json"); };
    client.call("eth_hashrate", json::array(), capture);
    runUntil(io, [&]() { return status.has_value(); });
    check(status && *status == errc::bad_response, "unparseable body gives bad_response");

    status.reset();
    node.respond = [](const json& request) {
        return httpReply(json{{"jsonrpc", "2.0"}, {"id", request["id"]}}.dump());
    };
    client.call("eth_hashrate", json::array(), capture);
    runUntil(io, [&]() { return status.has_value(); });
    check(status && *status == errc::bad_response, "reply without result gives bad_response");
}

static void testChunked() {
    asio::io_context io;
    FakeNode node(io);
    node.respond = [](const json& request) {
        std::string body = json{{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", "0x5"}}.dump();
        std::string a = body.substr(0, 10);
        std::string b = body.substr(10);
        std::ostringstream ss;
        ss << "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n"
           << std::hex << a.size() << "\r\n" << a << "\r\n"
           << std::hex << b.size() << "\r\n" << b << "\r\n"
           << "0\r\n\r\n";
        return ss.str();
    };

    JsonRpcClient client(io, endpointFor(node));
    std::optional<boost::system::error_code> status;
    json value;
    client.call("eth_blockNumber", json::array(), [&](const boost::system::error_code& ec, const json& r) {
        status = ec;
        value = r;
    });
    runUntil(io, [&]() { return status.has_value(); });
    check(status && !*status && value == "0x5", "chunked reply decoded");
}

static void testBatch() {
    asio::io_context io;
    FakeNode node(io);

    // Answer out of order, second call fails
    node.respond = [](const json& request) {
        json reply = json::array();
        for (auto it = request.rbegin(); it != request.rend(); ++it) {
            const json& call = *it;
            if (call["params"][0] == "0x2") {
                reply.push_back({{"jsonrpc", "2.0"}, {"id", call["id"]},
                                 {"error", {{"code", -1}, {"message", "missing"}}}});
            } else {
                reply.push_back({{"jsonrpc", "2.0"}, {"id", call["id"]},
                                 {"result", {{"number", call["params"][0]}}}});
            }
        }
        return httpReply(reply.dump());
    };

    JsonRpcClient client(io, endpointFor(node));
    std::optional<boost::system::error_code> status;
    std::vector<json> results;
    client.batch({{"eth_getBlockByNumber", json::array({"0x1", false})},
                  {"eth_getBlockByNumber", json::array({"0x2", false})},
                  {"eth_getBlockByNumber", json::array({"0x3", false})}},
                 [&](const boost::system::error_code& ec, const std::vector<json>& r) {
                     status = ec;
                     results = r;
                 });
    runUntil(io, [&]() { return status.has_value(); });

    check(status && !*status && results.size() == 3, "batch completes");
    check(results[0]["number"] == "0x1" && results[2]["number"] == "0x3", "results in request order");
    check(results[1].is_null(), "failed entry is null");
    check(node.requests.size() == 1 && node.requests[0].is_array(), "one HTTP request for the batch");

    status.reset();
    client.batch({}, [&](const boost::system::error_code& ec, const std::vector<json>& r) {
        status = ec;
        results = r;
    });
    runUntil(io, [&]() { return status.has_value(); });
    check(status && !*status && results.empty() && node.requests.size() == 1, "empty batch sends nothing");
}

static void testTimeoutAndCancel() {
    asio::io_context io;
    FakeNode node(io);
    node.respond = [](const json&) { return std::string(); };

    JsonRpcClient client(io, endpointFor(node, 50ms));
    std::optional<boost::system::error_code> status;
    int calls = 0;
    client.call("eth_syncing", json::array(), [&](const boost::system::error_code& ec, const json&) {
        status = ec;
        calls++;
    });
    runUntil(io, [&]() { return status.has_value(); });
    check(status && *status == errc::timed_out, "silent node times out");

    io.restart();
    io.run_for(50ms);
    check(calls == 1 && client.inFlight() == 0, "handler runs once");

    status.reset();
    JsonRpcClient slow(io, endpointFor(node, 5000ms));
    slow.call("eth_syncing", json::array(), [&](const boost::system::error_code& ec, const json&) {
        status = ec;
    });
    slow.cancelAll();
    check(status && *status == asio::error::operation_aborted, "cancelAll aborts in-flight calls");
    check(slow.inFlight() == 0, "nothing in flight after cancel");
}

static void testRefused() {
    asio::io_context io;
    unsigned port = 0;
    {
        tcp::acceptor probe(io, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
        port = probe.local_endpoint().port();
    }

    RpcEndpoint endpoint;
    endpoint.port = port;
    endpoint.timeout = 1000ms;
    JsonRpcClient client(io, endpoint);

    std::optional<boost::system::error_code> status;
    client.call("net_version", json::array(), [&](const boost::system::error_code& ec, const json&) {
        status = ec;
    });
    runUntil(io, [&]() { return status.has_value(); });
    check(status && *status && *status != errc::timed_out, "closed port reports a connection error");
}

static json minedBlock(uint64_t number, const std::string& miner) {
    return {
        {"number", toQuantity(number)},
        {"hash", "0xhash" + std::to_string(number)},
        {"miner", miner},
        {"nonce", "0x0000000000000042"},
        {"difficulty", "0x20000"},
        {"timestamp", toQuantity(1700000000 + number)}
    };
}

static void testGethBackend() {
    asio::io_context io;
    FakeNode node(io);

    bool hashrateFails = true;
    node.respond = [&](const json& request) -> std::string {
        if (request.is_array()) {
            json reply = json::array();
            for (const auto& call : request) {
                auto n = parseQuantity(call["params"][0]).value_or(0);
                std::string miner = n % 2 == 0 ? "0xABCDEF" : "0x999999";
                reply.push_back({{"jsonrpc", "2.0"}, {"id", call["id"]}, {"result", minedBlock(n, miner)}});
            }
            return httpReply(reply.dump());
        }

        std::string method = request["method"].get<std::string>();
        if (method == "net_version") return result(request, "1337");
        if (method == "eth_blockNumber") return result(request, "0x14");
        if (method == "eth_hashrate" && hashrateFails) {
            return httpReply(json{{"jsonrpc", "2.0"}, {"id", request["id"]},
                                  {"error", {{"code", -32601}, {"message", "not supported"}}}}.dump());
        }
        if (method == "eth_hashrate" || method == "miner_hashrate") return result(request, "0x16e360");
        if (method == "eth_getBlockByNumber") return result(request, {{"difficulty", "0x249f0"}});
        return result(request, nullptr);
    };

    GethSettings settings;
    settings.rpc = endpointFor(node);
    settings.probeInterval = 10s;
    GethRpcBackend backend(io, settings);

    check(!backend.isBackendRunning(), "unreachable before first probe");
    backend.open();
    runUntil(io, [&]() { return backend.isBackendRunning(); });
    check(backend.isBackendRunning(), "probe marks node reachable");

    std::optional<std::string> rate;
    backend.getHashRate([&](const boost::system::error_code& ec, const std::string& text) {
        rate = ec ? "error" : text;
    });
    runUntil(io, [&]() { return rate.has_value(); });
    check(rate && *rate == "1.50 MH/s", "miner_hashrate fallback formatted");

    std::optional<uint64_t> height;
    backend.getBlockHeight([&](const boost::system::error_code& ec, uint64_t h) {
        height = ec ? 0 : h;
    });
    runUntil(io, [&]() { return height.has_value(); });
    check(height && *height == 20, "block height");

    std::optional<std::vector<BlockReport>> blocks;
    backend.getRecentMinedBlocks("0xabcdef", 5, 2, [&](const boost::system::error_code& ec,
                                                        const std::vector<BlockReport>& b) {
        blocks = ec ? std::vector<BlockReport>() : b;
    });
    runUntil(io, [&]() { return blocks.has_value(); });
    check(blocks && blocks->size() == 2, "blocks limited");
    check(blocks && blocks->size() == 2 && (*blocks)[0].number == 20 && (*blocks)[1].number == 18,
          "own blocks newest first, case-insensitive match");
    check(blocks && !blocks->empty() && (*blocks)[0].nonce == uint64_t(0x42) &&
          (*blocks)[0].difficulty == uint64_t(0x20000) && !(*blocks)[0].reward,
          "block fields parsed, reward left to the ledger");

    std::optional<NetworkStats> network;
    backend.getNetworkStats([&](const boost::system::error_code& ec, const NetworkStats& stats) {
        network = ec ? NetworkStats() : stats;
    });
    runUntil(io, [&]() { return network.has_value(); });
    check(network && network->difficulty == 150000 && network->networkHashRate == 10000.0,
          "network hash rate from difficulty");

    std::optional<boost::system::error_code> started;
    backend.startMining("0xabcdef", 3, [&](const boost::system::error_code& ec) { started = ec; });
    runUntil(io, [&]() { return started.has_value(); });
    check(started && !*started, "start mining acknowledged");

    bool setEtherbase = false;
    bool minerStart = false;
    for (const auto& request : node.requests) {
        if (!request.is_object()) continue;
        if (request["method"] == "miner_setEtherbase" && request["params"][0] == "0xabcdef") {
            setEtherbase = true;
        }
        if (request["method"] == "miner_start" && request["params"][0] == 3) {
            minerStart = true;
        }
    }
    check(setEtherbase && minerStart, "etherbase set before miner_start");

    backend.close();
    check(backend.rpc().inFlight() == 0, "close aborts requests");
}

int main() {
    Log::setConsole(false);

    std::cout << "=== Quantities ===" << std::endl;
    testQuantities();

    std::cout << "\n=== JsonRpcClient ===" << std::endl;
    testCall();
    testErrors();
    testChunked();
    testBatch();
    testTimeoutAndCancel();
    testRefused();

    std::cout << "\n=== GethRpcBackend ===" << std::endl;
    testGethBackend();

    std::cout << "\n=== Summary ===" << std::endl;
    std::cout << "Passed: " << passed << ", Failed: " << failed << std::endl;

    return failed == 0 ? 0 : 1;
}
