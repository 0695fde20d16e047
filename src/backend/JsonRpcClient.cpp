/**
 * chiralmon - JSON-RPC over HTTP Client Implementation
 */

#include "JsonRpcClient.h"
#include "core/Errors.h"
#include "util/Log.h"
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <algorithm>
#include <cctype>
#include <exception>
#include <limits>
#include <map>
#include <sstream>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace chiral {

std::optional<uint64_t> parseQuantity(const json& value) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (!value.is_string()) {
        return std::nullopt;
    }

    const std::string& text = value.get_ref<const std::string&>();
    if (text.size() < 3 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
        return std::nullopt;
    }

    uint64_t result = 0;
    for (size_t i = 2; i < text.size(); i++) {
        int c = std::tolower(static_cast<unsigned char>(text[i]));
        int digit;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (c >= 'a' && c <= 'f') {
            digit = c - 'a' + 10;
        } else {
            return std::nullopt;
        }

        if (result > (std::numeric_limits<uint64_t>::max() >> 4)) {
            result = std::numeric_limits<uint64_t>::max();
            continue;
        }
        result = (result << 4) | static_cast<uint64_t>(digit);
    }
    return result;
}

std::string toQuantity(uint64_t value) {
    std::ostringstream ss;
    ss << "0x" << std::hex << value;
    return ss.str();
}

namespace {

std::string errorText(const json& error) {
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        return error["message"].get<std::string>();
    }
    if (error.is_string()) {
        return error.get<std::string>();
    }
    return error.dump();
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool dechunk(const std::string& in, std::string& out) {
    size_t pos = 0;
    out.clear();
    while (pos < in.size()) {
        size_t eol = in.find("\r\n", pos);
        if (eol == std::string::npos) {
            return false;
        }

        size_t size = 0;
        std::istringstream hex(in.substr(pos, eol - pos));
        if (!(hex >> std::hex >> size)) {
            return false;
        }
        if (size == 0) {
            return true;
        }

        pos = eol + 2;
        if (pos + size > in.size()) {
            return false;
        }
        out.append(in, pos, size);
        pos += size + 2;
    }
    return false;
}

}  // namespace

JsonRpcClient::JsonRpcClient(asio::io_context& io, RpcEndpoint endpoint)
    : m_io(io)
    , m_endpoint(std::move(endpoint))
    , m_alive(std::make_shared<int>(0))
{
}

JsonRpcClient::~JsonRpcClient() {
    m_alive.reset();

    // Handlers are not invoked during destruction
    for (const auto& ex : m_exchanges) {
        ex->done = true;
        ex->deadline.cancel();
        ex->resolver.cancel();
        boost::system::error_code ec;
        ex->socket.close(ec);
    }
    m_exchanges.clear();
}

json JsonRpcClient::envelope(const std::string& method, const json& params) {
    return {
        {"jsonrpc", "2.0"},
        {"id", m_nextId++},
        {"method", method},
        {"params", params}
    };
}

void JsonRpcClient::call(const std::string& method, const json& params, RpcHandler handler) {
    json request = envelope(method, params);

    post(request.dump(), [this, method, handler](const boost::system::error_code& ec,
                                                 const std::string& body) {
        if (ec) {
            handler(ec, json());
            return;
        }

        json msg;
        try {
            msg = json::parse(body);
        } catch (const json::exception& e) {
            Log::debug(method + ": unparseable reply: " + std::string(e.what()));
            handler(make_error_code(errc::bad_response), json());
            return;
        }

        if (!msg.is_object()) {
            handler(make_error_code(errc::bad_response), json());
            return;
        }

        if (msg.contains("error") && !msg["error"].is_null()) {
            m_lastRpcError = errorText(msg["error"]);
            Log::debug(method + " failed: " + m_lastRpcError);
            handler(make_error_code(errc::rpc_error), json());
            return;
        }

        if (!msg.contains("result")) {
            handler(make_error_code(errc::bad_response), json());
            return;
        }

        handler(boost::system::error_code(), msg["result"]);
    });
}

void JsonRpcClient::batch(const std::vector<std::pair<std::string, json>>& calls,
                          RpcBatchHandler handler) {
    if (calls.empty()) {
        asio::post(m_io, [handler]() { handler(boost::system::error_code(), std::vector<json>()); });
        return;
    }

    json request = json::array();
    std::map<uint64_t, size_t> slots;
    for (size_t i = 0; i < calls.size(); i++) {
        json entry = envelope(calls[i].first, calls[i].second);
        slots[entry["id"].get<uint64_t>()] = i;
        request.push_back(std::move(entry));
    }

    size_t count = calls.size();
    post(request.dump(), [this, slots, count, handler](const boost::system::error_code& ec,
                                                       const std::string& body) {
        std::vector<json> results(count);
        if (ec) {
            handler(ec, results);
            return;
        }

        json msg;
        try {
            msg = json::parse(body);
        } catch (const json::exception& e) {
            Log::debug("Batch reply unparseable: " + std::string(e.what()));
            handler(make_error_code(errc::bad_response), results);
            return;
        }

        // Nodes answer a rejected batch with a single error object
        if (msg.is_object() && msg.contains("error") && !msg["error"].is_null()) {
            m_lastRpcError = errorText(msg["error"]);
            handler(make_error_code(errc::rpc_error), results);
            return;
        }
        if (!msg.is_array()) {
            handler(make_error_code(errc::bad_response), results);
            return;
        }

        for (const auto& entry : msg) {
            if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_number_unsigned()) {
                continue;
            }
            auto slot = slots.find(entry["id"].get<uint64_t>());
            if (slot == slots.end()) {
                continue;
            }
            if (entry.contains("error") && !entry["error"].is_null()) {
                m_lastRpcError = errorText(entry["error"]);
                continue;
            }
            if (entry.contains("result")) {
                results[slot->second] = entry["result"];
            }
        }

        handler(boost::system::error_code(), results);
    });
}

void JsonRpcClient::cancelAll() {
    auto exchanges = m_exchanges;
    for (const auto& ex : exchanges) {
        finish(ex, asio::error::operation_aborted, std::string());
    }
}

void JsonRpcClient::post(const std::string& body, BodyHandler handler) {
    auto ex = std::make_shared<Exchange>(m_io);
    ex->complete = std::move(handler);

    std::ostringstream request;
    request << "POST / HTTP/1.1\r\n"
            << "Host: " << m_endpoint.host << ":" << m_endpoint.port << "\r\n"
            << "Content-Type: application/json\r\n"
            << "Accept: application/json\r\n"
            << "Content-Length: " << body.size() << "\r\n"
            << "Connection: close\r\n"
            << "\r\n"
            << body;
    ex->request = request.str();
    m_exchanges.insert(ex);

    std::weak_ptr<int> alive = m_alive;

    ex->deadline.expires_after(m_endpoint.timeout);
    ex->deadline.async_wait([this, alive, ex](const boost::system::error_code& ec) {
        if (ec || alive.expired() || ex->done) return;
        finish(ex, make_error_code(errc::timed_out), std::string());
    });

    ex->resolver.async_resolve(m_endpoint.host, std::to_string(m_endpoint.port),
        [this, alive, ex](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            if (alive.expired() || ex->done) return;
            if (ec) {
                finish(ex, ec, std::string());
                return;
            }

            asio::async_connect(ex->socket, results,
                [this, alive, ex](const boost::system::error_code& ec, const tcp::endpoint&) {
                    if (alive.expired() || ex->done) return;
                    if (ec) {
                        finish(ex, ec, std::string());
                        return;
                    }

                    asio::async_write(ex->socket, asio::buffer(ex->request),
                        [this, alive, ex](const boost::system::error_code& ec, size_t) {
                            if (alive.expired() || ex->done) return;
                            if (ec) {
                                finish(ex, ec, std::string());
                                return;
                            }

                            // Connection: close, so the reply ends at EOF
                            asio::async_read(ex->socket, ex->response,
                                [this, alive, ex](const boost::system::error_code& ec, size_t) {
                                    if (alive.expired() || ex->done) return;
                                    if (ec && ec != asio::error::eof) {
                                        finish(ex, ec, std::string());
                                        return;
                                    }

                                    auto data = ex->response.data();
                                    std::string raw(asio::buffers_begin(data), asio::buffers_end(data));
                                    std::string body;
                                    boost::system::error_code parseEc = parseHttp(raw, body);
                                    finish(ex, parseEc, body);
                                });
                        });
                });
        });
}

void JsonRpcClient::finish(const ExchangePtr& ex, const boost::system::error_code& ec,
                           const std::string& body) {
    if (ex->done) {
        return;
    }
    ex->done = true;

    ex->deadline.cancel();
    ex->resolver.cancel();
    boost::system::error_code closeEc;
    ex->socket.close(closeEc);
    if (closeEc) {
        Log::debug("RPC socket close: " + closeEc.message());
    }

    ExchangePtr keep = ex;
    m_exchanges.erase(keep);

    BodyHandler handler = std::move(keep->complete);
    if (!handler) {
        return;
    }

    try {
        handler(ec, body);
    } catch (const std::exception& e) {
        Log::error("RPC completion handler failed: " + std::string(e.what()));
    }
}

boost::system::error_code JsonRpcClient::parseHttp(const std::string& raw, std::string& body) {
    size_t headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        return make_error_code(errc::bad_response);
    }

    std::istringstream head(raw.substr(0, headerEnd));
    std::string statusLine;
    std::getline(head, statusLine);

    std::istringstream status(statusLine);
    std::string version;
    int code = 0;
    status >> version >> code;
    if (version.compare(0, 5, "HTTP/") != 0 || code == 0) {
        return make_error_code(errc::bad_response);
    }
    if (code < 200 || code >= 300) {
        Log::debug("RPC endpoint answered HTTP " + std::to_string(code));
        return make_error_code(errc::rpc_error);
    }

    bool chunked = false;
    std::string line;
    while (std::getline(head, line)) {
        std::string header = lower(line);
        if (header.compare(0, 18, "transfer-encoding:") == 0 &&
            header.find("chunked") != std::string::npos) {
            chunked = true;
        }
    }

    std::string payload = raw.substr(headerEnd + 4);
    if (!chunked) {
        body = std::move(payload);
        return {};
    }

    if (!dechunk(payload, body)) {
        return make_error_code(errc::bad_response);
    }
    return {};
}

}  // namespace chiral
