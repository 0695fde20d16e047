/**
 * chiralmon - Proxy Connection Manager Implementation
 */

#include "ProxyManager.h"
#include "core/Errors.h"
#include "util/Log.h"
#include <algorithm>
#include <sstream>

namespace chiral {

ProxyManager::ProxyManager(boost::asio::io_context& io, ProxyTransport& transport,
                           ProxySettings settings)
    : m_transport(transport)
    , m_settings(settings)
    , m_timers(io, "proxy")
    , m_alive(std::make_shared<int>(0))
    , m_view(settings.pageSize)
{
}

ProxyManager::~ProxyManager() {
    close();
}

bool ProxyManager::open() {
    if (m_open || !m_alive) {
        return false;
    }

    std::weak_ptr<int> alive = m_alive;
    m_subscription = m_transport.subscribe([this, alive](const ProxyStatusEvent& event) {
        if (alive.expired()) return;
        onStatusEvent(event);
    });

    if (PollScheduler* poller = m_timers.addPoller("refresh")) {
        poller->start(m_settings.refreshInterval, [this]() { refresh(); });
    }

    m_open = true;
    return true;
}

void ProxyManager::close() {
    if (!m_alive) {
        return;
    }

    m_alive.reset();
    if (m_open) {
        m_transport.unsubscribe(m_subscription);
    }
    m_timers.close();
    m_open = false;
}

std::string ProxyManager::keyFor(const std::string& address) {
    AddressCheck check = AddressValidator::check(address);
    return check.ok() ? check.canonical : address;
}

boost::system::error_code ProxyManager::addOrConnect(const std::string& address,
                                                     const std::string& credential) {
    if (!m_alive) {
        return make_error_code(errc::scope_closed);
    }

    AddressCheck check = AddressValidator::check(address);
    m_lastAddressError = check.error;
    if (!check.ok()) {
        Log::warning("Rejected proxy address '" + address + "': " + toString(check.error));
        return make_error_code(errc::validation_failed);
    }

    const std::string& key = check.canonical;
    auto it = m_nodes.find(key);
    if (it != m_nodes.end()) {
        ProxyStatus status = it->second.status;
        if (status != ProxyStatus::Offline && status != ProxyStatus::Timeout) {
            Log::warning("Proxy " + key + " already present (" + toString(status) + ")");
            return make_error_code(errc::duplicate_resource);
        }
        Log::info("Reconnecting proxy " + key + " (was " + toString(status) + ")");
    } else {
        ProxyNode node;
        node.id = key;
        node.address = key;
        it = m_nodes.emplace(key, std::move(node)).first;
        Log::info("Connecting proxy " + key);
    }

    ProxyNode& node = it->second;
    node.latencyMs.reset();
    node.error.clear();
    setStatus(node, ProxyStatus::Connecting);

    // Replaces any earlier timer for this address
    m_timers.schedule(key, m_settings.connectTimeout, [this, key]() { onTimeout(key); });
    recomputeView();

    std::weak_ptr<int> alive = m_alive;
    m_transport.connectProxy(key, credential, [this, alive, key](const boost::system::error_code& ec) {
        if (alive.expired() || !ec) return;

        auto it = m_nodes.find(key);
        if (it == m_nodes.end() || it->second.status != ProxyStatus::Connecting) {
            return;
        }

        m_timers.cancel(key);
        it->second.error = ec.message();
        setStatus(it->second, ProxyStatus::Error);
        Log::warning("Proxy " + key + " connect request failed: " + ec.message());
        recomputeView();
    });

    return {};
}

boost::system::error_code ProxyManager::disconnect(const std::string& address) {
    std::string key = keyFor(address);
    auto it = m_nodes.find(key);
    if (it == m_nodes.end()) {
        return make_error_code(errc::unknown_node);
    }

    m_timers.cancel(key);
    if (it->second.status == ProxyStatus::Connecting) {
        // A connecting node always owns a timer
        setStatus(it->second, ProxyStatus::Offline);
        recomputeView();
    }
    if (!it->second.address) {
        return {};
    }

    Log::info("Disconnecting proxy " + key);
    m_transport.disconnectProxy(key, [key](const boost::system::error_code& ec) {
        if (ec) {
            Log::warning("Proxy " + key + " disconnect failed: " + ec.message());
        }
    });
    return {};
}

boost::system::error_code ProxyManager::remove(const std::string& address) {
    std::string key = keyFor(address);
    auto it = m_nodes.find(key);
    if (it == m_nodes.end()) {
        return make_error_code(errc::unknown_node);
    }

    if (it->second.status == ProxyStatus::Online) {
        Log::warning("Proxy " + key + " is online, disconnect it before removing");
        return make_error_code(errc::node_online);
    }

    bool addressable = it->second.address.has_value();
    m_timers.cancel(key);
    m_nodes.erase(it);
    recomputeView();
    Log::info("Removed proxy " + key);

    if (addressable && m_alive) {
        m_transport.disconnectProxy(key, [key](const boost::system::error_code& ec) {
            if (ec) {
                Log::warning("Proxy " + key + " drop after remove failed: " + ec.message());
            }
        });
    }
    return {};
}

void ProxyManager::onStatusEvent(const ProxyStatusEvent& event) {
    std::string key = event.address ? keyFor(*event.address) : event.id;
    if (key.empty()) {
        Log::debug("Ignoring proxy event without address or id");
        return;
    }

    auto it = m_nodes.find(key);
    if (it == m_nodes.end()) {
        if (event.status != ProxyStatus::Online) {
            Log::debug("Ignoring " + std::string(toString(event.status)) +
                       " event for unknown proxy " + key);
            return;
        }

        ProxyNode node;
        node.id = event.id.empty() ? key : event.id;
        if (event.address) {
            node.address = key;
        }
        it = m_nodes.emplace(key, std::move(node)).first;
        Log::info("Discovered proxy " + key);
    }

    // Authoritative: beats any pending timeout. A connecting report keeps one armed.
    if (event.status == ProxyStatus::Connecting) {
        if (!m_timers.pending(key)) {
            m_timers.schedule(key, m_settings.connectTimeout, [this, key]() { onTimeout(key); });
        }
    } else {
        m_timers.cancel(key);
    }

    ProxyNode& node = it->second;
    if (!event.id.empty()) {
        node.id = event.id;
    }
    node.latencyMs = event.latencyMs;
    if (event.region) {
        node.region = *event.region;
    }
    node.error = event.error;

    ProxyStatus previous = node.status;
    setStatus(node, event.status);

    if (previous != event.status) {
        std::ostringstream ss;
        ss << "Proxy " << key << " " << toString(previous) << " -> " << toString(event.status);
        if (event.latencyMs) {
            ss << " (" << static_cast<long>(*event.latencyMs) << " ms)";
        }
        if (!event.error.empty()) {
            ss << ": " << event.error;
        }
        Log::info(ss.str());
    }

    recomputeView();
}

void ProxyManager::refresh() {
    if (!m_alive) {
        return;
    }

    std::weak_ptr<int> alive = m_alive;
    m_transport.listProxies([this, alive](const boost::system::error_code& ec,
                                          const std::vector<ProxyStatusEvent>& events) {
        if (alive.expired()) return;
        if (ec) {
            Log::warning("Proxy list refresh failed: " + ec.message());
            return;
        }
        for (const auto& event : events) {
            onStatusEvent(event);
        }
    });
}

void ProxyManager::onTimeout(const std::string& key) {
    auto it = m_nodes.find(key);
    if (it == m_nodes.end() || it->second.status != ProxyStatus::Connecting) {
        return;
    }

    setStatus(it->second, ProxyStatus::Timeout);
    Log::warning("Proxy " + key + " timed out after " +
                 std::to_string(m_settings.connectTimeout.count()) + " ms");
    recomputeView();
}

void ProxyManager::setStatus(ProxyNode& node, ProxyStatus status) {
    node.status = status;
    node.lastChange = SteadyClock::now();
}

std::optional<ProxyNode> ProxyManager::node(const std::string& address) const {
    auto it = m_nodes.find(keyFor(address));
    if (it == m_nodes.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t ProxyManager::countByStatus(ProxyStatus status) const {
    return static_cast<size_t>(std::count_if(m_nodes.begin(), m_nodes.end(),
        [status](const auto& entry) { return entry.second.status == status; }));
}

std::vector<ProxyNode> ProxyManager::nodes() const {
    std::vector<ProxyNode> out;
    out.reserve(m_nodes.size());
    for (const auto& entry : m_nodes) {
        out.push_back(entry.second);
    }

    // Map order already sorts by key; stable sort keeps it within a status
    std::stable_sort(out.begin(), out.end(), [](const ProxyNode& a, const ProxyNode& b) {
        return statusPriority(a.status) < statusPriority(b.status);
    });
    return out;
}

bool ProxyManager::hasPendingTimeout(const std::string& address) const {
    return m_timers.pending(keyFor(address));
}

void ProxyManager::setStatusFilter(std::optional<ProxyStatus> status) {
    m_statusFilter = status;
    recomputeView();
}

void ProxyManager::setPageSize(size_t pageSize) {
    m_view.setPageSize(pageSize);
    recomputeView();
}

void ProxyManager::setPage(size_t page) {
    m_view.setPage(page);
}

std::vector<ProxyNode> ProxyManager::filtered() const {
    std::vector<ProxyNode> all = nodes();
    if (!m_statusFilter) {
        return all;
    }

    std::vector<ProxyNode> out;
    for (auto& node : all) {
        if (node.status == *m_statusFilter) {
            out.push_back(std::move(node));
        }
    }
    return out;
}

std::vector<ProxyNode> ProxyManager::page() const {
    return m_view.slice(filtered());
}

void ProxyManager::recomputeView() {
    m_view.update(m_statusFilter ? countByStatus(*m_statusFilter) : m_nodes.size());
}

}  // namespace chiral
