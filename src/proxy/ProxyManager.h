/**
 * chiralmon - Proxy Connection Manager
 *
 * Per-address connection state machine over a ProxyTransport:
 *
 *   connecting -> online | timeout | error
 *   online     -> offline
 *   offline | timeout -> connecting   (addOrConnect again)
 *
 * Any node that is not online can be removed.
 */

#pragma once

#include "AddressValidator.h"
#include "ProxyTransport.h"
#include "core/Pagination.h"
#include "core/TimerScope.h"
#include "core/Types.h"
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chiral {

/**
 * Proxy manager settings
 */
struct ProxySettings {
    std::chrono::milliseconds connectTimeout{15000};
    std::chrono::milliseconds refreshInterval{30000};
    size_t pageSize = 10;
};

/**
 * ProxyManager class
 *
 * Owns the node map and one timeout timer per connecting address. Status
 * events from the transport are authoritative and always win over a pending
 * timeout.
 */
class ProxyManager {
public:
    ProxyManager(boost::asio::io_context& io, ProxyTransport& transport,
                 ProxySettings settings = ProxySettings());
    ~ProxyManager();

    // Non-copyable
    ProxyManager(const ProxyManager&) = delete;
    ProxyManager& operator=(const ProxyManager&) = delete;

    /**
     * Subscribe to transport events and start the periodic refresh
     *
     * @return false if already open or closed
     */
    bool open();

    /**
     * Unsubscribe and cancel every timer (runs once)
     */
    void close();

    /**
     * Add a node, or reconnect one that is offline or timed out
     *
     * Validation happens before any transport call.
     *
     * @return validation_failed, duplicate_resource, scope_closed, or success
     */
    boost::system::error_code addOrConnect(const std::string& address, const std::string& credential);

    /**
     * Reason for the last validation_failed returned by addOrConnect()
     */
    AddressError lastAddressError() const { return m_lastAddressError; }

    /**
     * Request a disconnect; the node goes offline on the following event
     *
     * @return unknown_node or success
     */
    boost::system::error_code disconnect(const std::string& address);

    /**
     * Forget a node that is not online
     *
     * @return node_online, unknown_node or success
     */
    boost::system::error_code remove(const std::string& address);

    /**
     * Apply an authoritative status event
     */
    void onStatusEvent(const ProxyStatusEvent& event);

    /**
     * Resync every node from the transport's list
     */
    void refresh();

    // Queries

    std::optional<ProxyNode> node(const std::string& address) const;

    size_t size() const { return m_nodes.size(); }

    size_t countByStatus(ProxyStatus status) const;

    /**
     * All nodes ordered by status priority, then address
     */
    std::vector<ProxyNode> nodes() const;

    bool hasPendingTimeout(const std::string& address) const;

    size_t pendingTimeouts() const { return m_timers.pendingCount(); }

    // View

    void setStatusFilter(std::optional<ProxyStatus> status);
    void setPageSize(size_t pageSize);
    void setPage(size_t page);

    std::optional<ProxyStatus> statusFilter() const { return m_statusFilter; }
    const PaginationView& view() const { return m_view; }

    /**
     * Nodes passing the status filter, in priority order
     */
    std::vector<ProxyNode> filtered() const;

    /**
     * Current page of filtered()
     */
    std::vector<ProxyNode> page() const;

    const ProxySettings& settings() const { return m_settings; }

private:
    /**
     * Canonical host:port for a valid address, else the text unchanged
     */
    static std::string keyFor(const std::string& address);

    void onTimeout(const std::string& key);
    void setStatus(ProxyNode& node, ProxyStatus status);
    void recomputeView();

private:
    ProxyTransport& m_transport;
    ProxySettings m_settings;
    TimerScope m_timers;

    std::shared_ptr<int> m_alive;
    bool m_open{false};
    uint64_t m_subscription{0};

    std::map<std::string, ProxyNode> m_nodes;
    AddressError m_lastAddressError{AddressError::None};

    std::optional<ProxyStatus> m_statusFilter;
    PaginationView m_view;
};

}  // namespace chiral
