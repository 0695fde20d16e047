/**
 * chiralmon - Proxy Transport Interface
 *
 * Command calls plus a fan-out status event subscription. Status and
 * latency for a connect request arrive later as events keyed by address.
 */

#pragma once

#include "core/Types.h"
#include <boost/system/error_code.hpp>
#include <functional>
#include <string>
#include <vector>

namespace chiral {

using ProxyCommandHandler = std::function<void(const boost::system::error_code&)>;
using ProxyListHandler = std::function<void(const boost::system::error_code&,
                                            const std::vector<ProxyStatusEvent>&)>;
using ProxyEventCallback = std::function<void(const ProxyStatusEvent&)>;

/**
 * ProxyTransport class
 */
class ProxyTransport {
public:
    virtual ~ProxyTransport() = default;

    /**
     * Request a connection
     *
     * The handler reports only whether the request could be issued.
     */
    virtual void connectProxy(const std::string& address, const std::string& credential,
                              ProxyCommandHandler handler) = 0;

    virtual void disconnectProxy(const std::string& address, ProxyCommandHandler handler) = 0;

    /**
     * Current status of every node the transport knows
     */
    virtual void listProxies(ProxyListHandler handler) = 0;

    /**
     * Register an event subscriber
     *
     * @return Subscription id for unsubscribe()
     */
    virtual uint64_t subscribe(ProxyEventCallback callback) = 0;

    virtual void unsubscribe(uint64_t id) = 0;
};

}  // namespace chiral
