/**
 * chiralmon - JSON Views
 *
 * Read-only JSON projections of the monitor, ledger and proxy manager.
 * Nothing here mutates the components it reads.
 */

#pragma once

#include "core/BlockLedger.h"
#include "core/MiningMonitor.h"
#include "core/Types.h"
#include "proxy/ProxyManager.h"
#include <nlohmann/json.hpp>
#include <deque>
#include <optional>

namespace chiral {

using json = nlohmann::json;

namespace JsonView {

json toJson(const HashRate& rate);
json toJson(const MiningSessionSnapshot& session);
json toJson(const MinedBlockRecord& record);
json toJson(const LedgerTransaction& tx);
json toJson(const ProxyNode& node);

json history(const std::deque<HistoryPoint>& points);

/**
 * Session snapshot plus ledger totals
 */
json status(const MiningMonitor& monitor, const BlockLedger& ledger);

/**
 * One page of the ledger's filtered/sorted projection
 *
 * Page and size default to the ledger's own view; out-of-range pages clamp.
 */
json blocksPage(const BlockLedger& ledger, std::optional<size_t> page = std::nullopt,
                std::optional<size_t> pageSize = std::nullopt);

json transactions(const BlockLedger& ledger);

/**
 * One page of proxy nodes, optionally restricted to one status
 */
json proxiesPage(const ProxyManager& proxies, std::optional<ProxyStatus> status = std::nullopt,
                 std::optional<size_t> page = std::nullopt,
                 std::optional<size_t> pageSize = std::nullopt);

/**
 * Seconds since the unix epoch
 */
uint64_t unixSeconds(SystemClock::time_point at);

}  // namespace JsonView

}  // namespace chiral
