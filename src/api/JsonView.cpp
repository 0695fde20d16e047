/**
 * chiralmon - JSON Views Implementation
 */

#include "JsonView.h"
#include "Version.h"
#include "util/Units.h"

namespace chiral {
namespace JsonView {

namespace {

const char* sortName(BlockSort sort) {
    switch (sort) {
        case BlockSort::Newest:      return "newest";
        case BlockSort::BlockNumber: return "block_number";
        case BlockSort::Reward:      return "reward";
        default:                     return "newest";
    }
}

template <typename T>
json pageJson(const PaginationView& view, const std::vector<T>& items) {
    json out;
    out["page"] = view.currentPage();
    out["page_size"] = view.pageSize();
    out["total_pages"] = view.totalPages();
    out["total_items"] = view.totalItems();

    json list = json::array();
    for (const auto& item : view.slice(items)) {
        list.push_back(toJson(item));
    }
    out["items"] = list;
    return out;
}

}  // namespace

uint64_t unixSeconds(SystemClock::time_point at) {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(at.time_since_epoch()).count());
}

json toJson(const HashRate& rate) {
    return {
        {"display", formatRate(rate.rate())},
        {"value", rate.value},
        {"unit", rateUnitSuffix(rate.unit)},
        {"rate", rate.rate()},
        {"source", toString(rate.source)}
    };
}

json toJson(const MiningSessionSnapshot& session) {
    json out;
    out["state"] = toString(session.state);
    out["active"] = session.isActive;
    if (session.sessionStartedAt) {
        out["started_at"] = unixSeconds(*session.sessionStartedAt);
        out["elapsed"] = static_cast<uint64_t>(session.elapsedSeconds());
    } else {
        out["started_at"] = nullptr;
        out["elapsed"] = 0;
    }
    out["workers"] = {
        {"active", session.activeWorkers},
        {"max", session.maxWorkers},
        {"intensity", session.intensityPercent}
    };
    out["hashrate"] = toJson(session.hashRate);
    out["hashrate_average"] = session.averageRate;
    out["total_hashes"] = session.totalHashesEstimate;
    out["block_height"] = session.blockHeight;
    out["blocks_per_minute"] = session.blocksPerMinute;
    out["network"] = {
        {"difficulty", session.network.difficulty},
        {"hashrate", session.network.networkHashRate},
        {"hashrate_display", formatRate(session.network.networkHashRate)}
    };
    out["backend_running"] = session.backendRunning;
    out["consecutive_failures"] = session.consecutiveFailures;
    return out;
}

json toJson(const MinedBlockRecord& record) {
    return {
        {"hash", record.hash},
        {"number", record.blockNumber},
        {"nonce", record.nonce},
        {"difficulty", record.difficulty},
        {"reward", record.reward},
        {"timestamp", record.discoveredAt}
    };
}

json toJson(const LedgerTransaction& tx) {
    json out = {
        {"id", tx.id},
        {"block_hash", tx.blockHash},
        {"block_number", tx.blockNumber},
        {"amount", tx.amount},
        {"status", toString(tx.status)},
        {"created_at", unixSeconds(tx.createdAt)}
    };
    out["confirmed_at"] = tx.confirmedAt ? json(unixSeconds(*tx.confirmedAt)) : json(nullptr);
    return out;
}

json toJson(const ProxyNode& node) {
    json out;
    out["id"] = node.id;
    out["address"] = node.address ? json(*node.address) : json(nullptr);
    out["status"] = toString(node.status);
    out["latency_ms"] = node.latencyMs ? json(*node.latencyMs) : json(nullptr);
    out["region"] = node.region;
    if (!node.error.empty()) {
        out["error"] = node.error;
    }
    return out;
}

json history(const std::deque<HistoryPoint>& points) {
    json out = json::array();
    for (const auto& point : points) {
        out.push_back({
            {"time", unixSeconds(point.at)},
            {"rate", point.rate},
            {"source", toString(point.source)}
        });
    }
    return out;
}

json status(const MiningMonitor& monitor, const BlockLedger& ledger) {
    json out;
    out["version"] = VERSION_STRING;
    out["account"] = monitor.account();
    out["session"] = toJson(monitor.snapshot());
    out["history"] = history(monitor.history());
    out["ledger"] = {
        {"blocks_found", ledger.blocksFound()},
        {"total_credited", ledger.totalCredited()},
        {"pending", ledger.pendingAmount()}
    };
    return out;
}

json blocksPage(const BlockLedger& ledger, std::optional<size_t> page, std::optional<size_t> pageSize) {
    std::vector<MinedBlockRecord> items = ledger.filtered();

    // Local view so a request never moves the ledger's own page
    PaginationView view(pageSize.value_or(ledger.view().pageSize()));
    view.update(items.size());
    view.setPage(page.value_or(ledger.view().currentPage()));

    json out = pageJson(view, items);
    out["sort"] = sortName(ledger.sort());
    out["total_credited"] = ledger.totalCredited();
    out["blocks_found"] = ledger.blocksFound();
    return out;
}

json transactions(const BlockLedger& ledger) {
    json list = json::array();
    const auto& txs = ledger.transactions();
    for (auto it = txs.rbegin(); it != txs.rend(); ++it) {
        list.push_back(toJson(*it));
    }

    return {
        {"transactions", list},
        {"pending", ledger.pendingAmount()},
        {"total_credited", ledger.totalCredited()}
    };
}

json proxiesPage(const ProxyManager& proxies, std::optional<ProxyStatus> status,
                 std::optional<size_t> page, std::optional<size_t> pageSize) {
    std::vector<ProxyNode> items;
    for (auto& node : proxies.nodes()) {
        if (!status || node.status == *status) {
            items.push_back(std::move(node));
        }
    }

    PaginationView view(pageSize.value_or(proxies.view().pageSize()));
    view.update(items.size());
    view.setPage(page.value_or(1));

    json out = pageJson(view, items);
    out["filter"] = status ? json(toString(*status)) : json(nullptr);
    out["counts"] = {
        {"online", proxies.countByStatus(ProxyStatus::Online)},
        {"connecting", proxies.countByStatus(ProxyStatus::Connecting)},
        {"offline", proxies.countByStatus(ProxyStatus::Offline)},
        {"timeout", proxies.countByStatus(ProxyStatus::Timeout)},
        {"error", proxies.countByStatus(ProxyStatus::Error)}
    };
    return out;
}

}  // namespace JsonView
}  // namespace chiral
