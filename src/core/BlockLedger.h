/**
 * chiralmon - Block Ledger
 *
 * Deduplicated, bounded record of blocks mined by the configured account,
 * with a two-phase credit log.
 */

#pragma once

#include "Pagination.h"
#include "Types.h"
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace chiral {

/**
 * Ledger settings
 */
struct LedgerSettings {
    size_t capacity = 50;             // visible records kept
    double defaultReward = 2.0;       // used when the backend reports none
    size_t pageSize = 10;
    uint64_t confirmationDepth = 12;  // blocks before a credit completes
};

/**
 * Ledger sort order for the paginated view
 */
enum class BlockSort {
    Newest,       // insertion order, most recent first
    BlockNumber,  // highest block number first
    Reward        // highest reward first
};

/**
 * Ledger filter for the paginated view
 */
struct BlockFilter {
    std::string hashPrefix;
    std::optional<uint64_t> minBlockNumber;

    bool matches(const MinedBlockRecord& record) const;
};

/**
 * Called once per newly credited block
 */
using CreditCallback = std::function<void(const MinedBlockRecord&, const LedgerTransaction&)>;

/**
 * BlockLedger class
 *
 * Every hash is credited at most once for the lifetime of the ledger. The
 * visible list is capped; evicted hashes stay in the seen set so a block
 * that scrolled out cannot be credited again. Duplicates are expected under
 * overlapping polls and are ignored silently.
 */
class BlockLedger {
public:
    explicit BlockLedger(LedgerSettings settings = LedgerSettings());

    /**
     * Construct from a previously held ledger
     *
     * Existing records are marked seen and counted in the credited total
     * without producing new credits or transactions.
     */
    BlockLedger(LedgerSettings settings, const std::vector<MinedBlockRecord>& existing);

    /**
     * Ingest backend block reports
     *
     * @param candidates Reports in backend order
     * @return Records credited by this call, in credit order
     */
    std::vector<MinedBlockRecord> ingest(const std::vector<BlockReport>& candidates);

    /**
     * Check whether a hash was ever credited (visible or evicted)
     */
    bool contains(const std::string& hash) const;

    /**
     * Visible records, most recent first
     */
    const std::deque<MinedBlockRecord>& records() const { return m_records; }

    size_t size() const { return m_records.size(); }

    /**
     * Unique blocks ever credited
     */
    uint64_t blocksFound() const { return m_seen.size(); }

    /**
     * Sum of rewards over every credited hash
     */
    double totalCredited() const { return m_totalCredited; }

    /**
     * Sum of rewards still pending confirmation
     */
    double pendingAmount() const;

    /**
     * Mark the credit for a block hash as completed
     *
     * @return true if the transaction was pending
     */
    bool confirm(const std::string& hash);

    /**
     * Confirm every pending credit at least confirmationDepth blocks deep
     *
     * @param height Authoritative chain height
     * @return Number of credits confirmed
     */
    size_t confirmMatured(uint64_t height) { return confirmMatured(height, m_settings.confirmationDepth); }
    size_t confirmMatured(uint64_t height, uint64_t depth);

    /**
     * Credit log, oldest first
     */
    const std::vector<LedgerTransaction>& transactions() const { return m_transactions; }

    std::optional<LedgerTransaction> transaction(const std::string& hash) const;

    void setCreditCallback(CreditCallback callback) { m_creditCallback = std::move(callback); }

    // --- paginated view ---

    void setPageSize(size_t pageSize);
    void setPage(size_t page);
    void setFilter(BlockFilter filter);
    void setSort(BlockSort sort);

    const PaginationView& view() const { return m_view; }
    const BlockFilter& filter() const { return m_filter; }
    BlockSort sort() const { return m_sort; }

    /**
     * Filtered and sorted projection of the visible records
     */
    std::vector<MinedBlockRecord> filtered() const;

    /**
     * Records on the current page
     */
    std::vector<MinedBlockRecord> page() const;

    const LedgerSettings& settings() const { return m_settings; }

private:
    void recomputeView();

private:
    LedgerSettings m_settings;

    std::deque<MinedBlockRecord> m_records;
    std::unordered_set<std::string> m_seen;
    double m_totalCredited{0};

    std::vector<LedgerTransaction> m_transactions;
    std::unordered_map<std::string, size_t> m_transactionIndex;
    uint64_t m_nextTransactionId{1};

    CreditCallback m_creditCallback;

    PaginationView m_view;
    BlockFilter m_filter;
    BlockSort m_sort{BlockSort::Newest};
};

}  // namespace chiral
