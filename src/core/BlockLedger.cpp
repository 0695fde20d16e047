/**
 * chiralmon - Block Ledger Implementation
 */

#include "BlockLedger.h"
#include "util/Log.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace chiral {

bool BlockFilter::matches(const MinedBlockRecord& record) const {
    if (!hashPrefix.empty() && record.hash.compare(0, hashPrefix.size(), hashPrefix) != 0) {
        return false;
    }
    if (minBlockNumber && record.blockNumber < *minBlockNumber) {
        return false;
    }
    return true;
}

BlockLedger::BlockLedger(LedgerSettings settings)
    : m_settings(settings)
    , m_view(settings.pageSize)
{
    if (m_settings.capacity == 0) {
        m_settings.capacity = 1;
    }
}

BlockLedger::BlockLedger(LedgerSettings settings, const std::vector<MinedBlockRecord>& existing)
    : BlockLedger(settings)
{
    for (const auto& record : existing) {
        if (record.hash.empty() || !m_seen.insert(record.hash).second) {
            continue;
        }
        m_totalCredited += record.reward;
        if (m_records.size() < m_settings.capacity) {
            m_records.push_back(record);
        }
    }
    recomputeView();
}

std::vector<MinedBlockRecord> BlockLedger::ingest(const std::vector<BlockReport>& candidates) {
    std::vector<MinedBlockRecord> credited;

    for (const auto& report : candidates) {
        if (report.hash.empty()) {
            Log::debug("Ignoring block report without hash (number " +
                       std::to_string(report.number) + ")");
            continue;
        }

        if (!m_seen.insert(report.hash).second) {
            continue;
        }

        MinedBlockRecord record;
        record.hash = report.hash;
        record.blockNumber = report.number;
        record.nonce = report.nonce.value_or(0);
        record.difficulty = report.difficulty.value_or(0);
        record.reward = report.reward.value_or(m_settings.defaultReward);
        record.discoveredAt = report.timestamp;

        m_records.push_front(record);
        m_totalCredited += record.reward;

        LedgerTransaction tx;
        tx.id = m_nextTransactionId++;
        tx.blockHash = record.hash;
        tx.blockNumber = record.blockNumber;
        tx.amount = record.reward;
        tx.status = TransactionStatus::Pending;
        tx.createdAt = SystemClock::now();
        m_transactionIndex[record.hash] = m_transactions.size();
        m_transactions.push_back(tx);

        std::ostringstream ss;
        ss << "Block #" << record.blockNumber << " credited: " << record.hash
           << " reward=" << std::fixed << std::setprecision(4) << record.reward;
        Log::info(ss.str());

        if (m_creditCallback) {
            m_creditCallback(record, tx);
        }

        credited.push_back(std::move(record));
    }

    while (m_records.size() > m_settings.capacity) {
        m_records.pop_back();
    }

    if (!credited.empty()) {
        m_view.firstPage();
    }
    recomputeView();

    return credited;
}

bool BlockLedger::contains(const std::string& hash) const {
    return m_seen.find(hash) != m_seen.end();
}

double BlockLedger::pendingAmount() const {
    double total = 0;
    for (const auto& tx : m_transactions) {
        if (tx.status == TransactionStatus::Pending) {
            total += tx.amount;
        }
    }
    return total;
}

bool BlockLedger::confirm(const std::string& hash) {
    auto it = m_transactionIndex.find(hash);
    if (it == m_transactionIndex.end()) {
        return false;
    }

    auto& tx = m_transactions[it->second];
    if (tx.status == TransactionStatus::Completed) {
        return false;
    }

    tx.status = TransactionStatus::Completed;
    tx.confirmedAt = SystemClock::now();
    Log::debug("Credit for block " + hash + " confirmed");
    return true;
}

size_t BlockLedger::confirmMatured(uint64_t height, uint64_t depth) {
    std::vector<std::string> matured;
    for (const auto& tx : m_transactions) {
        if (tx.status == TransactionStatus::Pending &&
            tx.blockNumber + depth <= height) {
            matured.push_back(tx.blockHash);
        }
    }

    size_t confirmed = 0;
    for (const auto& hash : matured) {
        if (confirm(hash)) {
            confirmed++;
        }
    }
    return confirmed;
}

std::optional<LedgerTransaction> BlockLedger::transaction(const std::string& hash) const {
    auto it = m_transactionIndex.find(hash);
    if (it == m_transactionIndex.end()) {
        return std::nullopt;
    }
    return m_transactions[it->second];
}

void BlockLedger::setPageSize(size_t pageSize) {
    m_view.setPageSize(pageSize);
    recomputeView();
}

void BlockLedger::setPage(size_t page) {
    m_view.setPage(page);
}

void BlockLedger::setFilter(BlockFilter filter) {
    m_filter = std::move(filter);
    recomputeView();
}

void BlockLedger::setSort(BlockSort sort) {
    m_sort = sort;
    recomputeView();
}

std::vector<MinedBlockRecord> BlockLedger::filtered() const {
    std::vector<MinedBlockRecord> out;
    out.reserve(m_records.size());
    for (const auto& record : m_records) {
        if (m_filter.matches(record)) {
            out.push_back(record);
        }
    }

    switch (m_sort) {
        case BlockSort::Newest:
            break;
        case BlockSort::BlockNumber:
            std::stable_sort(out.begin(), out.end(),
                [](const MinedBlockRecord& a, const MinedBlockRecord& b) {
                    return a.blockNumber > b.blockNumber;
                });
            break;
        case BlockSort::Reward:
            std::stable_sort(out.begin(), out.end(),
                [](const MinedBlockRecord& a, const MinedBlockRecord& b) {
                    return a.reward > b.reward;
                });
            break;
    }
    return out;
}

std::vector<MinedBlockRecord> BlockLedger::page() const {
    return m_view.slice(filtered());
}

void BlockLedger::recomputeView() {
    size_t count = 0;
    for (const auto& record : m_records) {
        if (m_filter.matches(record)) {
            count++;
        }
    }
    m_view.update(count);
}

}  // namespace chiral
