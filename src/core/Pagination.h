/**
 * chiralmon - Pagination View
 *
 * Derived page state over a filtered and sorted projection. Owners call
 * update() after every change to the backing collection or filter.
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

namespace chiral {

class PaginationView {
public:
    explicit PaginationView(size_t pageSize = 10)
        : m_pageSize(pageSize == 0 ? 1 : pageSize)
    {}

    /**
     * Recompute for a new item count and clamp the current page
     */
    void update(size_t totalItems) {
        m_totalItems = totalItems;
        clamp();
    }

    /**
     * Change page size, keeping the current page in range
     */
    void setPageSize(size_t pageSize) {
        m_pageSize = pageSize == 0 ? 1 : pageSize;
        clamp();
    }

    /**
     * Select a page (1-based), clamped into range
     */
    void setPage(size_t page) {
        m_currentPage = page;
        clamp();
    }

    void firstPage() { m_currentPage = 1; }
    void nextPage() { setPage(m_currentPage + 1); }
    void previousPage() { setPage(m_currentPage > 1 ? m_currentPage - 1 : 1); }

    size_t pageSize() const { return m_pageSize; }
    size_t currentPage() const { return m_currentPage; }
    size_t totalItems() const { return m_totalItems; }

    // Never below 1, an empty collection still has one (empty) page
    size_t totalPages() const {
        if (m_totalItems == 0) return 1;
        return (m_totalItems + m_pageSize - 1) / m_pageSize;
    }

    size_t offset() const { return (m_currentPage - 1) * m_pageSize; }

    /**
     * Slice the current page out of an already filtered/sorted projection
     */
    template <typename T>
    std::vector<T> slice(const std::vector<T>& items) const {
        size_t begin = std::min(offset(), items.size());
        size_t end = std::min(begin + m_pageSize, items.size());
        return std::vector<T>(items.begin() + begin, items.begin() + end);
    }

private:
    void clamp() {
        m_currentPage = std::max<size_t>(1, std::min(m_currentPage, totalPages()));
    }

    size_t m_pageSize;
    size_t m_currentPage{1};
    size_t m_totalItems{0};
};

}  // namespace chiral
