/**
 * chiralmon - Moving Averages and Rate Windows
 *
 * Bounded sample windows used for the session hash-rate average and the
 * block-rate history.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>

namespace chiral {

/**
 * Simple Moving Average (SMA) with fixed window
 *
 * Uses a deque to maintain a sliding window of samples.
 */
class SimpleMovingAverage {
public:
    /**
     * Constructor
     * @param windowSize Number of samples to average
     */
    explicit SimpleMovingAverage(size_t windowSize = 10)
        : m_windowSize(windowSize)
        , m_sum(0)
    {}

    /**
     * Add a new sample
     * @param value New sample value
     */
    void add(double value) {
        m_samples.push_back(value);
        m_sum += value;

        while (m_samples.size() > m_windowSize) {
            m_sum -= m_samples.front();
            m_samples.pop_front();
        }
    }

    /**
     * Get current average
     */
    double get() const {
        if (m_samples.empty()) {
            return 0;
        }
        return m_sum / m_samples.size();
    }

    size_t count() const {
        return m_samples.size();
    }

    bool isFull() const {
        return m_samples.size() >= m_windowSize;
    }

    void reset() {
        m_samples.clear();
        m_sum = 0;
    }

private:
    size_t m_windowSize;
    std::deque<double> m_samples;
    double m_sum;
};

/**
 * Block-rate window
 *
 * Keeps the last N (time, height) observations and derives blocks per
 * minute across the window. Height regressions (reorgs, node restarts)
 * restart the window instead of producing negative rates.
 */
class BlockRateWindow {
public:
    using Clock = std::chrono::steady_clock;

    explicit BlockRateWindow(size_t capacity = 30)
        : m_capacity(capacity < 2 ? 2 : capacity)
    {}

    /**
     * Record an observed chain height
     */
    void add(uint64_t height, Clock::time_point at = Clock::now()) {
        if (!m_samples.empty() && height < m_samples.back().height) {
            m_samples.clear();
        }
        if (!m_samples.empty() && height == m_samples.back().height &&
            at == m_samples.back().at) {
            return;
        }

        m_samples.push_back({at, height});
        while (m_samples.size() > m_capacity) {
            m_samples.pop_front();
        }
    }

    /**
     * Blocks per minute over the window, 0 until two samples exist
     */
    double blocksPerMinute() const {
        if (m_samples.size() < 2) {
            return 0;
        }
        const auto& first = m_samples.front();
        const auto& last = m_samples.back();
        double seconds = std::chrono::duration<double>(last.at - first.at).count();
        if (seconds <= 0) {
            return 0;
        }
        return static_cast<double>(last.height - first.height) * 60.0 / seconds;
    }

    size_t count() const {
        return m_samples.size();
    }

    void reset() {
        m_samples.clear();
    }

private:
    struct Sample {
        Clock::time_point at;
        uint64_t height;
    };

    size_t m_capacity;
    std::deque<Sample> m_samples;
};

}  // namespace chiral
