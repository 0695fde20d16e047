/**
 * chiralmon - Geth Log Scanner
 *
 * Derives mining performance counters from the tail of a geth log.
 */

#pragma once

#include "core/Types.h"
#include <deque>
#include <istream>
#include <string>

namespace chiral {

/**
 * GethLogScanner class
 *
 * Rate is taken, in order, from:
 *   1. average of hashrate= values on mining lines
 *   2. sealed blocks x most recent diff= over a 600 s window
 *   3. threads= x 85000 H/s from the miner start line
 * A missing log reports (0 blocks, 85000 H/s). Rates from 3 and from a
 * missing log are flagged estimated.
 */
class GethLogScanner {
public:
    static constexpr size_t TAIL_LINES = 2000;
    static constexpr double PER_THREAD_RATE = 85000.0;
    static constexpr double ESTIMATE_WINDOW = 600.0;

    /**
     * Scan <dataDir>/geth.log
     */
    static PerformanceCounters scanDataDir(const std::string& dataDir);

    /**
     * Scan a log file, missing file gives the default counters
     */
    static PerformanceCounters scanFile(const std::string& path);

    /**
     * Scan the last TAIL_LINES lines of a stream
     */
    static PerformanceCounters scan(std::istream& in);

private:
    static PerformanceCounters scanLines(const std::deque<std::string>& lines);

    /**
     * Text after key= up to the next space
     */
    static std::string fieldValue(const std::string& line, const std::string& key);

    static bool isBlockLine(const std::string& line);
};

}  // namespace chiral
