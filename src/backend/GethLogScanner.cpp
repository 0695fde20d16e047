/**
 * chiralmon - Geth Log Scanner Implementation
 */

#include "GethLogScanner.h"
#include "util/Log.h"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>

namespace chiral {

PerformanceCounters GethLogScanner::scanDataDir(const std::string& dataDir) {
    std::string path = dataDir;
    if (!path.empty() && path.back() != '/') {
        path += '/';
    }
    return scanFile(path + "geth.log");
}

PerformanceCounters GethLogScanner::scanFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        Log::debug("No engine log at " + path + ", using default rate");
        PerformanceCounters counters;
        counters.rateFromLogs = PER_THREAD_RATE;
        counters.estimated = true;
        return counters;
    }
    return scan(file);
}

PerformanceCounters GethLogScanner::scan(std::istream& in) {
    std::deque<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(std::move(line));
        if (lines.size() > TAIL_LINES) {
            lines.pop_front();
        }
    }
    return scanLines(lines);
}

bool GethLogScanner::isBlockLine(const std::string& line) {
    return line.find("Successfully sealed new block") != std::string::npos ||
           line.find("mined potential block") != std::string::npos ||
           line.find("Block mined") != std::string::npos ||
           (line.find("mined") != std::string::npos && line.find("block") != std::string::npos);
}

std::string GethLogScanner::fieldValue(const std::string& line, const std::string& key) {
    std::string needle = key + "=";
    size_t pos = line.find(needle);
    if (pos == std::string::npos) {
        return std::string();
    }
    pos += needle.size();
    size_t end = line.find(' ', pos);
    return line.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}

PerformanceCounters GethLogScanner::scanLines(const std::deque<std::string>& lines) {
    PerformanceCounters counters;

    double rateSum = 0;
    size_t rateCount = 0;
    for (const auto& line : lines) {
        if (isBlockLine(line)) {
            counters.blocksFound++;
        }

        if (line.find("Mining") != std::string::npos && line.find("hashrate") != std::string::npos) {
            std::string value = fieldValue(line, "hashrate");
            if (value.empty()) {
                continue;
            }
            char* end = nullptr;
            errno = 0;
            double rate = std::strtod(value.c_str(), &end);
            if (errno == 0 && end && *end == '\0' && std::isfinite(rate) && rate >= 0) {
                rateSum += rate;
                rateCount++;
            }
        }
    }

    if (rateCount > 0) {
        counters.rateFromLogs = rateSum / static_cast<double>(rateCount);
        return counters;
    }

    // Most recent sealed block difficulty
    uint64_t difficulty = 0;
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (it->find("Successfully sealed new block") == std::string::npos) {
            continue;
        }
        std::string value = fieldValue(*it, "diff");
        value.erase(std::remove(value.begin(), value.end(), ','), value.end());
        if (value.empty()) {
            continue;
        }
        char* end = nullptr;
        errno = 0;
        unsigned long long parsed = std::strtoull(value.c_str(), &end, 10);
        if (errno == 0 && end && *end == '\0') {
            difficulty = parsed;
            break;
        }
    }

    if (counters.blocksFound > 0 && difficulty > 0) {
        counters.rateFromLogs = static_cast<double>(counters.blocksFound) *
                                static_cast<double>(difficulty) / ESTIMATE_WINDOW;
        return counters;
    }

    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (it->find("Updated mining threads") == std::string::npos &&
            it->find("Starting mining operation") == std::string::npos) {
            continue;
        }
        std::string value = fieldValue(*it, "threads");
        if (value.empty()) {
            continue;
        }
        char* end = nullptr;
        errno = 0;
        unsigned long threads = std::strtoul(value.c_str(), &end, 10);
        if (errno == 0 && end && *end == '\0') {
            counters.rateFromLogs = static_cast<double>(threads) * PER_THREAD_RATE;
            counters.estimated = true;
            return counters;
        }
    }

    return counters;
}

}  // namespace chiral
