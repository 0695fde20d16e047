/**
 * chiralmon - Geth Log Scanner Tests
 */

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include "../src/backend/GethLogScanner.h"
#include "../src/util/Log.h"

using namespace chiral;

static int passed = 0;
static int failed = 0;

static void check(bool ok, const std::string& name) {
    if (ok) {
        std::cout << "[PASS] " << name << std::endl;
        passed++;
    } else {
        std::cout << "[FAIL] " << name << std::endl;
        failed++;
    }
}

static PerformanceCounters scanText(const std::string& text) {
    std::istringstream in(text);
    return GethLogScanner::scan(in);
}

int main() {
    Log::setConsole(false);

    std::cout << "=== Log rate sources ===" << std::endl;

    auto fromHashrate = scanText(
        "INFO [05-01|10:00:00.000] Mining stats hashrate=1000\n"
        "INFO [05-01|10:00:10.000] Commit new sealing work number=12 txs=0\n"
        "INFO [05-01|10:00:20.000] Mining stats hashrate=3000 peers=2\n"
        "INFO [05-01|10:00:30.000] Mining stats hashrate=oops\n");
    check(std::fabs(fromHashrate.rateFromLogs - 2000.0) < 1e-9, "average of hashrate fields");
    check(fromHashrate.blocksFound == 0, "no block lines");
    check(!fromHashrate.estimated, "hashrate fields are measurements");

    auto fromBlocks = scanText(
        "INFO [05-01|10:00:00.000] Successfully sealed new block number=1 sealhash=0xaa diff=1,000 elapsed=1s\n"
        "INFO [05-01|10:00:01.000] mined potential block number=1 hash=0xbb\n"
        "INFO [05-01|10:01:00.000] Successfully sealed new block number=2 sealhash=0xcc diff=3,000 elapsed=2s\n");
    check(fromBlocks.blocksFound == 3, "every block line counted");
    check(std::fabs(fromBlocks.rateFromLogs - 15.0) < 1e-9, "blocks x latest difficulty over 600 s");
    check(!fromBlocks.estimated, "block rate is not a thread estimate");

    auto fromThreads = scanText(
        "INFO [05-01|09:59:00.000] Starting mining operation threads=2\n"
        "INFO [05-01|10:00:00.000] Updated mining threads threads=4\n");
    check(std::fabs(fromThreads.rateFromLogs - 4 * 85000.0) < 1e-9, "latest thread count x 85000");
    check(fromThreads.estimated, "thread rate flagged estimated");

    auto blocksWithoutDiff = scanText(
        "INFO [05-01|10:00:00.000] Block mined number=5\n"
        "INFO [05-01|10:00:01.000] Starting mining operation threads=1\n");
    check(blocksWithoutDiff.blocksFound == 1, "generic mined block line counted");
    check(std::fabs(blocksWithoutDiff.rateFromLogs - 85000.0) < 1e-9, "thread fallback without difficulty");

    auto quiet = scanText(
        "INFO [05-01|10:00:00.000] Starting peer-to-peer node\n"
        "INFO [05-01|10:00:01.000] IPC endpoint opened\n");
    check(quiet.blocksFound == 0 && quiet.rateFromLogs == 0, "nothing recognisable gives zero");

    auto empty = scanText("");
    check(empty.blocksFound == 0 && empty.rateFromLogs == 0, "empty log");

    std::cout << "\n=== Tail window ===" << std::endl;

    std::ostringstream big;
    for (int i = 0; i < 200; i++) {
        big << "INFO Block mined number=" << i << "\n";
    }
    for (int i = 0; i < 1900; i++) {
        big << "INFO Imported new chain segment number=" << i << "\n";
    }
    auto tail = scanText(big.str());
    check(tail.blocksFound == 100, "only the last 2000 lines are scanned");

    std::cout << "\n=== Files ===" << std::endl;

    auto missing = GethLogScanner::scanFile("/nonexistent/chiralmon/geth.log");
    check(missing.blocksFound == 0 && missing.rateFromLogs == 85000.0, "missing log gives default rate");
    check(missing.estimated, "default rate flagged estimated");

    auto dir = std::filesystem::temp_directory_path() / "chiralmon_scanner_test";
    std::filesystem::create_directories(dir);
    {
        std::ofstream out(dir / "geth.log");
        out << "INFO Mining stats hashrate=5000\n";
        out << "INFO Successfully sealed new block number=9 diff=10\n";
    }
    auto fromDir = GethLogScanner::scanDataDir(dir.string());
    check(fromDir.blocksFound == 1 && std::fabs(fromDir.rateFromLogs - 5000.0) < 1e-9, "scan data directory");
    check(!fromDir.estimated, "measured rate from data directory");

    auto fromDirSlash = GethLogScanner::scanDataDir(dir.string() + "/");
    check(fromDirSlash.blocksFound == 1, "trailing slash on data directory");

    std::filesystem::remove_all(dir);

    std::cout << "\n=== Summary ===" << std::endl;
    std::cout << "Passed: " << passed << ", Failed: " << failed << std::endl;

    return failed == 0 ? 0 : 1;
}
