/**
 * chiralmon - Rate and Size Units
 *
 * Conversions between numeric rates/sizes and their display text.
 */

#pragma once

#include <cstdint>
#include <string>

namespace chiral {

/**
 * Hash rate unit, each step is a factor of 1000
 */
enum class RateUnit {
    H,
    K,
    M,
    G,
    T
};

/**
 * Unit suffix for display ("H/s", "KH/s", ...)
 */
const char* rateUnitSuffix(RateUnit unit);

/**
 * Multiplier from a unit to H/s
 */
double rateUnitScale(RateUnit unit);

/**
 * Largest unit for which the mantissa of rate is >= 1
 */
RateUnit rateUnitOf(double rate);

/**
 * Parse rate or size text into base units (H/s or bytes)
 *
 * Accepts "1500", "1.5 KH/s", "12MH", "3.2 GB". Hash units scale by 1000,
 * byte units by 1024. Returns 0 for anything unrecognized; callers treat 0
 * as "no data", not as a measured zero.
 */
double parseRate(const std::string& text);

/**
 * Format a rate with the largest fitting unit
 *
 * Two decimals for KH/s and above, one decimal for H/s.
 */
std::string formatRate(double rate);

/**
 * Format a byte count ("512.0 B", "1.50 MB")
 */
std::string formatBytes(uint64_t bytes);

}  // namespace chiral
