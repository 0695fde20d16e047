/**
 * chiralmon - Rate and Size Units Implementation
 */

#include "Units.h"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace chiral {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(begin, end - begin);
}

// Multiplier for an upper-cased unit token, 0 if unknown
double unitMultiplier(const std::string& unit) {
    if (unit.empty() || unit == "H") return 1.0;
    if (unit == "KH") return 1e3;
    if (unit == "MH") return 1e6;
    if (unit == "GH") return 1e9;
    if (unit == "TH") return 1e12;

    if (unit == "B") return 1.0;
    if (unit == "KB") return 1024.0;
    if (unit == "MB") return 1024.0 * 1024.0;
    if (unit == "GB") return 1024.0 * 1024.0 * 1024.0;
    if (unit == "TB") return 1024.0 * 1024.0 * 1024.0 * 1024.0;
    return 0.0;
}

std::string formatScaled(double mantissa, int precision, const char* suffix) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << mantissa << " " << suffix;
    return ss.str();
}

}  // namespace

const char* rateUnitSuffix(RateUnit unit) {
    switch (unit) {
        case RateUnit::H: return "H/s";
        case RateUnit::K: return "KH/s";
        case RateUnit::M: return "MH/s";
        case RateUnit::G: return "GH/s";
        case RateUnit::T: return "TH/s";
        default:          return "H/s";
    }
}

double rateUnitScale(RateUnit unit) {
    switch (unit) {
        case RateUnit::K: return 1e3;
        case RateUnit::M: return 1e6;
        case RateUnit::G: return 1e9;
        case RateUnit::T: return 1e12;
        default:          return 1.0;
    }
}

RateUnit rateUnitOf(double rate) {
    if (rate >= 1e12) return RateUnit::T;
    if (rate >= 1e9) return RateUnit::G;
    if (rate >= 1e6) return RateUnit::M;
    if (rate >= 1e3) return RateUnit::K;
    return RateUnit::H;
}

double parseRate(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) {
        return 0;
    }

    // Plain decimal only: strtod also takes hex, inf and nan
    if (!std::isdigit(static_cast<unsigned char>(s[0])) && s[0] != '.') {
        return 0;
    }

    const char* begin = s.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || !std::isfinite(value) || value < 0) {
        return 0;
    }
    for (const char* p = begin; p != end; ++p) {
        if (!std::isdigit(static_cast<unsigned char>(*p)) && *p != '.' &&
            *p != 'e' && *p != 'E' && *p != '+' && *p != '-') {
            return 0;
        }
    }

    std::string unit = trim(std::string(end));

    // Optional "/s" suffix
    if (unit.size() >= 2) {
        std::string tail = unit.substr(unit.size() - 2);
        if (tail == "/s" || tail == "/S") {
            unit = trim(unit.substr(0, unit.size() - 2));
        }
    }

    for (auto& c : unit) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    double multiplier = unitMultiplier(unit);
    if (multiplier == 0.0) {
        return 0;
    }

    return value * multiplier;
}

std::string formatRate(double rate) {
    if (!std::isfinite(rate) || rate <= 0) {
        return "0.0 H/s";
    }

    RateUnit unit = rateUnitOf(rate);
    int precision = (unit == RateUnit::H) ? 1 : 2;
    return formatScaled(rate / rateUnitScale(unit), precision, rateUnitSuffix(unit));
}

std::string formatBytes(uint64_t bytes) {
    static const char* suffixes[] = {"B", "KB", "MB", "GB", "TB"};

    double value = static_cast<double>(bytes);
    unsigned index = 0;
    while (value >= 1024.0 && index < 4) {
        value /= 1024.0;
        index++;
    }

    return formatScaled(value, index == 0 ? 1 : 2, suffixes[index]);
}

}  // namespace chiral
