/**
 * chiralmon - Version Information
 */

#pragma once

#include <string>

namespace chiral {

// Version components
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// Version string for display
constexpr const char* VERSION_STRING = "0.3.0";

// Server header for the status API
constexpr const char* SERVER_NAME = "chiralmon/0.3.0";

inline std::string getVersionString() {
    return "chiralmon v" + std::string(VERSION_STRING);
}

}  // namespace chiral
