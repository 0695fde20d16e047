/**
 * chiralmon - Logging Utility
 */

#pragma once

#include <string>
#include <mutex>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <functional>
#include <algorithm>
#include <cctype>

namespace chiral {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * Parse a level name ("debug", "info", "warning", "error")
 *
 * Unknown names map to Info.
 */
inline LogLevel parseLogLevel(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "debug") return LogLevel::Debug;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

/**
 * Log sink, receives every message that passes the level filter
 */
using LogSink = std::function<void(LogLevel, const std::string&)>;

/**
 * Simple logging class
 */
class Log {
public:
    /**
     * Set minimum log level
     */
    static void setLevel(LogLevel level) {
        s_level = level;
    }

    static LogLevel getLevel() {
        return s_level;
    }

    /**
     * Enable/disable timestamps
     */
    static void setShowTimestamp(bool show) {
        s_showTimestamp = show;
    }

    /**
     * Install a sink in addition to console output
     *
     * Pass an empty function to remove it.
     */
    static void setSink(LogSink sink) {
        std::lock_guard<std::mutex> lock(s_mutex);
        s_sink = std::move(sink);
    }

    /**
     * Silence console output (sink still receives messages)
     */
    static void setConsole(bool enabled) {
        s_console = enabled;
    }

    static void debug(const std::string& msg) {
        log(LogLevel::Debug, msg);
    }

    static void info(const std::string& msg) {
        log(LogLevel::Info, msg);
    }

    static void warning(const std::string& msg) {
        log(LogLevel::Warning, msg);
    }

    static void error(const std::string& msg) {
        log(LogLevel::Error, msg);
    }

    /**
     * Log a message at specified level
     */
    static void log(LogLevel level, const std::string& msg) {
        if (level < s_level) {
            return;
        }

        std::lock_guard<std::mutex> lock(s_mutex);

        if (s_sink) {
            s_sink(level, msg);
        }

        if (!s_console) {
            return;
        }

        std::ostream& out = (level >= LogLevel::Warning) ? std::cerr : std::cout;

        if (s_showTimestamp) {
            out << getTimestamp() << " ";
        }

        out << getLevelPrefix(level) << " " << msg << std::endl;
    }

private:
    static std::string getTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::ostringstream ss;
        ss << std::put_time(std::localtime(&time), "%H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static std::string getLevelPrefix(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "[D]";
            case LogLevel::Info:    return "[I]";
            case LogLevel::Warning: return "[W]";
            case LogLevel::Error:   return "[E]";
            default:                return "[?]";
        }
    }

    static inline LogLevel s_level = LogLevel::Info;
    static inline bool s_showTimestamp = true;
    static inline bool s_console = true;
    static inline LogSink s_sink;
    static inline std::mutex s_mutex;
};

}  // namespace chiral
