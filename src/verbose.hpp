#pragma once

/**
 * Verbose logging for x5conv.
 *
 * Traces archive ingestion, converter selection and payload assembly on
 * stderr when the -v/--verbose flag is enabled. Lines look like
 * "[12:00:01.042] [bundle] Asset PNG1: img/logo.png (42.0 KB, image/png)".
 */

#include <chrono>
#include <ctime>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace x5 {

/**
 * Global verbose mode flag.
 */
inline bool g_verbose = false;

inline void set_verbose(bool enabled) {
    g_verbose = enabled;
}

inline bool is_verbose() {
    return g_verbose;
}

/**
 * Wall-clock time as HH:MM:SS.mmm.
 */
inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

/**
 * Byte count for log lines: "512 B", "42.0 KB", "1.3 MB".
 */
inline std::string format_bytes(uint64_t bytes) {
    std::ostringstream oss;
    if (bytes < 1024) {
        oss << bytes << " B";
    } else if (bytes < 1024 * 1024) {
        oss << std::fixed << std::setprecision(1) << bytes / 1024.0 << " KB";
    } else {
        oss << std::fixed << std::setprecision(1) << bytes / (1024.0 * 1024.0) << " MB";
    }
    return oss.str();
}

namespace detail {
    inline void emit(const char* color, const std::string& tag, const std::string& message) {
        std::cerr << "\033[90m[" << timestamp() << "] " << color << "[" << tag << "]\033[0m "
                  << message << std::endl;
    }
}

// Step in ingestion or conversion. Categories: bundle, converter, transform, settings.
inline void verbose_log(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    detail::emit("\033[36m", category, message);
}

// Failure about to be re-raised to the caller.
inline void verbose_err(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    detail::emit("\033[31m", category + " ERR", message);
}

} // namespace x5
