//
//  logging.hpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <cstdint>

namespace tagforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Process-wide threshold; messages above it are dropped.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a --log-level argument; unknown strings map to Error.
LogVerbosity parse_log_verbosity(std::string_view s);

// First `max_len` bytes as space-separated hex, e.g. "66 4c 61 43" for a marker.
inline constexpr size_t kHexPreviewBytes = 8;
inline std::string hex_prefix(const std::vector<uint8_t>& data,
                              size_t max_len = kHexPreviewBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, data.size());
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
        if (i + 1 != limit) {
            oss << ' ';
        }
    }
    return oss.str();
}

}  // namespace tagforge

inline constexpr tagforge::LogVerbosity tf_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return tagforge::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return tagforge::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return tagforge::LogVerbosity::Info;
    }
    // Subsystem tags ("codec", "hash", "merge", "reconcile") only show at Debug.
    return tagforge::LogVerbosity::Debug;
}

inline bool tf_should_log(const char* level) {
    const auto current = tagforge::get_log_verbosity();
    const auto sev = tf_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void tf_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[TagForge][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[TagForge][" << level << "] " << msg << std::endl;
    }
}

#define TF_LOG(level, message)                                              \
    do {                                                                    \
        if (tf_should_log(level)) {                                         \
            std::ostringstream _tf_log_ss;                                  \
            _tf_log_ss << message;                                          \
            tf_log_impl(level, _tf_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
