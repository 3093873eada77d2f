#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cctype>
#include <sstream>
#include <iomanip>

namespace utils {

// Monotonic milliseconds, for durations only
inline u64 steady_ms() {
    using namespace std::chrono;
    return (u64)duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()
    ).count();
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    std::ostringstream ss;
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    } else if (bytes < 1024ULL * 1024) {
        ss << std::fixed << std::setprecision(2) << (double)bytes / 1024.0 << " KB";
    } else if (bytes < 1024ULL * 1024 * 1024) {
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024) << " MB";
    } else {
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024 * 1024) << " GB";
    }
    return ss.str();
}

// Average throughput of 'bytes' moved in 'elapsed_ms', as "X.XX KB/s"
inline std::string format_rate(u64 bytes, u64 elapsed_ms) {
    double bps = elapsed_ms == 0 ? (double)bytes * 1000.0
                                 : (double)bytes * 1000.0 / (double)elapsed_ms;
    std::ostringstream ss;
    if (bps < 1024.0) {
        ss << std::fixed << std::setprecision(1) << bps << " B/s";
    } else if (bps < 1024.0 * 1024) {
        ss << std::fixed << std::setprecision(2) << bps / 1024.0 << " KB/s";
    } else {
        ss << std::fixed << std::setprecision(2) << bps / (1024.0 * 1024) << " MB/s";
    }
    return ss.str();
}

// Validate IPv4 address string
inline bool validate_ip(const std::string& ip) {
    int a, b, c, d;
    char tail;
    if (std::sscanf(ip.c_str(), "%d.%d.%d.%d%c", &a, &b, &c, &d, &tail) != 4) return false;
    return (a >= 0 && a <= 255) && (b >= 0 && b <= 255) &&
           (c >= 0 && c <= 255) && (d >= 0 && d <= 255);
}

// Port 0 asks the OS for an ephemeral port
inline bool validate_port(int port) {
    return port >= 0 && port <= 65535;
}

// Validate that a path is non-empty and doesn't contain null bytes
inline bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (c == '\0') return false;
    }
    return true;
}

// ASCII case-insensitive equality
inline bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    }
    return true;
}

// Render untrusted bytes for a log line: non-printables become \xNN
inline std::string printable(const std::string& s) {
    std::ostringstream ss;
    for (unsigned char c : s) {
        if (c >= 0x20 && c < 0x7F) {
            ss << (char)c;
        } else {
            ss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << (int)c;
        }
    }
    return ss.str();
}

} // namespace utils
