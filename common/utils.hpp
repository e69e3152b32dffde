#pragma once

// ============================================================
// utils.hpp -- Formatting, validation and text helpers
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <iomanip>

namespace utils {

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    } else if (bytes < 1024ULL * 1024) {
        ss << (double)bytes / 1024.0 << " KB";
    } else if (bytes < 1024ULL * 1024 * 1024) {
        ss << (double)bytes / (1024.0 * 1024) << " MB";
    } else {
        ss << (double)bytes / (1024.0 * 1024 * 1024) << " GB";
    }
    return ss.str();
}

// Format speed as "X.XX MB/s"
inline std::string format_speed(double bytes_per_sec) {
    std::ostringstream ss;
    if (bytes_per_sec < 1024.0) {
        ss << std::fixed << std::setprecision(1) << bytes_per_sec << " B/s";
    } else if (bytes_per_sec < 1024.0 * 1024) {
        ss << std::fixed << std::setprecision(2) << bytes_per_sec / 1024.0 << " KB/s";
    } else if (bytes_per_sec < 1024.0 * 1024 * 1024) {
        ss << std::fixed << std::setprecision(2) << bytes_per_sec / (1024.0 * 1024) << " MB/s";
    } else {
        ss << std::fixed << std::setprecision(2) << bytes_per_sec / (1024.0 * 1024 * 1024) << " GB/s";
    }
    return ss.str();
}

// Format duration as "1h 23m 45s" or "45s"
inline std::string format_duration_s(u64 seconds) {
    if (seconds < 60) return std::to_string(seconds) + "s";
    if (seconds < 3600) {
        return std::to_string(seconds / 60) + "m " + std::to_string(seconds % 60) + "s";
    }
    return std::to_string(seconds / 3600) + "h " +
           std::to_string((seconds % 3600) / 60) + "m " +
           std::to_string(seconds % 60) + "s";
}

// "1.234s" / "850ms" for a session's elapsed time
inline std::string format_elapsed(std::chrono::nanoseconds d) {
    double secs = std::chrono::duration<double>(d).count();
    std::ostringstream ss;
    ss << std::fixed;
    if (secs < 1.0) {
        ss << std::setprecision(0) << secs * 1000.0 << "ms";
    } else {
        ss << std::setprecision(3) << secs << "s";
    }
    return ss.str();
}

// Bytes per second; zero elapsed time counts as one nanosecond
inline double throughput(u64 bytes, std::chrono::nanoseconds d) {
    double secs = std::chrono::duration<double>(d).count();
    if (secs <= 0.0) secs = 1e-9;
    return (double)bytes / secs;
}

// Validate port number (1-65535)
inline bool validate_port(int port) {
    return port >= 1 && port <= 65535;
}

// Validate that a path is non-empty and doesn't contain null bytes
inline bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (c == '\0') return false;
    }
    return true;
}

// Progress percentage string
inline std::string format_percent(u64 done, u64 total) {
    if (total == 0) return "100%";
    double pct = (double)done / (double)total * 100.0;
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << pct << "%";
    return ss.str();
}

template<typename T>
inline T clamp(T val, T lo, T hi) {
    return val < lo ? lo : (val > hi ? hi : val);
}

// Decode UTF-8, replacing every ill-formed sequence with U+FFFD.
// A truncated multi-byte sequence at the end also becomes one U+FFFD.
inline std::string utf8_lossy(const u8* data, size_t len) {
    static const char REPLACEMENT[] = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(len);
    size_t i = 0;
    while (i < len) {
        u8 b = data[i];
        if (b < 0x80) {
            out += (char)b;
            ++i;
            continue;
        }
        size_t need = 0;
        u8 lo = 0x80, hi = 0xBF;
        if (b >= 0xC2 && b <= 0xDF)      { need = 1; }
        else if (b == 0xE0)              { need = 2; lo = 0xA0; }
        else if (b >= 0xE1 && b <= 0xEC) { need = 2; }
        else if (b == 0xED)              { need = 2; hi = 0x9F; }
        else if (b >= 0xEE && b <= 0xEF) { need = 2; }
        else if (b == 0xF0)              { need = 3; lo = 0x90; }
        else if (b >= 0xF1 && b <= 0xF3) { need = 3; }
        else if (b == 0xF4)              { need = 3; hi = 0x8F; }
        else {
            out += REPLACEMENT;
            ++i;
            continue;
        }
        // Only the first continuation byte has a narrowed range
        size_t j = 1;
        for (; j <= need && i + j < len; ++j) {
            u8 c = data[i + j];
            u8 min = (j == 1) ? lo : 0x80;
            u8 max = (j == 1) ? hi : 0xBF;
            if (c < min || c > max) break;
        }
        if (j == need + 1) {
            out.append(reinterpret_cast<const char*>(data + i), need + 1);
            i += need + 1;
        } else {
            out += REPLACEMENT;
            i += j;
        }
    }
    return out;
}

// Strip ASCII whitespace and control bytes from both ends
inline std::string trim_name(const std::string& s) {
    auto junk = [](char ch) {
        unsigned char c = (unsigned char)ch;
        return c <= 0x20 || c == 0x7F;
    };
    size_t b = 0, e = s.size();
    while (b < e && junk(s[b])) ++b;
    while (e > b && junk(s[e - 1])) --e;
    return s.substr(b, e - b);
}

} // namespace utils
