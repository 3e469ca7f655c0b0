#pragma once
#include <string>
#include <cstdlib>
#include <cstdio>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>
#include <ctime>
#include <optional>
#include <random>

namespace queuectl {

namespace fs = std::filesystem;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline std::string home_dir() {
#ifdef _WIN32
    const char* h = std::getenv("USERPROFILE");
    if (!h) h = std::getenv("HOMEDRIVE");
#else
    const char* h = std::getenv("HOME");
#endif
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && (p[1] == '/' || p[1] == '\\')) {
        return home_dir() + p.substr(1);
    }
    return p;
}

// QUEUECTL_HOME overrides ~/.queuectl
inline std::string default_data_dir() {
    const char* env = std::getenv("QUEUECTL_HOME");
    if (env && *env) return expand_path(env);
    return home_dir() + "/.queuectl";
}

inline std::string default_config_path() {
    return default_data_dir() + "/config.json";
}

inline std::string read_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return "";
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// Fixed-width UTC timestamp with microseconds: 2024-05-01T12:00:00.000000Z.
// Lexical order of these strings is chronological order.
inline std::string format_iso8601(TimePoint tp) {
    auto us_total = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count();
    int64_t secs = us_total / 1000000;
    int64_t us = us_total % 1000000;
    if (us < 0) { us += 1000000; secs -= 1; }
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(us));
    return buf;
}

inline std::optional<TimePoint> parse_iso8601(const std::string& s) {
    std::tm tm{};
    int micros = 0;
    int n = std::sscanf(s.c_str(), "%d-%d-%dT%d:%d:%d.%d",
                        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &micros);
    if (n < 6) return std::nullopt;
    if (n == 6) micros = 0;
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
#ifdef _WIN32
    std::time_t t = _mkgmtime(&tm);
#else
    std::time_t t = timegm(&tm);
#endif
    return Clock::from_time_t(t) + std::chrono::microseconds(micros);
}

inline std::string now_iso8601() {
    return format_iso8601(Clock::now());
}

// Random RFC 4122 version 4 identifier
inline std::string generate_uuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

} // namespace queuectl
