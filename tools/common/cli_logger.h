#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <unistd.h>

namespace mtgtools::log {

// Quiet shows warnings and errors only. Verbose adds LOGI, Debug adds LOGD.
enum class VerbosityLevel : int { Quiet = 0, Verbose = 1, Debug = 2 };

inline VerbosityLevel current_level = VerbosityLevel::Quiet;

inline void set_verbosity(int level) {
    current_level = static_cast<VerbosityLevel>(std::clamp(level, 0, 2));
}

inline bool verbose_enabled() { return current_level >= VerbosityLevel::Verbose; }
inline bool debug_enabled() { return current_level >= VerbosityLevel::Debug; }

namespace detail {

inline std::mutex stream_mutex;
inline const auto start_time = std::chrono::steady_clock::now();

// UTF-8 output is assumed when the locale environment names it.
inline bool utf8_locale() {
    static const bool value = [] {
        for (const char* var : {"LC_ALL", "LC_CTYPE", "LANG"}) {
            const char* v = std::getenv(var);
            if (!v || !*v) continue;
            std::string_view s(v);
            return s.find("UTF-8") != std::string_view::npos || s.find("utf-8") != std::string_view::npos ||
                   s.find("UTF8") != std::string_view::npos || s.find("utf8") != std::string_view::npos;
        }
        return false;
    }();
    return value;
}

// The CLI redraws a progress line in place on a terminal; a log line must
// wipe it first or the two get interleaved.
inline bool stderr_is_tty() {
    static const bool value = ::isatty(::fileno(stderr)) != 0;
    return value;
}

template <typename... Args>
void emit(const char* tag, const char* utf_tag, Args&&... args) {
    std::lock_guard<std::mutex> lock(stream_mutex);
    auto& stream = std::cerr;
    if (stderr_is_tty()) stream << "\r\033[K";
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
    char stamp[24];
    std::snprintf(stamp, sizeof(stamp), "%8.3f ", elapsed);
    stream << stamp << (utf8_locale() ? utf_tag : tag) << ' ';
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

inline std::mutex once_mutex;
inline std::unordered_set<uint64_t> once_keys;

inline bool should_log_once(uint64_t key) {
    std::lock_guard<std::mutex> lock(once_mutex);
    return once_keys.insert(key).second;
}

inline std::mutex rate_mutex;
inline std::unordered_map<uint64_t, std::chrono::steady_clock::time_point> rate_timestamps;

inline bool should_log_rate(uint64_t key, uint32_t ms) {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(rate_mutex);
    auto it = rate_timestamps.find(key);
    if (it == rate_timestamps.end() ||
        std::chrono::duration_cast<std::chrono::milliseconds>(now - it->second).count() >= ms) {
        rate_timestamps[key] = now;
        return true;
    }
    return false;
}

// FNV-1a
constexpr uint64_t fnv1a_hash(const char* str) {
    uint64_t hash = 14695981039346656037ull;
    for (size_t i = 0; str[i] != '\0'; ++i) {
        hash ^= static_cast<uint64_t>(static_cast<unsigned char>(str[i]));
        hash *= 1099511628211ull;
    }
    return hash;
}

constexpr uint64_t make_location_key(const char* file, int line) {
    uint64_t hash = fnv1a_hash(file);
    hash ^= static_cast<uint64_t>(line);
    hash *= 1099511628211ull;
    return hash;
}

} // namespace detail

template <typename... Args>
void info(Args&&... args) {
    if (!verbose_enabled()) return;
    detail::emit("[INFO]", "[ℹ]", std::forward<Args>(args)...);
}

template <typename... Args>
void debug(Args&&... args) {
    if (!debug_enabled()) return;
    detail::emit("[DEBUG]", "[🐞]", std::forward<Args>(args)...);
}

template <typename... Args>
void warn(Args&&... args) {
    detail::emit("[WARN]", "⚠️", std::forward<Args>(args)...);
}

template <typename... Args>
void error(Args&&... args) {
    detail::emit("[ERROR]", "❌", std::forward<Args>(args)...);
}

} // namespace mtgtools::log

#define LOGI(...) ::mtgtools::log::info(__VA_ARGS__)
#define LOGW(...) ::mtgtools::log::warn(__VA_ARGS__)
#define LOGE(...) ::mtgtools::log::error(__VA_ARGS__)
#define LOGD(...) ::mtgtools::log::debug(__VA_ARGS__)

// LOGW_ONCE warns at most once per process for a given string key.
#define LOGW_ONCE(key, ...) \
    do { \
        if (::mtgtools::log::detail::should_log_once(::mtgtools::log::detail::fnv1a_hash(key))) { \
            ::mtgtools::log::warn(__VA_ARGS__); \
        } \
    } while (false)

#define LOGD_RATE_LIMIT(ms, ...) \
    do { \
        constexpr uint64_t _loc_key = ::mtgtools::log::detail::make_location_key(__FILE__, __LINE__); \
        if (::mtgtools::log::detail::should_log_rate(_loc_key, ms)) { \
            ::mtgtools::log::debug(__VA_ARGS__); \
        } \
    } while (false)
