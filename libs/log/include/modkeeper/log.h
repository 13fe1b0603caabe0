#pragma once

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <unordered_set>
#include <utility>

namespace modkeeper::log {

enum class VerbosityLevel : int { Quiet = 0, Verbose = 1, Debug = 2 };

inline VerbosityLevel current_level = VerbosityLevel::Quiet;

inline void set_verbosity(int level) {
    level = std::clamp(level, 0, 2);
    current_level = static_cast<VerbosityLevel>(level);
}

constexpr const char* level_name(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "QUIET";
        case VerbosityLevel::Verbose: return "INFO";
        case VerbosityLevel::Debug: return "DEBUG";
    }
    return "INFO";
}

namespace detail {

// Worker threads log too; keep lines from interleaving.
inline std::mutex stream_mutex;

template <typename... Args>
void write_line(std::ostream& stream, const char* tag, Args&&... args) {
    std::lock_guard<std::mutex> lock(stream_mutex);
    stream << '[' << tag << "] ";
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

// FNV-1a, used to key the *_ONCE macros
constexpr uint64_t fnv1a_hash(const char* str) {
    uint64_t hash = 14695981039346656037ull;
    for (size_t i = 0; str[i] != '\0'; ++i) {
        hash ^= static_cast<uint64_t>(str[i]);
        hash *= 1099511628211ull;
    }
    return hash;
}

} // namespace detail

template <typename... Args>
void log_impl(VerbosityLevel min_level, Args&&... args) {
    if (current_level < min_level) return;
    detail::write_line(std::cerr, level_name(min_level), std::forward<Args>(args)...);
}

template <typename... Args>
void info(Args&&... args) {
    log_impl(VerbosityLevel::Verbose, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(Args&&... args) {
    log_impl(VerbosityLevel::Debug, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(Args&&... args) {
    detail::write_line(std::cerr, "WARN", std::forward<Args>(args)...);
}

template <typename... Args>
void error(Args&&... args) {
    detail::write_line(std::cerr, "ERROR", std::forward<Args>(args)...);
}

} // namespace modkeeper::log

#define LOGI(...) ::modkeeper::log::info(__VA_ARGS__)
#define LOGW(...) ::modkeeper::log::warn(__VA_ARGS__)
#define LOGE(...) ::modkeeper::log::error(__VA_ARGS__)

#if MODKEEPER_DEBUG
    #define LOGD(...) ::modkeeper::log::debug(__VA_ARGS__)
#else
    #define LOGD(...) do {} while(false)
#endif

#define LOGW_ONCE(key, ...) \
    do { \
        if (::modkeeper::log::detail::should_log_once(key)) { \
            ::modkeeper::log::warn(__VA_ARGS__); \
        } \
    } while (false)

