/**
 * @file log_types.hpp
 * @brief Core type definitions and constants for the logging system
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <compare>
#include <concepts>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_errors.hpp"

namespace treelog
{

// File rotation constants
inline constexpr int ROTATION_MAX_PROBES         = 1000;                         // Candidate files probed before giving up
inline constexpr int WRITE_MAX_RETRIES           = 3;                            // Retries for a stalled write
inline constexpr auto WRITE_RETRY_BACKOFF        = std::chrono::milliseconds(1); // Initial backoff for stalled writes
inline constexpr size_t GZIP_BUFFER_SIZE         = 64 * 1024;                    // Read/deflate chunk size
inline constexpr const char *DEFAULT_LOG_EXTENSION = ".log";                     // Appended to extensionless file names

// Dispatcher constants
inline constexpr size_t ASYNC_QUEUE_CAPACITY = 1024;                          // Initial queue capacity
inline constexpr auto ASYNC_POLL_INTERVAL    = std::chrono::milliseconds(50); // Worker wakeup to check for shutdown

/**
 * @brief Concept for types that can be logged
 * @tparam T The type to check
 */
template <typename T>
concept Loggable = requires(T value) {
    { fmt::format("{}", value) } -> std::convertible_to<std::string>;
};

/**
 * @brief Built-in log levels in ascending order of severity
 *
 * The scale is open: any integer is a valid level and custom named levels
 * can be added at runtime with register_level().
 */
enum class log_level : int
{
    notset   = 0,  ///< Everything passes
    trace    = 10, ///< Finest-grained information
    debug    = 20, ///< Debugging information
    info     = 30, ///< General information
    success  = 40, ///< Completed operations
    warning  = 50, ///< Warning messages
    warn     = warning,
    fail     = 60, ///< Failed operations the program recovers from
    error    = 70, ///< Error messages
    critical = 80, ///< Critical errors
    fatal    = critical,
};

constexpr int to_int(log_level level) noexcept { return static_cast<int>(level); }

constexpr bool operator==(log_level lhs, int rhs) noexcept { return to_int(lhs) == rhs; }

constexpr std::strong_ordering operator<=>(log_level lhs, int rhs) noexcept { return to_int(lhs) <=> rhs; }

inline constexpr const char *COLOR_RESET   = "\033[0m";
inline constexpr const char *COLOR_DEFAULT = "\033[37m";

/**
 * @brief Process-wide table of level names and colors
 *
 * Holds the built-in levels and any level registered at runtime. Names are
 * matched case-insensitively. Reads take a shared lock, registration an
 * exclusive one.
 */
class level_table
{
  private:
    struct entry
    {
        std::string name; ///< Canonical upper-case name
        int value;
        std::string color;
    };

    std::vector<entry> entries_;                       // Sorted by value
    std::vector<std::pair<std::string, int>> aliases_; // Upper-case alias -> value
    mutable std::shared_mutex mutex_;

    static std::string upper(std::string_view text)
    {
        std::string result(text);
        std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return std::toupper(c); });
        return result;
    }

    level_table()
    {
        entries_ = {
            {"NOTSET", 0, "\033[37m"},
            {"TRACE", 10, "\033[94m"},
            {"DEBUG", 20, "\033[96m"},
            {"INFO", 30, "\033[92m"},
            {"SUCCESS", 40, "\033[32m"},
            {"WARNING", 50, "\033[93m"},
            {"FAIL", 60, "\033[31m"},
            {"ERROR", 70, "\033[91m"},
            {"CRITICAL", 80, "\033[95m"},
        };
        aliases_ = {{"WARN", 50}, {"FATAL", 80}};
    }

    const entry *find_value(int value) const
    {
        auto it = std::find_if(entries_.begin(), entries_.end(), [value](const entry &e) { return e.value == value; });
        return it == entries_.end() ? nullptr : &*it;
    }

  public:
    static level_table &instance()
    {
        static level_table inst;
        return inst;
    }

    std::string name(log_level level) const
    {
        std::shared_lock lock(mutex_);
        if (auto *e = find_value(to_int(level))) { return e->name; }
        return fmt::format("LEVEL{}", to_int(level));
    }

    std::string color(log_level level) const
    {
        std::shared_lock lock(mutex_);
        if (auto *e = find_value(to_int(level))) { return e->color; }
        return COLOR_DEFAULT;
    }

    std::optional<log_level> find(std::string_view name) const
    {
        auto key = upper(name);
        std::shared_lock lock(mutex_);
        for (const auto &e : entries_)
        {
            if (e.name == key) return static_cast<log_level>(e.value);
        }
        for (const auto &[alias, value] : aliases_)
        {
            if (alias == key) return static_cast<log_level>(value);
        }
        return std::nullopt;
    }

    /**
     * @brief Register a new named level
     * @throws configuration_error if the name is already taken (built-ins and aliases included)
     */
    log_level add(std::string_view name, int value, std::string_view color)
    {
        auto key = upper(name);
        if (key.empty()) { throw configuration_error("Level name must not be empty"); }

        std::unique_lock lock(mutex_);
        bool taken = std::any_of(entries_.begin(), entries_.end(), [&](const entry &e) { return e.name == key; }) ||
                     std::any_of(aliases_.begin(), aliases_.end(), [&](const auto &a) { return a.first == key; });
        if (taken) { throw configuration_error(fmt::format("Log level '{}' is already registered", key)); }

        if (find_value(value))
        {
            // Second name for an existing value
            aliases_.emplace_back(std::move(key), value);
            return static_cast<log_level>(value);
        }

        auto pos = std::upper_bound(entries_.begin(), entries_.end(), value, [](int v, const entry &e) { return v < e.value; });
        entries_.insert(pos, entry{std::move(key), value, std::string(color)});
        return static_cast<log_level>(value);
    }

    std::vector<log_level> levels() const
    {
        std::shared_lock lock(mutex_);
        std::vector<log_level> result;
        result.reserve(entries_.size());
        for (const auto &e : entries_) result.push_back(static_cast<log_level>(e.value));
        return result;
    }
};

/**
 * @brief Display name of a level ("INFO", "LEVEL35" for unnamed values)
 */
inline std::string level_name(log_level level) { return level_table::instance().name(level); }

/**
 * @brief ANSI color of a level, COLOR_DEFAULT for unknown levels
 */
inline std::string level_color(log_level level) { return level_table::instance().color(level); }

/**
 * @brief Convert string to log_level
 * @param str Level name or alias (case insensitive)
 * @return Corresponding log_level, or std::nullopt if the name is unknown
 */
inline std::optional<log_level> log_level_from_string(std::string_view str) { return level_table::instance().find(str); }

/**
 * @brief Add a custom level, e.g. register_level("notice", 35, "\033[34m")
 * @throws configuration_error on a duplicate name
 */
inline log_level register_level(std::string_view name, int value, std::string_view color = COLOR_DEFAULT)
{
    return level_table::instance().add(name, value, color);
}

} // namespace treelog
