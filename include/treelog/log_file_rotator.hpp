/**
 * @file log_file_rotator.hpp
 * @brief Rotating file handler
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * This file provides the file handler and its rotation policy:
 * - Size-based rotation (rotate before a file would exceed max_bytes)
 * - Line-based rotation (rotate once a file holds max_lines lines)
 * - Time-based rotation (rotate at S/M/H/D intervals or at midnight)
 * - Retention of rotated files by count, with optional compression
 *
 * File names come from a template that must contain {index}; {date} and
 * {time} are optional. Index 0 is probed first, then 1, 2, ... until a file
 * with room is found.
 */
#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "robin_hood.h"
#include "log_gzip.hpp"
#include "log_handler.hpp"
#include "log_writers.hpp"

namespace treelog
{

/**
 * @brief Time unit of interval based rotation
 */
enum class rotate_when
{
    none,     ///< No time based rotation
    seconds,  ///< "S"
    minutes,  ///< "M"
    hours,    ///< "H"
    days,     ///< "D"
    midnight, ///< "midnight": at 00:00 UTC, every interval days
};

/**
 * @brief Parse "S", "M", "H", "D" or "midnight" (case insensitive)
 */
inline std::optional<rotate_when> rotate_when_from_string(std::string_view text)
{
    auto lower = detail::to_lower(text);
    if (lower == "s") return rotate_when::seconds;
    if (lower == "m") return rotate_when::minutes;
    if (lower == "h") return rotate_when::hours;
    if (lower == "d") return rotate_when::days;
    if (lower == "midnight") return rotate_when::midnight;
    if (lower == "none" || lower.empty()) return rotate_when::none;
    return std::nullopt;
}

/**
 * @brief Rotation policy configuration
 *
 * Defines when log files rotate and what happens to the files rotated away
 * from.
 */
struct rotate_policy
{
    /// @name Size-based rotation
    /// @{
    std::optional<uint64_t> max_bytes; ///< Upper bound per file (unset = unbounded)
    std::optional<uint64_t> max_lines; ///< Lines per file (unset = unbounded)
    /// @}

    /// @name Time-based rotation
    /// @{
    rotate_when when = rotate_when::none; ///< Interval unit
    int interval     = 1;                 ///< Number of units between rotations
    /// @}

    /// @name Retention
    /// @{
    int backup_count = 0; ///< Rotated files kept (0 = keep all)
    /// @}

    /// @name Error handling
    /// @{
    int max_probes = ROTATION_MAX_PROBES; ///< Candidates tried before giving up
    /// @}

    bool sync_on_rotate = false; ///< fdatasync the old file before leaving it
};

/**
 * @brief Handler writing to a rotating set of files
 *
 * State machine: no_file -> file_open -> rotating -> file_open -> ...
 *
 * Every emit() runs one critical section under the handler's mutex:
 * check limits, rotate if needed, append the line. Loggers sharing the
 * instance serialize on that mutex; separate instances never contend.
 *
 * @code
 * auto handler = std::make_shared<rotating_file_handler>(
 *     "/var/log/app", "app_{index}", rotate_policy{.max_bytes = 10 * 1024 * 1024, .backup_count = 5});
 * @endcode
 */
class rotating_file_handler : public log_handler
{
  public:
    enum class state
    {
        no_file,
        file_open,
        rotating
    };

    /**
     * @brief Validate the template and open the first eligible file
     * @param directory Created if missing
     * @param file_name Template with {index} and optionally {date}, {time};
     *                  ".log" is appended when the name has no extension
     * @param policy Rotation limits and retention
     * @param compressor Receives files dropped by retention instead of deleting them
     * @throws configuration_error on an invalid template or policy
     * @throws handler_io_error when no eligible file can be opened
     */
    rotating_file_handler(std::string directory,
                          std::string file_name,
                          rotate_policy policy                         = {},
                          std::shared_ptr<file_compressor> compressor = nullptr);

    ~rotating_file_handler() override { close(); }

    /**
     * @brief Check a template and policy without touching the filesystem
     * @throws configuration_error with the same message the constructor would raise
     */
    static void validate(const std::string &file_name, const rotate_policy &policy);

    const char *name() const override { return "file"; }

    void flush() override;

    std::string current_file() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_path_;
    }

    size_t current_index() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_index_;
    }

    uint64_t rotation_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return rotations_;
    }

    state current_state() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    const rotate_policy &policy() const noexcept { return policy_; }

    /**
     * @brief Render the file path for an index at a given time
     */
    std::string render_path(size_t index, std::chrono::system_clock::time_point now) const;

  protected:
    void emit(logger &owner, const log_record &record, const log_formatter &formatter) override;
    void do_close() override;

  private:
    bool eligible(const file_stats &stats, size_t incoming) const noexcept;
    bool should_rotate(size_t incoming, std::chrono::system_clock::time_point now);
    void select_file(size_t start_index, size_t incoming, std::chrono::system_clock::time_point now);
    void rotate(size_t incoming, std::chrono::system_clock::time_point now, std::vector<std::string> &notes);
    void apply_retention(std::vector<std::string> &notes);
    void compute_next_rotation_time(std::chrono::system_clock::time_point now);
    file_writer &acquire(const std::string &path);

    std::string directory_;
    std::string template_;
    rotate_policy policy_;
    std::shared_ptr<file_compressor> compressor_;

    mutable std::mutex mutex_;
    state state_ = state::no_file;
    robin_hood::unordered_map<std::string, std::unique_ptr<file_writer>> open_files_; // Keyed by resolved path
    std::string current_path_;
    size_t current_index_   = 0;
    uint64_t current_lines_ = 0;
    uint64_t rotations_     = 0;
    std::deque<std::string> retired_;
    std::chrono::system_clock::time_point next_rotation_time_{};
};

} // namespace treelog
