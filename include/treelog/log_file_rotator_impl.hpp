/**
 * @file log_file_rotator_impl.hpp
 * @brief Implementation of the rotating file handler
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <ctime>
#include <exception>
#include <filesystem>

#include "log_file_rotator.hpp"
#include "log_logger.hpp"

namespace treelog
{

inline void rotating_file_handler::validate(const std::string &file_name, const rotate_policy &policy)
{
    if (file_name.find("{index") == std::string::npos)
    {
        throw configuration_error(fmt::format("File name template '{}' must contain the {{index}} placeholder", file_name));
    }
    if (policy.max_probes <= 0) { throw configuration_error("max_probes must be positive"); }
    if (policy.backup_count < 0) { throw configuration_error("backup_count must not be negative"); }
    if (policy.when != rotate_when::none && policy.interval <= 0)
    {
        throw configuration_error(fmt::format("Rotation interval must be positive, got {}", policy.interval));
    }

    // Same argument types render_path() passes
    try
    {
        (void)fmt::format(fmt::runtime(file_name),
                          fmt::arg("index", size_t{0}),
                          fmt::arg("date", std::string()),
                          fmt::arg("time", std::string()));
    }
    catch (const fmt::format_error &e)
    {
        throw configuration_error(fmt::format("Invalid file name template '{}': {}", file_name, e.what()));
    }
}

inline rotating_file_handler::rotating_file_handler(std::string directory,
                                                    std::string file_name,
                                                    rotate_policy policy,
                                                    std::shared_ptr<file_compressor> compressor)
    : directory_(std::move(directory)), template_(std::move(file_name)), policy_(policy), compressor_(std::move(compressor))
{
    validate(template_, policy_);
    if (directory_.empty()) directory_ = ".";

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) { throw handler_io_error(fmt::format("Failed to create log directory {}: {}", directory_, ec.message())); }

    auto now = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    select_file(0, 0, now);
    if (policy_.when != rotate_when::none) { compute_next_rotation_time(now); }
}

inline std::string rotating_file_handler::render_path(size_t index, std::chrono::system_clock::time_point now) const
{
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&tt, &tm);

    std::string name = fmt::format(fmt::runtime(template_),
                                   fmt::arg("index", index),
                                   fmt::arg("date", fmt::format("{:%Y-%m-%d}", tm)),
                                   fmt::arg("time", fmt::format("{:%H%M%S}", tm)));

    std::filesystem::path file(name);
    if (!file.has_extension()) { name += DEFAULT_LOG_EXTENSION; }
    return (std::filesystem::path(directory_) / name).string();
}

inline bool rotating_file_handler::eligible(const file_stats &stats, size_t incoming) const noexcept
{
    if (policy_.max_bytes)
    {
        uint64_t max = *policy_.max_bytes;
        if (stats.bytes >= max) return false;
        // A line longer than max_bytes still goes into an empty file
        if (stats.bytes > 0 && stats.bytes + incoming > max) return false;
    }
    if (policy_.max_lines && stats.lines >= *policy_.max_lines) return false;
    return true;
}

// Linear scan from start_index, bounded by max_probes. Absent candidates
// are created only once they are known to be eligible.
inline void rotating_file_handler::select_file(size_t start_index, size_t incoming, std::chrono::system_clock::time_point now)
{
    for (int probe = 0; probe < policy_.max_probes; ++probe)
    {
        size_t index     = start_index + static_cast<size_t>(probe);
        std::string path = render_path(index, now);

        std::error_code ec;
        bool exists = std::filesystem::exists(path, ec);

        file_stats stats;
        if (exists) { stats = touch_and_measure(path, policy_.max_lines.has_value()); }
        if (!eligible(stats, incoming)) continue;
        if (!exists) { stats = touch_and_measure(path, false); }

        current_path_  = std::move(path);
        current_index_ = index;
        current_lines_ = stats.lines;
        state_         = state::file_open;
        return;
    }

    state_ = state::no_file;
    throw handler_io_error(fmt::format("No eligible log file in {} after {} probes starting at index {}",
                                       directory_,
                                       policy_.max_probes,
                                       start_index));
}

inline bool rotating_file_handler::should_rotate(size_t incoming, std::chrono::system_clock::time_point now)
{
    if (policy_.when != rotate_when::none && now >= next_rotation_time_) return true;

    if (policy_.max_bytes)
    {
        uint64_t size = acquire(current_path_).size();
        uint64_t max  = *policy_.max_bytes;
        if (size >= max || (size > 0 && size + incoming > max)) return true;
    }

    return policy_.max_lines && current_lines_ >= *policy_.max_lines;
}

inline void rotating_file_handler::rotate(size_t incoming, std::chrono::system_clock::time_point now, std::vector<std::string> &notes)
{
    state_               = state::rotating;
    std::string old_path = current_path_;

    if (auto it = open_files_.find(old_path); it != open_files_.end())
    {
        if (policy_.sync_on_rotate && !it->second->sync())
        {
            notes.push_back(fmt::format("fdatasync failed for {}: {}", old_path, detail::get_error_string(errno)));
        }
        open_files_.erase(it);
    }

    select_file(current_index_ + 1, incoming, now);
    ++rotations_;

    retired_.push_back(std::move(old_path));
    apply_retention(notes);

    if (policy_.when != rotate_when::none) { compute_next_rotation_time(now); }
}

inline void rotating_file_handler::apply_retention(std::vector<std::string> &notes)
{
    if (policy_.backup_count <= 0) return;

    while (retired_.size() > static_cast<size_t>(policy_.backup_count))
    {
        std::string victim = std::move(retired_.front());
        retired_.pop_front();

        if (compressor_)
        {
            try
            {
                compressor_->compress(victim);
            }
            catch (const std::exception &e)
            {
                notes.push_back(fmt::format("Failed to compress rotated log {}: {}", victim, e.what()));
            }
        }
        else
        {
            std::error_code ec;
            std::filesystem::remove(victim, ec);
            if (ec) { notes.push_back(fmt::format("Failed to delete rotated log {}: {}", victim, ec.message())); }
        }
    }
}

inline void rotating_file_handler::compute_next_rotation_time(std::chrono::system_clock::time_point now)
{
    using namespace std::chrono;

    switch (policy_.when)
    {
    case rotate_when::seconds: next_rotation_time_ = now + seconds(policy_.interval); break;
    case rotate_when::minutes: next_rotation_time_ = now + minutes(policy_.interval); break;
    case rotate_when::hours: next_rotation_time_ = now + hours(policy_.interval); break;
    case rotate_when::days: next_rotation_time_ = now + days(policy_.interval); break;
    case rotate_when::midnight:
        // Cut over at 00:00 UTC
        next_rotation_time_ = floor<days>(now) + days(policy_.interval);
        break;
    default: next_rotation_time_ = system_clock::time_point::max(); break;
    }
}

inline file_writer &rotating_file_handler::acquire(const std::string &path)
{
    auto it = open_files_.find(path);
    if (it == open_files_.end()) { it = open_files_.emplace(path, std::make_unique<file_writer>(path)).first; }
    return *it->second;
}

inline void rotating_file_handler::emit(logger &owner, const log_record &record, const log_formatter &formatter)
{
    std::string line = formatter.render(record);
    line.push_back('\n');
    auto newlines = static_cast<uint64_t>(std::count(line.begin(), line.end(), '\n'));

    std::vector<std::string> notes;
    std::exception_ptr failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try
        {
            auto now = std::chrono::system_clock::now();
            if (state_ == state::no_file) { select_file(current_index_, line.size(), now); }
            if (should_rotate(line.size(), now)) { rotate(line.size(), now, notes); }

            acquire(current_path_).write(line);
            current_lines_ += newlines;
        }
        catch (const std::exception &)
        {
            // Reopen on the next record rather than reuse a descriptor that failed
            open_files_.erase(current_path_);
            failure = std::current_exception();
        }
    }

    // Outside the lock, a report may come back to a handler sharing this file
    for (const auto &note : notes) { owner.report(log_level::warning, note, this); }
    if (failure) std::rethrow_exception(failure);
}

inline void rotating_file_handler::flush()
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &entry : open_files_)
    {
        if (!entry.second->sync())
        {
            throw handler_io_error(fmt::format("fdatasync failed for {}: {}", entry.first, detail::get_error_string(errno)));
        }
    }
}

inline void rotating_file_handler::do_close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    open_files_.clear();
    state_ = state::no_file;
}

} // namespace treelog
