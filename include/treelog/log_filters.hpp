/**
 * @file log_filters.hpp
 * @brief Built-in admission filters
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <initializer_list>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "robin_hood.h"
#include "log_filter.hpp"
#include "log_utils.hpp"

namespace treelog
{

/**
 * @brief Filter based on minimum log level
 *
 * Admits records with level >= min_level.
 *
 * @code
 * console->add_filter(std::make_shared<level_filter>(log_level::warning));
 * // Only warnings and above reach the console
 * @endcode
 */
class level_filter final : public log_filter
{
  public:
    explicit level_filter(log_level min_level) : min_level_(min_level) {}

    bool admit(const log_record &record) const override { return record.level >= min_level_; }
    const char *name() const override { return "level"; }

    log_level min_level() const noexcept { return min_level_; }

  private:
    log_level min_level_;
};

/**
 * @brief Filter based on a regular expression searched in the message
 *
 * The pattern may match anywhere in the message, multi-line messages are
 * searched as a whole. With invert set the result is negated.
 */
class regex_filter final : public log_filter
{
  public:
    /**
     * @throws configuration_error if the pattern does not compile
     */
    explicit regex_filter(const std::string &pattern, bool invert = false) : pattern_(pattern), invert_(invert)
    {
        try
        {
            regex_ = std::regex(pattern, std::regex::ECMAScript);
        }
        catch (const std::regex_error &e)
        {
            throw configuration_error(fmt::format("Invalid regex filter pattern '{}': {}", pattern, e.what()));
        }
    }

    bool admit(const log_record &record) const override
    {
        bool found = std::regex_search(record.message, regex_);
        return invert_ ? !found : found;
    }

    const char *name() const override { return "regex"; }

    const std::string &pattern() const noexcept { return pattern_; }
    bool inverted() const noexcept { return invert_; }

  private:
    std::string pattern_;
    std::regex regex_;
    bool invert_;
};

/**
 * @brief Parse "HH:MM" or "HH:MM:SS" into seconds since midnight
 */
inline std::optional<std::chrono::seconds> parse_time_of_day(std::string_view text)
{
    int h = 0, m = 0, s = 0;
    std::string buf(text);
    int n = std::sscanf(buf.c_str(), "%d:%d:%d", &h, &m, &s);
    if (n < 2 || h < 0 || h > 23 || m < 0 || m > 59 || s < 0 || s > 59) return std::nullopt;
    return std::chrono::hours(h) + std::chrono::minutes(m) + std::chrono::seconds(s);
}

/**
 * @brief Filter on the local time of day a record was created
 *
 * Both ends are inclusive. When start > end the window wraps past midnight,
 * e.g. 22:00-06:00 admits 23:30 and 05:00.
 */
class time_filter final : public log_filter
{
  public:
    time_filter(std::chrono::seconds start, std::chrono::seconds end) : start_(start), end_(end) {}

    /**
     * @throws configuration_error on malformed times
     */
    time_filter(std::string_view start, std::string_view end) : time_filter(parse_or_throw(start), parse_or_throw(end)) {}

    bool admit(const log_record &record) const override
    {
        auto t = time_of_day(record.created_at);
        if (start_ <= end_) { return t >= start_ && t <= end_; }
        return t >= start_ || t <= end_;
    }

    const char *name() const override { return "time"; }

    static std::chrono::seconds time_of_day(std::chrono::system_clock::time_point tp)
    {
        std::time_t tt = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        localtime_r(&tt, &tm);
        return std::chrono::hours(tm.tm_hour) + std::chrono::minutes(tm.tm_min) + std::chrono::seconds(tm.tm_sec);
    }

  private:
    static std::chrono::seconds parse_or_throw(std::string_view text)
    {
        auto parsed = parse_time_of_day(text);
        if (!parsed) { throw configuration_error(fmt::format("Invalid time of day '{}', expected HH:MM[:SS]", text)); }
        return *parsed;
    }

    std::chrono::seconds start_;
    std::chrono::seconds end_;
};

/**
 * @brief Filter by exact logger name
 *
 * @code
 * // Only records produced by "db" or "db.pool" pass
 * module_filter filter{"db", "db.pool"};
 * @endcode
 */
class module_filter final : public log_filter
{
  public:
    module_filter(std::initializer_list<std::string> names)
    {
        for (const auto &n : names) add(n);
    }

    explicit module_filter(const std::vector<std::string> &names)
    {
        for (const auto &n : names) add(n);
    }

    /// Logger names are case-normalized, so are the configured names
    module_filter &add(std::string_view logger_name)
    {
        names_.insert(detail::to_lower(logger_name));
        return *this;
    }

    bool admit(const log_record &record) const override { return names_.count(record.logger_name) > 0; }
    const char *name() const override { return "module"; }

  private:
    robin_hood::unordered_set<std::string> names_;
};

/**
 * @brief Boolean combination mode of a composite_filter
 */
enum class composite_mode
{
    all,    ///< AND: every child must admit
    any,    ///< OR: at least one child must admit
    invalid ///< Unrecognized mode, rejects everything
};

inline composite_mode composite_mode_from_string(std::string_view text)
{
    auto lower = detail::to_lower(text);
    if (lower == "and" || lower == "all") return composite_mode::all;
    if (lower == "or" || lower == "any") return composite_mode::any;
    return composite_mode::invalid;
}

/**
 * @brief AND/OR composition of child filters
 *
 * Children are evaluated in list order with short-circuiting. An empty
 * composite admits in both modes. An invalid mode fails closed. A child
 * that throws counts as false on its own, so OR(throwing, admitting)
 * still admits.
 *
 * @code
 * auto f = std::make_shared<composite_filter>(composite_mode::any);
 * f->add(std::make_shared<level_filter>(log_level::error))
 *   .add(std::make_shared<regex_filter>("audit"));
 * @endcode
 */
class composite_filter final : public log_filter
{
  public:
    explicit composite_filter(composite_mode mode, filter_list children = {}) : mode_(mode), children_(std::move(children)) {}

    composite_filter(std::string_view mode, filter_list children = {})
        : composite_filter(composite_mode_from_string(mode), std::move(children))
    {
    }

    composite_filter &add(filter_ptr child)
    {
        children_.push_back(std::move(child));
        return *this;
    }

    /// A child that throws counts as false; the failure is not reported
    bool admit(const log_record &record) const override
    {
        return evaluate(record, [](const log_filter &, const std::string &) {});
    }

    bool evaluate(const log_record &record, const filter_error_fn &on_error) const override
    {
        switch (mode_)
        {
        case composite_mode::all:
            for (const auto &child : children_)
            {
                if (!child_admits(*child, record, on_error)) return false;
            }
            return true;
        case composite_mode::any:
            if (children_.empty()) return true;
            for (const auto &child : children_)
            {
                if (child_admits(*child, record, on_error)) return true;
            }
            return false;
        default: return false;
        }
    }

    const char *name() const override { return "composite"; }

    composite_mode mode() const noexcept { return mode_; }
    size_t size() const noexcept { return children_.size(); }

  private:
    static bool child_admits(const log_filter &child, const log_record &record, const filter_error_fn &on_error)
    {
        try
        {
            return child.evaluate(record, on_error);
        }
        catch (const std::exception &e)
        {
            on_error(child, e.what());
        }
        catch (...)
        {
            on_error(child, "unknown exception");
        }
        return false;
    }

    composite_mode mode_;
    filter_list children_;
};

} // namespace treelog
