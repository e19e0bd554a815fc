/**
 * @file log_record.hpp
 * @brief The data unit that flows through the dispatch chain
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <chrono>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "log_types.hpp"

namespace treelog
{

/**
 * @brief Insertion-ordered string to value map carried by every record
 *
 * Values are stored already rendered with fmt, the same way structured
 * metadata is turned into text as soon as it is attached. Setting an
 * existing key replaces its value in place, so the original position of
 * the key is kept.
 *
 * @code
 * extra_map extra{{"user", "alice"}};
 * extra.set("attempt", 3).set("ratio", 0.25);
 * @endcode
 */
class extra_map
{
  public:
    using value_type     = std::pair<std::string, std::string>;
    using const_iterator = std::vector<value_type>::const_iterator;

    extra_map() = default;

    extra_map(std::initializer_list<value_type> init)
    {
        for (const auto &kv : init) set(kv.first, kv.second);
    }

    template <Loggable T> extra_map &set(std::string_view key, T &&value)
    {
        std::string rendered;
        if constexpr (std::is_convertible_v<T, std::string_view>) { rendered = std::string(std::string_view(value)); }
        else { rendered = fmt::format("{}", std::forward<T>(value)); }

        for (auto &kv : entries_)
        {
            if (kv.first == key)
            {
                kv.second = std::move(rendered);
                return *this;
            }
        }
        entries_.emplace_back(std::string(key), std::move(rendered));
        return *this;
    }

    /// Insert only when the key is absent
    template <Loggable T> bool set_default(std::string_view key, T &&value)
    {
        if (contains(key)) return false;
        set(key, std::forward<T>(value));
        return true;
    }

    /**
     * @brief Merge another map into this one
     * @param overwrite when true, entries of @p other replace existing keys
     */
    void merge(const extra_map &other, bool overwrite = true)
    {
        for (const auto &[key, value] : other.entries_)
        {
            if (overwrite) { set(key, value); }
            else { set_default(key, value); }
        }
    }

    bool contains(std::string_view key) const { return find(key) != nullptr; }

    const std::string *find(std::string_view key) const
    {
        for (const auto &kv : entries_)
        {
            if (kv.first == key) return &kv.second;
        }
        return nullptr;
    }

    std::string get(std::string_view key, std::string_view fallback = {}) const
    {
        auto *value = find(key);
        return value ? *value : std::string(fallback);
    }

    bool erase(std::string_view key)
    {
        auto it = std::find_if(entries_.begin(), entries_.end(), [key](const value_type &kv) { return kv.first == key; });
        if (it == entries_.end()) return false;
        entries_.erase(it);
        return true;
    }

    void clear() noexcept { entries_.clear(); }
    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

  private:
    std::vector<value_type> entries_;
};

/**
 * @brief One log event
 *
 * Built fresh for every log call. Handlers only ever see it through a const
 * reference; middleware and propagation work on copies.
 */
struct log_record
{
    std::string message;
    log_level level = log_level::notset;
    std::string logger_name;
    std::string prefix; ///< Display prefix, falls back to logger_name when empty
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
    std::optional<std::string> parent_name;
    extra_map extra;

    const std::string &display_prefix() const noexcept { return prefix.empty() ? logger_name : prefix; }
};

} // namespace treelog
