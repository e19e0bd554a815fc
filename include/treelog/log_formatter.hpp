/**
 * @file log_formatter.hpp
 * @brief Formatter interface and the default template formatter
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <ctime>
#include <memory>
#include <string>
#include <string_view>

#include "log_record.hpp"

namespace treelog
{

/**
 * @brief Base class for formatters
 *
 * A formatter is a pure function of the record. render() produces the
 * plain text written to files, render_decorated() the colored variant used
 * on terminals: level color + plain text + reset.
 */
class log_formatter
{
  public:
    virtual ~log_formatter() = default;

    virtual std::string render(const log_record &record) const = 0;

    virtual std::string render_decorated(const log_record &record) const
    {
        std::string plain = render(record);
        std::string color = level_color(record.level);

        std::string out;
        out.reserve(color.size() + plain.size() + 4);
        out.append(color).append(plain).append(COLOR_RESET);
        return out;
    }

    virtual const char *name() const = 0;
};

using formatter_ptr = std::shared_ptr<const log_formatter>;

/**
 * @brief Render a timestamp in local time with a strftime-style format
 */
inline std::string format_timestamp(std::chrono::system_clock::time_point tp, const std::string &time_format)
{
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);
    return fmt::format(fmt::runtime("{:" + time_format + "}"), tm);
}

/**
 * @brief Formatter driven by a fmt named-argument template
 *
 * Tokens:
 * - {time}        created_at in local time, rendered with time_format
 * - {name}        logger name
 * - {prefix}      logger prefix, or the name when no prefix is set
 * - {level_name}  e.g. "WARNING"
 * - {level_value} e.g. 50
 * - {message}     the raw message
 * - {elapsed}     seconds since the formatter was created, "00001234.567"
 * - {parent}      parent logger name of a propagated record, empty otherwise
 *
 * Every entry of the record's extra map is available under its key.
 * Reserved tokens win over extras with the same name. Format specs work as
 * usual, e.g. "{level_name:<8}".
 *
 * A template that references a missing key or is malformed never throws:
 * the output degrades to "LEVEL: message [format error: ...]".
 */
class template_formatter final : public log_formatter
{
  public:
    static constexpr const char *DEFAULT_TEMPLATE    = "[{time}] {prefix} | {level_name}[{level_value}]: {message}";
    static constexpr const char *DEFAULT_TIME_FORMAT = "%d/%m/%Y %H:%M:%S";

    explicit template_formatter(std::string format_template = DEFAULT_TEMPLATE, std::string time_format = DEFAULT_TIME_FORMAT)
        : template_(std::move(format_template)), time_format_(std::move(time_format)), epoch_(std::chrono::system_clock::now())
    {
    }

    std::string render(const log_record &record) const override
    {
        try
        {
            auto time_text  = format_timestamp(record.created_at, time_format_);
            auto level_text = level_name(record.level);
            auto elapsed    = elapsed_string(record.created_at);
            std::string parent = record.parent_name.value_or("");

            fmt::dynamic_format_arg_store<fmt::format_context> store;
            store.push_back(fmt::arg("time", time_text));
            store.push_back(fmt::arg("name", record.logger_name));
            store.push_back(fmt::arg("prefix", record.display_prefix()));
            store.push_back(fmt::arg("level_name", level_text));
            store.push_back(fmt::arg("level_value", to_int(record.level)));
            store.push_back(fmt::arg("message", record.message));
            store.push_back(fmt::arg("elapsed", elapsed));
            store.push_back(fmt::arg("parent", parent));

            for (const auto &[key, value] : record.extra)
            {
                if (is_reserved(key)) continue;
                store.push_back(fmt::arg(key.c_str(), value));
            }

            return fmt::vformat(template_, store);
        }
        catch (const fmt::format_error &e)
        {
            return fmt::format("{}: {} [format error: {}]", level_name(record.level), record.message, e.what());
        }
    }

    const char *name() const override { return "default"; }

    const std::string &format_template() const noexcept { return template_; }
    const std::string &time_format() const noexcept { return time_format_; }

    static bool is_reserved(std::string_view key) noexcept
    {
        return key == "time" || key == "name" || key == "prefix" || key == "level_name" || key == "level_value" ||
               key == "message" || key == "elapsed" || key == "parent";
    }

  private:
    std::string elapsed_string(std::chrono::system_clock::time_point tp) const
    {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp - epoch_).count();
        if (ms < 0) ms = 0;
        return fmt::format("{:08d}.{:03d}", ms / 1000, ms % 1000);
    }

    std::string template_;
    std::string time_format_;
    std::chrono::system_clock::time_point epoch_;
};

} // namespace treelog
