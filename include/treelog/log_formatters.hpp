/**
 * @file log_formatters.hpp
 * @brief Structured formatters: JSON, XML, YAML, CSV, HTML and Markdown
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * All structured formatters project the same field set so they can be
 * swapped freely: time, name, prefix, level_name, level_value, message,
 * parent (propagated records only) and every extra entry.
 */
#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <tao/json/events/to_stream.hpp>
#include <tao/json/events/to_pretty_stream.hpp>

#include "log_formatter.hpp"
#include "log_utils.hpp"

namespace treelog
{

/**
 * @brief Common base holding the timestamp format of structured output
 */
class structured_formatter : public log_formatter
{
  public:
    static constexpr const char *ISO_TIME_FORMAT = "%Y-%m-%dT%H:%M:%S";

    explicit structured_formatter(std::string time_format = ISO_TIME_FORMAT) : time_format_(std::move(time_format)) {}

    /// Decorating structured output would corrupt it
    std::string render_decorated(const log_record &record) const override { return render(record); }

  protected:
    using field_list = std::vector<std::pair<std::string, std::string>>;

    /**
     * @brief Fixed fields in their canonical order, extras appended
     *
     * Extras that collide with a fixed field name are dropped.
     */
    field_list fields(const log_record &record) const
    {
        field_list out;
        out.reserve(7 + record.extra.size());
        out.emplace_back("time", format_timestamp(record.created_at, time_format_));
        out.emplace_back("name", record.logger_name);
        out.emplace_back("prefix", record.display_prefix());
        out.emplace_back("level_name", level_name(record.level));
        out.emplace_back("level_value", std::to_string(to_int(record.level)));
        out.emplace_back("message", record.message);
        if (record.parent_name) { out.emplace_back("parent", *record.parent_name); }

        for (const auto &[key, value] : record.extra)
        {
            if (template_formatter::is_reserved(key)) continue;
            out.emplace_back(key, value);
        }
        return out;
    }

    std::string time_format_;
};

/**
 * @brief JSON formatter using taocpp/json library
 *
 * Produces one JSON object per record through taocpp/json's event
 * consumers, so escaping and Unicode handling are the library's.
 *
 * @code
 * auto formatter = std::make_shared<json_formatter>();
 * formatter->pretty_print = true;
 * @endcode
 */
class json_formatter final : public structured_formatter
{
  public:
    bool pretty_print = false;

    using structured_formatter::structured_formatter;

    /**
     * @brief Produce JSON events for a record
     *
     * Follows taocpp/json's producer pattern so any consumer can be used.
     */
    template <typename Consumer> void produce_log_json(Consumer &c, const log_record &record) const
    {
        c.begin_object();

        c.key("time");
        c.string(format_timestamp(record.created_at, time_format_));
        c.member();

        c.key("name");
        c.string(record.logger_name);
        c.member();

        c.key("prefix");
        c.string(record.display_prefix());
        c.member();

        c.key("level_name");
        c.string(level_name(record.level));
        c.member();

        c.key("level_value");
        c.number(static_cast<std::int64_t>(to_int(record.level)));
        c.member();

        c.key("message");
        c.string(record.message);
        c.member();

        if (record.parent_name)
        {
            c.key("parent");
            c.string(*record.parent_name);
            c.member();
        }

        for (const auto &[key, value] : record.extra)
        {
            if (template_formatter::is_reserved(key)) continue;
            c.key(key);
            c.string(value);
            c.member();
        }

        c.end_object();
    }

    std::string render(const log_record &record) const override
    {
        std::ostringstream stream;
        if (pretty_print)
        {
            // Pretty print with 2-space indent
            tao::json::events::to_pretty_stream consumer(stream, 2);
            produce_log_json(consumer, record);
        }
        else
        {
            tao::json::events::to_stream consumer(stream);
            produce_log_json(consumer, record);
        }
        return stream.str();
    }

    const char *name() const override { return "json"; }
};

namespace detail
{

inline std::string xml_escape(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char ch : text)
    {
        switch (ch)
        {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&#39;"; break;
        default: out += ch;
        }
    }
    return out;
}

inline std::string yaml_quote(std::string_view text)
{
    std::string out = "\"";
    for (char ch : text)
    {
        switch (ch)
        {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default: out += ch;
        }
    }
    out += '"';
    return out;
}

inline std::string csv_quote(std::string_view text)
{
    if (text.find_first_of(",\"\r\n") == std::string_view::npos) return std::string(text);

    std::string out = "\"";
    for (char ch : text)
    {
        if (ch == '"') out += '"';
        out += ch;
    }
    out += '"';
    return out;
}

inline std::string markdown_escape(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char ch : text)
    {
        if (ch == '|' || ch == '\\' || ch == '`' || ch == '*' || ch == '_') out += '\\';
        if (ch == '\n') { out += "<br>"; continue; }
        out += ch;
    }
    return out;
}

} // namespace detail

/**
 * @brief One <log> element per record
 *
 * @code
 * <log><time>2025-01-02T03:04:05</time>...<extra key="user">alice</extra></log>
 * @endcode
 */
class xml_formatter final : public structured_formatter
{
  public:
    using structured_formatter::structured_formatter;

    std::string render(const log_record &record) const override
    {
        auto all         = fields(record);
        size_t fixed_end = record.parent_name ? 7 : 6;

        std::string out = "<log>";
        for (size_t i = 0; i < all.size(); ++i)
        {
            const auto &[key, value] = all[i];
            if (i < fixed_end) { out += fmt::format("<{0}>{1}</{0}>", key, detail::xml_escape(value)); }
            else { out += fmt::format("<extra key=\"{}\">{}</extra>", detail::xml_escape(key), detail::xml_escape(value)); }
        }
        out += "</log>";
        return out;
    }

    const char *name() const override { return "xml"; }
};

/**
 * @brief One YAML document per record, extras nested under "extra"
 */
class yaml_formatter final : public structured_formatter
{
  public:
    using structured_formatter::structured_formatter;

    std::string render(const log_record &record) const override
    {
        auto all         = fields(record);
        size_t fixed_end = record.parent_name ? 7 : 6;

        std::string out = "---";
        for (size_t i = 0; i < all.size() && i < fixed_end; ++i)
        {
            const auto &[key, value] = all[i];
            if (key == "level_value") { out += fmt::format("\n{}: {}", key, value); }
            else { out += fmt::format("\n{}: {}", key, detail::yaml_quote(value)); }
        }
        if (all.size() > fixed_end)
        {
            out += "\nextra:";
            for (size_t i = fixed_end; i < all.size(); ++i)
            {
                out += fmt::format("\n  {}: {}", detail::yaml_quote(all[i].first), detail::yaml_quote(all[i].second));
            }
        }
        return out;
    }

    const char *name() const override { return "yaml"; }
};

/**
 * @brief One CSV row per record (RFC 4180 quoting)
 *
 * Columns: time,name,prefix,level_name,level_value,message,parent,extra.
 * Extras are packed into the last column as "key=value" pairs joined by ';'.
 */
class csv_formatter final : public structured_formatter
{
  public:
    using structured_formatter::structured_formatter;

    static constexpr const char *HEADER = "time,name,prefix,level_name,level_value,message,parent,extra";

    std::string render(const log_record &record) const override
    {
        std::string extras;
        for (const auto &[key, value] : record.extra)
        {
            if (template_formatter::is_reserved(key)) continue;
            if (!extras.empty()) extras += ';';
            extras += key;
            extras += '=';
            extras += value;
        }

        return fmt::format("{},{},{},{},{},{},{},{}",
                           detail::csv_quote(format_timestamp(record.created_at, time_format_)),
                           detail::csv_quote(record.logger_name),
                           detail::csv_quote(record.display_prefix()),
                           detail::csv_quote(level_name(record.level)),
                           to_int(record.level),
                           detail::csv_quote(record.message),
                           detail::csv_quote(record.parent_name.value_or("")),
                           detail::csv_quote(extras));
    }

    const char *name() const override { return "csv"; }
};

/**
 * @brief One HTML table row per record, classed by level for styling
 */
class html_formatter final : public structured_formatter
{
  public:
    using structured_formatter::structured_formatter;

    std::string render(const log_record &record) const override
    {
        std::string out = fmt::format("<tr class=\"log-{}\">", detail::to_lower(level_name(record.level)));
        for (const auto &[key, value] : fields(record))
        {
            out += fmt::format("<td class=\"{}\">{}</td>", detail::xml_escape(key), detail::xml_escape(value));
        }
        out += "</tr>";
        return out;
    }

    const char *name() const override { return "html"; }
};

/**
 * @brief One Markdown table row per record
 */
class markdown_formatter final : public structured_formatter
{
  public:
    using structured_formatter::structured_formatter;

    std::string render(const log_record &record) const override
    {
        auto all         = fields(record);
        size_t fixed_end = record.parent_name ? 7 : 6;

        std::string out = "|";
        for (size_t i = 0; i < all.size(); ++i)
        {
            const auto &[key, value] = all[i];
            if (i < fixed_end) { out += fmt::format(" {} |", detail::markdown_escape(value)); }
            else { out += fmt::format(" {}={} |", detail::markdown_escape(key), detail::markdown_escape(value)); }
        }
        return out;
    }

    const char *name() const override { return "markdown"; }
};

} // namespace treelog
