/**
 * @file log_config.hpp
 * @brief Build loggers, handlers, filters and formatters from a JSON value
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Parsing files is left to the caller; this header only interprets an
 * already parsed tao::json::value:
 *
 * @code
 * auto config = tao::json::from_string(R"({
 *     "name": "app.http",
 *     "level": "info",
 *     "formatter": {"type": "default", "template": "{level_name}: {message}"},
 *     "handlers": [
 *         {"type": "stream", "stream": "stderr"},
 *         {"type": "size_rotating_file", "file_directory": "logs", "max_size": 1048576,
 *          "backup_count": 5, "compress": true, "level": "warning"}
 *     ],
 *     "filters": [{"type": "regex", "pattern": "healthcheck", "invert": true}]
 * })");
 * auto &http = treelog::configure_logger(registry, config);
 * @endcode
 *
 * Unknown types, unknown level names and wrongly typed values raise
 * configuration_error; nothing is attached to the logger in that case.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <tao/json/to_string.hpp>
#include <tao/json/value.hpp>

#include "log_errors.hpp"
#include "log_filters.hpp"
#include "log_formatters.hpp"
#include "log_gzip.hpp"
#include "log_handlers.hpp"
#include "log_registry.hpp"

namespace treelog
{

namespace detail
{

inline const tao::json::value *config_member(const tao::json::value &node, const std::string &key)
{
    if (!node.is_object()) { throw configuration_error(fmt::format("Expected an object while looking up '{}'", key)); }
    const auto &members = node.get_object();
    auto it             = members.find(key);
    return it == members.end() || it->second.is_null() ? nullptr : &it->second;
}

inline std::optional<std::string> config_string(const tao::json::value &node, const std::string &key)
{
    const auto *member = config_member(node, key);
    if (!member) return std::nullopt;
    if (!member->is_string()) { throw configuration_error(fmt::format("'{}' must be a string", key)); }
    return member->get_string();
}

inline std::optional<bool> config_bool(const tao::json::value &node, const std::string &key)
{
    const auto *member = config_member(node, key);
    if (!member) return std::nullopt;
    if (!member->is_boolean()) { throw configuration_error(fmt::format("'{}' must be a boolean", key)); }
    return member->get_boolean();
}

inline std::optional<std::int64_t> config_int(const tao::json::value &node, const std::string &key, std::int64_t min_value)
{
    const auto *member = config_member(node, key);
    if (!member) return std::nullopt;
    if (!member->is_integer()) { throw configuration_error(fmt::format("'{}' must be an integer", key)); }

    auto value = member->as<std::int64_t>();
    if (value < min_value) { throw configuration_error(fmt::format("'{}' must be at least {}, got {}", key, min_value, value)); }
    return value;
}

/// A level is a name ("info", "warn") or a raw integer value
inline std::optional<log_level> config_level(const tao::json::value &node, const std::string &key)
{
    const auto *member = config_member(node, key);
    if (!member) return std::nullopt;

    if (member->is_integer()) { return static_cast<log_level>(member->as<int>()); }
    if (member->is_string())
    {
        if (auto level = log_level_from_string(member->get_string())) return level;
        throw configuration_error(fmt::format("Unknown log level '{}'", member->get_string()));
    }
    throw configuration_error(fmt::format("'{}' must be a level name or an integer", key));
}

inline const std::vector<tao::json::value> *config_array(const tao::json::value &node, const std::string &key)
{
    const auto *member = config_member(node, key);
    if (!member) return nullptr;
    if (!member->is_array()) { throw configuration_error(fmt::format("'{}' must be an array", key)); }
    return &member->get_array();
}

inline std::string config_type(const tao::json::value &node, const char *what)
{
    auto type = config_string(node, "type");
    if (!type) { throw configuration_error(fmt::format("{} entry without a 'type'", what)); }
    return to_lower(*type);
}

} // namespace detail

/**
 * @brief Build a filter from {"type": "level"|"regex"|"time"|"module"|"composite", ...}
 *
 * - level:     {"level": "warning"}
 * - regex:     {"pattern": "...", "invert": false}
 * - time:      {"start": "09:00", "end": "17:30"}
 * - module:    {"names": ["db", "http"]}
 * - composite: {"mode": "and"|"or", "filters": [...]}
 */
inline filter_ptr make_filter(const tao::json::value &config)
{
    auto type = detail::config_type(config, "Filter");

    if (type == "level")
    {
        auto level = detail::config_level(config, "level");
        if (!level) throw configuration_error("Level filter requires 'level'");
        return std::make_shared<level_filter>(*level);
    }
    if (type == "regex")
    {
        auto pattern = detail::config_string(config, "pattern");
        if (!pattern) throw configuration_error("Regex filter requires 'pattern'");
        return std::make_shared<regex_filter>(*pattern, detail::config_bool(config, "invert").value_or(false));
    }
    if (type == "time")
    {
        auto start = detail::config_string(config, "start");
        auto end   = detail::config_string(config, "end");
        if (!start || !end) throw configuration_error("Time filter requires 'start' and 'end'");
        return std::make_shared<time_filter>(*start, *end);
    }
    if (type == "module")
    {
        std::vector<std::string> names;
        if (const auto *list = detail::config_array(config, "names"))
        {
            for (const auto &entry : *list)
            {
                if (!entry.is_string()) throw configuration_error("Module filter names must be strings");
                names.push_back(entry.get_string());
            }
        }
        return std::make_shared<module_filter>(names);
    }
    if (type == "composite")
    {
        auto mode = composite_mode_from_string(detail::config_string(config, "mode").value_or("and"));
        if (mode == composite_mode::invalid) throw configuration_error("Composite filter mode must be 'and' or 'or'");

        filter_list children;
        if (const auto *list = detail::config_array(config, "filters"))
        {
            for (const auto &entry : *list) children.push_back(make_filter(entry));
        }
        return std::make_shared<composite_filter>(mode, std::move(children));
    }

    throw configuration_error(fmt::format("Unknown filter type '{}'", type));
}

/**
 * @brief Build a formatter from {"type": "default"|"json"|"xml"|"yaml"|"csv"|"html"|"markdown", ...}
 *
 * "template" applies to the default formatter, "time_format" to all of
 * them, "pretty" to json.
 */
inline formatter_ptr make_formatter(const tao::json::value &config)
{
    auto type        = detail::config_string(config, "type").value_or("default");
    type             = detail::to_lower(type);
    auto time_format = detail::config_string(config, "time_format");

    if (type == "default" || type == "template")
    {
        return std::make_shared<template_formatter>(
            detail::config_string(config, "template").value_or(template_formatter::DEFAULT_TEMPLATE),
            time_format.value_or(template_formatter::DEFAULT_TIME_FORMAT));
    }

    std::string structured_time = time_format.value_or(structured_formatter::ISO_TIME_FORMAT);
    if (type == "json")
    {
        auto formatter          = std::make_shared<json_formatter>(structured_time);
        formatter->pretty_print = detail::config_bool(config, "pretty").value_or(false);
        return formatter;
    }
    if (type == "xml") return std::make_shared<xml_formatter>(structured_time);
    if (type == "yaml") return std::make_shared<yaml_formatter>(structured_time);
    if (type == "csv") return std::make_shared<csv_formatter>(structured_time);
    if (type == "html") return std::make_shared<html_formatter>(structured_time);
    if (type == "markdown") return std::make_shared<markdown_formatter>(structured_time);

    throw configuration_error(fmt::format("Unknown formatter type '{}'", type));
}

/// Deferred construction of a validated handler entry
using handler_factory = std::function<handler_ptr()>;

/**
 * @brief Validate a handler entry and return a factory that builds it
 *
 * Entries look like {"type": "stream"|"file"|"size_rotating_file"|"timed_rotating_file", ...}.
 * File handlers read file_directory (default "logs"), file_name (default
 * "{name}_{index}", where {name} is @p logger_name), max_size, max_lines,
 * backup_count, when, interval and compress. Every handler accepts
 * "level" (a handler-level minimum), "filters" and "formatter".
 *
 * All configuration errors are raised here. The factory only performs the
 * I/O of opening the handler, so it can still raise handler_io_error.
 */
inline handler_factory plan_handler(const tao::json::value &config, const std::string &logger_name)
{
    auto type = detail::config_type(config, "Handler");

    filter_list filters;
    if (auto level = detail::config_level(config, "level")) filters.push_back(std::make_shared<level_filter>(*level));
    if (const auto *list = detail::config_array(config, "filters"))
    {
        for (const auto &entry : *list) filters.push_back(make_filter(entry));
    }
    formatter_ptr formatter;
    if (const auto *node = detail::config_member(config, "formatter")) formatter = make_formatter(*node);

    auto finish = [filters, formatter](handler_ptr handler)
    {
        for (const auto &filter : filters) handler->add_filter(filter);
        if (formatter) handler->set_formatter(formatter);
        return handler;
    };

    if (type == "stream")
    {
        auto stream = detail::to_lower(detail::config_string(config, "stream").value_or("stdout"));
        int fd      = STDOUT_FILENO;
        if (stream == "stderr") fd = STDERR_FILENO;
        else if (stream != "stdout") throw configuration_error(fmt::format("Unknown stream '{}'", stream));
        bool color = detail::config_bool(config, "color").value_or(true);

        return [finish, fd, color] { return finish(make_stream_handler(fd, color)); };
    }

    if (type == "file" || type == "size_rotating_file" || type == "timed_rotating_file")
    {
        std::string directory = detail::config_string(config, "file_directory").value_or("logs");
        std::string file_name = detail::config_string(config, "file_name").value_or("{name}_{index}");
        for (size_t pos = file_name.find("{name}"); pos != std::string::npos; pos = file_name.find("{name}", pos + logger_name.size()))
        {
            file_name.replace(pos, 6, logger_name);
        }

        rotate_policy policy;
        if (auto max_size = detail::config_int(config, "max_size", 1)) policy.max_bytes = static_cast<uint64_t>(*max_size);
        if (auto max_lines = detail::config_int(config, "max_lines", 1)) policy.max_lines = static_cast<uint64_t>(*max_lines);
        policy.backup_count = static_cast<int>(detail::config_int(config, "backup_count", 0).value_or(0));
        policy.interval     = static_cast<int>(detail::config_int(config, "interval", 1).value_or(1));

        if (type == "size_rotating_file" && !policy.max_bytes)
        {
            throw configuration_error("size_rotating_file handler requires 'max_size'");
        }
        if (type == "timed_rotating_file")
        {
            auto when_text = detail::config_string(config, "when").value_or("midnight");
            auto when      = rotate_when_from_string(when_text);
            if (!when || *when == rotate_when::none) throw configuration_error(fmt::format("Unknown rotation unit '{}'", when_text));
            policy.when = *when;
        }
        rotating_file_handler::validate(file_name, policy);

        bool compress = detail::config_bool(config, "compress").value_or(false);
        return [finish, directory, file_name, policy, compress]
        {
            std::shared_ptr<file_compressor> compressor;
            if (compress) compressor = std::make_shared<gzip_compressor>();
            return finish(std::make_shared<rotating_file_handler>(directory, file_name, policy, std::move(compressor)));
        };
    }

    throw configuration_error(fmt::format("Unknown handler type '{}'", type));
}

/**
 * @brief Build a handler from a configuration entry
 * @see plan_handler for the accepted keys
 */
inline handler_ptr make_handler(const tao::json::value &config, const std::string &logger_name)
{
    return plan_handler(config, logger_name)();
}

/**
 * @brief Create or update a logger from a configuration object
 *
 * "name" (dotted) is required; the logger and any missing ancestors are
 * created. Other keys: level, prefix, propagate, enabled, context (object of
 * values), tags (array of strings, added to existing ones), category,
 * formatter, filters, handlers. Everything is validated before any handler
 * opens a file, and built before the logger is touched, so a
 * configuration_error leaves both the filesystem and the registry unchanged.
 * A handler_io_error while opening a later file handler can leave the
 * directories of earlier ones behind.
 */
inline logger &configure_logger(logger_registry &registry, const tao::json::value &config)
{
    auto name = detail::config_string(config, "name");
    if (!name || name->empty()) throw configuration_error("Logger configuration requires a 'name'");
    std::string lower_name = detail::to_lower(*name);

    auto level     = detail::config_level(config, "level");
    auto prefix    = detail::config_string(config, "prefix");
    auto propagate = detail::config_bool(config, "propagate");
    auto enabled   = detail::config_bool(config, "enabled");

    formatter_ptr formatter;
    if (const auto *node = detail::config_member(config, "formatter")) formatter = make_formatter(*node);

    filter_list filters;
    if (const auto *list = detail::config_array(config, "filters"))
    {
        for (const auto &entry : *list) filters.push_back(make_filter(entry));
    }

    std::vector<handler_factory> planned;
    if (const auto *list = detail::config_array(config, "handlers"))
    {
        for (const auto &entry : *list) planned.push_back(plan_handler(entry, lower_name));
    }

    auto category = detail::config_string(config, "category");
    std::vector<std::string> tags;
    if (const auto *list = detail::config_array(config, "tags"))
    {
        for (const auto &entry : *list)
        {
            if (!entry.is_string()) throw configuration_error("'tags' must be an array of strings");
            tags.push_back(entry.get_string());
        }
    }

    std::optional<extra_map> context;
    if (const auto *node = detail::config_member(config, "context"))
    {
        if (!node->is_object()) throw configuration_error("'context' must be an object");
        context.emplace();
        for (const auto &[key, value] : node->get_object())
        {
            if (value.is_string()) context->set(key, value.get_string());
            else context->set(key, tao::json::to_string(value));
        }
    }

    // Files are opened only once every entry has been validated
    std::vector<handler_ptr> handlers;
    for (const auto &factory : planned) handlers.push_back(factory());

    logger &log = registry.get_or_create(lower_name);
    if (level) log.set_level(*level);
    if (prefix) log.set_prefix(*prefix);
    if (propagate) log.set_propagate(*propagate);
    if (enabled) { *enabled ? log.enable() : log.disable(); }
    if (formatter) log.set_formatter(std::move(formatter));
    if (context) log.set_context(std::move(*context));
    if (category) log.set_category(std::move(*category));
    for (auto &tag : tags) log.add_tag(std::move(tag));
    for (auto &filter : filters) log.add_filter(std::move(filter));
    for (auto &handler : handlers) log.add_handler(std::move(handler));
    return log;
}

} // namespace treelog
