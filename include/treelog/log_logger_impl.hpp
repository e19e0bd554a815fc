/**
 * @file log_logger_impl.hpp
 * @brief Implementation of logger and of the handler contract
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cxxabi.h>
#include <typeinfo>

#include "log_logger.hpp"
#include "log_registry.hpp"

namespace treelog
{

namespace detail
{

inline std::string demangle(const char *mangled)
{
    int status = 0;
    std::unique_ptr<char, void (*)(void *)> result(abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    return (status == 0 && result) ? std::string(result.get()) : std::string(mangled);
}

/**
 * @brief Last resort output for diagnostics no handler could take
 */
inline void print_internal(log_level level, std::string_view logger_name, std::string_view message) noexcept
{
    try
    {
        fmt::print(stderr, "treelog [{}] {}: {}\n", level_name(level), logger_name, message);
    }
    catch (const std::exception &e)
    {
        std::fputs("treelog: failed to print an internal diagnostic: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
    }
}

} // namespace detail

inline exception_info describe_exception(std::exception_ptr eptr)
{
    exception_info info;
    bool outermost = true;

    while (eptr)
    {
        std::exception_ptr next;
        std::string type;
        std::string what;

        try
        {
            std::rethrow_exception(eptr);
        }
        catch (const std::exception &e)
        {
            type = detail::demangle(typeid(e).name());
            what = e.what();
            if (auto *nested = dynamic_cast<const std::nested_exception *>(&e)) next = nested->nested_ptr();
        }
        catch (...)
        {
            auto *ti = abi::__cxa_current_exception_type();
            type     = ti ? detail::demangle(ti->name()) : "unknown";
            what     = "non-standard exception";
        }

        if (outermost)
        {
            info.type    = type;
            info.message = what;
            outermost    = false;
        }
        else { info.trace.push_back('\n'); }
        info.trace += fmt::format("{}: {}", type, what);

        eptr = next;
    }
    return info;
}

inline handle_status log_handler::handle(logger &owner, const log_record &record)
{
    if (closed()) return handle_status::skipped;

    auto filters  = filters_.snapshot();
    bool admitted = evaluate_filters(*filters,
                                     record,
                                     [&](const log_filter &filter, const std::string &what)
                                     {
                                         owner.report(log_level::warning,
                                                      fmt::format("Filter '{}' of handler '{}' failed: {}", filter.name(), name(), what),
                                                      nullptr);
                                     });
    if (!admitted) return handle_status::skipped;

    auto chosen = formatter();
    if (!chosen) chosen = owner.formatter();

    try
    {
        emit(owner, record, *chosen);
        return handle_status::written;
    }
    catch (const std::exception &e)
    {
        owner.report(log_level::error, fmt::format("Handler '{}' failed: {}", name(), e.what()), this);
    }
    catch (...)
    {
        owner.report(log_level::error, fmt::format("Handler '{}' failed: unknown exception", name()), this);
    }
    return handle_status::failed;
}

inline bool log_handler::handle_report(logger &owner, const log_record &record) noexcept
{
    if (closed()) return false;

    try
    {
        auto chosen = formatter();
        if (!chosen) chosen = owner.formatter();
        emit(owner, record, *chosen);
        return true;
    }
    catch (const std::exception &e)
    {
        detail::print_internal(log_level::error, owner.name(), fmt::format("Handler '{}' failed: {}", name(), e.what()));
    }
    catch (...)
    {
        detail::print_internal(log_level::error, owner.name(), "Handler failed: unknown exception");
    }
    return false;
}

inline logger::logger(logger_registry &registry, logger_options options, logger *parent)
    : registry_(registry),
      name_(detail::to_lower(options.name)),
      parent_(parent),
      level_(options.level),
      enabled_(options.enabled),
      propagate_(options.propagate),
      prefix_(std::move(options.prefix)),
      formatter_(options.formatter ? std::move(options.formatter) : std::make_shared<template_formatter>())
{
}

inline std::string logger::prefix() const
{
    std::lock_guard<std::mutex> lock(settings_mutex_);
    return prefix_.empty() ? name_ : prefix_;
}

inline void logger::set_prefix(std::string prefix)
{
    std::lock_guard<std::mutex> lock(settings_mutex_);
    prefix_ = std::move(prefix);
}

inline formatter_ptr logger::formatter() const
{
    std::lock_guard<std::mutex> lock(settings_mutex_);
    return formatter_;
}

inline void logger::set_formatter(formatter_ptr formatter)
{
    if (!formatter) formatter = std::make_shared<template_formatter>();
    std::lock_guard<std::mutex> lock(settings_mutex_);
    formatter_ = std::move(formatter);
}

inline filter_list logger::effective_filters() const
{
    std::vector<const logger *> lineage;
    for (const logger *node = this; node; node = node->parent_) lineage.push_back(node);

    filter_list result;
    for (auto it = lineage.rbegin(); it != lineage.rend(); ++it)
    {
        auto own = (*it)->filters();
        result.insert(result.end(), own->begin(), own->end());
    }
    return result;
}

inline void logger::set_context(extra_map context)
{
    std::lock_guard<std::mutex> lock(context_mutex_);
    context_ = std::move(context);
}

inline void logger::clear_context()
{
    std::lock_guard<std::mutex> lock(context_mutex_);
    context_.clear();
}

inline extra_map logger::context() const
{
    std::lock_guard<std::mutex> lock(context_mutex_);
    return context_;
}

inline void logger::add_tag(std::string tag)
{
    std::lock_guard<std::mutex> lock(context_mutex_);
    tags_.push_back(std::move(tag));
}

inline bool logger::remove_tag(std::string_view tag)
{
    std::lock_guard<std::mutex> lock(context_mutex_);
    auto it = std::find(tags_.begin(), tags_.end(), tag);
    if (it == tags_.end()) return false;
    tags_.erase(it);
    return true;
}

inline std::vector<std::string> logger::tags() const
{
    std::lock_guard<std::mutex> lock(context_mutex_);
    return tags_;
}

inline void logger::set_category(std::string category)
{
    std::lock_guard<std::mutex> lock(context_mutex_);
    category_ = std::move(category);
}

inline void logger::clear_category()
{
    std::lock_guard<std::mutex> lock(context_mutex_);
    category_.reset();
}

inline std::optional<std::string> logger::category() const
{
    std::lock_guard<std::mutex> lock(context_mutex_);
    return category_;
}

inline log_record logger::make_record(std::string message, log_level level, extra_map extra) const
{
    log_record record;
    record.message     = std::move(message);
    record.level       = level;
    record.logger_name = name_;
    record.prefix      = prefix();
    if (parent_) record.parent_name = parent_->name_;

    {
        std::lock_guard<std::mutex> lock(context_mutex_);
        record.extra = context_;
        record.extra.merge(extra, true);
        if (!tags_.empty())
        {
            std::string joined;
            for (size_t i = 0; i < tags_.size(); ++i)
            {
                if (i > 0) joined += ',';
                joined += tags_[i];
            }
            record.extra.set_default("tags", joined);
        }
        if (category_) record.extra.set_default("category", *category_);
    }
    return record;
}

inline log_record logger::restamp(const log_record &record) const
{
    log_record copy  = record;
    copy.logger_name = name_;
    copy.prefix      = prefix();
    if (parent_) { copy.parent_name = parent_->name_; }
    else { copy.parent_name.reset(); }
    return copy;
}

inline bool logger::log(std::string message, log_level level, extra_map extra)
{
    if (!enabled() || level < this->level()) return false;
    return dispatch(make_record(std::move(message), level, std::move(extra)));
}

inline std::future<bool> logger::log_async(std::string message, log_level level, extra_map extra)
{
    if (!enabled() || level < this->level())
    {
        std::promise<bool> rejected;
        rejected.set_value(false);
        return rejected.get_future();
    }

    auto record = make_record(std::move(message), level, std::move(extra));
    return registry_.executor().submit([this, record = std::move(record)]() mutable { return dispatch(std::move(record)); });
}

inline bool logger::dispatch(log_record record)
{
    if (!admit(record)) return false;
    if (!process(record)) return false;

    if (propagate() && parent_) parent_->offer(parent_->restamp(record));
    return true;
}

inline bool logger::admit(const log_record &record)
{
    return evaluate_filters(effective_filters(),
                            record,
                            [&](const log_filter &filter, const std::string &what)
                            { report(log_level::warning, fmt::format("Filter '{}' failed: {}", filter.name(), what), nullptr); });
}

inline bool logger::process(const log_record &record)
{
    log_record current = record;

    auto filter_failed = [this](const middleware_base &step)
    {
        return [this, &step](const log_filter &filter, const std::string &what)
        {
            report(log_level::warning,
                   fmt::format("Filter '{}' of middleware '{}' failed: {}", filter.name(), step.name(), what),
                   nullptr);
        };
    };

    auto inner = inner_.snapshot();
    for (const auto &step : *inner)
    {
        log_record candidate = current;
        try
        {
            if (!step->applies_to(candidate, filter_failed(*step))) continue;
            if (step->process(*this, candidate) == middleware_verdict::reject) return false;
            current = std::move(candidate);
        }
        catch (const std::exception &e)
        {
            report(log_level::warning, fmt::format("Inner middleware '{}' failed: {}", step->name(), e.what()), nullptr);
        }
        catch (...)
        {
            report(log_level::warning, fmt::format("Inner middleware '{}' failed: unknown exception", step->name()), nullptr);
        }
    }

    auto handlers = handlers_.snapshot();
    for (const auto &handler : *handlers) { handler->handle(*this, current); }

    auto outer = outer_.snapshot();
    for (const auto &step : *outer)
    {
        try
        {
            if (step->applies_to(current, filter_failed(*step))) step->process(*this, current);
        }
        catch (const std::exception &e)
        {
            report(log_level::warning, fmt::format("Outer middleware '{}' failed: {}", step->name(), e.what()), nullptr);
        }
        catch (...)
        {
            report(log_level::warning, fmt::format("Outer middleware '{}' failed: unknown exception", step->name()), nullptr);
        }
    }
    return true;
}

// The gate failing here does not stop the record from climbing further
inline void logger::offer(const log_record &record)
{
    if (enabled() && level() <= record.level && admit(record))
    {
        if (!process(record)) return;
    }

    if (propagate() && parent_) parent_->offer(parent_->restamp(record));
}

inline bool logger::log_exception(std::string message, log_level level, extra_map extra)
{
    if (auto eptr = std::current_exception())
    {
        auto info = describe_exception(eptr);
        extra.set("exception_type", info.type);
        extra.set("exception_message", info.message);
        extra.set("stack_trace", info.trace);
    }
    return log(fmt::format("Exception: {}", message), level, std::move(extra));
}

inline bool logger::deliver_report(const log_record &record, const log_handler *skip)
{
    bool written  = false;
    auto handlers = handlers_.snapshot();
    for (const auto &handler : *handlers)
    {
        if (handler.get() == skip) continue;
        written = handler->handle_report(*this, record) || written;
    }
    return written;
}

inline void logger::report(log_level level, std::string message, const log_handler *skip, extra_map extra) noexcept
{
    thread_local int depth = 0;
    if (depth > 0)
    {
        detail::print_internal(level, name_, message);
        return;
    }

    struct depth_guard
    {
        int &d;
        explicit depth_guard(int &value) : d(value) { ++d; }
        ~depth_guard() { --d; }
    } guard(depth);

    try
    {
        log_record record = make_record(message, level, std::move(extra));

        bool written = false;
        for (logger *node = this;;)
        {
            written = node->deliver_report(record, skip) || written;
            if (!node->propagate() || !node->parent_) break;
            node   = node->parent_;
            record = node->restamp(record);
        }

        if (!written) detail::print_internal(level, name_, message);
    }
    catch (const std::exception &e)
    {
        detail::print_internal(level, name_, fmt::format("{} (while reporting: {})", message, e.what()));
    }
    catch (...)
    {
        detail::print_internal(level, name_, fmt::format("{} (while reporting: unknown exception)", message));
    }
}

} // namespace treelog
