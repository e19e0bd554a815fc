/**
 * @file log_middleware.hpp
 * @brief Pre-dispatch (inner) and post-dispatch (outer) middleware
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Inner middleware run after admission and before the handlers; each step
 * may rewrite the record or reject it. Outer middleware run after the
 * handlers and only observe. Both chains run in ascending priority order,
 * equal priorities in insertion order.
 *
 * @code
 * log.add_inner_middleware(std::make_shared<context_middleware>(extra_map{{"service", "billing"}}));
 * log.add_outer_middleware(std::make_shared<alert_middleware>(pager, "#oncall"));
 * @endcode
 */
#pragma once

#include <functional>
#include <memory>
#include <string>

#include "log_filter.hpp"
#include "log_formatter.hpp"
#include "log_handlers.hpp"
#include "log_utils.hpp"

namespace treelog
{

class logger;

enum class middleware_verdict
{
    pass,  ///< Continue with the (possibly rewritten) record
    reject ///< Stop the log call before any handler runs
};

/**
 * @brief Priority and applicability filters shared by both chains
 *
 * A step whose filters reject a record is skipped for that record.
 */
class middleware_base
{
  public:
    explicit middleware_base(int priority = 0) : priority_(priority) {}
    virtual ~middleware_base() = default;

    int priority() const noexcept { return priority_; }

    void add_filter(filter_ptr filter) { filters_.push_back(std::move(filter)); }

    /**
     * @brief Whether this step runs for @p record
     *
     * Exceptions from the filters propagate and count as a failure of the
     * step. Failures inside composite filters go to @p on_error.
     */
    bool applies_to(const log_record &record, const filter_error_fn &on_error) const
    {
        auto filters = filters_.snapshot();
        for (const auto &filter : *filters)
        {
            if (!filter->evaluate(record, on_error)) return false;
        }
        return true;
    }

    virtual const char *name() const = 0;

  private:
    int priority_;
    rcu_list<filter_ptr> filters_;
};

class inner_middleware : public middleware_base
{
  public:
    using middleware_base::middleware_base;

    /**
     * @brief Process a record
     *
     * @p record is a private copy; on an exception it is discarded and the
     * chain continues with the record as it was before this step.
     */
    virtual middleware_verdict process(logger &owner, log_record &record) = 0;
};

class outer_middleware : public middleware_base
{
  public:
    using middleware_base::middleware_base;

    virtual void process(logger &owner, const log_record &record) = 0;
};

using inner_middleware_ptr = std::shared_ptr<inner_middleware>;
using outer_middleware_ptr = std::shared_ptr<outer_middleware>;

/// Strict weak order used to keep the chains insertion-sorted
struct by_priority
{
    bool operator()(const std::shared_ptr<inner_middleware> &a, const std::shared_ptr<inner_middleware> &b) const noexcept
    {
        return a->priority() < b->priority();
    }
    bool operator()(const std::shared_ptr<outer_middleware> &a, const std::shared_ptr<outer_middleware> &b) const noexcept
    {
        return a->priority() < b->priority();
    }
};

/**
 * @brief Merge fixed key/values into the record's extras
 *
 * Keys already on the record win. With interpolate set, the message is
 * then formatted against the extras as a fmt template, so
 * "user {user} logged in" picks up the "user" entry. A message that does
 * not format keeps its text and gains a "[formatting error: ...]" suffix.
 */
class context_middleware final : public inner_middleware
{
  public:
    explicit context_middleware(extra_map context, bool interpolate = false, int priority = 0)
        : inner_middleware(priority), context_(std::move(context)), interpolate_(interpolate)
    {
    }

    middleware_verdict process(logger &, log_record &record) override
    {
        record.extra.merge(context_, false);

        if (interpolate_)
        {
            fmt::dynamic_format_arg_store<fmt::format_context> store;
            for (const auto &[key, value] : record.extra) { store.push_back(fmt::arg(key.c_str(), value)); }

            try
            {
                record.message = fmt::vformat(record.message, store);
            }
            catch (const fmt::format_error &e)
            {
                record.message += fmt::format(" [formatting error: {}]", e.what());
            }
        }
        return middleware_verdict::pass;
    }

    const char *name() const override { return "context"; }

  private:
    extra_map context_;
    bool interpolate_;
};

/**
 * @brief Send records at or above a threshold to a remote destination
 *
 * A refused delivery raises middleware_error, which the chain reports.
 */
class alert_middleware final : public outer_middleware
{
  public:
    alert_middleware(std::shared_ptr<remote_sender> sender,
                     std::string destination,
                     log_level threshold     = log_level::error,
                     formatter_ptr formatter = nullptr,
                     int priority            = 0)
        : outer_middleware(priority),
          sender_(std::move(sender)),
          destination_(std::move(destination)),
          threshold_(threshold),
          formatter_(std::move(formatter))
    {
    }

    void process(logger &, const log_record &record) override
    {
        if (record.level < threshold_) return;

        std::string text = formatter_
                               ? formatter_->render(record)
                               : fmt::format("[{}] {}: {}", level_name(record.level), record.display_prefix(), record.message);

        if (!sender_->send(destination_, text))
        {
            throw middleware_error(fmt::format("Alert delivery to '{}' was refused", destination_));
        }
    }

    const char *name() const override { return "alert"; }

  private:
    std::shared_ptr<remote_sender> sender_;
    std::string destination_;
    log_level threshold_;
    formatter_ptr formatter_;
};

/**
 * @brief Inner middleware wrapping a callable
 *
 * @code
 * log.add_inner_middleware(make_inner_middleware(10, [](logger &, log_record &r) {
 *     r.message = "[audit] " + r.message;
 *     return middleware_verdict::pass;
 * }));
 * @endcode
 */
class function_inner_middleware final : public inner_middleware
{
  public:
    using function_type = std::function<middleware_verdict(logger &, log_record &)>;

    function_inner_middleware(int priority, function_type fn, std::string name = "function")
        : inner_middleware(priority), fn_(std::move(fn)), name_(std::move(name))
    {
    }

    middleware_verdict process(logger &owner, log_record &record) override { return fn_(owner, record); }
    const char *name() const override { return name_.c_str(); }

  private:
    function_type fn_;
    std::string name_;
};

/**
 * @brief Outer middleware wrapping a callable
 */
class function_outer_middleware final : public outer_middleware
{
  public:
    using function_type = std::function<void(logger &, const log_record &)>;

    function_outer_middleware(int priority, function_type fn, std::string name = "function")
        : outer_middleware(priority), fn_(std::move(fn)), name_(std::move(name))
    {
    }

    void process(logger &owner, const log_record &record) override { fn_(owner, record); }
    const char *name() const override { return name_.c_str(); }

  private:
    function_type fn_;
    std::string name_;
};

inline inner_middleware_ptr make_inner_middleware(int priority, function_inner_middleware::function_type fn, std::string name = "function")
{
    return std::make_shared<function_inner_middleware>(priority, std::move(fn), std::move(name));
}

inline outer_middleware_ptr make_outer_middleware(int priority, function_outer_middleware::function_type fn, std::string name = "function")
{
    return std::make_shared<function_outer_middleware>(priority, std::move(fn), std::move(name));
}

} // namespace treelog
