/**
 * @file log_logger.hpp
 * @brief Named logger nodes and the per-call dispatch chain
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A log call runs through these steps:
 * 1. Fast gate: disabled logger or level below the logger's level -> false
 * 2. Record construction: context merged with call-site extras (call site wins),
 *    then tags and category
 * 3. Admission: inherited filters (furthest ancestor first), then own filters
 * 4. Inner middleware in priority order, each step on a copy of the record
 * 5. Every handler: its own filters, formatting, emission
 * 6. Outer middleware in priority order
 * 7. Propagation: a re-stamped copy of the record from step 2 is offered to
 *    the parent, which runs steps 1 and 3-6 with its own configuration
 *
 * Failures of filters, middleware and handlers never reach the caller. They
 * are reported through report() and the call carries on.
 */
#pragma once

#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "log_filter.hpp"
#include "log_formatter.hpp"
#include "log_handler.hpp"
#include "log_middleware.hpp"
#include "log_record.hpp"
#include "log_types.hpp"
#include "log_utils.hpp"

namespace treelog
{

class logger_registry;

/**
 * @brief Construction parameters of a logger
 *
 * @code
 * auto &db = registry.create({.name = "db", .level = log_level::debug, .propagate = false});
 * @endcode
 */
struct logger_options
{
    std::string name;
    std::string prefix;                 ///< Display prefix, defaults to the name
    log_level level   = log_level::notset;
    bool propagate    = true;
    bool enabled      = true;
    logger *parent    = nullptr;        ///< Defaults to the registry's root logger
    formatter_ptr formatter;            ///< Defaults to a template_formatter
};

/**
 * @brief Description of an exception for log extras
 */
struct exception_info
{
    std::string type;    ///< Demangled type name
    std::string message; ///< what() of the outermost exception
    std::string trace;   ///< One line per nested exception, outermost first
};

/**
 * @brief Describe an exception and the chain of exceptions nested in it
 */
exception_info describe_exception(std::exception_ptr eptr);

/**
 * @brief Node of the logger tree
 *
 * Loggers are owned by a logger_registry and live as long as it does.
 * Configuration (handlers, filters, middleware, context) may be changed
 * from any thread at any time; a log call in progress keeps using the
 * configuration it started with.
 */
class logger
{
  public:
    logger(logger_registry &registry, logger_options options, logger *parent);

    logger(const logger &)            = delete;
    logger &operator=(const logger &) = delete;

    const std::string &name() const noexcept { return name_; }

    std::string prefix() const;
    void set_prefix(std::string prefix);

    log_level level() const noexcept { return level_.load(std::memory_order_relaxed); }
    void set_level(log_level level) noexcept { level_.store(level, std::memory_order_relaxed); }

    bool enabled() const noexcept { return enabled_.load(std::memory_order_relaxed); }
    void enable() noexcept { enabled_.store(true, std::memory_order_relaxed); }
    void disable() noexcept { enabled_.store(false, std::memory_order_relaxed); }

    bool propagate() const noexcept { return propagate_.load(std::memory_order_relaxed); }
    void set_propagate(bool propagate) noexcept { propagate_.store(propagate, std::memory_order_relaxed); }

    logger *parent() const noexcept { return parent_; }
    std::vector<logger *> children() const { return *children_.snapshot(); }

    logger_registry &registry() const noexcept { return registry_; }

    formatter_ptr formatter() const;
    void set_formatter(formatter_ptr formatter);

    /// @name Handlers
    /// @{
    void add_handler(handler_ptr handler) { handlers_.push_back(std::move(handler)); }
    bool remove_handler(const handler_ptr &handler)
    {
        return handlers_.remove_if([&](const handler_ptr &h) { return h == handler; }) > 0;
    }
    void clear_handlers() { handlers_.clear(); }
    rcu_list<handler_ptr>::snapshot_type handlers() const { return handlers_.snapshot(); }
    /// @}

    /// @name Filters
    /// @{
    void add_filter(filter_ptr filter) { filters_.push_back(std::move(filter)); }
    bool remove_filter(const filter_ptr &filter)
    {
        return filters_.remove_if([&](const filter_ptr &f) { return f == filter; }) > 0;
    }
    void clear_filters() { filters_.clear(); }
    rcu_list<filter_ptr>::snapshot_type filters() const { return filters_.snapshot(); }

    /**
     * @brief Filters applied at admission: furthest ancestor's first, own last
     */
    filter_list effective_filters() const;
    /// @}

    /// @name Middleware
    /// @{
    void add_inner_middleware(inner_middleware_ptr middleware) { inner_.insert_sorted(std::move(middleware), by_priority{}); }
    void add_outer_middleware(outer_middleware_ptr middleware) { outer_.insert_sorted(std::move(middleware), by_priority{}); }
    bool remove_inner_middleware(const inner_middleware_ptr &middleware)
    {
        return inner_.remove_if([&](const inner_middleware_ptr &m) { return m == middleware; }) > 0;
    }
    bool remove_outer_middleware(const outer_middleware_ptr &middleware)
    {
        return outer_.remove_if([&](const outer_middleware_ptr &m) { return m == middleware; }) > 0;
    }
    void clear_middleware()
    {
        inner_.clear();
        outer_.clear();
    }
    rcu_list<inner_middleware_ptr>::snapshot_type inner_middleware() const { return inner_.snapshot(); }
    rcu_list<outer_middleware_ptr>::snapshot_type outer_middleware() const { return outer_.snapshot(); }
    /// @}

    /// @name Context merged into every record of this logger
    /// @{
    template <Loggable T> void add_context(std::string_view key, T &&value)
    {
        std::lock_guard<std::mutex> lock(context_mutex_);
        context_.set(key, std::forward<T>(value));
    }
    void set_context(extra_map context);
    void clear_context();
    extra_map context() const;
    /// @}

    /**
     * @name Tags and category
     *
     * Stamped on every record as the extras "tags" (joined with ',') and
     * "category", unless the context or the call site already set those keys.
     */
    /// @{
    void add_tag(std::string tag);
    /// Removes the first occurrence; false when the tag is not present
    bool remove_tag(std::string_view tag);
    std::vector<std::string> tags() const;
    void set_category(std::string category);
    void clear_category();
    std::optional<std::string> category() const;
    /// @}

    /**
     * @brief Log a message
     * @return false if the fast gate, a filter or an inner middleware rejected the call
     */
    bool log(std::string message, log_level level, extra_map extra = {});

    /**
     * @brief Log through the registry's executor
     *
     * The fast gate and the record's timestamp are taken on the calling
     * thread; the rest of the chain runs on the executor. With the default
     * inline executor the future is ready on return.
     */
    std::future<bool> log_async(std::string message, log_level level, extra_map extra = {});

    bool trace(std::string message, extra_map extra = {}) { return log(std::move(message), log_level::trace, std::move(extra)); }
    bool debug(std::string message, extra_map extra = {}) { return log(std::move(message), log_level::debug, std::move(extra)); }
    bool info(std::string message, extra_map extra = {}) { return log(std::move(message), log_level::info, std::move(extra)); }
    bool success(std::string message, extra_map extra = {}) { return log(std::move(message), log_level::success, std::move(extra)); }
    bool warning(std::string message, extra_map extra = {}) { return log(std::move(message), log_level::warning, std::move(extra)); }
    bool fail(std::string message, extra_map extra = {}) { return log(std::move(message), log_level::fail, std::move(extra)); }
    bool error(std::string message, extra_map extra = {}) { return log(std::move(message), log_level::error, std::move(extra)); }
    bool critical(std::string message, extra_map extra = {}) { return log(std::move(message), log_level::critical, std::move(extra)); }

    /**
     * @brief Log the exception currently being handled
     *
     * Adds exception_type, exception_message and stack_trace to the extras.
     * Meant to be called from inside a catch block.
     *
     * @code
     * try { load(); }
     * catch (const std::exception &) { log.log_exception("load failed"); }
     * @endcode
     */
    bool log_exception(std::string message, log_level level = log_level::error, extra_map extra = {});

    /**
     * @brief Run @p fn, logging and rethrowing any exception it throws
     */
    template <typename Fn> decltype(auto) catch_exceptions(std::string_view message, Fn &&fn, log_level level = log_level::error)
    {
        try
        {
            return std::forward<Fn>(fn)();
        }
        catch (...)
        {
            log_exception(std::string(message), level);
            throw;
        }
    }

    /**
     * @brief Run @p fn between "Start:" and "End:" messages
     *
     * An exception is logged as "Error in block: <message> - <what>" and
     * rethrown; the end message is written on every exit path.
     */
    template <typename Fn> decltype(auto) run_scoped(std::string_view message, Fn &&fn, log_level level = log_level::info);

    /**
     * @brief Run the chain after the fast gate for an already built record
     */
    bool dispatch(log_record record);

    /**
     * @brief Deliver an internal diagnostic through this logger's handlers
     *
     * Used for failures inside the chain. The record skips filters and
     * middleware, bypasses @p skip (the handler that failed), and climbs
     * the tree like a propagated record. A report raised while another is
     * being delivered on the same thread, or one no handler accepted, is
     * printed to stderr instead.
     */
    void report(log_level level, std::string message, const log_handler *skip, extra_map extra = {}) noexcept;

  private:
    friend class logger_registry;

    log_record make_record(std::string message, log_level level, extra_map extra) const;
    log_record restamp(const log_record &record) const;
    bool admit(const log_record &record);
    bool process(const log_record &record);
    void offer(const log_record &record);
    bool deliver_report(const log_record &record, const log_handler *skip);
    void add_child(logger *child) { children_.push_back(child); }

    logger_registry &registry_;
    std::string name_;
    logger *parent_;

    std::atomic<log_level> level_;
    std::atomic<bool> enabled_;
    std::atomic<bool> propagate_;

    mutable std::mutex settings_mutex_; // prefix_, formatter_
    std::string prefix_;
    formatter_ptr formatter_;

    mutable std::mutex context_mutex_;
    extra_map context_;
    std::vector<std::string> tags_;
    std::optional<std::string> category_;

    rcu_list<handler_ptr> handlers_;
    rcu_list<filter_ptr> filters_;
    rcu_list<inner_middleware_ptr> inner_;
    rcu_list<outer_middleware_ptr> outer_;
    rcu_list<logger *> children_;
};

/**
 * @brief RAII guard logging the start and end of a block
 *
 * The end message is written from the destructor, so it appears on every
 * exit path. When the block is left by an exception the destructor also
 * writes an ERROR record, unless fail() already described the error.
 *
 * @code
 * {
 *     log_scope scope(log, "nightly import");
 *     run_import();
 * } // "End: nightly import"
 * @endcode
 */
class log_scope
{
  public:
    log_scope(logger &log, std::string message, log_level level = log_level::info, std::string start_message = {}, std::string end_message = {})
        : log_(log),
          message_(std::move(message)),
          level_(level),
          end_message_(end_message.empty() ? "End: " + message_ : std::move(end_message)),
          uncaught_(std::uncaught_exceptions())
    {
        log_.log(start_message.empty() ? "Start: " + message_ : std::move(start_message), level_);
    }

    ~log_scope()
    {
        if (!failed_ && std::uncaught_exceptions() > uncaught_)
        {
            log_.log(fmt::format("Error in block: {}", message_), log_level::error);
        }
        log_.log(end_message_, level_);
    }

    log_scope(const log_scope &)            = delete;
    log_scope &operator=(const log_scope &) = delete;

    /// Log the error with its reason; the destructor will not log it again
    void fail(std::string_view reason)
    {
        failed_ = true;
        log_.log(fmt::format("Error in block: {} - {}", message_, reason), log_level::error);
    }

  private:
    logger &log_;
    std::string message_;
    log_level level_;
    std::string end_message_;
    int uncaught_;
    bool failed_ = false;
};

template <typename Fn> decltype(auto) logger::run_scoped(std::string_view message, Fn &&fn, log_level level)
{
    log_scope scope(*this, std::string(message), level);
    try
    {
        return std::forward<Fn>(fn)();
    }
    catch (const std::exception &e)
    {
        scope.fail(e.what());
        throw;
    }
}

} // namespace treelog
