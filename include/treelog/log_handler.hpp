/**
 * @file log_handler.hpp
 * @brief Handler (sink) interface
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <atomic>
#include <memory>
#include <mutex>

#include "log_filter.hpp"
#include "log_formatter.hpp"
#include "log_utils.hpp"

namespace treelog
{

class logger;

/**
 * @brief Outcome of one handle() call
 */
enum class handle_status
{
    written, ///< The record was emitted
    skipped, ///< A handler filter rejected the record, or the handler is closed
    failed   ///< Emission failed; the failure was reported through the owning logger
};

/**
 * @brief Base class for handlers
 *
 * handle() runs the fixed part of the contract: handler filters, formatter
 * selection (own formatter, else the owning logger's), and failure
 * reporting. Derived classes implement emit() and throw on failure.
 *
 * One handler instance may be attached to several loggers; derived classes
 * serialize their own I/O.
 */
class log_handler
{
  public:
    virtual ~log_handler() = default;

    log_handler()                               = default;
    log_handler(const log_handler &)            = delete;
    log_handler &operator=(const log_handler &) = delete;

    /**
     * @brief Filter, format and emit a record
     *
     * Never throws. A failing emit() is reported to @p owner as an ERROR
     * record that bypasses this handler.
     */
    handle_status handle(logger &owner, const log_record &record);

    /**
     * @brief Emit an internal diagnostic, bypassing the handler filters
     * @return false if the handler is closed or emission failed
     */
    bool handle_report(logger &owner, const log_record &record) noexcept;

    void add_filter(filter_ptr filter) { filters_.push_back(std::move(filter)); }
    void clear_filters() { filters_.clear(); }
    rcu_list<filter_ptr>::snapshot_type filters() const { return filters_.snapshot(); }

    void set_formatter(formatter_ptr formatter)
    {
        std::lock_guard<std::mutex> lock(formatter_mutex_);
        formatter_ = std::move(formatter);
    }

    formatter_ptr formatter() const
    {
        std::lock_guard<std::mutex> lock(formatter_mutex_);
        return formatter_;
    }

    virtual void flush() {}

    /**
     * @brief Release the handler's resources
     *
     * Only the first call does anything. A closed handler skips every
     * record it is given.
     */
    void close()
    {
        if (!closed_.exchange(true, std::memory_order_acq_rel)) { do_close(); }
    }

    bool closed() const noexcept { return closed_.load(std::memory_order_acquire); }

    virtual const char *name() const = 0;

  protected:
    /**
     * @brief Deliver one record
     * @throws handler_io_error (or any std::exception) on failure
     */
    virtual void emit(logger &owner, const log_record &record, const log_formatter &formatter) = 0;

    virtual void do_close() {}

  private:
    rcu_list<filter_ptr> filters_;
    mutable std::mutex formatter_mutex_;
    formatter_ptr formatter_;
    std::atomic<bool> closed_{false};
};

using handler_ptr = std::shared_ptr<log_handler>;

} // namespace treelog
