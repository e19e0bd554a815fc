/**
 * @file log_filter.hpp
 * @brief Filter interface for record admission
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "log_record.hpp"

namespace treelog
{

/**
 * @brief Base class for admission filters
 *
 * Filters are attached to loggers (admission for the whole call, inherited
 * by descendants) and to handlers (admission for one sink). A filter never
 * modifies the record. Throwing from admit() is allowed; the caller treats
 * it as a rejection and reports it as a warning.
 */
class log_filter;

/// Receives a failing filter and the reason it failed
using filter_error_fn = std::function<void(const log_filter &, const std::string &)>;

class log_filter
{
  public:
    virtual ~log_filter() = default;

    /**
     * @brief Decide whether the record passes
     * @param record The record to check
     * @return true to admit, false to reject
     */
    virtual bool admit(const log_record &record) const = 0;

    /**
     * @brief Admission inside a dispatch
     *
     * Filters that combine other filters override this to hand failures of
     * their children to @p on_error instead of failing as a whole.
     */
    virtual bool evaluate(const log_record &record, const filter_error_fn &on_error) const
    {
        (void)on_error;
        return admit(record);
    }

    /**
     * @brief Get filter name for diagnostics
     */
    virtual const char *name() const = 0;
};

using filter_ptr  = std::shared_ptr<const log_filter>;
using filter_list = std::vector<filter_ptr>;

/**
 * @brief Evaluate filters in order, stopping at the first rejection
 *
 * An exception thrown by a filter counts as a rejection and is handed to
 * @p on_error together with the filter that raised it.
 */
inline bool evaluate_filters(const filter_list &filters, const log_record &record, const filter_error_fn &on_error)
{
    for (const auto &filter : filters)
    {
        bool admitted = false;
        try
        {
            admitted = filter->evaluate(record, on_error);
        }
        catch (const std::exception &e)
        {
            on_error(*filter, e.what());
        }
        catch (...)
        {
            on_error(*filter, "unknown exception");
        }
        if (!admitted) return false;
    }
    return true;
}

} // namespace treelog
