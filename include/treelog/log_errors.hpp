/**
 * @file log_errors.hpp
 * @brief Exception types raised by the logging system
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Only configuration_error ever reaches the caller of a logging API. The
 * remaining types are raised inside the dispatch chain and are caught there:
 * a failing filter rejects, a failing handler or middleware step is reported
 * through the owning logger and the chain carries on.
 */
#pragma once

#include <stdexcept>
#include <string>

namespace treelog
{

/**
 * @brief Invalid construction input
 *
 * Duplicate logger or level names, a rotation template without the
 * {index} placeholder, unknown handler/filter/formatter types in a
 * configuration map.
 */
class configuration_error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// A filter could not evaluate a record; treated as a rejection.
class filter_evaluation_error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// A handler could not deliver a record (file open/write, remote send).
class handler_io_error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// A middleware step failed; the chain continues with the last good record.
class middleware_error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// A retired log file could not be compressed.
class compression_error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

} // namespace treelog
