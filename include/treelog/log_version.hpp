/**
 * @file log_version.hpp
 * @brief Version information for the treelog logging library
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

namespace treelog
{

#ifndef TREELOG_VERSION_STRING
    #define TREELOG_VERSION_STRING "dev"
#endif

inline constexpr const char *VERSION = TREELOG_VERSION_STRING;

} // namespace treelog
