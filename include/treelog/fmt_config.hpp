/**
 * @file fmt_config.hpp
 * @brief Configuration for fmt library to be used in header-only mode
 *
 * treelog is a header-only library, so fmt is pulled in the same way
 * and no separate fmt compilation is required.
 */
#pragma once

#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif

#include <fmt/format.h>
#include <fmt/chrono.h>
#include <fmt/args.h>
