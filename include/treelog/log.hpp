/**
 * @file log.hpp
 * @brief Hierarchical structured logging
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * This logging system provides:
 * - A tree of named loggers with level gates and propagation to ancestors
 * - Filters inherited down the tree, plus per-handler filters
 * - Inner middleware that rewrite or veto records, outer middleware that observe them
 * - Console, rotating file and remote handlers
 * - Template and structured (JSON, XML, YAML, CSV, HTML, Markdown) formatters
 * - Optional dispatch on a background worker thread
 *
 * Basic Usage:
 * @code
 * treelog::logger_registry registry;
 *
 * auto &app = registry.get_or_create("app");
 * app.add_handler(treelog::make_file_handler("logs", "app_{index}", 1024 * 1024));
 * app.info("Application started");
 * // Written to logs/app_0.log and, through propagation, to root's stdout handler:
 * // [14/03/2025 10:02:11] app | INFO[30]: Application started
 *
 * auto &db = registry.get_or_create("app.db");
 * db.warning("Slow query", {{"table", "orders"}, {"ms", "812"}});
 *
 * registry.shutdown();
 * @endcode
 *
 * Levels:
 * @code
 * // NOTSET(0) TRACE(10) DEBUG(20) INFO(30) SUCCESS(40) WARNING(50) FAIL(60) ERROR(70) CRITICAL(80)
 * app.set_level(treelog::log_level::warning);
 * app.info("dropped");                // returns false
 * auto notice = treelog::register_level("notice", 35, "\033[34m");
 * app.log("custom level", notice);
 * @endcode
 *
 * Context and exceptions:
 * @code
 * app.add_context("request_id", 42);
 * try { risky(); }
 * catch (const std::exception &) { app.log_exception("risky failed"); }
 *
 * app.run_scoped("import", [&] { run_import(); }); // "Start: import" ... "End: import"
 * @endcode
 *
 * Asynchronous dispatch:
 * @code
 * registry.start_async();
 * auto done = app.log_async("queued", treelog::log_level::info);
 * done.get();
 * @endcode
 */
#pragma once

#include "fmt_config.hpp"
#include "log_version.hpp"
#include "log_errors.hpp"
#include "log_types.hpp"
#include "log_utils.hpp"
#include "log_record.hpp"
#include "log_filter.hpp"
#include "log_filters.hpp"
#include "log_formatter.hpp"
#include "log_formatters.hpp"
#include "log_handler.hpp"
#include "log_writers.hpp"
#include "log_gzip.hpp"
#include "log_file_rotator.hpp"
#include "log_handlers.hpp"
#include "log_middleware.hpp"
#include "log_dispatcher.hpp"
#include "log_logger.hpp"
#include "log_registry.hpp"
#include "log_config.hpp"

// Implementation files, after every declaration they depend on
#include "log_logger_impl.hpp"
#include "log_file_rotator_impl.hpp"
