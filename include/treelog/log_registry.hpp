/**
 * @file log_registry.hpp
 * @brief Owner of the logger tree
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * The registry owns every logger it creates, creates the root logger on
 * first use, and tears the tree down: shutdown() drains queued records and
 * closes each handler exactly once, however many loggers share it.
 *
 * @code
 * treelog::logger_registry registry;
 * auto &http = registry.get_or_create("app.http"); // app -> root
 * http.info("listening");
 * registry.shutdown();
 * @endcode
 */
#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "robin_hood.h"
#include "log_dispatcher.hpp"
#include "log_errors.hpp"
#include "log_handlers.hpp"
#include "log_logger.hpp"

namespace treelog
{

class logger_registry
{
  public:
    static constexpr const char *ROOT_NAME = "root";

    logger_registry() = default;
    ~logger_registry() { shutdown(); }

    logger_registry(const logger_registry &)            = delete;
    logger_registry &operator=(const logger_registry &) = delete;

    /**
     * @brief The root logger: level NOTSET, no propagation, colored stdout handler
     */
    logger &root()
    {
        {
            std::shared_lock lock(mutex_);
            if (root_) return *root_;
        }
        std::unique_lock lock(mutex_);
        return ensure_root_locked();
    }

    /**
     * @brief Create a logger
     *
     * The name is stored lower-cased. Without options.parent the logger
     * hangs directly under root.
     *
     * @throws configuration_error if the name is empty or already taken
     */
    logger &create(logger_options options)
    {
        options.name = detail::to_lower(options.name);
        if (options.name.empty()) { throw configuration_error("Logger name must not be empty"); }

        std::unique_lock lock(mutex_);
        logger *parent = options.parent ? options.parent : &ensure_root_locked();
        if (&parent->registry() != this)
        {
            throw configuration_error(fmt::format("Parent of logger '{}' belongs to another registry", options.name));
        }
        return create_locked(std::move(options), parent);
    }

    /**
     * @brief Find a logger by name (case insensitive)
     */
    logger *find(std::string_view name) const
    {
        auto key = detail::to_lower(name);
        std::shared_lock lock(mutex_);
        auto it = loggers_.find(key);
        return it == loggers_.end() ? nullptr : it->second.get();
    }

    /**
     * @brief Get a logger, creating it and any missing ancestors
     *
     * "app.db.pool" yields loggers "app", "app.db" and "app.db.pool", each
     * the parent of the next, with "app" under root.
     *
     * @throws configuration_error on an empty name or an empty segment
     */
    logger &get_or_create(std::string_view dotted_name)
    {
        auto key = detail::to_lower(dotted_name);
        if (key.empty() || key.front() == '.' || key.back() == '.' || key.find("..") != std::string::npos)
        {
            throw configuration_error(fmt::format("Invalid logger name '{}'", dotted_name));
        }

        std::unique_lock lock(mutex_);
        logger *node = &ensure_root_locked();

        size_t pos = 0;
        for (;;)
        {
            size_t dot       = key.find('.', pos);
            std::string path = key.substr(0, dot);

            if (auto it = loggers_.find(path); it != loggers_.end()) { node = it->second.get(); }
            else { node = &create_locked(logger_options{.name = path}, node); }

            if (dot == std::string::npos) break;
            pos = dot + 1;
        }
        return *node;
    }

    std::vector<logger *> loggers() const
    {
        std::shared_lock lock(mutex_);
        std::vector<logger *> result;
        result.reserve(loggers_.size());
        for (const auto &entry : loggers_) result.push_back(entry.second.get());
        return result;
    }

    /**
     * @brief Executor used by logger::log_async()
     */
    log_executor &executor() noexcept { return *executor_.load(std::memory_order_acquire); }

    /**
     * @brief Route log_async() through a background worker thread
     */
    void start_async()
    {
        std::lock_guard<std::mutex> lock(async_mutex_);
        if (!dispatchers_.empty() && !dispatchers_.back()->is_shut_down()) return;
        dispatchers_.push_back(std::make_unique<async_dispatcher>());
        executor_.store(dispatchers_.back().get(), std::memory_order_release);
    }

    /**
     * @brief Drain the worker and go back to inline execution
     *
     * The stopped dispatcher stays alive with the registry; a caller still
     * holding it runs its task inline.
     */
    void stop_async()
    {
        std::lock_guard<std::mutex> lock(async_mutex_);
        executor_.store(&inline_, std::memory_order_release);
        for (auto &dispatcher : dispatchers_) dispatcher->shutdown();
    }

    bool async_enabled() const noexcept { return executor_.load(std::memory_order_acquire) != &inline_; }

    /**
     * @brief Block until every record submitted through log_async() is handled
     */
    void drain()
    {
        std::lock_guard<std::mutex> lock(async_mutex_);
        for (auto &dispatcher : dispatchers_) dispatcher->drain();
    }

    /**
     * @brief Drain async work, then flush and close every handler once
     *
     * Idempotent; also run by the destructor.
     */
    void shutdown()
    {
        if (shut_down_.exchange(true, std::memory_order_acq_rel)) return;

        stop_async();

        std::vector<handler_ptr> handlers;
        {
            std::shared_lock lock(mutex_);
            robin_hood::unordered_set<const log_handler *> seen;
            for (const auto &entry : loggers_)
            {
                auto snapshot = entry.second->handlers();
                for (const auto &handler : *snapshot)
                {
                    if (seen.insert(handler.get()).second) handlers.push_back(handler);
                }
            }
        }

        for (const auto &handler : handlers)
        {
            try
            {
                handler->flush();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "treelog: flushing handler '{}' failed: {}\n", handler->name(), e.what());
            }
            handler->close();
        }
    }

    bool is_shut_down() const noexcept { return shut_down_.load(std::memory_order_acquire); }

  private:
    logger &ensure_root_locked()
    {
        if (!root_)
        {
            auto root = std::make_unique<logger>(
                *this,
                logger_options{.name = ROOT_NAME, .level = log_level::notset, .propagate = false},
                nullptr);
            root->add_handler(make_stream_handler());
            root_ = root.get();
            loggers_.emplace(ROOT_NAME, std::move(root));
        }
        return *root_;
    }

    logger &create_locked(logger_options options, logger *parent)
    {
        if (loggers_.find(options.name) != loggers_.end())
        {
            throw configuration_error(fmt::format("Logger '{}' already exists", options.name));
        }

        std::string key = options.name;
        auto node       = std::make_unique<logger>(*this, std::move(options), parent);
        logger &result  = *node;
        loggers_.emplace(std::move(key), std::move(node));
        parent->add_child(&result);
        return result;
    }

    mutable std::shared_mutex mutex_;
    robin_hood::unordered_map<std::string, std::unique_ptr<logger>> loggers_; // Lower-case name -> logger
    logger *root_ = nullptr;

    std::mutex async_mutex_;
    inline_executor inline_;
    std::vector<std::unique_ptr<async_dispatcher>> dispatchers_;
    std::atomic<log_executor *> executor_{&inline_};

    std::atomic<bool> shut_down_{false};
};

} // namespace treelog
