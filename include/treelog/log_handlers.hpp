/**
 * @file log_handlers.hpp
 * @brief Console and remote handlers, handler factory functions
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unistd.h>

#include "log_file_rotator.hpp"
#include "log_handler.hpp"
#include "log_utils.hpp"

namespace treelog
{

/**
 * @brief Handler writing to a file descriptor, stdout by default
 */
class stream_handler : public log_handler
{
  public:
    explicit stream_handler(int fd = STDOUT_FILENO, bool use_color = true) : fd_(fd), use_color_(use_color) {}

    const char *name() const override { return "stream"; }

    bool use_color() const noexcept { return use_color_; }

  protected:
    void emit(logger &, const log_record &record, const log_formatter &formatter) override
    {
        std::string text = use_color_ ? formatter.render_decorated(record) : formatter.render(record);
        text.push_back('\n');

        std::lock_guard<std::mutex> lock(mutex_);
        if (int err = detail::write_all(fd_, text.data(), text.size()))
        {
            throw handler_io_error(fmt::format("Failed to write to fd {}: {}", fd_, detail::get_error_string(err)));
        }
    }

  private:
    int fd_;
    bool use_color_;
    std::mutex mutex_;
};

/**
 * @brief Remote delivery collaborator (chat bots, webhooks, ...)
 */
class remote_sender
{
  public:
    virtual ~remote_sender() = default;

    /**
     * @return true if the text was delivered
     */
    virtual bool send(const std::string &destination, const std::string &text) = 0;
};

/**
 * @brief Handler forwarding rendered records to a remote_sender
 *
 * Delivery is best effort: a false return or any exception from the
 * sender becomes a handler failure, reported like any other.
 */
class remote_handler : public log_handler
{
  public:
    remote_handler(std::shared_ptr<remote_sender> sender, std::string destination)
        : sender_(std::move(sender)), destination_(std::move(destination))
    {
    }

    const char *name() const override { return "remote"; }

    const std::string &destination() const noexcept { return destination_; }

  protected:
    void emit(logger &, const log_record &record, const log_formatter &formatter) override
    {
        std::string text = formatter.render(record);

        bool delivered = false;
        try
        {
            delivered = sender_->send(destination_, text);
        }
        catch (const std::exception &e)
        {
            throw handler_io_error(fmt::format("Remote delivery to '{}' failed: {}", destination_, e.what()));
        }
        catch (...)
        {
            throw handler_io_error(fmt::format("Remote delivery to '{}' failed: unknown exception", destination_));
        }

        if (!delivered) { throw handler_io_error(fmt::format("Remote delivery to '{}' was refused", destination_)); }
    }

  private:
    std::shared_ptr<remote_sender> sender_;
    std::string destination_;
};

/**
 * @brief Create a console handler
 *
 * @code
 * auto console = make_stream_handler();               // stdout, colored
 * auto errors  = make_stream_handler(STDERR_FILENO);   // stderr
 * @endcode
 */
inline std::shared_ptr<stream_handler> make_stream_handler(int fd = STDOUT_FILENO, bool use_color = true)
{
    return std::make_shared<stream_handler>(fd, use_color);
}

/**
 * @brief Create a size/line bounded rotating file handler
 *
 * @code
 * auto handler = make_file_handler("logs", "app_{index}", 1024 * 1024);
 * // logs/app_0.log, logs/app_1.log, ...
 * @endcode
 */
inline std::shared_ptr<rotating_file_handler> make_file_handler(const std::string &directory,
                                                                const std::string &file_name,
                                                                uint64_t max_bytes,
                                                                std::optional<uint64_t> max_lines = std::nullopt)
{
    return std::make_shared<rotating_file_handler>(directory,
                                                   file_name,
                                                   rotate_policy{.max_bytes = max_bytes, .max_lines = max_lines});
}

/**
 * @brief Create a size rotating file handler keeping @p backup_count rotated files
 */
inline std::shared_ptr<rotating_file_handler> make_size_rotating_file_handler(const std::string &directory,
                                                                              const std::string &file_name,
                                                                              uint64_t max_bytes,
                                                                              int backup_count,
                                                                              std::shared_ptr<file_compressor> compressor = nullptr)
{
    return std::make_shared<rotating_file_handler>(directory,
                                                   file_name,
                                                   rotate_policy{.max_bytes = max_bytes, .backup_count = backup_count},
                                                   std::move(compressor));
}

/**
 * @brief Create a time rotating file handler, optionally also bounded by size
 *
 * @code
 * // New file every day at 00:00 UTC, a week of history, older files gzipped
 * auto handler = make_timed_rotating_file_handler("logs", "app_{date}_{index}", rotate_when::midnight, 1, 7,
 *                                                 std::make_shared<gzip_compressor>());
 * @endcode
 */
inline std::shared_ptr<rotating_file_handler> make_timed_rotating_file_handler(const std::string &directory,
                                                                               const std::string &file_name,
                                                                               rotate_when when,
                                                                               int interval,
                                                                               int backup_count                           = 0,
                                                                               std::shared_ptr<file_compressor> compressor = nullptr,
                                                                               std::optional<uint64_t> max_bytes          = std::nullopt)
{
    return std::make_shared<rotating_file_handler>(
        directory,
        file_name,
        rotate_policy{.max_bytes = max_bytes, .when = when, .interval = interval, .backup_count = backup_count},
        std::move(compressor));
}

/**
 * @brief Create a handler forwarding records to a remote sender
 */
inline std::shared_ptr<remote_handler> make_remote_handler(std::shared_ptr<remote_sender> sender, std::string destination)
{
    return std::make_shared<remote_handler>(std::move(sender), std::move(destination));
}

} // namespace treelog
