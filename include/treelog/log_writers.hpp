/**
 * @file log_writers.hpp
 * @brief File descriptor wrappers used by the file handlers
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cerrno>
#include <cstdint>
#include <string>
#include <string_view>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "log_errors.hpp"
#include "log_utils.hpp"

namespace treelog
{

/**
 * @brief RAII wrapper for file descriptors
 */
class file_descriptor
{
  public:
    explicit file_descriptor(int fd = -1) noexcept : fd_(fd) {}

    file_descriptor(file_descriptor &&other) noexcept : fd_(other.release()) {}

    file_descriptor &operator=(file_descriptor &&other) noexcept
    {
        if (this != &other) { reset(other.release()); }
        return *this;
    }

    ~file_descriptor() { close(); }

    file_descriptor(const file_descriptor &)            = delete;
    file_descriptor &operator=(const file_descriptor &) = delete;

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    int release() noexcept
    {
        int old = fd_;
        fd_     = -1;
        return old;
    }

    void reset(int new_fd = -1) noexcept
    {
        if (fd_ != new_fd)
        {
            close();
            fd_ = new_fd;
        }
    }

    void close() noexcept
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

  private:
    int fd_;
};

/**
 * @brief Size and newline count of a file on disk
 */
struct file_stats
{
    uint64_t bytes = 0;
    uint64_t lines = 0;
};

/**
 * @brief Create @p path if absent and measure it
 *
 * Lines are only counted when @p count_lines is set since that requires
 * reading the whole file.
 *
 * @throws handler_io_error if the file cannot be created or read
 */
inline file_stats touch_and_measure(const std::string &path, bool count_lines)
{
    file_descriptor fd(::open(path.c_str(), O_RDONLY | O_CREAT | O_CLOEXEC, 0644));
    if (!fd) { throw handler_io_error("Failed to open log file: " + path + ": " + detail::get_error_string(errno)); }

    file_stats stats;
    struct stat st;
    if (fstat(fd.get(), &st) != 0) { throw handler_io_error("Failed to stat log file: " + path + ": " + detail::get_error_string(errno)); }
    stats.bytes = static_cast<uint64_t>(st.st_size);

    if (count_lines && stats.bytes > 0)
    {
        char buf[16 * 1024];
        for (;;)
        {
            ssize_t r = ::read(fd.get(), buf, sizeof(buf));
            if (r < 0)
            {
                if (errno == EINTR) continue;
                throw handler_io_error("Failed to read log file: " + path + ": " + detail::get_error_string(errno));
            }
            if (r == 0) break;
            for (ssize_t i = 0; i < r; ++i)
            {
                if (buf[i] == '\n') ++stats.lines;
            }
        }
    }
    return stats;
}

/**
 * @brief Append-only writer for one log file
 *
 * The file is opened with O_APPEND so concurrent writers on other
 * descriptors never interleave within a single write.
 */
class file_writer
{
  public:
    /**
     * @throws handler_io_error if the file cannot be opened
     */
    explicit file_writer(const std::string &filename)
        : filename_(filename), fd_(::open(filename.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644))
    {
        if (!fd_) { throw handler_io_error("Failed to open log file: " + filename + ": " + detail::get_error_string(errno)); }
    }

    /**
     * @brief Write all of @p data
     * @throws handler_io_error once the bounded retries are exhausted
     */
    void write(std::string_view data) const
    {
        int err = detail::write_all(fd_.get(), data.data(), data.size());
        if (err != 0) { throw handler_io_error("Failed to write to log file: " + filename_ + ": " + detail::get_error_string(err)); }
    }

    /**
     * @brief Current size as seen by the kernel, including other writers' appends
     */
    uint64_t size() const
    {
        struct stat st;
        if (fstat(fd_.get(), &st) != 0) { throw handler_io_error("Failed to stat log file: " + filename_ + ": " + detail::get_error_string(errno)); }
        return static_cast<uint64_t>(st.st_size);
    }

    bool sync() const noexcept { return fdatasync(fd_.get()) == 0; }

    const std::string &filename() const noexcept { return filename_; }
    int fd() const noexcept { return fd_.get(); }

  private:
    std::string filename_;
    file_descriptor fd_;
};

} // namespace treelog
