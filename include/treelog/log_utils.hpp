/**
 * @file log_utils.hpp
 * @brief Common utilities for the treelog logging library
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include <unistd.h>

#include "log_types.hpp"

namespace treelog
{

namespace detail
{

inline std::string to_lower(std::string_view text)
{
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

/**
 * @brief Thread-safe strerror
 */
inline std::string get_error_string(int err)
{
    char errbuf[256];

#ifdef _GNU_SOURCE
    // GNU version returns char* which may or may not use the buffer
    const char *msg = strerror_r(err, errbuf, sizeof(errbuf));
    return std::string(msg);
#else
    int ret = strerror_r(err, errbuf, sizeof(errbuf));
    if (ret != 0) { return "Unknown error " + std::to_string(err); }
    return std::string(errbuf);
#endif
}

/**
 * @brief Write all data to a file descriptor
 *
 * EINTR is retried transparently. EAGAIN and short writes that make no
 * progress are retried at most WRITE_MAX_RETRIES times with a small backoff
 * so a stuck descriptor never hangs the caller.
 *
 * @return 0 on success, the errno of the failing write otherwise
 */
inline int write_all(int fd, const void *buf, size_t len)
{
    const auto *p = static_cast<const unsigned char *>(buf);
    int stalls    = 0;
    auto backoff  = WRITE_RETRY_BACKOFF;

    while (len > 0)
    {
        ssize_t w = ::write(fd, p, len);
        if (w < 0)
        {
            if (errno == EINTR) continue;
            if ((errno == EAGAIN || errno == EWOULDBLOCK) && ++stalls < WRITE_MAX_RETRIES)
            {
                std::this_thread::sleep_for(backoff);
                backoff *= 2;
                continue;
            }
            return errno;
        }
        if (w == 0)
        {
            if (++stalls >= WRITE_MAX_RETRIES) return EIO;
            continue;
        }
        p += static_cast<size_t>(w);
        len -= static_cast<size_t>(w);
    }
    return 0;
}

} // namespace detail

/**
 * @brief Copy-on-write list for configuration read on every dispatch
 *
 * Readers take a snapshot (a shared_ptr to an immutable vector) and iterate
 * it without holding any lock. Writers copy the current vector, modify the
 * copy and publish it, so a dispatch in progress keeps its old snapshot.
 */
template <typename T> class rcu_list
{
  public:
    using snapshot_type = std::shared_ptr<const std::vector<T>>;

    rcu_list() : current_(std::make_shared<const std::vector<T>>()) {}

    snapshot_type snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_;
    }

    void push_back(T item)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto next = std::make_shared<std::vector<T>>(*current_);
        next->push_back(std::move(item));
        current_ = std::move(next);
    }

    /**
     * @brief Insert keeping the list ordered by @p less
     *
     * Equal elements keep their insertion order.
     */
    template <typename Less> void insert_sorted(T item, Less less)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto next = std::make_shared<std::vector<T>>(*current_);
        auto pos  = std::upper_bound(next->begin(), next->end(), item, less);
        next->insert(pos, std::move(item));
        current_ = std::move(next);
    }

    template <typename Pred> size_t remove_if(Pred pred)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto next    = std::make_shared<std::vector<T>>(*current_);
        auto removed = std::erase_if(*next, pred);
        if (removed) current_ = std::move(next);
        return removed;
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::make_shared<const std::vector<T>>();
    }

    size_t size() const { return snapshot()->size(); }
    bool empty() const { return snapshot()->empty(); }

  private:
    mutable std::mutex mutex_;
    snapshot_type current_;
};

} // namespace treelog
