/**
 * @file test_support.hpp
 * @brief Handlers and fixtures shared by the test suites
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

#include "treelog/log.hpp"

namespace treelog_test
{

using namespace treelog;
namespace fs = std::filesystem;

/**
 * @brief Handler keeping every record it is given
 */
class capture_handler : public log_handler
{
  public:
    const char *name() const override { return "capture"; }

    std::vector<log_record> records() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    std::vector<std::string> lines() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    size_t count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

    size_t count_at(log_level level) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto &r : records_)
        {
            if (r.level == level) ++n;
        }
        return n;
    }

    std::vector<std::string> messages() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto &r : records_) out.push_back(r.message);
        return out;
    }

  protected:
    void emit(logger &, const log_record &record, const log_formatter &formatter) override
    {
        auto line = formatter.render(record);
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
        lines_.push_back(std::move(line));
    }

  private:
    mutable std::mutex mutex_;
    std::vector<log_record> records_;
    std::vector<std::string> lines_;
};

/**
 * @brief Handler failing on every record
 */
class failing_handler : public log_handler
{
  public:
    const char *name() const override { return "failing"; }

    size_t attempts() const { return attempts_.load(); }

  protected:
    void emit(logger &, const log_record &, const log_formatter &) override
    {
        ++attempts_;
        throw handler_io_error("disk on fire");
    }

  private:
    std::atomic<size_t> attempts_{0};
};

/**
 * @brief Filter whose admit() always throws
 */
class throwing_filter : public log_filter
{
  public:
    bool admit(const log_record &) const override { throw filter_evaluation_error("filter exploded"); }
    const char *name() const override { return "throwing"; }
};

/**
 * @brief Filter whose admit() throws a value that is not a std::exception
 */
class foreign_throwing_filter : public log_filter
{
  public:
    bool admit(const log_record &) const override { throw 42; }
    const char *name() const override { return "foreign"; }
};

/**
 * @brief Remote sender recording deliveries
 */
class recording_sender : public remote_sender
{
  public:
    explicit recording_sender(bool accept = true) : accept_(accept) {}

    bool send(const std::string &destination, const std::string &text) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.emplace_back(destination, text);
        return accept_;
    }

    std::vector<std::pair<std::string, std::string>> sent() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

  private:
    bool accept_;
    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, std::string>> sent_;
};

/**
 * @brief Registry whose root logger writes nowhere
 */
class quiet_registry_fixture
{
  protected:
    logger_registry registry;
    std::shared_ptr<capture_handler> root_capture = std::make_shared<capture_handler>();

    quiet_registry_fixture()
    {
        registry.root().clear_handlers();
        registry.root().add_handler(root_capture);
    }
};

/**
 * @brief Unique scratch directory under /tmp, removed afterwards
 */
class temp_dir_fixture
{
  protected:
    std::string test_dir;

    temp_dir_fixture()
    {
        static std::atomic<int> sequence{0};
        auto pid = getpid();
        auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
        test_dir = "/tmp/treelog_test_" + std::to_string(pid) + "_" + std::to_string(tid) + "_" + std::to_string(sequence++);
        fs::remove_all(test_dir);
    }

    ~temp_dir_fixture()
    {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    std::string path(const std::string &name) const { return test_dir + "/" + name; }

    static std::string read_file(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    static void write_file(const std::string &path, const std::string &content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::vector<std::string> files_with_extension(const std::string &extension) const
    {
        std::vector<std::string> found;
        if (!fs::exists(test_dir)) return found;
        for (const auto &entry : fs::directory_iterator(test_dir))
        {
            if (entry.is_regular_file() && entry.path().extension() == extension) found.push_back(entry.path().string());
        }
        std::sort(found.begin(), found.end());
        return found;
    }
};

} // namespace treelog_test
