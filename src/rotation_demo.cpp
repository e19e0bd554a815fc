/**
 * @file rotation_demo.cpp
 * @brief Demonstration of the rotating file handler
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * This demo showcases the rotation features:
 * - Size-based rotation
 * - Line-based rotation
 * - Time-based rotation
 * - Retention with gzip compression
 * - One handler shared by several threads
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "treelog/log.hpp"

using namespace treelog;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

const std::string demo_root = "/tmp/treelog_rotation_demo";

void print_header(const std::string &title)
{
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << " " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void list_files(const std::string &dir)
{
    std::vector<fs::directory_entry> entries;
    for (const auto &entry : fs::directory_iterator(dir))
    {
        if (entry.is_regular_file()) entries.push_back(entry);
    }
    std::sort(entries.begin(), entries.end(), [](const auto &a, const auto &b) { return a.path() < b.path(); });

    uint64_t total = 0;
    for (const auto &entry : entries)
    {
        std::cout << "  " << entry.path().filename().string() << "  " << entry.file_size() << " bytes\n";
        total += entry.file_size();
    }
    std::cout << "  " << entries.size() << " files, " << total << " bytes\n";
}

std::string fresh_dir(const std::string &name)
{
    std::string dir = demo_root + "/" + name;
    fs::remove_all(dir);
    return dir;
}

// Demo 1: Size-based rotation
void demo_size_rotation(logger_registry &registry)
{
    print_header("Demo 1: Size-Based Rotation");

    std::string dir = fresh_dir("size");
    auto &log       = registry.create({.name = "size_demo", .propagate = false});
    auto handler    = make_file_handler(dir, "size_{index}", 4 * 1024);
    log.add_handler(handler);

    std::cout << "Configuration:\n";
    std::cout << "  Max file size: 4 KB\n";
    std::cout << "  Log directory: " << dir << "\n\n";

    for (int i = 0; i < 500; ++i)
    {
        log.info(fmt::format("Size rotation test message {} - Lorem ipsum dolor sit amet", i));
    }

    std::cout << "Rotations: " << handler->rotation_count() << "\n";
    list_files(dir);
}

// Demo 2: Line-based rotation
void demo_line_rotation(logger_registry &registry)
{
    print_header("Demo 2: Line-Based Rotation");

    std::string dir = fresh_dir("lines");
    auto &log       = registry.create({.name = "line_demo", .propagate = false});
    auto handler    = std::make_shared<rotating_file_handler>(dir, "lines_{index}", rotate_policy{.max_lines = 100});
    log.add_handler(handler);

    std::cout << "Configuration:\n";
    std::cout << "  Max lines per file: 100\n\n";

    for (int i = 0; i < 350; ++i) log.debug(fmt::format("line {}", i));

    std::cout << "Rotations: " << handler->rotation_count() << "\n";
    list_files(dir);
}

// Demo 3: Time-based rotation
void demo_time_rotation(logger_registry &registry)
{
    print_header("Demo 3: Time-Based Rotation");

    std::string dir = fresh_dir("time");
    auto &log       = registry.create({.name = "time_demo", .propagate = false});
    auto handler    = make_timed_rotating_file_handler(dir, "time_{date}_{index}", rotate_when::seconds, 1);
    log.add_handler(handler);

    std::cout << "Logging for 3 seconds with a 1 second rotation interval...\n";

    auto start = std::chrono::steady_clock::now();
    int count  = 0;
    while (std::chrono::steady_clock::now() - start < 3s)
    {
        log.info(fmt::format("Time rotation test message {}", count++));
        std::this_thread::sleep_for(50ms);
    }

    std::cout << "Rotations: " << handler->rotation_count() << "\n";
    list_files(dir);
}

// Demo 4: Retention with compression
void demo_retention(logger_registry &registry)
{
    print_header("Demo 4: Retention and Compression");

    std::string dir = fresh_dir("retention");
    auto &log       = registry.create({.name = "retention_demo", .propagate = false});
    auto handler    = make_size_rotating_file_handler(dir, "kept_{index}", 2 * 1024, 3, std::make_shared<gzip_compressor>());
    log.add_handler(handler);

    std::cout << "Configuration:\n";
    std::cout << "  Max file size: 2 KB\n";
    std::cout << "  Backups kept: 3, older files gzipped\n\n";

    for (int i = 0; i < 400; ++i) log.info(fmt::format("Retention test message {} with some padding text", i));

    std::cout << "Rotations: " << handler->rotation_count() << "\n";
    list_files(dir);
}

// Demo 5: Several threads sharing one handler
void demo_multithreaded(logger_registry &registry)
{
    print_header("Demo 5: Multi-Threaded Logging");

    std::string dir = fresh_dir("threads");
    auto handler    = make_file_handler(dir, "mt_{index}", 16 * 1024);

    std::atomic<uint64_t> total{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t)
    {
        auto &log = registry.create({.name = fmt::format("worker{}", t), .propagate = false});
        log.add_handler(handler);
        workers.emplace_back(
            [&log, &total, t]
            {
                for (int i = 0; i < 1000; ++i)
                {
                    log.info(fmt::format("Thread-{} msg#{}", t, total.fetch_add(1)));
                }
            });
    }
    for (auto &worker : workers) worker.join();

    std::cout << "Messages: " << total.load() << ", rotations: " << handler->rotation_count() << "\n";
    list_files(dir);
}

int main(int argc, char *argv[])
{
    std::cout << "treelog " << VERSION << " File Rotation Demo\n";
    std::cout << "================================\n";

    logger_registry registry;

    try
    {
        if (argc > 1)
        {
            std::string demo = argv[1];
            if (demo == "1" || demo == "size") { demo_size_rotation(registry); }
            else if (demo == "2" || demo == "lines") { demo_line_rotation(registry); }
            else if (demo == "3" || demo == "time") { demo_time_rotation(registry); }
            else if (demo == "4" || demo == "retention") { demo_retention(registry); }
            else if (demo == "5" || demo == "multithread") { demo_multithreaded(registry); }
            else
            {
                std::cout << "\nUsage: " << argv[0] << " [demo_number|demo_name]\n";
                std::cout << "  1 or size        - Size-based rotation\n";
                std::cout << "  2 or lines       - Line-based rotation\n";
                std::cout << "  3 or time        - Time-based rotation\n";
                std::cout << "  4 or retention   - Retention and compression\n";
                std::cout << "  5 or multithread - Multi-threaded logging\n";
                return 1;
            }
        }
        else
        {
            demo_size_rotation(registry);
            demo_line_rotation(registry);
            demo_time_rotation(registry);
            demo_retention(registry);
            demo_multithreaded(registry);
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Demo failed: " << e.what() << "\n";
        return 1;
    }

    registry.shutdown();
    std::cout << "\nOutput left in " << demo_root << "\n";
    return 0;
}
