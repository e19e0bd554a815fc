/**
 * @file config_demo.cpp
 * @brief Configure loggers from a JSON document
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Usage: config_demo [config.json]
 *
 * The document is either one logger object or an array of them. Without an
 * argument a built-in example is used.
 */

#include <iostream>
#include <string>

#include <tao/json/from_file.hpp>
#include <tao/json/from_string.hpp>

#include "treelog/log.hpp"

using namespace treelog;

static const char *example_config = R"([
    {
        "name": "api",
        "level": "debug",
        "prefix": "API",
        "context": {"service": "storefront", "build": 118},
        "handlers": [
            {"type": "stream", "color": true},
            {
                "type": "size_rotating_file",
                "file_directory": "/tmp/treelog_config_demo",
                "max_size": 65536,
                "backup_count": 2,
                "formatter": {"type": "json"}
            }
        ]
    },
    {
        "name": "api.auth",
        "filters": [{"type": "regex", "pattern": "token=", "invert": true}]
    }
])";

int main(int argc, char *argv[])
{
    logger_registry registry;

    try
    {
        tao::json::value config = argc > 1 ? tao::json::from_file(argv[1]) : tao::json::from_string(example_config);

        if (config.is_array())
        {
            for (const auto &entry : config.get_array()) configure_logger(registry, entry);
        }
        else { configure_logger(registry, config); }
    }
    catch (const configuration_error &e)
    {
        std::cerr << "Invalid logging configuration: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Cannot read configuration: " << e.what() << "\n";
        return 1;
    }

    for (const auto *log : registry.loggers())
    {
        std::cout << fmt::format("{:<12} level={:<8} propagate={} handlers={}\n",
                                 log->name(),
                                 level_name(log->level()),
                                 log->propagate(),
                                 log->handlers()->size());
    }
    std::cout << "\n";

    if (auto *auth = registry.find("api.auth"))
    {
        auth->info("login accepted", {{"user", "alice"}});
        auth->info("token=abc123 refreshed");
        auth->warning("too many attempts", {{"user", "mallory"}});
    }

    registry.shutdown();
    return 0;
}
