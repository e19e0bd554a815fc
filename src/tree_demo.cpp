/**
 * @file tree_demo.cpp
 * @brief Logger hierarchy, middleware, exception logging and async dispatch
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "treelog/log.hpp"

using namespace treelog;

// Prints alerts instead of sending them anywhere
class console_sender : public remote_sender
{
  public:
    bool send(const std::string &destination, const std::string &text) override
    {
        fmt::print("  >> alert to {}: {}\n", destination, text);
        return true;
    }
};

void load_inventory(int warehouse)
{
    try
    {
        throw std::runtime_error(fmt::format("warehouse {} unreachable", warehouse));
    }
    catch (...)
    {
        std::throw_with_nested(std::logic_error("inventory sync failed"));
    }
}

int main()
{
    fmt::print("treelog {}\n\n", VERSION);

    logger_registry registry;

    // shop -> shop.checkout -> shop.checkout.payment, all under root
    auto &shop     = registry.get_or_create("shop");
    auto &checkout = registry.get_or_create("shop.checkout");
    auto &payment  = registry.get_or_create("shop.checkout.payment");

    shop.set_prefix("SHOP");
    shop.set_level(log_level::success);
    checkout.set_level(log_level::debug);
    checkout.add_handler(make_stream_handler(STDOUT_FILENO, false));
    checkout.set_formatter(std::make_shared<template_formatter>("  checkout | {level_name:<8} {message}"));

    payment.add_context("provider", "acme-pay");
    payment.add_inner_middleware(std::make_shared<context_middleware>(extra_map{{"region", "eu"}}, true));
    payment.add_outer_middleware(std::make_shared<alert_middleware>(std::make_shared<console_sender>(), "#payments", log_level::error));

    std::cout << "Records climb from payment to checkout, shop and root:\n";
    payment.info("charging {provider} in {region}");
    payment.error("card declined", {{"order", "A-1042"}});

    std::cout << "\nshop only prints SUCCESS and above, root still sees everything:\n";
    checkout.debug("basket recalculated");
    checkout.success("order placed");

    std::cout << "\nException logging:\n";
    try
    {
        load_inventory(7);
    }
    catch (...)
    {
        shop.log_exception("nightly inventory job");
    }

    try
    {
        checkout.run_scoped("refund batch", [] { throw std::runtime_error("ledger locked"); });
    }
    catch (const std::exception &e)
    {
        std::cout << "  caught: " << e.what() << "\n";
    }

    std::cout << "\nAsync dispatch from several threads:\n";
    registry.start_async();
    std::vector<std::thread> threads;
    for (int t = 0; t < 3; ++t)
    {
        threads.emplace_back(
            [&checkout, t]
            {
                for (int i = 0; i < 3; ++i) checkout.log_async(fmt::format("worker {} item {}", t, i), log_level::info);
            });
    }
    for (auto &thread : threads) thread.join();
    registry.drain();

    registry.shutdown();
    return 0;
}
