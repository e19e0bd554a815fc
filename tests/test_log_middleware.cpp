/**
 * @file test_log_middleware.cpp
 * @brief Inner and outer middleware chains
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>
#include <vector>

#include "test_support.hpp"

using namespace treelog;
using namespace treelog_test;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

class middleware_test_fixture : public quiet_registry_fixture
{
  protected:
    logger &log                              = registry.create({.name = "mw", .propagate = false});
    std::shared_ptr<capture_handler> capture = std::make_shared<capture_handler>();

    middleware_test_fixture() { log.add_handler(capture); }

    inner_middleware_ptr tagger(int priority, std::string tag)
    {
        return make_inner_middleware(priority,
                                     [tag](logger &, log_record &record)
                                     {
                                         record.message += tag;
                                         return middleware_verdict::pass;
                                     });
    }
};

TEST_CASE_METHOD(middleware_test_fixture, "Inner middleware ordering", "[middleware][inner]")
{
    SECTION("Ascending priority, insertion order within a priority")
    {
        log.add_inner_middleware(tagger(20, "-c"));
        log.add_inner_middleware(tagger(10, "-a"));
        log.add_inner_middleware(tagger(20, "-d"));
        log.add_inner_middleware(tagger(10, "-b"));

        REQUIRE(log.info("m"));
        REQUIRE(capture->messages() == std::vector<std::string>{"m-a-b-c-d"});
        REQUIRE(log.inner_middleware()->size() == 4);
    }

    SECTION("Negative priorities run first")
    {
        log.add_inner_middleware(tagger(0, "-zero"));
        log.add_inner_middleware(tagger(-5, "-neg"));

        log.info("m");
        REQUIRE(capture->messages() == std::vector<std::string>{"m-neg-zero"});
    }
}

TEST_CASE_METHOD(middleware_test_fixture, "Removing middleware", "[middleware]")
{
    auto first  = tagger(10, "-a");
    auto second = tagger(20, "-b");
    log.add_inner_middleware(first);
    log.add_inner_middleware(second);

    REQUIRE(log.remove_inner_middleware(first));
    REQUIRE_FALSE(log.remove_inner_middleware(first));
    log.info("m");

    log.add_outer_middleware(make_outer_middleware(0, [](logger &, const log_record &) {}));
    REQUIRE(log.outer_middleware()->size() == 1);
    log.clear_middleware();
    log.info("n");

    REQUIRE(capture->messages() == std::vector<std::string>{"m-b", "n"});
    REQUIRE(log.inner_middleware()->empty());
    REQUIRE(log.outer_middleware()->empty());
}

TEST_CASE_METHOD(middleware_test_fixture, "Inner middleware rejection", "[middleware][inner]")
{
    int later_calls = 0;
    log.add_inner_middleware(make_inner_middleware(1,
                                                   [](logger &, log_record &record)
                                                   {
                                                       return record.message.find("drop") != std::string::npos ? middleware_verdict::reject
                                                                                                               : middleware_verdict::pass;
                                                   }));
    log.add_inner_middleware(make_inner_middleware(2,
                                                   [&later_calls](logger &, log_record &)
                                                   {
                                                       ++later_calls;
                                                       return middleware_verdict::pass;
                                                   }));

    REQUIRE_FALSE(log.info("drop me"));
    REQUIRE(capture->count() == 0);
    REQUIRE(later_calls == 0);

    REQUIRE(log.info("keep me"));
    REQUIRE(capture->messages() == std::vector<std::string>{"keep me"});
    REQUIRE(later_calls == 1);

    SECTION("A rejected record does not propagate")
    {
        auto &child = registry.create({.name = "mw.child", .parent = &log});
        child.add_inner_middleware(make_inner_middleware(0, [](logger &, log_record &) { return middleware_verdict::reject; }));

        REQUIRE_FALSE(child.info("nothing"));
        REQUIRE(capture->messages() == std::vector<std::string>{"keep me"});
    }
}

TEST_CASE_METHOD(middleware_test_fixture, "Failing inner middleware", "[middleware][inner][errors]")
{
    log.add_inner_middleware(tagger(1, "-first"));
    log.add_inner_middleware(make_inner_middleware(
        2,
        [](logger &, log_record &record) -> middleware_verdict
        {
            record.message = "half-rewritten";
            throw middleware_error("enrichment backend down");
        },
        "enricher"));
    log.add_inner_middleware(tagger(3, "-third"));

    REQUIRE(log.info("m"));

    auto records = capture->records();
    REQUIRE(records.size() == 2);

    // The failure is reported first, while the chain is still running
    REQUIRE(records[0].level == log_level::warning);
    REQUIRE_THAT(records[0].message, StartsWith("Inner middleware 'enricher' failed: "));
    REQUIRE_THAT(records[0].message, ContainsSubstring("enrichment backend down"));

    // The failing step's partial rewrite is discarded
    REQUIRE(records[1].message == "m-first-third");
    REQUIRE(records[1].level == log_level::info);
}

TEST_CASE_METHOD(middleware_test_fixture, "Middleware filters", "[middleware][filters]")
{
    auto only_errors = tagger(0, " [escalated]");
    only_errors->add_filter(std::make_shared<level_filter>(log_level::error));
    log.add_inner_middleware(only_errors);

    log.info("routine");
    log.error("broken");
    REQUIRE(capture->messages() == std::vector<std::string>{"routine", "broken [escalated]"});

    SECTION("A throwing middleware filter counts as a failed step")
    {
        auto guarded = tagger(5, "-never");
        guarded->add_filter(std::make_shared<throwing_filter>());
        log.add_inner_middleware(guarded);

        REQUIRE(log.info("still delivered"));
        REQUIRE(capture->messages().back() == "still delivered");
        REQUIRE(capture->count_at(log_level::warning) == 1);
    }
}

TEST_CASE_METHOD(middleware_test_fixture, "Middleware throwing non-standard values", "[middleware][errors]")
{
    SECTION("Inner step")
    {
        log.add_inner_middleware(make_inner_middleware(
            1, [](logger &, log_record &) -> middleware_verdict { throw 42; }, "bad"));
        log.add_inner_middleware(tagger(2, "-after"));

        REQUIRE_NOTHROW(log.info("m"));

        auto records = capture->records();
        REQUIRE(records.size() == 2);
        REQUIRE(records[0].level == log_level::warning);
        REQUIRE(records[0].message == "Inner middleware 'bad' failed: unknown exception");
        REQUIRE(records[1].message == "m-after");
    }

    SECTION("Outer step")
    {
        int later_calls = 0;
        log.add_outer_middleware(make_outer_middleware(1, [](logger &, const log_record &) { throw 42; }, "bad"));
        log.add_outer_middleware(make_outer_middleware(2, [&](logger &, const log_record &) { ++later_calls; }));

        bool result = false;
        REQUIRE_NOTHROW(result = log.error("m"));
        REQUIRE(result);
        REQUIRE(later_calls == 1);
        REQUIRE(capture->records().back().message == "Outer middleware 'bad' failed: unknown exception");
    }

    SECTION("Middleware filter")
    {
        auto guarded = tagger(1, "-never");
        guarded->add_filter(std::make_shared<foreign_throwing_filter>());
        log.add_inner_middleware(guarded);

        REQUIRE(log.info("m"));
        REQUIRE(capture->messages().back() == "m");
        REQUIRE(capture->records()[0].message == "Inner middleware 'function' failed: unknown exception");
    }

    SECTION("Throwing child of a composite middleware filter")
    {
        auto guarded = tagger(1, "-ran");
        guarded->add_filter(std::make_shared<composite_filter>(
            composite_mode::any, filter_list{std::make_shared<throwing_filter>(), std::make_shared<level_filter>(log_level::info)}));
        log.add_inner_middleware(guarded);

        REQUIRE(log.info("m"));
        REQUIRE(capture->messages().back() == "m-ran");
        REQUIRE(capture->records()[0].message == "Filter 'throwing' of middleware 'function' failed: filter exploded");
    }
}

TEST_CASE_METHOD(middleware_test_fixture, "Context middleware", "[middleware][context]")
{
    SECTION("Adds keys the record does not have")
    {
        log.add_inner_middleware(std::make_shared<context_middleware>(extra_map{{"service", "billing"}, {"region", "eu"}}));

        log.info("charged", {{"region", "us"}});
        auto record = capture->records().at(0);
        REQUIRE(record.extra.get("service") == "billing");
        REQUIRE(record.extra.get("region") == "us");
    }

    SECTION("Interpolates the message against the extras")
    {
        log.add_inner_middleware(std::make_shared<context_middleware>(extra_map{{"service", "billing"}}, true));

        log.info("user {user} charged by {service}", {{"user", "alice"}});
        REQUIRE(capture->messages().at(0) == "user alice charged by billing");
    }

    SECTION("A message that does not format gets an error suffix")
    {
        log.add_inner_middleware(std::make_shared<context_middleware>(extra_map{}, true));

        REQUIRE(log.info("value {missing}"));
        auto message = capture->messages().at(0);
        REQUIRE_THAT(message, StartsWith("value {missing} [formatting error: "));
        REQUIRE(capture->count_at(log_level::warning) == 0);
    }
}

TEST_CASE_METHOD(middleware_test_fixture, "Outer middleware", "[middleware][outer]")
{
    SECTION("Runs after every handler and sees the final record")
    {
        std::vector<std::string> seen;
        log.add_inner_middleware(tagger(0, "!"));
        log.add_outer_middleware(make_outer_middleware(0,
                                                       [&](logger &, const log_record &record)
                                                       {
                                                           seen.push_back(record.message);
                                                           REQUIRE(capture->count() == 1);
                                                       }));

        log.info("m");
        REQUIRE(seen == std::vector<std::string>{"m!"});
    }

    SECTION("Alerts above the threshold only")
    {
        auto sender = std::make_shared<recording_sender>();
        log.add_outer_middleware(std::make_shared<alert_middleware>(sender, "#oncall", log_level::error));

        log.warning("disk 80%");
        log.error("disk full");
        log.critical("disk gone");

        auto sent = sender->sent();
        REQUIRE(sent.size() == 2);
        REQUIRE(sent[0].first == "#oncall");
        REQUIRE(sent[0].second == "[ERROR] mw: disk full");
        REQUIRE(sent[1].second == "[CRITICAL] mw: disk gone");
    }

    SECTION("Alert text can use a formatter")
    {
        auto sender = std::make_shared<recording_sender>();
        log.add_outer_middleware(
            std::make_shared<alert_middleware>(sender, "ops", log_level::error, std::make_shared<template_formatter>("{level_name}:{message}")));

        log.error("x");
        REQUIRE(sender->sent().at(0).second == "ERROR:x");
    }

    SECTION("A refused alert is reported and the log call still succeeds")
    {
        auto sender = std::make_shared<recording_sender>(false);
        log.add_outer_middleware(std::make_shared<alert_middleware>(sender, "#oncall"));

        REQUIRE(log.error("disk full"));

        auto records = capture->records();
        REQUIRE(records.size() == 2);
        REQUIRE(records[0].message == "disk full");
        REQUIRE(records[1].level == log_level::warning);
        REQUIRE_THAT(records[1].message, StartsWith("Outer middleware 'alert' failed: "));
        REQUIRE_THAT(records[1].message, ContainsSubstring("#oncall"));
    }

    SECTION("A failing outer step does not stop the next one")
    {
        int calls = 0;
        log.add_outer_middleware(make_outer_middleware(
            1, [](logger &, const log_record &) { throw middleware_error("boom"); }, "exploding"));
        log.add_outer_middleware(make_outer_middleware(2, [&calls](logger &, const log_record &) { ++calls; }));

        log.info("m");
        REQUIRE(calls == 1);
        REQUIRE(capture->count_at(log_level::warning) == 1);
    }
}
