/**
 * @file test_log_filters.cpp
 * @brief Test suite for log filter functionality
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <ctime>
#include <memory>
#include <string>
#include <vector>

#include "test_support.hpp"

using namespace treelog;
using namespace treelog_test;

namespace
{

log_record make_test_record(std::string message, log_level level = log_level::info, std::string logger_name = "test")
{
    log_record record;
    record.message     = std::move(message);
    record.level       = level;
    record.logger_name = std::move(logger_name);
    return record;
}

// Local time today at hh:mm
std::chrono::system_clock::time_point at_local(int hour, int minute)
{
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    tm.tm_hour  = hour;
    tm.tm_min   = minute;
    tm.tm_sec   = 0;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

class fixed_filter : public log_filter
{
  public:
    explicit fixed_filter(bool result) : result_(result) {}
    bool admit(const log_record &) const override
    {
        ++calls;
        return result_;
    }
    const char *name() const override { return "fixed"; }

    mutable int calls = 0;

  private:
    bool result_;
};

} // namespace

TEST_CASE("Level filter", "[filters][level]")
{
    level_filter filter(log_level::warning);

    REQUIRE_FALSE(filter.admit(make_test_record("m", log_level::info)));
    REQUIRE(filter.admit(make_test_record("m", log_level::warning)));
    REQUIRE(filter.admit(make_test_record("m", log_level::critical)));
    REQUIRE(filter.admit(make_test_record("m", static_cast<log_level>(51))));
    REQUIRE_FALSE(filter.admit(make_test_record("m", static_cast<log_level>(49))));
}

TEST_CASE("Regex filter", "[filters][regex]")
{
    SECTION("Match anywhere in the message")
    {
        regex_filter filter("timeout");
        REQUIRE(filter.admit(make_test_record("connection timeout after 5s")));
        REQUIRE_FALSE(filter.admit(make_test_record("connected")));
    }

    SECTION("Invert negates")
    {
        regex_filter filter("healthcheck", true);
        REQUIRE_FALSE(filter.admit(make_test_record("GET /healthcheck")));
        REQUIRE(filter.admit(make_test_record("GET /orders")));
    }

    SECTION("Empty message")
    {
        REQUIRE_FALSE(regex_filter("x").admit(make_test_record("")));
        REQUIRE(regex_filter("x", true).admit(make_test_record("")));
        REQUIRE(regex_filter("^$").admit(make_test_record("")));
    }

    SECTION("Multi-line message")
    {
        auto record = make_test_record("first line\nsecond line with ERR42\nthird");
        REQUIRE(regex_filter("ERR[0-9]+").admit(record));
        REQUIRE_FALSE(regex_filter("ERR[0-9]+", true).admit(record));
        REQUIRE_FALSE(regex_filter("missing").admit(record));
    }

    SECTION("Invalid pattern fails at construction")
    {
        REQUIRE_THROWS_AS(regex_filter("(unclosed"), configuration_error);
    }
}

TEST_CASE("Time filter", "[filters][time]")
{
    SECTION("Parse times of day")
    {
        REQUIRE(parse_time_of_day("09:30") == std::chrono::seconds(9 * 3600 + 30 * 60));
        REQUIRE(parse_time_of_day("23:59:59") == std::chrono::seconds(86399));
        REQUIRE_FALSE(parse_time_of_day("24:00").has_value());
        REQUIRE_FALSE(parse_time_of_day("noon").has_value());
        REQUIRE_THROWS_AS(time_filter("9am", "17:00"), configuration_error);
    }

    SECTION("Daytime window, both ends inclusive")
    {
        time_filter filter("09:00", "17:00");
        auto record = make_test_record("m");

        record.created_at = at_local(9, 0);
        REQUIRE(filter.admit(record));
        record.created_at = at_local(12, 30);
        REQUIRE(filter.admit(record));
        record.created_at = at_local(17, 0);
        REQUIRE(filter.admit(record));
        record.created_at = at_local(17, 1);
        REQUIRE_FALSE(filter.admit(record));
        record.created_at = at_local(3, 0);
        REQUIRE_FALSE(filter.admit(record));
    }

    SECTION("Window wrapping past midnight")
    {
        time_filter filter("22:00", "06:00");
        auto record = make_test_record("m");

        record.created_at = at_local(23, 30);
        REQUIRE(filter.admit(record));
        record.created_at = at_local(5, 0);
        REQUIRE(filter.admit(record));
        record.created_at = at_local(12, 0);
        REQUIRE_FALSE(filter.admit(record));
    }
}

TEST_CASE("Module filter", "[filters][module]")
{
    module_filter filter{"DB", "http.server"};

    REQUIRE(filter.admit(make_test_record("m", log_level::info, "db")));
    REQUIRE(filter.admit(make_test_record("m", log_level::info, "http.server")));
    REQUIRE_FALSE(filter.admit(make_test_record("m", log_level::info, "http")));
    REQUIRE_FALSE(filter.admit(make_test_record("m", log_level::info, "db.pool")));

    filter.add("db.pool");
    REQUIRE(filter.admit(make_test_record("m", log_level::info, "db.pool")));
}

TEST_CASE("Composite filter", "[filters][composite]")
{
    auto yes    = std::make_shared<fixed_filter>(true);
    auto no     = std::make_shared<fixed_filter>(false);
    auto record = make_test_record("m");

    SECTION("Empty composite admits in both modes")
    {
        REQUIRE(composite_filter(composite_mode::all).admit(record));
        REQUIRE(composite_filter(composite_mode::any).admit(record));
    }

    SECTION("Single child")
    {
        REQUIRE(composite_filter(composite_mode::all, {yes}).admit(record));
        REQUIRE_FALSE(composite_filter(composite_mode::all, {no}).admit(record));
        REQUIRE(composite_filter(composite_mode::any, {yes}).admit(record));
        REQUIRE_FALSE(composite_filter(composite_mode::any, {no}).admit(record));
    }

    SECTION("Three children")
    {
        REQUIRE(composite_filter("and", {yes, yes, yes}).admit(record));
        REQUIRE_FALSE(composite_filter("and", {yes, no, yes}).admit(record));
        REQUIRE(composite_filter("or", {no, no, yes}).admit(record));
        REQUIRE_FALSE(composite_filter("or", {no, no, no}).admit(record));
    }

    SECTION("Evaluation stops at the deciding child")
    {
        auto tail = std::make_shared<fixed_filter>(true);
        REQUIRE_FALSE(composite_filter(composite_mode::all, {no, tail}).admit(record));
        REQUIRE(tail->calls == 0);
        REQUIRE(composite_filter(composite_mode::any, {yes, tail}).admit(record));
        REQUIRE(tail->calls == 0);
    }

    SECTION("Unknown mode rejects")
    {
        REQUIRE(composite_mode_from_string("xor") == composite_mode::invalid);
        REQUIRE_FALSE(composite_filter("xor", {yes}).admit(record));
    }

    SECTION("A throwing child counts as false on its own")
    {
        auto broken = std::make_shared<throwing_filter>();
        std::vector<std::string> failures;
        filter_error_fn collect = [&](const log_filter &filter, const std::string &what)
        { failures.push_back(std::string(filter.name()) + ": " + what); };

        composite_filter any(composite_mode::any, {broken, yes});
        REQUIRE(any.evaluate(record, collect));
        REQUIRE(any.admit(record));
        REQUIRE_FALSE(composite_filter(composite_mode::all, {yes, broken}).evaluate(record, collect));
        REQUIRE_FALSE(composite_filter(composite_mode::any, {std::make_shared<foreign_throwing_filter>()}).evaluate(record, collect));

        REQUIRE(failures ==
                std::vector<std::string>{"throwing: filter exploded", "throwing: filter exploded", "foreign: unknown exception"});
    }

    SECTION("Composites nest")
    {
        auto inner = std::make_shared<composite_filter>(composite_mode::any, filter_list{no, yes});
        REQUIRE(composite_filter(composite_mode::all, {yes, inner}).admit(record));
    }
}

TEST_CASE_METHOD(quiet_registry_fixture, "Logger filters", "[filters][logger]")
{
    auto &log    = registry.create({.name = "filtered"});
    auto capture = std::make_shared<capture_handler>();
    log.add_handler(capture);

    SECTION("Rejection returns false and reaches no handler")
    {
        log.add_filter(std::make_shared<regex_filter>("secret", true));
        REQUIRE(log.info("public"));
        REQUIRE_FALSE(log.info("secret stuff"));
        REQUIRE(capture->messages() == std::vector<std::string>{"public"});
    }

    SECTION("A throwing filter rejects and is reported as a warning")
    {
        log.add_filter(std::make_shared<throwing_filter>());
        REQUIRE_FALSE(log.info("lost"));

        REQUIRE(capture->count_at(log_level::info) == 0);
        REQUIRE(capture->count_at(log_level::warning) == 1);
        REQUIRE(capture->records()[0].message.find("filter exploded") != std::string::npos);
    }

    SECTION("A throwing child of a composite is reported without rejecting the record")
    {
        log.add_filter(std::make_shared<composite_filter>(
            composite_mode::any,
            filter_list{std::make_shared<throwing_filter>(), std::make_shared<level_filter>(log_level::info)}));

        REQUIRE(log.info("kept"));
        REQUIRE(capture->count_at(log_level::info) == 1);
        REQUIRE(capture->count_at(log_level::warning) == 1);
        REQUIRE(capture->records()[0].message == "Filter 'throwing' failed: filter exploded");
    }

    SECTION("A filter throwing a non-standard value rejects and is reported")
    {
        log.add_filter(std::make_shared<foreign_throwing_filter>());
        REQUIRE_FALSE(log.info("lost"));

        REQUIRE(capture->count_at(log_level::info) == 0);
        REQUIRE(capture->records()[0].message == "Filter 'foreign' failed: unknown exception");
    }

    SECTION("Handler filters failing with a non-standard value skip only their handler")
    {
        auto guarded = std::make_shared<capture_handler>();
        guarded->add_filter(std::make_shared<foreign_throwing_filter>());
        log.add_handler(guarded);

        REQUIRE(log.info("m"));
        REQUIRE(guarded->count_at(log_level::info) == 0);
        REQUIRE(capture->count_at(log_level::info) == 1);
    }

    SECTION("Handler filters only affect their handler")
    {
        auto errors_only = std::make_shared<capture_handler>();
        errors_only->add_filter(std::make_shared<level_filter>(log_level::error));
        log.add_handler(errors_only);

        REQUIRE(log.info("routine"));
        REQUIRE(log.error("broken"));

        REQUIRE(capture->count() == 2);
        REQUIRE(errors_only->messages() == std::vector<std::string>{"broken"});
    }

    SECTION("Ancestor filters apply first, own filters last")
    {
        std::vector<std::string> order;
        auto recorder = [&order](const char *tag)
        {
            class ordered_filter : public log_filter
            {
              public:
                ordered_filter(std::vector<std::string> &order, const char *tag) : order_(order), tag_(tag) {}
                bool admit(const log_record &) const override
                {
                    order_.push_back(tag_);
                    return true;
                }
                const char *name() const override { return "ordered"; }

              private:
                std::vector<std::string> &order_;
                std::string tag_;
            };
            return std::make_shared<ordered_filter>(order, tag);
        };

        registry.root().add_filter(recorder("root"));
        log.add_filter(recorder("own"));
        auto &child = registry.create({.name = "filtered.child", .propagate = false, .parent = &log});
        child.add_filter(recorder("child"));

        REQUIRE(child.info("x"));
        REQUIRE(order == std::vector<std::string>{"root", "own", "child"});
        REQUIRE(child.effective_filters().size() == 3);
    }
}
