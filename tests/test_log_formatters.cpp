/**
 * @file test_log_formatters.cpp
 * @brief Template and structured formatter output
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <chrono>
#include <ctime>
#include <string>

#include <tao/json/from_string.hpp>
#include <tao/json/value.hpp>

#include "test_support.hpp"

using namespace treelog;
using namespace treelog_test;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::EndsWith;
using Catch::Matchers::StartsWith;

namespace
{

// 2025-03-14 10:02:11 local time
std::chrono::system_clock::time_point fixed_time()
{
    std::tm tm{};
    tm.tm_year  = 2025 - 1900;
    tm.tm_mon   = 2;
    tm.tm_mday  = 14;
    tm.tm_hour  = 10;
    tm.tm_min   = 2;
    tm.tm_sec   = 11;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

log_record sample_record()
{
    log_record record;
    record.message     = "disk almost full";
    record.level       = log_level::warning;
    record.logger_name = "storage";
    record.prefix      = "STORAGE";
    record.created_at  = fixed_time();
    record.extra.set("mount", "/var").set("percent", 93);
    return record;
}

} // namespace

TEST_CASE("Template formatter tokens", "[formatters][template]")
{
    auto record = sample_record();

    SECTION("Default template")
    {
        template_formatter formatter;
        REQUIRE(formatter.render(record) == "[14/03/2025 10:02:11] STORAGE | WARNING[50]: disk almost full");
    }

    SECTION("Name, prefix fallback and parent")
    {
        template_formatter formatter("{name}|{prefix}|{parent}");
        REQUIRE(formatter.render(record) == "storage|STORAGE|");

        record.prefix.clear();
        record.parent_name = "root";
        REQUIRE(formatter.render(record) == "storage|storage|root");
    }

    SECTION("Extras are addressable by key")
    {
        template_formatter formatter("{message} on {mount} ({percent}%)");
        REQUIRE(formatter.render(record) == "disk almost full on /var (93%)");
    }

    SECTION("Format specs apply")
    {
        template_formatter formatter("{level_name:<8}|{level_value:03d}");
        REQUIRE(formatter.render(record) == "WARNING |050");
    }

    SECTION("Reserved tokens win over extras")
    {
        record.extra.set("message", "shadow");
        template_formatter formatter("{message}");
        REQUIRE(formatter.render(record) == "disk almost full");
    }

    SECTION("Custom time format")
    {
        template_formatter formatter("{time}", "%Y-%m-%d");
        REQUIRE(formatter.render(record) == "2025-03-14");
    }

    SECTION("Elapsed time since the formatter was created")
    {
        template_formatter formatter("{elapsed}");
        record.created_at = std::chrono::system_clock::now() + std::chrono::milliseconds(1500);
        auto elapsed      = formatter.render(record);
        REQUIRE(elapsed.size() == 12);
        REQUIRE(elapsed[8] == '.');
        REQUIRE_THAT(elapsed, StartsWith("00000001."));
    }
}

TEST_CASE("Template formatter fallback", "[formatters][template]")
{
    auto record = sample_record();

    SECTION("Unknown key")
    {
        template_formatter formatter("{message} {no_such_key}");
        auto out = formatter.render(record);
        REQUIRE_THAT(out, StartsWith("WARNING: disk almost full [format error: "));
        REQUIRE_THAT(out, EndsWith("]"));
    }

    SECTION("Malformed template")
    {
        template_formatter formatter("{message");
        REQUIRE_THAT(formatter.render(record), StartsWith("WARNING: disk almost full [format error: "));
    }
}

TEST_CASE("Decorated output", "[formatters][color]")
{
    auto record = sample_record();
    template_formatter formatter("{message}");

    REQUIRE(formatter.render_decorated(record) == std::string("\033[93m") + "disk almost full" + COLOR_RESET);

    record.level = static_cast<log_level>(45);
    REQUIRE(formatter.render_decorated(record) == std::string(COLOR_DEFAULT) + "disk almost full" + COLOR_RESET);

    SECTION("Structured formatters are never decorated")
    {
        json_formatter json;
        REQUIRE(json.render_decorated(record) == json.render(record));
    }
}

TEST_CASE("JSON formatter", "[formatters][json]")
{
    auto record = sample_record();
    record.message += " \"quoted\"\n";

    json_formatter formatter;
    auto text = formatter.render(record);
    REQUIRE(text.find('\n') == std::string::npos);

    auto parsed = tao::json::from_string(text);
    REQUIRE(parsed.at("name").get_string() == "storage");
    REQUIRE(parsed.at("prefix").get_string() == "STORAGE");
    REQUIRE(parsed.at("level_name").get_string() == "WARNING");
    REQUIRE(parsed.at("level_value").as<int>() == 50);
    REQUIRE(parsed.at("message").get_string() == "disk almost full \"quoted\"\n");
    REQUIRE(parsed.at("time").get_string() == "2025-03-14T10:02:11");
    REQUIRE(parsed.at("mount").get_string() == "/var");
    REQUIRE(parsed.at("percent").get_string() == "93");
    REQUIRE(parsed.get_object().count("parent") == 0);

    SECTION("Pretty printing spans lines and parses the same")
    {
        formatter.pretty_print = true;
        auto pretty            = formatter.render(record);
        REQUIRE(pretty.find('\n') != std::string::npos);
        REQUIRE(tao::json::from_string(pretty) == parsed);
    }
}

TEST_CASE("Markup and tabular formatters", "[formatters][structured]")
{
    auto record = sample_record();
    record.message = "a<b & \"c\"|d";

    SECTION("XML")
    {
        auto out = xml_formatter().render(record);
        REQUIRE_THAT(out, StartsWith("<log><time>2025-03-14T10:02:11</time><name>storage</name>"));
        REQUIRE_THAT(out, ContainsSubstring("<message>a&lt;b &amp; &quot;c&quot;|d</message>"));
        REQUIRE_THAT(out, ContainsSubstring("<extra key=\"mount\">/var</extra>"));
        REQUIRE_THAT(out, EndsWith("</log>"));
    }

    SECTION("YAML")
    {
        auto out = yaml_formatter().render(record);
        REQUIRE_THAT(out, StartsWith("---\ntime: \"2025-03-14T10:02:11\""));
        REQUIRE_THAT(out, ContainsSubstring("\nlevel_value: 50"));
        REQUIRE_THAT(out, ContainsSubstring("\nmessage: \"a<b & \\\"c\\\"|d\""));
        REQUIRE_THAT(out, ContainsSubstring("\nextra:\n  \"mount\": \"/var\"\n  \"percent\": \"93\""));
    }

    SECTION("CSV")
    {
        auto out = csv_formatter().render(record);
        REQUIRE(out == "2025-03-14T10:02:11,storage,STORAGE,WARNING,50,\"a<b & \"\"c\"\"|d\",,mount=/var;percent=93");
        REQUIRE(std::string(csv_formatter::HEADER) == "time,name,prefix,level_name,level_value,message,parent,extra");
    }

    SECTION("HTML")
    {
        auto out = html_formatter().render(record);
        REQUIRE_THAT(out, StartsWith("<tr class=\"log-warning\"><td class=\"time\">2025-03-14T10:02:11</td>"));
        REQUIRE_THAT(out, ContainsSubstring("<td class=\"message\">a&lt;b &amp; &quot;c&quot;|d</td>"));
        REQUIRE_THAT(out, EndsWith("<td class=\"percent\">93</td></tr>"));
    }

    SECTION("Markdown")
    {
        auto out = markdown_formatter().render(record);
        REQUIRE(out == "| 2025-03-14T10:02:11 | storage | STORAGE | WARNING | 50 | a<b & \"c\"\\|d | mount=/var | percent=93 |");
    }
}

TEST_CASE_METHOD(quiet_registry_fixture, "Formatter selection", "[formatters][logger]")
{
    auto &log = registry.create({.name = "fmtsel", .propagate = false, .formatter = std::make_shared<template_formatter>("L:{message}")});

    auto inherits = std::make_shared<capture_handler>();
    auto own      = std::make_shared<capture_handler>();
    own->set_formatter(std::make_shared<template_formatter>("H:{message}"));
    log.add_handler(inherits);
    log.add_handler(own);

    log.info("x");
    REQUIRE(inherits->lines() == std::vector<std::string>{"L:x"});
    REQUIRE(own->lines() == std::vector<std::string>{"H:x"});

    log.set_formatter(std::make_shared<json_formatter>());
    log.info("y");
    REQUIRE_THAT(inherits->lines().back(), StartsWith("{"));
    REQUIRE(own->lines().back() == "H:y");
}
