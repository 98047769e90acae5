/**
 * @file test_cli_options.cpp
 * @brief Юнит-тесты разбора аргументов
 */

#include <doctest/doctest.h>
#include "app/cli_options.hpp"
#include "support/fakes.hpp"
#include <algorithm>

using namespace hostdiag::app;
using hostdiag::testing::canonicalNames;

namespace {

CliOptions parse(std::vector<std::string> args) {
    return parseArguments(args, canonicalNames());
}

} // namespace

TEST_CASE("No arguments means usage") {
    auto options = parse({});
    CHECK(options.action == CliAction::ShowUsage);
    CHECK(options.selection.empty());
}

TEST_CASE("Section flags are composable and repeatable") {
    auto options = parse({"--network", "--system", "--network"});
    CHECK(options.action == CliAction::Run);
    CHECK(options.selection.enabled == std::set<std::string>{"network", "system"});
    CHECK_FALSE(options.selection.export_to_file);
}

TEST_CASE("--all equals every section flag in any order") {
    auto all = parse({"--all"});

    std::vector<std::string> flags;
    for (const auto& name : canonicalNames()) {
        flags.push_back("--" + name);
    }
    std::reverse(flags.begin(), flags.end());
    auto each = parse(flags);

    CHECK(all.selection.enabled == each.selection.enabled);
    CHECK(all.selection.enabled.size() == 9);
}

TEST_CASE("Export options") {
    auto options = parse({"--all", "--export-txt", "--out", "/tmp/r.txt"});
    CHECK(options.selection.export_to_file);
    CHECK(options.selection.exportPath() == std::filesystem::path("/tmp/r.txt"));

    auto defaulted = parse({"--export-txt", "--system"});
    CHECK(defaulted.selection.exportPath() == std::filesystem::path("reporte_diagnostico.txt"));
    CHECK(defaulted.selection.exportPath("host.txt") == std::filesystem::path("host.txt"));

    auto dangling = parse({"--export-txt", "--out"});
    CHECK_FALSE(dangling.selection.output_path.has_value());
}

TEST_CASE("Help wins when it comes first, unknown flag when it comes first") {
    CHECK(parse({"--system", "-h", "--bogus"}).action == CliAction::ShowUsage);
    CHECK(parse({"--help"}).action == CliAction::ShowUsage);
    CHECK_THROWS_AS(parse({"--system", "--bogus", "--help"}), UnknownOptionError);
    CHECK_THROWS_WITH_AS(parse({"--bogus"}), "Unknown option: --bogus", UnknownOptionError);
    CHECK_THROWS_AS(parse({"system"}), UnknownOptionError);
    CHECK_THROWS_AS(parse({"--all-sections"}), UnknownOptionError);
}

TEST_CASE("Menu, config and version flags") {
    auto options = parse({"--menu", "--config", "settings.json"});
    CHECK(options.interactive_menu);
    REQUIRE(options.config_path.has_value());
    CHECK(*options.config_path == std::filesystem::path("settings.json"));

    CHECK_THROWS_AS(parse({"--config"}), hostdiag::core::ConfigurationError);
    CHECK(parse({"--version"}).action == CliAction::ShowVersion);
}

TEST_CASE("Usage lists every section flag") {
    auto text = usageText("hostdiag");
    CHECK(text.rfind("Usage: hostdiag [options]", 0) == 0);
    for (const auto& name : canonicalNames()) {
        CHECK(text.find("--" + name) != std::string::npos);
    }
}
