/**
 * @file test_fallback_chain.cpp
 * @brief Юнит-тесты цепочек альтернативных утилит
 */

#include <doctest/doctest.h>
#include "core/fallback_chain.hpp"
#include "support/fakes.hpp"
#include <filesystem>
#include <fstream>

using namespace hostdiag::core;
using hostdiag::testing::FakeCommandRunner;

namespace {

constexpr std::chrono::milliseconds kTimeout{1000};

FallbackChain lsblkChain(bool fall_through) {
    return FallbackChain{{
        Alternative::command({"lsblk", "-o", "NAME,SIZE"}),
        Alternative::command({"lsblk"})
    }, "lsblk not found.", fall_through};
}

} // namespace

TEST_CASE("First available tool wins") {
    FakeCommandRunner runner;
    runner.install("dig").install("nslookup");
    runner.succeed("dig +short example.org", "93.184.216.34\n");

    FallbackChain chain{{
        Alternative::command({"dig", "+short", "example.org"}),
        Alternative::command({"nslookup", "example.org"})
    }, "No resolver tool found."};

    auto outcome = runChain(chain, runner, kTimeout);
    CHECK(outcome.ok());
    CHECK(outcome.tool == "dig");
    CHECK(outcome.text == "93.184.216.34\n");
    CHECK(runner.calls.size() == 1);
}

TEST_CASE("Missing tools are skipped in order") {
    FakeCommandRunner runner;
    runner.install("getent");
    runner.succeed("getent ahosts example.org", "1\n2\n3\n4\n5\n6\n7\n");

    FallbackChain chain{{
        Alternative::command({"dig", "+short", "example.org"}),
        Alternative::command({"nslookup", "example.org"}),
        Alternative::command({"getent", "ahosts", "example.org"}, LineWindow::head(5))
    }, "No resolver tool found."};

    auto outcome = runChain(chain, runner, kTimeout);
    CHECK(outcome.ok());
    CHECK(outcome.tool == "getent");
    CHECK(outcome.text == "1\n2\n3\n4\n5\n");
}

TEST_CASE("No tool at all gives the fixed message without failure") {
    FakeCommandRunner runner;
    auto outcome = runChain(lsblkChain(true), runner, kTimeout);

    CHECK(outcome.status == ChainStatus::Unavailable);
    CHECK(outcome.text == "lsblk not found.\n");
    CHECK(outcome.error.empty());
    CHECK(runner.calls.empty());
}

TEST_CASE("Failure stops the chain unless fall-through is requested") {
    FakeCommandRunner runner;
    runner.install("lsblk");
    runner.failExit("lsblk -o NAME,SIZE", 1, "lsblk: unknown column: MOUNTPOINTS\n");
    runner.succeed("lsblk", "sda 10G disk\n");

    SUBCASE("stop") {
        auto outcome = runChain(lsblkChain(false), runner, kTimeout);
        CHECK(outcome.status == ChainStatus::Failed);
        CHECK(outcome.error == "lsblk: unknown column: MOUNTPOINTS");
        CHECK(runner.calls.size() == 1);
    }

    SUBCASE("fall through") {
        auto outcome = runChain(lsblkChain(true), runner, kTimeout);
        CHECK(outcome.ok());
        CHECK(outcome.text == "sda 10G disk\n");
        CHECK(runner.calls.size() == 2);
    }
}

TEST_CASE("Last failure is reported when every alternative fails") {
    FakeCommandRunner runner;
    runner.install("journalctl");
    runner.failExit("journalctl -p warning", 1, "");
    runner.failExit("journalctl", 4, "");

    FallbackChain chain{{
        Alternative::command({"journalctl", "-p", "warning"}),
        Alternative::command({"journalctl"})
    }, "", true};

    auto outcome = runChain(chain, runner, kTimeout);
    CHECK(outcome.status == ChainStatus::Failed);
    CHECK(outcome.error == "journalctl: exit code 4");
}

TEST_CASE("Tool name is prefixed only when stderr does not already start with it") {
    FakeCommandRunner runner;
    runner.install("lspci");
    runner.failExit("lspci", 1, "\nFailed to open sysfs\n");

    FallbackChain chain{{Alternative::command({"lspci"})}, "lspci not found.", false};
    auto plain = runChain(chain, runner, kTimeout);
    CHECK(plain.error == "lspci: Failed to open sysfs");

    runner.failExit("lspci", 1, "lspci: Cannot find any working access method.\n");
    auto named = runChain(chain, runner, kTimeout);
    CHECK(named.error == "lspci: Cannot find any working access method.");

    // Совпадение только по началу имени не считается
    runner.failExit("lspci", 1, "lspcix: odd\n");
    auto other = runChain(chain, runner, kTimeout);
    CHECK(other.error == "lspci: lspcix: odd");
}

TEST_CASE("File alternatives are read directly and skipped when absent") {
    namespace fs = std::filesystem;
    auto path = fs::temp_directory_path() / "hostdiag_chain_loadavg.txt";
    {
        std::ofstream ofs(path);
        ofs << "0.10 0.20 0.30 1/100 4242\n";
    }

    FakeCommandRunner runner;
    runner.install("uptime");

    FallbackChain chain{{
        Alternative::fromFile(fs::temp_directory_path() / "hostdiag_missing_file"),
        Alternative::fromFile(path),
        Alternative::command({"uptime"})
    }, "N/A"};

    auto outcome = runChain(chain, runner, kTimeout);
    CHECK(outcome.ok());
    CHECK(outcome.text == "0.10 0.20 0.30 1/100 4242\n");
    CHECK(outcome.tool == path.string());
    CHECK(runner.calls.empty());

    std::error_code ec;
    fs::remove(path, ec);
}

TEST_CASE("Failure summary prefers stderr, then timeout, then exit code") {
    CommandResult r;
    r.launched = true;
    r.exit_code = 2;
    CHECK(summarizeFailure(r) == "exit code 2");

    r.timed_out = true;
    CHECK(summarizeFailure(r) == "timed out");

    r.err = "\nping: unknown host\n";
    CHECK(summarizeFailure(r) == "ping: unknown host");
}
