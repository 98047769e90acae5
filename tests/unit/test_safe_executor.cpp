/**
 * @file test_safe_executor.cpp
 * @brief Юнит-тесты изолированного запуска проб
 */

#include <doctest/doctest.h>
#include "core/safe_executor.hpp"
#include "support/fakes.hpp"

using namespace hostdiag::core;
using hostdiag::testing::FakeProbe;

namespace {

class NonStdThrowingProbe : public Probe {
public:
    std::string_view name() const noexcept override { return "odd"; }
    std::string_view title() const noexcept override { return "ODD"; }
    void run(ProbeOutput& out) override {
        out.line("before");
        throw 42;
    }
};

} // namespace

TEST_CASE("Successful probe yields output and no error") {
    FakeProbe probe("system", "SYSTEM", "Hostname: box\n");
    auto result = executeSafely(probe);

    CHECK(result.probe_name == "system");
    CHECK(result.title == "SYSTEM");
    CHECK(result.output_text == "Hostname: box\n");
    CHECK_FALSE(result.failed);
    CHECK_FALSE(result.error_summary.has_value());
}

TEST_CASE("Reported failure keeps the output and the cause") {
    FakeProbe probe("hardware", "HARDWARE", "dmesg (last 50 lines):\n");
    probe.failWith("dmesg: read kernel buffer failed: Operation not permitted");

    auto result = executeSafely(probe);
    CHECK(result.failed);
    CHECK(result.output_text == "dmesg (last 50 lines):\n");
    REQUIRE(result.error_summary.has_value());
    CHECK(*result.error_summary == "dmesg: read kernel buffer failed: Operation not permitted");
}

TEST_CASE("Exceptions are converted and partial output survives") {
    FakeProbe probe("dns", "DNS", "DNS servers:\n");
    probe.throwAfterOutput("resolver exploded");

    auto result = executeSafely(probe);
    CHECK(result.failed);
    CHECK(result.output_text == "DNS servers:\n");
    CHECK(result.error_summary.value_or("") == "resolver exploded");
}

TEST_CASE("Non-standard exceptions are contained too") {
    NonStdThrowingProbe probe;
    auto result = executeSafely(probe);

    CHECK(result.failed);
    CHECK(result.output_text == "before\n");
    CHECK(result.error_summary.value_or("") == "unknown error");
}

TEST_CASE("Several failures are joined into one summary") {
    ProbeOutput out;
    out.fail("a: exit code 1");
    out.fail("b: timed out");
    CHECK(out.error().value_or("") == "a: exit code 1; b: timed out");
}
