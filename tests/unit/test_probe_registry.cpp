/**
 * @file test_probe_registry.cpp
 * @brief Юнит-тесты реестра проб
 */

#include <doctest/doctest.h>
#include "core/probe_registry.hpp"
#include "support/fakes.hpp"
#include <stdexcept>

using namespace hostdiag::core;
using hostdiag::testing::FakeProbe;

TEST_CASE("Registry keeps registration order and looks up by name") {
    auto registry = hostdiag::testing::makeFakeRegistry();

    CHECK(registry.size() == 9);
    CHECK(registry.names() == hostdiag::testing::canonicalNames());

    Probe* dns = registry.find("dns");
    REQUIRE(dns != nullptr);
    CHECK(dns->title() == "DNS");
    CHECK(registry.find("bogus") == nullptr);
    CHECK_FALSE(registry.contains("all"));
}

TEST_CASE("Registry rejects duplicate and empty names") {
    ProbeRegistry registry;
    registry.add(std::make_unique<FakeProbe>("disk", "DISK", ""));

    CHECK_THROWS_AS(registry.add(std::make_unique<FakeProbe>("disk", "DISK 2", "")), std::invalid_argument);
    CHECK_THROWS_AS(registry.add(std::make_unique<FakeProbe>("", "EMPTY", "")), std::invalid_argument);
    CHECK_THROWS_AS(registry.add(nullptr), std::invalid_argument);
    CHECK(registry.size() == 1);
}
