/**
 * @file test_section_selector.cpp
 * @brief Юнит-тесты отбора разделов
 */

#include <doctest/doctest.h>
#include "core/section_selector.hpp"
#include "support/fakes.hpp"

using namespace hostdiag::core;
using hostdiag::model::Selection;

namespace {

std::vector<std::string> namesOf(const std::vector<Probe*>& probes) {
    std::vector<std::string> names;
    for (auto* p : probes) {
        names.emplace_back(p->name());
    }
    return names;
}

} // namespace

TEST_CASE("Selection order never changes canonical order") {
    auto registry = hostdiag::testing::makeFakeRegistry();

    Selection selection;
    selection.enabled = {"network", "system", "hardware", "dns"};

    CHECK(namesOf(selectProbes(registry, selection))
          == std::vector<std::string>{"system", "network", "dns", "hardware"});
}

TEST_CASE("Pseudo-name all expands to every probe") {
    auto registry = hostdiag::testing::makeFakeRegistry();

    Selection all;
    all.enabled = {"all"};
    CHECK(namesOf(selectProbes(registry, all)) == registry.names());

    Selection mixed;
    mixed.enabled = {"disk", "all"};
    CHECK(selectProbes(registry, mixed).size() == 9);
}

TEST_CASE("Empty selection selects nothing") {
    auto registry = hostdiag::testing::makeFakeRegistry();
    CHECK(selectProbes(registry, Selection{}).empty());
}

TEST_CASE("Unknown section name is a configuration error") {
    auto registry = hostdiag::testing::makeFakeRegistry();

    Selection selection;
    selection.enabled = {"system", "gpu"};
    CHECK_THROWS_AS((void)selectProbes(registry, selection), ConfigurationError);
}
