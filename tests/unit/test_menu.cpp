/**
 * @file test_menu.cpp
 * @brief Юнит-тесты интерактивного меню
 */

#include <doctest/doctest.h>
#include "app/menu.hpp"
#include "core/configuration_error.hpp"
#include "support/fakes.hpp"
#include <sstream>

using namespace hostdiag::app;
using hostdiag::core::ConfigurationError;

namespace {

MenuResult choose(const std::string& input, std::string* printed = nullptr) {
    auto registry = hostdiag::testing::makeFakeRegistry();
    std::istringstream in(input);
    std::ostringstream out;
    auto result = runMenu(in, out, registry);
    if (printed) {
        *printed = out.str();
    }
    return result;
}

} // namespace

TEST_CASE("Menu lists sections in canonical order") {
    std::string printed;
    (void)choose("q\n", &printed);

    CHECK(printed.find("1) System\n") != std::string::npos);
    CHECK(printed.find("6) DNS\n") != std::string::npos);
    CHECK(printed.find("9) Hardware\n") != std::string::npos);
    CHECK(printed.find("A) All\n") != std::string::npos);
    CHECK(printed.find("Choose: ") != std::string::npos);
}

TEST_CASE("Digits select one section") {
    auto result = choose("4\n");
    CHECK(result.outcome == MenuOutcome::Selected);
    CHECK(result.sections == std::set<std::string>{"network"});

    CHECK(choose("9").sections == std::set<std::string>{"hardware"});
}

TEST_CASE("A selects all and Q quits, case-insensitively") {
    CHECK(choose("a\n").sections.size() == 9);
    CHECK(choose("A\n").sections.size() == 9);
    CHECK(choose("Q\n").outcome == MenuOutcome::Quit);
    CHECK(choose("q\n").sections.empty());
}

TEST_CASE("Anything else is an invalid choice") {
    CHECK_THROWS_WITH_AS(choose("0\n"), "Invalid choice", ConfigurationError);
    CHECK_THROWS_AS(choose("10\n"), ConfigurationError);
    CHECK_THROWS_AS(choose("x\n"), ConfigurationError);
    CHECK_THROWS_AS(choose(""), ConfigurationError);
}
