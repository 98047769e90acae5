/**
 * @file menu.hpp
 * @brief Интерактивный выбор одного раздела
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "core/probe_registry.hpp"
#include <istream>
#include <ostream>
#include <set>
#include <string>

namespace hostdiag::app {

enum class MenuOutcome {
    Selected,
    Quit
};

struct MenuResult {
    MenuOutcome outcome = MenuOutcome::Quit;
    std::set<std::string> sections;
};

/**
 * @brief Показать меню и прочитать один ответ.
 *
 * Пункты 1..N соответствуют пробам реестра по порядку, A - все, Q - выход.
 * Регистр не важен; пустой ввод и конец потока считаются неверным выбором.
 *
 * @throws core::ConfigurationError("Invalid choice") При неверном ответе
 */
[[nodiscard]] MenuResult runMenu(
    std::istream& in,
    std::ostream& out,
    const core::ProbeRegistry& registry
);

} // namespace hostdiag::app
