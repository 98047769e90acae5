/**
 * @file section_selector.hpp
 * @brief Отбор проб реестра по выбору пользователя
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "configuration_error.hpp"
#include "probe_registry.hpp"
#include "model/selection.hpp"
#include <vector>

namespace hostdiag::core {

/**
 * @brief Пробы для запуска в каноническом порядке реестра.
 *
 * Порядок добавления имён в Selection не учитывается. Псевдоимя
 * "all" выбирает все пробы.
 *
 * @throws ConfigurationError Если имя не зарегистрировано
 */
[[nodiscard]] std::vector<Probe*> selectProbes(
    const ProbeRegistry& registry,
    const model::Selection& selection
);

} // namespace hostdiag::core
