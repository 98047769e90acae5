/**
 * @file safe_executor.hpp
 * @brief Изолированный запуск одной пробы
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "probe.hpp"
#include "model/execution_result.hpp"

namespace hostdiag::core {

/**
 * @brief Выполнить пробу, не пропуская наружу никаких сбоев.
 *
 * Исключение или зарегистрированная пробой ошибка превращаются в
 * failed == true и error_summary; накопленный до сбоя вывод сохраняется.
 */
[[nodiscard]] model::ExecutionResult executeSafely(Probe& probe);

} // namespace hostdiag::core
