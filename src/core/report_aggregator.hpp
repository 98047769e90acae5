/**
 * @file report_aggregator.hpp
 * @brief Последовательный запуск проб и сборка текстового отчёта
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "probe_registry.hpp"
#include "report_sink.hpp"
#include "model/execution_result.hpp"
#include "model/selection.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace hostdiag::core {

/// Ширина разделительной линии заголовка
constexpr size_t kRuleWidth = 70;

/**
 * @brief Заголовок раздела: линия, имя, линия (каждая с пустой строкой перед ней)
 */
[[nodiscard]] std::string renderSectionHeader(std::string_view title);

/**
 * @brief Строка "[ERROR] <TITLE>: <причина>" для неудачного раздела
 */
[[nodiscard]] std::string renderErrorAnnotation(const model::ExecutionResult& result);

/**
 * @brief Выполнить пробы по порядку и записать разделы в приёмник.
 *
 * Заголовок раздела уходит в sink до запуска пробы; сбой одной пробы
 * отражается строкой [ERROR] и не мешает остальным.
 *
 * @param probes Пробы в каноническом порядке
 * @param sink Приёмник отчёта
 * @return Результаты всех выполненных проб
 */
model::Report runReport(const std::vector<Probe*>& probes, ReportSink& sink);

/**
 * @brief Отобрать пробы по выбору и выполнить их
 * @throws ConfigurationError При неизвестном имени раздела (до запуска проб)
 */
model::Report runReport(
    const ProbeRegistry& registry,
    const model::Selection& selection,
    ReportSink& sink
);

} // namespace hostdiag::core
