/**
 * @file execution_result.hpp
 * @brief Результаты выполнения проб и сводка отчёта
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hostdiag::model {

/**
 * @brief Результат одного запуска пробы.
 *
 * При failed == true в output_text остаётся частичный вывод,
 * собранный пробой до сбоя (может быть пустым).
 */
struct ExecutionResult {
    std::string probe_name;
    std::string title;
    std::string output_text;
    bool failed = false;
    std::optional<std::string> error_summary;
};

struct ReportSummary {
    size_t total = 0;
    size_t succeeded = 0;
    size_t failed = 0;
};

/**
 * @brief Отчёт: результаты в каноническом порядке реестра
 */
struct Report {
    std::vector<ExecutionResult> sections;

    [[nodiscard]] ReportSummary summarize() const noexcept {
        ReportSummary summary;
        for (const auto& section : sections) {
            summary.total++;
            if (section.failed) {
                summary.failed++;
            } else {
                summary.succeeded++;
            }
        }
        return summary;
    }
};

} // namespace hostdiag::model
