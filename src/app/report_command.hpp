/**
 * @file report_command.hpp
 * @brief Выполнение отчёта с выводом в консоль и, при экспорте, в файл
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "core/probe_registry.hpp"
#include "model/execution_result.hpp"
#include "model/selection.hpp"
#include <filesystem>
#include <optional>
#include <ostream>

namespace hostdiag::app {

struct ReportCommandResult {
    int exit_code = 0;
    model::Report report;
    std::optional<std::filesystem::path> export_path;  ///< Задан при --export-txt
    bool export_failed = false;
};

/**
 * @brief Выполнить выбранные разделы и вывести отчёт.
 *
 * Сбои проб и ошибка записи файла не меняют код завершения: они
 * отражаются в отчёте и предупреждением в err.
 *
 * @param selection Выбор разделов и параметры экспорта
 * @param registry Канонический реестр проб
 * @param default_file Имя файла, если --out не задан
 * @param out Консольный поток отчёта
 * @param err Поток предупреждений
 * @throws core::ConfigurationError При неизвестном имени раздела (до вывода)
 */
ReportCommandResult runReportCommand(
    const model::Selection& selection,
    const core::ProbeRegistry& registry,
    const std::filesystem::path& default_file,
    std::ostream& out,
    std::ostream& err
);

} // namespace hostdiag::app
