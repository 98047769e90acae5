/**
 * @file selection.hpp
 * @brief Набор разделов отчёта, запрошенных пользователем
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace hostdiag::model {

/// Псевдоимя, раскрывающееся во все зарегистрированные разделы
constexpr const char* kAllSections = "all";

/// Имя файла отчёта по умолчанию для --export-txt
constexpr const char* kDefaultReportFile = "reporte_diagnostico.txt";

/**
 * @brief Выбор разделов и параметры экспорта.
 *
 * Строится один раз из аргументов командной строки или меню и далее
 * не изменяется. Пустой набор допустим (отчёт без разделов).
 */
struct Selection {
    std::set<std::string> enabled;                   ///< Имена проб (или "all")
    bool export_to_file = false;                     ///< Дублировать отчёт в файл
    std::optional<std::filesystem::path> output_path; ///< Путь файла (--out)

    [[nodiscard]] bool empty() const noexcept { return enabled.empty(); }

    /**
     * @brief Путь файла экспорта с учётом значения по умолчанию
     * @param fallback Имя файла, если --out не задан или пуст
     */
    [[nodiscard]] std::filesystem::path exportPath(
        const std::filesystem::path& fallback = kDefaultReportFile
    ) const {
        if (output_path.has_value() && !output_path->empty()) {
            return *output_path;
        }
        return fallback;
    }
};

} // namespace hostdiag::model
