/**
 * @file cli_options.hpp
 * @brief Разбор аргументов командной строки
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "core/configuration_error.hpp"
#include "model/selection.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hostdiag::app {

/**
 * @brief Неизвестный флаг: кроме сообщения выводится справка
 */
class UnknownOptionError : public core::ConfigurationError {
public:
    explicit UnknownOptionError(const std::string& option)
        : core::ConfigurationError("Unknown option: " + option) {}
};

enum class CliAction {
    ShowUsage,      ///< Нет аргументов или -h/--help (код 0)
    ShowVersion,
    Run             ///< Выполнить отчёт (возможно, после меню)
};

struct CliOptions {
    CliAction action = CliAction::ShowUsage;
    model::Selection selection;
    bool interactive_menu = false;
    std::optional<std::filesystem::path> config_path;
};

/**
 * @brief Разобрать аргументы (без argv[0]) слева направо.
 *
 * Первый -h/--help завершает разбор с ShowUsage; первый неизвестный
 * флаг - UnknownOptionError. --all кладёт в
 * выбор все имена разделов, а не псевдоимя, поэтому результат совпадает
 * с перечислением всех флагов.
 *
 * @param args Аргументы
 * @param section_names Имена разделов в каноническом порядке
 * @throws UnknownOptionError При неизвестном флаге
 * @throws core::ConfigurationError Если у --config нет значения
 */
[[nodiscard]] CliOptions parseArguments(
    const std::vector<std::string>& args,
    const std::vector<std::string>& section_names
);

/**
 * @brief Текст справки
 */
[[nodiscard]] std::string usageText(const std::string& program);

} // namespace hostdiag::app
