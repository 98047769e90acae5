/**
 * @file settings_io.hpp
 * @brief Чтение параметров проб из JSON-файла (--config)
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "model/settings.hpp"
#include <filesystem>
#include <string>

namespace hostdiag::io {

/**
 * @brief Загрузить настройки из файла.
 *
 * Все ключи необязательны; отсутствующие сохраняют значения по умолчанию.
 *
 * @param path Путь к JSON-файлу
 * @return Настройки
 * @throws core::ConfigurationError При ошибке чтения, синтаксиса или типа значения
 */
[[nodiscard]] model::ProbeSettings loadSettings(const std::filesystem::path& path);

/**
 * @brief Разобрать настройки из JSON-строки
 * @throws core::ConfigurationError При ошибке синтаксиса или типа значения
 */
[[nodiscard]] model::ProbeSettings settingsFromJson(const std::string& json_text);

} // namespace hostdiag::io
