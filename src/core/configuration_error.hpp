/**
 * @file configuration_error.hpp
 * @brief Ошибка конфигурации запуска (флаги, меню, файл настроек)
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include <stdexcept>
#include <string>

namespace hostdiag::core {

/**
 * @brief Неверный флаг, имя раздела, пункт меню или файл настроек.
 *
 * Единственный вид ошибок, влияющий на код завершения процесса.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace hostdiag::core
