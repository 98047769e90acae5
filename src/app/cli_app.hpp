/**
 * @file cli_app.hpp
 * @brief Точка входа CLI без привязки к std::cin/std::cout
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "core/probe_registry.hpp"
#include "model/settings.hpp"
#include <functional>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace hostdiag::app {

/// Строит реестр проб для заданных настроек; настройки живут дольше реестра
using RegistryFactory = std::function<core::ProbeRegistry(const model::ProbeSettings&)>;

/**
 * @brief Выполнить команду целиком: разбор флагов, настройки, меню, отчёт.
 *
 * @param program Имя программы для справки
 * @param args Аргументы без argv[0]
 * @param in Ввод для меню
 * @param out Стандартный вывод
 * @param err Поток ошибок
 * @param make_registry Фабрика реестра проб
 * @return Код завершения: 0 - норма/справка, 1 - ошибка флагов или меню
 */
int runCli(
    const std::string& program,
    const std::vector<std::string>& args,
    std::istream& in,
    std::ostream& out,
    std::ostream& err,
    const RegistryFactory& make_registry
);

} // namespace hostdiag::app
