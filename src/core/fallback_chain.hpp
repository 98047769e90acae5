/**
 * @file fallback_chain.hpp
 * @brief Упорядоченный список альтернативных утилит для одного замера
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "command_runner.hpp"
#include "text_utils.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace hostdiag::core {

/**
 * @brief Одна альтернатива: команда либо файл, и окно строк результата.
 *
 * Команда доступна, если утилита найдена в PATH; файл - если его можно открыть.
 */
struct Alternative {
    std::vector<std::string> argv;     ///< Пусто для файловой альтернативы
    std::filesystem::path file;
    LineWindow window = LineWindow::all();

    [[nodiscard]] static Alternative command(std::vector<std::string> argv, LineWindow window = LineWindow::all()) {
        Alternative alt;
        alt.argv = std::move(argv);
        alt.window = window;
        return alt;
    }

    [[nodiscard]] static Alternative fromFile(std::filesystem::path path, LineWindow window = LineWindow::all()) {
        Alternative alt;
        alt.file = std::move(path);
        alt.window = window;
        return alt;
    }

    [[nodiscard]] bool isFile() const noexcept { return argv.empty(); }
};

/**
 * @brief Цепочка: пробуем A, если её нет - B, и так далее.
 *
 * Если ни одной утилиты нет, результатом становится unavailable_message.
 */
struct FallbackChain {
    std::vector<Alternative> alternatives;
    std::string unavailable_message;
    bool fall_through_on_failure = false;   ///< Переходить к следующей при ненулевом коде
};

enum class ChainStatus {
    Succeeded,
    Failed,
    Unavailable
};

struct ChainOutcome {
    ChainStatus status = ChainStatus::Unavailable;
    std::string text;    ///< Вывод (или сообщение о недоступности), с '\n' в конце
    std::string error;   ///< Краткая причина для Failed
    std::string tool;    ///< Утилита или файл, давшие результат

    [[nodiscard]] bool ok() const noexcept { return status == ChainStatus::Succeeded; }
};

/**
 * @brief Выполнить цепочку альтернатив.
 *
 * @param chain Цепочка
 * @param runner Исполнитель команд
 * @param timeout Лимит на каждую команду
 */
[[nodiscard]] ChainOutcome runChain(
    const FallbackChain& chain,
    CommandRunner& runner,
    std::chrono::milliseconds timeout
);

/**
 * @brief Краткое описание причины неудачи команды
 *
 * Первая непустая строка stderr, иначе "timed out"/"exit code N".
 */
[[nodiscard]] std::string summarizeFailure(const CommandResult& result);

} // namespace hostdiag::core
