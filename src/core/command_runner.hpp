/**
 * @file command_runner.hpp
 * @brief Запуск внешних утилит с захватом stdout/stderr и таймаутом
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace hostdiag::core {

/// Код завершения, если утилиту не удалось запустить (как у shell)
constexpr int kExitNotFound = 127;

/**
 * @brief Системный сбой запуска (pipe/fork), не связанный с самой утилитой
 */
class CommandError : public std::runtime_error {
public:
    explicit CommandError(const std::string& message)
        : std::runtime_error(message) {}
};

struct CommandSpec {
    std::vector<std::string> argv;                 ///< argv[0] ищется в PATH
    std::chrono::milliseconds timeout{15000};      ///< После него процесс получает SIGKILL
};

struct CommandResult {
    bool launched = false;       ///< execvp выполнен успешно
    int exit_code = kExitNotFound;
    std::string out;
    std::string err;
    bool timed_out = false;

    [[nodiscard]] bool succeeded() const noexcept {
        return launched && !timed_out && exit_code == 0;
    }
};

/**
 * @brief Исполнитель внешних команд.
 *
 * Пробы обращаются к ОС только через этот интерфейс, что позволяет
 * подменять его в тестах.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Выполнить команду и дождаться завершения (не дольше spec.timeout)
     * @throws CommandError При сбое pipe/fork
     */
    virtual CommandResult run(const CommandSpec& spec) = 0;

    /**
     * @brief Доступна ли утилита (аналог `command -v`)
     */
    [[nodiscard]] virtual bool isAvailable(const std::string& tool) const = 0;
};

/**
 * @brief Реализация на fork/execvp/poll для POSIX-систем
 */
class SystemCommandRunner : public CommandRunner {
public:
    CommandResult run(const CommandSpec& spec) override;
    [[nodiscard]] bool isAvailable(const std::string& tool) const override;
};

} // namespace hostdiag::core
