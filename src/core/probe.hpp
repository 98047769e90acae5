/**
 * @file probe.hpp
 * @brief Интерфейс диагностической пробы
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "fallback_chain.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace hostdiag::core {

/**
 * @brief Накопитель вывода пробы.
 *
 * Хранится у исполнителя, поэтому частичный вывод сохраняется,
 * даже если проба прервалась исключением.
 */
class ProbeOutput {
public:
    void append(std::string_view text);
    void line(std::string_view text = {});

    /**
     * @brief Добавить результат цепочки; Failed регистрируется как ошибка пробы
     */
    void addOutcome(const ChainOutcome& outcome);

    /**
     * @brief Зарегистрировать ошибку (несколько причин объединяются через "; ")
     */
    void fail(std::string_view cause);

    [[nodiscard]] const std::string& text() const noexcept { return text_; }
    [[nodiscard]] const std::optional<std::string>& error() const noexcept { return error_; }
    [[nodiscard]] bool failed() const noexcept { return error_.has_value(); }

private:
    std::string text_;
    std::optional<std::string> error_;
};

/**
 * @brief Независимая диагностическая проба (один раздел отчёта)
 */
class Probe {
public:
    virtual ~Probe() = default;

    /// Уникальное имя ("system", "network", ...), совпадает с флагом CLI
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Заголовок раздела в отчёте ("SYSTEM", "NETWORK", ...)
    [[nodiscard]] virtual std::string_view title() const noexcept = 0;

    /**
     * @brief Собрать данные.
     *
     * Может бросать исключения: их перехватывает executeSafely().
     */
    virtual void run(ProbeOutput& out) = 0;
};

} // namespace hostdiag::core
