/**
 * @file text_utils.hpp
 * @brief Построчная обработка текстового вывода утилит
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace hostdiag::core {

/**
 * @brief Окно строк, оставляемое из вывода команды (аналог head/tail)
 */
struct LineWindow {
    enum class Mode {
        All,
        Head,
        Tail
    };

    Mode mode = Mode::All;
    size_t count = 0;

    [[nodiscard]] static LineWindow all() noexcept { return {}; }
    [[nodiscard]] static LineWindow head(size_t n) noexcept { return {Mode::Head, n}; }
    [[nodiscard]] static LineWindow tail(size_t n) noexcept { return {Mode::Tail, n}; }
};

/**
 * @brief Применить окно строк к тексту.
 *
 * Каждая оставленная строка завершается '\n', даже если во входе
 * последний перевод строки отсутствовал.
 */
[[nodiscard]] std::string applyLineWindow(std::string_view text, LineWindow window);

/**
 * @brief Добавить префикс к каждой строке (аналог sed 's/^/  /')
 */
[[nodiscard]] std::string prefixLines(std::string_view text, std::string_view prefix);

/**
 * @brief Первая непустая строка без пробелов по краям
 */
[[nodiscard]] std::string firstNonEmptyLine(std::string_view text);

[[nodiscard]] std::string trim(std::string_view text);

/**
 * @brief Верхний регистр для ASCII (заголовки разделов, пункты меню)
 */
[[nodiscard]] std::string toUpperAscii(std::string_view text);

/**
 * @brief Гарантировать завершающий '\n' у непустого текста
 */
[[nodiscard]] std::string ensureTrailingNewline(std::string text);

} // namespace hostdiag::core
