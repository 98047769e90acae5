/**
 * @file report_sink.hpp
 * @brief Приёмник текста отчёта
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include <string_view>

namespace hostdiag::core {

/**
 * @brief Получатель потока отчёта.
 *
 * Отчёт передаётся частями по мере выполнения проб, а не целиком в конце.
 */
class ReportSink {
public:
    virtual ~ReportSink() = default;

    virtual void write(std::string_view text) = 0;

    /// Вызывается после каждого раздела
    virtual void flush() {}
};

} // namespace hostdiag::core
