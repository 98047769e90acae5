/**
 * @file report_sinks.hpp
 * @brief Вывод отчёта в консоль и одновременно в файл (tee)
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "core/report_sink.hpp"
#include <filesystem>
#include <fstream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace hostdiag::io {

/**
 * @brief Ошибка записи файла отчёта
 */
class SinkError : public std::runtime_error {
public:
    explicit SinkError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Запись в произвольный поток (обычно std::cout)
 */
class StreamSink : public core::ReportSink {
public:
    explicit StreamSink(std::ostream& stream) : stream_(stream) {}

    void write(std::string_view text) override;
    void flush() override;

private:
    std::ostream& stream_;
};

/**
 * @brief Консоль + файл с побайтно одинаковым содержимым.
 *
 * Консольная копия приоритетна: при ошибке открытия или записи файла
 * запись в файл прекращается, консоль продолжает получать отчёт,
 * а причина доступна через fileError().
 */
class TeeSink : public core::ReportSink {
public:
    TeeSink(std::ostream& console, const std::filesystem::path& file_path);

    void write(std::string_view text) override;
    void flush() override;

    /// Закрыть файл; ошибка закрытия также попадает в fileError()
    void close();

    [[nodiscard]] bool fileActive() const noexcept { return file_.is_open() && !file_error_; }
    [[nodiscard]] const std::optional<SinkError>& fileError() const noexcept { return file_error_; }

private:
    void dropFile(const std::string& cause);

    std::ostream& console_;
    std::filesystem::path file_path_;
    std::ofstream file_;
    std::optional<SinkError> file_error_;
};

} // namespace hostdiag::io
