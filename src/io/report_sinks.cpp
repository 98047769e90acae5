/**
 * @file report_sinks.cpp
 * @brief Вывод отчёта в консоль и файл
 */

#include "report_sinks.hpp"
#include <cerrno>
#include <cstring>

namespace hostdiag::io {

void StreamSink::write(std::string_view text) {
    stream_.write(text.data(), static_cast<std::streamsize>(text.size()));
}

void StreamSink::flush() {
    stream_.flush();
}

TeeSink::TeeSink(std::ostream& console, const std::filesystem::path& file_path)
    : console_(console)
    , file_path_(file_path) {
    auto dir = file_path_.parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
    }

    file_.open(file_path_, std::ios::binary | std::ios::trunc);
    if (!file_) {
        dropFile(std::string("cannot open: ") + std::strerror(errno));
    }
}

void TeeSink::write(std::string_view text) {
    console_.write(text.data(), static_cast<std::streamsize>(text.size()));

    if (fileActive()) {
        file_.write(text.data(), static_cast<std::streamsize>(text.size()));
        if (!file_) {
            dropFile("write failed");
        }
    }
}

void TeeSink::flush() {
    console_.flush();
    if (fileActive()) {
        file_.flush();
        if (!file_) {
            dropFile("flush failed");
        }
    }
}

void TeeSink::close() {
    if (!file_.is_open()) {
        return;
    }
    file_.close();
    if (file_.fail() && !file_error_) {
        dropFile("close failed");
    }
}

void TeeSink::dropFile(const std::string& cause) {
    if (!file_error_) {
        file_error_.emplace(file_path_.string() + ": " + cause);
    }
    if (file_.is_open()) {
        file_.close();
    }
}

} // namespace hostdiag::io
