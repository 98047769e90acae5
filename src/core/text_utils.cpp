/**
 * @file text_utils.cpp
 * @brief Построчная обработка текстового вывода утилит
 */

#include "text_utils.hpp"
#include <cctype>
#include <vector>

namespace hostdiag::core {

namespace {

std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string applyLineWindow(std::string_view text, LineWindow window) {
    auto lines = splitLines(text);

    size_t first = 0;
    size_t last = lines.size();
    if (window.mode == LineWindow::Mode::Head && window.count < lines.size()) {
        last = window.count;
    } else if (window.mode == LineWindow::Mode::Tail && window.count < lines.size()) {
        first = lines.size() - window.count;
    }

    std::string out;
    for (size_t i = first; i < last; ++i) {
        out.append(lines[i]);
        out.push_back('\n');
    }
    return out;
}

std::string prefixLines(std::string_view text, std::string_view prefix) {
    std::string out;
    for (auto line : splitLines(text)) {
        out.append(prefix);
        out.append(line);
        out.push_back('\n');
    }
    return out;
}

std::string firstNonEmptyLine(std::string_view text) {
    for (auto line : splitLines(text)) {
        auto trimmed = trim(line);
        if (!trimmed.empty()) {
            return trimmed;
        }
    }
    return {};
}

std::string trim(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && isSpace(text[begin])) {
        ++begin;
    }
    while (end > begin && isSpace(text[end - 1])) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

std::string toUpperAscii(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string ensureTrailingNewline(std::string text) {
    if (!text.empty() && text.back() != '\n') {
        text.push_back('\n');
    }
    return text;
}

} // namespace hostdiag::core
