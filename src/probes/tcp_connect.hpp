/**
 * @file tcp_connect.hpp
 * @brief Проверка TCP-подключения с ограниченным ожиданием
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace hostdiag::probes {

struct TcpConnectResult {
    bool connected = false;
    std::string error;   ///< Причина при connected == false
};

/**
 * @brief Попытаться установить TCP-соединение.
 *
 * Перебирает адреса из getaddrinfo под общим сроком timeout (время
 * самого getaddrinfo ограничено таймаутом резолвера). Соединение сразу
 * закрывается.
 */
[[nodiscard]] TcpConnectResult tcpConnect(
    const std::string& host,
    std::uint16_t port,
    std::chrono::milliseconds timeout
);

} // namespace hostdiag::probes
