/**
 * @file settings.hpp
 * @brief Параметры проб (цели проверок, лимиты строк, таймауты)
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "model/selection.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace hostdiag::model {

struct ConnectivitySettings {
    std::string public_target = "1.1.1.1";     ///< Публичный адрес для ping
    int ping_count = 2;                        ///< ping -c
    int ping_wait_seconds = 2;                 ///< ping -W
    std::string tcp_host = "google.com";
    std::uint16_t tcp_port = 443;
    int tcp_timeout_seconds = 3;               ///< nc -w и таймаут connect()
};

struct LineLimits {
    size_t lscpu = 20;
    size_t meminfo = 15;
    size_t processes = 11;
    size_t resolver_status = 80;
    size_t resolve_answers = 5;
    size_t nslookup = 12;
    size_t journal = 50;
    size_t log_tail = 40;
    size_t devices = 40;
    size_t dmesg = 50;
};

/**
 * @brief Все настраиваемые параметры проб.
 *
 * Значения по умолчанию совпадают с исходным набором проверок;
 * файл --config переопределяет только указанные ключи.
 */
struct ProbeSettings {
    ConnectivitySettings connectivity;
    LineLimits limits;
    std::vector<std::string> dns_names{"google.com", "cloudflare.com", "microsoft.com"};
    std::vector<std::string> services{"NetworkManager", "systemd-resolved", "ssh", "cron", "cups"};
    std::vector<std::string> log_files{"/var/log/syslog", "/var/log/messages", "/var/log/dmesg"};
    std::chrono::milliseconds command_timeout{15000}; ///< Жёсткий лимит на одну команду
    std::string default_report_file = kDefaultReportFile;
};

} // namespace hostdiag::model
