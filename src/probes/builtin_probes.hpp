/**
 * @file builtin_probes.hpp
 * @brief Встроенные пробы и канонический реестр
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "host_probe.hpp"
#include "core/probe_registry.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace hostdiag::probes {

class SystemProbe : public HostProbe {
public:
    using HostProbe::HostProbe;
    [[nodiscard]] std::string_view name() const noexcept override { return "system"; }
    [[nodiscard]] std::string_view title() const noexcept override { return "SYSTEM"; }
    void run(core::ProbeOutput& out) override;
};

class PerformanceProbe : public HostProbe {
public:
    using HostProbe::HostProbe;
    [[nodiscard]] std::string_view name() const noexcept override { return "performance"; }
    [[nodiscard]] std::string_view title() const noexcept override { return "PERFORMANCE"; }
    void run(core::ProbeOutput& out) override;
};

class DiskProbe : public HostProbe {
public:
    using HostProbe::HostProbe;
    [[nodiscard]] std::string_view name() const noexcept override { return "disk"; }
    [[nodiscard]] std::string_view title() const noexcept override { return "DISK"; }
    void run(core::ProbeOutput& out) override;
};

class NetworkProbe : public HostProbe {
public:
    using HostProbe::HostProbe;
    [[nodiscard]] std::string_view name() const noexcept override { return "network"; }
    [[nodiscard]] std::string_view title() const noexcept override { return "NETWORK"; }
    void run(core::ProbeOutput& out) override;
};

/**
 * @brief Шлюз, ping и TCP-подключение; каждое ожидание ограничено настройками
 */
class ConnectivityProbe : public HostProbe {
public:
    using HostProbe::HostProbe;
    [[nodiscard]] std::string_view name() const noexcept override { return "connectivity"; }
    [[nodiscard]] std::string_view title() const noexcept override { return "CONNECTIVITY"; }
    void run(core::ProbeOutput& out) override;

private:
    void ping(core::ProbeOutput& out, const std::string& target);
    void tcpTest(core::ProbeOutput& out);
};

class DnsProbe : public HostProbe {
public:
    using HostProbe::HostProbe;
    [[nodiscard]] std::string_view name() const noexcept override { return "dns"; }
    [[nodiscard]] std::string_view title() const noexcept override { return "DNS"; }
    void run(core::ProbeOutput& out) override;
};

class ServicesProbe : public HostProbe {
public:
    using HostProbe::HostProbe;
    [[nodiscard]] std::string_view name() const noexcept override { return "services"; }
    [[nodiscard]] std::string_view title() const noexcept override { return "SERVICES"; }
    void run(core::ProbeOutput& out) override;
};

class LogsProbe : public HostProbe {
public:
    using HostProbe::HostProbe;
    [[nodiscard]] std::string_view name() const noexcept override { return "logs"; }
    [[nodiscard]] std::string_view title() const noexcept override { return "LOGS"; }
    void run(core::ProbeOutput& out) override;
};

class HardwareProbe : public HostProbe {
public:
    using HostProbe::HostProbe;
    [[nodiscard]] std::string_view name() const noexcept override { return "hardware"; }
    [[nodiscard]] std::string_view title() const noexcept override { return "HARDWARE"; }
    void run(core::ProbeOutput& out) override;
};

/**
 * @brief Шлюз по умолчанию из вывода `ip route` (третье поле строки default)
 */
[[nodiscard]] std::optional<std::string> defaultGatewayFromRoutes(std::string_view routes);

/**
 * @brief Реестр из девяти встроенных проб в каноническом порядке.
 *
 * runner и settings должны жить дольше реестра.
 */
[[nodiscard]] core::ProbeRegistry makeBuiltinRegistry(
    core::CommandRunner& runner,
    const model::ProbeSettings& settings
);

} // namespace hostdiag::probes
