/**
 * @file connectivity_probe.cpp
 * @brief Раздел CONNECTIVITY: шлюз, ping, TCP-подключение
 */

#include "builtin_probes.hpp"
#include "tcp_connect.hpp"
#include "core/text_utils.hpp"
#include <sstream>

namespace hostdiag::probes {

std::optional<std::string> defaultGatewayFromRoutes(std::string_view routes) {
    std::istringstream in{std::string(routes)};
    std::string line;
    while (std::getline(in, line)) {
        if (line.find("default") == std::string::npos) {
            continue;
        }
        std::istringstream fields(line);
        std::string first;
        std::string second;
        std::string third;
        if (fields >> first >> second >> third) {
            return third;
        }
    }
    return std::nullopt;
}

void ConnectivityProbe::run(core::ProbeOutput& out) {
    std::optional<std::string> gateway;
    if (have("ip")) {
        auto routes = runCommand({"ip", "route"});
        if (routes.succeeded()) {
            gateway = defaultGatewayFromRoutes(routes.out);
        }
    }

    out.line("Default gateway: " + gateway.value_or("N/A"));
    out.line();

    if (have("ping")) {
        if (gateway.has_value()) {
            out.line("Ping gateway (" + *gateway + "):");
            ping(out, *gateway);
            out.line();
        }

        out.line("Ping public (" + settings_.connectivity.public_target + "):");
        ping(out, settings_.connectivity.public_target);
    } else {
        out.line("ping not found.");
    }

    out.line();
    tcpTest(out);
}

void ConnectivityProbe::ping(core::ProbeOutput& out, const std::string& target) {
    const auto& c = settings_.connectivity;
    auto result = runCommand({
        "ping",
        "-c", std::to_string(c.ping_count),
        "-W", std::to_string(c.ping_wait_seconds),
        target
    });

    // Недоступность цели - результат проверки, а не сбой пробы
    out.append(core::ensureTrailingNewline(result.out));
    out.line(result.succeeded() ? "OK" : "FAILED");
}

void ConnectivityProbe::tcpTest(core::ProbeOutput& out) {
    const auto& c = settings_.connectivity;
    out.line("TCP test (" + c.tcp_host + ":" + std::to_string(c.tcp_port) + "):");

    if (have("nc")) {
        auto result = runCommand({
            "nc", "-vz",
            "-w", std::to_string(c.tcp_timeout_seconds),
            c.tcp_host,
            std::to_string(c.tcp_port)
        });
        // nc -v пишет итог в stderr
        out.append(core::applyLineWindow(result.out + result.err, core::LineWindow::tail(2)));
        return;
    }

    auto result = tcpConnect(c.tcp_host, c.tcp_port, std::chrono::seconds(c.tcp_timeout_seconds));
    out.line(result.connected ? "TCP OK" : "TCP FAILED (" + result.error + ")");
}

} // namespace hostdiag::probes
