/**
 * @file services_probe.cpp
 * @brief Раздел SERVICES: состояние служб systemd
 */

#include "builtin_probes.hpp"
#include "core/text_utils.hpp"
#include <utility>

namespace hostdiag::probes {

void ServicesProbe::run(core::ProbeOutput& out) {
    if (!have("systemctl")) {
        out.line("systemctl not found (maybe not systemd). Skipping.");
        return;
    }

    for (const auto& service : settings_.services) {
        out.line("Service: " + service);

        // is-enabled/is-active возвращают ненулевой код для выключенных служб;
        // сбоем считаем только незапуск или таймаут
        for (const auto& [verb, prefix] : {
                 std::pair<const char*, const char*>{"is-enabled", "  enabled: "},
                 std::pair<const char*, const char*>{"is-active", "  active:  "}}) {
            auto result = runCommand({"systemctl", verb, service});
            if (!result.launched || result.timed_out) {
                out.fail("systemctl " + std::string(verb) + " " + service + ": "
                         + core::summarizeFailure(result));
                continue;
            }
            out.append(core::prefixLines(result.out, prefix));
        }
        out.line();
    }
}

} // namespace hostdiag::probes
