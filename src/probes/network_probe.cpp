/**
 * @file network_probe.cpp
 * @brief Раздел NETWORK: интерфейсы, маршруты, конфигурация резолвера
 */

#include "builtin_probes.hpp"
#include "core/text_utils.hpp"

namespace hostdiag::probes {

void NetworkProbe::run(core::ProbeOutput& out) {
    using core::Alternative;
    using core::FallbackChain;

    if (have("ip")) {
        out.line("Interfaces (ip -br addr):");
        out.addOutcome(runChain(FallbackChain{{Alternative::command({"ip", "-br", "addr"})}, ""}));
        out.line();

        out.line("Routes (ip route):");
        out.addOutcome(runChain(FallbackChain{{Alternative::command({"ip", "route"})}, ""}));
    } else {
        out.line("ip command not found. Trying ifconfig/route...");
        out.addOutcome(runChain(FallbackChain{{Alternative::command({"ifconfig"})}, ""}));
        out.addOutcome(runChain(FallbackChain{{Alternative::command({"route", "-n"})}, ""}));
    }

    out.line();
    out.line("DNS (/etc/resolv.conf):");
    if (auto resolv = readFile("/etc/resolv.conf")) {
        out.append(core::prefixLines(*resolv, "  "));
    } else {
        out.line("  N/A");
    }
}

} // namespace hostdiag::probes
