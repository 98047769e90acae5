/**
 * @file hardware_probe.cpp
 * @brief Раздел HARDWARE: устройства PCI/USB и сообщения ядра
 */

#include "builtin_probes.hpp"

namespace hostdiag::probes {

void HardwareProbe::run(core::ProbeOutput& out) {
    using core::Alternative;
    using core::FallbackChain;
    using core::LineWindow;

    const auto& limits = settings_.limits;

    out.line("PCI devices (lspci):");
    out.addOutcome(runChain(FallbackChain{{
        Alternative::command({"lspci"}, LineWindow::head(limits.devices))
    }, "lspci not found."}));
    out.line();

    out.line("USB devices (lsusb):");
    out.addOutcome(runChain(FallbackChain{{
        Alternative::command({"lsusb"}, LineWindow::head(limits.devices))
    }, "lsusb not found."}));
    out.line();

    out.line("dmesg (last " + std::to_string(limits.dmesg) + " lines):");
    out.addOutcome(runChain(FallbackChain{{
        Alternative::command({"dmesg"}, LineWindow::tail(limits.dmesg))
    }, "dmesg not found."}));
}

} // namespace hostdiag::probes
