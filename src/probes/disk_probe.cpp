/**
 * @file disk_probe.cpp
 * @brief Раздел DISK: заполнение файловых систем и блочные устройства
 */

#include "builtin_probes.hpp"

namespace hostdiag::probes {

void DiskProbe::run(core::ProbeOutput& out) {
    using core::Alternative;
    using core::FallbackChain;

    out.line("Filesystem usage (df -h):");
    out.addOutcome(runChain(FallbackChain{{
        Alternative::command({"df", "-h"})
    }, "df not found."}));
    out.line();

    out.line("Block devices (lsblk):");
    out.addOutcome(runChain(FallbackChain{{
        Alternative::command({"lsblk", "-o", "NAME,SIZE,TYPE,FSTYPE,MOUNTPOINTS"}),
        Alternative::command({"lsblk"})
    }, "lsblk not found.", true}));
}

} // namespace hostdiag::probes
