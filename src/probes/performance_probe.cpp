/**
 * @file performance_probe.cpp
 * @brief Раздел PERFORMANCE: нагрузка, память, самые активные процессы
 */

#include "builtin_probes.hpp"

namespace hostdiag::probes {
namespace {

using core::Alternative;
using core::FallbackChain;
using core::LineWindow;

FallbackChain topProcesses(const char* sort_key, size_t lines) {
    return FallbackChain{{
        Alternative::command({"ps", "-eo", "pid,comm,%cpu,%mem", std::string("--sort=") + sort_key},
                             LineWindow::head(lines))
    }, "ps not found."};
}

} // namespace

void PerformanceProbe::run(core::ProbeOutput& out) {
    const auto& limits = settings_.limits;

    out.line("Load average:");
    out.addOutcome(runChain(FallbackChain{{
        Alternative::fromFile("/proc/loadavg"),
        Alternative::command({"uptime"})
    }, "N/A"}));
    out.line();

    out.line("Memory (free -h):");
    out.addOutcome(runChain(FallbackChain{{
        Alternative::command({"free", "-h"}),
        Alternative::fromFile("/proc/meminfo", LineWindow::head(limits.meminfo))
    }, "N/A"}));
    out.line();

    out.line("Top processes (CPU):");
    out.addOutcome(runChain(topProcesses("-%cpu", limits.processes)));
    out.line();

    out.line("Top processes (MEM):");
    out.addOutcome(runChain(topProcesses("-%mem", limits.processes)));
}

} // namespace hostdiag::probes
