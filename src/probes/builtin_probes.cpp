/**
 * @file builtin_probes.cpp
 * @brief Канонический реестр встроенных проб
 */

#include "builtin_probes.hpp"
#include <memory>

namespace hostdiag::probes {

core::ProbeRegistry makeBuiltinRegistry(
    core::CommandRunner& runner,
    const model::ProbeSettings& settings
) {
    core::ProbeRegistry registry;
    registry.add(std::make_unique<SystemProbe>(runner, settings));
    registry.add(std::make_unique<PerformanceProbe>(runner, settings));
    registry.add(std::make_unique<DiskProbe>(runner, settings));
    registry.add(std::make_unique<NetworkProbe>(runner, settings));
    registry.add(std::make_unique<ConnectivityProbe>(runner, settings));
    registry.add(std::make_unique<DnsProbe>(runner, settings));
    registry.add(std::make_unique<ServicesProbe>(runner, settings));
    registry.add(std::make_unique<LogsProbe>(runner, settings));
    registry.add(std::make_unique<HardwareProbe>(runner, settings));
    return registry;
}

} // namespace hostdiag::probes
