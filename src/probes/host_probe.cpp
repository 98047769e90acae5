/**
 * @file host_probe.cpp
 * @brief Общая основа проб, опрашивающих текущий хост
 */

#include "host_probe.hpp"
#include "core/text_utils.hpp"
#include <fstream>
#include <sstream>

namespace hostdiag::probes {

bool HostProbe::have(const std::string& tool) const {
    return runner_.isAvailable(tool);
}

core::ChainOutcome HostProbe::runChain(const core::FallbackChain& chain) {
    return core::runChain(chain, runner_, settings_.command_timeout);
}

core::CommandResult HostProbe::runCommand(std::vector<std::string> argv) {
    return runner_.run(core::CommandSpec{std::move(argv), settings_.command_timeout});
}

void HostProbe::inlineValue(core::ProbeOutput& out, const std::string& label, const core::FallbackChain& chain) {
    auto outcome = runChain(chain);
    std::string value = core::trim(outcome.text);
    if (outcome.status == core::ChainStatus::Unavailable || value.empty()) {
        value = "N/A";
    }
    out.line(label + value);
    if (outcome.status == core::ChainStatus::Failed) {
        out.fail(outcome.error);
    }
}

std::optional<std::string> HostProbe::readFile(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

} // namespace hostdiag::probes
