/**
 * @file probe_registry.cpp
 * @brief Реестр проб
 */

#include "probe_registry.hpp"
#include <stdexcept>

namespace hostdiag::core {

void ProbeRegistry::add(std::unique_ptr<Probe> probe) {
    if (!probe || probe->name().empty()) {
        throw std::invalid_argument("probe must have a non-empty name");
    }
    if (contains(probe->name())) {
        throw std::invalid_argument("duplicate probe name: " + std::string(probe->name()));
    }
    probes_.push_back(std::move(probe));
}

Probe* ProbeRegistry::find(std::string_view name) const noexcept {
    for (const auto& probe : probes_) {
        if (probe->name() == name) {
            return probe.get();
        }
    }
    return nullptr;
}

std::vector<std::string> ProbeRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(probes_.size());
    for (const auto& probe : probes_) {
        result.emplace_back(probe->name());
    }
    return result;
}

} // namespace hostdiag::core
