/**
 * @file section_selector.cpp
 * @brief Отбор проб реестра по выбору пользователя
 */

#include "section_selector.hpp"

namespace hostdiag::core {

std::vector<Probe*> selectProbes(
    const ProbeRegistry& registry,
    const model::Selection& selection
) {
    bool all = false;
    for (const auto& name : selection.enabled) {
        if (name == model::kAllSections) {
            all = true;
        } else if (!registry.contains(name)) {
            throw ConfigurationError("Unknown section: " + name);
        }
    }

    std::vector<Probe*> selected;
    for (const auto& probe : registry.list()) {
        if (all || selection.enabled.count(std::string(probe->name())) > 0) {
            selected.push_back(probe.get());
        }
    }
    return selected;
}

} // namespace hostdiag::core
