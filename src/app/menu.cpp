/**
 * @file menu.cpp
 * @brief Интерактивный выбор одного раздела
 */

#include "menu.hpp"
#include "core/configuration_error.hpp"
#include "core/text_utils.hpp"
#include <cctype>

namespace hostdiag::app {
namespace {

/// "NETWORK" -> "Network"; короткие аббревиатуры (DNS) остаются как есть
std::string menuLabel(std::string_view title) {
    std::string label(title);
    if (label.size() <= 3) {
        return label;
    }
    for (size_t i = 1; i < label.size(); ++i) {
        label[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(label[i])));
    }
    return label;
}

} // namespace

MenuResult runMenu(
    std::istream& in,
    std::ostream& out,
    const core::ProbeRegistry& registry
) {
    const auto& probes = registry.list();

    out << "\n";
    out << "hostdiag - Menu\n";
    for (size_t i = 0; i < probes.size(); ++i) {
        out << (i + 1) << ") " << menuLabel(probes[i]->title()) << "\n";
    }
    out << "A) All\n";
    out << "Q) Quit\n";
    out << "\n";
    out << "Choose: " << std::flush;

    std::string answer;
    std::getline(in, answer);
    std::string choice = core::toUpperAscii(core::trim(answer));

    MenuResult result;
    if (choice == "Q") {
        result.outcome = MenuOutcome::Quit;
        return result;
    }

    result.outcome = MenuOutcome::Selected;
    if (choice == "A") {
        for (const auto& probe : probes) {
            result.sections.emplace(probe->name());
        }
        return result;
    }

    if (choice.size() == 1 && choice[0] >= '1' && choice[0] <= '9') {
        size_t index = static_cast<size_t>(choice[0] - '1');
        if (index < probes.size()) {
            result.sections.emplace(probes[index]->name());
            return result;
        }
    }

    throw core::ConfigurationError("Invalid choice");
}

} // namespace hostdiag::app
