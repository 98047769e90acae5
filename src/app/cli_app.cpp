/**
 * @file cli_app.cpp
 * @brief Точка входа CLI без привязки к std::cin/std::cout
 */

#include "cli_app.hpp"
#include "cli_options.hpp"
#include "menu.hpp"
#include "report_command.hpp"
#include "io/settings_io.hpp"

namespace hostdiag::app {

int runCli(
    const std::string& program,
    const std::vector<std::string>& args,
    std::istream& in,
    std::ostream& out,
    std::ostream& err,
    const RegistryFactory& make_registry
) {
    model::ProbeSettings settings;

    try {
        auto registry = make_registry(settings);
        CliOptions options = parseArguments(args, registry.names());

        if (options.action == CliAction::ShowUsage) {
            out << usageText(program);
            return 0;
        }
        if (options.action == CliAction::ShowVersion) {
            out << program << " " << HOSTDIAG_VERSION << "\n";
            return 0;
        }

        if (options.config_path.has_value()) {
            settings = io::loadSettings(*options.config_path);
            registry = make_registry(settings);
        }

        model::Selection selection = options.selection;
        if (options.interactive_menu) {
            auto menu = runMenu(in, out, registry);
            if (menu.outcome == MenuOutcome::Quit) {
                return 0;
            }
            selection.enabled.insert(menu.sections.begin(), menu.sections.end());
        }

        auto result = runReportCommand(selection, registry, settings.default_report_file, out, err);
        return result.exit_code;
    } catch (const UnknownOptionError& e) {
        err << e.what() << "\n";
        out << usageText(program);
        return 1;
    } catch (const core::ConfigurationError& e) {
        err << e.what() << "\n";
        return 1;
    }
}

} // namespace hostdiag::app
