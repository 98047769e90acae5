/**
 * @file cli_options.cpp
 * @brief Разбор аргументов командной строки
 */

#include "cli_options.hpp"
#include <algorithm>

namespace hostdiag::app {

CliOptions parseArguments(
    const std::vector<std::string>& args,
    const std::vector<std::string>& section_names
) {
    CliOptions options;
    if (args.empty()) {
        return options;
    }

    options.action = CliAction::Run;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.action = CliAction::ShowUsage;
            return options;
        }
        if (arg == "--version") {
            options.action = CliAction::ShowVersion;
            return options;
        }

        if (arg == "--all") {
            options.selection.enabled.insert(section_names.begin(), section_names.end());
        } else if (arg == "--menu") {
            options.interactive_menu = true;
        } else if (arg == "--export-txt") {
            options.selection.export_to_file = true;
        } else if (arg == "--out") {
            // Без значения остаётся имя файла по умолчанию
            if (i + 1 < args.size()) {
                options.selection.output_path = std::filesystem::path(args[++i]);
            } else {
                options.selection.output_path.reset();
            }
        } else if (arg == "--config") {
            if (i + 1 >= args.size()) {
                throw core::ConfigurationError("Option --config requires a path");
            }
            options.config_path = std::filesystem::path(args[++i]);
        } else if (arg.rfind("--", 0) == 0
                   && std::find(section_names.begin(), section_names.end(), arg.substr(2)) != section_names.end()) {
            options.selection.enabled.insert(arg.substr(2));
        } else {
            throw UnknownOptionError(arg);
        }
    }
    return options;
}

std::string usageText(const std::string& program) {
    return "Usage: " + program + " [options]\n"
        "\n"
        "Options:\n"
        "  --all              Run all sections\n"
        "  --system           System summary\n"
        "  --performance      CPU/RAM + processes\n"
        "  --disk             Disk usage / devices\n"
        "  --network          Interfaces / routes / DNS config\n"
        "  --connectivity     Ping + TCP test\n"
        "  --dns              DNS diagnostics\n"
        "  --services         Basic service health (systemd)\n"
        "  --logs             Recent logs\n"
        "  --hardware         Hardware summary\n"
        "  --menu             Interactive menu\n"
        "  --export-txt       Save output to a TXT file\n"
        "  --out <path>       Output file path for --export-txt\n"
        "  --config <path>    Probe settings (JSON)\n"
        "  --version          Show version\n"
        "  -h, --help         Show help\n";
}

} // namespace hostdiag::app
