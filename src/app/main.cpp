/**
 * @file main.cpp
 * @brief Точка входа hostdiag
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "cli_app.hpp"
#include "core/command_runner.hpp"
#include "probes/builtin_probes.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    try {
        std::string program = argc > 0
            ? std::filesystem::path(argv[0]).filename().string()
            : std::string("hostdiag");
        std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

        hostdiag::core::SystemCommandRunner runner;
        return hostdiag::app::runCli(
            program, args, std::cin, std::cout, std::cerr,
            [&runner](const hostdiag::model::ProbeSettings& settings) {
                return hostdiag::probes::makeBuiltinRegistry(runner, settings);
            });
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
