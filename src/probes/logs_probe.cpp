/**
 * @file logs_probe.cpp
 * @brief Раздел LOGS: последние предупреждения журнала
 */

#include "builtin_probes.hpp"
#include <filesystem>

namespace hostdiag::probes {

void LogsProbe::run(core::ProbeOutput& out) {
    using core::Alternative;
    using core::FallbackChain;

    const auto& limits = settings_.limits;
    const std::string lines = std::to_string(limits.journal);

    if (have("journalctl")) {
        out.line("journalctl (last " + lines + " lines, warnings+errors if possible):");
        out.addOutcome(runChain(FallbackChain{{
            Alternative::command({"journalctl", "-p", "warning", "-n", lines, "--no-pager"}),
            Alternative::command({"journalctl", "-n", lines, "--no-pager"})
        }, "", true}));
        return;
    }

    out.line("journalctl not found. Showing common logs (if exist):");
    for (const auto& file : settings_.log_files) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file, ec)) {
            continue;
        }

        out.line("--- " + file + " (last " + std::to_string(limits.log_tail) + ") ---");
        auto outcome = runChain(FallbackChain{{
            Alternative::fromFile(file, core::LineWindow::tail(limits.log_tail))
        }, ""});
        if (outcome.status == core::ChainStatus::Unavailable) {
            out.fail("cannot read " + file);
        } else {
            out.addOutcome(outcome);
        }
        out.line();
    }
}

} // namespace hostdiag::probes
