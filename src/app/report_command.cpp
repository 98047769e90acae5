/**
 * @file report_command.cpp
 * @brief Выполнение отчёта с выводом в консоль и, при экспорте, в файл
 */

#include "report_command.hpp"
#include "core/report_aggregator.hpp"
#include "core/section_selector.hpp"
#include "io/report_sinks.hpp"

namespace hostdiag::app {

ReportCommandResult runReportCommand(
    const model::Selection& selection,
    const core::ProbeRegistry& registry,
    const std::filesystem::path& default_file,
    std::ostream& out,
    std::ostream& err
) {
    ReportCommandResult result;
    auto probes = core::selectProbes(registry, selection);

    if (selection.export_to_file) {
        auto path = selection.exportPath(default_file);
        result.export_path = path;

        io::TeeSink sink(out, path);
        result.report = core::runReport(probes, sink);
        sink.close();

        if (const auto& file_error = sink.fileError()) {
            result.export_failed = true;
            err << "Warning: cannot write report file " << file_error->what() << std::endl;
        } else {
            out << "\nSaved TXT report to: " << path.string() << std::endl;
        }
    } else {
        io::StreamSink sink(out);
        result.report = core::runReport(probes, sink);
    }

    auto summary = result.report.summarize();
    if (summary.failed > 0) {
        err << "Note: " << summary.failed << " of " << summary.total
            << " sections reported errors" << std::endl;
    }

    result.exit_code = 0;
    return result;
}

} // namespace hostdiag::app
