/**
 * @file report_aggregator.cpp
 * @brief Последовательный запуск проб и сборка текстового отчёта
 */

#include "report_aggregator.hpp"
#include "safe_executor.hpp"
#include "section_selector.hpp"
#include "text_utils.hpp"

namespace hostdiag::core {

std::string renderSectionHeader(std::string_view title) {
    const std::string rule(kRuleWidth, '=');
    std::string out;
    out.reserve(2 * kRuleWidth + title.size() + 6);
    out += "\n" + rule + "\n";
    out.append(title);
    out += "\n";
    out += "\n" + rule + "\n";
    return out;
}

std::string renderErrorAnnotation(const model::ExecutionResult& result) {
    std::string cause = result.error_summary.value_or("failed");
    return "[ERROR] " + result.title + ": " + cause + "\n";
}

model::Report runReport(const std::vector<Probe*>& probes, ReportSink& sink) {
    model::Report report;
    report.sections.reserve(probes.size());

    for (Probe* probe : probes) {
        sink.write(renderSectionHeader(probe->title()));
        sink.flush();

        auto result = executeSafely(*probe);
        sink.write(ensureTrailingNewline(result.output_text));
        if (result.failed) {
            sink.write(renderErrorAnnotation(result));
        }
        sink.flush();

        report.sections.push_back(std::move(result));
    }

    return report;
}

model::Report runReport(
    const ProbeRegistry& registry,
    const model::Selection& selection,
    ReportSink& sink
) {
    return runReport(selectProbes(registry, selection), sink);
}

} // namespace hostdiag::core
