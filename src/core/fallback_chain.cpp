/**
 * @file fallback_chain.cpp
 * @brief Выполнение цепочек альтернативных утилит
 */

#include "fallback_chain.hpp"
#include <fstream>
#include <optional>
#include <sstream>

namespace hostdiag::core {

namespace {

std::optional<std::string> readWholeFile(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

/// "tool: cause", если утилита ещё не назвала себя в начале сообщения
std::string withToolPrefix(const std::string& tool, const std::string& cause) {
    const std::string prefix = tool + ":";
    if (cause.compare(0, prefix.size(), prefix) == 0) {
        return cause;
    }
    return tool + ": " + cause;
}

} // namespace

std::string summarizeFailure(const CommandResult& result) {
    auto line = firstNonEmptyLine(result.err);
    if (!line.empty()) {
        return line;
    }
    if (result.timed_out) {
        return "timed out";
    }
    return "exit code " + std::to_string(result.exit_code);
}

ChainOutcome runChain(
    const FallbackChain& chain,
    CommandRunner& runner,
    std::chrono::milliseconds timeout
) {
    ChainOutcome outcome;
    bool attempted = false;

    for (const auto& alt : chain.alternatives) {
        if (alt.isFile()) {
            if (alt.file.empty()) {
                continue;
            }
            auto content = readWholeFile(alt.file);
            if (!content.has_value()) {
                continue;
            }
            outcome.status = ChainStatus::Succeeded;
            outcome.text = applyLineWindow(*content, alt.window);
            outcome.error.clear();
            outcome.tool = alt.file.string();
            return outcome;
        }

        if (!runner.isAvailable(alt.argv.front())) {
            continue;
        }

        CommandResult result = runner.run(CommandSpec{alt.argv, timeout});
        if (!result.launched) {
            // Утилита пропала между проверкой и запуском - как отсутствующая
            continue;
        }
        attempted = true;

        outcome.text = applyLineWindow(result.out, alt.window);
        outcome.tool = alt.argv.front();

        if (result.succeeded()) {
            outcome.status = ChainStatus::Succeeded;
            outcome.error.clear();
            return outcome;
        }

        outcome.status = ChainStatus::Failed;
        outcome.error = withToolPrefix(alt.argv.front(), summarizeFailure(result));
        if (!chain.fall_through_on_failure) {
            return outcome;
        }
    }

    if (attempted) {
        return outcome;
    }

    outcome.status = ChainStatus::Unavailable;
    outcome.tool.clear();
    outcome.error.clear();
    outcome.text = ensureTrailingNewline(chain.unavailable_message);
    return outcome;
}

} // namespace hostdiag::core
