/**
 * @file host_probe.hpp
 * @brief Общая основа проб, опрашивающих текущий хост
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "core/command_runner.hpp"
#include "core/fallback_chain.hpp"
#include "core/probe.hpp"
#include "model/settings.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hostdiag::probes {

/**
 * @brief Проба, работающая через CommandRunner и ProbeSettings.
 *
 * Оба объекта принадлежат вызывающей стороне и должны жить дольше пробы.
 */
class HostProbe : public core::Probe {
public:
    HostProbe(core::CommandRunner& runner, const model::ProbeSettings& settings)
        : runner_(runner)
        , settings_(settings) {}

protected:
    [[nodiscard]] bool have(const std::string& tool) const;

    /// Цепочка с таймаутом из настроек
    [[nodiscard]] core::ChainOutcome runChain(const core::FallbackChain& chain);

    /// Одна команда с таймаутом из настроек
    [[nodiscard]] core::CommandResult runCommand(std::vector<std::string> argv);

    /// Вывести "<label><значение>" одной строкой; N/A если утилит нет
    void inlineValue(core::ProbeOutput& out, const std::string& label, const core::FallbackChain& chain);

    [[nodiscard]] static std::optional<std::string> readFile(const std::filesystem::path& path);

    core::CommandRunner& runner_;
    const model::ProbeSettings& settings_;
};

} // namespace hostdiag::probes
