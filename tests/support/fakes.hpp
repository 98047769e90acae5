/**
 * @file fakes.hpp
 * @brief Подставные пробы и исполнитель команд для тестов
 */

#pragma once

#include "core/command_runner.hpp"
#include "core/probe.hpp"
#include "core/probe_registry.hpp"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hostdiag::testing {

/**
 * @brief Проба с заранее заданным выводом
 */
class FakeProbe : public core::Probe {
public:
    FakeProbe(std::string name, std::string title, std::string text)
        : name_(std::move(name))
        , title_(std::move(title))
        , text_(std::move(text)) {}

    FakeProbe& failWith(std::string error) {
        error_ = std::move(error);
        return *this;
    }

    FakeProbe& throwAfterOutput(std::string message) {
        throw_message_ = std::move(message);
        return *this;
    }

    std::string_view name() const noexcept override { return name_; }
    std::string_view title() const noexcept override { return title_; }

    void run(core::ProbeOutput& out) override {
        ++runs;
        out.append(text_);
        if (error_) {
            out.fail(*error_);
        }
        if (throw_message_) {
            throw std::runtime_error(*throw_message_);
        }
    }

    int runs = 0;

private:
    std::string name_;
    std::string title_;
    std::string text_;
    std::optional<std::string> error_;
    std::optional<std::string> throw_message_;
};

/// Имена канонических разделов в порядке реестра
inline const std::vector<std::string>& canonicalNames() {
    static const std::vector<std::string> names{
        "system", "performance", "disk", "network", "connectivity",
        "dns", "services", "logs", "hardware"
    };
    return names;
}

/**
 * @brief Реестр из девяти подставных проб с выводом "<name> output\n"
 */
inline core::ProbeRegistry makeFakeRegistry() {
    core::ProbeRegistry registry;
    for (const auto& name : canonicalNames()) {
        std::string title;
        for (char c : name) {
            title.push_back(static_cast<char>(c - 'a' + 'A'));
        }
        registry.add(std::make_unique<FakeProbe>(name, title, name + " output\n"));
    }
    return registry;
}

/**
 * @brief Исполнитель команд по сценарию.
 *
 * Ключ сценария - argv, склеенный через пробел. Команды без сценария
 * завершаются успешно с пустым выводом.
 */
class FakeCommandRunner : public core::CommandRunner {
public:
    FakeCommandRunner& install(const std::string& tool) {
        tools.insert(tool);
        return *this;
    }

    FakeCommandRunner& script(const std::string& command_line, core::CommandResult result) {
        result.launched = true;
        scripts[command_line] = std::move(result);
        return *this;
    }

    FakeCommandRunner& succeed(const std::string& command_line, const std::string& out) {
        core::CommandResult r;
        r.exit_code = 0;
        r.out = out;
        return script(command_line, r);
    }

    FakeCommandRunner& failExit(const std::string& command_line, int code, const std::string& err) {
        core::CommandResult r;
        r.exit_code = code;
        r.err = err;
        return script(command_line, r);
    }

    core::CommandResult run(const core::CommandSpec& spec) override {
        std::string key;
        for (const auto& arg : spec.argv) {
            if (!key.empty()) {
                key += ' ';
            }
            key += arg;
        }
        calls.push_back(key);

        auto it = scripts.find(key);
        if (it != scripts.end()) {
            return it->second;
        }
        core::CommandResult ok;
        ok.launched = true;
        ok.exit_code = 0;
        return ok;
    }

    bool isAvailable(const std::string& tool) const override {
        return tools.count(tool) > 0;
    }

    std::set<std::string> tools;
    std::map<std::string, core::CommandResult> scripts;
    std::vector<std::string> calls;
};

} // namespace hostdiag::testing
