/**
 * @file system_probe.cpp
 * @brief Раздел SYSTEM: имя хоста, ОС, ядро, время работы, CPU
 */

#include "builtin_probes.hpp"
#include "core/text_utils.hpp"
#include <array>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <sstream>
#include <unistd.h>

namespace hostdiag::probes {
namespace {

using core::Alternative;
using core::FallbackChain;
using core::LineWindow;

/// Аналог `date -Is`: 2026-10-19T10:15:00+03:00
std::string isoTimestampNow() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time_t, &tm);

    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S%z", &tm);
    std::string text(buf);
    // +0300 -> +03:00
    if (text.size() >= 5) {
        text.insert(text.size() - 2, ":");
    }
    return text;
}

std::string hostName() {
    std::array<char, 256> buf{};
    if (::gethostname(buf.data(), buf.size() - 1) != 0 || buf[0] == '\0') {
        return "N/A";
    }
    return std::string(buf.data());
}

/// Значение PRETTY_NAME без кавычек
std::string prettyName(const std::string& os_release) {
    std::istringstream in(os_release);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("PRETTY_NAME=", 0) != 0) {
            continue;
        }
        std::string value = line.substr(12);
        std::string unquoted;
        for (char c : value) {
            if (c != '"') {
                unquoted.push_back(c);
            }
        }
        return unquoted;
    }
    return {};
}

std::string cpuModelName(const std::string& cpuinfo) {
    std::istringstream in(cpuinfo);
    std::string line;
    while (std::getline(in, line)) {
        if (line.find("model name") == std::string::npos) {
            continue;
        }
        auto colon = line.find(':');
        if (colon != std::string::npos) {
            return core::trim(line.substr(colon + 1));
        }
    }
    return {};
}

} // namespace

void SystemProbe::run(core::ProbeOutput& out) {
    const char* user = std::getenv("USER");

    out.line("Hostname: " + hostName());
    out.line(std::string("User: ") + (user && *user ? user : "N/A"));
    out.line("Date: " + isoTimestampNow());
    out.line();

    if (auto os_release = readFile("/etc/os-release")) {
        out.line("OS:");
        out.line(prettyName(*os_release));
    } else {
        out.line("OS: N/A");
    }

    FallbackChain kernel{{
        Alternative::command({"uname", "-srmo"}),
        Alternative::command({"uname", "-a"})
    }, "", true};
    inlineValue(out, "Kernel: ", kernel);

    FallbackChain uptime{{
        Alternative::command({"uptime", "-p"}),
        Alternative::command({"uptime"})
    }, "", true};
    inlineValue(out, "Uptime: ", uptime);
    out.line();

    if (have("lscpu")) {
        out.line("CPU (lscpu):");
        out.addOutcome(runChain(FallbackChain{{
            Alternative::command({"lscpu"}, LineWindow::head(settings_.limits.lscpu))
        }, "lscpu not found."}));
    } else {
        auto cpuinfo = readFile("/proc/cpuinfo");
        out.line("CPU: " + (cpuinfo ? cpuModelName(*cpuinfo) : std::string()));
    }
}

} // namespace hostdiag::probes
