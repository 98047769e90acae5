/**
 * @file dns_probe.cpp
 * @brief Раздел DNS: серверы имён и разрешение контрольных имён
 */

#include "builtin_probes.hpp"
#include "core/text_utils.hpp"
#include <sstream>

namespace hostdiag::probes {
namespace {

using core::Alternative;
using core::FallbackChain;
using core::LineWindow;

/// Строки nameserver из resolv.conf
std::string nameserverLines(const std::string& resolv_conf) {
    std::istringstream in(resolv_conf);
    std::string line;
    std::string result;
    while (std::getline(in, line)) {
        if (core::trim(line).rfind("nameserver", 0) == 0) {
            result += line + "\n";
        }
    }
    return result;
}

} // namespace

void DnsProbe::run(core::ProbeOutput& out) {
    const auto& limits = settings_.limits;

    out.line("DNS servers:");
    auto status = runChain(FallbackChain{{
        Alternative::command({"resolvectl", "status"}, LineWindow::head(limits.resolver_status)),
        Alternative::command({"systemd-resolve", "--status"}, LineWindow::head(limits.resolver_status))
    }, ""});

    if (status.status == core::ChainStatus::Unavailable) {
        auto resolv = readFile("/etc/resolv.conf");
        std::string servers = resolv ? nameserverLines(*resolv) : std::string();
        out.append(servers.empty() ? std::string("N/A\n") : servers);
    } else {
        out.addOutcome(status);
    }
    out.line();

    for (const auto& host : settings_.dns_names) {
        out.line("Resolve: " + host);
        out.addOutcome(runChain(FallbackChain{{
            Alternative::command({"dig", "+short", host}, LineWindow::head(limits.resolve_answers)),
            Alternative::command({"nslookup", host}, LineWindow::head(limits.nslookup)),
            Alternative::command({"getent", "ahosts", host}, LineWindow::head(limits.resolve_answers))
        }, "No resolver tool found."}));
        out.line();
    }
}

} // namespace hostdiag::probes
