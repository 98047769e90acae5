/**
 * @file settings_io.cpp
 * @brief Чтение параметров проб из JSON
 */

#include "settings_io.hpp"
#include "core/configuration_error.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace hostdiag::io {

namespace {

using json = nlohmann::json;
using namespace hostdiag::model;

template <typename T>
void readValue(const json& j, const char* key, T& target) {
    if (j.contains(key)) {
        target = j.at(key).get<T>();
    }
}

void readPositive(const json& j, const char* key, int& target) {
    if (!j.contains(key)) {
        return;
    }
    int value = j.at(key).get<int>();
    if (value <= 0) {
        throw core::ConfigurationError(std::string("Setting '") + key + "' must be positive");
    }
    target = value;
}

void readConnectivity(const json& j, ConnectivitySettings& c) {
    readValue(j, "public_target", c.public_target);
    readPositive(j, "ping_count", c.ping_count);
    readPositive(j, "ping_wait_seconds", c.ping_wait_seconds);
    readValue(j, "tcp_host", c.tcp_host);
    if (j.contains("tcp_port")) {
        int port = j.at("tcp_port").get<int>();
        if (port <= 0 || port > 65535) {
            throw core::ConfigurationError("Setting 'tcp_port' is out of range");
        }
        c.tcp_port = static_cast<std::uint16_t>(port);
    }
    readPositive(j, "tcp_timeout_seconds", c.tcp_timeout_seconds);
}

void readLimits(const json& j, LineLimits& l) {
    readValue(j, "lscpu", l.lscpu);
    readValue(j, "meminfo", l.meminfo);
    readValue(j, "processes", l.processes);
    readValue(j, "resolver_status", l.resolver_status);
    readValue(j, "resolve_answers", l.resolve_answers);
    readValue(j, "nslookup", l.nslookup);
    readValue(j, "journal", l.journal);
    readValue(j, "log_tail", l.log_tail);
    readValue(j, "devices", l.devices);
    readValue(j, "dmesg", l.dmesg);
}

ProbeSettings settingsFromJsonObject(const json& j) {
    if (!j.is_object()) {
        throw core::ConfigurationError("Settings root must be a JSON object");
    }

    ProbeSettings settings;
    if (j.contains("connectivity")) {
        readConnectivity(j.at("connectivity"), settings.connectivity);
    }
    if (j.contains("line_limits")) {
        readLimits(j.at("line_limits"), settings.limits);
    }
    readValue(j, "dns_names", settings.dns_names);
    readValue(j, "services", settings.services);
    readValue(j, "log_files", settings.log_files);
    readValue(j, "default_report_file", settings.default_report_file);

    if (j.contains("command_timeout_ms")) {
        int ms = j.at("command_timeout_ms").get<int>();
        if (ms <= 0) {
            throw core::ConfigurationError("Setting 'command_timeout_ms' must be positive");
        }
        settings.command_timeout = std::chrono::milliseconds(ms);
    }
    return settings;
}

} // namespace

ProbeSettings settingsFromJson(const std::string& json_text) {
    try {
        return settingsFromJsonObject(json::parse(json_text));
    } catch (const json::exception& e) {
        throw core::ConfigurationError(std::string("Invalid settings: ") + e.what());
    }
}

ProbeSettings loadSettings(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw core::ConfigurationError("Cannot open settings file: " + path.string());
    }

    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    try {
        return settingsFromJson(buffer.str());
    } catch (const core::ConfigurationError& e) {
        throw core::ConfigurationError(path.string() + ": " + e.what());
    }
}

} // namespace hostdiag::io
