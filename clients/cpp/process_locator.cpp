/**
 * @file process_locator.cpp
 * @brief Language Server detection
 */

#include "process_locator.hpp"
#include "command_line.hpp"
#include "log.hpp"

#include <sstream>

namespace lsquota {

static std::string format_ports(const std::vector<int>& ports) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < ports.size(); ++i) {
        if (i) ss << ", ";
        ss << ports[i];
    }
    ss << "]";
    return ss.str();
}

ProcessLocator::ProcessLocator(ProcessTable& table, PortProbe& probe, std::string process_name)
    : table_(table), probe_(probe), process_name_(std::move(process_name)) {}

std::vector<ProcessCandidate> ProcessLocator::find_candidates() {
    std::vector<ProcessCandidate> candidates;

    for (const auto& proc : table_.list_processes()) {
        std::string cmd = join_arguments(proc.args);
        std::string text = searchable_text(proc.name, cmd);
        if (!is_language_server(text, process_name_)) continue;

        auto token = extract_csrf_token(cmd);
        if (!token) {
            log_debug("pid=" + std::to_string(proc.pid) + " has no CSRF token, skipping");
            continue;
        }

        auto sockets = table_.listening_ports(proc.pid);
        if (sockets.error != ProcessError::None) {
            log_debug("pid=" + std::to_string(proc.pid) + " socket lookup failed: " +
                      to_string(sockets.error));
            if (scan_action(sockets.error) == ScanAction::AbortScan) break;
            continue;
        }

        ProcessCandidate candidate;
        candidate.pid = proc.pid;
        candidate.command_line = cmd;
        candidate.csrf_token = *token;
        candidate.extension_port = extract_extension_port(cmd);
        candidate.listening_ports = sockets.ports;
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

std::optional<Connection> ProcessLocator::locate() {
    log_info("Scanning for Language Server process: " + process_name_);

    for (const auto& candidate : find_candidates()) {
        log_info("Found Language Server pid=" + std::to_string(candidate.pid) +
                 " token=" + fingerprint(candidate.csrf_token) +
                 ", testing ports: " + format_ports(candidate.listening_ports));

        for (int port : candidate.listening_ports) {
            if (!probe_.probe(port, candidate.csrf_token)) continue;

            Connection connection;
            connection.port = port;
            connection.csrf_token = candidate.csrf_token;
            connection.pid = candidate.pid;
            connection.extension_port = candidate.extension_port;
            log_info("Connected to Language Server on port " + std::to_string(port));
            return connection;
        }
    }

    log_warn("Language Server not found");
    return std::nullopt;
}

} // namespace lsquota
