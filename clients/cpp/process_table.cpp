/**
 * @file process_table.cpp
 * @brief Platform-independent parts of process introspection
 */

#include "process_table.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

namespace lsquota {

ScanAction scan_action(ProcessError error) {
    switch (error) {
        case ProcessError::None:
        case ProcessError::AccessDenied:
        case ProcessError::NoSuchProcess:
        case ProcessError::Unreadable:
            return ScanAction::SkipCandidate;
    }
    return ScanAction::SkipCandidate;
}

const char* to_string(ProcessError error) {
    switch (error) {
        case ProcessError::None:          return "none";
        case ProcessError::AccessDenied:  return "access denied";
        case ProcessError::NoSuchProcess: return "no such process";
        case ProcessError::Unreadable:    return "unreadable";
    }
    return "unknown";
}

ProcessError process_error_from_errno(int err) {
    switch (err) {
        case EACCES:
        case EPERM:
            return ProcessError::AccessDenied;
        case ENOENT:
        case ESRCH:
            return ProcessError::NoSuchProcess;
        default:
            return ProcessError::Unreadable;
    }
}

int port_from_network_order(uint16_t raw) {
    unsigned char bytes[sizeof(raw)];
    std::memcpy(bytes, &raw, sizeof(raw));
    return (bytes[0] << 8) | bytes[1];
}

void collect_listening_ports(const std::vector<SocketRow>& rows, int pid, std::vector<int>& out) {
    for (const auto& row : rows) {
        if (row.pid != pid || !row.listening) continue;
        int port = port_from_network_order(row.local_port);
        if (port == 0) continue;
        out.push_back(port);
    }
}

bool parse_procargs2(const std::string& buffer, std::vector<std::string>& args) {
    int argc = 0;
    if (buffer.size() < sizeof(argc)) return false;
    std::memcpy(&argc, buffer.data(), sizeof(argc));
    if (argc < 0) return false;

    // executable path, then NUL padding up to the first argument
    size_t pos = buffer.find('\0', sizeof(argc));
    if (pos == std::string::npos) return false;
    while (pos < buffer.size() && buffer[pos] == '\0') ++pos;

    std::vector<std::string> parsed;
    for (int i = 0; i < argc; ++i) {
        size_t end = buffer.find('\0', pos);
        if (pos >= buffer.size() || end == std::string::npos) return false;
        parsed.push_back(buffer.substr(pos, end - pos));
        pos = end + 1;
    }
    args = std::move(parsed);
    return true;
}

std::unique_ptr<ProcessTable> make_process_table(const std::string& proc_root) {
#if defined(_WIN32)
    (void)proc_root;
    return std::make_unique<WindowsProcessTable>();
#elif defined(__APPLE__)
    if (!proc_root.empty()) return std::make_unique<ProcfsProcessTable>(proc_root);
    return std::make_unique<DarwinProcessTable>();
#else
    return std::make_unique<ProcfsProcessTable>(proc_root);
#endif
}

} // namespace lsquota
