/**
 * @file darwin_process_table.cpp
 * @brief libproc-backed process introspection for macOS
 */

#include "process_table.hpp"

#include <libproc.h>
#include <sys/proc_info.h>
#include <sys/sysctl.h>
#include <sys/types.h>

#include <algorithm>
#include <cerrno>
#include <utility>

namespace lsquota {

static bool read_procargs(int pid, std::string& buffer) {
    int argmax_mib[2] = {CTL_KERN, KERN_ARGMAX};
    int argmax = 0;
    size_t size = sizeof(argmax);
    if (::sysctl(argmax_mib, 2, &argmax, &size, nullptr, 0) != 0 || argmax <= 0) return false;

    buffer.resize(static_cast<size_t>(argmax));
    int args_mib[3] = {CTL_KERN, KERN_PROCARGS2, pid};
    size = buffer.size();
    if (::sysctl(args_mib, 3, &buffer[0], &size, nullptr, 0) != 0) return false;
    buffer.resize(size);
    return true;
}

std::vector<ProcessEntry> DarwinProcessTable::list_processes() {
    std::vector<ProcessEntry> out;
    int count = ::proc_listallpids(nullptr, 0);
    if (count <= 0) return out;

    // room for processes started between the two calls
    std::vector<pid_t> pids(static_cast<size_t>(count) + 64);
    count = ::proc_listallpids(pids.data(), static_cast<int>(pids.size() * sizeof(pid_t)));
    if (count <= 0) return out;
    pids.resize(std::min(pids.size(), static_cast<size_t>(count)));

    for (pid_t pid : pids) {
        if (pid <= 0) continue;

        ProcessEntry entry;
        entry.pid = pid;

        // Fails for processes of other users and ones that exited meanwhile
        std::string raw;
        if (!read_procargs(pid, raw) || !parse_procargs2(raw, entry.args)) continue;

        char name[256] = {0};
        if (::proc_name(pid, name, sizeof(name)) > 0) entry.name = name;
        out.push_back(std::move(entry));
    }

    std::sort(out.begin(), out.end(),
              [](const ProcessEntry& a, const ProcessEntry& b) { return a.pid < b.pid; });
    return out;
}

ListeningPorts DarwinProcessTable::listening_ports(int pid) {
    ListeningPorts result;

    errno = 0;
    int size = ::proc_pidinfo(pid, PROC_PIDLISTFDS, 0, nullptr, 0);
    if (size <= 0) {
        if (errno != 0) result.error = process_error_from_errno(errno);
        return result;
    }

    std::vector<proc_fdinfo> fds(static_cast<size_t>(size) / sizeof(proc_fdinfo) + 16);
    size = ::proc_pidinfo(pid, PROC_PIDLISTFDS, 0, fds.data(),
                          static_cast<int>(fds.size() * sizeof(proc_fdinfo)));
    if (size <= 0) {
        result.error = process_error_from_errno(errno);
        return result;
    }
    fds.resize(static_cast<size_t>(size) / sizeof(proc_fdinfo));

    std::vector<SocketRow> rows;
    for (const auto& fd : fds) {
        if (fd.proc_fdtype != PROX_FDTYPE_SOCKET) continue;

        socket_fdinfo info{};
        int n = ::proc_pidfdinfo(pid, fd.proc_fd, PROC_PIDFDSOCKETINFO, &info, sizeof(info));
        if (n < static_cast<int>(sizeof(info))) continue; // fd closed meanwhile
        if (info.psi.soi_kind != SOCKINFO_TCP) continue;

        const auto& tcp = info.psi.soi_proto.pri_tcp;
        SocketRow row;
        row.pid = pid;
        row.listening = tcp.tcpsi_state == TSI_S_LISTEN;
        row.local_port = static_cast<uint16_t>(tcp.tcpsi_ini.insi_lport);
        rows.push_back(row);
    }

    collect_listening_ports(rows, pid, result.ports);
    std::sort(result.ports.begin(), result.ports.end());
    result.ports.erase(std::unique(result.ports.begin(), result.ports.end()), result.ports.end());
    return result;
}

} // namespace lsquota
