/**
 * @file procfs_process_table.cpp
 * @brief procfs-backed process introspection
 */

#include "process_table.hpp"

#include <sys/types.h>
#include <dirent.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace lsquota {

static bool all_digits(const char* s) {
    if (!*s) return false;
    for (; *s; ++s) {
        if (!std::isdigit(static_cast<unsigned char>(*s))) return false;
    }
    return true;
}

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    out.assign((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return !in.bad();
}

// cmdline is NUL separated with a trailing NUL
static std::vector<std::string> split_cmdline(const std::string& raw) {
    std::vector<std::string> args;
    std::string current;
    for (char c : raw) {
        if (c == '\0') {
            args.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) args.push_back(current);
    while (!args.empty() && args.back().empty()) args.pop_back();
    return args;
}

// "socket:[12345]" -> 12345
static bool socket_inode(const std::string& link, unsigned long& inode) {
    static const char prefix[] = "socket:[";
    if (link.compare(0, sizeof(prefix) - 1, prefix) != 0 || link.back() != ']') return false;
    std::string digits = link.substr(sizeof(prefix) - 1, link.size() - sizeof(prefix));
    if (!all_digits(digits.c_str())) return false;
    inode = std::strtoul(digits.c_str(), nullptr, 10);
    return true;
}

void parse_tcp_table(const std::string& content, const std::set<unsigned long>& inodes,
                     std::vector<int>& out) {
    std::istringstream ss(content);
    std::string line;
    std::getline(ss, line); // header
    while (std::getline(ss, line)) {
        std::istringstream fields(line);
        std::string sl, local, remote, state, tx_rx, tr_tm, retrnsmt, uid, timeout;
        unsigned long inode = 0;
        if (!(fields >> sl >> local >> remote >> state >> tx_rx >> tr_tm >> retrnsmt >> uid >> timeout >> inode)) {
            continue;
        }
        if (state != "0A") continue; // TCP_LISTEN
        if (inodes.count(inode) == 0) continue;

        auto colon = local.rfind(':');
        if (colon == std::string::npos) continue;
        char* end = nullptr;
        unsigned long port = std::strtoul(local.c_str() + colon + 1, &end, 16);
        if (!end || *end != '\0' || port == 0 || port > 65535) continue;
        out.push_back(static_cast<int>(port));
    }
}

ProcfsProcessTable::ProcfsProcessTable(std::string proc_root)
    : proc_root_(std::move(proc_root)) {}

std::string ProcfsProcessTable::proc_path(const std::string& rel) const {
    std::string path = proc_root_;
    while (!path.empty() && path.back() == '/') path.pop_back();
    return path + "/proc" + rel;
}

std::vector<ProcessEntry> ProcfsProcessTable::list_processes() {
    std::vector<ProcessEntry> out;
    std::string root = proc_path("");
    DIR* d = ::opendir(root.c_str());
    if (!d) return out;

    while (auto* ent = ::readdir(d)) {
        if (!all_digits(ent->d_name)) continue;
        std::string base = std::string("/") + ent->d_name;

        ProcessEntry entry;
        entry.pid = std::atoi(ent->d_name);

        std::string raw;
        if (!read_file(proc_path(base + "/cmdline"), raw)) continue; // vanished
        entry.args = split_cmdline(raw);

        if (read_file(proc_path(base + "/comm"), entry.name)) {
            while (!entry.name.empty() && (entry.name.back() == '\n' || entry.name.back() == '\0')) {
                entry.name.pop_back();
            }
        }
        out.push_back(std::move(entry));
    }
    ::closedir(d);

    std::sort(out.begin(), out.end(),
              [](const ProcessEntry& a, const ProcessEntry& b) { return a.pid < b.pid; });
    return out;
}

ListeningPorts ProcfsProcessTable::listening_ports(int pid) {
    ListeningPorts result;
    std::string base = "/" + std::to_string(pid);
    std::string fd_dir = proc_path(base + "/fd");

    DIR* d = ::opendir(fd_dir.c_str());
    if (!d) {
        result.error = process_error_from_errno(errno);
        return result;
    }

    std::set<unsigned long> inodes;
    char buf[4096];
    while (auto* ent = ::readdir(d)) {
        if (!all_digits(ent->d_name)) continue;
        std::string link_path = fd_dir + "/" + ent->d_name;
        ssize_t n = ::readlink(link_path.c_str(), buf, sizeof(buf) - 1);
        if (n <= 0) continue; // fd closed meanwhile
        unsigned long inode = 0;
        if (socket_inode(std::string(buf, static_cast<size_t>(n)), inode)) {
            inodes.insert(inode);
        }
    }
    ::closedir(d);

    if (inodes.empty()) return result;

    bool any_table = false;
    for (const char* table : {"/net/tcp", "/net/tcp6"}) {
        std::string content;
        if (!read_file(proc_path(base + table), content)) continue;
        any_table = true;
        parse_tcp_table(content, inodes, result.ports);
    }
    if (!any_table) {
        result.error = ::access(proc_path(base).c_str(), F_OK) == 0
            ? ProcessError::Unreadable
            : ProcessError::NoSuchProcess;
        return result;
    }

    std::sort(result.ports.begin(), result.ports.end());
    result.ports.erase(std::unique(result.ports.begin(), result.ports.end()), result.ports.end());
    return result;
}

} // namespace lsquota
