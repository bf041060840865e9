/**
 * @file process_table.hpp
 * @brief OS process and listening-socket introspection
 */

#ifndef LSQUOTA_PROCESS_TABLE_HPP
#define LSQUOTA_PROCESS_TABLE_HPP

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace lsquota {

/**
 * @brief Failure of a per-process introspection call
 */
enum class ProcessError {
    None,
    AccessDenied,
    NoSuchProcess,
    Unreadable
};

/**
 * @brief What a scan does when introspecting one candidate fails
 */
enum class ScanAction {
    SkipCandidate,
    AbortScan
};

/**
 * @brief Policy table mapping introspection errors to scan actions
 *
 * | Error          | Action         |
 * |----------------|----------------|
 * | AccessDenied   | SkipCandidate  |
 * | NoSuchProcess  | SkipCandidate  |
 * | Unreadable     | SkipCandidate  |
 */
ScanAction scan_action(ProcessError error);

const char* to_string(ProcessError error);

/**
 * @brief Maps an errno value from a failed OS call to a ProcessError
 */
ProcessError process_error_from_errno(int err);

struct ProcessEntry {
    int pid = 0;
    std::string name;
    std::vector<std::string> args;
};

struct ListeningPorts {
    std::vector<int> ports; // sorted, unique
    ProcessError error = ProcessError::None;
};

/**
 * @brief Source of process information
 *
 * Implementations may block on OS calls.
 */
class ProcessTable {
public:
    virtual ~ProcessTable() = default;

    /**
     * @brief Snapshot of all processes visible to this user
     *
     * Processes that vanish while being read are left out.
     */
    virtual std::vector<ProcessEntry> list_processes() = 0;

    /**
     * @brief TCP ports (IPv4 and IPv6) on which @p pid is listening
     */
    virtual ListeningPorts listening_ports(int pid) = 0;
};

#ifndef _WIN32
/**
 * @brief ProcessTable backed by Linux procfs
 *
 * Reads /proc/<pid>/{comm,cmdline,fd,net/tcp,net/tcp6}. A non-empty
 * @p proc_root is prepended to every /proc path.
 */
class ProcfsProcessTable : public ProcessTable {
public:
    explicit ProcfsProcessTable(std::string proc_root = std::string());

    std::vector<ProcessEntry> list_processes() override;
    ListeningPorts listening_ports(int pid) override;

private:
    std::string proc_path(const std::string& rel) const;

    std::string proc_root_;
};
#endif

#ifdef __APPLE__
/**
 * @brief ProcessTable backed by libproc and sysctl(KERN_PROCARGS2)
 */
class DarwinProcessTable : public ProcessTable {
public:
    std::vector<ProcessEntry> list_processes() override;
    ListeningPorts listening_ports(int pid) override;
};
#endif

#ifdef _WIN32
/**
 * @brief ProcessTable backed by Toolhelp32 snapshots and the IP Helper TCP tables
 *
 * Command lines are read with NtQueryInformationProcess. Processes of other
 * users usually deny that and are listed with their image name only.
 */
class WindowsProcessTable : public ProcessTable {
public:
    std::vector<ProcessEntry> list_processes() override;
    ListeningPorts listening_ports(int pid) override;
};
#endif

/**
 * @brief The ProcessTable for the platform this was built for
 *
 * A non-empty @p proc_root selects the procfs table rooted there on any
 * POSIX platform. It is ignored on Windows.
 */
std::unique_ptr<ProcessTable> make_process_table(const std::string& proc_root);

/**
 * @brief Listening ports from a /proc/net/tcp style table owned by @p inodes
 *
 * Only rows in state LISTEN (0A) whose inode is in @p inodes are kept.
 * Ports are appended to @p out unsorted.
 */
void parse_tcp_table(const std::string& content, const std::set<unsigned long>& inodes,
                     std::vector<int>& out);

/**
 * @brief One TCP socket as reported by a platform socket table
 */
struct SocketRow {
    int pid = 0;
    bool listening = false;
    uint16_t local_port = 0; // network byte order, as the OS stores it
};

/**
 * @brief Host value of a port stored in network byte order
 */
int port_from_network_order(uint16_t raw);

/**
 * @brief Appends the listening ports of @p pid in @p rows to @p out, unsorted
 *
 * Rows of other processes, sockets not in LISTEN and port 0 are skipped.
 */
void collect_listening_ports(const std::vector<SocketRow>& rows, int pid, std::vector<int>& out);

/**
 * @brief Arguments from a KERN_PROCARGS2 buffer
 *
 * The buffer is an int argc, the executable path, NUL padding, then argc
 * NUL-terminated arguments followed by the environment.
 *
 * @return false if the buffer is truncated or malformed
 */
bool parse_procargs2(const std::string& buffer, std::vector<std::string>& args);

} // namespace lsquota

#endif // LSQUOTA_PROCESS_TABLE_HPP
