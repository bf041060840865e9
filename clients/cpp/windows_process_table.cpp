/**
 * @file windows_process_table.cpp
 * @brief Toolhelp32 and IP Helper backed process introspection for Windows
 */

#include "process_table.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#include <ws2tcpip.h> // MIB_TCP6TABLE_OWNER_PID
#include <windows.h>
#include <iphlpapi.h>
#include <shellapi.h>
#include <tlhelp32.h>

#include <algorithm>
#include <utility>

namespace lsquota {

namespace {

// UNICODE_STRING as returned for ProcessCommandLineInformation
struct CommandLineInfo {
    USHORT Length;
    USHORT MaximumLength;
    PWSTR Buffer;
};

using NtQueryInformationProcessFn = LONG(NTAPI*)(HANDLE, ULONG, PVOID, ULONG, PULONG);

constexpr ULONG kProcessCommandLineInformation = 60;
constexpr LONG kStatusInfoLengthMismatch = static_cast<LONG>(0xC0000004);

NtQueryInformationProcessFn nt_query_information_process() {
    static NtQueryInformationProcessFn fn = []() -> NtQueryInformationProcessFn {
        HMODULE ntdll = ::GetModuleHandleW(L"ntdll.dll");
        if (!ntdll) return nullptr;
        return reinterpret_cast<NtQueryInformationProcessFn>(
            reinterpret_cast<void*>(::GetProcAddress(ntdll, "NtQueryInformationProcess")));
    }();
    return fn;
}

std::string narrow(const wchar_t* text, int length = -1) {
    int size = ::WideCharToMultiByte(CP_UTF8, 0, text, length, nullptr, 0, nullptr, nullptr);
    if (size <= 0) return std::string();
    std::string out(static_cast<size_t>(size), '\0');
    ::WideCharToMultiByte(CP_UTF8, 0, text, length, &out[0], size, nullptr, nullptr);
    if (length < 0 && !out.empty() && out.back() == '\0') out.pop_back();
    return out;
}

bool read_command_line(DWORD pid, std::wstring& out) {
    auto query = nt_query_information_process();
    if (!query) return false;

    HANDLE process = ::OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid);
    if (!process) return false;

    std::vector<unsigned char> buffer(1024);
    ULONG needed = 0;
    LONG status = query(process, kProcessCommandLineInformation, buffer.data(),
                        static_cast<ULONG>(buffer.size()), &needed);
    if (status == kStatusInfoLengthMismatch && needed > buffer.size()) {
        buffer.resize(needed);
        status = query(process, kProcessCommandLineInformation, buffer.data(),
                       static_cast<ULONG>(buffer.size()), &needed);
    }
    ::CloseHandle(process);
    if (status < 0) return false;

    const auto* info = reinterpret_cast<const CommandLineInfo*>(buffer.data());
    if (!info->Buffer || info->Length == 0) return false;
    out.assign(info->Buffer, info->Length / sizeof(wchar_t));
    return true;
}

std::vector<std::string> split_command_line(const std::wstring& command_line) {
    std::vector<std::string> args;
    int argc = 0;
    LPWSTR* argv = ::CommandLineToArgvW(command_line.c_str(), &argc);
    if (!argv) return args;
    for (int i = 0; i < argc; ++i) args.push_back(narrow(argv[i]));
    ::LocalFree(argv);
    return args;
}

bool read_listener_table(ULONG family, std::vector<unsigned char>& buffer) {
    DWORD size = 0;
    DWORD rc = ::GetExtendedTcpTable(nullptr, &size, FALSE, family, TCP_TABLE_OWNER_PID_LISTENER, 0);
    // The table may grow between the size query and the read
    for (int attempt = 0; attempt < 3 && rc == ERROR_INSUFFICIENT_BUFFER; ++attempt) {
        buffer.resize(size);
        rc = ::GetExtendedTcpTable(buffer.data(), &size, FALSE, family, TCP_TABLE_OWNER_PID_LISTENER, 0);
    }
    return rc == NO_ERROR && buffer.size() >= sizeof(DWORD);
}

template <typename Row>
SocketRow socket_row(const Row& row) {
    SocketRow out;
    out.pid = static_cast<int>(row.dwOwningPid);
    out.listening = row.dwState == MIB_TCP_STATE_LISTEN;
    out.local_port = static_cast<uint16_t>(row.dwLocalPort);
    return out;
}

} // namespace

std::vector<ProcessEntry> WindowsProcessTable::list_processes() {
    std::vector<ProcessEntry> out;
    HANDLE snapshot = ::CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
    if (snapshot == INVALID_HANDLE_VALUE) return out;

    PROCESSENTRY32W entry{};
    entry.dwSize = sizeof(entry);
    if (::Process32FirstW(snapshot, &entry)) {
        do {
            if (entry.th32ProcessID == 0) continue; // System Idle Process

            ProcessEntry process;
            process.pid = static_cast<int>(entry.th32ProcessID);
            process.name = narrow(entry.szExeFile);

            std::wstring command_line;
            if (read_command_line(entry.th32ProcessID, command_line)) {
                process.args = split_command_line(command_line);
            }
            out.push_back(std::move(process));
        } while (::Process32NextW(snapshot, &entry));
    }
    ::CloseHandle(snapshot);

    std::sort(out.begin(), out.end(),
              [](const ProcessEntry& a, const ProcessEntry& b) { return a.pid < b.pid; });
    return out;
}

ListeningPorts WindowsProcessTable::listening_ports(int pid) {
    ListeningPorts result;
    std::vector<SocketRow> rows;
    bool any_table = false;

    std::vector<unsigned char> buffer;
    if (read_listener_table(AF_INET, buffer)) {
        any_table = true;
        const auto* table = reinterpret_cast<const MIB_TCPTABLE_OWNER_PID*>(buffer.data());
        for (DWORD i = 0; i < table->dwNumEntries; ++i) rows.push_back(socket_row(table->table[i]));
    }

    buffer.clear();
    if (read_listener_table(AF_INET6, buffer)) {
        any_table = true;
        const auto* table = reinterpret_cast<const MIB_TCP6TABLE_OWNER_PID*>(buffer.data());
        for (DWORD i = 0; i < table->dwNumEntries; ++i) rows.push_back(socket_row(table->table[i]));
    }

    if (!any_table) {
        result.error = ProcessError::Unreadable;
        return result;
    }

    collect_listening_ports(rows, pid, result.ports);
    std::sort(result.ports.begin(), result.ports.end());
    result.ports.erase(std::unique(result.ports.begin(), result.ports.end()), result.ports.end());
    return result;
}

} // namespace lsquota
