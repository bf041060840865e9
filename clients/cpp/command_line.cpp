/**
 * @file command_line.cpp
 * @brief Command-line pattern extraction
 */

#include "command_line.hpp"

#include <climits>
#include <cstdlib>
#include <regex>

namespace lsquota {

const char* const kExtensionPortFlag = "--extension_server_port";
const char* const kCsrfTokenFlag = "--csrf_token";

std::string join_arguments(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty()) out.push_back(' ');
        out += arg;
    }
    return out;
}

std::string searchable_text(const std::string& name, const std::string& command_line) {
    return name + " " + command_line;
}

bool is_language_server(const std::string& text, const std::string& process_name) {
    if (process_name.empty() || text.find(process_name) == std::string::npos) return false;
    return text.find(kExtensionPortFlag) != std::string::npos;
}

std::optional<std::string> extract_csrf_token(const std::string& text) {
    static const std::regex pattern(std::string(kCsrfTokenFlag) + R"([=\s]+([a-zA-Z0-9\-]+))");
    std::smatch match;
    if (!std::regex_search(text, match, pattern)) return std::nullopt;
    return match[1].str();
}

int extract_extension_port(const std::string& text) {
    static const std::regex pattern(std::string(kExtensionPortFlag) + R"([=\s]+(\d+))");
    std::smatch match;
    if (!std::regex_search(text, match, pattern)) return 0;
    // Digits only, but may still overflow an int
    long long value = std::strtoll(match[1].str().c_str(), nullptr, 10);
    if (value > INT_MAX) return 0;
    return static_cast<int>(value);
}

} // namespace lsquota
