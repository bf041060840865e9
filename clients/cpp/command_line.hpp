/**
 * @file command_line.hpp
 * @brief Recognize the Language Server by its command line and pull out its credentials
 */

#ifndef LSQUOTA_COMMAND_LINE_HPP
#define LSQUOTA_COMMAND_LINE_HPP

#include <optional>
#include <string>
#include <vector>

namespace lsquota {

// Flag whose presence marks a Language Server with the control port enabled
extern const char* const kExtensionPortFlag;
extern const char* const kCsrfTokenFlag;

/**
 * @brief Join argv-style arguments with single spaces
 */
std::string join_arguments(const std::vector<std::string>& args);

/**
 * @brief Searchable text for a process: its name, a space, its command line
 */
std::string searchable_text(const std::string& name, const std::string& command_line);

/**
 * @brief Whether @p text names the target binary and carries the port flag
 */
bool is_language_server(const std::string& text, const std::string& process_name);

/**
 * @brief Extract the value of --csrf_token
 *
 * The flag must be followed by '=' or whitespace and a run of letters,
 * digits or hyphens. The first occurrence wins.
 */
std::optional<std::string> extract_csrf_token(const std::string& text);

/**
 * @brief Extract the value of --extension_server_port, 0 when absent
 */
int extract_extension_port(const std::string& text);

} // namespace lsquota

#endif // LSQUOTA_COMMAND_LINE_HPP
