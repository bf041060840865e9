/**
 * @file config.hpp
 * @brief Runtime configuration read from the environment
 */

#ifndef LSQUOTA_CONFIG_HPP
#define LSQUOTA_CONFIG_HPP

#include "log.hpp"

#include <chrono>
#include <string>

namespace lsquota {

/**
 * @brief Binary-name fragment the Language Server runs under on this OS
 */
const char* default_process_name();

/// Longest accepted request timeout; larger values are clamped to it
constexpr std::chrono::hours kMaxTimeout{24};

/**
 * @brief Parse a timeout given in (possibly fractional) seconds
 *
 * Positive values are clamped to [1 ms, kMaxTimeout].
 *
 * @return false if @p text is not a positive number
 */
bool parse_timeout(const char* text, std::chrono::milliseconds& out);

/**
 * @brief Quota monitor settings
 *
 * | Variable               | Field         |
 * |------------------------|---------------|
 * | LSQUOTA_TIMEOUT        | timeout (s)   |
 * | LSQUOTA_PROCESS_NAME   | process_name  |
 * | LSQUOTA_PROC_ROOT      | proc_root     |
 * | LSQUOTA_LOG_LEVEL      | log_level     |
 */
struct Config {
    std::chrono::milliseconds timeout{30000};
    std::string process_name = default_process_name();
    std::string proc_root;
    LogLevel log_level = LogLevel::Info;

    /**
     * @brief Build a configuration from LSQUOTA_* variables
     *
     * Unparseable values keep their default and are reported as warnings.
     */
    static Config from_env();
};

} // namespace lsquota

#endif // LSQUOTA_CONFIG_HPP
