/**
 * @file log.hpp
 * @brief Line logger for the quota monitor
 */

#ifndef LSQUOTA_LOG_HPP
#define LSQUOTA_LOG_HPP

#include <mutex>
#include <ostream>
#include <string>

namespace lsquota {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

/**
 * @brief Parse "debug", "info", "warn"/"warning" or "error" (any case)
 * @return true if @p text named a level
 */
bool parse_log_level(const std::string& text, LogLevel& level);

/**
 * @brief Process-wide logger
 *
 * Writes "YYYY-MM-DD HH:MM:SS [LEVEL] lsquota: message" lines to stderr,
 * or to the sink installed with set_sink().
 */
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Passing nullptr restores stderr. The sink must outlive its use.
    void set_sink(std::ostream* sink);

    void log(LogLevel level, const std::string& msg);

private:
    Logger() = default;

    mutable std::mutex mtx_;
    LogLevel level_ = LogLevel::Info;
    std::ostream* sink_ = nullptr;
};

inline void log_debug(const std::string& msg) { Logger::instance().log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)  { Logger::instance().log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { Logger::instance().log(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { Logger::instance().log(LogLevel::Error, msg); }

/**
 * @brief Short SHA-256 fingerprint of a secret, safe to log
 *
 * @return "sha256:" followed by the first 8 hex digits of the digest
 */
std::string fingerprint(const std::string& secret);

} // namespace lsquota

#endif // LSQUOTA_LOG_HPP
