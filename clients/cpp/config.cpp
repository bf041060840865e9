/**
 * @file config.cpp
 * @brief Environment configuration
 */

#include "config.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace lsquota {

const char* default_process_name() {
#if defined(__linux__)
    return "language_server_linux";
#elif defined(__APPLE__)
    return "language_server_macos";
#elif defined(_WIN32)
    return "language_server_windows";
#else
    return "language_server";
#endif
}

bool parse_timeout(const char* text, std::chrono::milliseconds& out) {
    char* end = nullptr;
    double seconds = std::strtod(text, &end);
    if (end == text || *end != '\0' || std::isnan(seconds) || seconds <= 0.0) return false;

    const double max_ms = static_cast<double>(
        std::chrono::duration_cast<std::chrono::milliseconds>(kMaxTimeout).count());
    double ms = std::min(std::max(seconds * 1000.0, 1.0), max_ms);
    out = std::chrono::milliseconds(static_cast<long long>(ms));
    return true;
}

static const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value && *value) return value;
    return nullptr;
}

Config Config::from_env() {
    Config config;

    if (const char* timeout = env_value("LSQUOTA_TIMEOUT")) {
        if (!parse_timeout(timeout, config.timeout)) {
            log_warn(std::string("Ignoring invalid LSQUOTA_TIMEOUT: ") + timeout);
        }
    }

    if (const char* name = env_value("LSQUOTA_PROCESS_NAME")) {
        config.process_name = name;
    }

    if (const char* root = env_value("LSQUOTA_PROC_ROOT")) {
        config.proc_root = root;
    }

    if (const char* level = env_value("LSQUOTA_LOG_LEVEL")) {
        if (!parse_log_level(level, config.log_level)) {
            log_warn(std::string("Ignoring invalid LSQUOTA_LOG_LEVEL: ") + level);
        }
    }

    return config;
}

} // namespace lsquota
