/**
 * @file log.cpp
 * @brief Line logger implementation
 */

#include "log.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace lsquota {

static const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

bool parse_log_level(const std::string& text, LogLevel& level) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") {
        level = LogLevel::Debug;
    } else if (lower == "info") {
        level = LogLevel::Info;
    } else if (lower == "warn" || lower == "warning") {
        level = LogLevel::Warn;
    } else if (lower == "error") {
        level = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mtx_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return level_;
}

void Logger::set_sink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(mtx_);
    sink_ = sink;
}

void Logger::log(LogLevel level, const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto tt = std::chrono::system_clock::to_time_t(now);
    std::tm tmv{};
#ifdef _WIN32
    localtime_s(&tmv, &tt);
#else
    localtime_r(&tt, &tmv);
#endif

    std::lock_guard<std::mutex> lock(mtx_);
    if (level < level_) return;

    std::ostream& out = sink_ ? *sink_ : std::cerr;
    out << std::put_time(&tmv, "%Y-%m-%d %H:%M:%S")
        << " [" << level_name(level) << "] lsquota: " << msg << "\n";
    out.flush();
}

std::string fingerprint(const std::string& secret) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(secret.data()), secret.size(), digest);

    std::stringstream ss;
    ss << "sha256:";
    for (int i = 0; i < 4; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)digest[i];
    }
    return ss.str();
}

} // namespace lsquota
