/**
 * @file quota_types.hpp
 * @brief Data model and exceptions shared by the quota monitor core
 *
 * Types describing a discovered Language Server process, the validated
 * connection to its control API and the normalized quota report.
 */

#ifndef LSQUOTA_QUOTA_TYPES_HPP
#define LSQUOTA_QUOTA_TYPES_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>

namespace lsquota {

/**
 * @brief A process that looks like the Language Server
 *
 * Produced fresh on every detection pass, never persisted.
 */
struct ProcessCandidate {
    int pid = 0;
    std::string command_line;
    std::string csrf_token;
    int extension_port = 0;          // advertised on the command line, informational
    std::vector<int> listening_ports; // sorted, unique
};

/**
 * @brief A validated connection to the Language Server API
 *
 * Only built after a successful probe on @c port.
 */
struct Connection {
    int port = 0;
    std::string csrf_token;
    int pid = 0;
    int extension_port = 0;
};

/**
 * @brief Prompt or flow credit usage
 */
struct CreditBlock {
    int64_t available = 0;
    int64_t monthly = 0;
    int64_t used = 0;
    double used_percentage = 0.0;
    double remaining_percentage = 0.0;
};

/**
 * @brief Quota state of a single model
 */
struct ModelQuota {
    std::string label;
    std::string model_id;
    std::optional<double> remaining_fraction;
    std::optional<double> remaining_percentage;
    std::optional<double> used_percentage;
    bool is_exhausted = false;
    std::string reset_time_iso;
    int64_t time_until_reset_ms = 0;
};

/**
 * @brief Models sharing the same reset time and remaining fraction
 *
 * Quota fields are copied from the first member.
 */
struct QuotaPool {
    std::string name;
    std::vector<ModelQuota> models;
    std::size_t model_count = 0;
    std::optional<double> remaining_fraction;
    std::optional<double> remaining_percentage;
    std::optional<double> used_percentage;
    bool is_exhausted = false;
    std::string reset_time_iso;
    int64_t time_until_reset_ms = 0;
};

/**
 * @brief Normalized quota report
 */
struct QuotaReport {
    std::string timestamp;
    std::string plan_name;
    std::string plan_tier;
    std::optional<CreditBlock> prompt_credits;
    std::optional<CreditBlock> flow_credits;
    std::vector<ModelQuota> models;
    std::vector<QuotaPool> pools;
    std::string user_name;
    std::string user_email;
};

/**
 * @brief Outcome category of a failed report request
 */
enum class ErrorKind {
    NotFound,
    RemoteError,
    MalformedUpstream
};

const char* to_string(ErrorKind kind);

/**
 * @brief Base exception for quota operations
 */
class QuotaException : public std::runtime_error {
public:
    QuotaException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Thrown when no Language Server process answers on any port
 */
class LanguageServerNotFoundException : public QuotaException {
public:
    LanguageServerNotFoundException()
        : QuotaException(ErrorKind::NotFound,
                         "Language Server not found. Is Antigravity running?") {}
};

/**
 * @brief Thrown when the authenticated API call fails
 */
class RemoteException : public QuotaException {
public:
    explicit RemoteException(const std::string& message)
        : QuotaException(ErrorKind::RemoteError, message) {}

protected:
    RemoteException(ErrorKind kind, const std::string& message)
        : QuotaException(kind, message) {}
};

/**
 * @brief Thrown when the API answers with a body that is not a JSON object
 */
class MalformedResponseException : public RemoteException {
public:
    explicit MalformedResponseException(const std::string& message)
        : RemoteException(ErrorKind::MalformedUpstream, message) {}
};

} // namespace lsquota

#endif // LSQUOTA_QUOTA_TYPES_HPP
