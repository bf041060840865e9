/**
 * @file language_server_api.hpp
 * @brief Calls against the Language Server's private control API
 */

#ifndef LSQUOTA_LANGUAGE_SERVER_API_HPP
#define LSQUOTA_LANGUAGE_SERVER_API_HPP

#include "http_client.hpp"
#include "quota_types.hpp"

#include <json/json.h>

#include <string>

namespace lsquota {

extern const char* const kLanguageServerService;

/**
 * @brief https://127.0.0.1:<port>/<service>/<method>
 */
std::string service_url(int port, const std::string& method);

/**
 * @brief Content-Type, Connect-Protocol-Version and X-Codeium-Csrf-Token headers
 */
HttpHeaders request_headers(const std::string& csrf_token);

/**
 * @brief Parse @p text as JSON
 * @return false on syntax errors, with the reason in @p errs
 */
bool parse_json(const std::string& text, Json::Value& out, std::string& errs);

/**
 * @brief Checks whether a port serves the Language Server API
 */
class PortProbe {
public:
    explicit PortProbe(HttpClient& client) : client_(client) {}

    /**
     * @brief Call GetUnleashData on @p port
     *
     * @return true only for HTTP 200 with a well-formed JSON body. Every
     *         failure, including transport errors, yields false.
     */
    bool probe(int port, const std::string& csrf_token);

private:
    HttpClient& client_;
};

/**
 * @brief Retrieves the raw GetUserStatus payload
 */
class QuotaFetcher {
public:
    explicit QuotaFetcher(HttpClient& client) : client_(client) {}

    /**
     * @brief POST GetUserStatus on the connection's port
     *
     * @return The response body as a JSON object
     * @throws RemoteException on transport errors, timeouts and non-2xx status
     * @throws MalformedResponseException if the body is not a JSON object
     */
    Json::Value fetch(const Connection& connection);

private:
    HttpClient& client_;
};

} // namespace lsquota

#endif // LSQUOTA_LANGUAGE_SERVER_API_HPP
