/**
 * @file language_server_api.cpp
 * @brief Probe and status calls against the Language Server
 */

#include "language_server_api.hpp"
#include "log.hpp"

#include <sstream>

namespace lsquota {

const char* const kLanguageServerService = "exa.language_server_pb.LanguageServerService";

// Identifies this client in GetUserStatus metadata
static const char* const kIdeName = "antigravity";
static const char* const kExtensionName = "antigravity";
static const char* const kLocale = "en";

std::string service_url(int port, const std::string& method) {
    return "https://127.0.0.1:" + std::to_string(port) + "/" + kLanguageServerService + "/" + method;
}

HttpHeaders request_headers(const std::string& csrf_token) {
    return {
        {"Content-Type", "application/json"},
        {"Connect-Protocol-Version", "1"},
        {"X-Codeium-Csrf-Token", csrf_token},
    };
}

bool parse_json(const std::string& text, Json::Value& out, std::string& errs) {
    Json::CharReaderBuilder reader;
    reader["failIfExtra"] = true;
    std::istringstream iss(text);
    return Json::parseFromStream(reader, iss, &out, &errs);
}

static std::string request_body(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

bool PortProbe::probe(int port, const std::string& csrf_token) {
    Json::Value request;
    request["wrapper_data"] = Json::Value(Json::objectValue);

    try {
        auto response = client_.post(service_url(port, "GetUnleashData"), request_body(request),
                                     request_headers(csrf_token));
        if (response.http_code != 200) {
            log_debug("Port " + std::to_string(port) + " test failed: HTTP " +
                      std::to_string(response.http_code));
            return false;
        }

        Json::Value body;
        std::string errs;
        if (!parse_json(response.data, body, errs)) {
            log_debug("Port " + std::to_string(port) + " test failed: " + errs);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        log_debug("Port " + std::to_string(port) + " test failed: " + e.what());
        return false;
    }
}

Json::Value QuotaFetcher::fetch(const Connection& connection) {
    Json::Value request;
    request["metadata"]["ideName"] = kIdeName;
    request["metadata"]["extensionName"] = kExtensionName;
    request["metadata"]["locale"] = kLocale;

    HttpResponse response;
    try {
        response = client_.post(service_url(connection.port, "GetUserStatus"), request_body(request),
                                request_headers(connection.csrf_token));
    } catch (const HttpException& e) {
        throw RemoteException(e.what());
    }

    if (response.http_code < 200 || response.http_code >= 300) {
        throw RemoteException("HTTP error: " + std::to_string(response.http_code));
    }

    Json::Value json_response;
    std::string errs;
    if (!parse_json(response.data, json_response, errs)) {
        throw MalformedResponseException("Failed to parse response: " + errs);
    }
    if (!json_response.isObject()) {
        throw MalformedResponseException("Failed to parse response: expected a JSON object");
    }
    return json_response;
}

} // namespace lsquota
