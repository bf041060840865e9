/**
 * @file report_json.hpp
 * @brief JSON rendering of quota reports and errors for UI consumers
 */

#ifndef LSQUOTA_REPORT_JSON_HPP
#define LSQUOTA_REPORT_JSON_HPP

#include "quota_types.hpp"

#include <json/json.h>

#include <string>

namespace lsquota {

Json::Value to_json(const CreditBlock& block);
Json::Value to_json(const ModelQuota& model);
Json::Value to_json(const QuotaPool& pool);

/**
 * @brief Report as a JSON object; absent optional fields become null
 */
Json::Value to_json(const QuotaReport& report);

/**
 * @brief {"error": "..."} body for a failed report request
 */
Json::Value error_to_json(const QuotaException& error);

/**
 * @brief HTTP status an outer route layer should answer with
 *
 * 503 when the Language Server is not running, 500 otherwise.
 */
int http_status_for(ErrorKind kind);

/**
 * @brief Serialize @p value; @p pretty selects two-space indentation
 */
std::string write_json(const Json::Value& value, bool pretty = false);

} // namespace lsquota

#endif // LSQUOTA_REPORT_JSON_HPP
