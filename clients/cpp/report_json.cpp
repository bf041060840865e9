/**
 * @file report_json.cpp
 * @brief QuotaReport to JSON
 */

#include "report_json.hpp"

namespace lsquota {

static Json::Value optional_number(const std::optional<double>& value) {
    if (!value) return Json::Value(Json::nullValue);
    return Json::Value(*value);
}

template <typename Block>
static Json::Value optional_block(const std::optional<Block>& block) {
    if (!block) return Json::Value(Json::nullValue);
    return to_json(*block);
}

Json::Value to_json(const CreditBlock& block) {
    Json::Value json;
    json["available"] = Json::Int64(block.available);
    json["monthly"] = Json::Int64(block.monthly);
    json["used"] = Json::Int64(block.used);
    json["used_percentage"] = block.used_percentage;
    json["remaining_percentage"] = block.remaining_percentage;
    return json;
}

Json::Value to_json(const ModelQuota& model) {
    Json::Value json;
    json["label"] = model.label;
    json["model_id"] = model.model_id;
    json["remaining_fraction"] = optional_number(model.remaining_fraction);
    json["remaining_percentage"] = optional_number(model.remaining_percentage);
    json["used_percentage"] = optional_number(model.used_percentage);
    json["is_exhausted"] = model.is_exhausted;
    json["reset_time_iso"] = model.reset_time_iso;
    json["time_until_reset_ms"] = Json::Int64(model.time_until_reset_ms);
    return json;
}

Json::Value to_json(const QuotaPool& pool) {
    Json::Value json;
    json["name"] = pool.name;
    json["models"] = Json::Value(Json::arrayValue);
    for (const auto& model : pool.models) {
        json["models"].append(to_json(model));
    }
    json["model_count"] = Json::UInt64(pool.model_count);
    json["remaining_fraction"] = optional_number(pool.remaining_fraction);
    json["remaining_percentage"] = optional_number(pool.remaining_percentage);
    json["used_percentage"] = optional_number(pool.used_percentage);
    json["is_exhausted"] = pool.is_exhausted;
    json["reset_time_iso"] = pool.reset_time_iso;
    json["time_until_reset_ms"] = Json::Int64(pool.time_until_reset_ms);
    return json;
}

Json::Value to_json(const QuotaReport& report) {
    Json::Value json;
    json["timestamp"] = report.timestamp;
    json["plan_name"] = report.plan_name;
    json["plan_tier"] = report.plan_tier;
    json["prompt_credits"] = optional_block(report.prompt_credits);
    json["flow_credits"] = optional_block(report.flow_credits);

    json["models"] = Json::Value(Json::arrayValue);
    for (const auto& model : report.models) {
        json["models"].append(to_json(model));
    }
    json["pools"] = Json::Value(Json::arrayValue);
    for (const auto& pool : report.pools) {
        json["pools"].append(to_json(pool));
    }

    json["user_name"] = report.user_name;
    json["user_email"] = report.user_email;
    return json;
}

Json::Value error_to_json(const QuotaException& error) {
    Json::Value json;
    json["error"] = error.what();
    return json;
}

int http_status_for(ErrorKind kind) {
    return kind == ErrorKind::NotFound ? 503 : 500;
}

std::string write_json(const Json::Value& value, bool pretty) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = pretty ? "  " : "";
    return Json::writeString(writer, value);
}

} // namespace lsquota
