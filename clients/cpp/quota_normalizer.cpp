/**
 * @file quota_normalizer.cpp
 * @brief GetUserStatus normalization
 */

#include "quota_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <map>
#include <set>
#include <utility>

namespace lsquota {

namespace {

// Safe lookups on untrusted JSON. A missing key, or a parent that is not
// an object, yields null rather than throwing.
const Json::Value& member(const Json::Value& parent, const char* key) {
    if (!parent.isObject()) return Json::Value::nullSingleton();
    return parent[key];
}

// Integers arrive as numbers, or as decimal strings for 64-bit fields
std::optional<int64_t> as_integer(const Json::Value& v) {
    if (v.isInt64()) return v.asInt64();
    if (v.isDouble() && !v.isUInt64()) {
        double d = v.asDouble();
        if (!std::isfinite(d) || d >= 9.2e18 || d <= -9.2e18) return std::nullopt;
        return static_cast<int64_t>(d);
    }
    if (v.isString()) {
        std::string s = v.asString();
        const char* begin = s.c_str();
        while (std::isspace(static_cast<unsigned char>(*begin))) ++begin;
        if (!*begin) return std::nullopt;
        char* end = nullptr;
        errno = 0;
        long long value = std::strtoll(begin, &end, 10);
        if (errno == ERANGE) return std::nullopt;
        while (std::isspace(static_cast<unsigned char>(*end))) ++end;
        if (*end != '\0') return std::nullopt;
        return static_cast<int64_t>(value);
    }
    return std::nullopt;
}

std::optional<double> as_number(const Json::Value& v) {
    if (!v.isNumeric()) return std::nullopt;
    return v.asDouble();
}

std::string as_text(const Json::Value& v, const std::string& fallback) {
    if (!v.isString()) return fallback;
    return v.asString();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string family_of(const std::string& label) {
    std::string lower = to_lower(label);
    if (lower.find("claude") != std::string::npos) return "Claude";
    if (lower.find("gemini") != std::string::npos) return "Gemini";
    if (lower.find("gpt") != std::string::npos) return "GPT";

    auto begin = std::find_if(label.begin(), label.end(),
                              [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(begin, label.end(),
                            [](unsigned char c) { return std::isspace(c); });
    if (begin == end) return "Other";
    return std::string(begin, end);
}

template <typename T>
void sort_by_pressure(std::vector<T>& items) {
    std::stable_sort(items.begin(), items.end(), [](const T& a, const T& b) {
        if (a.is_exhausted != b.is_exhausted) return a.is_exhausted;
        return a.used_percentage.value_or(0.0) > b.used_percentage.value_or(0.0);
    });
}

} // namespace

double round1(double value) {
    if (!std::isfinite(value)) return value;
    char buf[512];
    std::snprintf(buf, sizeof(buf), "%.1f", value);
    return std::strtod(buf, nullptr);
}

std::optional<CreditBlock> make_credit_block(std::optional<int64_t> monthly,
                                             std::optional<int64_t> available) {
    if (!monthly || *monthly == 0 || !available) return std::nullopt;

    // used = monthly - available must be representable
    const int64_t max = std::numeric_limits<int64_t>::max();
    const int64_t min = std::numeric_limits<int64_t>::min();
    if ((*available < 0 && *monthly > max + *available) ||
        (*available > 0 && *monthly < min + *available)) {
        return std::nullopt;
    }

    CreditBlock block;
    block.monthly = *monthly;
    block.available = *available;
    block.used = block.monthly - block.available;
    block.used_percentage = round1(static_cast<double>(block.used) / block.monthly * 100);
    block.remaining_percentage = round1(static_cast<double>(block.available) / block.monthly * 100);
    return block;
}

std::optional<ModelQuota> parse_model_quota(const Json::Value& entry, TimePoint now) {
    const Json::Value& quota_info = member(entry, "quotaInfo");
    if (!quota_info.isObject() || quota_info.empty()) return std::nullopt;

    ModelQuota model;
    model.label = as_text(member(entry, "label"), "Unknown");
    model.model_id = as_text(member(member(entry, "modelOrAlias"), "model"), "unknown");
    model.remaining_fraction = as_number(member(quota_info, "remainingFraction"));
    model.reset_time_iso = as_text(member(quota_info, "resetTime"), "");

    if (auto reset = parse_iso8601(model.reset_time_iso)) {
        model.time_until_reset_ms = millis_between(now, *reset);
    }

    if (model.remaining_fraction) {
        double fraction = *model.remaining_fraction;
        model.remaining_percentage = round1(fraction * 100);
        model.used_percentage = round1((1 - fraction) * 100);
        model.is_exhausted = fraction == 0.0;
    }
    return model;
}

void sort_models(std::vector<ModelQuota>& models) {
    sort_by_pressure(models);
}

void sort_pools(std::vector<QuotaPool>& pools) {
    // Ties fall back to reset time and name so the result does not depend on input order
    std::stable_sort(pools.begin(), pools.end(), [](const QuotaPool& a, const QuotaPool& b) {
        if (a.is_exhausted != b.is_exhausted) return a.is_exhausted;
        double used_a = a.used_percentage.value_or(0.0);
        double used_b = b.used_percentage.value_or(0.0);
        if (used_a != used_b) return used_a > used_b;
        if (a.reset_time_iso != b.reset_time_iso) return a.reset_time_iso < b.reset_time_iso;
        return a.name < b.name;
    });
}

std::vector<QuotaPool> group_into_pools(const std::vector<ModelQuota>& models) {
    using PoolKey = std::pair<std::string, std::optional<double>>;
    std::map<PoolKey, size_t> index;
    std::vector<QuotaPool> pools;

    for (const auto& model : models) {
        PoolKey key(model.reset_time_iso, model.remaining_fraction);
        auto it = index.find(key);
        if (it == index.end()) {
            QuotaPool pool;
            pool.remaining_fraction = model.remaining_fraction;
            pool.remaining_percentage = model.remaining_percentage;
            pool.used_percentage = model.used_percentage;
            pool.is_exhausted = model.is_exhausted;
            pool.reset_time_iso = model.reset_time_iso;
            pool.time_until_reset_ms = model.time_until_reset_ms;
            index.emplace(key, pools.size());
            pools.push_back(std::move(pool));
            it = index.find(key);
        }
        pools[it->second].models.push_back(model);
    }

    for (auto& pool : pools) {
        std::vector<std::string> labels;
        for (const auto& model : pool.models) labels.push_back(model.label);
        pool.name = derive_pool_name(labels);
        pool.model_count = pool.models.size();
    }
    return pools;
}

std::string derive_pool_name(const std::vector<std::string>& labels) {
    if (labels.empty()) return "Premium Models";
    if (labels.size() == 1) return labels.front();

    std::set<std::string> families;
    for (const auto& label : labels) families.insert(family_of(label));

    if (families.size() == 1) return *families.begin() + " Models";
    if (families.size() > 3) return "Premium Models";

    std::string name;
    for (const auto& family : families) {
        if (!name.empty()) name += " / ";
        name += family;
    }
    return name + " Models";
}

QuotaReport normalize(const Json::Value& raw, TimePoint now) {
    const Json::Value& user_status = member(raw, "userStatus");
    const Json::Value& plan_status = member(user_status, "planStatus");
    const Json::Value& plan_info = member(plan_status, "planInfo");

    QuotaReport report;
    report.timestamp = format_iso8601(now);
    report.plan_name = as_text(member(plan_info, "planName"), "Unknown");
    report.plan_tier = as_text(member(plan_info, "teamsTier"), "");
    report.user_name = as_text(member(user_status, "name"), "");
    report.user_email = as_text(member(user_status, "email"), "");

    report.prompt_credits = make_credit_block(as_integer(member(plan_info, "monthlyPromptCredits")),
                                              as_integer(member(plan_status, "availablePromptCredits")));
    report.flow_credits = make_credit_block(as_integer(member(plan_info, "monthlyFlowCredits")),
                                            as_integer(member(plan_status, "availableFlowCredits")));

    const Json::Value& raw_models =
        member(member(user_status, "cascadeModelConfigData"), "clientModelConfigs");
    if (raw_models.isArray()) {
        for (const auto& entry : raw_models) {
            if (auto model = parse_model_quota(entry, now)) {
                report.models.push_back(std::move(*model));
            }
        }
    }

    sort_models(report.models);
    report.pools = group_into_pools(report.models);
    sort_pools(report.pools);
    return report;
}

} // namespace lsquota
