/**
 * @file quota_normalizer.hpp
 * @brief Turns a raw GetUserStatus response into a QuotaReport
 */

#ifndef LSQUOTA_QUOTA_NORMALIZER_HPP
#define LSQUOTA_QUOTA_NORMALIZER_HPP

#include "quota_types.hpp"
#include "time_util.hpp"

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lsquota {

/**
 * @brief Normalize a GetUserStatus payload
 *
 * Pure and deterministic for a given (@p raw, @p now). Missing or
 * mistyped fields degrade to defaults; this function does not throw on
 * bad input.
 *
 * @param raw Parsed response body, untrusted
 * @param now Capture instant, used for the timestamp and reset countdowns
 */
QuotaReport normalize(const Json::Value& raw, TimePoint now);

/**
 * @brief Credit block for a monthly allotment and remaining credits
 *
 * @return std::nullopt when @p monthly is absent or zero, @p available is absent,
 *         or monthly - available does not fit in 64 bits
 */
std::optional<CreditBlock> make_credit_block(std::optional<int64_t> monthly,
                                             std::optional<int64_t> available);

/**
 * @brief Build a ModelQuota from one clientModelConfigs entry
 *
 * @return std::nullopt when the entry carries no quotaInfo
 */
std::optional<ModelQuota> parse_model_quota(const Json::Value& entry, TimePoint now);

/**
 * @brief Group sorted models into pools of equal (reset time, remaining fraction)
 *
 * Pools come out in order of first appearance; call sort_pools() afterwards.
 */
std::vector<QuotaPool> group_into_pools(const std::vector<ModelQuota>& models);

/**
 * @brief Stable sort: exhausted first, then used percentage descending
 *
 * An absent used percentage orders as 0.
 */
void sort_models(std::vector<ModelQuota>& models);

/**
 * @brief Sort pools like sort_models(), breaking ties by reset time then name
 */
void sort_pools(std::vector<QuotaPool>& pools);

/**
 * @brief Display name for a pool holding models with @p labels
 */
std::string derive_pool_name(const std::vector<std::string>& labels);

/**
 * @brief Round to one decimal, ties to even on the exact binary value
 */
double round1(double value);

} // namespace lsquota

#endif // LSQUOTA_QUOTA_NORMALIZER_HPP
