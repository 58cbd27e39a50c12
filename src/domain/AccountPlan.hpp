#pragma once

#include <cstdint>
#include <string_view>

namespace domain {

constexpr std::int64_t kDefaultPlanBarLimit = 5'000;
constexpr double kSafeBarRatio = 0.8;

// Maximum bars the service returns per query for an account tier.
constexpr std::int64_t plan_bar_limit(std::string_view planTier) {
    if (planTier == "pro_premium") {
        return 20'000;
    }
    if (planTier == "pro_plus" || planTier == "pro") {
        return 10'000;
    }
    return kDefaultPlanBarLimit;
}

constexpr std::int64_t safe_bar_limit(std::string_view planTier) {
    return static_cast<std::int64_t>(static_cast<double>(plan_bar_limit(planTier)) * kSafeBarRatio);
}

static_assert(plan_bar_limit("") == 5'000);
static_assert(plan_bar_limit("pro_premium") == 20'000);
static_assert(safe_bar_limit("pro") == 8'000);

}  // namespace domain
