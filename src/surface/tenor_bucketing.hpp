// SPDX-License-Identifier: MIT
/**
 * @file tenor_bucketing.hpp
 * @brief Calendar-month tenor bucketing of expiry dates
 */

#pragma once

#include "src/core/date.hpp"
#include <optional>

namespace volbatch {

/// Rounding of an expiry that falls exactly half-way between two month anniversaries
enum class HalfMonthRounding {
    HalfUp,    // Round to the later month
    HalfDown   // Round to the earlier month
};

/// Winner when two expiries are equally distant from a bucket's nominal date
enum class ExpiryTieBreak {
    PreferEarlier,
    PreferLater
};

/// Nearest whole-month distance from `observation` to `expiry`
///
/// Month k spans [observation + k months, observation + (k+1) months), with
/// month-end clamping (Jan 31 + 1 month = Feb 28/29). The expiry rounds to
/// the nearer anniversary; an exact half-way expiry follows `rounding`.
/// Returns nullopt for expiries before the observation date.
///
/// Example: observation 2024-06-01, expiry 2024-06-16 lies 15 of 30 days
/// into June, so it is a tie and rounds to 1 under HalfUp, 0 under HalfDown.
std::optional<int> nearest_month(const Date& observation,
                                 const Date& expiry,
                                 HalfMonthRounding rounding = HalfMonthRounding::HalfUp);

/// Nominal date of bucket `months` (observation + months, month-end clamped)
inline Date bucket_nominal_date(const Date& observation, int months) {
    return observation.add_months(months);
}

/// Absolute distance in days between an expiry and a bucket's nominal date
int distance_to_bucket(const Date& observation, int months, const Date& expiry);

}  // namespace volbatch
