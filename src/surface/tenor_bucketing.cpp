// SPDX-License-Identifier: MIT
#include "src/surface/tenor_bucketing.hpp"
#include <cstdlib>

namespace volbatch {

std::optional<int> nearest_month(const Date& observation,
                                 const Date& expiry,
                                 HalfMonthRounding rounding)
{
    if (expiry < observation) {
        return std::nullopt;
    }

    auto obs = observation.ymd();
    auto exp = expiry.ymd();
    int k = (static_cast<int>(exp.year()) - static_cast<int>(obs.year())) * 12 +
            (static_cast<int>(static_cast<unsigned>(exp.month())) -
             static_cast<int>(static_cast<unsigned>(obs.month())));

    // Settle k so that anchor(k) <= expiry < anchor(k + 1)
    while (k > 0 && observation.add_months(k) > expiry) {
        --k;
    }
    while (observation.add_months(k + 1) <= expiry) {
        ++k;
    }

    const Date lower = observation.add_months(k);
    const Date upper = observation.add_months(k + 1);
    const int into = days_between(lower, expiry);
    const int span = days_between(lower, upper);

    // Integer comparison keeps the half-way test exact
    if (2 * into > span) {
        return k + 1;
    }
    if (2 * into == span && rounding == HalfMonthRounding::HalfUp) {
        return k + 1;
    }
    return k;
}

int distance_to_bucket(const Date& observation, int months, const Date& expiry) {
    return std::abs(days_between(bucket_nominal_date(observation, months), expiry));
}

}  // namespace volbatch
