// SPDX-License-Identifier: MIT
/**
 * @file discount_curve.hpp
 * @brief Flat discount curve carried with the discount inputs of a ticker
 */

#pragma once

#include <cmath>
#include <optional>

namespace volbatch {

/// Flat continuously-compounded discount curve
///
/// A default-constructed curve is empty: the discount collaborator had no
/// rate to offer and the report leaves the zero rate out.
class DiscountCurve {
public:
    DiscountCurve() = default;

    static DiscountCurve flat(double rate) {
        DiscountCurve curve;
        curve.rate_ = rate;
        return curve;
    }

    [[nodiscard]] bool empty() const { return !rate_.has_value(); }

    /// Zero rate for maturity t (years); 0 for an empty curve
    double zero_rate([[maybe_unused]] double t) const { return rate_.value_or(0.0); }

    /// Discount factor exp(-r t)
    double discount(double t) const { return std::exp(-zero_rate(t) * t); }

private:
    std::optional<double> rate_;
};

}  // namespace volbatch
