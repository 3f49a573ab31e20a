// SPDX-License-Identifier: MIT
/**
 * @file surface_types.hpp
 * @brief Raw implied-vol surface and tenor-bucketed skew grid types
 */

#pragma once

#include "src/core/date.hpp"
#include "src/core/numeric.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace volbatch {

/// One (expiry, strike) implied vol as computed by the external vol solver
struct RawSurfacePoint {
    Date expiry;
    double strike = 0.0;
    double implied_vol = 0.0;
    std::optional<int64_t> open_interest;
};

/// Raw surface for one ticker
struct RawSurface {
    std::string ticker;
    std::optional<Date> quote_date;   ///< Observation date reported by the source
    std::optional<Numeric> spot;      ///< Spot in the source's own representation
    std::vector<RawSurfacePoint> points;

    /// Distinct expiries in ascending order
    [[nodiscard]] std::vector<Date> expiry_dates() const;
};

/// Whole-month tenor bucket ("1M", "2M", ...)
struct TenorBucket {
    int months = 0;
    std::string label;

    static TenorBucket from_months(int months) {
        return TenorBucket{months, std::to_string(months) + "M"};
    }

    friend bool operator==(const TenorBucket&, const TenorBucket&) = default;
};

/// Tenor-bucketed skew grid
///
/// Every row holds exactly one value slot per strike in `strikes`; a slot
/// without surviving data is nullopt. Rows are ordered by month.
struct SkewGrid {
    struct Row {
        TenorBucket bucket;
        std::vector<std::optional<double>> vols;  // Parallel to SkewGrid::strikes

        friend bool operator==(const Row&, const Row&) = default;
    };

    std::vector<double> strikes;
    std::vector<std::string> strike_keys;  // Decimal-formatted strikes
    std::vector<Row> rows;

    /// Row by label ("3M"), nullptr if absent
    [[nodiscard]] const Row* find(std::string_view label) const {
        for (const auto& row : rows) {
            if (row.bucket.label == label) return &row;
        }
        return nullptr;
    }

    /// Vol at (label, strike key), nullopt when missing
    [[nodiscard]] std::optional<double> at(std::string_view label, std::string_view strike_key) const;

    /// Number of populated cells
    [[nodiscard]] size_t populated_count() const;

    friend bool operator==(const SkewGrid&, const SkewGrid&) = default;
};

/// Shortest decimal text that round-trips the strike ("80", "92.5")
std::string format_strike(double strike);

}  // namespace volbatch
