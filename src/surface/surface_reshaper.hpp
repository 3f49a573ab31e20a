// SPDX-License-Identifier: MIT
/**
 * @file surface_reshaper.hpp
 * @brief Reshape a raw (expiry x strike) implied-vol surface into a skew grid
 */

#pragma once

#include "src/surface/surface_types.hpp"
#include "src/surface/tenor_bucketing.hpp"
#include "src/support/error_types.hpp"
#include <expected>
#include <span>
#include <vector>

namespace volbatch {

/// Configuration for surface reshaping
struct ReshapeConfig {
    /// Candidate strikes, strictly increasing and positive
    std::vector<double> strike_grid = {80.0, 90.0, 100.0, 110.0, 120.0};

    /// Horizon in months; buckets 1M..bucket_count M are emitted
    int bucket_count = 24;

    /// Absolute tolerance when matching a point's strike to the grid
    double strike_tolerance = 1e-6;

    HalfMonthRounding tie_rounding = HalfMonthRounding::HalfUp;
    ExpiryTieBreak expiry_tie_break = ExpiryTieBreak::PreferEarlier;
};

/// Check strike grid and horizon
std::expected<void, TransformError> validate(const ReshapeConfig& config);

/// Reshape raw surface points into a tenor-bucketed skew grid
///
/// Each point is assigned to its nearest whole-month bucket relative to
/// `observation`; points outside 1..bucket_count, with non-finite vols, or
/// whose strike is not on the grid are dropped. When several expiries land
/// on the same (bucket, strike) cell, the expiry closest to the bucket's
/// nominal date wins, ties resolved by `expiry_tie_break`.
///
/// The output always contains every bucket label and every grid strike;
/// cells without data are nullopt.
///
/// @param points Raw surface points (any order)
/// @param observation Observation date the tenors are measured from
/// @param config Strike grid, horizon and tie policies
/// @return Skew grid, or TransformError for an empty surface, a
///         non-positive strike, or an invalid config
std::expected<SkewGrid, TransformError> reshape_surface(
    std::span<const RawSurfacePoint> points,
    const Date& observation,
    const ReshapeConfig& config = {});

/// Convenience overload with explicit grid and horizon
inline std::expected<SkewGrid, TransformError> reshape_surface(
    std::span<const RawSurfacePoint> points,
    const Date& observation,
    std::span<const double> strike_grid,
    int bucket_count)
{
    ReshapeConfig config;
    config.strike_grid.assign(strike_grid.begin(), strike_grid.end());
    config.bucket_count = bucket_count;
    return reshape_surface(points, observation, config);
}

}  // namespace volbatch
