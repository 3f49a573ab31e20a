// SPDX-License-Identifier: MIT
#include "src/surface/surface_reshaper.hpp"
#include "src/support/volbatch_trace.h"
#include <algorithm>
#include <cmath>

namespace volbatch {

namespace {

/// Current winner of one grid cell
struct CellCandidate {
    Date expiry;
    int distance = 0;
    double vol = 0.0;
};

/// Index of the grid strike matching `strike`, or -1
long match_strike(const std::vector<double>& grid, double strike, double tolerance) {
    auto it = std::lower_bound(grid.begin(), grid.end(), strike - tolerance);
    if (it != grid.end() && std::abs(*it - strike) <= tolerance) {
        return static_cast<long>(std::distance(grid.begin(), it));
    }
    return -1;
}

bool replaces(const CellCandidate& current, int distance, const Date& expiry,
              ExpiryTieBreak tie_break) {
    if (distance != current.distance) {
        return distance < current.distance;
    }
    if (expiry == current.expiry) {
        return false;  // Duplicate quote for the same expiry: first one stays
    }
    return tie_break == ExpiryTieBreak::PreferEarlier
        ? expiry < current.expiry
        : expiry > current.expiry;
}

}  // namespace

std::expected<void, TransformError> validate(const ReshapeConfig& config) {
    if (config.bucket_count < 1) {
        return std::unexpected(TransformError{
            TransformErrorCode::InvalidBucketCount,
            "bucket_count must be at least 1",
            static_cast<double>(config.bucket_count)});
    }
    if (config.strike_grid.empty()) {
        return std::unexpected(TransformError{
            TransformErrorCode::InvalidStrikeGrid, "strike grid is empty"});
    }
    if (!(config.strike_tolerance >= 0.0)) {
        return std::unexpected(TransformError{
            TransformErrorCode::InvalidStrikeGrid, "negative strike tolerance",
            config.strike_tolerance});
    }
    for (size_t i = 0; i < config.strike_grid.size(); ++i) {
        double k = config.strike_grid[i];
        if (!std::isfinite(k) || k <= 0.0) {
            return std::unexpected(TransformError{
                TransformErrorCode::InvalidStrikeGrid, "grid strike must be positive", k});
        }
        if (i > 0 && !(k - config.strike_grid[i - 1] > 2.0 * config.strike_tolerance)) {
            return std::unexpected(TransformError{
                TransformErrorCode::InvalidStrikeGrid,
                "grid strikes must be strictly increasing", k});
        }
    }
    return {};
}

std::expected<SkewGrid, TransformError> reshape_surface(
    std::span<const RawSurfacePoint> points,
    const Date& observation,
    const ReshapeConfig& config)
{
    if (auto ok = validate(config); !ok) {
        return std::unexpected(ok.error());
    }
    if (points.empty()) {
        return std::unexpected(TransformError{
            TransformErrorCode::EmptySurface, "surface has no expiries"});
    }
    for (const auto& pt : points) {
        if (!std::isfinite(pt.strike) || pt.strike <= 0.0) {
            return std::unexpected(TransformError{
                TransformErrorCode::NonPositiveStrike,
                "strike must be positive (expiry " + pt.expiry.to_string() + ")",
                pt.strike});
        }
    }

    const size_t n_strikes = config.strike_grid.size();
    const size_t n_buckets = static_cast<size_t>(config.bucket_count);

    // cells[(month - 1) * n_strikes + strike_idx]
    std::vector<std::optional<CellCandidate>> cells(n_buckets * n_strikes);

    for (const auto& pt : points) {
        if (!std::isfinite(pt.implied_vol)) continue;  // No data

        auto month = nearest_month(observation, pt.expiry, config.tie_rounding);
        if (!month || *month < 1 || *month > config.bucket_count) continue;

        long strike_idx = match_strike(config.strike_grid, pt.strike, config.strike_tolerance);
        if (strike_idx < 0) continue;

        auto& cell = cells[static_cast<size_t>(*month - 1) * n_strikes +
                           static_cast<size_t>(strike_idx)];
        int distance = distance_to_bucket(observation, *month, pt.expiry);

        if (!cell || replaces(*cell, distance, pt.expiry, config.expiry_tie_break)) {
            cell = CellCandidate{pt.expiry, distance, pt.implied_vol};
        }
    }

    SkewGrid grid;
    grid.strikes = config.strike_grid;
    grid.strike_keys.reserve(n_strikes);
    for (double k : config.strike_grid) {
        grid.strike_keys.push_back(format_strike(k));
    }

    grid.rows.reserve(n_buckets);
    size_t kept = 0;
    for (size_t b = 0; b < n_buckets; ++b) {
        SkewGrid::Row row;
        row.bucket = TenorBucket::from_months(static_cast<int>(b) + 1);
        row.vols.reserve(n_strikes);
        for (size_t s = 0; s < n_strikes; ++s) {
            const auto& cell = cells[b * n_strikes + s];
            if (cell) {
                row.vols.push_back(cell->vol);
                ++kept;
            } else {
                row.vols.push_back(std::nullopt);
            }
        }
        grid.rows.push_back(std::move(row));
    }

    VOLBATCH_TRACE_RESHAPE_COMPLETE(points.size(), kept, n_buckets);
    return grid;
}

}  // namespace volbatch
