// SPDX-License-Identifier: MIT
/**
 * @file file_sources.hpp
 * @brief File-backed collaborators for offline batch runs
 */

#pragma once

#include "src/batch/collaborators.hpp"
#include <filesystem>
#include <set>
#include <string>

namespace volbatch {

/// Surface source reading `<directory>/<TICKER>.json` snapshots
///
/// Snapshot format:
/// ```json
/// {"ticker": "SPY", "quote_date": "2024-06-21", "spot": 580.5,
///  "points": [{"expiry": "2024-07-19", "strike": 100, "iv": 12.8,
///              "open_interest": 1520}, ...]}
/// ```
/// `spot_fixed9` (integer, price * 10^9) may replace `spot`. A null `iv`
/// is read as no data.
class JsonSnapshotSurfaceSource final : public SurfaceSource {
public:
    explicit JsonSnapshotSurfaceSource(std::filesystem::path directory)
        : directory_(std::move(directory)) {}

    std::expected<RawSurface, UpstreamError> fetch(
        const TickerSpec& spec, const DiscountInputs& discount, std::stop_token stop) const override;

    [[nodiscard]] std::filesystem::path snapshot_path(const std::string& ticker) const {
        return directory_ / (ticker + ".json");
    }

private:
    std::filesystem::path directory_;
};

/// Discount source built from the run parameters
///
/// With dividends: flat curve at the TickerSpec interest rate and its
/// dividend yield. Without: the named method must be one of `methods`;
/// the snapshot vols are already forward-consistent, so the curve is flat
/// at the interest rate and no dividend yield is applied.
class ConfiguredDiscountSource final : public DiscountSource {
public:
    ConfiguredDiscountSource() = default;

    explicit ConfiguredDiscountSource(std::set<std::string> methods)
        : methods_(std::move(methods)) {}

    std::expected<DiscountInputs, UpstreamError> fetch(
        const TickerSpec& spec, std::stop_token stop) const override;

private:
    std::set<std::string> methods_ = {"smooth", "flat"};
};

}  // namespace volbatch
