// SPDX-License-Identifier: MIT
/**
 * @file collaborators.hpp
 * @brief Interfaces of the external data collaborators used by ticker jobs
 *
 * Implementations must be safe to call concurrently from several jobs and
 * may be called from a job that has already been abandoned by the batch
 * runner. They should poll the stop token at their blocking points and
 * return UpstreamErrorCode::Cancelled once a stop is requested.
 */

#pragma once

#include "src/core/date.hpp"
#include "src/market/discount_curve.hpp"
#include "src/support/error_types.hpp"
#include "src/surface/surface_types.hpp"
#include <expected>
#include <optional>
#include <stop_token>
#include <string>

namespace volbatch {

/// One unit of batch work
struct TickerSpec {
    std::string ticker;                   ///< Symbol passed to collaborators
    std::string output_key;               ///< Outcome / file key (defaults to ticker)
    Date start_date;
    bool use_dividends = false;           ///< Explicit dividend yield instead of calibration
    std::optional<double> dividend_yield;
    double interest_rate = 0.05;          ///< Flat rate used with explicit dividends
    std::string discount_method = "smooth";

    [[nodiscard]] const std::string& key() const {
        return output_key.empty() ? ticker : output_key;
    }
};

/// Forward/discount inputs consumed by the surface computation
struct DiscountInputs {
    DiscountCurve curve;
    double dividend_yield = 0.0;
    std::string method;
};

/// Dividend/discount collaborator
class DiscountSource {
public:
    virtual ~DiscountSource() = default;

    virtual std::expected<DiscountInputs, UpstreamError> fetch(
        const TickerSpec& spec, std::stop_token stop) const = 0;
};

/// Option-data collaborator: option chain in, solved implied-vol surface out
class SurfaceSource {
public:
    virtual ~SurfaceSource() = default;

    virtual std::expected<RawSurface, UpstreamError> fetch(
        const TickerSpec& spec, const DiscountInputs& discount, std::stop_token stop) const = 0;
};

}  // namespace volbatch
