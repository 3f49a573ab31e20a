// SPDX-License-Identifier: MIT
#include "src/batch/ticker_job.hpp"
#include "src/support/volbatch_trace.h"
#include <chrono>

namespace volbatch {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

}  // namespace

std::expected<TickerResult, JobFailure> TickerJob::execute(const TickerSpec& spec,
                                                           std::stop_token stop) const
{
    const auto start = Clock::now();
    const std::string& key = spec.key();

    if (!has_collaborators()) {
        return std::unexpected(to_job_failure(
            UpstreamError{UpstreamErrorCode::Unsupported, "job has no data collaborators"},
            key, since(start)));
    }

    // Step 1: external collaborators
    auto discount = catch_upstream([&] { return discount_source_->fetch(spec, stop); });
    if (!discount) {
        VOLBATCH_TRACE_JOB_FAILED(VOLBATCH_MODULE_TICKER_JOB,
                                  static_cast<int>(JobFailureCode::UpstreamError));
        return std::unexpected(to_job_failure(discount.error(), key, since(start)));
    }

    auto surface = catch_upstream([&] { return surface_source_->fetch(spec, *discount, stop); });
    if (!surface) {
        VOLBATCH_TRACE_JOB_FAILED(VOLBATCH_MODULE_TICKER_JOB,
                                  static_cast<int>(JobFailureCode::UpstreamError));
        return std::unexpected(to_job_failure(surface.error(), key, since(start)));
    }

    if (stop.stop_requested()) {
        return std::unexpected(to_job_failure(
            UpstreamError{UpstreamErrorCode::Cancelled, "stop requested"}, key, since(start)));
    }

    // Step 2: reshape and report
    const Date observation = surface->quote_date.value_or(spec.start_date);
    auto grid = catch_transform([&] {
        return reshape_surface(surface->points, observation, reshape_);
    });
    if (!grid) {
        VOLBATCH_TRACE_JOB_FAILED(VOLBATCH_MODULE_RESHAPER,
                                  static_cast<int>(JobFailureCode::TransformError));
        return std::unexpected(to_job_failure(grid.error(), key, since(start)));
    }

    SurfaceSummary summary;
    summary.observation = observation;
    summary.params.discount_method = discount->method;
    summary.params.use_dividends = spec.use_dividends;
    if (spec.use_dividends) {
        summary.params.interest_rate = spec.interest_rate;
    }
    summary.params.dividend_yield = discount->dividend_yield;
    if (!discount->curve.empty()) {
        summary.params.zero_rate_1y = discount->curve.zero_rate(1.0);
    }
    summary.params.bucket_count = reshape_.bucket_count;
    summary.params.strike_grid = reshape_.strike_grid;
    summary.surface = std::move(*surface);

    auto result = catch_transform([&]() -> std::expected<TickerResult, TransformError> {
        return builder_.build(key, spec.start_date, std::move(summary), std::move(*grid));
    });
    if (!result) {
        VOLBATCH_TRACE_JOB_FAILED(VOLBATCH_MODULE_REPORT,
                                  static_cast<int>(JobFailureCode::TransformError));
        return std::unexpected(to_job_failure(result.error(), key, since(start)));
    }
    return std::move(*result);
}

}  // namespace volbatch
