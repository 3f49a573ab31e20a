// SPDX-License-Identifier: MIT
/**
 * @file ticker_job.hpp
 * @brief Single-ticker unit of work: fetch, reshape, report
 */

#pragma once

#include "src/batch/collaborators.hpp"
#include "src/report/skew_report.hpp"
#include "src/support/error_types.hpp"
#include "src/surface/surface_reshaper.hpp"
#include <expected>
#include <memory>
#include <stop_token>

namespace volbatch {

/// One ticker job
///
/// Holds only shared ownership of its collaborators and value configs, so a
/// copy can outlive the batch runner when a job is abandoned after its
/// timeout. execute() mutates nothing outside its own stack.
///
/// **Usage:**
/// ```cpp
/// TickerJob job(surface_source, discount_source);
/// auto result = job.execute(spec);
/// if (!result) {
///     std::cerr << result.error() << "\n";
/// }
/// ```
class TickerJob {
public:
    TickerJob(std::shared_ptr<const SurfaceSource> surface_source,
              std::shared_ptr<const DiscountSource> discount_source,
              ReshapeConfig reshape = {},
              ReportConfig report = {})
        : surface_source_(std::move(surface_source))
        , discount_source_(std::move(discount_source))
        , reshape_(std::move(reshape))
        , builder_(report) {}

    /// Run the job
    ///
    /// Step 1 fetches discount inputs and the surface; failures there are
    /// UpstreamError and are not retried. Step 2 reshapes and builds the
    /// report; failures there are TransformError.
    ///
    /// @param spec Ticker and run parameters
    /// @param stop Cooperative cancellation, forwarded to collaborators
    std::expected<TickerResult, JobFailure> execute(const TickerSpec& spec,
                                                    std::stop_token stop = {}) const;

    std::expected<TickerResult, JobFailure> operator()(const TickerSpec& spec,
                                                       std::stop_token stop) const {
        return execute(spec, stop);
    }

    [[nodiscard]] bool has_collaborators() const {
        return surface_source_ && discount_source_;
    }

    [[nodiscard]] const ReshapeConfig& reshape_config() const { return reshape_; }
    [[nodiscard]] const ReportConfig& report_config() const { return builder_.config(); }

private:
    std::shared_ptr<const SurfaceSource> surface_source_;
    std::shared_ptr<const DiscountSource> discount_source_;
    ReshapeConfig reshape_;
    SkewReportBuilder builder_;
};

}  // namespace volbatch
