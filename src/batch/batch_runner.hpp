// SPDX-License-Identifier: MIT
/**
 * @file batch_runner.hpp
 * @brief Timeout-bounded, failure-isolated batch execution of ticker jobs
 */

#pragma once

#include "src/batch/ticker_job.hpp"
#include "src/support/error_types.hpp"
#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace volbatch {

/// Batch execution parameters, given per run
struct BatchConfig {
    std::chrono::milliseconds per_job_timeout{std::chrono::seconds{120}};
    size_t max_concurrency = 1;                   ///< 1 = sequential loop
    std::chrono::milliseconds launch_interval{0}; ///< Minimum gap between job launches
    bool require_tickers = true;                  ///< Empty ticker list is a ConfigError
};

/// Outcome of one submitted ticker
struct TickerOutcome {
    std::string ticker;
    std::expected<TickerResult, JobFailure> result;
};

/// Ordered outcome of a batch (submission order, one entry per ticker)
struct BatchOutcome {
    std::vector<TickerOutcome> entries;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] size_t size() const { return entries.size(); }

    [[nodiscard]] size_t succeeded() const;

    [[nodiscard]] size_t failed_count() const { return entries.size() - succeeded(); }

    /// Check if all jobs succeeded
    [[nodiscard]] bool all_succeeded() const { return failed_count() == 0; }

    /// Entry for a ticker key, nullptr if absent
    [[nodiscard]] const TickerOutcome* find(const std::string& ticker) const;
};

/// Batch runner
///
/// Runs one job per ticker, at most `max_concurrency` at a time. Each job
/// gets a hard wall-clock budget; a job that has not reported when its
/// budget runs out is sent a stop request, disowned (its thread is
/// detached and any late result discarded) and recorded as
/// JobFailureCode::Timeout. Its slot is reused immediately.
///
/// Per-ticker failures are data in the BatchOutcome; run() only fails for
/// invalid invocation parameters, before any job starts. The outcome
/// content does not depend on `max_concurrency`; only latency does.
///
/// **Usage:**
/// ```cpp
/// BatchRunner runner(TickerJob(surface_source, discount_source));
/// auto outcome = runner.run(specs, std::chrono::seconds{60});
/// if (!outcome) {
///     std::cerr << outcome.error() << "\n";
/// } else if (!outcome->all_succeeded()) {
///     // partial success
/// }
/// ```
class BatchRunner {
public:
    /// Job callable. Receives the stop token of its worker thread.
    using JobFn = std::function<std::expected<TickerResult, JobFailure>(
        const TickerSpec& spec, std::stop_token stop)>;

    explicit BatchRunner(JobFn job) : job_(std::move(job)) {}

    explicit BatchRunner(const TickerJob& job);

    /// Run a batch with full configuration
    std::expected<BatchOutcome, ConfigError> run(std::span<const TickerSpec> tickers,
                                                 const BatchConfig& config) const;

    /// Run a batch with default configuration and the given per-job timeout
    std::expected<BatchOutcome, ConfigError> run(std::span<const TickerSpec> tickers,
                                                 std::chrono::milliseconds per_job_timeout) const
    {
        BatchConfig config;
        config.per_job_timeout = per_job_timeout;
        return run(tickers, config);
    }

    /// Validate invocation parameters without running anything
    static std::expected<void, ConfigError> validate(std::span<const TickerSpec> tickers,
                                                     const BatchConfig& config);

private:
    JobFn job_;
    std::expected<void, ConfigError> job_check_;
};

/// Convert a duration given in seconds (CLI, Python) to milliseconds
///
/// Rejects NaN, infinities and negative values with
/// ConfigErrorCode::InvalidDuration. Values past the millisecond range
/// saturate to milliseconds::max(), which the runner treats as unbounded.
std::expected<std::chrono::milliseconds, ConfigError> milliseconds_from_seconds(double seconds);

}  // namespace volbatch
