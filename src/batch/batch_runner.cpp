// SPDX-License-Identifier: MIT
#include "src/batch/batch_runner.hpp"
#include "src/support/volbatch_trace.h"
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace volbatch {

namespace {

using Clock = std::chrono::steady_clock;
using JobResult = std::expected<TickerResult, JobFailure>;

std::chrono::milliseconds to_ms(Clock::duration d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d);
}

/// now + d, clamped to the clock's range
Clock::time_point saturating_add(Clock::time_point now, std::chrono::milliseconds d) {
    const auto headroom = to_ms(Clock::time_point::max() - now);
    if (d >= headroom) {
        return Clock::time_point::max();
    }
    return now + d;
}

/// State shared between the runner and its workers
///
/// Held through shared_ptr so that a disowned worker can still publish
/// (and have ignored) its late result after run() has returned.
struct CompletionChannel {
    explicit CompletionChannel(size_t n) : results(n), abandoned(n, false) {}

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::optional<JobResult>> results;
    std::vector<bool> abandoned;
    std::deque<size_t> completed;
};

/// Job currently owning a slot
struct ActiveJob {
    size_t index;
    Clock::time_point started;
    Clock::time_point deadline;
    std::jthread worker;
};

JobResult invoke_job(const BatchRunner::JobFn& job, const TickerSpec& spec, std::stop_token stop,
                     Clock::time_point started) {
    try {
        return job(spec, stop);
    } catch (const std::exception& e) {
        return std::unexpected(JobFailure{
            .code = JobFailureCode::UpstreamError,
            .ticker = spec.key(),
            .reason = std::string("job threw: ") + e.what(),
            .elapsed = to_ms(Clock::now() - started)});
    }
}

JobFailure timeout_failure(const TickerSpec& spec, std::chrono::milliseconds budget,
                           std::chrono::milliseconds elapsed) {
    return JobFailure{
        .code = JobFailureCode::Timeout,
        .ticker = spec.key(),
        .reason = "no result within " + std::to_string(budget.count()) + " ms",
        .elapsed = elapsed};
}

}  // namespace

size_t BatchOutcome::succeeded() const {
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
        [](const TickerOutcome& e) { return e.result.has_value(); }));
}

const TickerOutcome* BatchOutcome::find(const std::string& ticker) const {
    for (const auto& entry : entries) {
        if (entry.ticker == ticker) return &entry;
    }
    return nullptr;
}

BatchRunner::BatchRunner(const TickerJob& job)
    : job_(job)
{
    if (!job.has_collaborators()) {
        job_check_ = std::unexpected(ConfigError{
            ConfigErrorCode::MissingCollaborator, "ticker job needs surface and discount sources"});
        return;
    }
    if (auto ok = volbatch::validate(job.reshape_config()); !ok) {
        auto code = ok.error().code == TransformErrorCode::InvalidBucketCount
            ? ConfigErrorCode::InvalidBucketCount
            : ConfigErrorCode::InvalidStrikeGrid;
        job_check_ = std::unexpected(ConfigError{code, ok.error().reason});
        return;
    }
    const auto& grid = job.reshape_config().strike_grid;
    const double atm = job.report_config().atm_strike;
    bool has_atm = std::any_of(grid.begin(), grid.end(),
        [atm](double k) { return std::abs(k - atm) <= 1e-9 * std::max(1.0, std::abs(atm)); });
    if (!has_atm) {
        job_check_ = std::unexpected(ConfigError{
            ConfigErrorCode::MissingAtmStrike,
            "ATM strike " + format_strike(atm) + " is not on the strike grid"});
    }
}

std::expected<void, ConfigError> BatchRunner::validate(std::span<const TickerSpec> tickers,
                                                       const BatchConfig& config)
{
    if (config.per_job_timeout.count() <= 0) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::NonPositiveTimeout,
            "per-job timeout must be positive, got " +
                std::to_string(config.per_job_timeout.count()) + " ms"});
    }
    if (config.max_concurrency == 0) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::InvalidConcurrency, "max_concurrency must be at least 1"});
    }
    if (config.launch_interval.count() < 0) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::InvalidConcurrency, "launch_interval must not be negative"});
    }
    if (tickers.empty() && config.require_tickers) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::EmptyTickerList, "no tickers submitted"});
    }
    return {};
}

std::expected<std::chrono::milliseconds, ConfigError> milliseconds_from_seconds(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::InvalidDuration,
            "duration must be a finite, non-negative number of seconds, got " +
                std::to_string(seconds)});
    }
    const double ms = seconds * 1000.0;
    constexpr auto max_ms = std::chrono::milliseconds::max().count();
    if (ms >= static_cast<double>(max_ms)) {
        return std::chrono::milliseconds::max();
    }
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(ms)};
}

std::expected<BatchOutcome, ConfigError> BatchRunner::run(std::span<const TickerSpec> tickers,
                                                          const BatchConfig& config) const
{
    if (!job_) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::MissingCollaborator, "batch runner has no job"});
    }
    if (!job_check_) {
        return std::unexpected(job_check_.error());
    }
    if (auto ok = validate(tickers, config); !ok) {
        return std::unexpected(ok.error());
    }

    const size_t n = tickers.size();
    const auto batch_start = Clock::now();
    VOLBATCH_TRACE_BATCH_START(n, config.per_job_timeout.count(), config.max_concurrency);

    auto channel = std::make_shared<CompletionChannel>(n);
    std::vector<std::optional<JobResult>> outcomes(n);
    std::vector<ActiveJob> active;
    active.reserve(config.max_concurrency);

    size_t next = 0;
    auto next_launch = batch_start;

    while (next < n || !active.empty()) {
        // Fill free slots
        auto now = Clock::now();
        while (next < n && active.size() < config.max_concurrency && now >= next_launch) {
            const size_t index = next++;
            VOLBATCH_TRACE_JOB_START(index);

            ActiveJob job{index, now, saturating_add(now, config.per_job_timeout), {}};
            job.worker = std::jthread(
                [channel, fn = job_, spec = tickers[index], index, started = now](std::stop_token stop) {
                    JobResult result = invoke_job(fn, spec, stop, started);
                    std::lock_guard lock(channel->mutex);
                    if (channel->abandoned[index]) {
                        return;  // Disowned: result discarded
                    }
                    channel->results[index] = std::move(result);
                    channel->completed.push_back(index);
                    channel->cv.notify_all();
                });
            active.push_back(std::move(job));

            next_launch = saturating_add(now, config.launch_interval);
            now = Clock::now();
        }

        // Sleep until a job reports, a deadline passes, or the next launch is due
        auto wake = Clock::time_point::max();
        for (const auto& job : active) {
            wake = std::min(wake, job.deadline);
        }
        if (next < n && active.size() < config.max_concurrency) {
            wake = std::min(wake, next_launch);
        }

        std::vector<ActiveJob> finished;
        {
            std::unique_lock lock(channel->mutex);
            channel->cv.wait_until(lock, wake, [&] { return !channel->completed.empty(); });

            while (!channel->completed.empty()) {
                const size_t index = channel->completed.front();
                channel->completed.pop_front();
                outcomes[index] = std::move(channel->results[index]);
                channel->results[index].reset();

                auto it = std::find_if(active.begin(), active.end(),
                    [index](const ActiveJob& j) { return j.index == index; });
                if (it != active.end()) {
                    VOLBATCH_TRACE_JOB_COMPLETE(index, to_ms(Clock::now() - it->started).count());
                    finished.push_back(std::move(*it));
                    active.erase(it);
                }
            }

            // Disown jobs past their deadline
            const auto check = Clock::now();
            for (auto it = active.begin(); it != active.end();) {
                if (check < it->deadline) {
                    ++it;
                    continue;
                }
                const auto elapsed = to_ms(check - it->started);
                channel->abandoned[it->index] = true;
                outcomes[it->index] = std::unexpected(
                    timeout_failure(tickers[it->index], config.per_job_timeout, elapsed));
                VOLBATCH_TRACE_JOB_TIMEOUT(it->index, elapsed.count());

                it->worker.request_stop();
                it->worker.detach();
                it = active.erase(it);
            }
        }

        // Reported workers are past their last lock; joining is immediate
        for (auto& job : finished) {
            if (job.worker.joinable()) {
                job.worker.join();
            }
        }
    }

    BatchOutcome outcome;
    outcome.entries.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        outcome.entries.push_back(TickerOutcome{tickers[i].key(), std::move(*outcomes[i])});
    }
    outcome.elapsed = to_ms(Clock::now() - batch_start);

    VOLBATCH_TRACE_BATCH_COMPLETE(n, outcome.failed_count(), outcome.elapsed.count());
    return outcome;
}

}  // namespace volbatch
