// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/batch/batch_runner.hpp"
#include "src/batch/batch_summary.hpp"
#include <atomic>
#include <condition_variable>
#include <limits>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace volbatch;
using namespace std::chrono_literals;

namespace {

using Clock = std::chrono::steady_clock;
using JobResult = std::expected<TickerResult, JobFailure>;

std::vector<TickerSpec> make_specs(std::initializer_list<const char*> tickers) {
    std::vector<TickerSpec> specs;
    for (const char* t : tickers) {
        TickerSpec spec;
        spec.ticker = t;
        spec.start_date = Date(2024, 6, 21);
        specs.push_back(spec);
    }
    return specs;
}

JobResult ok_result(const TickerSpec& spec) {
    TickerResult result;
    result.ticker = spec.key();
    result.start_date = spec.start_date;
    return result;
}

/// Sleeps until the stop token fires
void wait_for_stop(std::stop_token stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait(lock, stop, [] { return false; });
}

}  // namespace

TEST(BatchRunnerTest, RejectsNonPositiveTimeout) {
    auto calls = std::make_shared<std::atomic<int>>(0);
    BatchRunner runner([calls](const TickerSpec& spec, std::stop_token) {
        ++*calls;
        return ok_result(spec);
    });

    auto specs = make_specs({"SPY"});
    auto outcome = runner.run(specs, 0ms);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ConfigErrorCode::NonPositiveTimeout);

    auto negative = runner.run(specs, -5ms);
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(calls->load(), 0);
}

TEST(BatchRunnerTest, RejectsEmptyTickerList) {
    BatchRunner runner([](const TickerSpec& spec, std::stop_token) { return ok_result(spec); });
    std::vector<TickerSpec> none;

    auto outcome = runner.run(none, 1s);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ConfigErrorCode::EmptyTickerList);

    BatchConfig lenient;
    lenient.require_tickers = false;
    auto empty = runner.run(none, lenient);
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(empty->size(), 0u);
    EXPECT_TRUE(empty->all_succeeded());
}

TEST(BatchRunnerTest, RejectsZeroConcurrency) {
    BatchRunner runner([](const TickerSpec& spec, std::stop_token) { return ok_result(spec); });
    BatchConfig config;
    config.max_concurrency = 0;

    auto outcome = runner.run(make_specs({"SPY"}), config);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ConfigErrorCode::InvalidConcurrency);
}

TEST(BatchRunnerTest, SequentialRunPreservesOrder) {
    BatchRunner runner([](const TickerSpec& spec, std::stop_token) { return ok_result(spec); });

    auto outcome = runner.run(make_specs({"SPY", "QQQ", "IWM", "AAPL"}), 5s);
    ASSERT_TRUE(outcome.has_value()) << outcome.error();
    ASSERT_EQ(outcome->size(), 4u);
    EXPECT_EQ(outcome->entries[0].ticker, "SPY");
    EXPECT_EQ(outcome->entries[1].ticker, "QQQ");
    EXPECT_EQ(outcome->entries[2].ticker, "IWM");
    EXPECT_EQ(outcome->entries[3].ticker, "AAPL");
    EXPECT_TRUE(outcome->all_succeeded());
    EXPECT_EQ(outcome->succeeded(), 4u);
}

TEST(BatchRunnerTest, ConcurrentRunPreservesSubmissionOrder) {
    struct Log {
        std::mutex mutex;
        std::vector<std::string> completed;
    };
    auto log = std::make_shared<Log>();

    BatchRunner runner([log](const TickerSpec& spec, std::stop_token) {
        auto delay = spec.ticker == "AAPL" ? 200ms : spec.ticker == "SPY" ? 100ms : 10ms;
        std::this_thread::sleep_for(delay);
        {
            std::lock_guard lock(log->mutex);
            log->completed.push_back(spec.ticker);
        }
        return ok_result(spec);
    });

    BatchConfig config;
    config.per_job_timeout = 5s;
    config.max_concurrency = 3;

    auto outcome = runner.run(make_specs({"AAPL", "MSFT", "SPY"}), config);
    ASSERT_TRUE(outcome.has_value());
    ASSERT_EQ(outcome->size(), 3u);
    EXPECT_EQ(outcome->entries[0].ticker, "AAPL");
    EXPECT_EQ(outcome->entries[1].ticker, "MSFT");
    EXPECT_EQ(outcome->entries[2].ticker, "SPY");
    EXPECT_TRUE(outcome->all_succeeded());

    std::lock_guard lock(log->mutex);
    ASSERT_EQ(log->completed.size(), 3u);
    EXPECT_EQ(log->completed.front(), "MSFT");
}

TEST(BatchRunnerTest, HangingJobTimesOutAndBatchContinues) {
    BatchRunner runner([](const TickerSpec& spec, std::stop_token stop) -> JobResult {
        if (spec.ticker == "HANG") {
            wait_for_stop(stop);
            return std::unexpected(JobFailure{JobFailureCode::UpstreamError, spec.key(), "stopped"});
        }
        return ok_result(spec);
    });

    const auto timeout = 200ms;
    const auto start = Clock::now();
    auto outcome = runner.run(make_specs({"SPY", "HANG", "QQQ"}), timeout);
    const auto wall = Clock::now() - start;

    ASSERT_TRUE(outcome.has_value());
    ASSERT_EQ(outcome->size(), 3u);
    EXPECT_TRUE(outcome->entries[0].result.has_value());
    ASSERT_FALSE(outcome->entries[1].result.has_value());
    EXPECT_EQ(outcome->entries[1].result.error().code, JobFailureCode::Timeout);
    EXPECT_EQ(outcome->entries[1].result.error().ticker, "HANG");
    EXPECT_GE(outcome->entries[1].result.error().elapsed, timeout);
    EXPECT_TRUE(outcome->entries[2].result.has_value());

    EXPECT_LT(wall, 3 * timeout);
    EXPECT_EQ(outcome->failed_count(), 1u);
}

TEST(BatchRunnerTest, UncooperativeJobIsAbandoned) {
    // Ignores its stop token entirely; the runner must not wait for it
    BatchRunner runner([](const TickerSpec& spec, std::stop_token) -> JobResult {
        if (spec.ticker == "SLOW") {
            std::this_thread::sleep_for(1500ms);
        }
        return ok_result(spec);
    });

    const auto start = Clock::now();
    auto outcome = runner.run(make_specs({"SLOW", "SPY"}), 100ms);
    const auto wall = Clock::now() - start;

    ASSERT_TRUE(outcome.has_value());
    ASSERT_FALSE(outcome->entries[0].result.has_value());
    EXPECT_EQ(outcome->entries[0].result.error().code, JobFailureCode::Timeout);
    EXPECT_TRUE(outcome->entries[1].result.has_value());
    EXPECT_LT(wall, 1000ms);
}

TEST(BatchRunnerTest, FailuresAreIsolated) {
    BatchRunner runner([](const TickerSpec& spec, std::stop_token) -> JobResult {
        if (spec.ticker == "BOOM") {
            throw std::runtime_error("unexpected payload");
        }
        if (spec.ticker == "EMPTY") {
            return std::unexpected(to_job_failure(
                TransformError{TransformErrorCode::EmptySurface, "surface has no expiries"},
                spec.key(), 0ms));
        }
        return ok_result(spec);
    });

    auto outcome = runner.run(make_specs({"SPY", "BOOM", "EMPTY", "QQQ"}), 5s);
    ASSERT_TRUE(outcome.has_value());
    ASSERT_EQ(outcome->size(), 4u);

    const auto* boom = outcome->find("BOOM");
    ASSERT_NE(boom, nullptr);
    ASSERT_FALSE(boom->result.has_value());
    EXPECT_EQ(boom->result.error().code, JobFailureCode::UpstreamError);
    EXPECT_NE(boom->result.error().reason.find("unexpected payload"), std::string::npos);

    const auto* empty = outcome->find("EMPTY");
    ASSERT_NE(empty, nullptr);
    EXPECT_EQ(empty->result.error().code, JobFailureCode::TransformError);

    EXPECT_EQ(outcome->succeeded(), 2u);
    EXPECT_EQ(outcome->failed_count(), 2u);
    EXPECT_FALSE(outcome->all_succeeded());
    EXPECT_EQ(outcome->find("MSFT"), nullptr);
}

TEST(BatchRunnerTest, ConcurrencyDoesNotChangeContent) {
    BatchRunner runner([](const TickerSpec& spec, std::stop_token) -> JobResult {
        std::this_thread::sleep_for(std::chrono::milliseconds(spec.ticker.size() * 5));
        if (spec.ticker.size() == 4) {
            return std::unexpected(JobFailure{JobFailureCode::UpstreamError, spec.key(), "no data"});
        }
        return ok_result(spec);
    });
    auto specs = make_specs({"SPY", "AAPL", "QQQ", "MSFT", "IWM", "TSLA"});

    BatchConfig sequential;
    sequential.per_job_timeout = 5s;
    BatchConfig parallel = sequential;
    parallel.max_concurrency = 4;

    auto a = runner.run(specs, sequential);
    auto b = runner.run(specs, parallel);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    ASSERT_EQ(a->size(), b->size());
    for (size_t i = 0; i < a->size(); ++i) {
        EXPECT_EQ(a->entries[i].ticker, b->entries[i].ticker);
        EXPECT_EQ(a->entries[i].result.has_value(), b->entries[i].result.has_value());
        if (a->entries[i].result && b->entries[i].result) {
            EXPECT_EQ(a->entries[i].result->ticker, b->entries[i].result->ticker);
        } else if (!a->entries[i].result && !b->entries[i].result) {
            EXPECT_EQ(a->entries[i].result.error().reason, b->entries[i].result.error().reason);
        }
    }
}

TEST(BatchRunnerTest, LaunchIntervalSpacesJobs) {
    BatchRunner runner([](const TickerSpec& spec, std::stop_token) { return ok_result(spec); });
    BatchConfig config;
    config.per_job_timeout = 5s;
    config.max_concurrency = 2;
    config.launch_interval = 50ms;

    auto outcome = runner.run(make_specs({"SPY", "QQQ", "IWM"}), config);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->all_succeeded());
    EXPECT_GE(outcome->elapsed, 100ms);
}

TEST(BatchRunnerTest, VeryLongTimeoutDoesNotExpireJobs) {
    BatchRunner runner([](const TickerSpec& spec, std::stop_token) {
        std::this_thread::sleep_for(20ms);
        return ok_result(spec);
    });
    auto specs = make_specs({"SPY", "QQQ"});

    auto centuries = runner.run(specs, std::chrono::hours{24 * 365 * 400});
    ASSERT_TRUE(centuries.has_value());
    EXPECT_TRUE(centuries->all_succeeded());

    BatchConfig unbounded;
    unbounded.per_job_timeout = std::chrono::milliseconds::max();
    unbounded.max_concurrency = 2;
    unbounded.launch_interval = std::chrono::milliseconds::max();
    auto outcome = runner.run(make_specs({"SPY"}), unbounded);
    ASSERT_TRUE(outcome.has_value());
    ASSERT_EQ(outcome->size(), 1u);
    EXPECT_TRUE(outcome->all_succeeded());

    unbounded.launch_interval = 0ms;
    auto both = runner.run(specs, unbounded);
    ASSERT_TRUE(both.has_value());
    EXPECT_TRUE(both->all_succeeded());
}

TEST(BatchRunnerTest, MillisecondsFromSeconds) {
    auto two = milliseconds_from_seconds(2.5);
    ASSERT_TRUE(two.has_value());
    EXPECT_EQ(*two, 2500ms);

    auto zero = milliseconds_from_seconds(0.0);
    ASSERT_TRUE(zero.has_value());
    EXPECT_EQ(*zero, 0ms);

    auto huge = milliseconds_from_seconds(1e300);
    ASSERT_TRUE(huge.has_value());
    EXPECT_EQ(*huge, std::chrono::milliseconds::max());

    for (double bad : {std::numeric_limits<double>::quiet_NaN(),
                       std::numeric_limits<double>::infinity(),
                       -std::numeric_limits<double>::infinity(), -1.0}) {
        auto ms = milliseconds_from_seconds(bad);
        ASSERT_FALSE(ms.has_value()) << bad;
        EXPECT_EQ(ms.error().code, ConfigErrorCode::InvalidDuration);
    }
}

TEST(BatchRunnerTest, TickerJobValidation) {
    TickerJob no_sources(nullptr, nullptr);
    auto missing = BatchRunner(no_sources).run(make_specs({"SPY"}), 1s);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ConfigErrorCode::MissingCollaborator);
}

TEST(BatchRunnerTest, BatchSummaryListsEveryTicker) {
    BatchRunner runner([](const TickerSpec& spec, std::stop_token) -> JobResult {
        if (spec.ticker == "BAD") {
            return std::unexpected(JobFailure{JobFailureCode::UpstreamError, spec.key(), "NotFound: x", 3ms});
        }
        return ok_result(spec);
    });
    auto outcome = runner.run(make_specs({"SPY", "BAD"}), 5s);
    ASSERT_TRUE(outcome.has_value());

    auto doc = batch_summary_json(*outcome);
    ASSERT_EQ(doc["tickers"].size(), 2u);
    EXPECT_EQ(doc["tickers"][0]["ticker"], "SPY");
    EXPECT_EQ(doc["tickers"][0]["status"], "ok");
    EXPECT_EQ(doc["tickers"][1]["status"], "UpstreamError");
    EXPECT_EQ(doc["tickers"][1]["reason"], "NotFound: x");
    EXPECT_EQ(doc["succeeded"], 1);
    EXPECT_EQ(doc["failed"], 1);
}
