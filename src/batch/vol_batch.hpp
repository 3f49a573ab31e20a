// SPDX-License-Identifier: MIT
/**
 * @file vol_batch.hpp
 * @brief Single-ticker and batch entry points
 */

#pragma once

#include "src/batch/batch_runner.hpp"
#include "src/batch/ticker_config.hpp"
#include "src/report/json_output.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace volbatch {

/// Invocation parameters
struct VolBatchParams {
    double interest_rate = 0.05;             ///< Flat rate used with explicit dividends
    std::string discount_type = "smooth";    ///< Discount method when not using dividends
    std::filesystem::path output_dir = ".";  ///< Where `<TICKER>.json` files are written
    int json_indent = -1;                    ///< -1 = compact

    ReshapeConfig reshape;
    ReportConfig report;
    BatchConfig batch;
};

/// Persistence result of one ticker
struct SavedFile {
    std::string ticker;
    std::expected<std::filesystem::path, std::string> path;
};

/// Result of a process_* call
struct ProcessResult {
    BatchOutcome outcome;
    std::vector<SavedFile> saved;  ///< One entry per successful ticker when saving

    [[nodiscard]] size_t save_failures() const {
        size_t count = 0;
        for (const auto& f : saved) {
            if (!f.path) ++count;
        }
        return count;
    }
};

/// Entry points equivalent to `process_single_ticker` and `process_batch`
///
/// Both build TickerSpec entries from the ticker map and the parameters and
/// delegate to BatchRunner. Nothing is shared between calls except the
/// immutable collaborators.
class VolBatch {
public:
    VolBatch(VolBatchParams params,
             TickerMap tickers,
             std::shared_ptr<const SurfaceSource> surface_source,
             std::shared_ptr<const DiscountSource> discount_source)
        : params_(std::move(params))
        , tickers_(std::move(tickers))
        , job_(std::move(surface_source), std::move(discount_source),
               params_.reshape, params_.report) {}

    /// Process one ticker
    ///
    /// A ticker missing from the map is still processed; it has no dividend
    /// yield, so `use_dividends` fails it as an upstream error.
    /// On success the encoded document is kept (see vol_data()).
    std::expected<ProcessResult, ConfigError> process_single_ticker(
        const std::string& ticker, const Date& start_date, bool use_dividends, bool save);

    /// Process every ticker of the map in map order
    std::expected<ProcessResult, ConfigError> process_batch(
        const Date& start_date, bool use_dividends, bool save);

    /// Document of the last successful single-ticker call
    [[nodiscard]] const std::optional<Json>& vol_data() const { return vol_data_; }

    /// Write the last single-ticker document (default `<output_dir>/<ticker>.json`)
    std::expected<std::filesystem::path, std::string> save_vol_data(
        std::optional<std::filesystem::path> filename = std::nullopt) const;

    [[nodiscard]] const VolBatchParams& params() const { return params_; }
    [[nodiscard]] const TickerMap& tickers() const { return tickers_; }

private:
    SpecDefaults defaults(const Date& start_date, bool use_dividends) const;
    std::expected<ProcessResult, ConfigError> run(const std::vector<TickerSpec>& specs, bool save) const;

    VolBatchParams params_;
    TickerMap tickers_;
    TickerJob job_;

    std::optional<Json> vol_data_;
    std::string vol_data_ticker_;
};

}  // namespace volbatch
