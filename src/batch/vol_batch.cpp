// SPDX-License-Identifier: MIT
#include "src/batch/vol_batch.hpp"
#include <system_error>

namespace volbatch {

SpecDefaults VolBatch::defaults(const Date& start_date, bool use_dividends) const {
    SpecDefaults d;
    d.start_date = start_date;
    d.use_dividends = use_dividends;
    d.interest_rate = params_.interest_rate;
    d.discount_method = params_.discount_type;
    return d;
}

std::expected<ProcessResult, ConfigError> VolBatch::run(const std::vector<TickerSpec>& specs,
                                                        bool save) const
{
    BatchRunner runner(job_);
    auto outcome = runner.run(specs, params_.batch);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }

    ProcessResult result{std::move(*outcome), {}};
    if (!save) {
        return result;
    }

    std::error_code ec;
    std::filesystem::create_directories(params_.output_dir, ec);

    for (const auto& entry : result.outcome.entries) {
        if (!entry.result) continue;
        if (ec) {
            result.saved.push_back(SavedFile{entry.ticker, std::unexpected(
                "Cannot create " + params_.output_dir.string() + ": " + ec.message())});
            continue;
        }
        auto path = params_.output_dir / (entry.ticker + ".json");
        auto written = write_json_file(to_json(*entry.result), path, params_.json_indent);
        if (written) {
            result.saved.push_back(SavedFile{entry.ticker, path});
        } else {
            result.saved.push_back(SavedFile{entry.ticker, std::unexpected(written.error())});
        }
    }
    return result;
}

std::expected<ProcessResult, ConfigError> VolBatch::process_single_ticker(
    const std::string& ticker, const Date& start_date, bool use_dividends, bool save)
{
    TickerInfo info{ticker, ticker, ticker, std::nullopt};
    std::optional<double> div_yield;
    if (const auto* known = tickers_.find(ticker)) {
        info = *known;
        div_yield = dividend_map(tickers_)[ticker];
    }

    std::vector<TickerSpec> specs{make_ticker_spec(info, defaults(start_date, use_dividends), div_yield)};

    auto result = run(specs, save);
    if (!result) {
        return result;
    }

    const auto& entry = result->outcome.entries.front();
    if (entry.result) {
        vol_data_ = to_json(*entry.result);
        vol_data_ticker_ = entry.ticker;
    }
    return result;
}

std::expected<ProcessResult, ConfigError> VolBatch::process_batch(
    const Date& start_date, bool use_dividends, bool save)
{
    return run(to_ticker_specs(tickers_, defaults(start_date, use_dividends)), save);
}

std::expected<std::filesystem::path, std::string> VolBatch::save_vol_data(
    std::optional<std::filesystem::path> filename) const
{
    if (!vol_data_) {
        return std::unexpected(std::string("No vol data to save"));
    }
    auto path = filename.value_or(params_.output_dir / (vol_data_ticker_ + ".json"));
    auto written = write_json_file(*vol_data_, path, params_.json_indent);
    if (!written) {
        return std::unexpected(written.error());
    }
    return path;
}

}  // namespace volbatch
