// SPDX-License-Identifier: MIT
#include "src/report/skew_report.hpp"
#include "src/core/sanitize.hpp"
#include <algorithm>
#include <cmath>

namespace volbatch {

namespace {

bool is_atm(double strike, double atm_strike) {
    return std::abs(strike - atm_strike) <= 1e-9 * std::max(1.0, std::abs(atm_strike));
}

}  // namespace

std::string strike_column_label(double strike, double atm_strike) {
    if (is_atm(strike, atm_strike)) {
        return "ATM";
    }
    return format_strike(strike) + "%";
}

std::string skew_metric_name(double strike, double atm_strike) {
    double shift = strike - atm_strike;
    std::string sign = shift < 0.0 ? "-" : "+";
    return sign + format_strike(std::abs(shift)) + "% Skew";
}

SkewData SkewReportBuilder::build_skew_data(const std::string& ticker,
                                            const Date& start_date,
                                            const SkewGrid& grid) const
{
    SkewData data;
    data.ticker = ticker;
    data.start_date = start_date;

    std::optional<size_t> atm_idx;
    data.columns.reserve(grid.strikes.size());
    for (size_t i = 0; i < grid.strikes.size(); ++i) {
        data.columns.push_back(strike_column_label(grid.strikes[i], config_.atm_strike));
        if (is_atm(grid.strikes[i], config_.atm_strike)) {
            atm_idx = i;
        }
    }

    data.rows.reserve(grid.rows.size());
    for (const auto& grid_row : grid.rows) {
        SkewRow row;
        row.month = grid_row.bucket.months;
        row.label = std::to_string(grid_row.bucket.months);
        row.vols = grid_row.vols;

        // Skew columns need an ATM anchor
        if (atm_idx) {
            const auto& atm_vol = grid_row.vols[*atm_idx];
            for (size_t i = 0; i < grid.strikes.size(); ++i) {
                if (i == *atm_idx) continue;
                SkewMetric metric;
                metric.name = skew_metric_name(grid.strikes[i], config_.atm_strike);
                if (atm_vol && grid_row.vols[i]) {
                    double skew = (*grid_row.vols[i] - *atm_vol) / config_.skew_divisor;
                    metric.value = sanitize(round_to(skew, config_.metric_decimals));
                }
                row.metrics.push_back(std::move(metric));
            }
        }
        data.rows.push_back(std::move(row));
    }
    return data;
}

TickerResult SkewReportBuilder::build(std::string ticker,
                                      const Date& start_date,
                                      SurfaceSummary raw_surface_summary,
                                      SkewGrid grid) const
{
    TickerResult result;
    result.skew_data = build_skew_data(ticker, start_date, grid);
    result.ticker = std::move(ticker);
    result.start_date = start_date;
    result.data = std::move(raw_surface_summary);
    result.skew = std::move(grid);
    return result;
}

}  // namespace volbatch
