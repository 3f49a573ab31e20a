// SPDX-License-Identifier: MIT
/**
 * @file skew_report.hpp
 * @brief Per-ticker output envelope: surface data, skew grid and skew report
 */

#pragma once

#include "src/core/date.hpp"
#include "src/surface/surface_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace volbatch {

/// Configuration for the derived skew columns
struct ReportConfig {
    double atm_strike = 100.0;   ///< Grid strike labelled "ATM"
    double skew_divisor = 20.0;  ///< (vol_k - vol_atm) / skew_divisor
    int metric_decimals = 2;     ///< Rounding of the skew columns
};

/// Parameters the surface was computed with
struct RunParameters {
    std::string discount_method;
    bool use_dividends = false;
    std::optional<double> interest_rate;
    std::optional<double> dividend_yield;
    std::optional<double> zero_rate_1y;   ///< 1y zero rate of the discount curve
    int bucket_count = 0;
    std::vector<double> strike_grid;
};

/// Raw surface plus run parameters (the `data_dict` part of the envelope)
struct SurfaceSummary {
    RawSurface surface;
    Date observation;
    RunParameters params;
};

/// Named derived metric of a skew row
struct SkewMetric {
    std::string name;             // "-20% Skew"
    std::optional<double> value;  // nullopt when either input vol is missing
};

/// One tenor row of the skew report
struct SkewRow {
    int month = 0;
    std::string label;                        // Month index as text ("1")
    std::vector<std::optional<double>> vols;  // Parallel to SkewData::columns
    std::vector<SkewMetric> metrics;          // One per non-ATM strike
};

/// Self-describing skew report (the `skew_data` part of the envelope)
struct SkewData {
    std::vector<std::string> columns;  // "80%", "90%", "ATM", "110%", "120%"
    std::vector<SkewRow> rows;
    std::string ticker;
    Date start_date;
};

/// Output of one successful ticker job
struct TickerResult {
    std::string ticker;
    Date start_date;
    SurfaceSummary data;  // data_dict
    SkewGrid skew;        // skew_dict
    SkewData skew_data;   // skew_data
};

/// Assembles the three-part envelope
///
/// Pure function of its inputs: no I/O, no clock.
class SkewReportBuilder {
public:
    explicit SkewReportBuilder(ReportConfig config = {}) : config_(config) {}

    [[nodiscard]] TickerResult build(std::string ticker,
                                     const Date& start_date,
                                     SurfaceSummary raw_surface_summary,
                                     SkewGrid grid) const;

    /// Skew report rows for a grid
    [[nodiscard]] SkewData build_skew_data(const std::string& ticker,
                                           const Date& start_date,
                                           const SkewGrid& grid) const;

    [[nodiscard]] const ReportConfig& config() const { return config_; }

private:
    ReportConfig config_;
};

/// Column label of a grid strike ("ATM" or "<strike>%")
std::string strike_column_label(double strike, double atm_strike);

/// Skew metric name for a grid strike ("-20% Skew", "+10% Skew")
std::string skew_metric_name(double strike, double atm_strike);

}  // namespace volbatch
