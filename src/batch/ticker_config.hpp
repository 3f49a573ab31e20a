// SPDX-License-Identifier: MIT
/**
 * @file ticker_config.hpp
 * @brief Ticker map: the set of tickers a batch run processes
 */

#pragma once

#include "src/batch/collaborators.hpp"
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace volbatch {

/// One ticker map entry
struct TickerInfo {
    std::string key;      ///< Map key, used for output naming ("SPX")
    std::string ticker;   ///< Data-source symbol ("^SPX")
    std::string name;     ///< Display name
    std::optional<double> div_yield;
};

/// Ordered ticker map (file order is processing order)
struct TickerMap {
    std::vector<TickerInfo> entries;

    [[nodiscard]] const TickerInfo* find(const std::string& key) const;
    [[nodiscard]] bool empty() const { return entries.empty(); }
    [[nodiscard]] size_t size() const { return entries.size(); }
};

/// Load `{"AAPL": {"ticker": "AAPL", "name": "Apple", "divYield": 0.0044}, ...}`
std::expected<TickerMap, std::string> load_ticker_map(const std::filesystem::path& path);

/// Write the map back in the same format
std::expected<void, std::string> save_ticker_map(const TickerMap& map,
                                                 const std::filesystem::path& path);

/// Dividend yield per key, missing yields as 0.0
///
/// SPX takes SPY's yield when both are present.
std::map<std::string, double> dividend_map(const TickerMap& map);

/// Run parameters shared by every ticker of a batch
struct SpecDefaults {
    Date start_date;
    bool use_dividends = false;
    double interest_rate = 0.05;
    std::string discount_method = "smooth";
};

/// Spec for one map entry
TickerSpec make_ticker_spec(const TickerInfo& info, const SpecDefaults& defaults,
                            std::optional<double> dividend_yield);

/// Specs for every entry, in map order
std::vector<TickerSpec> to_ticker_specs(const TickerMap& map, const SpecDefaults& defaults);

}  // namespace volbatch
