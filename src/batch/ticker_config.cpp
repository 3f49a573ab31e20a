// SPDX-License-Identifier: MIT
#include "src/batch/ticker_config.hpp"
#include "src/report/json_output.hpp"

namespace volbatch {

const TickerInfo* TickerMap::find(const std::string& key) const {
    for (const auto& entry : entries) {
        if (entry.key == key) return &entry;
    }
    return nullptr;
}

std::expected<TickerMap, std::string> load_ticker_map(const std::filesystem::path& path) {
    auto doc = read_json_file(path);
    if (!doc) {
        return std::unexpected(doc.error());
    }
    if (!doc->is_object()) {
        return std::unexpected("Ticker map must be a JSON object: " + path.string());
    }

    TickerMap map;
    for (const auto& [key, value] : doc->items()) {
        if (!value.is_object()) {
            return std::unexpected("Ticker map entry is not an object: " + key);
        }
        TickerInfo info;
        info.key = key;
        info.ticker = key;
        if (auto it = value.find("ticker"); it != value.end()) {
            if (!it->is_string()) {
                return std::unexpected("'ticker' must be a string for " + key);
            }
            info.ticker = it->get<std::string>();
        }
        if (auto it = value.find("name"); it != value.end() && it->is_string()) {
            info.name = it->get<std::string>();
        }
        if (auto it = value.find("divYield"); it != value.end() && !it->is_null()) {
            if (!it->is_number()) {
                return std::unexpected("'divYield' must be a number for " + key);
            }
            info.div_yield = it->get<double>();
        }
        map.entries.push_back(std::move(info));
    }
    return map;
}

std::expected<void, std::string> save_ticker_map(const TickerMap& map,
                                                 const std::filesystem::path& path)
{
    Json doc = Json::object();
    for (const auto& entry : map.entries) {
        Json value = Json::object();
        value["ticker"] = entry.ticker;
        value["name"] = entry.name;
        value["divYield"] = json_number(entry.div_yield);
        doc[entry.key] = std::move(value);
    }
    auto written = write_json_file(doc, path, 2);
    if (!written) {
        return std::unexpected(written.error());
    }
    return {};
}

std::map<std::string, double> dividend_map(const TickerMap& map) {
    std::map<std::string, double> divs;
    for (const auto& entry : map.entries) {
        divs[entry.key] = entry.div_yield.value_or(0.0);
    }
    // Index options use the tracking ETF's yield
    if (divs.contains("SPX") && divs.contains("SPY")) {
        divs["SPX"] = divs["SPY"];
    }
    return divs;
}

TickerSpec make_ticker_spec(const TickerInfo& info, const SpecDefaults& defaults,
                            std::optional<double> dividend_yield)
{
    TickerSpec spec;
    spec.ticker = info.ticker;
    spec.output_key = info.key;
    spec.start_date = defaults.start_date;
    spec.use_dividends = defaults.use_dividends;
    spec.dividend_yield = dividend_yield;
    spec.interest_rate = defaults.interest_rate;
    spec.discount_method = defaults.discount_method;
    return spec;
}

std::vector<TickerSpec> to_ticker_specs(const TickerMap& map, const SpecDefaults& defaults) {
    auto divs = dividend_map(map);
    std::vector<TickerSpec> specs;
    specs.reserve(map.size());
    for (const auto& entry : map.entries) {
        specs.push_back(make_ticker_spec(entry, defaults, divs[entry.key]));
    }
    return specs;
}

}  // namespace volbatch
