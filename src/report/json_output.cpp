// SPDX-License-Identifier: MIT
#include "src/report/json_output.hpp"
#include "src/core/sanitize.hpp"
#include "src/support/volbatch_trace.h"
#include <fstream>
#include <sstream>

namespace volbatch {

Json json_number(std::optional<double> value) {
    auto clean = sanitize(value);
    if (!clean) {
        return Json(nullptr);
    }
    return Json(*clean);
}

Json json_number(double value) {
    return json_number(std::optional<double>{value});
}

Json skew_dict_to_json(const SkewGrid& grid, const std::string& ticker, const Date& start_date) {
    Json doc = Json::object();
    for (const auto& row : grid.rows) {
        Json cells = Json::object();
        for (size_t i = 0; i < grid.strike_keys.size(); ++i) {
            cells[grid.strike_keys[i]] = json_number(row.vols[i]);
        }
        doc[row.bucket.label] = std::move(cells);
    }
    doc["ticker"] = ticker;
    doc["start_date"] = start_date.to_string();
    return doc;
}

Json skew_data_to_json(const SkewData& data) {
    Json rows = Json::object();
    for (const auto& row : data.rows) {
        Json cells = Json::object();
        for (size_t i = 0; i < data.columns.size(); ++i) {
            cells[data.columns[i]] = json_number(row.vols[i]);
        }
        for (const auto& metric : row.metrics) {
            cells[metric.name] = json_number(metric.value);
        }
        cells["label"] = row.label;
        rows[row.label] = std::move(cells);
    }

    Json doc = Json::object();
    doc["skew_dict"] = std::move(rows);
    doc["ticker"] = data.ticker;
    doc["start_date"] = data.start_date.to_string();
    return doc;
}

Json data_dict_to_json(const SurfaceSummary& summary) {
    const auto& p = summary.params;

    Json params = Json::object();
    params["discount_method"] = p.discount_method;
    params["use_dividends"] = p.use_dividends;
    params["interest_rate"] = json_number(p.interest_rate);
    params["dividend_yield"] = json_number(p.dividend_yield);
    params["zero_rate_1y"] = json_number(p.zero_rate_1y);
    params["skew_tenors"] = p.bucket_count;
    Json strikes = Json::array();
    for (double k : p.strike_grid) {
        strikes.push_back(json_number(k));
    }
    params["strike_grid"] = std::move(strikes);

    const auto& s = summary.surface;
    Json surface = Json::object();
    surface["ticker"] = s.ticker;
    surface["observation_date"] = summary.observation.to_string();
    surface["quote_date"] = s.quote_date ? Json(s.quote_date->to_string()) : Json(nullptr);
    surface["spot"] = json_number(sanitize(s.spot));

    Json expiries = Json::array();
    for (const auto& d : s.expiry_dates()) {
        expiries.push_back(d.to_string());
    }
    surface["expiries"] = std::move(expiries);

    Json points = Json::array();
    for (const auto& pt : s.points) {
        Json entry = Json::object();
        entry["expiry"] = pt.expiry.to_string();
        entry["strike"] = json_number(pt.strike);
        entry["iv"] = json_number(pt.implied_vol);
        entry["open_interest"] = pt.open_interest ? Json(*pt.open_interest) : Json(nullptr);
        points.push_back(std::move(entry));
    }
    surface["points"] = std::move(points);

    Json doc = Json::object();
    doc["params"] = std::move(params);
    doc["surface"] = std::move(surface);
    return doc;
}

Json to_json(const TickerResult& result) {
    Json doc = Json::object();
    doc["data_dict"] = data_dict_to_json(result.data);
    doc["skew_dict"] = skew_dict_to_json(result.skew, result.ticker, result.start_date);
    doc["skew_data"] = skew_data_to_json(result.skew_data);
    return doc;
}

std::string dump_json(const Json& doc, int indent) {
    return doc.dump(indent, ' ', false, Json::error_handler_t::replace);
}

std::expected<size_t, std::string> write_json_file(const Json& doc,
                                                   const std::filesystem::path& path,
                                                   int indent)
{
    std::string text = dump_json(doc, indent);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected("Cannot open for writing: " + path.string());
    }
    out << text;
    out.close();
    if (!out) {
        return std::unexpected("Write failed: " + path.string());
    }

    VOLBATCH_TRACE_FILE_WRITTEN(text.size());
    return text.size();
}

std::expected<Json, std::string> read_json_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected("Cannot open: " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    Json doc = Json::parse(buffer.str(), nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return std::unexpected("Invalid JSON in " + path.string());
    }
    return doc;
}

}  // namespace volbatch
