// SPDX-License-Identifier: MIT
#include "src/batch/file_sources.hpp"
#include "src/report/json_output.hpp"
#include <cmath>
#include <limits>
#include <system_error>

namespace volbatch {

namespace {

std::unexpected<UpstreamError> malformed(const std::string& reason) {
    return std::unexpected(UpstreamError{UpstreamErrorCode::Malformed, reason});
}

std::expected<RawSurfacePoint, UpstreamError> parse_point(const Json& entry, size_t index) {
    const std::string where = "points[" + std::to_string(index) + "]";
    if (!entry.is_object()) {
        return malformed(where + " is not an object");
    }

    auto expiry_it = entry.find("expiry");
    if (expiry_it == entry.end() || !expiry_it->is_string()) {
        return malformed(where + ": missing 'expiry'");
    }
    auto expiry = Date::parse(expiry_it->get<std::string>());
    if (!expiry) {
        return malformed(where + ": " + expiry.error());
    }

    auto strike_it = entry.find("strike");
    if (strike_it == entry.end() || !strike_it->is_number()) {
        return malformed(where + ": missing 'strike'");
    }

    RawSurfacePoint pt;
    pt.expiry = *expiry;
    pt.strike = strike_it->get<double>();
    pt.implied_vol = std::numeric_limits<double>::quiet_NaN();

    if (auto iv_it = entry.find("iv"); iv_it != entry.end() && !iv_it->is_null()) {
        if (!iv_it->is_number()) {
            return malformed(where + ": 'iv' must be a number or null");
        }
        pt.implied_vol = iv_it->get<double>();
    }
    if (auto oi_it = entry.find("open_interest"); oi_it != entry.end() && oi_it->is_number_integer()) {
        pt.open_interest = oi_it->get<int64_t>();
    }
    return pt;
}

}  // namespace

std::expected<RawSurface, UpstreamError> JsonSnapshotSurfaceSource::fetch(
    const TickerSpec& spec, const DiscountInputs& /*discount*/, std::stop_token stop) const
{
    if (stop.stop_requested()) {
        return std::unexpected(UpstreamError{UpstreamErrorCode::Cancelled, "stop requested"});
    }

    const auto path = snapshot_path(spec.ticker);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(UpstreamError{
            UpstreamErrorCode::NotFound, "no snapshot for " + spec.ticker + " at " + path.string()});
    }

    auto doc = read_json_file(path);
    if (!doc) {
        return malformed(doc.error());
    }
    if (!doc->is_object()) {
        return malformed("snapshot root is not an object");
    }

    RawSurface surface;
    surface.ticker = spec.ticker;
    if (auto it = doc->find("ticker"); it != doc->end() && it->is_string()) {
        surface.ticker = it->get<std::string>();
    }

    if (auto it = doc->find("quote_date"); it != doc->end() && it->is_string()) {
        auto date = Date::parse(it->get<std::string>());
        if (!date) {
            return malformed("quote_date: " + date.error());
        }
        surface.quote_date = *date;
    }

    if (auto it = doc->find("spot_fixed9"); it != doc->end() && it->is_number_integer()) {
        surface.spot = Numeric{it->get<int64_t>(), NumericFormat::FixedPoint9};
    } else if (auto it2 = doc->find("spot"); it2 != doc->end() && it2->is_number()) {
        surface.spot = Numeric{it2->get<double>()};
    }

    auto points_it = doc->find("points");
    if (points_it == doc->end() || !points_it->is_array()) {
        return malformed("snapshot has no 'points' array");
    }
    surface.points.reserve(points_it->size());
    for (size_t i = 0; i < points_it->size(); ++i) {
        if (stop.stop_requested()) {
            return std::unexpected(UpstreamError{UpstreamErrorCode::Cancelled, "stop requested"});
        }
        auto pt = parse_point((*points_it)[i], i);
        if (!pt) {
            return std::unexpected(pt.error());
        }
        surface.points.push_back(*pt);
    }
    return surface;
}

std::expected<DiscountInputs, UpstreamError> ConfiguredDiscountSource::fetch(
    const TickerSpec& spec, std::stop_token stop) const
{
    if (stop.stop_requested()) {
        return std::unexpected(UpstreamError{UpstreamErrorCode::Cancelled, "stop requested"});
    }
    if (!std::isfinite(spec.interest_rate)) {
        return std::unexpected(UpstreamError{UpstreamErrorCode::Malformed, "interest rate is not finite"});
    }

    DiscountInputs inputs;
    inputs.curve = DiscountCurve::flat(spec.interest_rate);

    if (spec.use_dividends) {
        if (!spec.dividend_yield) {
            return std::unexpected(UpstreamError{
                UpstreamErrorCode::NotFound, "no dividend yield for " + spec.ticker});
        }
        inputs.dividend_yield = *spec.dividend_yield;
        inputs.method = "dividend_yield";
        return inputs;
    }

    if (!methods_.contains(spec.discount_method)) {
        return std::unexpected(UpstreamError{
            UpstreamErrorCode::Unsupported, "unknown discount method '" + spec.discount_method + "'"});
    }
    inputs.method = spec.discount_method;
    return inputs;
}

}  // namespace volbatch
