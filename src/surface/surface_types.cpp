// SPDX-License-Identifier: MIT
#include "src/surface/surface_types.hpp"
#include <algorithm>
#include <charconv>
#include <string>
#include <system_error>

namespace volbatch {

std::vector<Date> RawSurface::expiry_dates() const {
    std::vector<Date> dates;
    dates.reserve(points.size());
    for (const auto& pt : points) {
        dates.push_back(pt.expiry);
    }
    std::sort(dates.begin(), dates.end());
    dates.erase(std::unique(dates.begin(), dates.end()), dates.end());
    return dates;
}

std::optional<double> SkewGrid::at(std::string_view label, std::string_view strike_key) const {
    const Row* row = find(label);
    if (!row) return std::nullopt;
    for (size_t i = 0; i < strike_keys.size(); ++i) {
        if (strike_keys[i] == strike_key) {
            return row->vols[i];
        }
    }
    return std::nullopt;
}

size_t SkewGrid::populated_count() const {
    size_t count = 0;
    for (const auto& row : rows) {
        count += static_cast<size_t>(std::count_if(row.vols.begin(), row.vols.end(),
            [](const std::optional<double>& v) { return v.has_value(); }));
    }
    return count;
}

std::string format_strike(double strike) {
    // Shortest round-trip digits in fixed notation: 100000 stays "100000"
    char buf[400];
    auto r = std::to_chars(buf, buf + sizeof(buf), strike, std::chars_format::fixed);
    if (r.ec != std::errc{}) {
        return std::to_string(strike);
    }
    return std::string(buf, r.ptr);
}

}  // namespace volbatch
