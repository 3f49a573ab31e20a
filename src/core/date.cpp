// SPDX-License-Identifier: MIT
#include "src/core/date.hpp"
#include <charconv>
#include <cstdio>

namespace volbatch {

namespace {

std::expected<Date, std::string> make_date(int year, int month, int day, std::string_view s) {
    std::chrono::year_month_day ymd{
        std::chrono::year{year},
        std::chrono::month{static_cast<unsigned>(month)},
        std::chrono::day{static_cast<unsigned>(day)}};
    if (month < 1 || day < 1 || !ymd.ok()) {
        return std::unexpected("Invalid date: " + std::string(s));
    }
    return Date{std::chrono::sys_days{ymd}};
}

bool parse_field(std::string_view s, size_t pos, size_t len, int& out) {
    if (pos + len > s.size()) return false;
    const char* first = s.data() + pos;
    const char* last = first + len;
    auto r = std::from_chars(first, last, out);
    return r.ec == std::errc{} && r.ptr == last;
}

}  // namespace

std::expected<Date, std::string> Date::parse(std::string_view s, DateFormat format) {
    int year = 0, month = 0, day = 0;

    if (format == DateFormat::Compact) {
        if (s.size() != 8) {
            return std::unexpected("Compact format must be 8 digits: " + std::string(s));
        }
        if (!parse_field(s, 0, 4, year) || !parse_field(s, 4, 2, month) ||
            !parse_field(s, 6, 2, day)) {
            return std::unexpected("Failed to parse compact date: " + std::string(s));
        }
        return make_date(year, month, day, s);
    }

    // Date part first, an optional "THH:MM:SS" suffix is ignored
    if (s.size() < 10 || s[4] != '-' || s[7] != '-' ||
        (s.size() > 10 && s[10] != 'T' && s[10] != ' ')) {
        return std::unexpected("Failed to parse ISO date: " + std::string(s));
    }
    if (!parse_field(s, 0, 4, year) || !parse_field(s, 5, 2, month) ||
        !parse_field(s, 8, 2, day)) {
        return std::unexpected("Failed to parse ISO date: " + std::string(s));
    }
    return make_date(year, month, day, s);
}

Date Date::today() {
    return Date{std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
}

Date Date::add_months(int months) const {
    auto ymd = this->ymd();
    auto target = std::chrono::year_month{ymd.year(), ymd.month()} + std::chrono::months{months};
    auto last = std::chrono::year_month_day_last{target.year(), std::chrono::month_day_last{target.month()}};
    auto day = ymd.day() > last.day() ? last.day() : ymd.day();
    return Date{std::chrono::sys_days{std::chrono::year_month_day{target.year(), target.month(), day}}};
}

std::string Date::to_string() const {
    auto ymd = this->ymd();
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()));
    return buf;
}

}  // namespace volbatch
