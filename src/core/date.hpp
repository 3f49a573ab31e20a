// SPDX-License-Identifier: MIT
/**
 * @file date.hpp
 * @brief Calendar date type used for observation and expiry dates
 */

#pragma once

#include <chrono>
#include <compare>
#include <expected>
#include <string>
#include <string_view>

namespace volbatch {

/// Date string format
enum class DateFormat {
    ISO,      // "2024-06-21" or "2024-06-21T10:30:00" (time ignored)
    Compact   // "20240621"
};

/// Calendar date (UTC day resolution)
class Date {
public:
    using Days = std::chrono::sys_days;

    Date() = default;

    explicit Date(Days days) : days_(days) {}

    /// Construct from year, month (1-12), day (1-31). Caller guarantees validity.
    Date(int year, unsigned month, unsigned day)
        : days_(std::chrono::year_month_day{
              std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}}) {}

    /// Parse a date string
    static std::expected<Date, std::string> parse(
        std::string_view s, DateFormat format = DateFormat::ISO);

    /// Current UTC date
    static Date today();

    [[nodiscard]] Days days() const { return days_; }

    [[nodiscard]] std::chrono::year_month_day ymd() const {
        return std::chrono::year_month_day{days_};
    }

    /// Same day-of-month `months` calendar months later, clamped to month end
    ///
    /// 2024-01-31 + 1 month is 2024-02-29.
    [[nodiscard]] Date add_months(int months) const;

    /// ISO "YYYY-MM-DD"
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const Date&, const Date&) = default;
    friend auto operator<=>(const Date&, const Date&) = default;

private:
    Days days_{};
};

/// Signed number of days from `from` to `to`
inline int days_between(const Date& from, const Date& to) {
    return static_cast<int>((to.days() - from.days()).count());
}

}  // namespace volbatch
