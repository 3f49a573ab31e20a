// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/core/date.hpp"

using namespace volbatch;

TEST(DateTest, ParseISODate) {
    auto d = Date::parse("2024-06-21");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, Date(2024, 6, 21));
    EXPECT_EQ(d->to_string(), "2024-06-21");
}

TEST(DateTest, ParseISODateWithTimeSuffix) {
    auto with_t = Date::parse("2024-06-21T10:30:00");
    auto with_space = Date::parse("2024-06-21 16:00:00");
    ASSERT_TRUE(with_t.has_value());
    ASSERT_TRUE(with_space.has_value());
    EXPECT_EQ(*with_t, Date(2024, 6, 21));
    EXPECT_EQ(*with_space, Date(2024, 6, 21));
}

TEST(DateTest, ParseCompactDate) {
    auto d = Date::parse("20240621", DateFormat::Compact);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, Date(2024, 6, 21));
}

TEST(DateTest, RejectsMalformedInput) {
    EXPECT_FALSE(Date::parse("").has_value());
    EXPECT_FALSE(Date::parse("2024/06/21").has_value());
    EXPECT_FALSE(Date::parse("2024-6-21").has_value());
    EXPECT_FALSE(Date::parse("2024-06-21X").has_value());
    EXPECT_FALSE(Date::parse("2024062", DateFormat::Compact).has_value());
}

TEST(DateTest, RejectsImpossibleCalendarDates) {
    EXPECT_FALSE(Date::parse("2024-02-30").has_value());
    EXPECT_FALSE(Date::parse("2023-02-29").has_value());
    EXPECT_FALSE(Date::parse("2024-13-01").has_value());
    EXPECT_FALSE(Date::parse("2024-00-10").has_value());
    EXPECT_TRUE(Date::parse("2024-02-29").has_value());
}

TEST(DateTest, ErrorMentionsInput) {
    auto d = Date::parse("not-a-date");
    ASSERT_FALSE(d.has_value());
    EXPECT_NE(d.error().find("not-a-date"), std::string::npos);
}

TEST(DateTest, AddMonthsKeepsDayOfMonth) {
    EXPECT_EQ(Date(2024, 6, 15).add_months(1), Date(2024, 7, 15));
    EXPECT_EQ(Date(2024, 11, 15).add_months(3), Date(2025, 2, 15));
    EXPECT_EQ(Date(2024, 6, 15).add_months(0), Date(2024, 6, 15));
}

TEST(DateTest, AddMonthsClampsToMonthEnd) {
    EXPECT_EQ(Date(2024, 1, 31).add_months(1), Date(2024, 2, 29));
    EXPECT_EQ(Date(2023, 1, 31).add_months(1), Date(2023, 2, 28));
    EXPECT_EQ(Date(2024, 3, 31).add_months(1), Date(2024, 4, 30));
    // Clamping does not accumulate
    EXPECT_EQ(Date(2024, 1, 31).add_months(2), Date(2024, 3, 31));
}

TEST(DateTest, AddNegativeMonths) {
    EXPECT_EQ(Date(2024, 3, 31).add_months(-1), Date(2024, 2, 29));
    EXPECT_EQ(Date(2024, 1, 10).add_months(-2), Date(2023, 11, 10));
}

TEST(DateTest, DaysBetween) {
    EXPECT_EQ(days_between(Date(2024, 6, 1), Date(2024, 7, 1)), 30);
    EXPECT_EQ(days_between(Date(2024, 7, 1), Date(2024, 6, 1)), -30);
    EXPECT_EQ(days_between(Date(2024, 2, 1), Date(2024, 3, 1)), 29);
    EXPECT_EQ(days_between(Date(2023, 12, 31), Date(2024, 1, 1)), 1);
}

TEST(DateTest, Ordering) {
    EXPECT_LT(Date(2024, 6, 1), Date(2024, 6, 2));
    EXPECT_GT(Date(2025, 1, 1), Date(2024, 12, 31));
    EXPECT_NE(Date(2024, 6, 1), Date(2024, 6, 2));
}
