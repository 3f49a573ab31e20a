// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/batch/file_sources.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>

using namespace volbatch;

class FileSourcesTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("volbatch_file_sources_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    void write(const std::string& ticker, const std::string& content) {
        std::ofstream out(dir_ / (ticker + ".json"));
        out << content;
    }

    TickerSpec spec(const std::string& ticker) const {
        TickerSpec s;
        s.ticker = ticker;
        s.start_date = Date(2024, 6, 21);
        return s;
    }

    std::filesystem::path dir_;
    DiscountInputs discount_;
};

TEST_F(FileSourcesTest, ReadsSnapshot) {
    write("SPY", R"({
        "ticker": "SPY", "quote_date": "2024-06-21", "spot": 580.5,
        "points": [
            {"expiry": "2024-07-19", "strike": 100, "iv": 12.8, "open_interest": 1520},
            {"expiry": "2024-08-16", "strike": 90, "iv": null}
        ]})");

    JsonSnapshotSurfaceSource source(dir_);
    auto surface = source.fetch(spec("SPY"), discount_, {});
    ASSERT_TRUE(surface.has_value()) << surface.error();

    EXPECT_EQ(surface->ticker, "SPY");
    ASSERT_TRUE(surface->quote_date.has_value());
    EXPECT_EQ(*surface->quote_date, Date(2024, 6, 21));
    ASSERT_TRUE(surface->spot.has_value());
    EXPECT_DOUBLE_EQ(surface->spot->to_double(), 580.5);

    ASSERT_EQ(surface->points.size(), 2u);
    EXPECT_EQ(surface->points[0].expiry, Date(2024, 7, 19));
    EXPECT_DOUBLE_EQ(surface->points[0].strike, 100.0);
    EXPECT_DOUBLE_EQ(surface->points[0].implied_vol, 12.8);
    EXPECT_EQ(surface->points[0].open_interest, std::optional<int64_t>(1520));
    EXPECT_TRUE(std::isnan(surface->points[1].implied_vol));
    EXPECT_FALSE(surface->points[1].open_interest.has_value());
}

TEST_F(FileSourcesTest, FixedPointSpot) {
    write("QQQ", R"({"spot_fixed9": 480250000000, "points": []})");

    JsonSnapshotSurfaceSource source(dir_);
    auto surface = source.fetch(spec("QQQ"), discount_, {});
    ASSERT_TRUE(surface.has_value());
    ASSERT_TRUE(surface->spot.has_value());
    EXPECT_EQ(surface->spot->format(), NumericFormat::FixedPoint9);
    EXPECT_NEAR(surface->spot->to_double(), 480.25, 1e-9);
    EXPECT_FALSE(surface->quote_date.has_value());
    EXPECT_TRUE(surface->points.empty());
}

TEST_F(FileSourcesTest, MissingSnapshotIsNotFound) {
    JsonSnapshotSurfaceSource source(dir_);
    auto surface = source.fetch(spec("NOPE"), discount_, {});
    ASSERT_FALSE(surface.has_value());
    EXPECT_EQ(surface.error().code, UpstreamErrorCode::NotFound);
}

TEST_F(FileSourcesTest, MalformedSnapshots) {
    write("BAD", "{not json");
    write("NOPTS", R"({"ticker": "NOPTS"})");
    write("BADEXP", R"({"points": [{"expiry": "07/19/2024", "strike": 100, "iv": 12}]})");
    write("BADIV", R"({"points": [{"expiry": "2024-07-19", "strike": 100, "iv": "high"}]})");

    JsonSnapshotSurfaceSource source(dir_);
    for (const char* ticker : {"BAD", "NOPTS", "BADEXP", "BADIV"}) {
        auto surface = source.fetch(spec(ticker), discount_, {});
        ASSERT_FALSE(surface.has_value()) << ticker;
        EXPECT_EQ(surface.error().code, UpstreamErrorCode::Malformed) << ticker;
    }
}

TEST_F(FileSourcesTest, StopRequestCancels) {
    write("SPY", R"({"points": []})");
    std::stop_source stop;
    stop.request_stop();

    JsonSnapshotSurfaceSource source(dir_);
    auto surface = source.fetch(spec("SPY"), discount_, stop.get_token());
    ASSERT_FALSE(surface.has_value());
    EXPECT_EQ(surface.error().code, UpstreamErrorCode::Cancelled);
}

TEST_F(FileSourcesTest, DiscountWithDividends) {
    ConfiguredDiscountSource source;
    auto s = spec("AAPL");
    s.use_dividends = true;
    s.dividend_yield = 0.0044;
    s.interest_rate = 0.04;

    auto inputs = source.fetch(s, {});
    ASSERT_TRUE(inputs.has_value()) << inputs.error();
    EXPECT_DOUBLE_EQ(inputs->dividend_yield, 0.0044);
    EXPECT_EQ(inputs->method, "dividend_yield");
    EXPECT_NEAR(inputs->curve.zero_rate(1.0), 0.04, 1e-12);
}

TEST_F(FileSourcesTest, DiscountWithDividendsNeedsYield) {
    ConfiguredDiscountSource source;
    auto s = spec("XYZ");
    s.use_dividends = true;

    auto inputs = source.fetch(s, {});
    ASSERT_FALSE(inputs.has_value());
    EXPECT_EQ(inputs.error().code, UpstreamErrorCode::NotFound);
}

TEST_F(FileSourcesTest, DiscountMethodMustBeKnown) {
    ConfiguredDiscountSource source;
    auto s = spec("SPY");
    s.discount_method = "smooth";
    auto ok = source.fetch(s, {});
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->method, "smooth");
    EXPECT_DOUBLE_EQ(ok->dividend_yield, 0.0);

    s.discount_method = "spline";
    auto unknown = source.fetch(s, {});
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, UpstreamErrorCode::Unsupported);

    ConfiguredDiscountSource custom(std::set<std::string>{"spline"});
    EXPECT_TRUE(custom.fetch(s, {}).has_value());
}
