#include "TestHelpers.hpp"
#include "modules/weather/domain/RainfallAggregator.hpp"

using namespace TestHelpers;
using namespace std::chrono_literals;

class RainfallAggregatorTest : public ::testing::Test {
protected:
    RainfallAggregator aggregator;
};

TEST_F(RainfallAggregatorTest, AccumulatesAllWindows) {
    aggregator.accept(observation("A", at(0s), 2.0, 4.0));
    auto totals = aggregator.accept(observation("A", at(10min), 3.0, 6.0));
    EXPECT_DOUBLE_EQ(totals.lastHourMm, 5.0);
    EXPECT_DOUBLE_EQ(totals.last24hMm, 5.0);
    EXPECT_DOUBLE_EQ(totals.last7dMm, 5.0);
}

TEST_F(RainfallAggregatorTest, WindowIsLeftOpen) {
    aggregator.accept(observation("A", at(0s), 2.0, 4.0));
    aggregator.accept(observation("A", at(30min), 1.0, 2.0));

    auto totals = aggregator.totals("A", at(1h) - 1s);
    EXPECT_DOUBLE_EQ(totals.lastHourMm, 3.0);

    // 恰好一小时后，首条观测落在窗口左端点之外
    totals = aggregator.totals("A", at(1h));
    EXPECT_DOUBLE_EQ(totals.lastHourMm, 1.0);
    EXPECT_DOUBLE_EQ(totals.last24hMm, 3.0);
}

TEST_F(RainfallAggregatorTest, ExpiresEntriesPerWindow) {
    aggregator.accept(observation("A", at(0s), 10.0, 5.0));
    auto totals = aggregator.totals("A", at(2h));
    EXPECT_DOUBLE_EQ(totals.lastHourMm, 0.0);
    EXPECT_DOUBLE_EQ(totals.last24hMm, 10.0);

    totals = aggregator.totals("A", at(48h));
    EXPECT_DOUBLE_EQ(totals.last24hMm, 0.0);
    EXPECT_DOUBLE_EQ(totals.last7dMm, 10.0);

    totals = aggregator.totals("A", at(24h * 7));
    EXPECT_DOUBLE_EQ(totals.last7dMm, 0.0);
}

TEST_F(RainfallAggregatorTest, DailyAntecedentBuckets) {
    aggregator.accept(observation("A", at(0s), 4.0, 1.0));
    aggregator.accept(observation("A", at(24h * 3 + 1h), 2.0, 1.0));
    auto totals = aggregator.accept(observation("A", at(24h * 10), 1.0, 1.0));

    EXPECT_DOUBLE_EQ(totals.dailyMm[0], 1.0);
    EXPECT_DOUBLE_EQ(totals.dailyMm[6], 2.0);     // 往前 6-7 天
    EXPECT_DOUBLE_EQ(totals.dailyMm[9], 0.0);     // 恰好 10 天前落在左端点之外
    EXPECT_DOUBLE_EQ(totals.dailyMm[10], 4.0);
    EXPECT_DOUBLE_EQ(totals.last7dMm, 3.0);
    EXPECT_DOUBLE_EQ(totals.last14dMm, 7.0);

    // 14 天后首条观测移出
    totals = aggregator.totals("A", at(24h * 14));
    EXPECT_DOUBLE_EQ(totals.last14dMm, 3.0);
    EXPECT_DOUBLE_EQ(aggregator.totals("A", at(24h * 10)).toJson()["rainfall_14d_mm"].asDouble(), 7.0);
}

TEST_F(RainfallAggregatorTest, RejectsOutOfOrderAndDuplicateTimestamps) {
    aggregator.accept(observation("A", at(10min), 1.0, 1.0));
    EXPECT_THROW(aggregator.accept(observation("A", at(5min), 1.0, 1.0)), ValidationException);
    EXPECT_THROW(aggregator.accept(observation("A", at(10min), 1.0, 1.0)), ValidationException);

    // 被拒绝的观测不影响窗口
    EXPECT_DOUBLE_EQ(aggregator.totals("A", at(10min)).lastHourMm, 1.0);
    EXPECT_EQ(aggregator.lastTimestamp("A"), at(10min));
}

TEST_F(RainfallAggregatorTest, RejectsNegativeRainfall) {
    EXPECT_THROW(aggregator.accept(observation("A", at(0s), -0.5, 1.0)), ValidationException);
    EXPECT_FALSE(aggregator.lastTimestamp("A").has_value());
}

TEST_F(RainfallAggregatorTest, LocationsAreIndependent) {
    aggregator.accept(observation("A", at(10min), 4.0, 1.0));
    aggregator.accept(observation("B", at(5min), 1.0, 1.0));
    EXPECT_DOUBLE_EQ(aggregator.totals("A", at(10min)).lastHourMm, 4.0);
    EXPECT_DOUBLE_EQ(aggregator.totals("B", at(10min)).lastHourMm, 1.0);
    EXPECT_DOUBLE_EQ(aggregator.totals("C", at(10min)).lastHourMm, 0.0);
}

TEST_F(RainfallAggregatorTest, WindowNamesRoundTrip) {
    EXPECT_EQ(rainWindowFromString("1h"), RainWindow::OneHour);
    EXPECT_EQ(rainWindowFromString("7d"), RainWindow::SevenDays);
    EXPECT_FALSE(rainWindowFromString("3h").has_value());
    EXPECT_EQ(rainWindowToString(RainWindow::OneDay), "24h");
}

class WeatherObservationTest : public ::testing::Test {
protected:
    static Json::Value validJson() {
        Json::Value json;
        json["timestamp"] = "2024-06-01T08:30:00+08:00";
        json["location"]["lon"] = 103.01;
        json["location"]["lat"] = 30.02;
        json["rainfall_mm"] = 2.5;
        json["intensity_mm_hr"] = 15.0;
        json["humidity_pct"] = 92;
        json["source"] = "station-7";
        return json;
    }
};

TEST_F(WeatherObservationTest, ParsesLonLatObject) {
    auto obs = WeatherObservation::fromJson(validJson());
    EXPECT_EQ(obs.timestamp, *TimestampHelper::parse("2024-06-01T00:30:00Z"));
    EXPECT_DOUBLE_EQ(obs.location.lon, 103.01);
    EXPECT_DOUBLE_EQ(obs.rainfallMm, 2.5);
    ASSERT_TRUE(obs.humidityPct.has_value());
    EXPECT_DOUBLE_EQ(*obs.humidityPct, 92.0);
    EXPECT_FALSE(obs.temperatureC.has_value());
    EXPECT_TRUE(obs.locationId.empty());
}

TEST_F(WeatherObservationTest, ParsesGeoJsonPointAndExplicitLocation) {
    auto json = validJson();
    json["location"] = Geo::toGeoJson(GeoPoint{103.5, 30.5});
    json["location_id"] = "A";
    auto obs = WeatherObservation::fromJson(json);
    EXPECT_DOUBLE_EQ(obs.location.lat, 30.5);
    EXPECT_EQ(obs.locationId, "A");
}

TEST_F(WeatherObservationTest, RejectsInvalidFields) {
    auto missingTimestamp = validJson();
    missingTimestamp.removeMember("timestamp");
    EXPECT_THROW(WeatherObservation::fromJson(missingTimestamp), ValidationException);

    auto badTimestamp = validJson();
    badTimestamp["timestamp"] = "yesterday";
    EXPECT_THROW(WeatherObservation::fromJson(badTimestamp), ValidationException);

    auto negative = validJson();
    negative["rainfall_mm"] = -1.0;
    EXPECT_THROW(WeatherObservation::fromJson(negative), ValidationException);

    auto humidity = validJson();
    humidity["humidity_pct"] = 120;
    EXPECT_THROW(WeatherObservation::fromJson(humidity), ValidationException);

    auto noSource = validJson();
    noSource["source"] = "";
    EXPECT_THROW(WeatherObservation::fromJson(noSource), ValidationException);

    auto badLocation = validJson();
    badLocation["location"]["lat"] = 95.0;
    EXPECT_THROW(WeatherObservation::fromJson(badLocation), ValidationException);

    EXPECT_THROW(WeatherObservation::fromJson(Json::Value("text")), ValidationException);
}

class LocationRegistryTest : public ::testing::Test {
protected:
    LocationRegistry registry{{location("A", 103.0, 30.0, 5000.0), location("B", 103.05, 30.0, 5000.0)}};
};

TEST_F(LocationRegistryTest, ExplicitIdTakesPriority) {
    EXPECT_EQ(registry.resolve("B", {103.0, 30.0}).id, "B");
    EXPECT_THROW(registry.resolve("Z", {103.0, 30.0}), ValidationException);
}

TEST_F(LocationRegistryTest, ResolvesNearestWithinRadius) {
    EXPECT_EQ(registry.resolve("", {103.01, 30.0}).id, "A");
    EXPECT_EQ(registry.resolve("", {103.04, 30.0}).id, "B");
    EXPECT_THROW(registry.resolve("", {104.0, 31.0}), ValidationException);
}

class TimestampHelperTest : public ::testing::Test {};

TEST_F(TimestampHelperTest, ParsesIsoAndPostgresText) {
    auto expected = *TimestampHelper::parse("2024-05-01T12:00:00Z");
    EXPECT_EQ(TimestampHelper::parse("2024-05-01 12:00:00.000+00"), expected);
    EXPECT_EQ(TimestampHelper::parse("2024-05-01T20:00:00+08:00"), expected);
    EXPECT_EQ(TimestampHelper::parse("2024-05-01T12:00:00"), expected);
    EXPECT_EQ(TimestampHelper::toIso(expected), "2024-05-01T12:00:00Z");
}

TEST_F(TimestampHelperTest, KeepsMilliseconds) {
    auto base = *TimestampHelper::parse("2024-05-01T12:00:00Z");
    auto tp = TimestampHelper::parse("2024-05-01T12:00:00.25Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(*tp - base, std::chrono::milliseconds(250));
    EXPECT_EQ(TimestampHelper::toIso(*tp), "2024-05-01T12:00:00.250Z");

    // 毫秒以下截断
    EXPECT_EQ(TimestampHelper::parse("2024-05-01 12:00:00.123456+00"), base + std::chrono::milliseconds(123));
    EXPECT_EQ(TimestampHelper::toIso(base + std::chrono::microseconds(1999)), "2024-05-01T12:00:00.001Z");
    EXPECT_EQ(TimestampHelper::parse(TimestampHelper::toIso(base + std::chrono::milliseconds(7))),
              base + std::chrono::milliseconds(7));
}

TEST_F(TimestampHelperTest, RejectsMalformedText) {
    EXPECT_FALSE(TimestampHelper::parse("2024-05-01").has_value());
    EXPECT_FALSE(TimestampHelper::parse("2024-05-01T12:00:00~01").has_value());
    EXPECT_FALSE(TimestampHelper::parse("2024-05-01T12:00:00.Z").has_value());
}
