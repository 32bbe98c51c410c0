#include "TestHelpers.hpp"
#include "modules/event/domain/RainfallEventDetector.hpp"
#include "modules/alert/AlertManager.hpp"

using namespace TestHelpers;
using namespace std::chrono_literals;

class RainfallEventDetectorTest : public ::testing::Test {
protected:
    SpatialStore store;
    RainfallEventDetector detector{store, DetectorConfig{}};

    static RainfallTotals totals(double last24hMm) {
        return {last24hMm, last24hMm, last24hMm};
    }

    /** 以雨强起始的事件 */
    RainfallEvent startEvent(std::chrono::seconds offset = 0s) {
        auto out = detector.process(observation("A", at(offset), 3.0, 12.0), totals(3.0));
        EXPECT_TRUE(out.opened.has_value());
        return *out.opened;
    }
};

TEST_F(RainfallEventDetectorTest, NonQualifyingObservationIsIgnored) {
    auto out = detector.process(observation("A", at(0s), 0.05, 0.2), totals(0.05));
    EXPECT_FALSE(out.qualifying);
    EXPECT_EQ(out.active(), nullptr);
    EXPECT_EQ(detector.state("A"), DetectorState::Idle);
}

TEST_F(RainfallEventDetectorTest, QualifyingBelowOnsetDoesNotOpen) {
    auto out = detector.process(observation("A", at(0s), 2.0, 4.0), totals(2.0));
    EXPECT_TRUE(out.qualifying);
    EXPECT_FALSE(out.opened.has_value());
    EXPECT_FALSE(store.activeEvent("A").has_value());
}

TEST_F(RainfallEventDetectorTest, OpensOnIntensity) {
    auto event = startEvent();
    EXPECT_EQ(event.startTime, at(0s));
    EXPECT_EQ(event.observationCount, 1);
    EXPECT_DOUBLE_EQ(event.totalRainfallMm, 3.0);
    EXPECT_TRUE(event.isActive);
    EXPECT_EQ(detector.state("A"), DetectorState::Active);
}

TEST_F(RainfallEventDetectorTest, OpensOnAccumulatedRainfall) {
    // 雨强未达起始值，但 24h 累计达到 10 mm
    auto out = detector.process(observation("A", at(0s), 1.0, 2.0), totals(10.0));
    ASSERT_TRUE(out.opened.has_value());
    EXPECT_EQ(out.opened->locationId, "A");
}

TEST_F(RainfallEventDetectorTest, ExtendsActiveEvent) {
    startEvent();
    auto out = detector.process(observation("A", at(30min), 2.0, 6.0), totals(5.0));
    ASSERT_TRUE(out.updated.has_value());
    EXPECT_EQ(out.updated->observationCount, 2);
    EXPECT_DOUBLE_EQ(out.updated->totalRainfallMm, 5.0);
    EXPECT_DOUBLE_EQ(out.updated->maxIntensityMmHr, 12.0);
    EXPECT_DOUBLE_EQ(out.updated->avgIntensityMmHr, 9.0);
    EXPECT_EQ(out.updated->durationMinutes, 30);
}

TEST_F(RainfallEventDetectorTest, GapOfExactlyInactivityIntervalContinues) {
    auto opened = startEvent();
    auto out = detector.process(observation("A", at(2h), 1.0, 1.0), totals(4.0));
    EXPECT_FALSE(out.closed.has_value());
    ASSERT_TRUE(out.updated.has_value());
    EXPECT_EQ(out.updated->id, opened.id);
}

TEST_F(RainfallEventDetectorTest, LongerGapClosesAndOpensNewEvent) {
    auto opened = startEvent();
    detector.process(observation("A", at(20min), 1.0, 3.0), totals(4.0));

    auto out = detector.process(observation("A", at(20min + 2h + 1s), 4.0, 15.0), totals(5.0));
    ASSERT_TRUE(out.closed.has_value());
    EXPECT_EQ(out.closed->id, opened.id);
    EXPECT_FALSE(out.closed->isActive);
    EXPECT_EQ(out.closed->endTime, at(20min));
    EXPECT_EQ(out.closed->durationMinutes, 20);

    ASSERT_TRUE(out.opened.has_value());
    EXPECT_NE(out.opened->id, opened.id);
    EXPECT_EQ(store.activeEvent("A")->id, out.opened->id);
}

TEST_F(RainfallEventDetectorTest, NonQualifyingObservationAfterGapOnlyCloses) {
    startEvent();
    auto out = detector.process(observation("A", at(3h), 0.0, 0.0), totals(0.0));
    EXPECT_TRUE(out.closed.has_value());
    EXPECT_FALSE(out.opened.has_value());
    EXPECT_EQ(detector.state("A"), DetectorState::Idle);
}

TEST_F(RainfallEventDetectorTest, CloseIfInactiveUsesWallClock) {
    startEvent();
    EXPECT_TRUE(detector.closeIfInactive(at(2h)).empty());

    auto closed = detector.closeIfInactive(at(2h + 1s));
    ASSERT_EQ(closed.size(), 1u);
    EXPECT_EQ(closed[0].endTime, at(0s));
    EXPECT_FALSE(store.activeEvent("A").has_value());
    EXPECT_TRUE(detector.closeIfInactive(at(5h)).empty());
}

TEST_F(RainfallEventDetectorTest, FlagsTriggerExceedance) {
    // 起始观测雨强 12 < I-D 阈值 14，累计 3 mm < 10 mm
    EXPECT_FALSE(startEvent().thresholdExceeded);

    auto out = detector.process(observation("A", at(30min), 20.0, 8.0), totals(26.0));
    ASSERT_TRUE(out.updated.has_value());
    EXPECT_TRUE(out.updated->thresholdExceeded);

    // 已置位后不再清除
    out = detector.process(observation("A", at(40min), 0.5, 1.0), totals(26.5));
    EXPECT_TRUE(out.updated->thresholdExceeded);
}

TEST_F(RainfallEventDetectorTest, IntensityDurationThreshold) {
    DetectorConfig config;
    EXPECT_DOUBLE_EQ(config.idThreshold(0.25), 14.0);
    EXPECT_DOUBLE_EQ(config.idThreshold(1.0), 14.0);
    EXPECT_NEAR(config.idThreshold(4.0), 14.0 * std::pow(4.0, -0.4), 1e-12);

    auto out = detector.process(observation("A", at(0s), 3.0, 14.0), totals(3.0));
    ASSERT_TRUE(out.opened.has_value());
    EXPECT_TRUE(out.opened->thresholdExceeded);
}

TEST_F(RainfallEventDetectorTest, RecordAssessmentOnlyTouchesCurrentEvent) {
    auto event = startEvent();
    auto updated = detector.recordAssessment("A", event.id, 0.8, true);
    ASSERT_TRUE(updated.has_value());
    EXPECT_DOUBLE_EQ(*updated->triggerProbability, 0.8);
    EXPECT_TRUE(updated->thresholdExceeded);

    EXPECT_FALSE(detector.recordAssessment("A", event.id + 100, 0.1, false).has_value());
    EXPECT_FALSE(detector.recordAssessment("B", event.id, 0.1, false).has_value());
}

TEST_F(RainfallEventDetectorTest, LocationsHaveIndependentStateMachines) {
    startEvent();
    auto out = detector.process(observation("B", at(1min), 3.0, 12.0), totals(3.0));
    ASSERT_TRUE(out.opened.has_value());
    EXPECT_EQ(store.activeEvents().size(), 2u);
}

TEST_F(RainfallEventDetectorTest, SyncWithStoreRestoresActiveState) {
    RainfallEvent restored;
    restored.id = 42;
    restored.locationId = "A";
    restored.startTime = at(0s);
    restored.lastObservationAt = at(10min);
    restored.isActive = true;
    store.restoreEvent(restored);

    EXPECT_EQ(detector.state("A"), DetectorState::Idle);
    detector.syncWithStore();
    EXPECT_EQ(detector.state("A"), DetectorState::Active);

    auto out = detector.process(observation("A", at(20min), 1.0, 2.0), totals(1.0));
    ASSERT_TRUE(out.updated.has_value());
    EXPECT_EQ(out.updated->id, 42);
}

TEST_F(RainfallEventDetectorTest, SteadyRainReachingOnsetClosesAsExceeded) {
    // 5 mm/h 持续 3 小时，缺省配置
    RainfallAggregator aggregator;
    AlertManager alerts{store, AlertConfig{}};
    std::optional<RainfallEvent> opened;
    for (int hour = 0; hour < 3; ++hour) {
        auto obs = observation("A", at(std::chrono::hours(hour)), 5.0, 5.0);
        auto out = detector.process(obs, aggregator.accept(obs));
        if (out.opened) {
            EXPECT_FALSE(opened.has_value());
            EXPECT_EQ(hour, 1);
            opened = out.opened;
        }
    }
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(opened->startTime, at(1h));

    auto closed = detector.closeIfInactive(at(5h));
    ASSERT_EQ(closed.size(), 1u);
    EXPECT_EQ(closed[0].id, opened->id);
    EXPECT_DOUBLE_EQ(closed[0].totalRainfallMm, 10.0);
    EXPECT_TRUE(closed[0].thresholdExceeded);

    auto alert = alerts.onEventClosed(closed[0], at(5h));
    ASSERT_TRUE(alert.has_value());
    EXPECT_EQ(alert->alert.type, AlertType::ThresholdExceeded);
}
