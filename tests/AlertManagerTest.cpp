#include "TestHelpers.hpp"
#include "modules/alert/AlertManager.hpp"

using namespace TestHelpers;
using namespace std::chrono_literals;

class AlertManagerTest : public ::testing::Test {
protected:
    SpatialStore store;
    AlertManager manager{store, AlertConfig{}};

    static RiskAssessment assessment(RiskLevel level, bool degraded = false) {
        RiskAssessment a;
        a.eventId = 1;
        a.locationId = "A";
        a.level = level;
        a.riskValue = 0.6;
        a.degraded = degraded;
        a.degradedReason = degraded ? "易发区 #3 缺少物源数据" : "";
        return a;
    }

    static RainfallEvent closedEvent(bool exceeded) {
        RainfallEvent e;
        e.id = 1;
        e.locationId = "A";
        e.totalRainfallMm = 42.0;
        e.maxIntensityMmHr = 18.0;
        e.thresholdExceeded = exceeded;
        e.isActive = false;
        return e;
    }
};

TEST_F(AlertManagerTest, ClosedEventAlertsOnlyWhenExceeded) {
    EXPECT_FALSE(manager.onEventClosed(closedEvent(false), at(0s)).has_value());

    auto upsert = manager.onEventClosed(closedEvent(true), at(0s));
    ASSERT_TRUE(upsert.has_value());
    EXPECT_TRUE(upsert->created);
    EXPECT_EQ(upsert->alert.type, AlertType::ThresholdExceeded);
    EXPECT_EQ(upsert->alert.severity, AlertSeverity::Warning);
    EXPECT_EQ(upsert->alert.subject.eventId, 1);
    EXPECT_NE(upsert->alert.message.find("42.00"), std::string::npos);
}

TEST_F(AlertManagerTest, ClosedEventSeverityFollowsLastAssessment) {
    store.recordAssessment(assessment(RiskLevel::Critical));
    auto upsert = manager.onEventClosed(closedEvent(true), at(0s));
    ASSERT_TRUE(upsert.has_value());
    EXPECT_EQ(upsert->alert.severity, AlertSeverity::Critical);
}

TEST_F(AlertManagerTest, HighRiskRaisedWhenLevelRises) {
    EXPECT_TRUE(manager.onRiskAssessed(assessment(RiskLevel::Moderate), std::nullopt, at(0s)).empty());

    auto first = manager.onRiskAssessed(assessment(RiskLevel::High), assessment(RiskLevel::Moderate), at(1min));
    ASSERT_EQ(first.size(), 1u);
    EXPECT_TRUE(first[0].created);
    EXPECT_EQ(first[0].alert.type, AlertType::HighRisk);

    // 等级未变化不重复告警
    EXPECT_TRUE(manager.onRiskAssessed(assessment(RiskLevel::High), assessment(RiskLevel::High), at(2min)).empty());

    auto escalated = manager.onRiskAssessed(assessment(RiskLevel::Critical), assessment(RiskLevel::High), at(3min));
    ASSERT_EQ(escalated.size(), 1u);
    EXPECT_FALSE(escalated[0].created);
    EXPECT_TRUE(escalated[0].escalated);
    EXPECT_EQ(escalated[0].alert.id, first[0].alert.id);
    EXPECT_EQ(escalated[0].alert.severity, AlertSeverity::Critical);
}

TEST_F(AlertManagerTest, DegradedConfidenceRaisedOnFirstDegradation) {
    auto result = manager.onRiskAssessed(assessment(RiskLevel::Low, true), std::nullopt, at(0s));
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].alert.type, AlertType::DegradedConfidence);
    EXPECT_EQ(result[0].alert.severity, AlertSeverity::Info);
    EXPECT_EQ(result[0].alert.metadata["reason"].asString(), "易发区 #3 缺少物源数据");

    EXPECT_TRUE(manager.onRiskAssessed(assessment(RiskLevel::Low, true),
                                       assessment(RiskLevel::Low, true), at(1min)).empty());
}

TEST_F(AlertManagerTest, ZoneAlertsAboveModerate) {
    SimulationRun run;
    run.id = 5;
    RiskZone zone;
    zone.id = 9;
    zone.level = RiskLevel::Moderate;
    EXPECT_FALSE(manager.onZoneCreated(run, zone, at(0s)).has_value());

    zone.level = RiskLevel::High;
    auto upsert = manager.onZoneCreated(run, zone, at(0s));
    ASSERT_TRUE(upsert.has_value());
    EXPECT_EQ(upsert->alert.subject.simulationId, 5);
    EXPECT_EQ(upsert->alert.metadata["zone_id"].asInt64(), 9);
}

TEST_F(AlertManagerTest, FailedRunAlwaysAlerts) {
    SimulationRun run;
    run.id = 5;
    run.trigger = ThresholdTrigger{1};
    run.rainfallEventId = 1;
    run.errorMessage = "timeout after 3600s";

    auto upsert = manager.onRunFailed(run, at(0s));
    EXPECT_TRUE(upsert.created);
    EXPECT_EQ(upsert.alert.type, AlertType::SimulationFailed);
    EXPECT_EQ(upsert.alert.metadata["trigger_type"].asString(), "threshold_exceeded");
    EXPECT_NE(upsert.alert.message.find("timeout after 3600s"), std::string::npos);
}

TEST_F(AlertManagerTest, TerrainChangeUsesAbsoluteNetVolume) {
    ChangeDetection cd;
    cd.id = 2;
    cd.netChangeM3 = 300.0;
    EXPECT_FALSE(manager.onChangeDetection(cd, at(0s)).has_value());

    cd.netChangeM3 = -600.0;
    auto upsert = manager.onChangeDetection(cd, at(0s));
    ASSERT_TRUE(upsert.has_value());
    EXPECT_EQ(upsert->alert.type, AlertType::TerrainChange);
    EXPECT_EQ(upsert->alert.subject.changeId, 2);
}

TEST_F(AlertManagerTest, AcknowledgeThroughManager) {
    auto upsert = manager.onRunFailed(SimulationRun{}, at(0s));
    auto acked = manager.acknowledge(upsert.alert.id, "ops", at(1min));
    EXPECT_TRUE(acked.acknowledged);
    EXPECT_THROW(manager.acknowledge(upsert.alert.id, "ops", at(2min)), ConflictException);
}
