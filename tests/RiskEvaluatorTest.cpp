#include "TestHelpers.hpp"
#include "modules/risk/domain/RiskEvaluator.hpp"

using namespace TestHelpers;
using namespace std::chrono_literals;

class RiskEvaluatorTest : public ::testing::Test {
protected:
    SpatialStore store;
    RiskEvaluator evaluator{store, RiskConfig{}, DetectorConfig{}};
    MonitoredLocation site = location("A", 103.0, 30.0, 5000.0);

    /** 持续 durationMinutes 分钟、最大雨强 maxIntensity 的活跃事件 */
    static RainfallEvent event(double maxIntensity, int durationMinutes = 0, double totalMm = 10.0) {
        RainfallEvent e;
        e.id = 1;
        e.locationId = "A";
        e.startTime = at(0s);
        e.lastObservationAt = at(std::chrono::minutes(durationMinutes));
        e.maxIntensityMmHr = maxIntensity;
        e.totalRainfallMm = totalMm;
        return e;
    }

    static RainfallTotals totals(double last7dMm) {
        return {0.0, last7dMm, last7dMm};
    }

    SourceArea addArea(std::optional<double> susceptibility, std::optional<double> material,
                       double lon = 103.0) {
        return store.upsertSourceArea(sourceArea(square(lon, 30.0, 0.01), susceptibility, material));
    }

    SourceArea addSlopedArea(double slopeDeg, double lon = 103.0) {
        auto area = sourceArea(square(lon, 30.0, 0.01), 1.0, 1.0);
        area.slopeDeg = slopeDeg;
        return store.upsertSourceArea(area);
    }
};

TEST_F(RiskEvaluatorTest, IntensityAtThresholdGivesEvenTriggerOdds) {
    auto area = addArea(1.0, 1.0);
    auto a = evaluator.assess(event(14.0), totals(10.0), site, at(0s));

    EXPECT_DOUBLE_EQ(a.thresholdIntensityMmHr, 14.0);
    EXPECT_DOUBLE_EQ(a.exceedance, 1.0);
    EXPECT_DOUBLE_EQ(a.triggerProbability, 0.5);
    EXPECT_DOUBLE_EQ(a.riskValue, 0.5);
    EXPECT_EQ(a.level, RiskLevel::High);
    EXPECT_EQ(a.sourceAreaId, area.id);
    EXPECT_TRUE(a.thresholdExceeded);
    EXPECT_TRUE(a.simulationRecommended);
    EXPECT_FALSE(a.degraded);
}

TEST_F(RiskEvaluatorTest, ProbabilityGrowsWithExceedance) {
    addArea(1.0, 1.0);
    auto low = evaluator.assess(event(5.0), totals(10.0), site, at(0s));
    auto high = evaluator.assess(event(30.0), totals(10.0), site, at(0s));
    EXPECT_LT(low.triggerProbability, 0.5);
    EXPECT_GT(high.triggerProbability, 0.9);
    EXPECT_LT(low.riskValue, high.riskValue);
    EXPECT_FALSE(low.thresholdExceeded);
}

TEST_F(RiskEvaluatorTest, LongerEventsLowerTheThreshold) {
    addArea(1.0, 1.0);
    auto a = evaluator.assess(event(9.0, 240), totals(10.0), site, at(4h));
    EXPECT_NEAR(a.thresholdIntensityMmHr, 14.0 * std::pow(4.0, -0.4), 1e-9);
    EXPECT_TRUE(a.thresholdExceeded);
}

TEST_F(RiskEvaluatorTest, AntecedentRainfallAmplifiesExceedance) {
    addArea(1.0, 1.0);
    // 7 天 60 mm，其中事件本身 10 mm → 前期 50 mm，湿度 0.5
    auto a = evaluator.assess(event(14.0), totals(60.0), site, at(0s));
    EXPECT_DOUBLE_EQ(a.antecedentMm, 50.0);
    EXPECT_NEAR(a.exceedance, 1.2, 1e-12);
    EXPECT_DOUBLE_EQ(a.saturation, 0.6);
}

TEST_F(RiskEvaluatorTest, SaturationRecommendsSimulation) {
    addArea(0.1, 0.1);
    auto a = evaluator.assess(event(2.0), totals(80.0), site, at(0s));
    EXPECT_EQ(a.level, RiskLevel::Low);
    EXPECT_FALSE(a.thresholdExceeded);
    EXPECT_TRUE(a.simulationRecommended);
}

TEST_F(RiskEvaluatorTest, NoSourceAreaUsesDefaultsAndDegrades) {
    addArea(1.0, 1.0, 104.0);   // 超出监测半径
    auto a = evaluator.assess(event(14.0), totals(10.0), site, at(0s));
    EXPECT_TRUE(a.degraded);
    EXPECT_FALSE(a.sourceAreaId.has_value());
    EXPECT_DOUBLE_EQ(a.susceptibility, 0.5);
    EXPECT_NEAR(a.riskValue, 0.25, 1e-9);
}

TEST_F(RiskEvaluatorTest, MissingAreaInputDegrades) {
    auto area = addArea(std::nullopt, 0.9);
    auto a = evaluator.assess(event(14.0), totals(10.0), site, at(0s));
    EXPECT_TRUE(a.degraded);
    EXPECT_EQ(a.sourceAreaId, area.id);
    EXPECT_DOUBLE_EQ(a.susceptibility, 0.5);
    EXPECT_DOUBLE_EQ(a.materialAvailability, 0.9);
    EXPECT_NE(a.degradedReason.find(std::to_string(area.id)), std::string::npos);
}

TEST_F(RiskEvaluatorTest, PicksHighestRiskArea) {
    addArea(0.2, 0.2);
    auto riskiest = addArea(0.9, 0.8, 103.005);
    auto a = evaluator.assess(event(14.0), totals(10.0), site, at(0s));
    EXPECT_EQ(a.sourceAreaId, riskiest.id);
    EXPECT_NEAR(a.riskValue, 0.5 * std::sqrt(0.9) * std::sqrt(0.8), 1e-12);
}

TEST_F(RiskEvaluatorTest, ConfiguredSourceAreasOverrideRadius) {
    auto far = addArea(1.0, 1.0, 104.0);
    site.sourceAreaIds = {far.id, 999};
    auto a = evaluator.assess(event(14.0), totals(10.0), site, at(0s));
    EXPECT_EQ(a.sourceAreaId, far.id);
    EXPECT_TRUE(a.degraded);
    EXPECT_NE(a.degradedReason.find("999"), std::string::npos);
}

TEST_F(RiskEvaluatorTest, ExistingEventFlagCountsAsExceeded) {
    addArea(1.0, 1.0);
    auto e = event(2.0);
    e.thresholdExceeded = true;
    EXPECT_TRUE(evaluator.assess(e, totals(10.0), site, at(0s)).thresholdExceeded);
}

TEST_F(RiskEvaluatorTest, GentleSlopeCannotRelease) {
    addSlopedArea(20.0);
    auto a = evaluator.assess(event(14.0), totals(10.0), site, at(0s));
    EXPECT_DOUBLE_EQ(a.criticalSlopeDeg, 35.0 * (1.0 - 0.2 * 0.1));
    EXPECT_EQ(a.gatedSourceAreas, 1);
    EXPECT_DOUBLE_EQ(a.triggerProbability, 0.5);
    EXPECT_DOUBLE_EQ(a.riskValue, 0.0);
    EXPECT_EQ(a.level, RiskLevel::Low);
    // 降雨本身仍超过 I-D 阈值
    EXPECT_TRUE(a.thresholdExceeded);
}

TEST_F(RiskEvaluatorTest, SteepAreaWinsOverGatedArea) {
    addSlopedArea(20.0);
    auto steep = addSlopedArea(40.0, 103.005);
    auto a = evaluator.assess(event(14.0), totals(10.0), site, at(0s));
    EXPECT_EQ(a.sourceAreaId, steep.id);
    EXPECT_EQ(a.gatedSourceAreas, 1);
    EXPECT_DOUBLE_EQ(a.riskValue, 0.5);
}

TEST_F(RiskEvaluatorTest, SaturationLowersCriticalSlope) {
    addSlopedArea(30.0);
    auto dry = evaluator.assess(event(14.0), totals(10.0), site, at(0s));
    EXPECT_EQ(dry.gatedSourceAreas, 1);

    auto wet = evaluator.assess(event(14.0), totals(100.0), site, at(0s));
    EXPECT_NEAR(wet.criticalSlopeDeg, 28.0, 1e-9);
    EXPECT_EQ(wet.gatedSourceAreas, 0);
    EXPECT_GT(wet.riskValue, 0.5);
}

TEST_F(RiskEvaluatorTest, EffectiveAntecedentDecaysByDay) {
    addArea(1.0, 1.0);
    RainfallTotals t = totals(30.0);
    t.last14dMm = 40.0;
    t.dailyMm[0] = 10.0;    // 当天（本事件）不计入
    t.dailyMm[1] = 10.0;
    t.dailyMm[2] = 10.0;
    t.dailyMm[9] = 10.0;

    auto a = evaluator.assess(event(14.0), t, site, at(0s));
    EXPECT_DOUBLE_EQ(a.antecedentMm, 20.0);
    EXPECT_DOUBLE_EQ(a.antecedent14dMm, 30.0);
    EXPECT_NEAR(a.effectiveAntecedentMm, 10.0 * (0.84 + std::pow(0.84, 2) + std::pow(0.84, 9)), 1e-9);

    auto json = a.toJson();
    EXPECT_DOUBLE_EQ(json["antecedent_14d_mm"].asDouble(), 30.0);
    EXPECT_NEAR(json["effective_antecedent_mm"].asDouble(), a.effectiveAntecedentMm, 1e-12);
    EXPECT_DOUBLE_EQ(json["critical_slope_deg"].asDouble(), a.criticalSlopeDeg);
}

TEST_F(RiskEvaluatorTest, TriggerReasonListsConditions) {
    addArea(1.0, 1.0);
    auto a = evaluator.assess(event(14.0), totals(80.0), site, at(0s));
    ASSERT_TRUE(a.simulationRecommended);
    EXPECT_NE(a.triggerReason.find("I-D"), std::string::npos);
    EXPECT_NE(a.triggerReason.find("(1.28)"), std::string::npos);
    EXPECT_NE(a.triggerReason.find("(0.80)"), std::string::npos);
    EXPECT_NE(a.triggerReason.find("; "), std::string::npos);
    EXPECT_EQ(a.toJson()["trigger_reason"].asString(), a.triggerReason);

    auto quiet = evaluator.assess(event(5.0), totals(10.0), site, at(0s));
    ASSERT_FALSE(quiet.simulationRecommended);
    EXPECT_EQ(quiet.triggerReason, "风险低于模拟阈值");
}

TEST_F(RiskEvaluatorTest, TriggerReasonNamesSlopeGate) {
    addSlopedArea(20.0);
    auto a = evaluator.assess(event(5.0), totals(10.0), site, at(0s));
    ASSERT_FALSE(a.simulationRecommended);
    EXPECT_NE(a.triggerReason.find("临界坡度"), std::string::npos);
}

TEST_F(RiskEvaluatorTest, CombineClampsInputs) {
    EXPECT_DOUBLE_EQ(evaluator.combine(1.0, 1.0, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(evaluator.combine(2.0, 4.0, 9.0), 1.0);
    EXPECT_DOUBLE_EQ(evaluator.combine(0.5, 0.0, 1.0), 0.0);
    EXPECT_DOUBLE_EQ(evaluator.combine(-1.0, 1.0, 1.0), 0.0);
}

TEST_F(RiskEvaluatorTest, MaterializeZoneScalesAssessmentByRunout) {
    SimulationRun run;
    run.id = 7;
    run.locationId = "A";
    run.modelName = "gpp";
    run.modelVersion = "1.0";
    run.metrics.runoutProbability = 0.5;
    run.metrics.footprint = square(103.0, 30.0, 0.01);
    run.metrics.runoutAreaM2 = 12000.0;

    RiskAssessment assessment;
    assessment.riskValue = 0.8;
    assessment.triggerProbability = 0.9;

    auto zone = evaluator.materializeZone(run, assessment, square(100.0, 20.0, 1.0), at(1h));
    EXPECT_EQ(zone.simulationRunId, 7);
    EXPECT_DOUBLE_EQ(zone.riskValue, 0.4);
    EXPECT_EQ(zone.level, RiskLevel::Moderate);
    EXPECT_DOUBLE_EQ(zone.triggerProbability, 0.9);
    EXPECT_DOUBLE_EQ(zone.affectedAreaM2, 12000.0);
    EXPECT_DOUBLE_EQ(zone.geometry.ring[0].lon, 103.0);
    EXPECT_FALSE(zone.metadata["conditional_on_trigger"].asBool());
}

TEST_F(RiskEvaluatorTest, MaterializeZoneWithoutAssessmentAssumesTrigger) {
    SimulationRun run;
    run.id = 8;
    auto extent = square(103.0, 30.0, 0.02);

    auto zone = evaluator.materializeZone(run, std::nullopt, extent, at(1h));
    EXPECT_DOUBLE_EQ(zone.triggerProbability, 1.0);
    EXPECT_DOUBLE_EQ(zone.riskValue, 0.5);
    EXPECT_EQ(zone.level, RiskLevel::High);
    EXPECT_NEAR(zone.affectedAreaM2, Geo::areaM2(extent), 1e-6);
    EXPECT_TRUE(zone.metadata["conditional_on_trigger"].asBool());
}

class RiskThresholdsTest : public ::testing::Test {};

TEST_F(RiskThresholdsTest, ClassifiesByHalfOpenBuckets) {
    RiskThresholds t;
    EXPECT_EQ(t.classify(0.0), RiskLevel::Low);
    EXPECT_EQ(t.classify(0.2499), RiskLevel::Low);
    EXPECT_EQ(t.classify(0.25), RiskLevel::Moderate);
    EXPECT_EQ(t.classify(0.5), RiskLevel::High);
    EXPECT_EQ(t.classify(0.75), RiskLevel::Critical);
    EXPECT_EQ(t.classify(1.0), RiskLevel::Critical);
}

TEST_F(RiskThresholdsTest, ValidatesOrdering) {
    EXPECT_FALSE(RiskThresholds{}.validate().has_value());
    EXPECT_TRUE((RiskThresholds{0.5, 0.4, 0.9}.validate().has_value()));
    EXPECT_TRUE((RiskThresholds{0.0, 0.4, 0.9}.validate().has_value()));
    EXPECT_TRUE((RiskThresholds{0.2, 0.4, 1.0}.validate().has_value()));
}

TEST_F(RiskThresholdsTest, LevelsAreOrdered) {
    EXPECT_LT(RiskLevel::Low, RiskLevel::Moderate);
    EXPECT_LT(RiskLevel::High, RiskLevel::Critical);
    EXPECT_EQ(riskLevelFromString("critical"), RiskLevel::Critical);
    EXPECT_FALSE(riskLevelFromString("extreme").has_value());
}
