#include "TestHelpers.hpp"
#include "modules/terrain/ChangeDetectionIntegrator.hpp"

using namespace TestHelpers;
using namespace std::chrono_literals;

class ChangeDetectionIntegratorTest : public ::testing::Test {
protected:
    SpatialStore store;
    ChangeDetectionIntegrator integrator{store, ChangeDetectionConfig{}};
    TerrainSnapshot baseline;
    TerrainSnapshot comparison;

    void SetUp() override {
        baseline = store.addSnapshot(snapshot("2024-spring", square(103.0, 30.0, 0.1)));
        comparison = store.addSnapshot(snapshot("2024-summer", square(103.0, 30.0, 0.1)));
    }

    ChangeDetection change(double netM3, std::optional<GeoPolygon> footprint) {
        ChangeDetection cd;
        cd.timestamp = at(0s);
        cd.baselineSnapshotId = baseline.id;
        cd.comparisonSnapshotId = comparison.id;
        cd.dodRasterPath = "/dod/summer.tif";
        cd.depositionVolumeM3 = (std::max)(netM3, 0.0);
        cd.erosionVolumeM3 = (std::max)(-netM3, 0.0);
        cd.netChangeM3 = netM3;
        cd.lodThresholdM = 0.1;
        cd.footprint = std::move(footprint);
        return cd;
    }

    SourceArea addArea(double lon, std::optional<double> material = 0.2) {
        return integrator.upsertSourceArea(sourceArea(square(lon, 30.0, 0.01), 0.6, material), at(0s));
    }
};

TEST_F(ChangeDetectionIntegratorTest, ContributionScalesWithOverlap) {
    auto area = addArea(103.0);
    // 足迹覆盖易发区的右半部分
    auto outcome = integrator.ingest(change(1000.0, square(103.005, 29.99, 0.02)), at(0s));

    ASSERT_EQ(outcome.updatedAreas.size(), 1u);
    EXPECT_EQ(outcome.updatedAreas[0].id, area.id);
    EXPECT_NEAR(*outcome.updatedAreas[0].materialAvailability, 0.7, 1e-3);
    ASSERT_EQ(outcome.updatedAreas[0].contributions.size(), 1u);
    EXPECT_EQ(outcome.updatedAreas[0].contributions[0].changeDetectionId, outcome.change.id);
}

TEST_F(ChangeDetectionIntegratorTest, NonOverlappingAreasAreUntouched) {
    addArea(103.0);
    auto far = addArea(103.08);
    auto outcome = integrator.ingest(change(1000.0, square(103.0, 30.0, 0.02)), at(0s));
    ASSERT_EQ(outcome.updatedAreas.size(), 1u);
    EXPECT_DOUBLE_EQ(*store.sourceArea(far.id)->materialAvailability, 0.2);
}

TEST_F(ChangeDetectionIntegratorTest, ErosionAddsNoMaterial) {
    auto area = addArea(103.0);
    auto outcome = integrator.ingest(change(-800.0, square(103.0, 30.0, 0.02)), at(0s));
    EXPECT_TRUE(outcome.updatedAreas.empty());
    EXPECT_GT(outcome.change.id, 0);
    EXPECT_DOUBLE_EQ(*store.sourceArea(area.id)->materialAvailability, 0.2);
}

TEST_F(ChangeDetectionIntegratorTest, MissingFootprintUsesComparisonExtent) {
    addArea(103.0);
    addArea(103.05);
    auto outcome = integrator.ingest(change(500.0, std::nullopt), at(0s));
    ASSERT_EQ(outcome.updatedAreas.size(), 2u);
    for (const auto& area : outcome.updatedAreas) {
        EXPECT_NEAR(*area.materialAvailability, 0.7, 1e-3);
    }
}

TEST_F(ChangeDetectionIntegratorTest, MaterialIsClampedToUnit) {
    auto area = addArea(103.0, 0.9);
    integrator.ingest(change(5000.0, std::nullopt), at(0s));
    EXPECT_DOUBLE_EQ(*store.sourceArea(area.id)->materialAvailability, 1.0);
}

TEST_F(ChangeDetectionIntegratorTest, ContributionDecaysOverTime) {
    auto area = addArea(103.0);
    integrator.ingest(change(500.0, std::nullopt), at(0s));

    auto changed = integrator.refresh(at(24h * 30));
    ASSERT_EQ(changed.size(), 1u);
    EXPECT_NEAR(*changed[0].materialAvailability, 0.2 + 0.5 * std::exp(-1.0), 1e-3);

    // 同一时刻再次刷新没有变化
    EXPECT_TRUE(integrator.refresh(at(24h * 30)).empty());
    EXPECT_EQ(store.sourceArea(area.id)->revision, changed[0].revision);
}

TEST_F(ChangeDetectionIntegratorTest, UpsertKeepsAccumulatedContributions) {
    auto area = addArea(103.0);
    integrator.ingest(change(500.0, std::nullopt), at(0s));

    auto refreshed = sourceArea(square(103.0, 30.0, 0.01), 0.8, 0.1);
    refreshed.id = area.id;
    auto stored = integrator.upsertSourceArea(refreshed, at(0s));
    EXPECT_EQ(stored.contributions.size(), 1u);
    EXPECT_NEAR(*stored.materialAvailability, 0.6, 1e-3);
}

TEST_F(ChangeDetectionIntegratorTest, AreaWithoutAnyMaterialDataStaysUnknown) {
    auto area = addArea(103.0, std::nullopt);
    EXPECT_FALSE(area.materialAvailability.has_value());
}

TEST_F(ChangeDetectionIntegratorTest, SamePairIngestedTwiceConflicts) {
    integrator.ingest(change(500.0, std::nullopt), at(0s));
    EXPECT_THROW(integrator.ingest(change(600.0, std::nullopt), at(1h)), ConflictException);
}

TEST_F(ChangeDetectionIntegratorTest, ParsesChangeDetectionJson) {
    Json::Value json;
    json["baseline_snapshot_id"] = 1;
    json["comparison_snapshot_id"] = 2;
    json["dod_raster_path"] = "/dod/a.tif";
    json["erosion_volume_m3"] = 120.0;
    json["deposition_volume_m3"] = 800.0;
    json["lod_threshold_m"] = 0.15;

    auto cd = ChangeDetection::fromJson(json);
    EXPECT_DOUBLE_EQ(cd.netChangeM3, 680.0);
    EXPECT_FALSE(cd.footprint.has_value());

    json["comparison_snapshot_id"] = 1;
    EXPECT_THROW(ChangeDetection::fromJson(json), ValidationException);
    json["comparison_snapshot_id"] = 2;
    json["lod_threshold_m"] = 0;
    EXPECT_THROW(ChangeDetection::fromJson(json), ValidationException);
}
