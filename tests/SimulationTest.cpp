#include "TestHelpers.hpp"
#include "modules/simulation/SimulationDispatcher.hpp"

using namespace TestHelpers;
using namespace std::chrono_literals;

class SimulationRunTest : public ::testing::Test {};

TEST_F(SimulationRunTest, AllowedTransitions) {
    EXPECT_TRUE(SimulationRun::canTransition(RunStatus::Pending, RunStatus::Running));
    EXPECT_TRUE(SimulationRun::canTransition(RunStatus::Pending, RunStatus::Failed));
    EXPECT_TRUE(SimulationRun::canTransition(RunStatus::Running, RunStatus::Completed));
    EXPECT_TRUE(SimulationRun::canTransition(RunStatus::Running, RunStatus::Failed));

    EXPECT_FALSE(SimulationRun::canTransition(RunStatus::Pending, RunStatus::Completed));
    EXPECT_FALSE(SimulationRun::canTransition(RunStatus::Completed, RunStatus::Running));
    EXPECT_FALSE(SimulationRun::canTransition(RunStatus::Failed, RunStatus::Running));
    EXPECT_FALSE(SimulationRun::canTransition(RunStatus::Failed, RunStatus::Completed));
}

TEST_F(SimulationRunTest, IllegalTransitionLeavesRunUnchanged) {
    SimulationRun run;
    run.markRunning("ext-1", at(1min));
    run.fail("timeout", at(2min));
    EXPECT_TRUE(run.isTerminal());

    EXPECT_THROW(run.markRunning("ext-2", at(3min)), IllegalTransitionException);
    EXPECT_THROW(run.complete(std::nullopt, {}, at(3min)), IllegalTransitionException);
    EXPECT_EQ(run.status, RunStatus::Failed);
    EXPECT_EQ(run.externalRunId, "ext-1");
}

TEST_F(SimulationRunTest, TriggerVariantNames) {
    EXPECT_EQ(triggerTypeName(ManualTrigger{"ops"}), "manual");
    EXPECT_EQ(triggerTypeName(ThresholdTrigger{3}), "threshold_exceeded");
    EXPECT_EQ(triggerTypeName(ScheduledTrigger{at(0s)}), "scheduled");

    Json::Value json = triggerToJson(ThresholdTrigger{3});
    json["type"] = "threshold_exceeded";
    auto restored = triggerFromJson(json);
    ASSERT_TRUE(std::holds_alternative<ThresholdTrigger>(restored));
    EXPECT_EQ(std::get<ThresholdTrigger>(restored).rainfallEventId, 3);
}

class ExecutorStatusTest : public ::testing::Test {};

TEST_F(ExecutorStatusTest, MapsQueuedToPending) {
    Json::Value json;
    json["status"] = "queued";
    EXPECT_EQ(ExecutorStatus::fromJson(json).status, RunStatus::Pending);
    json["status"] = "submitted";
    EXPECT_EQ(ExecutorStatus::fromJson(json).status, RunStatus::Pending);
}

TEST_F(ExecutorStatusTest, ParsesCompletedWithMetrics) {
    Json::Value json;
    json["status"] = "completed";
    json["output_path"] = "/runs/42/out.tif";
    json["metrics"]["runout_area_m2"] = 15000.0;
    json["metrics"]["runout_probability"] = 0.6;
    json["metrics"]["footprint"] = Geo::toGeoJson(square(103.0, 30.0, 0.01));

    auto status = ExecutorStatus::fromJson(json);
    EXPECT_EQ(status.status, RunStatus::Completed);
    EXPECT_EQ(*status.outputPath, "/runs/42/out.tif");
    EXPECT_DOUBLE_EQ(*status.metrics.runoutAreaM2, 15000.0);
    ASSERT_TRUE(status.metrics.footprint.has_value());
    EXPECT_EQ(status.metrics.footprint->ring.size(), 4u);
    EXPECT_FALSE(status.metrics.maxVelocityMs.has_value());
}

TEST_F(ExecutorStatusTest, RejectsUnknownStatusAndBadFootprint) {
    Json::Value json;
    json["status"] = "exploded";
    EXPECT_THROW(ExecutorStatus::fromJson(json), ExecutorException);

    Json::Value bad;
    bad["status"] = "completed";
    bad["metrics"]["footprint"]["type"] = "Point";
    EXPECT_THROW(ExecutorStatus::fromJson(bad), ExecutorException);
}

/**
 * @brief 内存执行器，按测试设定返回结果
 */
class FakeExecutor : public SimulationExecutor {
public:
    bool failSubmit = false;
    bool failPoll = false;
    ExecutorStatus nextStatus;
    std::vector<std::string> cancelled;
    std::vector<Json::Value> submittedParameters;

    Task<std::string> submit(const Json::Value& parameters, const std::string&, const std::string&) override {
        if (failSubmit) throw ExecutorException("executor unavailable");
        submittedParameters.push_back(parameters);
        co_return "ext-" + std::to_string(submittedParameters.size());
    }

    Task<ExecutorStatus> poll(const std::string&) override {
        if (failPoll) throw ExecutorException("poll timed out");
        co_return nextStatus;
    }

    Task<void> cancel(const std::string& externalRunId) override {
        cancelled.push_back(externalRunId);
        co_return;
    }
};

class SimulationDispatcherTest : public ::testing::Test {
protected:
    SpatialStore store;
    RiskEvaluator evaluator{store, RiskConfig{}, DetectorConfig{}};
    std::shared_ptr<FakeExecutor> executor = std::make_shared<FakeExecutor>();
    std::unique_ptr<SimulationDispatcher> dispatcher;

    void SetUp() override {
        SimulationConfig config;
        config.timeout = 1h;
        config.defaultParameters["friction"] = 0.2;
        config.defaultParameters["release_depth_m"] = 1.5;
        dispatcher = std::make_unique<SimulationDispatcher>(store, evaluator, executor, config);
    }

    TerrainSnapshot addSnapshot() {
        return store.addSnapshot(snapshot("v1", square(103.0, 30.0, 0.1)));
    }

    SimulationRun launched() {
        addSnapshot();
        auto run = dispatcher->dispatch(DispatchRequest{}, at(0s));
        auto outcome = drogon::sync_wait(dispatcher->launch(run.id));
        EXPECT_EQ(outcome.updated.size(), 1u);
        return *store.run(run.id);
    }

    static TimePoint later(std::chrono::seconds offset) {
        return std::chrono::system_clock::now() + offset;
    }
};

TEST_F(SimulationDispatcherTest, DispatchRequiresSnapshot) {
    EXPECT_THROW(dispatcher->dispatch(DispatchRequest{}, at(0s)), ValidationException);

    DispatchRequest request;
    request.terrainSnapshotId = 404;
    addSnapshot();
    EXPECT_THROW(dispatcher->dispatch(request, at(0s)), ValidationException);
}

TEST_F(SimulationDispatcherTest, DispatchMergesParameters) {
    auto snap = addSnapshot();
    DispatchRequest request;
    request.trigger = ManualTrigger{"ops"};
    request.parameters["friction"] = 0.3;

    auto run = dispatcher->dispatch(request, at(0s));
    EXPECT_EQ(run.status, RunStatus::Pending);
    EXPECT_EQ(run.terrainSnapshotId, snap.id);
    EXPECT_EQ(run.modelName, "gpp");
    EXPECT_DOUBLE_EQ(run.parameters["friction"].asDouble(), 0.3);
    EXPECT_DOUBLE_EQ(run.parameters["release_depth_m"].asDouble(), 1.5);
    EXPECT_EQ(run.parameters["dem_path"].asString(), snap.demPath);
    EXPECT_FALSE(run.rainfallEventId.has_value());
}

TEST_F(SimulationDispatcherTest, DispatchCarriesRainfallEvent) {
    addSnapshot();
    auto event = openEvent(store, "A", at(0s), 20.0, true);

    DispatchRequest request;
    request.rainfallEventId = event.id;
    auto run = dispatcher->dispatch(request, at(1min));
    EXPECT_EQ(run.rainfallEventId, event.id);
    EXPECT_EQ(run.locationId, "A");
    EXPECT_DOUBLE_EQ(run.parameters["rainfall_max_intensity_mm_hr"].asDouble(), 20.0);

    EXPECT_THROW(dispatcher->dispatch(request, at(2min)), DuplicateDispatchException);

    request.rainfallEventId = 404;
    EXPECT_THROW(dispatcher->dispatch(request, at(2min)), ValidationException);
}

TEST_F(SimulationDispatcherTest, ThresholdDispatchOncePerEvent) {
    addSnapshot();
    auto quiet = openEvent(store, "A", at(0s), 5.0, false);
    EXPECT_FALSE(dispatcher->dispatchForThreshold(quiet, at(1min)).has_value());

    auto storm = openEvent(store, "B", at(0s), 30.0, true);
    auto run = dispatcher->dispatchForThreshold(storm, at(1min));
    ASSERT_TRUE(run.has_value());
    EXPECT_TRUE(std::holds_alternative<ThresholdTrigger>(run->trigger));

    // 已有运行（任意状态）时不再自动调度
    store.updateRun(run->id, [](SimulationRun& r) { r.fail("boom", at(2min)); });
    EXPECT_FALSE(dispatcher->dispatchForThreshold(storm, at(3min)).has_value());
}

TEST_F(SimulationDispatcherTest, ThresholdDispatchWithoutSnapshotIsSkipped) {
    auto storm = openEvent(store, "A", at(0s), 30.0, true);
    EXPECT_FALSE(dispatcher->dispatchForThreshold(storm, at(1min)).has_value());
}

TEST_F(SimulationDispatcherTest, ScheduledDispatchSkipsWhileOpen) {
    EXPECT_FALSE(dispatcher->dispatchScheduled(at(0s)).has_value());
    addSnapshot();
    EXPECT_TRUE(dispatcher->dispatchScheduled(at(1h)).has_value());
    EXPECT_FALSE(dispatcher->dispatchScheduled(at(2h)).has_value());
}

TEST_F(SimulationDispatcherTest, LaunchSubmitsAndMarksRunning) {
    auto run = launched();
    EXPECT_EQ(run.status, RunStatus::Running);
    EXPECT_EQ(run.externalRunId, "ext-1");
    EXPECT_TRUE(run.startedAt.has_value());
    ASSERT_EQ(executor->submittedParameters.size(), 1u);
    EXPECT_TRUE(executor->submittedParameters[0].isMember("dem_path"));
}

TEST_F(SimulationDispatcherTest, SubmitFailureFailsRun) {
    addSnapshot();
    executor->failSubmit = true;
    auto run = dispatcher->dispatch(DispatchRequest{}, at(0s));
    auto outcome = drogon::sync_wait(dispatcher->launch(run.id));

    ASSERT_EQ(outcome.failed.size(), 1u);
    EXPECT_EQ(outcome.failed[0].status, RunStatus::Failed);
    EXPECT_NE(outcome.failed[0].errorMessage->find("submit failed"), std::string::npos);
}

TEST_F(SimulationDispatcherTest, CompletionMaterializesZone) {
    auto run = launched();
    executor->nextStatus.status = RunStatus::Completed;
    executor->nextStatus.outputPath = "/runs/1/out.tif";
    executor->nextStatus.metrics.runoutProbability = 0.8;
    executor->nextStatus.metrics.footprint = square(103.01, 30.01, 0.01);

    auto outcome = drogon::sync_wait(dispatcher->superviseOnce(later(1min)));
    ASSERT_EQ(outcome.completed.size(), 1u);
    const auto& [completed, zone] = outcome.completed[0];
    EXPECT_EQ(completed.status, RunStatus::Completed);
    EXPECT_EQ(*completed.outputPath, "/runs/1/out.tif");
    EXPECT_EQ(zone.simulationRunId, run.id);
    EXPECT_NEAR(zone.riskValue, 0.4, 1e-9);
    EXPECT_EQ(store.zoneForRun(run.id)->id, zone.id);

    // 终态后的巡检不再轮询
    auto again = drogon::sync_wait(dispatcher->superviseOnce(later(2min)));
    EXPECT_TRUE(again.empty());
}

TEST_F(SimulationDispatcherTest, RunoutAreaMetricBecomesZoneArea) {
    auto run = launched();
    executor->nextStatus.status = RunStatus::Completed;
    executor->nextStatus.metrics.runoutAreaM2 = 1500.0;

    auto outcome = drogon::sync_wait(dispatcher->superviseOnce(later(1min)));
    ASSERT_EQ(outcome.completed.size(), 1u);
    EXPECT_DOUBLE_EQ(outcome.completed[0].second.affectedAreaM2, 1500.0);

    // 无足迹时几何取快照范围
    auto zones = store.zones();
    ASSERT_EQ(zones.size(), 1u);
    EXPECT_EQ(zones[0].simulationRunId, run.id);
    EXPECT_DOUBLE_EQ(zones[0].affectedAreaM2, 1500.0);
    EXPECT_FALSE(zones[0].geometry.empty());
    EXPECT_DOUBLE_EQ(zones[0].toJson()["affected_area_m2"].asDouble(), 1500.0);
}

TEST_F(SimulationDispatcherTest, ExecutorFailureFailsRun) {
    launched();
    executor->nextStatus.status = RunStatus::Failed;
    executor->nextStatus.errorMessage = "solver diverged";

    auto outcome = drogon::sync_wait(dispatcher->superviseOnce(later(1min)));
    ASSERT_EQ(outcome.failed.size(), 1u);
    EXPECT_EQ(*outcome.failed[0].errorMessage, "solver diverged");
}

TEST_F(SimulationDispatcherTest, PollErrorKeepsRunRunning) {
    auto run = launched();
    executor->failPoll = true;
    auto outcome = drogon::sync_wait(dispatcher->superviseOnce(later(1min)));
    EXPECT_TRUE(outcome.empty());
    EXPECT_EQ(store.run(run.id)->status, RunStatus::Running);
}

TEST_F(SimulationDispatcherTest, TimeoutFailsAndSignalsExecutor) {
    launched();
    auto outcome = drogon::sync_wait(dispatcher->superviseOnce(later(1h + 1min)));
    ASSERT_EQ(outcome.failed.size(), 1u);
    EXPECT_NE(outcome.failed[0].errorMessage->find("timeout"), std::string::npos);
    ASSERT_EQ(executor->cancelled.size(), 1u);
    EXPECT_EQ(executor->cancelled[0], "ext-1");
}

TEST_F(SimulationDispatcherTest, CancellationIsCooperative) {
    auto run = launched();
    auto requested = dispatcher->requestCancel(run.id);
    EXPECT_TRUE(requested.cancelRequested);
    EXPECT_EQ(requested.status, RunStatus::Running);

    auto outcome = drogon::sync_wait(dispatcher->superviseOnce(later(1min)));
    ASSERT_EQ(outcome.failed.size(), 1u);
    EXPECT_EQ(*outcome.failed[0].errorMessage, "cancelled by operator");
    EXPECT_EQ(executor->cancelled.size(), 1u);

    EXPECT_THROW(dispatcher->requestCancel(run.id), IllegalTransitionException);
    EXPECT_THROW(dispatcher->requestCancel(404), NotFoundException);
}

TEST_F(SimulationDispatcherTest, RecoveryFailsUnsubmittedRuns) {
    auto running = launched();
    auto other = store.addSnapshot(snapshot("v2", square(103.0, 30.0, 0.1)));
    DispatchRequest request;
    request.terrainSnapshotId = other.id;
    auto pending = dispatcher->dispatch(request, at(0s));

    auto failed = dispatcher->recoverAfterRestart(at(1min));
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].id, pending.id);
    EXPECT_EQ(store.run(running.id)->status, RunStatus::Running);
}
