#pragma once

#include "common/domain/DomainEvent.hpp"
#include "SimulationRun.hpp"
#include "modules/risk/domain/RiskZone.hpp"

// ==================== 模拟运行事件 ====================

struct SimulationDispatched : DomainEvent {
    SimulationRun run;

    explicit SimulationDispatched(SimulationRun r)
        : DomainEvent("SimulationDispatched", r.id, "SimulationRun"), run(std::move(r)) {}
};

/**
 * @brief 非终态变更（已提交、已请求取消）
 */
struct SimulationUpdated : DomainEvent {
    SimulationRun run;

    explicit SimulationUpdated(SimulationRun r)
        : DomainEvent("SimulationUpdated", r.id, "SimulationRun"), run(std::move(r)) {}
};

struct SimulationCompleted : DomainEvent {
    SimulationRun run;
    RiskZone zone;

    SimulationCompleted(SimulationRun r, RiskZone z)
        : DomainEvent("SimulationCompleted", r.id, "SimulationRun")
        , run(std::move(r)), zone(std::move(z)) {}
};

struct SimulationFailed : DomainEvent {
    SimulationRun run;

    explicit SimulationFailed(SimulationRun r)
        : DomainEvent("SimulationFailed", r.id, "SimulationRun"), run(std::move(r)) {}
};
