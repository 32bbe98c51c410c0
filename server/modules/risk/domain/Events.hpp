#pragma once

#include "common/domain/DomainEvent.hpp"
#include "RiskZone.hpp"

// ==================== 风险评估事件 ====================

struct RiskAssessed : DomainEvent {
    RiskAssessment assessment;
    std::optional<RiskLevel> previousLevel;     // 同一事件上一次评估的等级

    RiskAssessed(RiskAssessment a, std::optional<RiskLevel> previous)
        : DomainEvent("RiskAssessed", a.eventId, "RainfallEvent")
        , assessment(std::move(a)), previousLevel(previous) {}
};
