#pragma once

#include "common/domain/DomainEvent.hpp"
#include "Alert.hpp"

// ==================== 告警事件 ====================

struct AlertRaised : DomainEvent {
    Alert alert;

    explicit AlertRaised(Alert a)
        : DomainEvent("AlertRaised", a.id, "Alert"), alert(std::move(a)) {}
};

/**
 * @brief 去重命中，已有未确认告警被刷新
 */
struct AlertRefreshed : DomainEvent {
    Alert alert;
    bool escalated = false;

    AlertRefreshed(Alert a, bool esc)
        : DomainEvent("AlertRefreshed", a.id, "Alert"), alert(std::move(a)), escalated(esc) {}
};

struct AlertAcknowledged : DomainEvent {
    Alert alert;

    explicit AlertAcknowledged(Alert a)
        : DomainEvent("AlertAcknowledged", a.id, "Alert"), alert(std::move(a)) {}
};
