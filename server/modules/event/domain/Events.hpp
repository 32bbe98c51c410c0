#pragma once

#include "common/domain/DomainEvent.hpp"
#include "RainfallEvent.hpp"

// ==================== 降雨事件 ====================

struct RainfallEventOpened : DomainEvent {
    RainfallEvent event;

    explicit RainfallEventOpened(RainfallEvent e)
        : DomainEvent("RainfallEventOpened", e.id, "RainfallEvent"), event(std::move(e)) {}
};

struct RainfallEventUpdated : DomainEvent {
    RainfallEvent event;

    explicit RainfallEventUpdated(RainfallEvent e)
        : DomainEvent("RainfallEventUpdated", e.id, "RainfallEvent"), event(std::move(e)) {}
};

struct RainfallEventClosed : DomainEvent {
    RainfallEvent event;

    explicit RainfallEventClosed(RainfallEvent e)
        : DomainEvent("RainfallEventClosed", e.id, "RainfallEvent"), event(std::move(e)) {}
};
