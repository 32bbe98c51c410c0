#pragma once

#include "common/domain/DomainEvent.hpp"
#include "WeatherObservation.hpp"

// ==================== 气象观测事件 ====================

/**
 * @brief 一批观测通过校验并进入窗口（按到达顺序）
 */
struct ObservationsAccepted : DomainEvent {
    std::vector<WeatherObservation> observations;

    explicit ObservationsAccepted(std::vector<WeatherObservation> items)
        : DomainEvent("ObservationsAccepted", items.empty() ? 0 : items.back().id, "WeatherObservation")
        , observations(std::move(items)) {}
};
