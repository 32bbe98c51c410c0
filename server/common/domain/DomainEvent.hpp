#pragma once

/**
 * @brief 流水线领域事件基类
 *
 * 内存状态机（事件检测、风险评估、模拟调度、告警）只负责发布，
 * 持久化和 WebSocket 推送由订阅者完成。具体事件见各模块 domain/Events.hpp。
 */
struct DomainEvent {
    std::string type;
    int64_t aggregateId = 0;
    std::string aggregateType;
    std::chrono::system_clock::time_point occurredAt = std::chrono::system_clock::now();

    DomainEvent() = default;
    DomainEvent(std::string eventType, int64_t id, std::string entity)
        : type(std::move(eventType)), aggregateId(id), aggregateType(std::move(entity)) {}
    virtual ~DomainEvent() = default;

    /** 日志用，如 "AlertRaised Alert#12" */
    std::string describe() const {
        return type + " " + aggregateType + "#" + std::to_string(aggregateId);
    }
};
