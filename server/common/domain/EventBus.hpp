#pragma once

#include "DomainEvent.hpp"

/**
 * @brief 进程内事件总线
 *
 * 流水线在内存中完成状态转换后 publish，持久化与 WebSocket 推送作为订阅者依次执行。
 * 订阅者失败只记日志并计数，不影响同一事件的其他订阅者，也不回滚内存状态。
 *
 * 订阅表按事件类型保存不可变快照（写时复制），publish 不持锁执行订阅者。
 *
 * @code
 * EventBus::instance().subscribe<AlertRaised>([](const AlertRaised& e) -> Task<void> {
 *     co_await AlertRepository::save(e.alert);
 * });
 * co_await EventBus::instance().publish(AlertRaised{alert});
 * @endcode
 */
class EventBus {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;
    using Handler = std::function<Task<void>(const DomainEvent&)>;
    using HandlerList = std::vector<Handler>;

    static EventBus& instance() {
        static EventBus bus;
        return bus;
    }

    template<typename E>
    Task<void> publish(const E& event) {
        static_assert(std::is_base_of_v<DomainEvent, E>, "E must derive from DomainEvent");

        auto handlers = handlersFor(std::type_index(typeid(E)));
        if (!handlers) {
            LOG_TRACE << "[EventBus] No subscribers for " << event.type;
            co_return;
        }
        LOG_DEBUG << "[EventBus] " << event.describe() << " -> " << handlers->size() << " subscribers";

        for (const auto& handler : *handlers) {
            std::string failure;
            try {
                co_await handler(event);
            } catch (const drogon::orm::DrogonDbException& e) {
                failure = e.base().what();
            } catch (const std::exception& e) {
                failure = e.what();
            }
            if (!failure.empty()) {
                failures_.fetch_add(1, std::memory_order_relaxed);
                LOG_ERROR << "[EventBus] Subscriber failed on " << event.describe() << ": " << failure;
            }
        }
    }

    template<typename E>
    void subscribe(std::function<Task<void>(const E&)> handler) {
        static_assert(std::is_base_of_v<DomainEvent, E>, "E must derive from DomainEvent");

        Handler erased = [handler = std::move(handler)](const DomainEvent& e) -> Task<void> {
            co_await handler(static_cast<const E&>(e));
        };

        std::unique_lock lock(mutex_);
        auto& slot = handlers_[std::type_index(typeid(E))];
        auto next = slot ? std::make_shared<HandlerList>(*slot) : std::make_shared<HandlerList>();
        next->push_back(std::move(erased));
        slot = std::move(next);
    }

    template<typename E>
    size_t subscriberCount() const {
        auto handlers = handlersFor(std::type_index(typeid(E)));
        return handlers ? handlers->size() : 0;
    }

    /** 启动以来订阅者失败次数 */
    uint64_t failureCount() const { return failures_.load(std::memory_order_relaxed); }

    /**
     * @brief 清空订阅（关闭服务、测试之间）
     */
    void unsubscribeAll() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
        LOG_DEBUG << "[EventBus] All subscribers removed";
    }

private:
    EventBus() = default;

    std::shared_ptr<const HandlerList> handlersFor(std::type_index type) const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(type);
        if (it == handlers_.end()) return nullptr;
        return it->second;
    }

    std::map<std::type_index, std::shared_ptr<const HandlerList>> handlers_;
    mutable std::shared_mutex mutex_;
    std::atomic<uint64_t> failures_{0};
};
