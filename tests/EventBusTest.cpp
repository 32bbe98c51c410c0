#include "TestHelpers.hpp"
#include "common/domain/EventBus.hpp"

namespace {

struct ProbeEvent : DomainEvent {
    explicit ProbeEvent(int64_t id) : DomainEvent("ProbeEvent", id, "Probe") {}
};

struct OtherEvent : DomainEvent {
    OtherEvent() : DomainEvent("OtherEvent", 0, "Probe") {}
};

}  // namespace

class EventBusTest : public ::testing::Test {
protected:
    void TearDown() override { EventBus::instance().unsubscribeAll(); }
};

TEST_F(EventBusTest, FailingSubscriberDoesNotStopOthers) {
    auto& bus = EventBus::instance();
    std::vector<int64_t> seen;

    bus.subscribe<ProbeEvent>([](const ProbeEvent&) -> drogon::Task<void> {
        throw std::runtime_error("disk full");
        co_return;
    });
    bus.subscribe<ProbeEvent>([&seen](const ProbeEvent& e) -> drogon::Task<void> {
        seen.push_back(e.aggregateId);
        co_return;
    });

    auto failuresBefore = bus.failureCount();
    drogon::sync_wait(bus.publish(ProbeEvent{7}));

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], 7);
    EXPECT_EQ(bus.failureCount(), failuresBefore + 1);
}

TEST_F(EventBusTest, DispatchesByEventType) {
    auto& bus = EventBus::instance();
    int probes = 0;
    bus.subscribe<ProbeEvent>([&probes](const ProbeEvent&) -> drogon::Task<void> {
        ++probes;
        co_return;
    });

    EXPECT_EQ(bus.subscriberCount<ProbeEvent>(), 1u);
    EXPECT_EQ(bus.subscriberCount<OtherEvent>(), 0u);

    drogon::sync_wait(bus.publish(OtherEvent{}));
    EXPECT_EQ(probes, 0);

    drogon::sync_wait(bus.publish(ProbeEvent{1}));
    EXPECT_EQ(probes, 1);
}

TEST_F(EventBusTest, UnsubscribeAllClearsEveryType) {
    auto& bus = EventBus::instance();
    bus.subscribe<ProbeEvent>([](const ProbeEvent&) -> drogon::Task<void> { co_return; });
    bus.subscribe<OtherEvent>([](const OtherEvent&) -> drogon::Task<void> { co_return; });

    bus.unsubscribeAll();
    EXPECT_EQ(bus.subscriberCount<ProbeEvent>(), 0u);
    EXPECT_EQ(bus.subscriberCount<OtherEvent>(), 0u);
}

TEST(DomainEventTest, DescribeNamesTypeAndEntity) {
    EXPECT_EQ(ProbeEvent{12}.describe(), "ProbeEvent Probe#12");
}
