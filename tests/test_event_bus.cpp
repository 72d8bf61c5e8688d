#include <catch2/catch.hpp>
#include "event_bus.hpp"
#include <stdexcept>

using namespace stepstream;

// ── Basic publish / subscribe ───────────────────────────────────

TEST_CASE("EventBus: subscribe and publish", "[event_bus]") {
    EventBus bus;
    int count = 0;

    bus.subscribe(SummaryUpdatedEvent::TAG, [&](const Event&) {
        count++;
    });

    SummaryUpdatedEvent ev;
    ev.session_id = "s1";
    bus.publish(ev);

    REQUIRE(count == 1);
}

TEST_CASE("EventBus: multiple subscribers called in order", "[event_bus]") {
    EventBus bus;
    std::vector<int> order;

    bus.subscribe(StepCompletedEvent::TAG, [&](const Event&) {
        order.push_back(1);
    });
    bus.subscribe(StepCompletedEvent::TAG, [&](const Event&) {
        order.push_back(2);
    });

    StepCompletedEvent ev;
    bus.publish(ev);

    REQUIRE(order.size() == 2);
    REQUIRE(order[0] == 1);
    REQUIRE(order[1] == 2);
}

TEST_CASE("EventBus: publish with no subscribers is a no-op", "[event_bus]") {
    EventBus bus;
    StreamErrorEvent ev;
    bus.publish(ev); // should not crash
}

TEST_CASE("EventBus: different tags are independent", "[event_bus]") {
    EventBus bus;
    int state_count = 0;
    int error_count = 0;

    bus.subscribe(ConnectionStateChangedEvent::TAG, [&](const Event&) { state_count++; });
    bus.subscribe(StreamErrorEvent::TAG, [&](const Event&) { error_count++; });

    ConnectionStateChangedEvent ev1;
    bus.publish(ev1);
    bus.publish(ev1);

    StreamErrorEvent ev2;
    bus.publish(ev2);

    REQUIRE(state_count == 2);
    REQUIRE(error_count == 1);
}

TEST_CASE("EventBus: throwing handler does not stop the others", "[event_bus]") {
    EventBus bus;
    int count = 0;

    bus.subscribe(StreamErrorEvent::TAG, [](const Event&) {
        throw std::runtime_error("boom");
    });
    bus.subscribe(StreamErrorEvent::TAG, [&](const Event&) { count++; });

    StreamErrorEvent ev;
    bus.publish(ev);
    REQUIRE(count == 1);
}

TEST_CASE("EventBus: handler may unsubscribe itself while publishing", "[event_bus]") {
    EventBus bus;
    int count = 0;
    uint64_t id = 0;

    id = bus.subscribe(SummaryUpdatedEvent::TAG, [&](const Event&) {
        count++;
        bus.unsubscribe(id);
    });

    SummaryUpdatedEvent ev;
    bus.publish(ev);
    bus.publish(ev);
    REQUIRE(count == 1);
}

// ── Unsubscribe ─────────────────────────────────────────────────

TEST_CASE("EventBus: unsubscribe removes handler", "[event_bus]") {
    EventBus bus;
    int count = 0;

    uint64_t id = bus.subscribe(StepCompletedEvent::TAG, [&](const Event&) {
        count++;
    });

    StepCompletedEvent ev;
    bus.publish(ev);
    REQUIRE(count == 1);

    REQUIRE(bus.unsubscribe(id));
    bus.publish(ev);
    REQUIRE(count == 1); // not called again
}

TEST_CASE("EventBus: unsubscribe returns false for unknown id", "[event_bus]") {
    EventBus bus;
    REQUIRE_FALSE(bus.unsubscribe(999));
}

TEST_CASE("ScopedSubscription: unsubscribes when destroyed", "[event_bus]") {
    EventBus bus;
    int count = 0;
    {
        ScopedSubscription sub(bus, bus.subscribe(StreamErrorEvent::TAG,
                                                  [&](const Event&) { count++; }));
        REQUIRE(bus.subscriber_count(StreamErrorEvent::TAG) == 1);

        ScopedSubscription moved = std::move(sub);
        REQUIRE(bus.subscriber_count(StreamErrorEvent::TAG) == 1);
    }
    REQUIRE(bus.subscriber_count(StreamErrorEvent::TAG) == 0);

    StreamErrorEvent ev;
    bus.publish(ev);
    REQUIRE(count == 0);
}

// ── Clear ───────────────────────────────────────────────────────

TEST_CASE("EventBus: clear removes all subscriptions", "[event_bus]") {
    EventBus bus;
    int count = 0;

    bus.subscribe(SummaryUpdatedEvent::TAG, [&](const Event&) { count++; });
    bus.subscribe(StepCompletedEvent::TAG, [&](const Event&) { count++; });

    bus.clear();

    SummaryUpdatedEvent ev1;
    StepCompletedEvent ev2;
    bus.publish(ev1);
    bus.publish(ev2);
    REQUIRE(count == 0);
}

// ── subscriber_count ────────────────────────────────────────────

TEST_CASE("EventBus: subscriber_count", "[event_bus]") {
    EventBus bus;
    REQUIRE(bus.subscriber_count(SummaryUpdatedEvent::TAG) == 0);

    bus.subscribe(SummaryUpdatedEvent::TAG, [](const Event&) {});
    bus.subscribe(SummaryUpdatedEvent::TAG, [](const Event&) {});
    REQUIRE(bus.subscriber_count(SummaryUpdatedEvent::TAG) == 2);
    REQUIRE(bus.subscriber_count(StepCompletedEvent::TAG) == 0);
}

// ── Type-safe subscribe helper ──────────────────────────────────

TEST_CASE("EventBus: type-safe subscribe template", "[event_bus]") {
    EventBus bus;
    std::string captured_step;
    std::optional<int64_t> captured_sequence;

    subscribe<SummaryUpdatedEvent>(bus, [&](const SummaryUpdatedEvent& ev) {
        captured_step = ev.plan_step_id;
        captured_sequence = ev.last_sequence;
    });

    SummaryUpdatedEvent ev;
    ev.plan_step_id = "step-9";
    ev.last_sequence = 41;
    bus.publish(ev);

    REQUIRE(captured_step == "step-9");
    REQUIRE(captured_sequence == 41);
}

TEST_CASE("EventBus: state change carries state and error", "[event_bus]") {
    EventBus bus;
    ConnectionState state = ConnectionState::Idle;
    std::string error;

    subscribe<ConnectionStateChangedEvent>(bus, [&](const ConnectionStateChangedEvent& ev) {
        state = ev.state;
        error = ev.error;
    });

    ConnectionStateChangedEvent ev;
    ev.state = ConnectionState::Error;
    ev.error = "Planner stream connection failed";
    bus.publish(ev);

    REQUIRE(state == ConnectionState::Error);
    REQUIRE(error == "Planner stream connection failed");
}
