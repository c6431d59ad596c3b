#include <doctest/doctest.h>
#include <plcsim/util/event.hpp>
#include <plcsim/util/state_machine.hpp>

using namespace plcsim;

TEST_CASE("Event subscribe/emit") {
    SUBCASE("single listener") {
        Event<i32> event;
        i32 received = 0;
        event.subscribe([&](i32 val) { received = val; });
        event.emit(42);
        CHECK(received == 42);
    }

    SUBCASE("multiple listeners run in subscription order") {
        Event<i32> event;
        dp::Vector<i32> order;
        event.subscribe([&](i32) { order.push_back(1); });
        event.subscribe([&](i32) { order.push_back(2); });
        event.emit(10);
        REQUIRE(order.size() == 2);
        CHECK(order[0] == 1);
        CHECK(order[1] == 2);
    }

    SUBCASE("reference arguments") {
        Event<const dp::String &> event;
        dp::String seen;
        event.subscribe([&](const dp::String &s) { seen = s; });
        event.emit(dp::String("PING"));
        CHECK(seen == "PING");
    }

    SUBCASE("no arguments") {
        Event<> event;
        i32 count = 0;
        event.subscribe([&]() { count++; });
        event.emit();
        event.emit();
        CHECK(count == 2);
    }

    SUBCASE("clear listeners") {
        Event<i32> event;
        i32 val = 0;
        event.subscribe([&](i32 v) { val = v; });
        event.clear();
        event.emit(99);
        CHECK(val == 0);
        CHECK(event.count() == 0);
    }

    SUBCASE("operator+=") {
        Event<i32> event;
        i32 val = 0;
        event += [&](i32 v) { val = v; };
        event.emit(7);
        CHECK(val == 7);
    }
}

TEST_CASE("Event unsubscribe") {
    SUBCASE("token removes only its listener") {
        Event<i32> event;
        i32 a = 0;
        i32 b = 0;
        auto ta = event.subscribe([&](i32 v) { a = v; });
        event.subscribe([&](i32 v) { b = v; });
        CHECK(event.unsubscribe(ta));
        CHECK_FALSE(event.unsubscribe(ta));
        event.emit(5);
        CHECK(a == 0);
        CHECK(b == 5);
        CHECK(event.count() == 1);
    }

    SUBCASE("unsubscribing during dispatch is deferred") {
        Event<> event;
        i32 first = 0;
        i32 second = 0;
        ListenerToken second_token = INVALID_TOKEN;
        event.subscribe([&]() {
            first++;
            event.unsubscribe(second_token);
        });
        second_token = event.subscribe([&]() { second++; });

        event.emit();
        CHECK(first == 1);
        CHECK(second == 0);
        CHECK(event.count() == 1);

        event.emit();
        CHECK(first == 2);
        CHECK(second == 0);
    }

    SUBCASE("listener added during dispatch waits for the next emit") {
        Event<> event;
        i32 late = 0;
        bool added = false;
        event.subscribe([&]() {
            if (!added) {
                added = true;
                event.subscribe([&]() { late++; });
            }
        });
        event.emit();
        CHECK(late == 0);
        event.emit();
        CHECK(late == 1);
    }
}

enum class Lamp : u8 { Off, On, Broken };

TEST_CASE("StateMachine") {
    StateMachine<Lamp> sm(Lamp::Off);
    dp::Vector<std::pair<Lamp, Lamp>> seen;
    sm.on_transition.subscribe([&](Lamp from, Lamp to) { seen.push_back({from, to}); });

    SUBCASE("transition notifies once per change") {
        sm.transition(Lamp::On);
        sm.transition(Lamp::On);
        REQUIRE(seen.size() == 1);
        CHECK(seen[0].first == Lamp::Off);
        CHECK(seen[0].second == Lamp::On);
        CHECK(sm.is(Lamp::On));
    }

    SUBCASE("is_any") {
        sm.transition(Lamp::Broken);
        CHECK(sm.is_any(Lamp::On, Lamp::Broken));
        CHECK_FALSE(sm.is_any(Lamp::Off, Lamp::On));
    }

    SUBCASE("guard refuses illegal moves") {
        sm.set_guard([](Lamp from, Lamp to) { return !(from == Lamp::Broken && to == Lamp::On); });
        CHECK(sm.transition(Lamp::Broken));
        CHECK_FALSE(sm.can_transition(Lamp::On));
        CHECK_FALSE(sm.transition(Lamp::On));
        CHECK(sm.is(Lamp::Broken));
        CHECK(sm.previous() == Lamp::Off);
        CHECK(sm.changes() == 1);
        CHECK(seen.size() == 1);
    }
}
