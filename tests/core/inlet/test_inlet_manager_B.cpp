/*
===============================================================================
 inlet::Manager - Group B Unit Tests
===============================================================================

Scope:
------
Sample delivery by the pull worker and its failure contract.

Covered Requirements:
---------------------
B1. Fan-out
    - Every subscriber of a uid receives every pulled sample
    - Per-subscriber order matches pull order

B2. Drop-oldest under burst
    - Queue capacity N, burst of M > N with no consumption: the queue ends
      with exactly the last N samples, in arrival order

B3. Pull failure orphans the inlet
    - Worker exits, is_pulling() turns false
    - Entry and reference count stay (no self-heal)
    - Last unsubscribe still closes the inlet and erases the entry

B4. Destruction
    - Destroying the manager closes every remaining inlet

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>

#include "telemux/core/inlet/manager.hpp"
#include "common/test_check.hpp"
#include "common/mock_source.hpp"

using namespace telemux;
using namespace telemux::core;
using namespace std::chrono_literals;
using test::MockSource;
using test::MockHandle;


// -----------------------------------------------------------------------------
// B1: Fan-out
// -----------------------------------------------------------------------------
void test_fan_out_order() {
    std::cout << "[TEST] Group B1: fan-out to every subscriber\n";

    MockSource source;
    auto xs = source.add_stream(test::make_descriptor("X", "Xstream"));
    const MockHandle handle{"X", xs};

    inlet::Manager<MockSource> manager(source);

    inlet::Subscriber a, b;
    TEST_CHECK(manager.subscribe("X", handle, 256, a) == Error::None);
    TEST_CHECK(manager.subscribe("X", handle, 256, b) == Error::None);

    constexpr std::size_t N = 100; // several pull batches
    MockSource::push_sequence(*xs, N);

    TEST_CHECK(test::wait_until([&] { return a->size() == N && b->size() == N; }));

    for (auto* q : {&a, &b}) {
        for (std::size_t i = 0; i < N; ++i) {
            stream::SamplePtr s;
            TEST_CHECK((*q)->try_pop(s));
            TEST_CHECK(s->timestamp == static_cast<double>(i));
        }
    }

    // Both queues share the same immutable sample objects
    MockSource::push_sequence(*xs, 1, 500.0);
    TEST_CHECK(test::wait_until([&] { return a->size() == 1 && b->size() == 1; }));
    stream::SamplePtr sa, sb;
    TEST_CHECK(a->try_pop(sa) && b->try_pop(sb));
    TEST_CHECK(sa.get() == sb.get());

    std::ostringstream dump;
    TEST_CHECK(manager.telemetry_dump("X", dump));
    TEST_CHECK(dump.str().find("Samples pulled") != std::string::npos);
    TEST_CHECK(!manager.telemetry_dump("nope", dump));

    manager.unsubscribe("X", a);
    manager.unsubscribe("X", b);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B2: Drop-oldest
// -----------------------------------------------------------------------------
void test_drop_oldest_burst() {
    std::cout << "[TEST] Group B2: drop-oldest under burst\n";

    MockSource source;
    auto xs = source.add_stream(test::make_descriptor("X", "Xstream"));

    inlet::Manager<MockSource> manager(source);

    constexpr std::size_t CAPACITY = 4;
    constexpr std::size_t BURST = 50;

    inlet::Subscriber slow, fast;
    TEST_CHECK(manager.subscribe("X", MockHandle{"X", xs}, CAPACITY, slow) == Error::None);
    TEST_CHECK(manager.subscribe("X", MockHandle{"X", xs}, BURST, fast) == Error::None);

    MockSource::push_sequence(*xs, BURST);
    TEST_CHECK(test::wait_until([&] { return fast->size() == BURST; }));

    TEST_CHECK(slow->size() == CAPACITY);
    TEST_CHECK(slow->evicted() == BURST - CAPACITY);
    TEST_CHECK(fast->evicted() == 0);

    for (std::size_t expected = BURST - CAPACITY; expected < BURST; ++expected) {
        stream::SamplePtr s;
        TEST_CHECK(slow->try_pop(s));
        TEST_CHECK(s->timestamp == static_cast<double>(expected));
    }

    manager.unsubscribe("X", slow);
    manager.unsubscribe("X", fast);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B3: Pull failure
// -----------------------------------------------------------------------------
void test_pull_failure_orphans_inlet() {
    std::cout << "[TEST] Group B3: pull failure orphans the inlet\n";

    MockSource source;
    auto xs = source.add_stream(test::make_descriptor("X", "Xstream"));
    const MockHandle handle{"X", xs};

    inlet::Manager<MockSource> manager(source);

    inlet::Subscriber q;
    TEST_CHECK(manager.subscribe("X", handle, 16, q) == Error::None);
    TEST_CHECK(manager.is_pulling("X"));

    MockSource::fail_pulls(*xs, Error::SourceFailure);
    TEST_CHECK(test::wait_until([&] { return !manager.is_pulling("X"); }));

    // Entry survives with its reference count and open inlet
    TEST_CHECK(manager.is_open("X"));
    TEST_CHECK(manager.ref_count("X") == 1);
    TEST_CHECK(xs->close_calls.load() == 0);

    // A late subscriber joins the orphan: no new inlet, no new worker
    inlet::Subscriber late;
    TEST_CHECK(manager.subscribe("X", handle, 16, late) == Error::None);
    TEST_CHECK(manager.ref_count("X") == 2);
    TEST_CHECK(xs->inlets_created.load() == 1);
    TEST_CHECK(!manager.is_pulling("X"));

    manager.unsubscribe("X", q);
    manager.unsubscribe("X", late);
    TEST_CHECK(!manager.is_open("X"));
    TEST_CHECK(xs->close_calls.load() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B4: Destruction
// -----------------------------------------------------------------------------
void test_destructor_closes_inlets() {
    std::cout << "[TEST] Group B4: destructor closes inlets\n";

    MockSource source;
    auto x = source.add_stream(test::make_descriptor("X", "Xstream"));
    auto y = source.add_stream(test::make_descriptor("Y", "Ystream"));

    {
        inlet::Manager<MockSource> manager(source);
        inlet::Subscriber qx, qy;
        TEST_CHECK(manager.subscribe("X", MockHandle{"X", x}, 8, qx) == Error::None);
        TEST_CHECK(manager.subscribe("Y", MockHandle{"Y", y}, 8, qy) == Error::None);
        TEST_CHECK(manager.active_inlets().size() == 2);
    } // Destructor must run here

    TEST_CHECK(x->close_calls.load() == 1);
    TEST_CHECK(y->close_calls.load() == 1);
    TEST_CHECK(!x->is_inlet_open());
    TEST_CHECK(!y->is_inlet_open());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Warn);

    test_fan_out_order();
    test_drop_oldest_burst();
    test_pull_failure_orphans_inlet();
    test_destructor_closes_inlets();

    std::cout << "\n[GROUP B - INLET DELIVERY TESTS PASSED]\n";
    return 0;
}
