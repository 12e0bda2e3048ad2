#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <future>
#include <swarmsync/scheduler.hpp>
#include <vector>

using namespace std::literals;
using namespace swarmsync;

TEST_CASE("Manual scheduler", "[scheduler]") {
    ManualScheduler sched;
    std::vector<int> ran;

    sched.schedule(300ms, [&] { ran.push_back(3); });
    sched.schedule(100ms, [&] { ran.push_back(1); });
    auto cancelled = sched.schedule(200ms, [&] { ran.push_back(2); });
    sched.post([&] { ran.push_back(0); });

    CHECK(sched.pending() == 4);
    CHECK(sched.next_delay() == 0ms);
    CHECK(sched.pending_delays() == std::vector{0ms, 100ms, 200ms, 300ms});

    CHECK(sched.run_pending() == 1);
    CHECK(ran == std::vector{0});

    CHECK(sched.cancel(cancelled));
    CHECK_FALSE(sched.cancel(cancelled));

    CHECK(sched.advance(150ms) == 1);
    CHECK(ran == std::vector{0, 1});
    CHECK(sched.now() == 150ms);
    CHECK(sched.next_delay() == 150ms);

    SECTION("tasks scheduled by tasks run when due") {
        sched.schedule(10ms, [&] { sched.schedule(10ms, [&] { ran.push_back(4); }); });
        CHECK(sched.advance(20ms) == 2);
        CHECK(ran == std::vector{0, 1, 4});
        CHECK(sched.advance(1s) == 1);
        CHECK(ran == std::vector{0, 1, 4, 3});
    }
    SECTION("nothing pending") {
        CHECK(sched.advance(1s) == 1);
        CHECK(sched.pending() == 0);
        CHECK(sched.next_delay() == -1ms);
    }
}

TEST_CASE("Manual scheduler clock read from another thread", "[scheduler]") {
    ManualScheduler sched;
    for (int i = 1; i <= 200; i++)
        sched.schedule(i * 1ms, [] {});

    std::atomic<bool> done{false};
    auto reader = std::async(std::launch::async, [&] {
        bool monotonic = true;
        auto last = sched.now();
        while (!done) {
            auto t = sched.now();
            if (t < last)
                monotonic = false;
            last = t;
        }
        return monotonic;
    });

    for (int i = 0; i < 200; i++)
        sched.advance(1ms);
    done = true;

    CHECK(reader.get());
    CHECK(sched.now() == 200ms);
    CHECK(sched.pending() == 0);
}

TEST_CASE("Thread scheduler", "[scheduler]") {
    ThreadScheduler sched{2};

    std::promise<int> done;
    auto result = done.get_future();
    sched.schedule(10ms, [&] { done.set_value(42); });
    REQUIRE(result.wait_for(5s) == std::future_status::ready);
    CHECK(result.get() == 42);

    std::atomic<bool> ran{false};
    auto id = sched.schedule(1h, [&] { ran = true; });
    CHECK(sched.cancel(id));
    CHECK_FALSE(sched.cancel(id));
    CHECK_FALSE(ran);
}
