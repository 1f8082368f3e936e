#include <catch2/catch_test_macros.hpp>

#include "courier/channel.hpp"
#include "courier/scheduler.hpp"
#include "utils.hpp"

using namespace courier;

TEST_CASE("Timer queue", "[scheduler][timers]") {
    fake_clock clock;
    TimerQueue timers{clock.fn()};
    std::vector<std::string> fired;

    CHECK(timers.empty());
    CHECK_FALSE(timers.next_due());

    timers.schedule(2s, [&] { fired.push_back("b"); });
    auto a = timers.schedule(1s, [&] { fired.push_back("a"); });
    auto c = timers.schedule(3s, [&] { fired.push_back("c"); });
    timers.schedule(2s, [&] { fired.push_back("b2"); });
    CHECK(timers.size() == 4);
    CHECK(timers.next_due() == clock.now + 1s);

    CHECK(timers.process() == 0);

    clock.advance(1s);
    CHECK(timers.process() == 1);
    CHECK(fired == std::vector<std::string>{"a"});
    CHECK_FALSE(timers.cancel(a));

    CHECK(timers.cancel(c));
    clock.advance(10s);
    CHECK(timers.process() == 2);
    CHECK(fired == std::vector<std::string>{"a", "b", "b2"});
    CHECK(timers.empty());

    // A callback scheduling an already-due timer runs it in the same pass
    timers.schedule(0ms, [&] {
        fired.push_back("outer");
        timers.schedule(0ms, [&] { fired.push_back("inner"); });
    });
    CHECK(timers.process() == 2);
    CHECK(fired.back() == "inner");
}

TEST_CASE("Retry registry", "[scheduler][retry]") {
    fake_clock clock;
    TimerQueue timers{clock.fn()};
    int first = 0, second = 0;

    {
        RetryRegistry retries{timers};
        retries.schedule("message:1", 1s, [&] { first++; });
        CHECK(retries.pending("message:1"));

        // Rescheduling replaces the pending retry
        retries.schedule("message:1", 2s, [&] { second++; });
        CHECK(retries.size() == 1);
        CHECK(timers.size() == 1);

        clock.advance(1s);
        timers.process();
        CHECK(first == 0);
        clock.advance(1s);
        timers.process();
        CHECK(second == 1);
        CHECK_FALSE(retries.pending("message:1"));

        retries.schedule("action:1", 1s, [&] { first++; });
        CHECK(retries.cancel("action:1"));
        CHECK_FALSE(retries.cancel("action:1"));

        retries.schedule("a", 1s, [&] { first++; });
        retries.schedule("b", 1s, [&] { first++; });
        retries.cancel_all();
        CHECK(retries.size() == 0);
        CHECK(timers.empty());

        retries.schedule("c", 1s, [&] { first++; });
    }
    // Destroying the registry cancels what is left
    CHECK(timers.empty());
    clock.advance(1min);
    timers.process();
    CHECK(first == 0);
}

TEST_CASE("Channel subscriptions", "[scheduler][channel]") {
    Channel<int> ch;
    std::vector<int> a, b;

    auto sub_a = ch.subscribe([&](const int& v) { a.push_back(v); });
    {
        auto sub_b = ch.subscribe([&](const int& v) { b.push_back(v); });
        CHECK(ch.subscriber_count() == 2);
        ch.publish(1);
    }
    CHECK(ch.subscriber_count() == 1);
    ch.publish(2);
    CHECK(a == std::vector<int>{1, 2});
    CHECK(b == std::vector<int>{1});

    sub_a.unsubscribe();
    CHECK_FALSE(sub_a);
    ch.publish(3);
    CHECK(a.size() == 2);

    SECTION("unsubscribing during a publish") {
        Subscription second;
        int calls = 0;
        auto first = ch.subscribe([&](const int&) { second.unsubscribe(); });
        second = ch.subscribe([&](const int&) { calls++; });
        ch.publish(4);
        CHECK(calls == 0);
    }

    SECTION("subscription outliving the channel") {
        Subscription s;
        {
            Channel<int> temp;
            s = temp.subscribe([](const int&) {});
        }
        CHECK_NOTHROW(s.unsubscribe());
    }
}
