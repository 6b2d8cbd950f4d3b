/**
 * @file test_spsc_queue.cc
 * @brief Unit tests for the realtime single producer / single consumer ring
 */

#include <doctest/doctest.h>
#include <rainout/sdk/spsc_queue.hh>
#include <cstdint>
#include <thread>

using namespace rainout;

TEST_SUITE("SpscQueue::Unit") {

    TEST_CASE("should_hold_exactly_its_capacity") {
        spsc_queue<int> q(4);
        CHECK(q.capacity() == 4);
        CHECK(q.empty());

        for (int i = 0; i < 4; i++) {
            CHECK(q.try_push(i));
        }
        CHECK_FALSE(q.try_push(99));
        CHECK(q.size() == 4);

        int v = -1;
        REQUIRE(q.try_pop(v));
        CHECK(v == 0);
        CHECK(q.try_push(4));
    }

    TEST_CASE("should_wrap_around") {
        spsc_queue<int> q(3);
        int v = 0;
        for (int round = 0; round < 10; round++) {
            CHECK(q.try_push(round));
            CHECK(q.try_push(round + 100));
            REQUIRE(q.try_pop(v));
            CHECK(v == round);
            REQUIRE(q.try_pop(v));
            CHECK(v == round + 100);
        }
        CHECK(q.empty());
        CHECK_FALSE(q.try_pop(v));
    }

    TEST_CASE("should_discard_everything_queued") {
        spsc_queue<int> q(8);
        q.try_push(1);
        q.try_push(2);
        q.try_push(3);
        CHECK(q.discard_all() == 3);
        CHECK(q.empty());
        CHECK(q.discard_all() == 0);
    }

    TEST_CASE("should_transfer_in_order_between_threads") {
        constexpr uint32_t count = 100000;
        spsc_queue<uint32_t> q(64);

        std::thread producer([&q] {
            for (uint32_t i = 0; i < count; i++) {
                while (!q.try_push(i)) {
                    std::this_thread::yield();
                }
            }
        });

        uint32_t expected = 0;
        bool in_order = true;
        while (expected < count) {
            uint32_t v;
            if (q.try_pop(v)) {
                in_order = in_order && v == expected;
                expected++;
            } else {
                std::this_thread::yield();
            }
        }
        producer.join();

        CHECK(in_order);
        CHECK(q.empty());
    }
}
