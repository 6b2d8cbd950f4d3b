/**
 * @file test_message_channel.cc
 * @brief Unit tests for message_channel
 *
 * Test Coverage:
 * - FIFO delivery and overflow accounting
 * - Terminal message uniqueness and ordering after status messages
 * - Concurrent terminal claims
 * - Message classification helpers
 */

#include <doctest/doctest.h>
#include <rainout/device_monitor.hh>
#include <rainout/message_channel.hh>
#include "../../test_helpers.hh"
#include <atomic>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace rainout;
using namespace rainout::test;

namespace {
    rt_message nonfatal(stream_error_code code, uint64_t count = 0) {
        rt_message m;
        m.type = stream_msg_type::nonfatal_error;
        m.error = code;
        m.count = count;
        return m;
    }
}

TEST_SUITE("MessageChannel::Unit") {

    TEST_CASE("should_deliver_messages_in_order") {
        device_monitor monitor;
        message_channel channel(8, monitor);
        CHECK(channel.is_empty());

        CHECK(channel.post(nonfatal(stream_error_code::xrun)));
        CHECK(channel.post(nonfatal(stream_error_code::buffer_size_mismatch, 1024)));

        const auto msgs = drain(channel);
        REQUIRE(msgs.size() == 2);
        CHECK(msgs[0].error == stream_error_code::xrun);
        CHECK(msgs[1].error == stream_error_code::buffer_size_mismatch);
        CHECK(msgs[1].count == 1024);
        CHECK_FALSE(msgs[0].device.has_value());
        CHECK_FALSE(channel.pop().has_value());
    }

    TEST_CASE("should_count_dropped_messages_when_full") {
        device_monitor monitor;
        message_channel channel(3, monitor);
        CHECK(channel.capacity() == 3);

        int accepted = 0;
        for (int i = 0; i < 10; i++) {
            if (channel.post(nonfatal(stream_error_code::xrun, i))) {
                accepted++;
            }
        }

        CHECK(accepted == 3);
        CHECK(channel.dropped_count() == 7);
        const auto msgs = drain(channel);
        REQUIRE(msgs.size() == 3);
        // the oldest messages survive
        CHECK(msgs[0].count == 0);
        CHECK(msgs[2].count == 2);
    }

    TEST_CASE("should_accept_only_one_terminal_message") {
        device_monitor monitor;
        message_channel channel(4, monitor);
        CHECK_FALSE(channel.terminated());

        CHECK(channel.post_terminal(stream_msg_type::fatal_error, stream_error_code::process_fault, "boom"));
        CHECK_FALSE(channel.post_terminal(stream_msg_type::closed, stream_error_code::none, nullptr));
        CHECK(channel.terminated());
        CHECK(channel.terminal_pending());

        const auto msg = channel.pop();
        REQUIRE(msg.has_value());
        CHECK(msg->type == stream_msg_type::fatal_error);
        CHECK(msg->error == stream_error_code::process_fault);
        CHECK(msg->detail == "boom");

        CHECK_FALSE(channel.terminal_pending());
        CHECK(channel.terminated());
        CHECK_FALSE(channel.pop().has_value());
        CHECK_FALSE(channel.post_terminal(stream_msg_type::closed, stream_error_code::none, nullptr));
    }

    TEST_CASE("should_deliver_terminal_message_after_pending_status") {
        device_monitor monitor;
        monitor.track(device_id{"Card"}, device_kind::audio);
        message_channel channel(4, monitor);

        monitor.set_present(device_id{"Card"}, device_kind::audio, false);
        channel.post_terminal(stream_msg_type::closed, stream_error_code::none, nullptr);
        channel.post(nonfatal(stream_error_code::xrun));

        const auto msgs = drain(channel);
        REQUIRE(msgs.size() == 3);
        CHECK(msgs[0].type == stream_msg_type::audio_device_disconnected);
        CHECK(msgs[0].device == std::optional<device_id>(device_id{"Card"}));
        CHECK(msgs[1].type == stream_msg_type::nonfatal_error);
        CHECK(msgs[2].type == stream_msg_type::closed);
        CHECK(msgs[2].detail.empty());
    }

    TEST_CASE("should_let_exactly_one_thread_win_the_terminal_slot") {
        device_monitor monitor;
        message_channel channel(4, monitor);
        std::atomic<int> winners{0};

        std::vector<std::thread> threads;
        for (int i = 0; i < 8; i++) {
            threads.emplace_back([&channel, &winners] {
                if (channel.post_terminal(stream_msg_type::fatal_error,
                                          stream_error_code::backend_failure, "lost")) {
                    winners++;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        CHECK(winners.load() == 1);
        CHECK(drain(channel).size() == 1);
    }

    TEST_CASE("should_truncate_long_details") {
        device_monitor monitor;
        message_channel channel(1, monitor);
        const std::string long_detail(1000, 'x');
        channel.post_terminal(stream_msg_type::fatal_error, stream_error_code::process_fault, long_detail.c_str());

        const auto msg = channel.pop();
        REQUIRE(msg.has_value());
        CHECK(msg->detail.size() == 255);
    }

    TEST_CASE("should_classify_messages") {
        CHECK(is_terminal(stream_msg_type::closed));
        CHECK(is_terminal(stream_msg_type::fatal_error));
        CHECK_FALSE(is_terminal(stream_msg_type::nonfatal_error));
        CHECK_FALSE(is_terminal(stream_msg_type::midi_device_reconnected));

        CHECK(is_fatal(stream_error_code::process_fault));
        CHECK(is_fatal(stream_error_code::backend_failure));
        CHECK_FALSE(is_fatal(stream_error_code::xrun));
        CHECK_FALSE(is_fatal(stream_error_code::midi_buffer_overflow));
    }

    TEST_CASE("should_format_messages") {
        stream_msg msg;
        msg.type = stream_msg_type::nonfatal_error;
        msg.error = stream_error_code::midi_buffer_overflow;
        msg.count = 3;

        std::ostringstream os;
        os << msg;
        CHECK(os.str() == "nonfatal error [MIDI buffer overflow x3]");
    }
}
