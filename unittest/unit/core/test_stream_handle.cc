/**
 * @file test_stream_handle.cc
 * @brief Unit tests for run() and stream_handle against a scripted adapter
 *
 * Test Coverage:
 * - Start, processing and close of a stream
 * - Open failures, open timeout and init failures leaving nothing open
 * - Fatal errors from the handler and from the adapter
 * - Nonfatal notifications and reported latency
 * - Device transitions reported without cycles
 * - Separate MIDI backend
 * - Move semantics of the handle
 */

#include <doctest/doctest.h>
#include <rainout/backend_registry.hh>
#include <rainout/error.hh>
#include <rainout/stream_handle.hh>
#include "../../test_helpers.hh"
#include <chrono>
#include <memory>
#include <thread>

using namespace rainout;
using namespace rainout::test;

namespace {
    struct handle_fixture {
        handle_fixture()
            : mock(std::make_shared<mock_backend>()) {
            registry.register_backend(mock, 10);
        }

        stream_handle start(rainout_config config = {}, run_options options = quick_options()) {
            auto h = make_handler(log);
            handler = h.get();
            return run(config, options, std::move(h), registry);
        }

        std::shared_ptr<handler_log> log = std::make_shared<handler_log>();
        recording_handler* handler = nullptr;
        std::shared_ptr<mock_backend> mock;
        backend_registry registry;
    };

    run_config_errc run_failure(handle_fixture& f, const rainout_config& config, const run_options& options) {
        try {
            auto handle = f.start(config, options);
        } catch (const run_config_error& e) {
            return e.code();
        }
        FAIL("run() was expected to fail");
        return run_config_errc::device_open_failed;
    }
}

TEST_SUITE("StreamHandle::Unit") {

    TEST_CASE_FIXTURE(handle_fixture, "should_start_and_process") {
        auto options = quick_options();
        options.application_name = "unit test";
        auto handle = start({}, options);

        CHECK(handle.is_open());
        CHECK(handle.state() == engine_state::running);
        CHECK(log->init_calls.load() == 1);
        CHECK(log->last_session() == handle.info());
        CHECK(mock->open_calls.load() == 1);
        CHECK(mock->last_application_name == std::optional<std::string>("unit test"));

        auto* stream = mock->last_stream();
        REQUIRE(stream != nullptr);
        CHECK(stream->start_calls.load() == 1);
        CHECK(stream->opened_with == handle.info());

        for (int i = 0; i < 3; i++) {
            CHECK(stream->cycle() == cycle_result::keep_running);
        }
        CHECK(handle.processed_cycles() == 3);
        CHECK(log->last_frames.load() == 256);
        CHECK(stream->output(0, 0) == 0.25f);
        CHECK(stream->output(255, 1) == 0.25f);
        CHECK(handle.messages().is_empty());
    }

    TEST_CASE_FIXTURE(handle_fixture, "should_close_once_and_post_closed") {
        auto handle = start();
        auto* stream = mock->last_stream();

        handle.close();
        CHECK_FALSE(handle.is_open());
        CHECK(handle.state() == engine_state::stopped);
        CHECK(stream->stop_calls.load() == 1);
        CHECK(stream->close_calls.load() == 1);

        // late cycles from the adapter are refused
        CHECK(stream->cycle() == cycle_result::stop);

        handle.close();
        CHECK(stream->close_calls.load() == 1);

        const auto msgs = drain(handle.messages());
        REQUIRE(msgs.size() == 1);
        CHECK(msgs[0].type == stream_msg_type::closed);

        CHECK_THROWS_AS(handle.change_block_size(auto_option<frames_t>::use(512)), state_error);
        CHECK_FALSE(handle.can_change_block_size());
    }

    TEST_CASE_FIXTURE(handle_fixture, "should_close_when_destroyed") {
        {
            auto handle = start();
            CHECK(mock->live_streams() == 1);
        }
        CHECK(mock->live_streams() == 0);
        CHECK(mock->last_stream() == nullptr);
    }

    TEST_CASE_FIXTURE(handle_fixture, "should_move_ownership") {
        auto handle = start();
        auto other = std::move(handle);

        CHECK_FALSE(handle.is_open());
        CHECK_THROWS_AS((void)handle.info(), state_error);
        CHECK_THROWS_AS(handle.close(), state_error);
        CHECK(other.is_open());
        CHECK(other.info().sample_rate == 48000);

        // assigning over an open handle closes its stream
        auto second = start();
        CHECK(mock->live_streams() == 2);
        other = std::move(second);
        CHECK(mock->live_streams() == 1);
        CHECK(other.is_open());
    }

    TEST_CASE_FIXTURE(handle_fixture, "should_report_open_failures") {
        mock->fail_open = true;
        CHECK(run_failure(*this, {}, quick_options()) == run_config_errc::device_open_failed);
        CHECK(log->init_calls.load() == 0);
        CHECK(mock->live_streams() == 0);
    }

    TEST_CASE_FIXTURE(handle_fixture, "should_time_out_slow_opens") {
        mock->open_delay = std::chrono::milliseconds(300);
        auto options = quick_options();
        options.open_timeout = std::chrono::milliseconds(30);

        CHECK(run_failure(*this, {}, options) == run_config_errc::timeout);
        CHECK(log->init_calls.load() == 0);

        // the stream that arrives late is closed and released
        CHECK(wait_until([this] { return mock->open_calls.load() == 1; }));
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        CHECK(wait_until([this] { return mock->live_streams() == 0; }));
    }

    TEST_CASE_FIXTURE(handle_fixture, "should_fail_to_resolve_before_opening") {
        rainout_config config;
        config.sample_rate = auto_option<sample_rate_t>::use(12345);
        CHECK(run_failure(*this, config, quick_options()) == run_config_errc::invalid_sample_rate);
        CHECK(mock->open_calls.load() == 0);
    }

    TEST_CASE_FIXTURE(handle_fixture, "should_release_the_device_when_init_throws") {
        auto h = make_handler(log);
        h->throw_in_init = true;

        CHECK_THROWS_AS(run(rainout_config{}, quick_options(), std::move(h), registry), std::runtime_error);
        CHECK(mock->open_calls.load() == 1);
        CHECK(mock->live_streams() == 0);
    }

    TEST_CASE_FIXTURE(handle_fixture, "should_require_a_handler") {
        CHECK_THROWS(run(rainout_config{}, quick_options(), nullptr, registry));
        CHECK(mock->open_calls.load() == 0);
    }

    TEST_CASE_FIXTURE(handle_fixture, "should_fault_when_process_throws") {
        auto handle = start();
        auto* stream = mock->last_stream();
        stream->cycle();
        handler->throw_in_process = true;

        CHECK(stream->cycle() == cycle_result::stop);
        CHECK(handle.state() == engine_state::faulted);
        CHECK(handle.processed_cycles() == 1);

        const auto msg = handle.messages().pop();
        REQUIRE(msg.has_value());
        CHECK(msg->type == stream_msg_type::fatal_error);
        CHECK(msg->error == stream_error_code::process_fault);

        // closing a faulted stream posts nothing further
        handle.close();
        CHECK(handle.state() == engine_state::stopped);
        CHECK_FALSE(handle.messages().pop().has_value());
        CHECK(stream->close_calls.load() == 1);
    }

    TEST_CASE_FIXTURE(handle_fixture, "should_fault_when_the_adapter_fails") {
        auto handle = start();
        mock->last_stream()->host().backend_failed("device vanished");

        CHECK(handle.state() == engine_state::faulted);
        const auto msgs = drain(handle.messages());
        REQUIRE(msgs.size() == 1);
        CHECK(msgs[0].error == stream_error_code::backend_failure);
        CHECK(msgs[0].detail == "device vanished");
    }

    TEST_CASE_FIXTURE(handle_fixture, "should_forward_nonfatal_notifications") {
        auto handle = start();
        auto* stream = mock->last_stream();

        stream->host().report_xrun();
        stream->host().device_presence_changed(device_id{"Mock Device"}, device_kind::audio, false);
        stream->cycle();

        const auto msgs = drain(handle.messages());
        REQUIRE(msgs.size() == 2);
        CHECK(msgs[0].type == stream_msg_type::audio_device_disconnected);
        CHECK(msgs[0].device->name == "Mock Device");
        CHECK(msgs[1].error == stream_error_code::xrun);
        CHECK(handle.state() == engine_state::running);
        // outputs of a missing device are silent
        CHECK(stream->output(0, 0) == 0.0f);
    }

    TEST_CASE_FIXTURE(handle_fixture, "should_report_device_changes_while_no_cycle_runs") {
        auto handle = start();
        auto* stream = mock->last_stream();
        stream->cycle();

        // Act: the adapter stops delivering cycles once the device is gone
        stream->host().device_presence_changed(device_id{"Mock Device"}, device_kind::audio, false);
        auto msgs = drain(handle.messages());
        REQUIRE(msgs.size() == 1);
        CHECK(msgs[0].type == stream_msg_type::audio_device_disconnected);

        stream->host().device_presence_changed(device_id{"Mock Device"}, device_kind::audio, true);
        stream->cycle();
        stream->cycle();
        msgs = drain(handle.messages());
        REQUIRE(msgs.size() == 1);
        CHECK(msgs[0].type == stream_msg_type::audio_device_reconnected);
        CHECK(stream->output(0, 0) == 0.25f);
    }

    TEST_CASE_FIXTURE(handle_fixture, "should_report_a_device_lost_and_regained_between_cycles") {
        auto handle = start();
        auto* stream = mock->last_stream();
        stream->cycle();

        stream->host().device_presence_changed(device_id{"Mock Device"}, device_kind::audio, false);
        stream->host().device_presence_changed(device_id{"Mock Device"}, device_kind::audio, true);
        stream->cycle();
        stream->cycle();

        const auto msgs = drain(handle.messages());
        REQUIRE(msgs.size() == 2);
        CHECK(msgs[0].type == stream_msg_type::audio_device_disconnected);
        CHECK(msgs[1].type == stream_msg_type::audio_device_reconnected);
    }

    TEST_CASE_FIXTURE(handle_fixture, "should_prefer_the_latency_the_adapter_reports") {
        mock->stream_latency = 1000;
        auto handle = start();
        CHECK(handle.info().latency == std::optional<frames_t>(1000));
        CHECK(log->last_session().latency == std::optional<frames_t>(1000));
    }

    TEST_CASE_FIXTURE(handle_fixture, "should_open_midi_on_a_separate_backend") {
        mock->has_midi = false;
        auto midi = std::make_shared<mock_backend>(backend::alsa);
        registry.register_backend(midi, 1);

        rainout_config config;
        config.midi = midi_config{};
        auto handle = start(config);

        REQUIRE(handle.info().midi.has_value());
        CHECK(handle.info().midi->midi_backend == backend::alsa);
        CHECK(midi->midi_open_calls.load() == 1);
        CHECK(mock->midi_open_calls.load() == 0);
        CHECK(handle.can_change_midi_ports());
    }

    TEST_CASE_FIXTURE(handle_fixture, "should_pass_midi_through_the_handler") {
        rainout_config config;
        config.midi = midi_config{};
        auto handle = start(config);
        handler->echo_midi = true;
        auto* stream = mock->last_stream();

        const uint8 cc[] = {0xB0, 7, 127};
        REQUIRE(stream->host().push_midi_input(0, 10, cc, sizeof(cc)));
        stream->cycle();

        midi_message out;
        REQUIRE(stream->host().pop_midi_output(0, out));
        CHECK(out.delta_frames == 10);
        CHECK(out.data[0] == 0xB0);
        CHECK(log->midi().size() == 1);
    }
}
