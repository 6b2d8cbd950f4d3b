/**
 * @file test_hot_reconfig.cc
 * @brief Live reconfiguration of running streams through stream_handle
 *
 * Test Coverage:
 * - Block size, audio port and MIDI port changes applied at a cycle boundary
 * - Capability checks and validation failures leaving the stream untouched
 * - Adapter refusal in prepare_change, leaving endpoints and adapters as they were
 * - Back pressure when changes pile up between cycles
 */

#include <doctest/doctest.h>
#include <rainout/backend_registry.hh>
#include <rainout/error.hh>
#include <rainout/stream_handle.hh>
#include "../../test_helpers.hh"
#include <memory>

using namespace rainout;
using namespace rainout::test;

namespace {
    using port_list = auto_option<std::vector<audio_port_ref>>;
    using midi_port_list = auto_option<std::vector<midi_port_config>>;

    struct reconfig_fixture {
        reconfig_fixture()
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

    const uint8 note_on[] = {0x90, 60, 100};
}

TEST_SUITE("HotReconfig::Unit") {

    TEST_CASE_FIXTURE(reconfig_fixture, "should_change_block_size_at_next_cycle") {
        auto handle = start();
        auto* stream = mock->last_stream();
        REQUIRE(stream != nullptr);
        CHECK(handle.can_change_block_size());

        // Act
        handle.change_block_size(auto_option<frames_t>::use(512));

        // Assert: accepted, prepared, not yet applied
        CHECK(handle.info().block_size == stream_block_size::fixed_size(512));
        CHECK(handle.info().latency == std::optional<frames_t>(512));
        CHECK(stream->prepare_calls.load() == 1);
        REQUIRE(stream->last_prepared.has_value());
        CHECK(stream->last_prepared->block_size.size == 512);
        CHECK(handle.applied_changes() == 0);
        CHECK(stream->host().current_block_frames() == 256);

        stream->cycle();
        CHECK(log->changed_calls.load() == 1);
        CHECK(handle.applied_changes() == 1);
        CHECK(stream->host().current_block_frames() == 512);

        stream->cycle();
        CHECK(log->last_frames.load() == 512);
        CHECK(log->last_session() == handle.info());
    }

    TEST_CASE_FIXTURE(reconfig_fixture, "should_change_audio_ports") {
        auto handle = start();
        auto* stream = mock->last_stream();

        handle.change_audio_ports(std::nullopt, port_list::use({audio_port_ref::by_name("playback_2")}));
        REQUIRE(handle.info().audio_out_ports.size() == 1);
        CHECK(handle.info().audio_out_ports[0].channel == 1);

        stream->cycle();
        CHECK(log->last_out_count.load() == 1);
        CHECK(stream->output(0, 0) == 0.0f);
        CHECK(stream->output(0, 1) == 0.25f);
    }

    TEST_CASE_FIXTURE(reconfig_fixture, "should_recompute_latency_when_inputs_are_added") {
        auto handle = start();
        CHECK(handle.info().latency == std::optional<frames_t>(256));

        handle.change_audio_ports(port_list::use({audio_port_ref::by_index(1)}), std::nullopt);
        CHECK(handle.info().audio_in_ports.size() == 1);
        CHECK(handle.info().latency == std::optional<frames_t>(512));

        auto* stream = mock->last_stream();
        stream->input_levels = {0.0f, 0.75f};
        stream->cycle();
        CHECK(log->last_in_count.load() == 1);
        CHECK(log->last_input_sample.load() == 0.75f);
    }

    TEST_CASE_FIXTURE(reconfig_fixture, "should_apply_several_fields_as_one_change") {
        auto handle = start();
        stream_change change;
        change.block_size = auto_option<frames_t>::use(128);
        change.audio_out_ports = port_list::use({audio_port_ref::by_index(0)});
        handle.apply_changes(change);

        mock->last_stream()->cycle();
        CHECK(log->changed_calls.load() == 1);
        const auto session = log->last_session();
        CHECK(session.block_size.size == 128);
        CHECK(session.audio_out_ports.size() == 1);
    }

    TEST_CASE_FIXTURE(reconfig_fixture, "should_leave_the_stream_untouched_on_invalid_values") {
        auto handle = start();
        const auto before = handle.info();

        try {
            handle.change_block_size(auto_option<frames_t>::use(3000));
            FAIL("block size 3000 was expected to be rejected");
        } catch (const run_config_error& e) {
            CHECK(e.code() == run_config_errc::invalid_block_size);
        }

        CHECK(handle.info() == before);
        CHECK(mock->last_stream()->prepare_calls.load() == 0);

        mock->last_stream()->cycle();
        CHECK(log->changed_calls.load() == 0);
    }

    TEST_CASE_FIXTURE(reconfig_fixture, "should_refuse_changes_the_adapter_cannot_apply") {
        mock->streams_change_block_size = false;
        mock->streams_change_audio_ports = false;
        auto handle = start();

        CHECK_FALSE(handle.can_change_block_size());
        CHECK_FALSE(handle.can_change_audio_port_config());
        CHECK_FALSE(handle.can_change_midi_ports());

        try {
            handle.change_block_size(auto_option<frames_t>::use(512));
            FAIL("the change was expected to be refused");
        } catch (const change_config_error& e) {
            CHECK(e.code() == change_config_errc::not_supported);
        }
        CHECK_THROWS_AS(handle.change_audio_ports(std::nullopt, port_list::use({})), change_config_error);
        // no MIDI in this session
        CHECK_THROWS_AS(handle.change_midi_ports(midi_port_list::use({}), std::nullopt), change_config_error);
        CHECK(handle.info().block_size.size == 256);
    }

    TEST_CASE_FIXTURE(reconfig_fixture, "should_report_adapter_refusal") {
        auto handle = start();
        auto* stream = mock->last_stream();
        stream->on_prepare_change = [](const stream_info&) {
            throw device_error("period size locked by another client");
        };

        try {
            handle.change_block_size(auto_option<frames_t>::use(1024));
            FAIL("the adapter refusal was expected to propagate");
        } catch (const run_config_error& e) {
            CHECK(e.code() == run_config_errc::device_open_failed);
        }
        CHECK(handle.info().block_size.size == 256);
        stream->cycle();
        CHECK(handle.applied_changes() == 0);
    }

    TEST_CASE_FIXTURE(reconfig_fixture, "should_not_consume_endpoints_on_refused_changes") {
        rainout_config config;
        config.midi = midi_config{};
        auto options = quick_options();
        options.max_midi_endpoints = 3;
        auto handle = start(config, options);
        auto* stream = mock->last_stream();
        REQUIRE(handle.info().midi->in_ports.size() == 1);

        const device_id keys{"Mock Keys"};
        const auto both = midi_port_list::use(
            {{keys, 0, midi_control_scheme::midi1}, {keys, 1, midi_control_scheme::midi1}});

        // Arrange: the adapter refuses the next two changes
        int refusals = 2;
        stream->on_prepare_change = [&refusals](const stream_info&) {
            if (refusals > 0) {
                refusals--;
                throw device_error("port busy");
            }
        };
        CHECK_THROWS_AS(handle.change_midi_ports(both, std::nullopt), run_config_error);
        CHECK_THROWS_AS(handle.change_midi_ports(both, std::nullopt), run_config_error);
        CHECK(handle.info().midi->in_ports.size() == 1);

        // Act: the third attempt is accepted and gets the first free endpoint
        REQUIRE_NOTHROW(handle.change_midi_ports(both, std::nullopt));
        const auto& midi = *handle.info().midi;
        REQUIRE(midi.in_ports.size() == 2);
        CHECK(midi.in_ports[0].endpoint == 0);
        CHECK(midi.in_ports[1].endpoint == 1);

        stream->cycle();
        CHECK(handle.applied_changes() == 1);
        REQUIRE(stream->host().push_midi_input(1, 2, note_on, sizeof(note_on)));
        stream->cycle();
        CHECK(log->midi().size() == 1);
    }

    TEST_CASE_FIXTURE(reconfig_fixture, "should_restore_the_audio_adapter_when_midi_refuses") {
        mock->has_midi = false;
        auto midi = std::make_shared<mock_backend>(backend::alsa);
        midi->midi_prepare_change = [](const stream_info&) {
            throw device_error("MIDI driver refused");
        };
        registry.register_backend(midi, 1);

        rainout_config config;
        config.midi = midi_config{};
        auto handle = start(config);
        auto* stream = mock->last_stream();
        const auto running = handle.info();

        CHECK_THROWS_AS(handle.change_block_size(auto_option<frames_t>::use(512)), run_config_error);

        // prepared for the change, then for the running session again
        CHECK(stream->prepare_calls.load() == 2);
        REQUIRE(stream->last_prepared.has_value());
        CHECK(*stream->last_prepared == running);
        CHECK(handle.info() == running);

        stream->cycle();
        CHECK(handle.applied_changes() == 0);
        CHECK(stream->host().current_block_frames() == 256);
    }

    TEST_CASE_FIXTURE(reconfig_fixture, "should_fail_when_the_device_is_gone") {
        auto handle = start();
        mock->audio.devices.clear();
        mock->audio.default_device.reset();

        try {
            handle.change_block_size(auto_option<frames_t>::use(128));
            FAIL("the change was expected to fail");
        } catch (const run_config_error& e) {
            CHECK(e.code() == run_config_errc::device_not_found);
        }
    }

    TEST_CASE_FIXTURE(reconfig_fixture, "should_report_busy_when_changes_pile_up") {
        auto handle = start();
        auto* stream = mock->last_stream();

        int accepted = 0;
        bool busy = false;
        while (!busy && accepted < 100) {
            try {
                handle.change_block_size(auto_option<frames_t>::use(accepted % 2 ? 128 : 512));
                accepted++;
            } catch (const change_config_error& e) {
                CHECK(e.code() == change_config_errc::busy);
                busy = true;
            }
        }
        CHECK(busy);
        CHECK(accepted == 16);

        // Act: one cycle boundary drains the backlog
        stream->cycle();
        CHECK(handle.applied_changes() == 16);
        CHECK(log->changed_calls.load() == 16);
        CHECK(stream->host().current_block_frames() == 128);
        CHECK_NOTHROW(handle.change_block_size(auto_option<frames_t>::use(256)));
    }

    TEST_CASE_FIXTURE(reconfig_fixture, "should_change_midi_ports_keeping_endpoints") {
        rainout_config config;
        config.midi = midi_config{};
        auto handle = start(config);
        auto* stream = mock->last_stream();
        REQUIRE(handle.info().midi.has_value());
        CHECK(handle.can_change_midi_ports());

        const device_id keys{"Mock Keys"};
        handle.change_midi_ports(
            midi_port_list::use({{keys, 0, midi_control_scheme::midi1}, {keys, 1, midi_control_scheme::midi1}}),
            std::nullopt);
        const auto& midi = *handle.info().midi;
        REQUIRE(midi.in_ports.size() == 2);
        CHECK(midi.in_ports[0].endpoint == 0);
        CHECK(midi.in_ports[1].endpoint == 1);
        CHECK(midi.out_ports.size() == 1);

        stream->cycle();
        REQUIRE(stream->host().push_midi_input(1, 5, note_on, sizeof(note_on)));
        stream->cycle();

        const auto received = log->midi();
        REQUIRE(received.size() == 1);
        CHECK(received[0].delta_frames == 5);
    }

    TEST_CASE_FIXTURE(reconfig_fixture, "should_refuse_changes_after_a_fault") {
        auto handle = start();
        handler->throw_in_process = true;
        mock->last_stream()->cycle();
        CHECK(handle.state() == engine_state::faulted);

        CHECK_THROWS_AS(handle.change_block_size(auto_option<frames_t>::use(512)), state_error);
    }

    TEST_CASE_FIXTURE(reconfig_fixture, "should_call_stream_changed_for_an_empty_change") {
        auto handle = start();
        handle.apply_changes(stream_change{});
        mock->last_stream()->cycle();
        CHECK(log->changed_calls.load() == 1);
        CHECK(log->last_session() == handle.info());
    }
}
