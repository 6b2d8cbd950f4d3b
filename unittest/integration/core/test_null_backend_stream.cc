/**
 * @file test_null_backend_stream.cc
 * @brief End to end streams on the null backend and its clock thread
 *
 * Test Coverage:
 * - Cycle cadence follows the sample clock, also while the message ring overflows
 * - Input and output levels through native conversion, silence flags
 * - MIDI in, handler echo and MIDI out, also on ports added while running
 * - Xruns, device disconnect and reconnect, adapter failure
 * - Live block size change on a running device
 * - Close semantics and the process wide registry
 */

#include <doctest/doctest.h>
#include <rainout/backend_registry.hh>
#include <rainout/backends/null/null_backend.hh>
#include <rainout/stream_handle.hh>
#include "../../test_helpers.hh"
#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace rainout;
using namespace rainout::test;

namespace {
    const device_id null_device{"Null Device", std::string("null:0")};
    const device_id null_midi{"Null MIDI", std::string("null-midi:0")};

    struct null_fixture {
        explicit null_fixture(null_backend_config config = default_null_backend_config())
            : adapter(create_null_backend(std::move(config))) {
            registry.register_backend(adapter, 0);
        }

        stream_handle start(rainout_config config = {}, run_options options = {}, bool echo_midi = false) {
            auto h = make_handler(log);
            h->echo_midi = echo_midi;
            return run(config, options, std::move(h), registry);
        }

        std::shared_ptr<handler_log> log = std::make_shared<handler_log>();
        std::shared_ptr<null_backend> adapter;
        backend_registry registry;
    };

    null_backend_config unpaced() {
        auto cfg = default_null_backend_config();
        cfg.realtime_pacing = false;
        return cfg;
    }

    // Collects messages until one of @p type shows up
    class message_collector {
        public:
            explicit message_collector(stream_handle& handle)
                : m_handle(handle) {
            }

            bool wait_for(stream_msg_type type) {
                return wait_until([this, type] {
                    m_handle.messages().pop_each([this](const stream_msg& m) { seen.push_back(m); });
                    return std::any_of(seen.begin(), seen.end(),
                                       [type](const stream_msg& m) { return m.type == type; });
                });
            }

            const stream_msg* find(stream_msg_type type, stream_error_code error = stream_error_code::none) const {
                for (const auto& m : seen) {
                    if (m.type == type && (error == stream_error_code::none || m.error == error)) {
                        return &m;
                    }
                }
                return nullptr;
            }

            std::vector<stream_msg> seen;

        private:
            stream_handle& m_handle;
    };
}

TEST_SUITE("NullBackend::Integration") {

    TEST_CASE_FIXTURE(null_fixture, "should_follow_the_sample_clock") {
        const auto started = std::chrono::steady_clock::now();
        auto handle = start();
        CHECK(handle.info().sample_rate == 48000);
        CHECK(handle.info().block_size == stream_block_size::fixed_size(512));

        REQUIRE(wait_until([&handle] { return handle.processed_cycles() >= 10; }));
        const auto elapsed = std::chrono::steady_clock::now() - started;
        // ten cycles of 512 frames at 48 kHz span at least nine periods of 10.67 ms
        CHECK(elapsed >= std::chrono::milliseconds(80));

        CHECK(log->last_frames.load() == 512);
        CHECK(wait_until([this] { return adapter->last_output_peak() == 0.25f; }));
    }

    TEST_CASE("should_convert_native_input") {
        auto cfg = unpaced();
        cfg.input_level = 0.5f;
        cfg.native_format = audio_format::s16le;
        null_fixture f(cfg);

        run_options options;
        options.auto_audio_inputs = true;
        auto handle = f.start({}, options);
        REQUIRE(handle.info().audio_in_ports.size() == 2);

        REQUIRE(wait_until([&f] { return f.log->process_calls.load() >= 5; }));
        CHECK(f.log->last_input_sample.load() == doctest::Approx(0.5f).epsilon(0.001));
        CHECK(wait_until([&f] { return f.adapter->last_output_peak() == doctest::Approx(0.25f).epsilon(0.001); }));
    }

    TEST_CASE("should_flag_silent_inputs") {
        null_fixture f(unpaced());
        run_options options;
        options.auto_audio_inputs = true;
        options.check_for_silent_inputs = true;
        auto handle = f.start({}, options);
        CHECK(handle.info().checking_for_silent_inputs);

        REQUIRE(wait_until([&f] { return f.log->process_calls.load() >= 3; }));
        CHECK(f.log->last_input_silent.load());
        CHECK(f.log->last_input_sample.load() == 0.0f);
    }

    TEST_CASE("should_pass_midi_through_the_stream") {
        null_fixture f(unpaced());
        rainout_config config;
        config.midi = midi_config{};
        auto handle = f.start(config, {}, true);
        REQUIRE(handle.info().midi.has_value());
        CHECK(handle.info().midi->midi_backend == backend::dummy);

        midi_message msg;
        const uint8 note_on[] = {0x90, 48, 90};
        REQUIRE(midi_message::make(3, note_on, sizeof(note_on), msg));
        CHECK(f.adapter->send_midi(null_midi, 0, msg) == 1);
        CHECK(f.adapter->send_midi(null_midi, 5, msg) == 0);

        REQUIRE(wait_until([&f] { return f.log->midi().size() == 1; }));
        CHECK(f.log->midi()[0].data[1] == 48);
        CHECK(wait_until([&f] { return f.adapter->midi_messages_sent() == 1; }));
    }

    TEST_CASE("should_send_midi_on_ports_added_while_running") {
        null_fixture f(unpaced());
        rainout_config config;
        midi_config midi;
        midi.out_ports = auto_option<std::vector<midi_port_config>>::use({});
        config.midi = midi;
        auto handle = f.start(config, {}, true);
        REQUIRE(handle.info().midi.has_value());
        CHECK(handle.info().midi->out_ports.empty());
        REQUIRE(wait_until([&handle] { return handle.processed_cycles() > 0; }));

        // Act: the output port shows up between two cycles of the clock thread
        handle.change_midi_ports(std::nullopt, auto_option<std::vector<midi_port_config>>::use({{null_midi, 0}}));
        REQUIRE(handle.info().midi->out_ports.size() == 1);
        REQUIRE(wait_until([&handle] { return handle.applied_changes() == 1; }));

        midi_message msg;
        const uint8 clock[] = {0xF8};
        REQUIRE(midi_message::make(0, clock, sizeof(clock), msg));
        CHECK(f.adapter->send_midi(null_midi, 0, msg) == 1);
        CHECK(wait_until([&f] { return f.adapter->midi_messages_sent() == 1; }));
    }

    TEST_CASE("should_report_xruns") {
        null_fixture f(unpaced());
        auto handle = f.start();
        message_collector messages(handle);

        f.adapter->simulate_xrun();
        REQUIRE(messages.wait_for(stream_msg_type::nonfatal_error));
        CHECK(messages.find(stream_msg_type::nonfatal_error, stream_error_code::xrun) != nullptr);
        CHECK(handle.state() == engine_state::running);
    }

    TEST_CASE("should_keep_cadence_while_messages_overflow") {
        null_fixture f;
        f.log->record_cycle_times = true;
        run_options options;
        options.message_buffer_size = 4;
        auto handle = f.start({}, options);
        REQUIRE(wait_until([&handle] { return handle.processed_cycles() > 2; }));
        const auto first = f.log->cycle_times().size() - 1;

        // nobody reads messages while xruns pile up
        for (int i = 0; i < 40; i++) {
            f.adapter->simulate_xrun();
            const auto before = handle.processed_cycles();
            REQUIRE(wait_until([&handle, before] { return handle.processed_cycles() > before; }));
        }
        CHECK(handle.messages().dropped_count() > 0);
        CHECK(handle.state() == engine_state::running);

        // 512 frames at 48 kHz
        const std::chrono::microseconds period(512 * 1000000LL / 48000);
        const auto times = f.log->cycle_times();
        REQUIRE(times.size() > first + 30);
        std::chrono::steady_clock::duration longest{0};
        for (std::size_t i = first + 1; i < times.size(); i++) {
            longest = std::max(longest, times[i] - times[i - 1]);
        }
        const auto mean = (times.back() - times[first]) / static_cast<int64_t>(times.size() - 1 - first);
        CHECK(mean >= period * 8 / 10);
        CHECK(mean <= period * 12 / 10);
        CHECK(longest < period * 5);

        handle.close();
        const auto msgs = drain(handle.messages());
        REQUIRE_FALSE(msgs.empty());
        CHECK(msgs.size() <= 5);
        CHECK(msgs.back().type == stream_msg_type::closed);
    }

    TEST_CASE("should_report_disconnect_and_reconnect") {
        null_fixture f(unpaced());
        auto handle = f.start();
        message_collector messages(handle);

        f.adapter->set_device_present(null_device, false);
        REQUIRE(messages.wait_for(stream_msg_type::audio_device_disconnected));
        const auto* lost = messages.find(stream_msg_type::audio_device_disconnected);
        REQUIRE(lost->device.has_value());
        CHECK(lost->device->matches(null_device));

        const auto opts = f.registry.enumerate_audio_backend(backend::dummy);
        REQUIRE(opts.has_value());
        CHECK(opts->status == backend_status::no_devices);
        // the stream keeps running silently
        CHECK(handle.state() == engine_state::running);
        CHECK(wait_until([&f] { return f.adapter->last_output_peak() == 0.0f; }));

        f.adapter->set_device_present(null_device, true);
        REQUIRE(messages.wait_for(stream_msg_type::audio_device_reconnected));
        CHECK(wait_until([&f] { return f.adapter->last_output_peak() == 0.25f; }));
    }

    TEST_CASE("should_fault_when_the_device_fails") {
        null_fixture f(unpaced());
        auto handle = f.start();
        REQUIRE(wait_until([&handle] { return handle.processed_cycles() > 0; }));

        message_collector messages(handle);
        f.adapter->fail_streams("pulled the plug");
        REQUIRE(messages.wait_for(stream_msg_type::fatal_error));

        const auto* fatal = messages.find(stream_msg_type::fatal_error);
        CHECK(fatal->error == stream_error_code::backend_failure);
        CHECK(fatal->detail == "pulled the plug");
        CHECK(handle.state() == engine_state::faulted);

        const auto cycles = handle.processed_cycles();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        CHECK(handle.processed_cycles() == cycles);
    }

    TEST_CASE("should_change_block_size_while_running") {
        null_fixture f(unpaced());
        auto handle = f.start();
        REQUIRE(wait_until([&handle] { return handle.processed_cycles() > 0; }));

        handle.change_block_size(auto_option<frames_t>::use(128));
        REQUIRE(wait_until([&f] { return f.log->changed_calls.load() == 1; }));
        CHECK(wait_until([&f] { return f.log->last_frames.load() == 128; }));
        CHECK(handle.applied_changes() == 1);
    }

    TEST_CASE("should_stop_cycles_on_close") {
        null_fixture f(unpaced());
        auto handle = f.start();
        REQUIRE(wait_until([&handle] { return handle.processed_cycles() > 0; }));

        handle.close();
        CHECK(handle.state() == engine_state::stopped);
        const auto delivered = f.adapter->delivered_cycles();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        CHECK(f.adapter->delivered_cycles() == delivered);

        message_collector messages(handle);
        REQUIRE(messages.wait_for(stream_msg_type::closed));
        CHECK(messages.seen.back().type == stream_msg_type::closed);
    }

    TEST_CASE("should_refuse_to_open_when_not_running") {
        null_fixture f;
        f.adapter->set_status(backend_status::not_running);
        CHECK_THROWS_AS(f.start(), run_config_error);
        CHECK(f.log->init_calls.load() == 0);
    }

    TEST_CASE("should_forward_the_application_name") {
        null_fixture f(unpaced());
        run_options options;
        options.application_name = "integration";
        auto handle = f.start({}, options);
        CHECK(f.adapter->last_application_name() == std::optional<std::string>("integration"));
        CHECK(f.adapter->open_stream_count() == 1);
    }

    TEST_CASE("should_run_on_the_global_registry") {
        auto log = std::make_shared<handler_log>();
        rainout_config config;
        config.audio_backend = auto_option<backend>::use(backend::dummy);
        auto handle = run(config, run_options{}, make_handler(log));

        CHECK(handle.info().audio_backend == backend::dummy);
        CHECK(wait_until([&log] { return log->process_calls.load() > 0; }));
        handle.close();
        CHECK_FALSE(handle.is_open());
    }
}
