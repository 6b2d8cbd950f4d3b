#include <doctest/doctest.h>
#include <rainout/backends/null/null_backend.hh>
#include <rainout/error.hh>
#include "backend_test_helpers.hh"
#include <chrono>
#include <memory>
#include <thread>

using namespace rainout;

TEST_SUITE("NullBackend") {
    TEST_CASE("null backend creation") {
        auto backend = create_null_backend();
        CHECK(backend != nullptr);
        CHECK_FALSE(backend->is_initialized());
        CHECK(backend->id() == backend::dummy);
        CHECK(backend->version() == std::optional<std::string>("1.0"));
        CHECK(backend->supports_midi());
    }

    TEST_CASE("null initialization lifecycle") {
        test::test_backend_initialization(create_null_backend());
    }

    TEST_CASE("null device enumeration") {
        test::test_enumeration_invariants(create_null_backend());

        auto cfg = default_null_backend_config();
        cfg.device_options = device_options_kind::linked_in_out;
        cfg.in_devices = cfg.devices;
        cfg.out_devices = cfg.devices;
        cfg.default_in_device = 0;
        cfg.default_out_device = 0;
        cfg.devices.clear();
        cfg.default_device.reset();
        test::test_enumeration_invariants(create_null_backend(cfg));
    }

    TEST_CASE("null MIDI capabilities") {
        test::test_midi_capabilities(create_null_backend());

        auto cfg = default_null_backend_config();
        cfg.midi_in_ports.clear();
        cfg.midi_out_ports.clear();
        test::test_midi_capabilities(create_null_backend(cfg));
    }

    TEST_CASE("null stream lifecycle") {
        auto cfg = default_null_backend_config();
        cfg.realtime_pacing = false;
        test::test_stream_lifecycle(create_null_backend(cfg), 5);
    }

    TEST_CASE("null backend reports its status") {
        auto backend = create_null_backend(default_null_backend_config());
        backend->init();

        backend->set_status(backend_status::not_running);
        const auto opts = backend->enumerate_audio();
        CHECK(opts.status == backend_status::not_running);
        CHECK_FALSE(opts.has_devices());

        stream_info session;
        test::counting_host host;
        CHECK_THROWS_AS(backend->open_stream(session, host, {}), device_error);
        backend->shutdown();
    }

    TEST_CASE("null stream forwards device changes") {
        auto cfg = default_null_backend_config();
        cfg.realtime_pacing = false;
        auto backend = create_null_backend(cfg);
        backend->init();

        stream_info session;
        REQUIRE(test::default_session(*backend, session));
        test::counting_host host(session.max_block_frames());
        auto stream = backend->open_stream(session, host, {});
        CHECK(backend->open_stream_count() == 1);

        const auto device = cfg.devices[0].id;
        backend->set_device_present(device, false);
        CHECK(backend->enumerate_audio().status == backend_status::no_devices);
        backend->set_device_present(device, true);
        CHECK(backend->enumerate_audio().status == backend_status::running);

        const auto events = host.presence_events();
        REQUIRE(events.size() == 2);
        CHECK(events[0].id == device);
        CHECK(events[0].kind == device_kind::audio);
        CHECK_FALSE(events[0].present);
        CHECK(events[1].present);

        backend->simulate_xrun();
        backend->fail_streams("unplugged");
        CHECK(host.xruns.load() == 1);
        CHECK(host.failures.load() == 1);

        stream.reset();
        CHECK(backend->open_stream_count() == 0);
        backend->shutdown();
    }

    TEST_CASE("null MIDI stream delivers input to its endpoints") {
        auto backend = create_null_backend(default_null_backend_config());
        backend->init();

        const auto midi = backend->enumerate_midi();
        REQUIRE(midi.in_ports.size() == 1);

        stream_info session;
        session.sample_rate = 48000;
        midi_stream_info m;
        m.midi_backend = backend::dummy;
        m.in_ports.push_back({midi.in_ports[0].id, 0, midi_control_scheme::midi1, true, 3});
        session.midi = m;

        test::counting_host host;
        auto stream = backend->open_midi_stream(session, host, {});
        REQUIRE(stream != nullptr);

        midi_message msg;
        const uint8 clock[] = {0xF8};
        REQUIRE(midi_message::make(0, clock, sizeof(clock), msg));
        CHECK(backend->send_midi(midi.in_ports[0].id, 0, msg) == 1);
        CHECK(backend->send_midi(midi.in_ports[0].id, 1, msg) == 0);
        CHECK(host.midi_in.load() == 1);

        stream->close();
        backend->shutdown();
    }
}
