#include "backend_test_helpers.hh"
#include <doctest/doctest.h>
#include <rainout/error.hh>
#include <algorithm>
#include <chrono>
#include <thread>

namespace rainout::test {

cycle_result counting_host::run_cycle(native_cycle& cycle) noexcept {
    last_frames = cycle.frames;
    const auto n = ++cycles;
    const auto limit = m_stop_after.load();
    return (limit != 0 && n >= limit) ? cycle_result::stop : cycle_result::keep_running;
}

bool counting_host::push_midi_input(uint32_t, const midi_message&) noexcept {
    midi_in++;
    return true;
}

bool counting_host::push_midi_input(uint32_t, frames_t, const uint8*, std::size_t) noexcept {
    midi_in++;
    return true;
}

bool counting_host::pop_midi_output(uint32_t, midi_message&) noexcept {
    return false;
}

void counting_host::device_presence_changed(const device_id& id, device_kind kind, bool present) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_presence.push_back({id, kind, present});
}

std::vector<counting_host::presence_event> counting_host::presence_events() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_presence;
}

void test_backend_initialization(std::shared_ptr<audio_backend> backend) {
    REQUIRE(backend != nullptr);

    // Should not be initialized initially
    CHECK_FALSE(backend->is_initialized());

    CHECK_NOTHROW(backend->init());
    CHECK(backend->is_initialized());

    // Double init should throw
    CHECK_THROWS(backend->init());

    CHECK_NOTHROW(backend->shutdown());
    CHECK_FALSE(backend->is_initialized());

    // Double shutdown should be safe
    CHECK_NOTHROW(backend->shutdown());
}

void test_enumeration_invariants(std::shared_ptr<audio_backend> backend) {
    REQUIRE(backend != nullptr);
    backend->init();

    const auto opts = backend->enumerate_audio();
    CHECK(opts.id == backend->id());

    auto check_devices = [](const std::vector<audio_device_info>& list,
                            const std::optional<std::size_t>& def) {
        if (def) {
            CHECK(*def < list.size());
        }
        for (const auto& d : list) {
            CHECK_FALSE(d.id.name.empty());
            CHECK_FALSE(d.sample_rates.empty());
            if (d.default_sample_rate != 0) {
                CHECK(d.supports_sample_rate(d.default_sample_rate));
            }
            for (auto idx : d.default_in_ports) {
                CHECK(idx < d.in_ports.size());
            }
            for (auto idx : d.default_out_ports) {
                CHECK(idx < d.out_ports.size());
            }
            if (d.block_sizes) {
                CHECK(d.block_sizes->min_size <= d.block_sizes->max_size);
                CHECK(d.block_sizes->contains(d.block_sizes->default_size));
            }
        }
    };

    if (opts.device_options == device_options_kind::linked_in_out) {
        CHECK(opts.devices.empty());
        check_devices(opts.in_devices, opts.default_in_device);
        check_devices(opts.out_devices, opts.default_out_device);
    } else {
        CHECK(opts.in_devices.empty());
        CHECK(opts.out_devices.empty());
        check_devices(opts.devices, opts.default_device);
    }

    if (opts.status == backend_status::no_devices) {
        CHECK_FALSE(opts.has_devices());
    }

    // a second scan sees the same devices
    const auto again = backend->enumerate_audio();
    CHECK(again.devices.size() == opts.devices.size());
    CHECK(again.out_devices.size() == opts.out_devices.size());

    backend->shutdown();
}

void test_midi_capabilities(std::shared_ptr<audio_backend> backend) {
    REQUIRE(backend != nullptr);
    backend->init();

    const auto midi = backend->enumerate_midi();
    CHECK(midi.id == backend->id());
    if (!backend->supports_midi()) {
        CHECK(midi.status == backend_status::not_installed);
        CHECK(midi.in_ports.empty());
        CHECK(midi.out_ports.empty());

        stream_info session;
        counting_host host;
        CHECK_THROWS_AS(backend->open_midi_stream(session, host, {}), device_error);
    } else if (midi.status == backend_status::running) {
        if (midi.default_in_port) {
            CHECK(*midi.default_in_port < midi.in_ports.size());
        }
        if (midi.default_out_port) {
            CHECK(*midi.default_out_port < midi.out_ports.size());
        }
    }

    backend->shutdown();
}

bool default_session(audio_backend& backend, stream_info& session) {
    const auto opts = backend.enumerate_audio();
    if (opts.status != backend_status::running) {
        return false;
    }

    const audio_device_info* device = nullptr;
    const bool linked = opts.device_options == device_options_kind::linked_in_out;
    const auto& list = linked ? opts.out_devices : opts.devices;
    const auto& def = linked ? opts.default_out_device : opts.default_device;
    if (list.empty()) {
        return false;
    }
    device = &list[def ? *def : 0];

    session = stream_info{};
    session.audio_backend = opts.id;
    session.backend_version = opts.version;
    session.linked_devices = linked;
    session.output_device = device->id;
    if (!linked) {
        session.input_device = device->id;
    }
    session.sample_rate = device->default_sample_rate != 0 ? device->default_sample_rate
                                                           : device->sample_rates.front();
    if (device->block_sizes) {
        session.block_size = stream_block_size::fixed_size(device->block_sizes->default_size);
    } else {
        session.block_size = stream_block_size::unfixed_with_max(1024);
    }
    for (std::size_t i = 0; i < std::min<std::size_t>(2, device->out_ports.size()); i++) {
        session.audio_out_ports.push_back({device->out_ports[i], i, true});
    }
    return true;
}

void test_stream_lifecycle(std::shared_ptr<audio_backend> backend, uint64_t min_cycles) {
    REQUIRE(backend != nullptr);
    backend->init();

    stream_info session;
    if (!default_session(*backend, session)) {
        MESSAGE("backend has no devices, skipping stream lifecycle");
        backend->shutdown();
        return;
    }

    counting_host host(session.max_block_frames());
    auto stream = backend->open_stream(session, host, {});
    REQUIRE(stream != nullptr);
    CHECK(host.cycles.load() == 0);

    CHECK_NOTHROW(stream->start());
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (host.cycles < min_cycles && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    CHECK(host.cycles.load() >= min_cycles);
    if (host.cycles > 0) {
        CHECK(host.last_frames.load() > 0);
        CHECK(host.last_frames.load() <= session.max_block_frames());
    }

    CHECK_NOTHROW(stream->stop());
    const auto stopped_at = host.cycles.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    CHECK(host.cycles.load() == stopped_at);

    CHECK_NOTHROW(stream->close());
    CHECK_NOTHROW(stream->close());
    CHECK(host.failures.load() == 0);
    stream.reset();

    backend->shutdown();
}

} // namespace rainout::test
