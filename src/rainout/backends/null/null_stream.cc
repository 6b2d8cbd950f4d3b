#include "null_stream.hh"
#include <rainout/error.hh>
#include <rainout/sdk/samples_converter.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <chrono>
#include <cmath>

namespace rainout {

    namespace {
        const audio_device_info* find_in(const std::vector<audio_device_info>& list, const device_id& id) {
            for (const auto& d : list) {
                if (d.id.matches(id)) {
                    return &d;
                }
            }
            return nullptr;
        }
    }

    null_backend::stream::stream(null_backend& owner, const stream_info& session, stream_host& host, bool drives_audio)
        : m_owner(owner),
          m_host(host),
          m_drives_audio(drives_audio),
          m_format(owner.m_config.native_format),
          m_input_level(owner.m_config.input_level),
          m_pacing(owner.m_config.realtime_pacing),
          m_session(session) {
        const auto& cfg = owner.m_config;
        const bool linked = cfg.device_options == device_options_kind::linked_in_out;
        const audio_device_info* in = nullptr;
        const audio_device_info* out = nullptr;
        if (session.input_device) {
            in = find_in(linked ? cfg.in_devices : cfg.devices, *session.input_device);
        }
        if (session.output_device) {
            out = find_in(linked ? cfg.out_devices : cfg.devices, *session.output_device);
        }
        if (m_drives_audio && !in && !out) {
            throw device_error("null backend has no device matching the session");
        }

        m_capacity = session.max_block_frames();
        for (const auto* d : {in, out}) {
            if (d && d->block_sizes) {
                m_capacity = std::max(m_capacity, d->block_sizes->max_size);
            }
        }
        m_in_channels = in ? static_cast<channels_t>(in->in_ports.size()) : 0;
        m_out_channels = out ? static_cast<channels_t>(out->out_ports.size()) : 0;

        if (m_drives_audio) {
            const auto bps = static_cast<std::size_t>(bytes_per_sample(m_format));
            m_input.reset(std::max<std::size_t>(std::size_t(m_capacity) * m_in_channels * bps, 1));
            m_output.reset(std::max<std::size_t>(std::size_t(m_capacity) * m_out_channels * bps, 1));
            m_scratch.reset(std::max<frames_t>(m_capacity, 1));
        }
        publish(session);
        m_owner.register_stream(this);
    }

    null_backend::stream::~stream() {
        close();
        m_owner.unregister_stream(this);
    }

    void null_backend::stream::start() {
        if (m_closed) {
            throw device_error("null stream is closed");
        }
        if (m_running.exchange(true)) {
            return;
        }
        m_thread = std::thread(&stream::clock, this);
    }

    void null_backend::stream::stop() {
        m_running.store(false);
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    void null_backend::stream::close() {
        stop();
        m_closed = true;
    }

    void null_backend::stream::prepare_change(const stream_info& next) {
        if (next.max_block_frames() > m_capacity) {
            throw device_error("null device cannot run " + std::to_string(next.max_block_frames()) +
                               " frames per cycle, at most " + std::to_string(m_capacity));
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_session = next;
        publish(next);
    }

    void null_backend::stream::publish(const stream_info& session) noexcept {
        m_rate.store(session.sample_rate, std::memory_order_release);
        if (!session.midi || session.midi->midi_backend != backend::dummy) {
            return;
        }
        uint32_t end = m_midi_out_end.load(std::memory_order_relaxed);
        for (const auto& p : session.midi->out_ports) {
            if (p.success) {
                end = std::max(end, p.endpoint + 1);
            }
        }
        m_midi_out_end.store(end, std::memory_order_release);
    }

    bool null_backend::stream::can_change_audio_port_config() const {
        return m_owner.m_config.can_change_audio_ports;
    }

    bool null_backend::stream::can_change_block_size() const {
        return m_owner.m_config.can_change_block_size;
    }

    bool null_backend::stream::can_change_midi_ports() const {
        return m_owner.m_config.can_change_midi_ports;
    }

    void null_backend::stream::device_presence_changed(const device_id& id, device_kind kind, bool present) {
        m_host.device_presence_changed(id, kind, present);
    }

    bool null_backend::stream::send_midi(const device_id& device, uint32_t port_index, const midi_message& msg) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_session.midi) {
            return false;
        }
        for (const auto& p : m_session.midi->in_ports) {
            if (p.success && p.port_index == port_index && p.device.matches(device)) {
                return m_host.push_midi_input(p.endpoint, msg);
            }
        }
        return false;
    }

    frames_t null_backend::stream::next_cycle_frames() const noexcept {
        const auto frames = m_host.current_block_frames();
        return std::min(std::max<frames_t>(frames, 1), m_capacity);
    }

    void null_backend::stream::fill_input(frames_t frames) noexcept {
        if (m_in_channels == 0) {
            return;
        }
        const auto bps = static_cast<std::size_t>(bytes_per_sample(m_format));
        const auto stride = bps * m_in_channels;
        std::fill_n(m_scratch.data(), frames, m_input_level);
        const auto convert = get_from_float_converter(m_format);
        for (channels_t c = 0; c < m_in_channels; c++) {
            convert(m_input.data() + c * bps, m_scratch.data(), frames, stride);
        }
    }

    void null_backend::stream::drain_midi_output() noexcept {
        const uint32_t end = m_midi_out_end.load(std::memory_order_acquire);
        midi_message msg;
        for (uint32_t endpoint = 0; endpoint < end; endpoint++) {
            while (m_host.pop_midi_output(endpoint, msg)) {
                m_owner.m_stats.midi_sent.fetch_add(1, std::memory_order_relaxed);
            }
        }
    }

    void null_backend::stream::clock() {
        using clock_t = std::chrono::steady_clock;
        auto deadline = clock_t::now();
        const auto bps = static_cast<std::size_t>(bytes_per_sample(m_format));
        const auto to_float = get_to_float_converter(m_format);

        while (m_running.load(std::memory_order_acquire)) {
            const sample_rate_t rate = m_rate.load(std::memory_order_acquire);
            const frames_t frames = m_drives_audio ? next_cycle_frames() : 256;

            if (m_drives_audio) {
                fill_input(frames);
                native_cycle cycle;
                cycle.frames = frames;
                cycle.input = {m_format, m_in_channels, true, m_input.data(), nullptr};
                cycle.output = {m_format, m_out_channels, true, m_output.data(), nullptr};
                const auto result = m_host.run_cycle(cycle);
                m_owner.m_stats.cycles.fetch_add(1, std::memory_order_relaxed);

                if (m_out_channels > 0) {
                    to_float(m_scratch.data(), m_output.data(), frames, bps * m_out_channels);
                    float peak = 0.0f;
                    for (frames_t i = 0; i < frames; i++) {
                        peak = std::max(peak, std::fabs(m_scratch[i]));
                    }
                    m_owner.m_stats.output_peak.store(peak, std::memory_order_relaxed);
                }
                drain_midi_output();
                if (result == cycle_result::stop) {
                    break;
                }
            } else {
                drain_midi_output();
            }

            if (m_pacing && rate > 0) {
                deadline += std::chrono::nanoseconds(static_cast<int64_t>(frames) * 1000000000LL / rate);
                std::this_thread::sleep_until(deadline);
            } else {
                std::this_thread::yield();
            }
        }
        LOG_DEBUG("null_backend", "Clock thread finished");
    }

} // namespace rainout
