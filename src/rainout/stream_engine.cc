#include "stream_engine.hh"
#include <rainout/error.hh>
#include <rainout/process_info.hh>
#include <rainout/sdk/samples_converter.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <ostream>

namespace rainout {

    const char* to_string(engine_state s) {
        switch (s) {
            case engine_state::created: return "created";
            case engine_state::initializing: return "initializing";
            case engine_state::running: return "running";
            case engine_state::stopping: return "stopping";
            case engine_state::stopped: return "stopped";
            case engine_state::faulted: return "faulted";
        }
        return "unknown";
    }

    std::ostream& operator<<(std::ostream& os, engine_state s) {
        return os << to_string(s);
    }

    stream_engine::stream_engine(std::unique_ptr<process_handler> handler,
                                 const run_options& options,
                                 device_monitor& monitor,
                                 message_channel& channel)
        : m_handler(std::move(handler)),
          m_monitor(monitor),
          m_channel(channel),
          m_midi_in(options.max_midi_endpoints, std::max<uint32_t>(options.midi_buffer_size, 1)),
          m_midi_out(options.max_midi_endpoints, std::max<uint32_t>(options.midi_buffer_size, 1)),
          m_commands(command_capacity),
          m_retired(command_capacity * 2) {
        if (!m_handler) {
            THROW_RUNTIME("stream_engine requires a process handler");
        }
    }

    stream_engine::~stream_engine() {
        // the adapter is stopped by now; both queues may be drained from here
        stream_layout* pending = nullptr;
        while (m_commands.try_pop(pending)) {
            delete pending;
        }
        collect_retired();
    }

    std::unique_ptr<stream_layout> stream_engine::build_layout(const stream_info& session, frames_t min_capacity) {
        return build_stream_layout(session, min_capacity, m_monitor, m_midi_in, m_midi_out);
    }

    void stream_engine::initialize(std::unique_ptr<stream_layout> layout) {
        if (state() != engine_state::created) {
            throw state_error(std::string("stream_engine already initialised, state is ") + to_string(state()));
        }
        m_state.store(engine_state::initializing, std::memory_order_release);
        m_active = std::move(layout);
        m_latest_capacity = m_active->capacity;
        m_block_frames.store(m_active->block_frames, std::memory_order_release);
        if (m_active->session.midi) {
            for (const auto& p : m_active->session.midi->in_ports) {
                m_next_in_endpoint = std::max(m_next_in_endpoint, p.endpoint + 1);
            }
            for (const auto& p : m_active->session.midi->out_ports) {
                m_next_out_endpoint = std::max(m_next_out_endpoint, p.endpoint + 1);
            }
        }
        m_handler->init(m_active->session);
    }

    void stream_engine::mark_running() noexcept {
        auto expected = engine_state::initializing;
        m_state.compare_exchange_strong(expected, engine_state::running, std::memory_order_acq_rel);
    }

    stream_engine::endpoint_reservation stream_engine::assign_endpoints(const stream_info& current,
                                                                        stream_info& next) const {
        endpoint_reservation r{m_next_in_endpoint, m_next_out_endpoint};
        if (!next.midi) {
            return r;
        }
        auto assign = [](const std::vector<stream_midi_port_info>* old_ports,
                         std::vector<stream_midi_port_info>& ports,
                         uint32_t& next_endpoint,
                         std::size_t max) {
            for (auto& p : ports) {
                bool reused = false;
                if (old_ports) {
                    for (const auto& o : *old_ports) {
                        if (o.success && o.device.matches(p.device) && o.port_index == p.port_index) {
                            p.endpoint = o.endpoint;
                            reused = true;
                            break;
                        }
                    }
                }
                if (!reused) {
                    if (next_endpoint >= max) {
                        throw change_config_error(change_config_errc::not_supported,
                                                  "MIDI endpoint limit of " + std::to_string(max) + " reached");
                    }
                    p.endpoint = next_endpoint++;
                }
            }
        };
        assign(current.midi ? &current.midi->in_ports : nullptr, next.midi->in_ports,
               r.next_in, m_midi_in.max_endpoints());
        assign(current.midi ? &current.midi->out_ports : nullptr, next.midi->out_ports,
               r.next_out, m_midi_out.max_endpoints());
        return r;
    }

    void stream_engine::commit_endpoints(const endpoint_reservation& r) noexcept {
        m_next_in_endpoint = std::max(m_next_in_endpoint, r.next_in);
        m_next_out_endpoint = std::max(m_next_out_endpoint, r.next_out);
    }

    void stream_engine::create_endpoint_queues(const stream_info& session) {
        if (!session.midi) {
            return;
        }
        auto create = [](const std::vector<stream_midi_port_info>& ports, midi_endpoints& endpoints) {
            for (const auto& p : ports) {
                if (p.success && !endpoints.ensure(p.endpoint)) {
                    throw rainout_error("MIDI endpoint " + std::to_string(p.endpoint) +
                                        " exceeds the configured maximum of " +
                                        std::to_string(endpoints.max_endpoints()));
                }
            }
        };
        create(session.midi->in_ports, m_midi_in);
        create(session.midi->out_ports, m_midi_out);
    }

    bool stream_engine::can_submit() noexcept {
        collect_retired();
        return m_commands.size() < m_commands.capacity();
    }

    bool stream_engine::submit(std::unique_ptr<stream_layout>& next) {
        collect_retired();
        if (!next) {
            return false;
        }
        const auto capacity = next->capacity;
        if (!m_commands.try_push(next.get())) {
            return false;
        }
        next.release();
        m_latest_capacity = capacity;
        return true;
    }

    void stream_engine::collect_retired() {
        stream_layout* old = nullptr;
        while (m_retired.try_pop(old)) {
            delete old;
        }
    }

    void stream_engine::request_stop() noexcept {
        auto expected = engine_state::running;
        if (m_state.compare_exchange_strong(expected, engine_state::stopping, std::memory_order_acq_rel)) {
            // a null layout is the stop command; the state alone is enough when the queue is full
            m_commands.try_push(nullptr);
            return;
        }
        expected = engine_state::initializing;
        m_state.compare_exchange_strong(expected, engine_state::stopped, std::memory_order_acq_rel);
    }

    void stream_engine::finish() noexcept {
        m_state.store(engine_state::stopped, std::memory_order_release);
    }

    void stream_engine::fault(stream_error_code code, const char* reason) noexcept {
        auto s = m_state.load(std::memory_order_acquire);
        while (s == engine_state::initializing || s == engine_state::running || s == engine_state::stopping) {
            if (m_state.compare_exchange_weak(s, engine_state::faulted, std::memory_order_acq_rel)) {
                m_channel.post_terminal(stream_msg_type::fatal_error, code, reason);
                return;
            }
        }
    }

    // ---------------------------------------------------------------------
    // realtime path
    // ---------------------------------------------------------------------

    void stream_engine::write_silence(native_audio_block& block, frames_t offset, frames_t frames) noexcept {
        if (block.channels == 0 || frames == 0) {
            return;
        }
        const auto silence = get_silence_writer(block.format);
        const auto bps = static_cast<std::size_t>(bytes_per_sample(block.format));
        if (!silence || bps == 0) {
            return;
        }
        if (block.interleaved) {
            if (!block.data) {
                return;
            }
            const std::size_t stride = bps * block.channels;
            silence(block.data + offset * stride, static_cast<frames_t>(frames * block.channels), bps);
        } else {
            if (!block.planes) {
                return;
            }
            for (channels_t c = 0; c < block.channels; c++) {
                if (block.planes[c]) {
                    silence(block.planes[c] + offset * bps, frames, bps);
                }
            }
        }
    }

    bool stream_engine::install_pending() noexcept {
        stream_layout* next = nullptr;
        // the retired queue must have room before a command is taken
        while (m_retired.size() < m_retired.capacity() && m_commands.try_pop(next)) {
            if (!next) {
                auto expected = engine_state::stopping;
                m_state.compare_exchange_strong(expected, engine_state::stopped, std::memory_order_acq_rel);
                return false;
            }
            stream_layout* old = m_active.release();
            m_active.reset(next);
            if (old) {
                m_retired.try_push(old);
            }
            m_block_frames.store(m_active->block_frames, std::memory_order_release);
            try {
                m_handler->stream_changed(m_active->session);
            } catch (const std::exception& e) {
                fault(stream_error_code::process_fault, e.what());
                return false;
            } catch (...) {
                fault(stream_error_code::process_fault, "unknown exception in stream_changed");
                return false;
            }
            m_applied.fetch_add(1, std::memory_order_acq_rel);
        }
        return true;
    }

    void stream_engine::gather_midi_input(stream_layout& layout, frames_t frames) noexcept {
        const frames_t last = frames > 0 ? frames - 1 : 0;
        for (std::size_t i = 0; i < layout.midi_in_cycle.size(); i++) {
            auto& buf = layout.midi_in_cycle[i];
            auto& route = layout.midi_in_routes[i];
            buf.clear();
            if (!route.queue) {
                continue;
            }
            if (!route.connected || !route.device->present.load(std::memory_order_acquire)) {
                route.queue->discard_all();
                continue;
            }
            midi_message msg;
            while (route.queue->try_pop(msg)) {
                msg.delta_frames = std::min(msg.delta_frames, last);
                if (!buf.push(msg)) {
                    ++m_midi_overflow;
                }
            }
        }
    }

    void stream_engine::split_midi_input(stream_layout& layout, frames_t offset, frames_t frames) noexcept {
        for (std::size_t i = 0; i < layout.midi_in.size(); i++) {
            auto& chunk = layout.midi_in[i];
            chunk.clear();
            for (const auto& ev : layout.midi_in_cycle[i]) {
                if (ev.delta_frames < offset || ev.delta_frames - offset >= frames) {
                    continue;
                }
                midi_message msg = ev;
                msg.delta_frames -= offset;
                chunk.push(msg);
            }
        }
    }

    void stream_engine::queue_midi_output(stream_layout& layout, frames_t offset) noexcept {
        for (std::size_t i = 0; i < layout.midi_out.size(); i++) {
            const auto& route = layout.midi_out_routes[i];
            const auto& buf = layout.midi_out[i];
            if (buf.empty() || !route.queue || !route.connected ||
                !route.device->present.load(std::memory_order_acquire)) {
                continue;
            }
            for (const auto& ev : buf) {
                midi_message out = ev;
                out.delta_frames += offset;
                if (!route.queue->try_push(out)) {
                    ++m_midi_overflow;
                }
            }
        }
    }

    bool stream_engine::process_chunk(stream_layout& layout, native_cycle& cycle, frames_t offset, frames_t frames) noexcept {
        auto& in = cycle.input;
        const auto to_float = in.channels > 0 ? get_to_float_converter(in.format) : nullptr;
        const auto in_bps = static_cast<std::size_t>(bytes_per_sample(in.format));

        for (std::size_t i = 0; i < layout.audio_in.size(); i++) {
            auto& buf = layout.audio_in[i];
            const auto& route = layout.in_routes[i];
            const uint8* src = nullptr;
            std::size_t stride = in_bps;
            if (to_float && route.connected && route.channel < in.channels &&
                route.device->present.load(std::memory_order_acquire)) {
                if (in.interleaved && in.data) {
                    stride = in_bps * in.channels;
                    src = in.data + offset * stride + route.channel * in_bps;
                } else if (!in.interleaved && in.planes && in.planes[route.channel]) {
                    src = in.planes[route.channel] + offset * in_bps;
                }
            }
            if (src) {
                to_float(buf.data(), src, frames, stride);
            } else {
                buf.clear(frames);
            }
            if (layout.session.checking_for_silent_inputs) {
                const float* p = buf.data();
                layout.silent_in[i] = std::all_of(p, p + frames, [](float s) { return s == 0.0f; });
            }
        }

        for (auto& buf : layout.audio_out) {
            buf.clear(frames);
        }
        for (auto& buf : layout.midi_out) {
            buf.clear();
        }

        process_info info{layout.audio_in, layout.audio_out, frames, layout.silent_in,
                          layout.midi_in, layout.midi_out};
        try {
            m_handler->process(info);
        } catch (const std::exception& e) {
            fault(stream_error_code::process_fault, e.what());
            return false;
        } catch (...) {
            fault(stream_error_code::process_fault, "unknown exception in process");
            return false;
        }
        m_cycles.fetch_add(1, std::memory_order_relaxed);

        auto& out = cycle.output;
        write_silence(out, offset, frames);
        const auto from_float = out.channels > 0 ? get_from_float_converter(out.format) : nullptr;
        const auto out_bps = static_cast<std::size_t>(bytes_per_sample(out.format));
        if (from_float) {
            for (std::size_t i = 0; i < layout.audio_out.size(); i++) {
                const auto& route = layout.out_routes[i];
                if (!route.connected || route.channel >= out.channels ||
                    !route.device->present.load(std::memory_order_acquire)) {
                    continue;
                }
                if (out.interleaved && out.data) {
                    const std::size_t stride = out_bps * out.channels;
                    from_float(out.data + offset * stride + route.channel * out_bps,
                               layout.audio_out[i].data(), frames, stride);
                } else if (!out.interleaved && out.planes && out.planes[route.channel]) {
                    from_float(out.planes[route.channel] + offset * out_bps,
                               layout.audio_out[i].data(), frames, out_bps);
                }
            }
        }

        queue_midi_output(layout, offset);
        return true;
    }

    void stream_engine::flush_counters() noexcept {
        auto post_count = [this](stream_error_code code, uint64_t count) {
            rt_message msg;
            msg.type = stream_msg_type::nonfatal_error;
            msg.error = code;
            msg.count = count;
            return m_channel.post(msg);
        };

        const uint64_t overflow = m_midi_overflow + m_midi_push_overflow.exchange(0, std::memory_order_acq_rel);
        m_midi_overflow = 0;
        if (overflow > 0 && !post_count(stream_error_code::midi_buffer_overflow, overflow)) {
            m_midi_overflow = overflow;
        }

        const uint64_t too_long = m_midi_too_long.exchange(0, std::memory_order_acq_rel);
        if (too_long > 0 && !post_count(stream_error_code::midi_event_too_long, too_long)) {
            m_midi_too_long.fetch_add(too_long, std::memory_order_relaxed);
        }

        const uint64_t xruns = m_xruns.exchange(0, std::memory_order_acq_rel);
        if (xruns > 0 && !post_count(stream_error_code::xrun, xruns)) {
            m_xruns.fetch_add(xruns, std::memory_order_relaxed);
        }

        if (m_mismatch_frames > 0 && post_count(stream_error_code::buffer_size_mismatch, m_mismatch_frames)) {
            m_mismatch_frames = 0;
        }
    }

    cycle_result stream_engine::run_cycle(native_cycle& cycle) noexcept {
        auto s = m_state.load(std::memory_order_acquire);
        if (s == engine_state::stopping) {
            m_state.compare_exchange_strong(s, engine_state::stopped, std::memory_order_acq_rel);
            write_silence(cycle.output, 0, cycle.frames);
            return cycle_result::stop;
        }
        if (s != engine_state::running) {
            write_silence(cycle.output, 0, cycle.frames);
            return s == engine_state::initializing ? cycle_result::keep_running : cycle_result::stop;
        }

        // false on a stop command or when stream_changed faulted
        if (!install_pending()) {
            write_silence(cycle.output, 0, cycle.frames);
            return cycle_result::stop;
        }

        auto& layout = *m_active;

        if (cycle.frames == 0) {
            flush_counters();
            return cycle_result::keep_running;
        }

        gather_midi_input(layout, cycle.frames);
        if (cycle.frames > layout.capacity) {
            m_mismatch_frames = cycle.frames;
        }

        frames_t offset = 0;
        while (offset < cycle.frames) {
            const frames_t n = std::min(layout.capacity, cycle.frames - offset);
            split_midi_input(layout, offset, n);
            if (!process_chunk(layout, cycle, offset, n)) {
                write_silence(cycle.output, offset, cycle.frames - offset);
                return cycle_result::stop;
            }
            offset += n;
        }

        flush_counters();
        return cycle_result::keep_running;
    }

    frames_t stream_engine::current_block_frames() const noexcept {
        return m_block_frames.load(std::memory_order_acquire);
    }

    bool stream_engine::push_midi_input(uint32_t endpoint, const midi_message& msg) noexcept {
        auto* q = m_midi_in.get(endpoint);
        if (!q) {
            return false;
        }
        if (!q->try_push(msg)) {
            m_midi_push_overflow.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        return true;
    }

    bool stream_engine::push_midi_input(uint32_t endpoint, frames_t delta, const uint8* bytes, std::size_t size) noexcept {
        midi_message msg;
        if (!midi_message::make(delta, bytes, size, msg)) {
            m_midi_too_long.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        return push_midi_input(endpoint, msg);
    }

    bool stream_engine::pop_midi_output(uint32_t endpoint, midi_message& msg) noexcept {
        auto* q = m_midi_out.get(endpoint);
        return q && q->try_pop(msg);
    }

    void stream_engine::device_presence_changed(const device_id& id, device_kind kind, bool present) {
        m_monitor.set_present(id, kind, present);
    }

    void stream_engine::report_xrun() noexcept {
        m_xruns.fetch_add(1, std::memory_order_relaxed);
    }

    void stream_engine::backend_failed(const char* reason) noexcept {
        fault(stream_error_code::backend_failure, reason ? reason : "backend failure");
    }

} // namespace rainout
