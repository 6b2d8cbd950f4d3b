#include <rainout/stream_handle.hh>
#include <rainout/backend_registry.hh>
#include <rainout/config_resolver.hh>
#include <rainout/error.hh>
#include <rainout/sdk/audio_backend.hh>
#include <rainout/sdk/backend_stream.hh>
#include <failsafe/failsafe.hh>
#include "reconfig_controller.hh"
#include "stream_engine.hh"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace rainout {

    namespace {
        // Shared with a pending open so a late adapter never outlives its host
        struct stream_core {
            stream_core(const run_options& options, std::unique_ptr<process_handler> handler)
                : channel(options.message_buffer_size, monitor),
                  engine(std::move(handler), options, monitor, channel) {
            }

            device_monitor monitor;
            message_channel channel;
            stream_engine engine;
        };

        struct pending_open {
            std::mutex mutex;
            std::condition_variable cv;
            bool done = false;
            bool abandoned = false;
            std::unique_ptr<backend_stream> stream;
            std::string error;
        };

        using opener_t = std::function<std::unique_ptr<backend_stream>()>;

        void close_quietly(backend_stream& s, const char* what) {
            try {
                s.stop();
                s.close();
            } catch (const std::exception& e) {
                LOG_ERROR("rainout", "Failed to close", what, "stream:", e.what());
            }
        }

        /**
         * Runs @p open on a helper thread and waits at most @p timeout. A
         * stream that shows up after the timeout is closed by the helper.
         */
        std::unique_ptr<backend_stream> open_with_timeout(opener_t open,
                                                          std::shared_ptr<stream_core> core,
                                                          std::chrono::milliseconds timeout,
                                                          const std::string& what) {
            auto state = std::make_shared<pending_open>();
            std::thread([state, core, open = std::move(open), what]() {
                std::unique_ptr<backend_stream> s;
                std::string error;
                try {
                    s = open();
                    if (!s) {
                        error = "the adapter returned no stream";
                    }
                } catch (const std::exception& e) {
                    error = e.what();
                }

                std::unique_lock<std::mutex> lock(state->mutex);
                if (state->abandoned) {
                    lock.unlock();
                    if (s) {
                        LOG_WARN("rainout", what, "opened after the timeout, closing it");
                        close_quietly(*s, what.c_str());
                    }
                    return;
                }
                state->stream = std::move(s);
                state->error = std::move(error);
                state->done = true;
                state->cv.notify_all();
            }).detach();

            std::unique_lock<std::mutex> lock(state->mutex);
            if (!state->cv.wait_for(lock, timeout, [&state] { return state->done; })) {
                state->abandoned = true;
                throw run_config_error(run_config_errc::timeout,
                                       what + " did not open within " + std::to_string(timeout.count()) + " ms");
            }
            if (!state->stream) {
                throw run_config_error(run_config_errc::device_open_failed, what + ": " + state->error);
            }
            return std::move(state->stream);
        }
    }

    struct stream_handle::impl {
        impl(const backend_registry& r, const run_options& o)
            : registry(r),
              options(o),
              controller(r, options) {
        }

        const backend_registry& registry;
        run_options options;
        reconfig_controller controller;
        std::shared_ptr<audio_backend> adapter;
        std::shared_ptr<audio_backend> midi_adapter;
        std::shared_ptr<stream_core> core;
        std::unique_ptr<backend_stream> stream;
        std::unique_ptr<backend_stream> midi_stream;
        stream_info session;
        bool closed = false;

        [[nodiscard]] const backend_stream& midi_caps() const {
            return midi_stream ? *midi_stream : *stream;
        }

        /**
         * Prepares both adapters for @p next. When the MIDI adapter refuses,
         * the audio adapter is prepared for the running session again.
         */
        void prepare_streams(const stream_info& next) {
            stream->prepare_change(next);
            if (!midi_stream) {
                return;
            }
            try {
                midi_stream->prepare_change(next);
            } catch (const std::exception&) {
                revert(*stream, "audio");
                throw;
            }
        }

        void revert(backend_stream& s, const char* what) noexcept {
            try {
                s.prepare_change(session);
            } catch (const std::exception& e) {
                LOG_ERROR("rainout", "Failed to restore", what, "stream after a refused change:", e.what());
            }
        }

        void revert_streams() noexcept {
            if (midi_stream) {
                revert(*midi_stream, "MIDI");
            }
            revert(*stream, "audio");
        }

        void release_streams() {
            if (midi_stream) {
                close_quietly(*midi_stream, "MIDI");
            }
            if (stream) {
                close_quietly(*stream, "audio");
            }
        }
    };

    stream_handle::stream_handle(std::unique_ptr<impl> pimpl)
        : m_pimpl(std::move(pimpl)) {
    }

    stream_handle::stream_handle(stream_handle&& other) noexcept = default;

    stream_handle& stream_handle::operator=(stream_handle&& other) noexcept {
        if (this != &other) {
            if (m_pimpl) {
                try {
                    close();
                } catch (const std::exception& e) {
                    LOG_ERROR("rainout", "Closing replaced stream failed:", e.what());
                }
            }
            m_pimpl = std::move(other.m_pimpl);
        }
        return *this;
    }

    stream_handle::~stream_handle() {
        if (m_pimpl) {
            try {
                close();
            } catch (const std::exception& e) {
                LOG_ERROR("rainout", "Closing stream failed:", e.what());
            }
        }
    }

    stream_handle::impl& stream_handle::checked() const {
        if (!m_pimpl) {
            throw state_error("stream_handle is empty");
        }
        return *m_pimpl;
    }

    const stream_info& stream_handle::info() const {
        return checked().session;
    }

    engine_state stream_handle::state() const {
        return checked().core->engine.state();
    }

    message_channel& stream_handle::messages() {
        return checked().core->channel;
    }

    bool stream_handle::can_change_audio_port_config() const {
        auto& p = checked();
        return !p.closed && p.stream->can_change_audio_port_config();
    }

    bool stream_handle::can_change_block_size() const {
        auto& p = checked();
        return !p.closed && p.stream->can_change_block_size();
    }

    bool stream_handle::can_change_midi_ports() const {
        auto& p = checked();
        return !p.closed && p.session.midi && p.midi_caps().can_change_midi_ports();
    }

    void stream_handle::apply_changes(const stream_change& change) {
        auto& p = checked();
        auto& engine = p.core->engine;
        if (p.closed) {
            throw state_error("stream is closed");
        }
        if (engine.state() == engine_state::faulted) {
            throw state_error("stream faulted and must be discarded");
        }
        if (!engine.can_submit()) {
            throw change_config_error(change_config_errc::busy,
                                      "previous changes are still waiting for a cycle boundary");
        }

        // nothing below may leave a trace of a refused change
        auto next = p.controller.plan(p.session, change, *p.stream, p.midi_caps());
        const auto endpoints = engine.assign_endpoints(p.session, next);

        // endpoint queues exist before the adapters can push into them
        engine.create_endpoint_queues(next);

        try {
            p.prepare_streams(next);
        } catch (const device_error& e) {
            throw run_config_error(run_config_errc::device_open_failed, e.what());
        }

        std::unique_ptr<stream_layout> layout;
        try {
            layout = engine.build_layout(next, change.changes_block_size() ? engine.latest_capacity() : 0);
        } catch (const std::exception&) {
            p.revert_streams();
            throw;
        }
        if (!engine.submit(layout)) {
            p.revert_streams();
            throw change_config_error(change_config_errc::busy, "command queue is full");
        }
        engine.commit_endpoints(endpoints);
        p.session = std::move(next);
        LOG_INFO("rainout", "Stream change accepted:", p.session);
    }

    void stream_handle::change_audio_ports(const std::optional<auto_option<std::vector<audio_port_ref>>>& in_ports,
                                           const std::optional<auto_option<std::vector<audio_port_ref>>>& out_ports) {
        stream_change change;
        change.audio_in_ports = in_ports;
        change.audio_out_ports = out_ports;
        apply_changes(change);
    }

    void stream_handle::change_block_size(const auto_option<frames_t>& block_size) {
        stream_change change;
        change.block_size = block_size;
        apply_changes(change);
    }

    void stream_handle::change_midi_ports(const std::optional<auto_option<std::vector<midi_port_config>>>& in_ports,
                                          const std::optional<auto_option<std::vector<midi_port_config>>>& out_ports) {
        stream_change change;
        change.midi_in_ports = in_ports;
        change.midi_out_ports = out_ports;
        apply_changes(change);
    }

    uint64_t stream_handle::processed_cycles() const {
        return checked().core->engine.processed_cycles();
    }

    uint64_t stream_handle::applied_changes() const {
        return checked().core->engine.applied_changes();
    }

    void stream_handle::close() {
        auto& p = checked();
        if (p.closed) {
            return;
        }
        p.closed = true;

        auto& engine = p.core->engine;
        engine.request_stop();
        const auto deadline = std::chrono::steady_clock::now() + p.options.close_timeout;
        while (engine.state() == engine_state::stopping && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        if (engine.state() == engine_state::stopping) {
            LOG_WARN("rainout", "Realtime thread did not stop within", p.options.close_timeout.count(),
                     "ms, stopping the adapter");
        }

        p.release_streams();
        const bool faulted = engine.state() == engine_state::faulted;
        engine.finish();
        engine.collect_retired();
        p.core->channel.post_terminal(stream_msg_type::closed, stream_error_code::none, "stream closed");
        if (faulted) {
            LOG_INFO("rainout", "Faulted stream on", p.session.audio_backend, "released");
        } else {
            LOG_INFO("rainout", "Stream on", p.session.audio_backend, "closed after",
                     engine.processed_cycles(), "cycles");
        }
    }

    bool stream_handle::is_open() const noexcept {
        return m_pimpl && !m_pimpl->closed;
    }

    stream_handle run(const rainout_config& config,
                      const run_options& options,
                      std::unique_ptr<process_handler> handler,
                      const backend_registry& registry) {
        if (!handler) {
            THROW_RUNTIME("run() requires a process handler");
        }
        config_resolver resolver(registry);
        auto session = resolver.resolve(config, options);

        auto adapter = registry.find(session.audio_backend);
        if (!adapter) {
            throw run_config_error(run_config_errc::backend_unavailable, to_string(session.audio_backend));
        }
        std::shared_ptr<audio_backend> midi_adapter;
        if (session.midi && session.midi->midi_backend != session.audio_backend) {
            midi_adapter = registry.find(session.midi->midi_backend);
            if (!midi_adapter) {
                throw run_config_error(run_config_errc::backend_unavailable,
                                       std::string(to_string(session.midi->midi_backend)) + " MIDI");
            }
        }

        auto p = std::make_unique<stream_handle::impl>(registry, options);
        p->adapter = adapter;
        p->midi_adapter = midi_adapter;
        p->core = std::make_shared<stream_core>(options, std::move(handler));
        auto& engine = p->core->engine;

        // endpoint queues exist before the adapter can push into them
        auto layout = engine.build_layout(session);

        stream_open_options open_options;
        open_options.application_name = options.application_name;
        auto core = p->core;
        p->stream = open_with_timeout([adapter, session, core, open_options]() {
                                          return adapter->open_stream(session, core->engine, open_options);
                                      },
                                      core, options.open_timeout, adapter->get_name());
        try {
            if (midi_adapter) {
                p->midi_stream = open_with_timeout([midi_adapter, session, core, open_options]() {
                                                       return midi_adapter->open_midi_stream(session, core->engine,
                                                                                             open_options);
                                                   },
                                                   core, options.open_timeout, midi_adapter->get_name() + " MIDI");
            }

            if (auto reported = p->stream->latency()) {
                session.latency = *reported;
                layout->session.latency = *reported;
            }
            p->session = session;
            engine.initialize(std::move(layout));
            engine.mark_running();
        } catch (const std::exception&) {
            p->release_streams();
            throw;
        }

        try {
            p->stream->start();
            if (p->midi_stream) {
                p->midi_stream->start();
            }
        } catch (const std::exception& e) {
            engine.request_stop();
            p->release_streams();
            engine.finish();
            throw run_config_error(run_config_errc::device_open_failed, e.what());
        }

        LOG_INFO("rainout", "Stream started:", p->session);
        return stream_handle(std::move(p));
    }

    stream_handle run(const rainout_config& config,
                      const run_options& options,
                      std::unique_ptr<process_handler> handler) {
        return run(config, options, std::move(handler), backend_registry::global());
    }

} // namespace rainout
