#ifndef RAINOUT_MOCK_BACKENDS_HH
#define RAINOUT_MOCK_BACKENDS_HH

#include <rainout/sdk/audio_backend.hh>
#include <rainout/sdk/backend_stream.hh>
#include <rainout/error.hh>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace rainout::test {

    class mock_backend;

    // Adapter stream whose cycles are driven by the test itself.
    // cycle() plays the realtime thread, so a test that calls it from one
    // thread only keeps every single-producer/single-consumer contract.
    class mock_stream : public backend_stream {
        public:
            mock_stream(mock_backend* owner, const stream_info& session, stream_host& host,
                        channels_t in_channels, channels_t out_channels);
            ~mock_stream() override;

            // Statistics for testing
            std::atomic<int> start_calls{0};
            std::atomic<int> stop_calls{0};
            std::atomic<int> close_calls{0};
            std::atomic<int> prepare_calls{0};

            // Configurable behaviors
            bool audio_ports_changeable = true;
            bool block_size_changeable = true;
            bool midi_ports_changeable = true;
            std::optional<frames_t> reported_latency;
            std::function<void(const stream_info&)> on_prepare_change;
            std::function<void()> on_start;

            void start() override {
                start_calls++;
                if (on_start) {
                    on_start();
                }
            }

            void stop() override { stop_calls++; }

            void close() override { close_calls++; }

            void prepare_change(const stream_info& next) override {
                prepare_calls++;
                if (on_prepare_change) {
                    on_prepare_change(next);
                }
                last_prepared = next;
            }

            [[nodiscard]] bool can_change_audio_port_config() const override { return audio_ports_changeable; }
            [[nodiscard]] bool can_change_block_size() const override { return block_size_changeable; }
            [[nodiscard]] bool can_change_midi_ports() const override { return midi_ports_changeable; }
            [[nodiscard]] std::optional<frames_t> latency() const override { return reported_latency; }

            // Runs one cycle of @p frames; 0 means the engine's current block size
            cycle_result cycle(frames_t frames = 0) {
                if (frames == 0) {
                    frames = m_host.current_block_frames();
                }
                const auto in_samples = std::size_t(frames) * m_in_channels;
                const auto out_samples = std::size_t(frames) * m_out_channels;
                m_input.assign(in_samples, 0.0f);
                for (std::size_t f = 0; f < frames; f++) {
                    for (channels_t c = 0; c < m_in_channels; c++) {
                        m_input[f * m_in_channels + c] = c < input_levels.size() ? input_levels[c] : 0.0f;
                    }
                }
                m_output.assign(out_samples, -1.0f);

                native_cycle c;
                c.frames = frames;
                c.input = {audio_f32sys, m_in_channels, true, reinterpret_cast<uint8*>(m_input.data()), nullptr};
                c.output = {audio_f32sys, m_out_channels, true, reinterpret_cast<uint8*>(m_output.data()), nullptr};
                return m_host.run_cycle(c);
            }

            [[nodiscard]] float output(frames_t frame, channels_t channel) const {
                return m_output.at(std::size_t(frame) * m_out_channels + channel);
            }

            stream_host& host() { return m_host; }

            void detach() noexcept { m_owner = nullptr; }

            // constant value of each native input channel
            std::vector<float> input_levels;
            std::optional<stream_info> last_prepared;
            const stream_info opened_with;

        private:
            mock_backend* m_owner;
            stream_host& m_host;
            channels_t m_in_channels;
            channels_t m_out_channels;
            std::vector<float> m_input;
            std::vector<float> m_output;
    };

    // Scriptable adapter: enumeration results are plain data the test edits
    class mock_backend : public audio_backend {
        public:
            explicit mock_backend(backend id = backend::jack)
                : m_id(id) {
                audio = default_audio_options();
                midi = default_midi_options();
            }

            ~mock_backend() override {
                std::lock_guard<std::mutex> lock(m_mutex);
                for (auto* s : m_streams) {
                    s->detach();
                }
            }

            // Statistics for testing
            std::atomic<int> init_calls{0};
            std::atomic<int> open_calls{0};
            std::atomic<int> midi_open_calls{0};

            // Configurable behaviors
            audio_backend_options audio;
            midi_backend_options midi;
            bool has_midi = true;
            bool fail_init = false;
            bool fail_open = false;
            std::chrono::milliseconds open_delay{0};
            std::optional<frames_t> stream_latency;
            bool streams_change_audio_ports = true;
            bool streams_change_block_size = true;
            bool streams_change_midi_ports = true;
            // installed as on_prepare_change of every MIDI stream opened
            std::function<void(const stream_info&)> midi_prepare_change;

            static audio_backend_options default_audio_options() {
                audio_backend_options o;
                o.version = "9.9";
                o.status = backend_status::running;
                o.device_options = device_options_kind::single_device;

                audio_device_info main;
                main.id = device_id{"Mock Device", std::string("mock:0")};
                main.in_ports = {"capture_1", "capture_2"};
                main.out_ports = {"playback_1", "playback_2"};
                main.sample_rates = {44100, 48000};
                main.default_sample_rate = 48000;
                main.block_sizes = block_size_range{32, 2048, 256, false};
                main.default_in_ports = {0, 1};
                main.default_out_ports = {0, 1};
                main.can_take_exclusive_access = true;

                audio_device_info mono;
                mono.id = device_id{"Mono Device", std::string("mock:1")};
                mono.in_ports = {"mic"};
                mono.out_ports = {"speaker"};
                mono.sample_rates = {22050, 44100};
                mono.default_sample_rate = 44100;
                mono.block_sizes = block_size_range{64, 1024, 128, true};
                mono.default_in_ports = {0};
                mono.default_out_ports = {0};

                o.devices = {main, mono};
                o.default_device = 0;
                return o;
            }

            static midi_backend_options default_midi_options() {
                midi_backend_options o;
                o.status = backend_status::running;
                const device_id keys{"Mock Keys", std::string("keys:0")};
                const device_id synth{"Mock Synth", std::string("synth:0")};
                o.in_ports = {{keys, 0, midi_control_scheme::midi1}, {keys, 1, midi_control_scheme::midi1}};
                o.out_ports = {{synth, 0, midi_control_scheme::midi1}};
                o.default_in_port = 0;
                o.default_out_port = 0;
                return o;
            }

            void init() override {
                init_calls++;
                if (fail_init) {
                    throw device_error("mock init failure");
                }
                if (m_initialized) {
                    throw std::runtime_error("mock backend already initialised");
                }
                m_initialized = true;
            }

            void shutdown() override { m_initialized = false; }

            [[nodiscard]] bool is_initialized() const override { return m_initialized; }

            [[nodiscard]] backend id() const override { return m_id; }

            [[nodiscard]] std::optional<std::string> version() const override { return audio.version; }

            audio_backend_options enumerate_audio() override {
                auto o = audio;
                o.id = m_id;
                return o;
            }

            [[nodiscard]] bool supports_midi() const override { return has_midi; }

            midi_backend_options enumerate_midi() override {
                if (!has_midi) {
                    return audio_backend::enumerate_midi();
                }
                auto o = midi;
                o.id = m_id;
                return o;
            }

            std::unique_ptr<backend_stream> open_stream(const stream_info& session,
                                                        stream_host& host,
                                                        const stream_open_options& options) override {
                open_calls++;
                last_application_name = options.application_name;
                if (open_delay.count() > 0) {
                    std::this_thread::sleep_for(open_delay);
                }
                if (fail_open) {
                    throw device_error("mock open failure");
                }
                return make_stream(session, host);
            }

            std::unique_ptr<backend_stream> open_midi_stream(const stream_info& session,
                                                             stream_host& host,
                                                             const stream_open_options&) override {
                midi_open_calls++;
                if (!has_midi) {
                    throw device_error("mock backend has no MIDI");
                }
                auto s = std::make_unique<mock_stream>(nullptr, session, host, 0, 0);
                s->midi_ports_changeable = streams_change_midi_ports;
                s->on_prepare_change = midi_prepare_change;
                return s;
            }

            // Most recently opened audio stream, nullptr once it was destroyed
            mock_stream* last_stream() {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_last;
            }

            [[nodiscard]] std::size_t live_streams() const {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_streams.size();
            }

            std::optional<std::string> last_application_name;

        private:
            friend class mock_stream;

            std::unique_ptr<mock_stream> make_stream(const stream_info& session, stream_host& host) {
                channels_t in = 0;
                channels_t out = 0;
                for (const auto& d : audio.devices) {
                    if (session.input_device && d.id.matches(*session.input_device)) {
                        in = static_cast<channels_t>(d.in_ports.size());
                    }
                    if (session.output_device && d.id.matches(*session.output_device)) {
                        out = static_cast<channels_t>(d.out_ports.size());
                    }
                }
                auto s = std::make_unique<mock_stream>(this, session, host, in, out);
                s->audio_ports_changeable = streams_change_audio_ports;
                s->block_size_changeable = streams_change_block_size;
                s->midi_ports_changeable = streams_change_midi_ports;
                s->reported_latency = stream_latency;
                std::lock_guard<std::mutex> lock(m_mutex);
                m_streams.push_back(s.get());
                m_last = s.get();
                return s;
            }

            void forget(mock_stream* s) {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_streams.erase(std::remove(m_streams.begin(), m_streams.end(), s), m_streams.end());
                if (m_last == s) {
                    m_last = nullptr;
                }
            }

            backend m_id;
            bool m_initialized = false;
            mutable std::mutex m_mutex;
            std::vector<mock_stream*> m_streams;
            mock_stream* m_last = nullptr;
    };

    inline mock_stream::mock_stream(mock_backend* owner, const stream_info& session, stream_host& host,
                                    channels_t in_channels, channels_t out_channels)
        : opened_with(session),
          m_owner(owner),
          m_host(host),
          m_in_channels(in_channels),
          m_out_channels(out_channels) {
    }

    inline mock_stream::~mock_stream() {
        if (m_owner) {
            m_owner->forget(this);
        }
    }

} // namespace rainout::test

#endif // RAINOUT_MOCK_BACKENDS_HH
