#pragma once

#include <rainout/backends/null/null_backend.hh>
#include <rainout/sdk/backend_stream.hh>
#include <rainout/sdk/buffer.hh>
#include <atomic>
#include <mutex>
#include <thread>

namespace rainout {

    /**
     * One simulated device stream. The clock thread owns the native
     * buffers and never locks: it reads the rate and the range of MIDI
     * output endpoints from atomics. The session copy used to route
     * incoming MIDI is guarded by m_mutex.
     */
    class null_backend::stream final : public backend_stream {
    public:
        stream(null_backend& owner, const stream_info& session, stream_host& host, bool drives_audio);
        ~stream() override;

        void start() override;
        void stop() override;
        void close() override;
        void prepare_change(const stream_info& next) override;

        [[nodiscard]] bool can_change_audio_port_config() const override;
        [[nodiscard]] bool can_change_block_size() const override;
        [[nodiscard]] bool can_change_midi_ports() const override;

        // called by null_backend with its mutex held
        void device_presence_changed(const device_id& id, device_kind kind, bool present);
        bool send_midi(const device_id& device, uint32_t port_index, const midi_message& msg);
        void report_xrun() noexcept { m_host.report_xrun(); }
        void fail(const char* reason) noexcept { m_host.backend_failed(reason); }

    private:
        void clock();
        void fill_input(frames_t frames) noexcept;
        void drain_midi_output() noexcept;
        frames_t next_cycle_frames() const noexcept;
        void publish(const stream_info& session) noexcept;

        null_backend& m_owner;
        stream_host& m_host;
        const bool m_drives_audio;
        const audio_format m_format;
        const float m_input_level;
        const bool m_pacing;

        std::mutex m_mutex;
        stream_info m_session;

        std::atomic<sample_rate_t> m_rate{0};
        // endpoints are never reused, so draining [0, end) covers every output port
        std::atomic<uint32_t> m_midi_out_end{0};

        channels_t m_in_channels = 0;
        channels_t m_out_channels = 0;
        frames_t m_capacity = 0;
        buffer<uint8> m_input;
        buffer<uint8> m_output;
        buffer<float> m_scratch;

        std::atomic<bool> m_running{false};
        bool m_closed = false;
        std::thread m_thread;
    };

} // namespace rainout
