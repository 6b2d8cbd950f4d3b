#ifndef RAINOUT_SDL3_AUDIO_STREAM_HH
#define RAINOUT_SDL3_AUDIO_STREAM_HH

#include <rainout/sdk/backend_stream.hh>
#include <rainout/sdk/buffer.hh>
#include "sdl3.hh"
#include <atomic>
#include <memory>

namespace rainout {

class sdl3_backend;

/**
 * Playback and recording SDL_AudioStream pair feeding a stream_host.
 *
 * The playback get-callback drives cycles; recorded data is pulled from the
 * recording stream inside it. Input-only sessions are driven by the
 * recording stream's put-callback instead.
 */
class sdl3_audio_stream : public backend_stream {
public:
    sdl3_audio_stream(sdl3_backend& owner, const stream_info& session, stream_host& host);
    ~sdl3_audio_stream() override;

    void start() override;
    void stop() override;
    void close() override;
    void prepare_change(const stream_info& next) override;

    [[nodiscard]] bool can_change_audio_port_config() const override { return true; }
    [[nodiscard]] bool can_change_block_size() const override { return true; }
    [[nodiscard]] bool can_change_midi_ports() const override { return false; }
    [[nodiscard]] std::optional<frames_t> latency() const override;

    void on_device_removed(SDL_AudioDeviceID id);
    void on_device_added(SDL_AudioDeviceID id);

private:
    struct device_side {
        device_id id;
        /// physical device, matched against hot-plug events
        SDL_AudioDeviceID physical_id = 0;
        /// logical device opened on it
        SDL_AudioDeviceID sdl_id = 0;
        std::shared_ptr<SDL_AudioStream> stream;
        channels_t channels = 0;
        frames_t device_frames = 0;
    };

    static void SDLCALL playback_callback(void* userdata, SDL_AudioStream* stream, int additional_amount, int total_amount);
    static void SDLCALL recording_callback(void* userdata, SDL_AudioStream* stream, int additional_amount, int total_amount);

    void open_side(device_side& side, const device_id& id, bool playback, sample_rate_t rate);
    void run_cycles(frames_t frames, SDL_AudioStream* playback) noexcept;
    void release() noexcept;

    sdl3_backend& m_owner;
    stream_host& m_host;
    device_side m_playback;
    device_side m_recording;
    frames_t m_capacity = 0;
    buffer<uint8> m_input;
    buffer<uint8> m_output;
    std::atomic<bool> m_running{false};
    bool m_closed = false;
};

} // namespace rainout

#endif // RAINOUT_SDL3_AUDIO_STREAM_HH
