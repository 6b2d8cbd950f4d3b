/**
 * @file sdl3_backend_impl.hh
 * @brief SDL3 backend implementation
 * @ingroup sdl3_backend
 */

#ifndef RAINOUT_SDL3_BACKEND_IMPL_HH
#define RAINOUT_SDL3_BACKEND_IMPL_HH

#include <rainout/sdk/audio_backend.hh>
#include "sdl3.hh"
#include <mutex>
#include <string>
#include <vector>

namespace rainout {

class sdl3_audio_stream;

/**
 * @class sdl3_backend
 * @brief SDL3 implementation of the audio_backend interface
 * @ingroup sdl3_backend
 *
 * Devices are identified by their SDL instance id, kept as the device_id
 * identifier. Open streams are registered so that the event watch can
 * forward device removal and arrival to them.
 *
 * @note This is an internal implementation class. Users should
 *       create instances via create_sdl3_backend().
 */
class sdl3_backend : public audio_backend {
public:
    sdl3_backend() = default;
    ~sdl3_backend() override;

    void init() override;
    void shutdown() override;
    [[nodiscard]] bool is_initialized() const override;
    [[nodiscard]] backend id() const override;
    [[nodiscard]] std::optional<std::string> version() const override;

    audio_backend_options enumerate_audio() override;

    std::unique_ptr<backend_stream> open_stream(const stream_info& session,
                                                stream_host& host,
                                                const stream_open_options& options) override;

    static audio_format sdl_to_rainout_format(SDL_AudioFormat sdl_fmt);
    static SDL_AudioFormat rainout_to_sdl_format(audio_format fmt);

    // called by sdl3_audio_stream
    void register_stream(sdl3_audio_stream* s);
    void unregister_stream(sdl3_audio_stream* s);

private:
    static bool SDLCALL event_watch(void* userdata, SDL_Event* event);
    void on_device_event(const SDL_AudioDeviceEvent& event);

    std::vector<audio_device_info> list_devices(bool playback, std::optional<std::size_t>& default_index) const;

    bool m_initialized = false;
    std::mutex m_streams_mutex;
    std::vector<sdl3_audio_stream*> m_streams;
};

} // namespace rainout

#endif // RAINOUT_SDL3_BACKEND_IMPL_HH
