#include "sdl3_backend_impl.hh"
#include "sdl3_audio_stream.hh"
#include <rainout/error.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>

namespace rainout {
    namespace {
        std::string get_sdl_error() {
            const char* error = SDL_GetError();
            return error ? error : "Unknown SDL error";
        }

        // SDL converts rates itself, so every device accepts these
        constexpr sample_rate_t common_rates[] = {22050, 44100, 48000, 88200, 96000};

        channel_layout layout_of(int channels) {
            switch (channels) {
                case 1: return channel_layout::mono;
                case 2: return channel_layout::stereo;
                default: return channel_layout::other;
            }
        }

#if defined(RAINOUT_COMPILER_GCC)
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
# pragma GCC diagnostic ignored "-Wuseless-cast"
#elif defined(RAINOUT_COMPILER_CLANG)
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wold-style-cast"
#endif
        // name of the device SDL picks for the default logical device
        std::string default_device_name(bool playback) {
            std::string name;
            SDL_AudioSpec spec;
            SDL_zero(spec);
            spec.freq = 48000;
            spec.format = SDL_AUDIO_F32;
            spec.channels = 2;
            SDL_AudioDeviceID default_dev = SDL_OpenAudioDevice(
                playback ? SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK : SDL_AUDIO_DEVICE_DEFAULT_RECORDING, &spec);
            if (default_dev != 0) {
                const char* opened_name = SDL_GetAudioDeviceName(default_dev);
                if (opened_name) {
                    name = opened_name;
                }
                SDL_CloseAudioDevice(default_dev);
            }
            return name;
        }
#if defined(RAINOUT_COMPILER_GCC)
# pragma GCC diagnostic pop
#elif defined(RAINOUT_COMPILER_CLANG)
# pragma clang diagnostic pop
#endif
    }

    audio_format sdl3_backend::sdl_to_rainout_format(SDL_AudioFormat sdl_fmt) {
        switch (sdl_fmt) {
            case SDL_AUDIO_U8: return audio_format::u8;
            case SDL_AUDIO_S8: return audio_format::s8;
            case SDL_AUDIO_S16LE: return audio_format::s16le;
            case SDL_AUDIO_S16BE: return audio_format::s16be;
            case SDL_AUDIO_S32LE: return audio_format::s32le;
            case SDL_AUDIO_S32BE: return audio_format::s32be;
            case SDL_AUDIO_F32LE: return audio_format::f32le;
            case SDL_AUDIO_F32BE: return audio_format::f32be;
            default: return audio_format::unknown;
        }
    }

    SDL_AudioFormat sdl3_backend::rainout_to_sdl_format(audio_format fmt) {
        switch (fmt) {
            case audio_format::u8: return SDL_AUDIO_U8;
            case audio_format::s8: return SDL_AUDIO_S8;
            case audio_format::s16le: return SDL_AUDIO_S16LE;
            case audio_format::s16be: return SDL_AUDIO_S16BE;
            case audio_format::s32le: return SDL_AUDIO_S32LE;
            case audio_format::s32be: return SDL_AUDIO_S32BE;
            case audio_format::f32le: return SDL_AUDIO_F32LE;
            case audio_format::f32be: return SDL_AUDIO_F32BE;
            default: return SDL_AUDIO_UNKNOWN;
        }
    }

    sdl3_backend::~sdl3_backend() {
        if (m_initialized) {
            shutdown();
        }
    }

    void sdl3_backend::init() {
        if (m_initialized) {
            THROW_RUNTIME("SDL3 backend already initialized");
        }

        if (!SDL_InitSubSystem(SDL_INIT_AUDIO)) {
            THROW_RUNTIME("Failed to initialize SDL3 audio: " + get_sdl_error());
        }
        if (!SDL_AddEventWatch(event_watch, this)) {
            LOG_WARN("sdl3_backend", "Device hot-plug events unavailable:", get_sdl_error());
        }

        m_initialized = true;
        LOG_INFO("sdl3_backend", "Initialized with driver", SDL_GetCurrentAudioDriver() ? SDL_GetCurrentAudioDriver() : "none");
    }

    void sdl3_backend::shutdown() {
        if (!m_initialized) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(m_streams_mutex);
            if (!m_streams.empty()) {
                LOG_WARN("sdl3_backend", "Shutting down with", m_streams.size(), "open streams");
            }
        }
        SDL_RemoveEventWatch(event_watch, this);
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        m_initialized = false;
    }

    bool sdl3_backend::is_initialized() const {
        return m_initialized;
    }

    backend sdl3_backend::id() const {
        return backend::sdl3;
    }

    std::optional<std::string> sdl3_backend::version() const {
        const int v = SDL_GetVersion();
        return std::to_string(SDL_VERSIONNUM_MAJOR(v)) + "." + std::to_string(SDL_VERSIONNUM_MINOR(v)) + "." +
               std::to_string(SDL_VERSIONNUM_MICRO(v));
    }

    std::vector<audio_device_info> sdl3_backend::list_devices(bool playback,
                                                              std::optional<std::size_t>& default_index) const {
        std::vector<audio_device_info> devices;
        int count = 0;
        SDL_AudioDeviceID* sdl_devices = playback ? SDL_GetAudioPlaybackDevices(&count)
                                                  : SDL_GetAudioRecordingDevices(&count);
        if (!sdl_devices) {
            return devices;
        }
        const auto default_name = default_device_name(playback);

        for (std::size_t i = 0; i < static_cast<std::size_t>(count); i++) {
            const char* name = SDL_GetAudioDeviceName(sdl_devices[i]);
            if (!name) continue;

            SDL_AudioSpec spec;
            int sample_frames = 0;
            if (!SDL_GetAudioDeviceFormat(sdl_devices[i], &spec, &sample_frames)) {
                continue;
            }

            audio_device_info info;
            info.id = device_id{name, std::to_string(sdl_devices[i])};
            std::vector<std::string> ports;
            for (int c = 0; c < spec.channels; c++) {
                ports.push_back("ch" + std::to_string(c + 1));
            }
            std::vector<std::size_t> defaults;
            for (int c = 0; c < std::min(spec.channels, 2); c++) {
                defaults.push_back(static_cast<std::size_t>(c));
            }
            if (playback) {
                info.out_ports = std::move(ports);
                info.default_out_ports = std::move(defaults);
                info.out_layout = layout_of(spec.channels);
            } else {
                info.in_ports = std::move(ports);
                info.default_in_ports = std::move(defaults);
                info.in_layout = layout_of(spec.channels);
            }
            info.sample_rates.assign(std::begin(common_rates), std::end(common_rates));
            const auto native_rate = static_cast<sample_rate_t>(spec.freq);
            if (std::find(info.sample_rates.begin(), info.sample_rates.end(), native_rate) == info.sample_rates.end()) {
                info.sample_rates.push_back(native_rate);
                std::sort(info.sample_rates.begin(), info.sample_rates.end());
            }
            info.default_sample_rate = native_rate;

            if (!default_index && !default_name.empty() && default_name == name) {
                default_index = devices.size();
            }
            devices.push_back(std::move(info));
        }
        SDL_free(sdl_devices);

        if (!default_index && !devices.empty()) {
            default_index = 0;
        }
        return devices;
    }

    audio_backend_options sdl3_backend::enumerate_audio() {
        if (!m_initialized) {
            THROW_RUNTIME("Backend not initialized");
        }
        audio_backend_options opts;
        opts.id = backend::sdl3;
        opts.version = version();
        opts.device_options = device_options_kind::linked_in_out;
        opts.out_devices = list_devices(true, opts.default_out_device);
        opts.in_devices = list_devices(false, opts.default_in_device);
        opts.status = opts.has_devices() ? backend_status::running : backend_status::no_devices;
        return opts;
    }

    std::unique_ptr<backend_stream> sdl3_backend::open_stream(const stream_info& session,
                                                              stream_host& host,
                                                              const stream_open_options& options) {
        if (!m_initialized) {
            throw device_error("SDL3 backend is not initialized");
        }
        if (options.application_name) {
            SDL_SetHint(SDL_HINT_AUDIO_DEVICE_STREAM_NAME, options.application_name->c_str());
        }
        return std::make_unique<sdl3_audio_stream>(*this, session, host);
    }

    void sdl3_backend::register_stream(sdl3_audio_stream* s) {
        std::lock_guard<std::mutex> lock(m_streams_mutex);
        m_streams.push_back(s);
    }

    void sdl3_backend::unregister_stream(sdl3_audio_stream* s) {
        std::lock_guard<std::mutex> lock(m_streams_mutex);
        m_streams.erase(std::remove(m_streams.begin(), m_streams.end(), s), m_streams.end());
    }

    bool SDLCALL sdl3_backend::event_watch(void* userdata, SDL_Event* event) {
        if (event->type == SDL_EVENT_AUDIO_DEVICE_REMOVED || event->type == SDL_EVENT_AUDIO_DEVICE_ADDED) {
            static_cast<sdl3_backend*>(userdata)->on_device_event(event->adevice);
        }
        return true;
    }

    void sdl3_backend::on_device_event(const SDL_AudioDeviceEvent& event) {
        std::lock_guard<std::mutex> lock(m_streams_mutex);
        for (auto* s : m_streams) {
            if (event.type == SDL_EVENT_AUDIO_DEVICE_REMOVED) {
                s->on_device_removed(event.which);
            } else {
                s->on_device_added(event.which);
            }
        }
    }
} // namespace rainout
