#include "sdl3_audio_stream.hh"
#include "sdl3_backend_impl.hh"
#include <rainout/error.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cstring>

namespace rainout {

// Custom deleter that checks if SDL is still initialized
static void safe_destroy_audio_stream(SDL_AudioStream* stream) {
    if (stream && SDL_WasInit(SDL_INIT_AUDIO)) {
        SDL_DestroyAudioStream(stream);
    }
}

namespace {
    constexpr frames_t min_capacity = 4096;

    std::string get_sdl_error() {
        const char* error = SDL_GetError();
        return error ? error : "Unknown SDL error";
    }

    SDL_AudioDeviceID find_physical(const device_id& id, bool playback) {
        int count = 0;
        SDL_AudioDeviceID* devices = playback ? SDL_GetAudioPlaybackDevices(&count)
                                              : SDL_GetAudioRecordingDevices(&count);
        if (!devices) {
            return 0;
        }
        SDL_AudioDeviceID found = 0;
        for (int i = 0; i < count && found == 0; i++) {
            if (id.identifier) {
                if (*id.identifier == std::to_string(devices[i])) {
                    found = devices[i];
                }
                continue;
            }
            const char* name = SDL_GetAudioDeviceName(devices[i]);
            if (name && id.name == name) {
                found = devices[i];
            }
        }
        SDL_free(devices);
        return found;
    }
}

sdl3_audio_stream::sdl3_audio_stream(sdl3_backend& owner, const stream_info& session, stream_host& host)
    : m_owner(owner)
    , m_host(host) {
    m_capacity = std::max(session.max_block_frames(), min_capacity);
    try {
        if (session.output_device) {
            open_side(m_playback, *session.output_device, true, session.sample_rate);
        }
        if (session.input_device) {
            open_side(m_recording, *session.input_device, false, session.sample_rate);
        }
    } catch (const device_error&) {
        release();
        throw;
    }
    if (!m_playback.stream && !m_recording.stream) {
        throw device_error("SDL3 session has neither an input nor an output device");
    }

    m_input.reset(std::max<std::size_t>(std::size_t(m_capacity) * m_recording.channels * sizeof(float), 1));
    m_output.reset(std::max<std::size_t>(std::size_t(m_capacity) * m_playback.channels * sizeof(float), 1));
    m_owner.register_stream(this);
}

sdl3_audio_stream::~sdl3_audio_stream() {
    close();
    m_owner.unregister_stream(this);
}

void sdl3_audio_stream::open_side(device_side& side, const device_id& id, bool playback, sample_rate_t rate) {
    side.id = id;
    side.physical_id = find_physical(id, playback);
    if (side.physical_id == 0) {
        throw device_error("SDL3 device not found: " + id.name);
    }

    SDL_AudioSpec device_spec;
    int sample_frames = 0;
    if (!SDL_GetAudioDeviceFormat(side.physical_id, &device_spec, &sample_frames)) {
        throw device_error("Failed to get audio device format: " + get_sdl_error());
    }
    side.sdl_id = SDL_OpenAudioDevice(side.physical_id, &device_spec);
    if (side.sdl_id == 0) {
        throw device_error("Failed to open audio device: " + get_sdl_error());
    }
    SDL_PauseAudioDevice(side.sdl_id);
    side.channels = static_cast<channels_t>(device_spec.channels);
    side.device_frames = sample_frames > 0 ? static_cast<frames_t>(sample_frames) : 0;

    SDL_AudioSpec ours;
    ours.format = sdl3_backend::rainout_to_sdl_format(audio_f32sys);
    ours.channels = device_spec.channels;
    ours.freq = static_cast<int>(rate);

    side.stream = std::shared_ptr<SDL_AudioStream>(
        playback ? SDL_CreateAudioStream(&ours, &device_spec) : SDL_CreateAudioStream(&device_spec, &ours),
        safe_destroy_audio_stream);
    if (!side.stream) {
        throw device_error("Failed to create audio stream: " + get_sdl_error());
    }
    if (!SDL_BindAudioStream(side.sdl_id, side.stream.get())) {
        throw device_error("Failed to bind stream to device: " + get_sdl_error());
    }
    LOG_INFO("sdl3_backend", "Opened", playback ? "playback" : "recording", "device", id.name,
             "with", static_cast<int>(side.channels), "channels at", rate, "Hz");
}

void sdl3_audio_stream::start() {
    if (m_closed) {
        throw device_error("SDL3 stream is closed");
    }
    if (m_running.exchange(true)) {
        return;
    }
    bool ok = true;
    if (m_playback.stream) {
        ok = SDL_SetAudioStreamGetCallback(m_playback.stream.get(), playback_callback, this);
    } else {
        ok = SDL_SetAudioStreamPutCallback(m_recording.stream.get(), recording_callback, this);
    }
    if (!ok) {
        m_running = false;
        throw device_error("Failed to set stream callback: " + get_sdl_error());
    }
    if (m_recording.sdl_id != 0 && !SDL_ResumeAudioDevice(m_recording.sdl_id)) {
        m_running = false;
        throw device_error("Failed to start recording: " + get_sdl_error());
    }
    if (m_playback.sdl_id != 0 && !SDL_ResumeAudioDevice(m_playback.sdl_id)) {
        m_running = false;
        throw device_error("Failed to start playback: " + get_sdl_error());
    }
}

void sdl3_audio_stream::stop() {
    m_running = false;
    // the stream lock is held while a callback runs, so clearing them waits for the one in flight
    if (m_playback.stream) {
        SDL_SetAudioStreamGetCallback(m_playback.stream.get(), nullptr, nullptr);
    }
    if (m_recording.stream) {
        SDL_SetAudioStreamPutCallback(m_recording.stream.get(), nullptr, nullptr);
    }
    if (m_playback.sdl_id != 0) {
        SDL_PauseAudioDevice(m_playback.sdl_id);
    }
    if (m_recording.sdl_id != 0) {
        SDL_PauseAudioDevice(m_recording.sdl_id);
    }
}

void sdl3_audio_stream::close() {
    if (m_closed) {
        return;
    }
    stop();
    release();
    m_closed = true;
}

void sdl3_audio_stream::release() noexcept {
    for (auto* side : {&m_playback, &m_recording}) {
        if (side->stream) {
            SDL_UnbindAudioStream(side->stream.get());
            side->stream.reset();
        }
        if (side->sdl_id != 0) {
            SDL_CloseAudioDevice(side->sdl_id);
            side->sdl_id = 0;
        }
    }
}

void sdl3_audio_stream::prepare_change(const stream_info& next) {
    if (next.max_block_frames() > m_capacity) {
        throw device_error("SDL3 stream buffers hold at most " + std::to_string(m_capacity) + " frames");
    }
}

std::optional<frames_t> sdl3_audio_stream::latency() const {
    const frames_t total = m_playback.device_frames + m_recording.device_frames;
    if (total == 0) {
        return std::nullopt;
    }
    return total;
}

void sdl3_audio_stream::on_device_removed(SDL_AudioDeviceID id) {
    if (m_playback.physical_id == id) {
        m_host.device_presence_changed(m_playback.id, device_kind::audio, false);
    }
    if (m_recording.physical_id == id) {
        m_host.device_presence_changed(m_recording.id, device_kind::audio, false);
    }
}

void sdl3_audio_stream::on_device_added(SDL_AudioDeviceID id) {
    const char* name = SDL_GetAudioDeviceName(id);
    if (!name) {
        return;
    }
    if (m_playback.stream && m_playback.id.name == name) {
        m_host.device_presence_changed(m_playback.id, device_kind::audio, true);
    }
    if (m_recording.stream && m_recording.id.name == name) {
        m_host.device_presence_changed(m_recording.id, device_kind::audio, true);
    }
}

void sdl3_audio_stream::run_cycles(frames_t frames, SDL_AudioStream* playback) noexcept {
    const std::size_t in_frame_bytes = sizeof(float) * m_recording.channels;
    const std::size_t out_frame_bytes = sizeof(float) * m_playback.channels;

    while (frames > 0 && m_running.load(std::memory_order_acquire)) {
        const frames_t n = std::min({frames, std::max<frames_t>(m_host.current_block_frames(), 1), m_capacity});

        if (m_recording.stream) {
            const auto wanted = static_cast<int>(n * in_frame_bytes);
            int got = SDL_GetAudioStreamData(m_recording.stream.get(), m_input.data(), wanted);
            if (got < 0) {
                got = 0;
            }
            if (got < wanted) {
                std::memset(m_input.data() + got, 0, static_cast<std::size_t>(wanted - got));
            }
        }

        native_cycle cycle;
        cycle.frames = n;
        cycle.input = {audio_f32sys, m_recording.channels, true, m_input.data(), nullptr};
        cycle.output = {audio_f32sys, m_playback.channels, true, m_output.data(), nullptr};
        const auto result = m_host.run_cycle(cycle);

        if (playback) {
            SDL_PutAudioStreamData(playback, m_output.data(), static_cast<int>(n * out_frame_bytes));
        }
        if (result == cycle_result::stop) {
            m_running.store(false, std::memory_order_release);
            break;
        }
        frames -= n;
    }
}

void SDLCALL sdl3_audio_stream::playback_callback(void* userdata, SDL_AudioStream* stream,
                                                  int additional_amount, [[maybe_unused]] int total_amount) {
    auto* self = static_cast<sdl3_audio_stream*>(userdata);
    if (!self || additional_amount <= 0 || self->m_playback.channels == 0) {
        return;
    }
    const auto frame_bytes = static_cast<int>(sizeof(float) * self->m_playback.channels);
    const auto frames = static_cast<frames_t>((additional_amount + frame_bytes - 1) / frame_bytes);
    self->run_cycles(frames, stream);
}

void SDLCALL sdl3_audio_stream::recording_callback(void* userdata, SDL_AudioStream* stream,
                                                   [[maybe_unused]] int additional_amount,
                                                   [[maybe_unused]] int total_amount) {
    auto* self = static_cast<sdl3_audio_stream*>(userdata);
    if (!self || self->m_recording.channels == 0) {
        return;
    }
    const int available = SDL_GetAudioStreamAvailable(stream);
    const auto frame_bytes = static_cast<int>(sizeof(float) * self->m_recording.channels);
    if (available >= frame_bytes) {
        self->run_cycles(static_cast<frames_t>(available / frame_bytes), nullptr);
    }
}

} // namespace rainout
