#include <rainout/backend.hh>
#include <algorithm>
#include <cctype>
#include <ostream>

namespace rainout {

backend_kind backend_kind_of(backend b) {
    switch (b) {
        case backend::jack:
        case backend::pipewire:
        case backend::dummy:
            return backend_kind::duplex_server;
        case backend::alsa:
        case backend::core_audio:
        case backend::wasapi:
        case backend::asio:
        case backend::sdl3:
            return backend_kind::split_stream;
    }
    return backend_kind::split_stream;
}

const char* to_string(backend b) {
    switch (b) {
        case backend::jack: return "Jack";
        case backend::pipewire: return "Pipewire";
        case backend::alsa: return "Alsa";
        case backend::core_audio: return "CoreAudio";
        case backend::wasapi: return "WASAPI";
        case backend::asio: return "ASIO";
        case backend::sdl3: return "SDL3";
        case backend::dummy: return "Dummy";
    }
    return "Unknown";
}

std::optional<backend> backend_from_string(const std::string& name) {
    static const backend all[] = {
        backend::jack, backend::pipewire, backend::alsa, backend::core_audio,
        backend::wasapi, backend::asio, backend::sdl3, backend::dummy
    };
    auto lower = [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    };
    const auto wanted = lower(name);
    for (auto b : all) {
        if (lower(to_string(b)) == wanted) {
            return b;
        }
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, backend b) {
    return os << to_string(b);
}

const std::vector<backend>& platform_backend_preference() {
#if defined(_WIN32)
    static const std::vector<backend> order = {
        backend::wasapi, backend::asio, backend::sdl3, backend::dummy
    };
#elif defined(__APPLE__)
    static const std::vector<backend> order = {
        backend::core_audio, backend::jack, backend::sdl3, backend::dummy
    };
#else
    static const std::vector<backend> order = {
        backend::jack, backend::pipewire, backend::alsa, backend::sdl3, backend::dummy
    };
#endif
    return order;
}

} // namespace rainout
