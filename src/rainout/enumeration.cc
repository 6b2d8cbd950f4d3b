#include <rainout/enumeration.hh>
#include <rainout/backend_registry.hh>
#include <algorithm>
#include <ostream>

namespace rainout {

const char* to_string(backend_status s) {
    switch (s) {
        case backend_status::running: return "running";
        case backend_status::no_devices: return "no devices";
        case backend_status::not_installed: return "not installed";
        case backend_status::not_running: return "not running";
    }
    return "unknown";
}

const char* to_string(channel_layout l) {
    switch (l) {
        case channel_layout::unspecified: return "unspecified";
        case channel_layout::mono: return "mono";
        case channel_layout::multi_mono: return "multi mono";
        case channel_layout::stereo: return "stereo";
        case channel_layout::multi_stereo: return "multi stereo";
        case channel_layout::stereo_x2_speaker_headphone: return "stereo x2 (speaker, headphone)";
        case channel_layout::other: return "other";
    }
    return "unknown";
}

bool audio_device_info::supports_sample_rate(sample_rate_t rate) const {
    return std::find(sample_rates.begin(), sample_rates.end(), rate) != sample_rates.end();
}

bool audio_device_info::has_stereo_output() const {
    if (out_layout == channel_layout::mono || out_layout == channel_layout::multi_mono) {
        return false;
    }
    return out_ports.size() >= 2;
}

std::ostream& operator<<(std::ostream& os, const device_id& id) {
    os << "\"" << id.name << "\"";
    if (id.identifier) {
        os << " (" << *id.identifier << ")";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const audio_device_info& info) {
    os << "audio_device_info{"
       << "id=" << info.id << ", "
       << "in_ports=" << info.in_ports.size() << ", "
       << "out_ports=" << info.out_ports.size() << ", "
       << "rates=[";
    for (std::size_t i = 0; i < info.sample_rates.size(); i++) {
        os << (i ? "," : "") << info.sample_rates[i];
    }
    os << "]";
    if (info.block_sizes) {
        os << ", block_sizes=" << info.block_sizes->min_size << ".." << info.block_sizes->max_size
           << " (default " << info.block_sizes->default_size << ")";
    }
    os << "}";
    return os;
}

std::vector<backend> available_audio_backends() {
    return backend_registry::global().available_audio_backends();
}

std::vector<backend> available_midi_backends() {
    return backend_registry::global().available_midi_backends();
}

std::optional<audio_backend_options> enumerate_audio_backend(backend b) {
    return backend_registry::global().enumerate_audio_backend(b);
}

std::optional<midi_backend_options> enumerate_midi_backend(backend b) {
    return backend_registry::global().enumerate_midi_backend(b);
}

std::optional<audio_backend_options> find_preferred_audio_backend() {
    return backend_registry::global().find_preferred_audio_backend();
}

} // namespace rainout
