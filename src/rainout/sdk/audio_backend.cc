#include <rainout/sdk/audio_backend.hh>
#include <rainout/error.hh>

namespace rainout {

    midi_backend_options audio_backend::enumerate_midi() {
        midi_backend_options opts;
        opts.id = id();
        opts.version = version();
        opts.status = backend_status::not_installed;
        return opts;
    }

    std::unique_ptr<backend_stream> audio_backend::open_midi_stream(const stream_info&,
                                                                    stream_host&,
                                                                    const stream_open_options&) {
        throw device_error(get_name() + " does not provide MIDI");
    }

} // namespace rainout
