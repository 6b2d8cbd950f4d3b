#include "stream_layout.hh"
#include <rainout/error.hh>
#include <algorithm>

namespace rainout {

    namespace {
        void build_audio_routes(stream_layout& layout,
                                const std::vector<stream_audio_port_info>& ports,
                                const std::optional<device_id>& device,
                                device_monitor& monitor,
                                std::vector<buffer<float>>& buffers,
                                std::vector<stream_layout::audio_route>& routes) {
            device_monitor::slot* s = nullptr;
            if (device && !ports.empty()) {
                s = monitor.track(*device, device_kind::audio);
            }
            buffers.reserve(ports.size());
            routes.reserve(ports.size());
            for (const auto& port : ports) {
                buffers.emplace_back(layout.capacity);
                stream_layout::audio_route r;
                r.device = s;
                r.channel = port.channel;
                r.connected = port.success && s != nullptr;
                routes.push_back(r);
            }
        }

        void build_midi_routes(const std::vector<stream_midi_port_info>& ports,
                               std::size_t buffer_size,
                               device_monitor& monitor,
                               midi_endpoints& endpoints,
                               std::vector<midi_buffer>& buffers,
                               std::vector<stream_layout::midi_route>& routes) {
            buffers.reserve(ports.size());
            routes.reserve(ports.size());
            for (const auto& port : ports) {
                buffers.emplace_back(buffer_size);
                stream_layout::midi_route r;
                if (port.success) {
                    r.device = monitor.track(port.device, device_kind::midi);
                    r.queue = endpoints.ensure(port.endpoint);
                    if (!r.queue) {
                        throw rainout_error("MIDI endpoint " + std::to_string(port.endpoint) +
                                            " exceeds the configured maximum of " +
                                            std::to_string(endpoints.max_endpoints()));
                    }
                    r.connected = true;
                }
                routes.push_back(r);
            }
        }
    }

    std::unique_ptr<stream_layout> build_stream_layout(const stream_info& session,
                                                       frames_t min_capacity,
                                                       device_monitor& monitor,
                                                       midi_endpoints& midi_in,
                                                       midi_endpoints& midi_out) {
        auto layout = std::make_unique<stream_layout>();
        layout->session = session;
        layout->block_frames = session.max_block_frames();
        layout->capacity = std::max(layout->block_frames, min_capacity);

        build_audio_routes(*layout, session.audio_in_ports, session.input_device, monitor,
                           layout->audio_in, layout->in_routes);
        build_audio_routes(*layout, session.audio_out_ports, session.output_device, monitor,
                           layout->audio_out, layout->out_routes);
        layout->silent_in.assign(session.audio_in_ports.size(), false);

        if (session.midi) {
            const std::size_t size = std::max<uint32_t>(session.midi->midi_buffer_size, 1);
            build_midi_routes(session.midi->in_ports, size, monitor, midi_in,
                              layout->midi_in, layout->midi_in_routes);
            layout->midi_in_cycle.reserve(session.midi->in_ports.size());
            for (std::size_t i = 0; i < session.midi->in_ports.size(); i++) {
                layout->midi_in_cycle.emplace_back(size);
            }
            build_midi_routes(session.midi->out_ports, size, monitor, midi_out,
                              layout->midi_out, layout->midi_out_routes);
        }
        return layout;
    }

} // namespace rainout
