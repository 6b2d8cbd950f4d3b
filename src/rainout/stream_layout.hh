#pragma once

#include <rainout/device_monitor.hh>
#include <rainout/midi_buffer.hh>
#include <rainout/stream_info.hh>
#include <rainout/sdk/buffer.hh>
#include "midi_endpoints.hh"
#include <memory>
#include <vector>

namespace rainout {

    /**
     * Everything the realtime cycle touches for one session, allocated up
     * front on the owner thread. A reconfiguration builds a new layout and
     * hands it to the engine as a whole.
     */
    struct stream_layout {
        struct audio_route {
            device_monitor::slot* device = nullptr;
            std::size_t channel = 0;
            bool connected = false;
        };

        struct midi_route {
            device_monitor::slot* device = nullptr;
            midi_endpoints::queue_t* queue = nullptr;
            bool connected = false;
        };

        stream_info session;
        /// frames every audio buffer can hold
        frames_t capacity = 0;
        /// frames the adapter should deliver per cycle
        frames_t block_frames = 0;

        std::vector<buffer<float>> audio_in;
        std::vector<buffer<float>> audio_out;
        std::vector<bool> silent_in;
        std::vector<midi_buffer> midi_in;
        std::vector<midi_buffer> midi_out;
        /// MIDI input of the whole cycle, split into midi_in per chunk
        std::vector<midi_buffer> midi_in_cycle;

        std::vector<audio_route> in_routes;
        std::vector<audio_route> out_routes;
        std::vector<midi_route> midi_in_routes;
        std::vector<midi_route> midi_out_routes;
    };

    /**
     * Builds the layout of @p session. @p min_capacity keeps buffers at least
     * that large so cycles sized for a previous layout still fit.
     *
     * @throws rainout_error when the session needs more MIDI endpoints than configured
     */
    std::unique_ptr<stream_layout> build_stream_layout(const stream_info& session,
                                                       frames_t min_capacity,
                                                       device_monitor& monitor,
                                                       midi_endpoints& midi_in,
                                                       midi_endpoints& midi_out);

} // namespace rainout
