/**
 * @file stream_info.hh
 * @brief The resolved session: what a stream actually runs with
 * @ingroup config
 */

#ifndef RAINOUT_STREAM_INFO_HH
#define RAINOUT_STREAM_INFO_HH

#include <rainout/configuration.hh>
#include <rainout/export_rainout.h>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace rainout {

/**
 * @struct stream_block_size
 * @brief Cycle length contract of a stream
 *
 * fixed: every cycle has exactly @c size frames (the adapter may still
 * deliver a shorter final cycle on shutdown).
 * unfixed: cycles vary in length but never exceed @c size frames.
 */
struct stream_block_size {
    bool fixed = true;
    frames_t size = 0;

    static stream_block_size fixed_size(frames_t n) { return {true, n}; }
    static stream_block_size unfixed_with_max(frames_t n) { return {false, n}; }

    bool operator==(const stream_block_size& o) const { return fixed == o.fixed && size == o.size; }
    bool operator!=(const stream_block_size& o) const { return !(*this == o); }
};

/**
 * @struct stream_audio_port_info
 */
struct stream_audio_port_info {
    /// device port name, or the requested name when the port failed
    std::string name;
    /// native channel index on the device; meaningful only when success is true
    std::size_t channel = 0;
    /// false: the port is missing and its buffer stays silent
    bool success = true;

    bool operator==(const stream_audio_port_info& o) const {
        return name == o.name && channel == o.channel && success == o.success;
    }
};

/**
 * @struct stream_midi_port_info
 */
struct stream_midi_port_info {
    device_id device;
    uint32_t port_index = 0;
    midi_control_scheme control_scheme = midi_control_scheme::midi1;
    bool success = true;
    /// engine side queue this port is fed through; see stream_host::push_midi_input
    uint32_t endpoint = 0;

    bool operator==(const stream_midi_port_info& o) const {
        return device == o.device && port_index == o.port_index &&
               control_scheme == o.control_scheme && success == o.success && endpoint == o.endpoint;
    }
};

struct midi_stream_info {
    backend midi_backend = backend::dummy;
    std::vector<stream_midi_port_info> in_ports;
    std::vector<stream_midi_port_info> out_ports;
    uint32_t midi_buffer_size = 0;

    bool operator==(const midi_stream_info& o) const {
        return midi_backend == o.midi_backend && in_ports == o.in_ports &&
               out_ports == o.out_ports && midi_buffer_size == o.midi_buffer_size;
    }
};

/**
 * @struct stream_info
 * @brief Fully concrete session handed to process_handler::init and stream_changed
 *
 * Structurally the same as rainout_config, with every automatic choice
 * replaced by the value the resolver picked.
 */
struct stream_info {
    backend audio_backend = backend::dummy;
    std::optional<std::string> backend_version;
    bool linked_devices = false;
    /// absent when the session has no input device
    std::optional<device_id> input_device;
    /// absent when the session has no output device
    std::optional<device_id> output_device;
    sample_rate_t sample_rate = 0;
    stream_block_size block_size;
    std::vector<stream_audio_port_info> audio_in_ports;
    std::vector<stream_audio_port_info> audio_out_ports;
    bool exclusive_access = false;
    bool checking_for_silent_inputs = false;
    /// estimated round trip latency in frames
    std::optional<frames_t> latency;
    std::optional<midi_stream_info> midi;

    /**
     * @brief Explicit configuration that resolves back to this session
     */
    [[nodiscard]] RAINOUT_EXPORT rainout_config as_config() const;

    /**
     * @brief Capacity every audio buffer of the session is allocated with
     */
    [[nodiscard]] frames_t max_block_frames() const noexcept { return block_size.size; }

    bool operator==(const stream_info& o) const {
        return audio_backend == o.audio_backend && backend_version == o.backend_version &&
               linked_devices == o.linked_devices && input_device == o.input_device &&
               output_device == o.output_device && sample_rate == o.sample_rate &&
               block_size == o.block_size && audio_in_ports == o.audio_in_ports &&
               audio_out_ports == o.audio_out_ports && exclusive_access == o.exclusive_access &&
               checking_for_silent_inputs == o.checking_for_silent_inputs &&
               latency == o.latency && midi == o.midi;
    }
    bool operator!=(const stream_info& o) const { return !(*this == o); }
};

RAINOUT_EXPORT std::ostream& operator<<(std::ostream& os, const stream_info& info);

} // namespace rainout

#endif // RAINOUT_STREAM_INFO_HH
