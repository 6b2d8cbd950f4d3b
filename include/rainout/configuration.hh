/**
 * @file configuration.hh
 * @brief What the application asks for when starting a stream
 * @ingroup config
 */

#ifndef RAINOUT_CONFIGURATION_HH
#define RAINOUT_CONFIGURATION_HH

#include <rainout/auto_option.hh>
#include <rainout/backend.hh>
#include <rainout/device_id.hh>
#include <rainout/enumeration.hh>
#include <rainout/sdk/types.hh>
#include <chrono>
#include <utility>
#include <optional>
#include <string>
#include <vector>

namespace rainout {

/**
 * @defgroup config Configuration
 * @brief Requested stream parameters and runtime options
 * @{
 */

/**
 * @struct audio_device_selection
 * @brief A single full duplex device or a linked input/output pair
 */
struct audio_device_selection {
    enum class kind {
        single,
        linked_in_out
    };

    kind type = kind::single;
    /// kind::single
    device_id device;
    /// kind::linked_in_out; either side may be absent
    std::optional<device_id> input;
    std::optional<device_id> output;

    static audio_device_selection single(device_id id) {
        audio_device_selection s;
        s.type = kind::single;
        s.device = std::move(id);
        return s;
    }

    static audio_device_selection linked(std::optional<device_id> in, std::optional<device_id> out) {
        audio_device_selection s;
        s.type = kind::linked_in_out;
        s.input = std::move(in);
        s.output = std::move(out);
        return s;
    }

    bool operator==(const audio_device_selection& o) const {
        if (type != o.type) {
            return false;
        }
        return type == kind::single ? device == o.device : (input == o.input && output == o.output);
    }

    bool operator!=(const audio_device_selection& o) const { return !(*this == o); }
};

/**
 * @struct audio_port_ref
 * @brief Selects a device port by index or by name
 */
struct audio_port_ref {
    std::optional<std::size_t> index;
    std::string name;

    static audio_port_ref by_index(std::size_t i) {
        audio_port_ref r;
        r.index = i;
        return r;
    }

    static audio_port_ref by_name(std::string n) {
        audio_port_ref r;
        r.name = std::move(n);
        return r;
    }

    bool operator==(const audio_port_ref& o) const { return index == o.index && name == o.name; }
    bool operator!=(const audio_port_ref& o) const { return !(*this == o); }
};

/**
 * @struct midi_port_config
 * @brief One requested MIDI port
 */
struct midi_port_config {
    device_id device;
    uint32_t port_index = 0;
    midi_control_scheme control_scheme = midi_control_scheme::midi1;

    bool operator==(const midi_port_config& o) const {
        return device == o.device && port_index == o.port_index && control_scheme == o.control_scheme;
    }
    bool operator!=(const midi_port_config& o) const { return !(*this == o); }
};

/**
 * @struct midi_config
 */
struct midi_config {
    auto_option<backend> midi_backend;
    auto_option<std::vector<midi_port_config>> in_ports;
    auto_option<std::vector<midi_port_config>> out_ports;

    bool operator==(const midi_config& o) const {
        return midi_backend == o.midi_backend && in_ports == o.in_ports && out_ports == o.out_ports;
    }
};

/**
 * @struct rainout_config
 * @brief Requested stream, with every selectable field explicit or automatic
 *
 * A default constructed config asks for "the best the machine offers":
 * preferred backend, its default device at its default rate and block size,
 * default outputs, no inputs unless run_options::auto_audio_inputs is set,
 * and no MIDI.
 */
struct rainout_config {
    auto_option<backend> audio_backend;
    auto_option<audio_device_selection> audio_device;
    auto_option<sample_rate_t> sample_rate;
    auto_option<frames_t> block_size;
    auto_option<std::vector<audio_port_ref>> audio_in_ports;
    auto_option<std::vector<audio_port_ref>> audio_out_ports;
    bool take_exclusive_access = false;
    std::optional<midi_config> midi;

    bool operator==(const rainout_config& o) const {
        return audio_backend == o.audio_backend && audio_device == o.audio_device &&
               sample_rate == o.sample_rate && block_size == o.block_size &&
               audio_in_ports == o.audio_in_ports && audio_out_ports == o.audio_out_ports &&
               take_exclusive_access == o.take_exclusive_access && midi == o.midi;
    }

    /**
     * @brief True when no field is left automatic
     */
    [[nodiscard]] RAINOUT_EXPORT bool is_fully_explicit() const;
};

/**
 * @struct run_options
 * @brief Knobs that shape resolution and the runtime, but are not part of the session
 */
struct run_options {
    /// client name on server backends
    std::optional<std::string> application_name;
    /// include the device default inputs when audio_in_ports is automatic
    bool auto_audio_inputs = false;
    /// an automatically chosen device must expose at least two output ports
    bool must_have_stereo_output = false;
    /// keep a failed explicit port as a silent buffer instead of failing
    bool empty_buffers_for_failed_ports = true;
    /// scan inputs for silence every cycle and report it in process_info
    bool check_for_silent_inputs = false;
    /// buffer capacity used when the device only reports variable cycle lengths
    frames_t fallback_max_block_size = 1024;
    /// events per MIDI port buffer
    uint32_t midi_buffer_size = 1024;
    /// capacity of the notification ring
    std::size_t message_buffer_size = 512;
    /// distinct MIDI endpoints a stream may use over its lifetime
    std::size_t max_midi_endpoints = 64;
    std::chrono::milliseconds open_timeout{10000};
    std::chrono::milliseconds close_timeout{2000};
};

/** @} */

} // namespace rainout

#endif // RAINOUT_CONFIGURATION_HH
