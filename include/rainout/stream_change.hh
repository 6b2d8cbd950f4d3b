/**
 * @file stream_change.hh
 * @brief Live reconfiguration request
 * @ingroup config
 */

#ifndef RAINOUT_STREAM_CHANGE_HH
#define RAINOUT_STREAM_CHANGE_HH

#include <rainout/auto_option.hh>
#include <rainout/configuration.hh>
#include <optional>
#include <vector>

namespace rainout {

/**
 * @struct stream_change
 * @brief Fields to change on a running stream; unset fields stay as they are
 *
 * Every set field is resolved with the same rules as run() uses, against a
 * fresh enumeration of the stream's devices.
 */
struct stream_change {
    std::optional<auto_option<std::vector<audio_port_ref>>> audio_in_ports;
    std::optional<auto_option<std::vector<audio_port_ref>>> audio_out_ports;
    std::optional<auto_option<frames_t>> block_size;
    std::optional<auto_option<std::vector<midi_port_config>>> midi_in_ports;
    std::optional<auto_option<std::vector<midi_port_config>>> midi_out_ports;

    [[nodiscard]] bool changes_audio_ports() const { return audio_in_ports || audio_out_ports; }
    [[nodiscard]] bool changes_block_size() const { return block_size.has_value(); }
    [[nodiscard]] bool changes_midi_ports() const { return midi_in_ports || midi_out_ports; }
    [[nodiscard]] bool empty() const {
        return !changes_audio_ports() && !changes_block_size() && !changes_midi_ports();
    }
};

} // namespace rainout

#endif // RAINOUT_STREAM_CHANGE_HH
